// AuditLogger.cpp
#include "AuditLogger.h"
#include "SessionRecord.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QCryptographicHash>
#include <QCoreApplication>

// =====================================================
// Global audit logger state (process-wide)
// =====================================================
//
// One mutex guards all state and the single open file handle, which is
// rotated by day ("audit-YYYY-MM-DD.jsonl"). Events come from the GUI thread
// and from transfer workers.
//
// If the file cannot be opened, events are dropped (the regular log still
// has the same information).
// =====================================================

static QMutex   g_auditMutex;
static QString  g_appName;
static QString  g_runId;
static QString  g_dirOverride;

static QFile*   g_auditFile = nullptr;
static QString  g_openDate;             // "yyyy-MM-dd" currently opened day
static QString  g_openPath;

static QString dayKey()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd");
}

static QString baseDirLocked()
{
    if (!g_dirOverride.isEmpty())
        return g_dirOverride;
    return QDir::cleanPath(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/audit");
}

static QString pathForDayLocked(const QString& day)
{
    return QDir(baseDirLocked()).filePath(QString("audit-%1.jsonl").arg(day));
}

static void closeLocked()
{
    if (g_auditFile) {
        if (g_auditFile->isOpen())
            g_auditFile->close();
        delete g_auditFile;
        g_auditFile = nullptr;
    }
    g_openDate.clear();
    g_openPath.clear();
}

// Ensures today's file is open (reopens on day change).
static bool ensureOpenLocked()
{
    const QString today = dayKey();
    const QString wantPath = pathForDayLocked(today);

    if (g_auditFile && g_auditFile->isOpen() && g_openPath == wantPath)
        return true;

    closeLocked();
    QDir().mkpath(baseDirLocked());

    g_auditFile = new QFile(wantPath);
    if (!g_auditFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        closeLocked();
        return false;
    }

    g_openDate = today;
    g_openPath = wantPath;
    return true;
}

// =====================================================
// Public API
// =====================================================

namespace AuditLogger {

void install(const QString& appName, const QString& dirOverride)
{
    // No qInfo/qWarning here: called before/while the Logger is installed.
    QMutexLocker lock(&g_auditMutex);
    g_appName = appName;
    g_dirOverride = dirOverride.trimmed().isEmpty() ? QString() : QDir::cleanPath(dirOverride.trimmed());
    closeLocked();
    ensureOpenLocked();
}

void setRunId(const QString& runId)
{
    QMutexLocker lock(&g_auditMutex);
    g_runId = runId;
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_auditMutex);
    return g_openPath.isEmpty() ? pathForDayLocked(dayKey()) : g_openPath;
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_auditMutex);

    if (!ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("pid", (qint64)QCoreApplication::applicationPid());
    if (!g_runId.isEmpty())
        o.insert("run_id", g_runId);

    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    const QByteArray line = QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n";
    if (g_auditFile->write(line) == line.size())
        g_auditFile->flush();
}

QJsonObject sessionFields(const SessionRecord& session)
{
    QJsonObject f;
    f.insert("session", session.name);
    f.insert("host", session.host);
    f.insert("port", session.effectivePort());
    f.insert("user", session.username);
    f.insert("auth", session.hasPrivateKey() ? "publickey" : (session.hasPassword() ? "password" : "none"));
    return f;
}

QJsonObject commandFields(const QString& command)
{
    QJsonObject f;
    const QByteArray h = QCryptographicHash::hash(command.toUtf8(), QCryptographicHash::Sha256).toHex();
    f.insert("cmd_hash", QString::fromLatin1(h.left(16)));

    const QString first = command.trimmed().section(' ', 0, 0);
    if (!first.isEmpty())
        f.insert("cmd_head", first.left(64));
    return f;
}

} // namespace AuditLogger
