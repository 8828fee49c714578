// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QDebug>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*     g_file  = nullptr;   // Open log file handle
static QMutex     g_mutex;             // Guards concurrent writes (worker threads log too)
static QString    g_path;              // Absolute path to log file
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug

// Prevent recursion if something inside handler triggers Qt logging again
static thread_local bool g_inHandler = false;

static const qint64 kMaxLogBytes = 2 * 1024 * 1024;
static const int    kKeepRotated = 3;

static const char* levelName(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0 = WARN and above, 1 = INFO and above, 2 = everything
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtFatalMsg || type == QtCriticalMsg || type == QtWarningMsg) return true;
    if (type == QtInfoMsg) return lvl >= 1;
    return lvl >= 2;
}

// One record = one physical line
static QString oneLine(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static void writeRecordLocked(const QString& line)
{
    if (!g_file || !g_file->isOpen()) {
        const QByteArray utf8 = line.toUtf8();
        std::fprintf(stderr, "%s\n", utf8.constData());
        std::fflush(stderr);
        return;
    }

    QTextStream out(g_file);
    out.setCodec("UTF-8");
    out << line << "\n";
    out.flush();
}

// =====================================================
// Qt message handler
// =====================================================
static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) abort();
        return;
    }
    g_inHandler = true;

    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = QString("%1 [%2] ").arg(ts, QLatin1String(levelName(type)));
    if (ctx.file && ctx.function) {
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    }
    line += oneLine(msg);

    {
        QMutexLocker lock(&g_mutex);
        writeRecordLocked(line);
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        abort();
}

// =====================================================
// Log rotation (size-based): log -> .1 -> .2 -> .3
// =====================================================
static void rotateIfNeeded(const QString& path)
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.size() < kMaxLogBytes)
        return;

    QFile::remove(path + "." + QString::number(kKeepRotated));
    for (int i = kKeepRotated - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

static void closeFileLocked()
{
    if (g_file) {
        if (g_file->isOpen()) g_file->close();
        delete g_file;
        g_file = nullptr;
    }
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

void install(const QString& appName, const QString& fileOverride)
{
    const QString defaultPath =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
        + "/logs/" + appName + ".log";

    const QString path = fileOverride.trimmed().isEmpty()
        ? QDir::cleanPath(defaultPath)
        : QDir::cleanPath(fileOverride.trimmed());

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    {
        QMutexLocker lock(&g_mutex);
        closeFileLocked();
        g_path = path;

        g_file = new QFile(g_path);
        if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "Logger: failed to open log file: %s\n", g_path.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QString("Logger initialized: %1").arg(g_path);
}

void uninstall()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&g_mutex);
    closeFileLocked();
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

} // namespace Logger
