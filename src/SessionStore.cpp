// SessionStore.cpp
//
// SessionStore is the persistence boundary for the session list.
// Responsibilities:
// - Locate sessions.json
// - Serialize/deserialize SessionRecord to JSON
//
// Non-responsibilities:
// - No UI (dialogs/widgets)
// - No SSH/network operations
//
// Note: passwords and passphrases are stored as given (plain JSON, user-only
// file permissions). The file never reaches the logs.

#include "SessionStore.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>
#include <QDebug>

static QString g_pathOverride;

// -----------------------------
// Helpers: record <-> JSON
// -----------------------------
static QJsonObject recordToJson(const SessionRecord& s)
{
    QJsonObject obj;

    obj["name"]     = s.name;
    obj["host"]     = s.host;
    obj["port"]     = s.effectivePort();
    obj["username"] = s.username;

    // Optional auth fields are stored only when set
    if (!s.password.isEmpty())
        obj["password"] = s.password;
    if (!s.privateKeyPath.trimmed().isEmpty())
        obj["private_key_path"] = s.privateKeyPath.trimmed();
    if (!s.privateKeyPassphrase.isEmpty())
        obj["private_key_passphrase"] = s.privateKeyPassphrase;

    obj["remote_path"] = s.remotePath.trimmed().isEmpty() ? QStringLiteral("/") : s.remotePath.trimmed();
    return obj;
}

static SessionRecord recordFromJson(const QJsonObject& obj)
{
    SessionRecord s;
    s.name     = obj.value("name").toString().trimmed();
    s.host     = obj.value("host").toString().trimmed();
    s.port     = obj.value("port").toInt(22);
    s.username = obj.value("username").toString().trimmed();

    s.password             = obj.value("password").toString();
    s.privateKeyPath       = obj.value("private_key_path").toString().trimmed();
    s.privateKeyPassphrase = obj.value("private_key_passphrase").toString();

    s.remotePath = obj.value("remote_path").toString("/").trimmed();
    if (s.remotePath.isEmpty())
        s.remotePath = "/";
    if (s.port <= 0 || s.port > 65535)
        s.port = 22;
    return s;
}

QString SessionStore::configPath()
{
    if (!g_pathOverride.isEmpty())
        return g_pathOverride;

    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("sessions.json");
}

void SessionStore::setConfigPathOverride(const QString& absoluteFilePath)
{
    const QString p = absoluteFilePath.trimmed();
    g_pathOverride = p.isEmpty() ? QString() : QDir::cleanPath(p);
}

QVector<SessionRecord> SessionStore::defaults()
{
    QVector<SessionRecord> out;

    SessionRecord s;
    s.name       = QCoreApplication::translate("SessionStore", "My Server");
    s.host       = "server.com";
    s.port       = 22;
    s.username   = "user";
    s.remotePath = "/";

    out.push_back(s);
    return out;
}

bool SessionStore::save(const QVector<SessionRecord>& sessions, QString* err)
{
    /*
        JSON format:
        {
          "sessions": [
            {
              "name": "...",
              "host": "...",
              "port": 22,
              "username": "...",
              "password": "...",                 // optional
              "private_key_path": "...",         // optional
              "private_key_passphrase": "...",   // optional
              "remote_path": "/"
            }
          ]
        }
    */
    QJsonArray arr;
    for (const auto& s : sessions)
        arr.append(recordToJson(s));

    QJsonObject root;
    root["sessions"] = arr;

    const QString path = configPath();
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (err) *err = QCoreApplication::translate("SessionStore",
                                                    "Could not write sessions.json: %1")
                            .arg(f.errorString());
        return false;
    }

    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner))
        qWarning().noquote() << QString("[STORE] could not restrict permissions on %1").arg(path);

    if (!f.commit()) {
        if (err) *err = QCoreApplication::translate("SessionStore",
                                                    "Could not write sessions.json: %1")
                            .arg(f.errorString());
        return false;
    }

    qInfo().noquote() << QString("[STORE] saved %1 session(s) to %2").arg(sessions.size()).arg(path);

    if (err) err->clear();
    return true;
}

QVector<SessionRecord> SessionStore::load(QString* err)
{
    QVector<SessionRecord> out;

    QFile f(configPath());
    if (!f.exists()) {
        // First run: seed and persist the default list
        out = defaults();
        QString saveErr;
        if (!save(out, &saveErr))
            qWarning().noquote() << QString("[STORE] could not seed defaults: %1").arg(saveErr);
        if (err) err->clear();
        return out;
    }

    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QCoreApplication::translate("SessionStore",
                                                    "Could not open sessions.json: %1")
                            .arg(f.errorString());
        return out;
    }

    const QByteArray data = f.readAll();
    f.close();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QCoreApplication::translate("SessionStore",
                                                    "Invalid JSON in sessions.json: %1")
                            .arg(perr.errorString());
        return out;
    }

    const QJsonArray arr = doc.object().value("sessions").toArray();
    for (const QJsonValue& val : arr) {
        if (!val.isObject())
            continue;

        SessionRecord s = recordFromJson(val.toObject());

        // Skip incomplete records
        if (s.username.isEmpty() || s.host.isEmpty())
            continue;

        if (s.name.isEmpty())
            s.name = s.target();

        out.push_back(s);
    }

    if (err) err->clear();
    return out;
}
