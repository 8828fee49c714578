#pragma once

#include <QString>
#include <QVector>

// -----------------------------
// Saved host profile (one per session tab)
// -----------------------------
// Optional credentials are empty strings when absent. When both a password
// and a private key are configured, the key is used.
struct SessionRecord {
    // Identity (name is the unique key in the session list)
    QString name;
    QString host;
    int     port = 22;
    QString username;

    // Auth
    QString password;
    QString privateKeyPath;
    QString privateKeyPassphrase;

    // Last-used remote directory
    QString remotePath = QStringLiteral("/");

    bool hasPassword() const   { return !password.isEmpty(); }
    bool hasPrivateKey() const { return !privateKeyPath.trimmed().isEmpty(); }
    bool hasUsableAuth() const { return hasPassword() || hasPrivateKey(); }

    int effectivePort() const { return port > 0 ? port : 22; }

    QString target() const { return QStringLiteral("%1@%2").arg(username.trimmed(), host.trimmed()); }
};

using SessionList = QVector<SessionRecord>;
