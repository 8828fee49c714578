// RemoteError.h
//
// Purpose:
//   Typed error carried through the bool + out-parameter calls of the
//   remote layer (channels, shell host, transfer pipeline, connection).
//   Callers branch on `kind`; `message` is human-readable and never
//   contains secrets.

#pragma once

#include <QString>
#include <QMetaType>

enum class RemoteErrorKind {
    None,
    AuthConfig,          // neither password nor private key configured
    Auth,                // server rejected the credentials
    Connect,             // network / handshake failure
    List,                // directory listing failed
    Attribute,           // stat on a path failed
    Transfer,            // upload/download/rename or archive step failed
    Command,             // one-shot remote command failed
    SurfaceNotReady,     // display surface never became ready
    ShellLaunch,         // terminal process could not be started
    UnsupportedArchive,  // extract on an unknown archive suffix (informational)
    Busy                 // another operation is still running on this session
};

struct RemoteError
{
    RemoteErrorKind kind = RemoteErrorKind::None;
    QString message;

    bool isError() const { return kind != RemoteErrorKind::None; }
    void clear() { kind = RemoteErrorKind::None; message.clear(); }
};

// Fills an optional out-param; no-op when err is null.
inline void setRemoteError(RemoteError* err, RemoteErrorKind kind, const QString& message)
{
    if (!err) return;
    err->kind = kind;
    err->message = message;
}

inline QString remoteErrorKindName(RemoteErrorKind k)
{
    switch (k) {
        case RemoteErrorKind::None:               return QStringLiteral("none");
        case RemoteErrorKind::AuthConfig:         return QStringLiteral("auth_config");
        case RemoteErrorKind::Auth:               return QStringLiteral("auth");
        case RemoteErrorKind::Connect:            return QStringLiteral("connect");
        case RemoteErrorKind::List:               return QStringLiteral("list");
        case RemoteErrorKind::Attribute:          return QStringLiteral("attribute");
        case RemoteErrorKind::Transfer:           return QStringLiteral("transfer");
        case RemoteErrorKind::Command:            return QStringLiteral("command");
        case RemoteErrorKind::SurfaceNotReady:    return QStringLiteral("surface_not_ready");
        case RemoteErrorKind::ShellLaunch:        return QStringLiteral("shell_launch");
        case RemoteErrorKind::UnsupportedArchive: return QStringLiteral("unsupported_archive");
        case RemoteErrorKind::Busy:               return QStringLiteral("busy");
    }
    return QStringLiteral("unknown");
}

Q_DECLARE_METATYPE(RemoteError)
