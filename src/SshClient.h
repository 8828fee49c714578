// SshClient.h
//
// Purpose:
//   Lightweight wrapper around libssh providing:
//     - Connection/authentication (private key or password) for a SessionRecord
//     - Remote exec with captured stdout/stderr/exit status
//     - SFTP listing, stat, streaming upload/download and rename
//
// Design boundary:
//   Interactive terminal sessions are handled by spawning OpenSSH inside an
//   external terminal (ShellHost). This class is only used for
//   *programmatic* operations and is driven from worker threads, so it is
//   a plain class (no QObject, no signals).

#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include "RemoteChannels.h"
#include "RemoteError.h"
#include "SessionRecord.h"

class QIODevice;

// Forward-declare libssh types to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;
struct sftp_session_struct;
using sftp_session = sftp_session_struct*;

class SshClient
{
public:
    SshClient();
    ~SshClient();

    SshClient(const SshClient&) = delete;
    SshClient& operator=(const SshClient&) = delete;

    // libssh connect timeout (seconds)
    void setConnectTimeoutSec(int seconds) { m_timeoutSec = seconds > 0 ? seconds : 8; }

    // Connect and authenticate. Private key wins over password.
    //   AuthConfig: neither configured
    //   Auth:       server rejected the credentials / key unreadable
    //   Connect:    resolve/handshake failure
    bool connectSession(const SessionRecord& session, RemoteError* err = nullptr);

    // Close/free SFTP + libssh session (safe to call multiple times).
    void disconnect();

    bool isConnected() const;

    // Run one command over a fresh exec channel. Returns true when the
    // command ran to completion, whatever its exit status.
    bool exec(const QString& command, CommandResult* out, RemoteError* err = nullptr);

    // ------------------------------------------------------------
    // SFTP primitives (one SFTP subsystem per connection, opened lazily)
    // ------------------------------------------------------------
    bool listRemoteDir(const QString& remotePath,
                       QVector<FileEntry>* outItems,
                       RemoteError* err = nullptr);

    bool statRemotePath(const QString& remotePath,
                        FileAttributes* outInfo,
                        RemoteError* err = nullptr);

    // Streams `in` to <remotePath>.part, then renames into place.
    bool uploadStream(QIODevice* in, const QString& remotePath, RemoteError* err = nullptr);

    bool downloadStream(const QString& remotePath, QIODevice* out, RemoteError* err = nullptr);

    bool renameRemote(const QString& oldPath, const QString& newPath, RemoteError* err = nullptr);

private:
    bool ensureSftp(RemoteErrorKind kindOnFailure, RemoteError* err);

    ssh_session  m_session = nullptr;
    sftp_session m_sftp    = nullptr;
    int          m_timeoutSec = 8;
    QString      m_target;   // user@host:port, for log lines
};
