
    // SshClient.cpp
    //
    // Purpose:
    //   Central SSH/SFTP utility layer for MintTerm.
    //   - Creates and owns a libssh session
    //   - Authenticates with a private key (optionally encrypted) or a password
    //     (falls back to keyboard-interactive with the same password)
    //   - Provides the "remote exec" helper used by the control channel
    //   - Provides SFTP listing/stat/streaming transfer/rename for the file channel
    //
    // Design notes:
    //   - Never log secrets (passwords, passphrases).
    //   - Secret bytes handed to libssh are wiped with sodium_memzero afterwards.

    #include "SshClient.h"

    #include <QFile>
    #include <QFileInfo>
    #include <QIODevice>
    #include <QDebug>

    #include <libssh/libssh.h>
    #include <libssh/sftp.h>

    #include <fcntl.h>
    #include <sys/stat.h>

    #include <sodium.h>
    #include <algorithm> // std::fill

    // ------------------------------------------------------------
    // Small helper to turn libssh's last error into QString
    // ------------------------------------------------------------
    static QString libsshError(ssh_session s)
    {
        if (!s) return QStringLiteral("libssh: null session");
        return QString::fromLocal8Bit(ssh_get_error(s));
    }

    // ------------------------------------------------------------
    // Best-effort wipe of secret material (passwords, passphrases).
    // ------------------------------------------------------------
    static void wipeSecret(QByteArray& bytes)
    {
        if (bytes.isEmpty()) return;
        if (sodium_init() >= 0) sodium_memzero(bytes.data(), (size_t)bytes.size());
        else std::fill(bytes.begin(), bytes.end(), '\0');
        bytes.clear();
    }

    static bool isDirMode(quint32 perms, int type)
    {
        if (type == SSH_FILEXFER_TYPE_DIRECTORY) return true;
        return (perms & S_IFMT) == S_IFDIR;
    }

    SshClient::SshClient() = default;

    SshClient::~SshClient()
    {
        // Ensure we never leak sessions on shutdown.
        disconnect();
    }

    // ------------------------------------------------------------
    // Keyboard-interactive: answer every prompt with the password.
    // ------------------------------------------------------------
    static int authKbdInteractive(ssh_session s, const QByteArray& password)
    {
        int rc = ssh_userauth_kbdint(s, nullptr, nullptr);
        while (rc == SSH_AUTH_INFO) {
            const int n = ssh_userauth_kbdint_getnprompts(s);
            for (int i = 0; i < n; ++i) {
                if (ssh_userauth_kbdint_setanswer(s, (unsigned)i, password.constData()) < 0)
                    return SSH_AUTH_ERROR;
            }
            rc = ssh_userauth_kbdint(s, nullptr, nullptr);
        }
        return rc;
    }

    // ------------------------------------------------------------
    // connectSession(): establish libssh session suitable for SFTP + exec
    // ------------------------------------------------------------
bool SshClient::connectSession(const SessionRecord& session, RemoteError* err)
{
    if (err) err->clear();

    const QString host = session.host.trimmed();
    const QString user = session.username.trimmed();
    const int port = session.effectivePort();

    if (host.isEmpty() || user.isEmpty()) {
        setRemoteError(err, RemoteErrorKind::AuthConfig, QStringLiteral("Host and username are required."));
        qWarning().noquote() << "[SSH] connectSession FAILED: host or username missing";
        return false;
    }
    if (!session.hasUsableAuth()) {
        setRemoteError(err, RemoteErrorKind::AuthConfig, QStringLiteral("No password and no private key set."));
        qWarning().noquote() << QString("[SSH] connectSession FAILED user='%1' host='%2': no credentials")
                                .arg(user, host);
        return false;
    }

    const bool useKey = session.hasPrivateKey();

    qInfo().noquote() << QString("[SSH] connectSession start user='%1' host='%2' port=%3 auth=%4")
                         .arg(user, host)
                         .arg(port)
                         .arg(useKey ? "publickey" : "password");

    // Always clean up any previous libssh session before reconnecting.
    disconnect();

    ssh_session s = ssh_new();
    if (!s) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("ssh_new() failed."));
        qWarning().noquote() << "[SSH] connectSession FAILED: ssh_new failed";
        return false;
    }

    auto failAndFree = [&](RemoteErrorKind kind, const QString &msg, bool connected) -> bool {
        setRemoteError(err, kind, msg);
        qWarning().noquote() << QString("[SSH] connectSession FAILED user='%1' host='%2': %3")
                                .arg(user, host, msg);
        if (connected) ssh_disconnect(s);
        ssh_free(s);
        return false;
    };

    auto optSet = [&](enum ssh_options_e opt, const void *val, const char *what) -> bool {
        const int r = ssh_options_set(s, opt, val);
        if (r != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
            return false;
        }
        return true;
    };

    // Options
    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    if (!optSet(SSH_OPTIONS_HOST, hostUtf8.constData(), "HOST"))
        return failAndFree(RemoteErrorKind::Connect, QStringLiteral("Invalid host '%1'.").arg(host), false);
    optSet(SSH_OPTIONS_USER, userUtf8.constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");

    long timeoutSec = m_timeoutSec;
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    // Network connect
    int rc = ssh_connect(s);
    if (rc != SSH_OK) {
        return failAndFree(RemoteErrorKind::Connect,
                           QStringLiteral("ssh_connect failed: %1").arg(libsshError(s)), false);
    }

    qInfo().noquote() << QString("[SSH] ssh_connect OK host='%1' port=%2").arg(host).arg(port);

    if (useKey) {
        const QByteArray keyPath = QFile::encodeName(session.privateKeyPath.trimmed());
        QByteArray passphrase = session.privateKeyPassphrase.toUtf8();

        ssh_key key = nullptr;
        const int irc = ssh_pki_import_privkey_file(keyPath.constData(),
                                                    passphrase.isEmpty() ? nullptr : passphrase.constData(),
                                                    nullptr, nullptr, &key);
        wipeSecret(passphrase);

        if (irc != SSH_OK || !key) {
            return failAndFree(RemoteErrorKind::Auth,
                               QStringLiteral("Could not load private key '%1' (wrong passphrase or unsupported format).")
                                   .arg(QFileInfo(session.privateKeyPath).fileName()),
                               true);
        }

        rc = ssh_userauth_publickey(s, nullptr, key);
        ssh_key_free(key);
    } else {
        QByteArray password = session.password.toUtf8();

        rc = ssh_userauth_password(s, nullptr, password.constData());
        if (rc == SSH_AUTH_DENIED) {
            qInfo().noquote() << QString("[SSH] password auth denied -> trying keyboard-interactive user='%1' host='%2'")
                                 .arg(user, host);
            rc = authKbdInteractive(s, password);
        }

        wipeSecret(password);
    }

    if (rc == SSH_AUTH_ERROR) {
        return failAndFree(RemoteErrorKind::Connect,
                           QStringLiteral("Authentication error: %1").arg(libsshError(s)), true);
    }
    if (rc != SSH_AUTH_SUCCESS) {
        return failAndFree(RemoteErrorKind::Auth,
                           QStringLiteral("Authentication failed for %1@%2: %3")
                               .arg(user, host, libsshError(s)),
                           true);
    }

    // Success: keep session
    m_session = s;
    m_target = QString("%1@%2:%3").arg(user, host).arg(port);

    qInfo().noquote() << QString("[SSH] connectSession OK %1").arg(m_target);
    return true;
}

    // ------------------------------------------------------------
    // Disconnect and free session (safe to call multiple times).
    // ------------------------------------------------------------
    void SshClient::disconnect()
    {
        if (m_sftp) {
            sftp_free(m_sftp);
            m_sftp = nullptr;
        }
        if (m_session) {
            qInfo().noquote() << QString("[SSH] disconnect %1").arg(m_target);
            ssh_disconnect(m_session);
            ssh_free(m_session);
            m_session = nullptr;
        }
    }

    bool SshClient::isConnected() const
    {
        return m_session != nullptr;
    }

    // ------------------------------------------------------------
    // Small helper: open+init SFTP for current session (once).
    // ------------------------------------------------------------
    bool SshClient::ensureSftp(RemoteErrorKind kindOnFailure, RemoteError* err)
    {
        if (!m_session) {
            setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("Not connected."));
            return false;
        }
        if (m_sftp) return true;

        sftp_session sftp = sftp_new(m_session);
        if (!sftp) {
            setRemoteError(err, kindOnFailure, "sftp_new failed: " + libsshError(m_session));
            return false;
        }

        if (sftp_init(sftp) != SSH_OK) {
            setRemoteError(err, kindOnFailure, "sftp_init failed: " + libsshError(m_session));
            sftp_free(sftp);
            return false;
        }

        m_sftp = sftp;
        return true;
    }

// ------------------------------------------------------------
// Execute a remote command and capture stdout/stderr/exit status.
// ------------------------------------------------------------
bool SshClient::exec(const QString& command, CommandResult* out, RemoteError* err)
{
    if (out) *out = CommandResult{};
    if (err) err->clear();

    if (!m_session) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("Not connected."));
        return false;
    }

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        setRemoteError(err, RemoteErrorKind::Command, QStringLiteral("ssh_channel_new failed."));
        return false;
    }

    auto cleanup = [&]() {
        if (ssh_channel_is_open(ch)) {
            ssh_channel_send_eof(ch);
            ssh_channel_close(ch);
        }
        ssh_channel_free(ch);
        ch = nullptr;
    };

    auto fail = [&](const QString& msg) -> bool {
        setRemoteError(err, RemoteErrorKind::Command, msg);
        cleanup();
        return false;
    };

    if (ssh_channel_open_session(ch) != SSH_OK)
        return fail("ssh_channel_open_session failed: " + libsshError(m_session));

    if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK)
        return fail("ssh_channel_request_exec failed: " + libsshError(m_session));

    QByteArray outBuf, errBuf;
    char buf[4096];

    auto readAvailable = [&](int isStderr) -> bool {
        while (true) {
            const int n = ssh_channel_read_nonblocking(ch, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR)
                return false;
            if (n <= 0)
                break;

            if (isStderr) errBuf.append(buf, n);
            else          outBuf.append(buf, n);
        }
        return true;
    };

    while (true) {
        // Wait up to 50ms for stdout activity (this is our main "tick")
        const int availOut = ssh_channel_poll_timeout(ch, /*timeoutMs*/ 50, /*is_stderr*/ 0);
        if (availOut == SSH_ERROR)
            return fail("ssh_channel_poll_timeout(stdout) failed: " + libsshError(m_session));

        if (availOut > 0 && !readAvailable(0))
            return fail("ssh_channel_read(stdout) failed: " + libsshError(m_session));

        // Always drain any stderr that is available (don't block on it)
        const int availErr = ssh_channel_poll_timeout(ch, 0, 1);
        if (availErr == SSH_ERROR)
            return fail("ssh_channel_poll_timeout(stderr) failed: " + libsshError(m_session));

        if (availErr > 0 && !readAvailable(1))
            return fail("ssh_channel_read(stderr) failed: " + libsshError(m_session));

        // Stop when remote EOF and nothing more buffered
        if (ssh_channel_is_eof(ch)) {
            if (!readAvailable(0) || !readAvailable(1))
                return fail("ssh_channel_read(drain) failed: " + libsshError(m_session));
            break;
        }
    }

    ssh_channel_send_eof(ch);
    ssh_channel_close(ch);

    const int status = ssh_channel_get_exit_status(ch);
    ssh_channel_free(ch);
    ch = nullptr;

    if (out) {
        out->stdoutText = QString::fromUtf8(outBuf);
        out->stderrText = QString::fromUtf8(errBuf);
        out->exitStatus = status;
    }

    qDebug().noquote() << QString("[SSH] exec done exit=%1 out=%2B err=%3B")
                          .arg(status).arg(outBuf.size()).arg(errBuf.size());
    return true;
}

    // ------------------------------------------------------------
    // SFTP: list remote directory (non-recursive).
    // ------------------------------------------------------------
    bool SshClient::listRemoteDir(const QString& remotePath,
                                  QVector<FileEntry>* outItems,
                                  RemoteError* err)
    {
        if (err) err->clear();
        if (outItems) outItems->clear();

        if (!ensureSftp(RemoteErrorKind::List, err)) return false;

        const QString path = remotePath.trimmed().isEmpty() ? QStringLiteral("/") : remotePath.trimmed();

        sftp_dir dir = sftp_opendir(m_sftp, path.toUtf8().constData());
        if (!dir) {
            setRemoteError(err, RemoteErrorKind::List,
                           QString("Cannot list '%1': %2").arg(path, libsshError(m_session)));
            return false;
        }

        QVector<FileEntry> items;

        while (true) {
            sftp_attributes a = sftp_readdir(m_sftp, dir);
            if (!a) break;

            const QString name = QString::fromUtf8(a->name ? a->name : "");
            if (name.isEmpty() || name == "." || name == "..") {
                sftp_attributes_free(a);
                continue;
            }

            FileEntry e;
            e.name        = name;
            e.sizeBytes   = (quint64)a->size;
            e.modifiedAt  = (qint64)a->mtime;
            e.isDirectory = isDirMode((quint32)a->permissions, a->type);

            // Links are listed as their target (same answer as statRemotePath).
            // A dangling link stays a plain entry.
            if (a->type == SSH_FILEXFER_TYPE_SYMLINK) {
                const QString full = path.endsWith('/') ? path + name : path + "/" + name;
                sftp_attributes t = sftp_stat(m_sftp, full.toUtf8().constData());
                if (t) {
                    e.isDirectory = isDirMode((quint32)t->permissions, t->type);
                    e.sizeBytes   = (quint64)t->size;
                    e.modifiedAt  = (qint64)t->mtime;
                    sftp_attributes_free(t);
                }
            }

            items.push_back(e);
            sftp_attributes_free(a);
        }

        const bool eof = sftp_dir_eof(dir) != 0;
        sftp_closedir(dir);

        if (!eof) {
            setRemoteError(err, RemoteErrorKind::List,
                           QString("Listing '%1' ended early: %2").arg(path, libsshError(m_session)));
            return false;
        }

        if (outItems) *outItems = items;
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: stat remote path (file or directory).
    // ------------------------------------------------------------
    bool SshClient::statRemotePath(const QString& remotePath,
                                   FileAttributes* outInfo,
                                   RemoteError* err)
    {
        if (err) err->clear();
        if (!outInfo) {
            setRemoteError(err, RemoteErrorKind::Attribute, "statRemotePath: outInfo is null.");
            return false;
        }
        *outInfo = FileAttributes{};

        if (remotePath.trimmed().isEmpty()) {
            setRemoteError(err, RemoteErrorKind::Attribute, "Remote path is empty.");
            return false;
        }
        if (!ensureSftp(RemoteErrorKind::Attribute, err)) return false;

        sftp_attributes a = sftp_stat(m_sftp, remotePath.toUtf8().constData());
        if (!a) {
            setRemoteError(err, RemoteErrorKind::Attribute,
                           QString("sftp_stat failed for '%1': %2").arg(remotePath, libsshError(m_session)));
            return false;
        }

        outInfo->sizeBytes   = (quint64)a->size;
        outInfo->modifiedAt  = (qint64)a->mtime;
        outInfo->isDirectory = isDirMode((quint32)a->permissions, a->type);

        sftp_attributes_free(a);
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: streaming upload QIODevice -> remote file.
    //   - writes to <remote>.part
    //   - rename to final (unlink + retry for servers that don't overwrite)
    // ------------------------------------------------------------
    bool SshClient::uploadStream(QIODevice* in, const QString& remotePath, RemoteError* err)
    {
        if (err) err->clear();

        if (!in || !in->isReadable() || remotePath.trimmed().isEmpty()) {
            setRemoteError(err, RemoteErrorKind::Transfer, "uploadStream: source/remotePath invalid.");
            return false;
        }
        if (!ensureSftp(RemoteErrorKind::Transfer, err)) return false;

        const QString tmpPath = remotePath + ".part";
        const QByteArray tmpUtf8 = tmpPath.toUtf8();
        const QByteArray dstUtf8 = remotePath.toUtf8();

        sftp_file f = sftp_open(m_sftp, tmpUtf8.constData(),
                                O_WRONLY | O_CREAT | O_TRUNC,
                                S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (!f) {
            setRemoteError(err, RemoteErrorKind::Transfer,
                           QString("Cannot open remote temp file '%1': %2").arg(tmpPath, libsshError(m_session)));
            return false;
        }

        QByteArray buf(64 * 1024, Qt::Uninitialized);
        quint64 sent = 0;

        while (true) {
            const qint64 n = in->read(buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) {
                setRemoteError(err, RemoteErrorKind::Transfer,
                               QString("Local read failed: %1").arg(in->errorString()));
                sftp_close(f);
                sftp_unlink(m_sftp, tmpUtf8.constData());
                return false;
            }

            const char* ptr = buf.constData();
            qint64 remaining = n;
            while (remaining > 0) {
                const ssize_t w = sftp_write(f, ptr, (size_t)remaining);
                if (w < 0) {
                    setRemoteError(err, RemoteErrorKind::Transfer,
                                   QString("SFTP write failed: %1").arg(libsshError(m_session)));
                    sftp_close(f);
                    sftp_unlink(m_sftp, tmpUtf8.constData());
                    return false;
                }
                ptr += w;
                remaining -= w;
            }
            sent += (quint64)n;
        }

        sftp_close(f);

        if (sftp_rename(m_sftp, tmpUtf8.constData(), dstUtf8.constData()) != SSH_OK) {
            sftp_unlink(m_sftp, dstUtf8.constData());

            if (sftp_rename(m_sftp, tmpUtf8.constData(), dstUtf8.constData()) != SSH_OK) {
                setRemoteError(err, RemoteErrorKind::Transfer,
                               QString("SFTP rename failed '%1' -> '%2': %3")
                                   .arg(tmpPath, remotePath, libsshError(m_session)));
                sftp_unlink(m_sftp, tmpUtf8.constData());
                return false;
            }
        }

        qInfo().noquote() << QString("[SFTP] uploaded %1 bytes -> %2").arg(sent).arg(remotePath);
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: streaming download remote file -> QIODevice.
    // ------------------------------------------------------------
    bool SshClient::downloadStream(const QString& remotePath, QIODevice* out, RemoteError* err)
    {
        if (err) err->clear();

        if (!out || !out->isWritable() || remotePath.trimmed().isEmpty()) {
            setRemoteError(err, RemoteErrorKind::Transfer, "downloadStream: remotePath/target invalid.");
            return false;
        }
        if (!ensureSftp(RemoteErrorKind::Transfer, err)) return false;

        sftp_file f = sftp_open(m_sftp, remotePath.toUtf8().constData(), O_RDONLY, 0);
        if (!f) {
            setRemoteError(err, RemoteErrorKind::Transfer,
                           QString("Cannot open remote file '%1': %2").arg(remotePath, libsshError(m_session)));
            return false;
        }

        QByteArray buf(64 * 1024, Qt::Uninitialized);
        quint64 done = 0;

        while (true) {
            const ssize_t n = sftp_read(f, buf.data(), (size_t)buf.size());
            if (n == 0)
                break; // EOF
            if (n < 0) {
                setRemoteError(err, RemoteErrorKind::Transfer,
                               QString("SFTP read failed: %1").arg(libsshError(m_session)));
                sftp_close(f);
                return false;
            }

            if (out->write(buf.constData(), (qint64)n) != (qint64)n) {
                setRemoteError(err, RemoteErrorKind::Transfer,
                               QString("Local write failed: %1").arg(out->errorString()));
                sftp_close(f);
                return false;
            }
            done += (quint64)n;
        }

        sftp_close(f);

        qInfo().noquote() << QString("[SFTP] downloaded %1 bytes <- %2").arg(done).arg(remotePath);
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: rename (single call, no overwrite fallback).
    // ------------------------------------------------------------
    bool SshClient::renameRemote(const QString& oldPath, const QString& newPath, RemoteError* err)
    {
        if (err) err->clear();
        if (!ensureSftp(RemoteErrorKind::Transfer, err)) return false;

        if (sftp_rename(m_sftp, oldPath.toUtf8().constData(), newPath.toUtf8().constData()) != SSH_OK) {
            setRemoteError(err, RemoteErrorKind::Transfer,
                           QString("Rename '%1' -> '%2' failed: %3")
                               .arg(oldPath, newPath, libsshError(m_session)));
            return false;
        }
        return true;
    }
