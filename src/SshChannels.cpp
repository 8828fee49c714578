// SshChannels.cpp
//
// Thin adapters from the ControlChannel / FileChannel seams onto SshClient.

#include "SshChannels.h"

#include <QDebug>

// ------------------------------------------------------------
// SshControlChannel
// ------------------------------------------------------------
SshControlChannel::SshControlChannel(const SessionRecord& session, int connectTimeoutSec)
    : m_session(session)
{
    m_client.setConnectTimeoutSec(connectTimeoutSec);
}

SshControlChannel::~SshControlChannel()
{
    disconnect();
}

bool SshControlChannel::connect(RemoteError* err)
{
    return m_client.connectSession(m_session, err);
}

bool SshControlChannel::run(const QString& command, CommandResult* out, RemoteError* err)
{
    if (!m_client.isConnected()) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("Control channel is not connected."));
        return false;
    }
    return m_client.exec(command, out, err);
}

void SshControlChannel::disconnect()
{
    m_client.disconnect();
}

// ------------------------------------------------------------
// SshFileChannel
// ------------------------------------------------------------
SshFileChannel::SshFileChannel(const SessionRecord& session, int connectTimeoutSec)
    : m_session(session)
{
    m_client.setConnectTimeoutSec(connectTimeoutSec);
}

SshFileChannel::~SshFileChannel()
{
    disconnect();
}

bool SshFileChannel::connect(RemoteError* err)
{
    if (!m_client.connectSession(m_session, err))
        return false;

    // Stat the root now so a server without SFTP fails the connect,
    // not the first listing.
    FileAttributes root;
    RemoteError rootErr;
    if (!m_client.statRemotePath(QStringLiteral("/"), &root, &rootErr)) {
        m_client.disconnect();
        setRemoteError(err, RemoteErrorKind::Connect,
                       QStringLiteral("SFTP unavailable: %1").arg(rootErr.message));
        return false;
    }
    return true;
}

void SshFileChannel::disconnect()
{
    m_client.disconnect();
}

bool SshFileChannel::isConnected() const
{
    return m_client.isConnected();
}

bool SshFileChannel::list(const QString& path, QVector<FileEntry>* out, RemoteError* err)
{
    return m_client.listRemoteDir(path, out, err);
}

bool SshFileChannel::attributes(const QString& path, FileAttributes* out, RemoteError* err)
{
    return m_client.statRemotePath(path, out, err);
}

bool SshFileChannel::upload(QIODevice* in, const QString& remotePath, RemoteError* err)
{
    return m_client.uploadStream(in, remotePath, err);
}

bool SshFileChannel::download(const QString& remotePath, QIODevice* out, RemoteError* err)
{
    return m_client.downloadStream(remotePath, out, err);
}

bool SshFileChannel::rename(const QString& oldPath, const QString& newPath, RemoteError* err)
{
    return m_client.renameRemote(oldPath, newPath, err);
}

// ------------------------------------------------------------
// SshChannelFactory
// ------------------------------------------------------------
std::unique_ptr<ControlChannel> SshChannelFactory::createControlChannel(const SessionRecord& session)
{
    return std::make_unique<SshControlChannel>(session, m_timeoutSec);
}

std::shared_ptr<FileChannel> SshChannelFactory::createFileChannel(const SessionRecord& session)
{
    return std::make_shared<SshFileChannel>(session, m_timeoutSec);
}
