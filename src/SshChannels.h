#pragma once

#include "RemoteChannels.h"
#include "SshClient.h"

/*
    libssh-backed channels.

    Each channel owns its own SshClient (its own TCP connection), so a
    control command never shares a session with an in-progress SFTP
    transfer.
*/

class SshControlChannel : public ControlChannel
{
public:
    explicit SshControlChannel(const SessionRecord& session, int connectTimeoutSec = 8);
    ~SshControlChannel() override;

    bool connect(RemoteError* err = nullptr) override;
    bool run(const QString& command, CommandResult* out, RemoteError* err = nullptr) override;
    void disconnect() override;

private:
    SessionRecord m_session;
    SshClient     m_client;
};

class SshFileChannel : public FileChannel
{
public:
    explicit SshFileChannel(const SessionRecord& session, int connectTimeoutSec = 8);
    ~SshFileChannel() override;

    bool connect(RemoteError* err = nullptr) override;
    void disconnect() override;
    bool isConnected() const override;

    bool list(const QString& path, QVector<FileEntry>* out, RemoteError* err = nullptr) override;
    bool attributes(const QString& path, FileAttributes* out, RemoteError* err = nullptr) override;
    bool upload(QIODevice* in, const QString& remotePath, RemoteError* err = nullptr) override;
    bool download(const QString& remotePath, QIODevice* out, RemoteError* err = nullptr) override;
    bool rename(const QString& oldPath, const QString& newPath, RemoteError* err = nullptr) override;

private:
    SessionRecord m_session;
    SshClient     m_client;
};

class SshChannelFactory : public ChannelFactory
{
public:
    explicit SshChannelFactory(int connectTimeoutSec = 8) : m_timeoutSec(connectTimeoutSec) {}

    std::unique_ptr<ControlChannel> createControlChannel(const SessionRecord& session) override;
    std::shared_ptr<FileChannel> createFileChannel(const SessionRecord& session) override;

private:
    int m_timeoutSec = 8;
};
