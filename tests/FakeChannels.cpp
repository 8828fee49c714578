#include "FakeChannels.h"
#include "RemotePath.h"

#include <QIODevice>
#include <QMutexLocker>
#include <QThread>

void FakeRemote::addDir(const QString& path, const QVector<FileEntry>& entries)
{
    QMutexLocker lock(&mutex);
    dirs.insert(path, entries);
    FileAttributes a;
    a.isDirectory = true;
    attrs.insert(path, a);
}

void FakeRemote::addFile(const QString& path, quint64 size, qint64 mtime, const QByteArray& data)
{
    QMutexLocker lock(&mutex);
    FileAttributes a;
    a.sizeBytes = size;
    a.modifiedAt = mtime;
    attrs.insert(path, a);
    contents.insert(path, data);
}

int FakeRemote::listCount() const
{
    QMutexLocker lock(&mutex);
    return listedPaths.size();
}

QStringList FakeRemote::commandLog() const
{
    QMutexLocker lock(&mutex);
    return commands;
}

// ------------------------------------------------------------
// FakeFileChannel
// ------------------------------------------------------------
bool FakeFileChannel::connect(RemoteError* err)
{
    QMutexLocker lock(&m_remote->mutex);
    ++m_remote->fileConnects;
    if (m_remote->connectFailure != RemoteErrorKind::None) {
        setRemoteError(err, m_remote->connectFailure, QStringLiteral("fake connect failure"));
        return false;
    }
    m_connected = true;
    return true;
}

void FakeFileChannel::disconnect()
{
    QMutexLocker lock(&m_remote->mutex);
    if (m_connected)
        ++m_remote->fileDisconnects;
    m_connected = false;
}

bool FakeFileChannel::list(const QString& path, QVector<FileEntry>* out, RemoteError* err)
{
    int delay = 0;
    {
        QMutexLocker lock(&m_remote->mutex);
        delay = m_remote->listDelayMs;
    }
    if (delay > 0)
        QThread::msleep(delay);

    QMutexLocker lock(&m_remote->mutex);
    m_remote->listedPaths << path;

    if (m_remote->failList.contains(path) || !m_remote->dirs.contains(path)) {
        setRemoteError(err, RemoteErrorKind::List, QStringLiteral("No such directory: %1").arg(path));
        return false;
    }
    if (out) *out = m_remote->dirs.value(path);
    return true;
}

bool FakeFileChannel::attributes(const QString& path, FileAttributes* out, RemoteError* err)
{
    QMutexLocker lock(&m_remote->mutex);
    if (!m_remote->attrs.contains(path)) {
        setRemoteError(err, RemoteErrorKind::Attribute, QStringLiteral("No such file: %1").arg(path));
        return false;
    }
    if (out) *out = m_remote->attrs.value(path);
    return true;
}

bool FakeFileChannel::upload(QIODevice* in, const QString& remotePath, RemoteError* err)
{
    Q_UNUSED(err);
    const QByteArray data = in->readAll();
    QMutexLocker lock(&m_remote->mutex);
    m_remote->contents.insert(remotePath, data);
    FileAttributes a;
    a.sizeBytes = quint64(data.size());
    m_remote->attrs.insert(remotePath, a);
    return true;
}

bool FakeFileChannel::download(const QString& remotePath, QIODevice* out, RemoteError* err)
{
    QByteArray data;
    {
        QMutexLocker lock(&m_remote->mutex);
        if (!m_remote->contents.contains(remotePath)) {
            setRemoteError(err, RemoteErrorKind::Transfer, QStringLiteral("No such file: %1").arg(remotePath));
            return false;
        }
        data = m_remote->contents.value(remotePath);
    }
    if (out->write(data) != data.size()) {
        setRemoteError(err, RemoteErrorKind::Transfer, QStringLiteral("short write"));
        return false;
    }
    return true;
}

bool FakeFileChannel::rename(const QString& oldPath, const QString& newPath, RemoteError* err)
{
    QMutexLocker lock(&m_remote->mutex);
    m_remote->renames.push_back(qMakePair(oldPath, newPath));

    if (!m_remote->attrs.contains(oldPath)) {
        setRemoteError(err, RemoteErrorKind::Transfer, QStringLiteral("No such file: %1").arg(oldPath));
        return false;
    }

    // Move the entry inside its parent listing too.
    const QString parent = RemotePath::parent(oldPath);
    if (m_remote->dirs.contains(parent)) {
        QVector<FileEntry>& entries = m_remote->dirs[parent];
        for (FileEntry& e : entries) {
            if (e.name == RemotePath::baseName(oldPath))
                e.name = RemotePath::baseName(newPath);
        }
    }
    m_remote->attrs.insert(newPath, m_remote->attrs.take(oldPath));
    if (m_remote->contents.contains(oldPath))
        m_remote->contents.insert(newPath, m_remote->contents.take(oldPath));
    return true;
}

// ------------------------------------------------------------
// FakeControlChannel
// ------------------------------------------------------------
bool FakeControlChannel::connect(RemoteError* err)
{
    QMutexLocker lock(&m_remote->mutex);
    if (m_remote->connectFailure != RemoteErrorKind::None) {
        setRemoteError(err, m_remote->connectFailure, QStringLiteral("fake connect failure"));
        return false;
    }
    if (!m_connected) {
        m_connected = true;
        ++m_remote->openControlChannels;
    }
    return true;
}

bool FakeControlChannel::run(const QString& command, CommandResult* out, RemoteError* err)
{
    QMutexLocker lock(&m_remote->mutex);
    if (!m_connected) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("not connected"));
        return false;
    }
    m_remote->commands << command;

    CommandResult r;
    r.exitStatus = 0;
    if (m_remote->commandResults.contains(command))
        r = m_remote->commandResults.value(command);
    if (out) *out = r;
    return true;
}

void FakeControlChannel::disconnect()
{
    QMutexLocker lock(&m_remote->mutex);
    if (m_connected) {
        m_connected = false;
        --m_remote->openControlChannels;
    }
}

// ------------------------------------------------------------
// FakeChannelFactory
// ------------------------------------------------------------
std::unique_ptr<ControlChannel> FakeChannelFactory::createControlChannel(const SessionRecord& session)
{
    Q_UNUSED(session);
    {
        QMutexLocker lock(&m_remote->mutex);
        ++m_remote->controlChannelsCreated;
    }
    return std::unique_ptr<ControlChannel>(new FakeControlChannel(m_remote));
}

std::shared_ptr<FileChannel> FakeChannelFactory::createFileChannel(const SessionRecord& session)
{
    Q_UNUSED(session);
    {
        QMutexLocker lock(&m_remote->mutex);
        ++m_remote->fileChannelsCreated;
    }
    return std::make_shared<FakeFileChannel>(m_remote);
}
