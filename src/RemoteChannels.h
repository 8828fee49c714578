// RemoteChannels.h
//
// Purpose:
//   Abstract seams between the session orchestrator and the transport:
//     - ControlChannel: one-shot remote command execution
//     - FileChannel:    SFTP-style listing / stat / stream transfer / rename
//     - ChannelFactory: builds both for a SessionRecord
//
//   The libssh implementations live in SshChannels.h; tests substitute
//   in-memory or local-filesystem doubles.
//
// Threading:
//   A channel instance is used by one thread at a time. The orchestrator
//   guarantees this by running at most one task per connection.

#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>
#include <memory>

#include "RemoteError.h"
#include "SessionRecord.h"

class QIODevice;

// One row of a remote directory listing.
struct FileEntry
{
    QString name;
    bool    isDirectory  = false;
    bool    isParentLink = false;   // synthetic ".." row
    quint64 sizeBytes    = 0;
    qint64  modifiedAt   = 0;       // seconds since epoch

    // Decimal byte count; "-" for directories and the parent link.
    QString sizeText() const;

    // "yyyy-MM-dd HH:mm" local time; "-" for directories and the parent link.
    QString modifiedText() const;

    static FileEntry parentLink();
};

struct FileAttributes
{
    bool    isDirectory = false;
    quint64 sizeBytes   = 0;
    qint64  modifiedAt  = 0;
};

struct CommandResult
{
    QString stdoutText;
    QString stderrText;
    int     exitStatus = -1;

    bool succeeded() const { return exitStatus == 0; }

    // stderr if present, else a generic "exit N" message
    QString failureText() const;
};

// ------------------------------------------------------------
// ControlChannel: authenticated command-execution connection.
// ------------------------------------------------------------
class ControlChannel
{
public:
    virtual ~ControlChannel() = default;

    virtual bool connect(RemoteError* err = nullptr) = 0;

    // Runs one command on a fresh exec channel. Returns false only if the
    // command could not be run; a non-zero exit status is reported in `out`.
    virtual bool run(const QString& command, CommandResult* out, RemoteError* err = nullptr) = 0;

    // Safe to call multiple times and on a never-connected channel.
    virtual void disconnect() = 0;
};

// ------------------------------------------------------------
// FileChannel: authenticated file-transfer connection.
// ------------------------------------------------------------
class FileChannel
{
public:
    virtual ~FileChannel() = default;

    virtual bool connect(RemoteError* err = nullptr) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Entries of `path`, without "." and "..".
    virtual bool list(const QString& path, QVector<FileEntry>* out, RemoteError* err = nullptr) = 0;

    virtual bool attributes(const QString& path, FileAttributes* out, RemoteError* err = nullptr) = 0;

    // Whole-stream transfers. `in` must be open for reading, `out` for writing.
    virtual bool upload(QIODevice* in, const QString& remotePath, RemoteError* err = nullptr) = 0;
    virtual bool download(const QString& remotePath, QIODevice* out, RemoteError* err = nullptr) = 0;

    virtual bool rename(const QString& oldPath, const QString& newPath, RemoteError* err = nullptr) = 0;
};

// ------------------------------------------------------------
// ChannelFactory: creates unconnected channels for a session.
// Must be callable from worker threads.
// ------------------------------------------------------------
class ChannelFactory
{
public:
    virtual ~ChannelFactory() = default;

    virtual std::unique_ptr<ControlChannel> createControlChannel(const SessionRecord& session) = 0;
    virtual std::shared_ptr<FileChannel> createFileChannel(const SessionRecord& session) = 0;
};
