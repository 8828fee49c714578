// Connection.cpp
//
// Every channel call goes through runTask(): the worker receives the file
// channel (shared, kept alive for the task) and the factory, never `this`.
// Results are applied in the watcher's finished handler on the GUI thread.

#include "Connection.h"
#include "AuditLogger.h"
#include "RemotePath.h"
#include "ShellHost.h"
#include "SurfaceProvider.h"

#include <QFileInfo>
#include <QFutureWatcher>
#include <QJsonObject>
#include <QtConcurrent/QtConcurrent>
#include <QDebug>

#include <algorithm>

// ------------------------------------------------------------
// Worker-side helpers (no Connection state)
// ------------------------------------------------------------

// One-shot command on a fresh control channel, disconnected afterwards.
static bool runControlCommand(ChannelFactory& factory,
                              const SessionRecord& session,
                              const QString& command,
                              CommandResult* out,
                              RemoteError* err)
{
    std::unique_ptr<ControlChannel> control = factory.createControlChannel(session);
    if (!control) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("Cannot create a control channel."));
        return false;
    }
    if (!control->connect(err)) {
        control->disconnect();
        return false;
    }

    RemoteError runErr;
    const bool ran = control->run(command, out, &runErr);
    control->disconnect();

    if (!ran) {
        setRemoteError(err, RemoteErrorKind::Command, runErr.message);
        return false;
    }
    if (!out->succeeded()) {
        setRemoteError(err, RemoteErrorKind::Command, out->failureText());
        return false;
    }
    return true;
}

// Pipeline over the task's file channel and a fresh control channel. The
// control channel is only connected when the step runs remote commands.
static bool withPipeline(ChannelFactory& factory,
                         const SessionRecord& session,
                         FileChannel& files,
                         const TransferOptions& options,
                         bool needsControl,
                         const std::function<bool(TransferPipeline&, RemoteError*)>& fn,
                         RemoteError* err)
{
    std::unique_ptr<ControlChannel> control = factory.createControlChannel(session);
    if (!control) {
        setRemoteError(err, RemoteErrorKind::Connect, QStringLiteral("Cannot create a control channel."));
        return false;
    }
    if (needsControl && !control->connect(err)) {
        control->disconnect();
        return false;
    }

    TransferPipeline pipeline(*control, files, options);
    const bool ok = fn(pipeline, err);
    control->disconnect();
    return ok;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
Connection::Connection(const SessionRecord& session,
                       std::shared_ptr<ChannelFactory> factory,
                       const TransferOptions& transferOptions,
                       QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_factory(std::move(factory))
    , m_transferOptions(transferOptions)
{
    m_shell = new ShellHost(this);

    connect(m_shell, &ShellHost::attached, this, [this](qint64 pid) {
        qInfo().noquote() << QString("[CONN] '%1' shell attached pid=%2").arg(m_session.name).arg(pid);
    });
    connect(m_shell, &ShellHost::warning, this, &Connection::shellWarning);
    connect(m_shell, &ShellHost::failed, this, [this](const RemoteError& e) {
        // The file channel stays usable without a shell.
        reportError(e);
    });
    connect(m_shell, &ShellHost::exited, this, &Connection::onShellExited);

    m_status = tr("Disconnected");
}

Connection::~Connection()
{
    ++m_generation;
    m_shell->stop();

    // A channel held by a running worker is closed by its own destructor
    // once the worker drops the last reference.
    if (m_files && !m_busy)
        m_files->disconnect();
    m_files.reset();
}

// ------------------------------------------------------------
// State / reporting
// ------------------------------------------------------------
void Connection::setState(State s)
{
    if (m_state == s) return;
    m_state = s;
    emit stateChanged(s);
}

void Connection::setStatus(const QString& text)
{
    if (m_status == text) return;
    m_status = text;
    emit statusChanged(text);
}

void Connection::reportError(const RemoteError& e)
{
    qWarning().noquote() << QString("[CONN] '%1' %2: %3")
                            .arg(m_session.name, remoteErrorKindName(e.kind), e.message);
    emit errorReported(e);
}

void Connection::reportError(RemoteErrorKind kind, const QString& message)
{
    RemoteError e;
    e.kind = kind;
    e.message = message;
    reportError(e);
}

bool Connection::requireConnected(const QString& what)
{
    if (m_state == State::Connected && m_files)
        return true;
    reportError(RemoteErrorKind::Connect, tr("%1: not connected.").arg(what));
    return false;
}

QString Connection::entryPath(const QString& name) const
{
    return RemotePath::join(m_currentPath, name);
}

// ------------------------------------------------------------
// runTask(): one worker task per connection
// ------------------------------------------------------------
bool Connection::runTask(const QString& label, Task task, Done done)
{
    if (m_busy) {
        reportError(RemoteErrorKind::Busy, tr("%1: another operation is still running.").arg(label));
        return false;
    }
    if (!m_files) {
        reportError(RemoteErrorKind::Connect, tr("%1: not connected.").arg(label));
        return false;
    }

    m_busy = true;
    const quint64 gen = m_generation;
    std::shared_ptr<FileChannel> files = m_files;
    std::shared_ptr<ChannelFactory> factory = m_factory;

    qDebug().noquote() << QString("[CONN] '%1' task start: %2").arg(m_session.name, label);

    auto *watcher = new QFutureWatcher<TaskResult>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, gen, files, label, done]() {
        const TaskResult r = watcher->result();
        watcher->deleteLater();

        if (gen != m_generation) {
            qInfo().noquote() << QString("[CONN] '%1' discarding result of '%2' (session was disconnected)")
                                 .arg(m_session.name, label);
            if (files != m_files)
                files->disconnect();
            return;
        }

        m_busy = false;
        done(r);
    });

    watcher->setFuture(QtConcurrent::run([task, files, factory]() -> TaskResult {
        return task(*files, *factory);
    }));
    return true;
}

// Audit record of a finished task; rejected requests never get here.
void Connection::auditOutcome(const QString& event, QJsonObject fields, const TaskResult& r) const
{
    fields.insert("ok", r.ok);
    if (!r.ok)
        fields.insert("error", remoteErrorKindName(r.err.kind));
    AuditLogger::writeEvent(event, fields);
}

// Runs `task`, audits and reports its outcome, then refreshes the listing
// either way.
bool Connection::refreshAfter(const QString& label, Task task,
                              const QString& auditEvent, const QJsonObject& auditFields)
{
    return runTask(label, std::move(task), [this, label, auditEvent, auditFields](const TaskResult& r) {
        auditOutcome(auditEvent, auditFields, r);
        if (!r.ok)
            reportError(r.err);
        else
            qInfo().noquote() << QString("[CONN] '%1' %2 OK").arg(m_session.name, label);
        refreshFiles();
    });
}

// ------------------------------------------------------------
// Connect / disconnect
// ------------------------------------------------------------
bool Connection::connectSession(SurfaceProvider* surface)
{
    if (!m_session.hasUsableAuth()) {
        reportError(RemoteErrorKind::AuthConfig,
                    tr("Session '%1' has neither a password nor a private key.").arg(m_session.name));
        return false;
    }
    if (m_state == State::Connecting || m_state == State::Disconnecting) {
        reportError(RemoteErrorKind::Busy, tr("Session '%1' is already connecting.").arg(m_session.name));
        return false;
    }
    if (m_state == State::Connected)
        disconnectSession();

    m_files = m_factory->createFileChannel(m_session);
    if (!m_files) {
        reportError(RemoteErrorKind::Connect, tr("Cannot create a file channel."));
        return false;
    }

    qInfo().noquote() << QString("[CONN] '%1' connecting to %2:%3")
                         .arg(m_session.name, m_session.target()).arg(m_session.effectivePort());

    setState(State::Connecting);
    setStatus(tr("Connecting to %1...").arg(m_session.target()));

    if (surface)
        m_shell->start(m_session, surface);

    const bool started = runTask(tr("Connect"),
        [](FileChannel& files, ChannelFactory&) {
            TaskResult r;
            r.ok = files.connect(&r.err);
            return r;
        },
        [this](const TaskResult& r) {
            QJsonObject f = AuditLogger::sessionFields(m_session);
            f.insert("ok", r.ok);

            if (!r.ok) {
                f.insert("error", remoteErrorKindName(r.err.kind));
                AuditLogger::writeEvent("session.connect", f);

                m_shell->stop();
                std::shared_ptr<FileChannel> files = std::move(m_files);
                m_files.reset();
                if (files) files->disconnect();

                setState(State::Idle);
                setStatus(tr("Connection failed"));
                reportError(r.err);
                return;
            }

            AuditLogger::writeEvent("session.connect", f);

            m_currentPath = QStringLiteral("/");
            emit currentPathChanged(m_currentPath);
            setState(State::Connected);
            setStatus(tr("Connected: %1").arg(m_session.target()));
            refreshFiles();
        });

    if (!started) {
        m_shell->stop();
        m_files.reset();
        setState(State::Idle);
        setStatus(tr("Disconnected"));
    }
    return started;
}

void Connection::disconnectSession()
{
    const bool wasActive = m_state != State::Idle;

    ++m_generation;
    if (wasActive)
        setState(State::Disconnecting);

    if (m_files) {
        std::shared_ptr<FileChannel> files = std::move(m_files);
        m_files.reset();
        // A running task still uses the channel; its finished handler
        // closes it.
        if (!m_busy)
            files->disconnect();
    }
    m_busy = false;

    m_shell->stop();

    m_entries.clear();
    emit listingChanged();

    setStatus(tr("Disconnected"));
    setState(State::Idle);

    if (wasActive) {
        qInfo().noquote() << QString("[CONN] '%1' disconnected").arg(m_session.name);
        AuditLogger::writeEvent("session.disconnect", AuditLogger::sessionFields(m_session));
    }
}

void Connection::onShellExited(int exitCode, const QString& reason)
{
    qInfo().noquote() << QString("[CONN] '%1' shell exited code=%2 (%3)")
                         .arg(m_session.name).arg(exitCode).arg(reason);

    QJsonObject f = AuditLogger::sessionFields(m_session);
    f.insert("exit_code", exitCode);
    AuditLogger::writeEvent("shell.exited", f);

    if (m_state == State::Idle)
        return;

    disconnectSession();
    emit infoReported(tr("Shell exited (%1); session disconnected.").arg(reason));
}

// ------------------------------------------------------------
// Listing / navigation
// ------------------------------------------------------------
QVector<FileEntry> Connection::arrangeListing(const QString& path, QVector<FileEntry> raw)
{
    raw.erase(std::remove_if(raw.begin(), raw.end(), [](const FileEntry& e) {
                  return e.name.isEmpty() || e.name == "." || e.name == ".." || e.isParentLink;
              }),
              raw.end());

    std::sort(raw.begin(), raw.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.isDirectory != b.isDirectory)
            return a.isDirectory;
        const int c = QString::compare(a.name, b.name, Qt::CaseInsensitive);
        if (c != 0) return c < 0;
        return a.name < b.name;
    });

    QVector<FileEntry> out;
    out.reserve(raw.size() + 1);
    if (!RemotePath::isRoot(path))
        out.push_back(FileEntry::parentLink());
    out += raw;
    return out;
}

// Lists `target`; the path is committed only when the listing succeeds.
bool Connection::listPath(const QString& target)
{
    const QString path = RemotePath::normalize(target);

    return runTask(tr("List"),
        [path](FileChannel& files, ChannelFactory&) {
            TaskResult r;
            r.path = path;
            r.ok = files.list(path, &r.entries, &r.err);
            return r;
        },
        [this](const TaskResult& r) {
            if (!r.ok) {
                RemoteError e;
                e.kind = RemoteErrorKind::List;
                e.message = r.err.message.isEmpty()
                    ? tr("Cannot list '%1'.").arg(r.path)
                    : r.err.message;
                reportError(e);
                return;
            }

            const bool moved = (r.path != m_currentPath);
            m_currentPath = r.path;
            m_entries = arrangeListing(r.path, r.entries);

            if (moved)
                emit currentPathChanged(m_currentPath);
            emit listingChanged();
            setStatus(tr("Connected: %1:%2").arg(m_session.target(), m_currentPath));
        });
}

bool Connection::refreshFiles()
{
    if (m_state != State::Connected || !m_files)
        return false;
    return listPath(m_currentPath);
}

bool Connection::openPath(const QString& path)
{
    if (!requireConnected(tr("Open")))
        return false;

    const QString typed = path.trimmed();
    if (typed.isEmpty())
        return false;

    const QString target = typed.startsWith('/')
        ? RemotePath::normalize(typed)
        : RemotePath::join(m_currentPath, typed);
    return listPath(target);
}

bool Connection::goUp()
{
    if (!requireConnected(tr("Up")))
        return false;
    if (RemotePath::isRoot(m_currentPath))
        return false;
    return listPath(RemotePath::parent(m_currentPath));
}

bool Connection::activateEntry(const QString& name)
{
    if (!requireConnected(tr("Open")))
        return false;
    if (name.isEmpty())
        return false;
    if (name == "..")
        return goUp();

    const QString target = entryPath(name);

    return runTask(tr("Open"),
        [target](FileChannel& files, ChannelFactory&) {
            TaskResult r;
            r.path = target;
            FileAttributes attrs;
            r.ok = files.attributes(target, &attrs, &r.err);
            r.isDirectory = attrs.isDirectory;
            return r;
        },
        [this](const TaskResult& r) {
            if (!r.ok) {
                // Entry vanished or is unreadable; nothing to open.
                qDebug().noquote() << QString("[CONN] skip '%1': %2").arg(r.path, r.err.message);
                return;
            }
            if (r.isDirectory)
                listPath(r.path);
            else
                emit editRequested(r.path);
        });
}

bool Connection::sync()
{
    if (!requireConnected(tr("Sync")))
        return false;

    const SessionRecord session = m_session;

    return runTask(tr("Sync"),
        [session](FileChannel&, ChannelFactory& factory) {
            TaskResult r;
            CommandResult out;
            r.ok = runControlCommand(factory, session, QStringLiteral("pwd"), &out, &r.err);
            if (r.ok) {
                const QString pwd = out.stdoutText.trimmed();
                if (pwd.isEmpty()) {
                    r.ok = false;
                    setRemoteError(&r.err, RemoteErrorKind::Command,
                                   QStringLiteral("Remote 'pwd' returned no path."));
                } else {
                    r.path = RemotePath::normalize(pwd);
                }
            }
            return r;
        },
        [this](const TaskResult& r) {
            if (!r.ok) {
                reportError(r.err);
                return;
            }
            qInfo().noquote() << QString("[CONN] '%1' sync -> %2").arg(m_session.name, r.path);
            AuditLogger::writeEvent("session.sync", AuditLogger::sessionFields(m_session));

            if (r.path != m_currentPath) {
                m_currentPath = r.path;
                emit currentPathChanged(m_currentPath);
            }
            refreshFiles();
        });
}

// ------------------------------------------------------------
// Transfers
// ------------------------------------------------------------
bool Connection::inspectEntry(const QString& name)
{
    if (name.isEmpty() || name == "..")
        return false;
    if (!requireConnected(tr("Inspect")))
        return false;

    const QString remote = entryPath(name);

    return runTask(tr("Inspect"),
        [remote](FileChannel& files, ChannelFactory&) {
            TaskResult r;
            r.path = remote;
            FileAttributes attrs;
            r.ok = files.attributes(remote, &attrs, &r.err);
            r.isDirectory = attrs.isDirectory;
            return r;
        },
        [this, name](const TaskResult& r) {
            if (!r.ok) {
                reportError(r.err);
                return;
            }
            emit entryInspected(name, r.isDirectory);
        });
}

bool Connection::downloadEntry(const QString& name, const QString& localTarget)
{
    if (!requireConnected(tr("Download")))
        return false;
    if (name.isEmpty() || name == ".." || localTarget.trimmed().isEmpty())
        return false;

    const QString remote = entryPath(name);
    const QString local = localTarget;
    const SessionRecord session = m_session;
    const TransferOptions opts = m_transferOptions;

    return runTask(tr("Download"),
        [remote, local, session, opts](FileChannel& files, ChannelFactory& factory) {
            TaskResult r;
            r.path = remote;

            FileAttributes attrs;
            if (!files.attributes(remote, &attrs, &r.err))
                return r;
            r.isDirectory = attrs.isDirectory;

            r.ok = withPipeline(factory, session, files, opts, attrs.isDirectory,
                [&](TransferPipeline& p, RemoteError* err) {
                    return attrs.isDirectory
                        ? p.downloadFolder(remote, local, err)
                        : p.downloadFile(remote, local, err);
                },
                &r.err);
            return r;
        },
        [this, local](const TaskResult& r) {
            QJsonObject f = AuditLogger::sessionFields(m_session);
            f.insert("remote", r.path);
            f.insert("local", local);
            auditOutcome(r.isDirectory ? "transfer.folder_download" : "transfer.file_download", f, r);

            if (!r.ok) {
                reportError(r.err);
                return;
            }
            emit infoReported(tr("Downloaded %1 to %2").arg(r.path, local));
        });
}

bool Connection::uploadFile(const QString& localPath)
{
    if (!requireConnected(tr("Upload")))
        return false;

    const QFileInfo fi(localPath);
    if (!fi.isFile()) {
        reportError(RemoteErrorKind::Transfer, tr("'%1' is not a file.").arg(localPath));
        return false;
    }

    const QString local = fi.absoluteFilePath();
    const QString remote = entryPath(fi.fileName());
    const SessionRecord session = m_session;
    const TransferOptions opts = m_transferOptions;

    QJsonObject f = AuditLogger::sessionFields(m_session);
    f.insert("local", local);
    f.insert("remote", remote);

    return refreshAfter(tr("Upload"),
        [local, remote, session, opts](FileChannel& files, ChannelFactory& factory) {
            TaskResult r;
            r.ok = withPipeline(factory, session, files, opts, false,
                [&](TransferPipeline& p, RemoteError* err) { return p.uploadFile(local, remote, err); },
                &r.err);
            return r;
        },
        "transfer.file_upload", f);
}

bool Connection::uploadFolder(const QString& localDir)
{
    if (!requireConnected(tr("Upload")))
        return false;

    const QFileInfo fi(localDir);
    if (!fi.isDir()) {
        reportError(RemoteErrorKind::Transfer, tr("'%1' is not a folder.").arg(localDir));
        return false;
    }

    const QString local = fi.absoluteFilePath();
    const QString dest = m_currentPath;
    const SessionRecord session = m_session;
    const TransferOptions opts = m_transferOptions;

    QJsonObject f = AuditLogger::sessionFields(m_session);
    f.insert("local", local);
    f.insert("remote", dest);

    return refreshAfter(tr("Upload folder"),
        [local, dest, session, opts](FileChannel& files, ChannelFactory& factory) {
            TaskResult r;
            r.ok = withPipeline(factory, session, files, opts, true,
                [&](TransferPipeline& p, RemoteError* err) { return p.uploadFolder(local, dest, err); },
                &r.err);
            return r;
        },
        "transfer.folder_upload", f);
}

// ------------------------------------------------------------
// Entry operations
// ------------------------------------------------------------
bool Connection::renameEntry(const QString& oldName, const QString& newName)
{
    const QString to = newName.trimmed();
    if (oldName.isEmpty() || oldName == ".." || to.isEmpty() || to == oldName || to.contains('/'))
        return false;
    if (!requireConnected(tr("Rename")))
        return false;

    const QString from = entryPath(oldName);
    const QString dest = entryPath(to);

    QJsonObject f = AuditLogger::sessionFields(m_session);
    f.insert("from", from);
    f.insert("to", dest);

    return refreshAfter(tr("Rename"),
        [from, dest](FileChannel& files, ChannelFactory&) {
            TaskResult r;
            r.ok = files.rename(from, dest, &r.err);
            return r;
        },
        "entry.rename", f);
}

bool Connection::deleteEntry(const QString& name)
{
    if (name.isEmpty() || name == "." || name == "..")
        return false;
    if (!requireConnected(tr("Delete")))
        return false;

    const QString target = entryPath(name);
    if (RemotePath::isRoot(target))
        return false;

    const QString cmd = QString("rm -rf -- %1").arg(RemotePath::shQuote(target));
    const SessionRecord session = m_session;

    QJsonObject f = AuditLogger::sessionFields(m_session);
    const QJsonObject c = AuditLogger::commandFields(cmd);
    for (auto it = c.begin(); it != c.end(); ++it)
        f.insert(it.key(), it.value());

    return refreshAfter(tr("Delete"),
        [cmd, session](FileChannel&, ChannelFactory& factory) {
            TaskResult r;
            CommandResult out;
            r.ok = runControlCommand(factory, session, cmd, &out, &r.err);
            return r;
        },
        "entry.delete", f);
}

bool Connection::compressEntry(const QString& name, ArchiveFormat format)
{
    if (name.isEmpty() || name == "..")
        return false;
    if (!requireConnected(tr("Compress")))
        return false;

    const QString target = entryPath(name);
    const SessionRecord session = m_session;
    const TransferOptions opts = m_transferOptions;

    QJsonObject f = AuditLogger::sessionFields(m_session);
    f.insert("remote", target);
    f.insert("format", format == ArchiveFormat::Zip ? "zip" : "tar.gz");

    return refreshAfter(tr("Compress"),
        [target, format, session, opts](FileChannel& files, ChannelFactory& factory) {
            TaskResult r;
            r.ok = withPipeline(factory, session, files, opts, true,
                [&](TransferPipeline& p, RemoteError* err) { return p.compressEntry(target, format, err); },
                &r.err);
            return r;
        },
        "entry.compress", f);
}

bool Connection::extractEntry(const QString& name)
{
    if (name.isEmpty() || name == "..")
        return false;
    if (!requireConnected(tr("Extract")))
        return false;

    const QString target = entryPath(name);
    const SessionRecord session = m_session;
    const TransferOptions opts = m_transferOptions;
    const bool supported = TransferPipeline::isSupportedArchive(name);

    return runTask(tr("Extract"),
        [target, session, opts, supported](FileChannel& files, ChannelFactory& factory) {
            TaskResult r;
            r.path = target;
            r.ok = withPipeline(factory, session, files, opts, supported,
                [&](TransferPipeline& p, RemoteError* err) { return p.extractEntry(target, &r.outcome, err); },
                &r.err);
            return r;
        },
        [this](const TaskResult& r) {
            QJsonObject f = AuditLogger::sessionFields(m_session);
            f.insert("remote", r.path);
            if (r.ok)
                f.insert("outcome", r.outcome == ExtractOutcome::Unsupported ? "unsupported" : "extracted");
            auditOutcome("entry.extract", f, r);

            if (!r.ok)
                reportError(r.err);
            else if (r.outcome == ExtractOutcome::Unsupported)
                emit infoReported(tr("'%1' is not a supported archive (.zip, .tar.gz, .tgz, .tar).")
                                      .arg(RemotePath::baseName(r.path)));
            refreshFiles();
        });
}
