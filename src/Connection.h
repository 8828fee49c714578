#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>

#include "RemoteChannels.h"
#include "RemoteError.h"
#include "SessionRecord.h"
#include "TransferPipeline.h"

class ShellHost;
class SurfaceProvider;

/*
    Connection
    ----------
    Per-session state behind one tab: the embedded shell (ShellHost), the
    file channel, the current remote path and its listing.

    Threading:
    - Lives on the GUI thread; all members are mutated there only.
    - Channel I/O runs on QtConcurrent workers, one task at a time. A second
      request while a task runs is rejected with RemoteErrorKind::Busy.
    - disconnectSession() bumps a generation counter; results of tasks
      started before it are discarded and their file channel is closed
      when the worker returns.

    Errors are delivered through errorReported(); nothing here throws.
*/
class Connection : public QObject
{
    Q_OBJECT
public:
    enum class State { Idle, Connecting, Connected, Disconnecting };
    Q_ENUM(State)

    Connection(const SessionRecord& session,
               std::shared_ptr<ChannelFactory> factory,
               const TransferOptions& transferOptions = TransferOptions(),
               QObject *parent = nullptr);
    ~Connection() override;

    const SessionRecord& session() const { return m_session; }
    void setSession(const SessionRecord& session) { m_session = session; }

    State state() const { return m_state; }
    bool isConnected() const { return m_state == State::Connected; }
    bool isBusy() const { return m_busy; }

    QString currentPath() const { return m_currentPath; }
    const QVector<FileEntry>& entries() const { return m_entries; }
    QString statusText() const { return m_status; }

    ShellHost* shellHost() const { return m_shell; }

    // Returns false (and reports) when the request was not started.
    bool connectSession(SurfaceProvider* surface);
    void disconnectSession();

    bool refreshFiles();
    bool openPath(const QString& path);
    bool activateEntry(const QString& name);
    bool goUp();
    bool sync();

    // Stats `name` (links followed) and emits entryInspected(); this is the
    // same answer downloadEntry() acts on.
    bool inspectEntry(const QString& name);
    bool downloadEntry(const QString& name, const QString& localTarget);
    bool uploadFile(const QString& localPath);
    bool uploadFolder(const QString& localDir);
    bool renameEntry(const QString& oldName, const QString& newName);
    bool deleteEntry(const QString& name);
    bool compressEntry(const QString& name, ArchiveFormat format);
    bool extractEntry(const QString& name);

    // ".." first (unless path is root), then directories, then files;
    // each group case-insensitive by name.
    static QVector<FileEntry> arrangeListing(const QString& path, QVector<FileEntry> raw);

signals:
    void stateChanged(Connection::State state);
    void listingChanged();
    void currentPathChanged(const QString& path);
    void statusChanged(const QString& text);
    void errorReported(const RemoteError& error);
    void infoReported(const QString& message);
    void entryInspected(const QString& name, bool isDirectory);
    void editRequested(const QString& remotePath);
    void shellWarning(const QString& message);

private:
    struct TaskResult {
        bool ok = false;
        RemoteError err;
        QVector<FileEntry> entries;
        QString path;
        bool isDirectory = false;
        ExtractOutcome outcome = ExtractOutcome::Extracted;
    };

    using Task = std::function<TaskResult(FileChannel& files, ChannelFactory& factory)>;
    using Done = std::function<void(const TaskResult& r)>;

    bool runTask(const QString& label, Task task, Done done);
    bool requireConnected(const QString& what);
    bool listPath(const QString& target);
    bool refreshAfter(const QString& label, Task task,
                      const QString& auditEvent, const QJsonObject& auditFields);
    void auditOutcome(const QString& event, QJsonObject fields, const TaskResult& r) const;
    QString entryPath(const QString& name) const;

    void setState(State s);
    void setStatus(const QString& text);
    void reportError(const RemoteError& e);
    void reportError(RemoteErrorKind kind, const QString& message);
    void onShellExited(int exitCode, const QString& reason);

    SessionRecord m_session;
    std::shared_ptr<ChannelFactory> m_factory;
    TransferOptions m_transferOptions;

    ShellHost* m_shell = nullptr;
    std::shared_ptr<FileChannel> m_files;

    State m_state = State::Idle;
    QString m_currentPath = QStringLiteral("/");
    QVector<FileEntry> m_entries;
    QString m_status;

    bool    m_busy = false;
    quint64 m_generation = 0;
};
