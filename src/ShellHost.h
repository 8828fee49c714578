#pragma once

#include <QObject>
#include <QProcess>
#include <QString>
#include <QTimer>
#include <memory>

#include "RemoteError.h"
#include "SessionRecord.h"
#include "ShellCommand.h"

class SurfaceProvider;

/*
    ShellHost
    ---------
    Runs the interactive shell (external terminal + ssh) embedded into a
    display surface owned by the UI.

    Lifecycle:
    - start(): attempts attachment on the event loop. Each attempt checks
      SurfaceProvider::ready(); when not ready, it retries up to
      options().maxRetries more times, then reports SurfaceNotReady.
      A readiness callback from the provider triggers the next attempt
      immediately.
    - exited(): the terminal process ended on its own (queued delivery).
    - stop(): cancels pending attempts, terminates the process (bounded
      wait, then kill). Idempotent; never emits exited().
    - A surface destroyed while waiting is never touched again; the next
      attempt reports SurfaceNotReady.
*/
class ShellHost : public QObject
{
    Q_OBJECT
public:
    enum class State { Idle, WaitingForSurface, Running };

    explicit ShellHost(QObject *parent = nullptr);
    ~ShellHost() override;

    void setOptions(const ShellLaunchOptions& opt) { m_options = opt; }
    const ShellLaunchOptions& options() const { return m_options; }

    void start(const SessionRecord& session, SurfaceProvider* surface);
    void stop();

    State state() const { return m_state; }
    bool isActive() const { return m_state != State::Idle; }

    // Readiness checks performed by the current / last start().
    int attemptCount() const { return m_attempts; }

signals:
    void attached(qint64 pid);
    void warning(const QString& message);
    void failed(const RemoteError& error);
    void exited(int exitCode, const QString& reason);

private:
    void attempt();
    void launch();
    void onProcessFinished(quint64 launchId, int exitCode, QProcess::ExitStatus status);
    void onProcessError(quint64 launchId, QProcess::ProcessError error);
    void releaseSurface();
    SurfaceProvider* liveSurface() const;
    void failSurface(const QString& message);
    void dropProcess();

    ShellLaunchOptions m_options;
    SessionRecord      m_session;
    SurfaceProvider*   m_surface = nullptr;
    std::weak_ptr<void> m_surfaceLifetime;   // expired once the surface is destroyed
    QProcess*          m_process = nullptr;
    QTimer             m_retryTimer;

    State   m_state = State::Idle;
    int     m_attempts = 0;
    quint64 m_launchId = 0;   // bumps on every launch/stop; stale process signals are ignored
};
