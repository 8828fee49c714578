// ShellHost.cpp
//
// Purpose:
//   Embedded interactive shell: "xterm -into <surface> -e ssh user@host".
//
// Notes:
//   - The surface may not have a native window yet when the session connects
//     (tab just created, not shown). Attachment is therefore an event-loop
//     retry with a hard bound, plus an early wake-up from the surface.
//   - Process signals are delivered queued and tagged with a launch id, so a
//     process that was stopped (or replaced) can never report an exit.

#include "ShellHost.h"
#include "SurfaceProvider.h"

#include <QPointer>
#include <QProcessEnvironment>
#include <QDebug>

ShellHost::ShellHost(QObject *parent)
    : QObject(parent)
{
    m_retryTimer.setSingleShot(true);
    connect(&m_retryTimer, &QTimer::timeout, this, &ShellHost::attempt);
}

ShellHost::~ShellHost()
{
    stop();
}

// ------------------------------------------------------------
// start(): schedule attachment to the surface.
// ------------------------------------------------------------
void ShellHost::start(const SessionRecord& session, SurfaceProvider* surface)
{
    stop();

    m_session  = session;
    m_surface  = surface;
    m_surfaceLifetime = surface ? surface->lifetime() : std::weak_ptr<void>();
    m_attempts = 0;
    m_state    = State::WaitingForSurface;

    qInfo().noquote() << QString("[SHELL] start target='%1' (waiting for surface)").arg(session.target());

    if (m_surface) {
        QPointer<ShellHost> self(this);
        m_surface->setReadyCallback([self]() {
            if (self && self->m_state == State::WaitingForSurface)
                self->m_retryTimer.start(0);
        });
    }

    // First attempt is deferred: the surface is usually realized by the
    // same event loop turn that created it.
    m_retryTimer.start(0);
}

void ShellHost::attempt()
{
    if (m_state != State::WaitingForSurface)
        return;

    ++m_attempts;

    SurfaceProvider* surface = liveSurface();
    if (m_surface && !surface) {
        qWarning().noquote() << "[SHELL] surface destroyed while waiting";
        failSurface(tr("Terminal area was closed; the shell was not started."));
        return;
    }

    if (surface && surface->ready()) {
        launch();
        return;
    }

    if (m_attempts > m_options.maxRetries) {
        qWarning().noquote() << QString("[SHELL] surface not ready after %1 attempt(s)").arg(m_attempts);
        failSurface(tr("Terminal area was not ready; the shell was not started."));
        return;
    }

    qDebug().noquote() << QString("[SHELL] surface not ready (attempt %1), retrying").arg(m_attempts);
    m_retryTimer.start(qMax(0, m_options.retryIntervalMs));
}

void ShellHost::failSurface(const QString& message)
{
    releaseSurface();
    m_state = State::Idle;

    RemoteError e;
    e.kind = RemoteErrorKind::SurfaceNotReady;
    e.message = message;
    emit failed(e);
}

// ------------------------------------------------------------
// launch(): spawn the terminal bound to the surface id.
// ------------------------------------------------------------
void ShellHost::launch()
{
    const ShellInvocation inv = ShellCommand::buildShell(m_session, liveSurface()->surfaceId(), m_options);
    releaseSurface();

    if (!inv.warning.isEmpty()) {
        qWarning().noquote() << QString("[SHELL] %1").arg(inv.warning);
        emit warning(inv.warning);
    }

    qInfo().noquote() << QString("[SHELL] launching: %1").arg(ShellCommand::describe(inv));

    const quint64 id = ++m_launchId;
    m_process = new QProcess(this);

    if (inv.passwordViaEnv) {
        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        env.insert("SSHPASS", m_session.password);
        m_process->setProcessEnvironment(env);
    }

    connect(m_process, &QProcess::started, this, [this, id]() {
        if (id != m_launchId || !m_process) return;
        qInfo().noquote() << QString("[SHELL] attached pid=%1").arg(m_process->processId());
        emit attached(m_process->processId());
    }, Qt::QueuedConnection);

    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, id](int code, QProcess::ExitStatus status) {
                onProcessFinished(id, code, status);
            }, Qt::QueuedConnection);

    connect(m_process, &QProcess::errorOccurred,
            this, [this, id](QProcess::ProcessError error) {
                onProcessError(id, error);
            }, Qt::QueuedConnection);

    m_state = State::Running;
    m_process->start(inv.program, inv.arguments);
}

void ShellHost::onProcessFinished(quint64 launchId, int exitCode, QProcess::ExitStatus status)
{
    if (launchId != m_launchId || m_state != State::Running)
        return;

    const QString reason = (status == QProcess::CrashExit)
        ? tr("Shell terminated unexpectedly")
        : tr("Shell exited with code %1").arg(exitCode);

    qInfo().noquote() << QString("[SHELL] exited code=%1 crash=%2")
                         .arg(exitCode)
                         .arg(status == QProcess::CrashExit ? "yes" : "no");

    dropProcess();
    m_state = State::Idle;
    emit exited(exitCode, reason);
}

void ShellHost::onProcessError(quint64 launchId, QProcess::ProcessError error)
{
    // Only a failed start is terminal here; crashes arrive via finished().
    if (launchId != m_launchId || error != QProcess::FailedToStart || m_state != State::Running)
        return;

    RemoteError e;
    e.kind = RemoteErrorKind::ShellLaunch;
    e.message = tr("Could not start terminal '%1': %2")
                    .arg(m_options.terminalProgram,
                         m_process ? m_process->errorString() : QString());

    qWarning().noquote() << QString("[SHELL] %1").arg(e.message);

    dropProcess();
    m_state = State::Idle;
    emit failed(e);
}

// ------------------------------------------------------------
// stop(): idempotent teardown, no exit notification.
// ------------------------------------------------------------
void ShellHost::stop()
{
    m_retryTimer.stop();
    releaseSurface();
    ++m_launchId;

    if (m_process) {
        m_process->disconnect(this);

        if (m_process->state() != QProcess::NotRunning) {
            qInfo().noquote() << QString("[SHELL] stopping pid=%1").arg(m_process->processId());
            m_process->terminate();
            if (!m_process->waitForFinished(m_options.stopTimeoutMs)) {
                qWarning().noquote() << "[SHELL] terminal did not exit in time -> kill";
                m_process->kill();
                if (!m_process->waitForFinished(1000))
                    qWarning().noquote() << "[SHELL] terminal still running after kill";
            }
        }
        dropProcess();
    }

    m_state = State::Idle;
}

void ShellHost::releaseSurface()
{
    if (SurfaceProvider* surface = liveSurface())
        surface->setReadyCallback(std::function<void()>());
    m_surface = nullptr;
    m_surfaceLifetime.reset();
}

SurfaceProvider* ShellHost::liveSurface() const
{
    return m_surfaceLifetime.expired() ? nullptr : m_surface;
}

void ShellHost::dropProcess()
{
    if (!m_process) return;
    m_process->deleteLater();
    m_process = nullptr;
}
