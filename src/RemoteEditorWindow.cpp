// RemoteEditorWindow.cpp
#include "RemoteEditorWindow.h"
#include "TermWidget.h"

#include <QProcessEnvironment>
#include <QStatusBar>
#include <QTimer>
#include <QDebug>

RemoteEditorWindow::RemoteEditorWindow(const SessionRecord& session,
                                       const QString& remotePath,
                                       const ShellLaunchOptions& options,
                                       QWidget *parent)
    : QMainWindow(parent)
    , m_session(session)
    , m_remotePath(remotePath)
    , m_invocation(ShellCommand::buildEditor(session, remotePath, options))
{
    setAttribute(Qt::WA_DeleteOnClose, true);
    setWindowTitle(tr("%1 - %2").arg(remotePath, session.target()));

    m_term = new TermWidget(2000, this);
    setCentralWidget(m_term);
    resize(900, 560);

    if (!m_invocation.warning.isEmpty())
        statusBar()->showMessage(m_invocation.warning);

    connect(m_term, &QTermWidget::finished, this, [this]() {
        qInfo().noquote() << QString("[SHELL] editor closed: %1").arg(m_remotePath);
        emit editorClosed(m_remotePath);
        close();
    });
}

void RemoteEditorWindow::start()
{
    qInfo().noquote() << QString("[SHELL] editor: %1").arg(ShellCommand::describe(m_invocation));

    if (m_invocation.passwordViaEnv) {
        QStringList env = QProcessEnvironment::systemEnvironment().toStringList();
        env << QStringLiteral("SSHPASS=") + m_session.password;
        m_term->setEnvironment(env);
    }

    m_term->setShellProgram(m_invocation.program);
    m_term->setArgs(m_invocation.arguments);
    m_term->startShellProgram();

    show();
    raise();
    activateWindow();

    QTimer::singleShot(0, m_term, [this]() {
        m_term->setFocus(Qt::OtherFocusReason);
    });
}
