#pragma once

#include <QMainWindow>
#include <QString>

#include "SessionRecord.h"
#include "ShellCommand.h"

class TermWidget;

// Separate window running "ssh -t user@host <editor> '<path>'" in a
// terminal widget. Deletes itself on close; closes when the editor exits.
class RemoteEditorWindow : public QMainWindow
{
    Q_OBJECT
public:
    RemoteEditorWindow(const SessionRecord& session,
                       const QString& remotePath,
                       const ShellLaunchOptions& options,
                       QWidget *parent = nullptr);

    void start();

signals:
    void editorClosed(const QString& remotePath);

private:
    SessionRecord m_session;
    QString       m_remotePath;
    ShellInvocation m_invocation;
    TermWidget   *m_term = nullptr;
};
