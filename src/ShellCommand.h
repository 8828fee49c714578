#pragma once

#include <QString>
#include <QStringList>

#include "SessionRecord.h"

// How the interactive shell and the remote editor are launched.
// Defaults mirror AppSettings; tests override fields directly.
struct ShellLaunchOptions
{
    QString     terminalProgram = QStringLiteral("xterm");
    // "{surface}" is replaced with the display surface id
    QStringList terminalArgs    = { "-into", "{surface}", "-fa", "Monospace", "-fs", "11", "-e" };
    QString     sshProgram      = QStringLiteral("ssh");
    QString     passwordHelper  = QStringLiteral("sshpass");
    QStringList helperSearchPaths;     // empty => PATH
    QString     editorCommand   = QStringLiteral("nano");

    int maxRetries      = 5;      // surface readiness retries after the first attempt
    int retryIntervalMs = 50;
    int stopTimeoutMs   = 2000;
};

// A fully resolved process launch.
struct ShellInvocation
{
    QString     program;
    QStringList arguments;

    // The child needs SSHPASS=<password> in its environment.
    bool        passwordViaEnv = false;

    // Non-fatal launch note (e.g. password helper missing).
    QString     warning;
};

namespace ShellCommand {
    // Absolute path of the password helper, or empty if not installed.
    QString findPasswordHelper(const ShellLaunchOptions& opt);

    // "ssh [-t] [-p port] [-i key] user@host" (program first)
    QStringList sshCommand(const SessionRecord& session,
                           const ShellLaunchOptions& opt,
                           bool forceTty = false);

    // <terminal> <terminal args> [<helper> -e] ssh ... user@host
    ShellInvocation buildShell(const SessionRecord& session,
                               const QString& surfaceId,
                               const ShellLaunchOptions& opt);

    // [<helper> -e] ssh -t ... user@host <editor> '<remotePath>'
    ShellInvocation buildEditor(const SessionRecord& session,
                                const QString& remotePath,
                                const ShellLaunchOptions& opt);

    // Single-line rendering for logs (never contains secrets).
    QString describe(const ShellInvocation& inv);
}
