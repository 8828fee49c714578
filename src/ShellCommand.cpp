// ShellCommand.cpp
//
// Builds the argv for the embedded interactive shell and for the remote
// editor terminal. Passwords never appear in argv: when the password helper
// is used it reads SSHPASS from the child environment ("sshpass -e").

#include "ShellCommand.h"
#include "RemotePath.h"

#include <QFileInfo>
#include <QStandardPaths>

namespace ShellCommand {

QString findPasswordHelper(const ShellLaunchOptions& opt)
{
    const QString name = opt.passwordHelper.trimmed();
    if (name.isEmpty())
        return QString();

    // Explicit absolute path in settings
    if (QFileInfo(name).isAbsolute()) {
        const QFileInfo fi(name);
        return (fi.exists() && fi.isExecutable()) ? fi.absoluteFilePath() : QString();
    }

    return opt.helperSearchPaths.isEmpty()
        ? QStandardPaths::findExecutable(name)
        : QStandardPaths::findExecutable(name, opt.helperSearchPaths);
}

QStringList sshCommand(const SessionRecord& session, const ShellLaunchOptions& opt, bool forceTty)
{
    QStringList cmd;
    cmd << (opt.sshProgram.trimmed().isEmpty() ? QStringLiteral("ssh") : opt.sshProgram.trimmed());

    if (forceTty)
        cmd << "-t";

    const int port = session.effectivePort();
    if (port != 22)
        cmd << "-p" << QString::number(port);

    if (session.hasPrivateKey())
        cmd << "-i" << session.privateKeyPath.trimmed();

    cmd << session.target();
    return cmd;
}

// Prefix ssh with the password helper when a password (and no key) is set.
static void applyPasswordHelper(const SessionRecord& session,
                                const ShellLaunchOptions& opt,
                                QStringList* argv,
                                ShellInvocation* inv)
{
    if (!session.hasPassword() || session.hasPrivateKey())
        return;

    const QString helper = findPasswordHelper(opt);
    if (helper.isEmpty()) {
        inv->warning = QStringLiteral("'%1' not found; ssh will prompt for the password.")
                           .arg(opt.passwordHelper);
        return;
    }

    argv->prepend("-e");
    argv->prepend(helper);
    inv->passwordViaEnv = true;
}

ShellInvocation buildShell(const SessionRecord& session,
                           const QString& surfaceId,
                           const ShellLaunchOptions& opt)
{
    ShellInvocation inv;
    inv.program = opt.terminalProgram;

    for (const QString& a : opt.terminalArgs) {
        QString arg = a;
        arg.replace("{surface}", surfaceId);
        inv.arguments << arg;
    }

    QStringList ssh = sshCommand(session, opt);
    applyPasswordHelper(session, opt, &ssh, &inv);

    inv.arguments << ssh;
    return inv;
}

ShellInvocation buildEditor(const SessionRecord& session,
                            const QString& remotePath,
                            const ShellLaunchOptions& opt)
{
    ShellInvocation inv;

    QStringList argv = sshCommand(session, opt, /*forceTty*/ true);

    // ssh joins the trailing words into one remote command line
    argv << (opt.editorCommand.trimmed().isEmpty() ? QStringLiteral("nano") : opt.editorCommand.trimmed());
    argv << RemotePath::shQuote(remotePath);

    applyPasswordHelper(session, opt, &argv, &inv);

    inv.program = argv.takeFirst();
    inv.arguments = argv;
    return inv;
}

QString describe(const ShellInvocation& inv)
{
    QStringList parts;
    parts << inv.program << inv.arguments;
    QString s = parts.join(' ');
    if (inv.passwordViaEnv)
        s += QStringLiteral(" (SSHPASS via env)");
    return s;
}

} // namespace ShellCommand
