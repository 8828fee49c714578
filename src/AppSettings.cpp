// AppSettings.cpp
//
// Keys (QSettings, organization/application set in main.cpp):
//   shell/terminal            terminal program            (xterm)
//   shell/terminalArgs        args, {surface} placeholder (-into {surface} -fa Monospace -fs 11 -e)
//   shell/ssh                 ssh program                 (ssh)
//   shell/passwordHelper      password helper             (sshpass)
//   shell/helperSearchPaths   extra lookup dirs           (empty => PATH)
//   shell/retryIntervalMs     surface retry interval      (50)
//   shell/stopTimeoutMs       terminate wait before kill  (2000)
//   editor/command            remote editor               (nano)
//   transfer/remoteTempDir    remote temp archives        (/tmp)
//   transfer/localTempDir     local temp archives         (QDir::tempPath())
//   transfer/localTar         local tar binary            (tar)
//   ssh/connectTimeoutSec     libssh connect timeout      (8)
//   log/level                 0..2                        (1)
//   log/fileOverride          absolute log file path      (empty)
//   audit/dirOverride         audit directory             (empty)

#include "AppSettings.h"

#include <QSettings>

namespace AppSettings {

ShellLaunchOptions shellLaunchOptions()
{
    QSettings s;
    ShellLaunchOptions o;

    o.terminalProgram = s.value("shell/terminal", o.terminalProgram).toString().trimmed();
    if (o.terminalProgram.isEmpty())
        o.terminalProgram = QStringLiteral("xterm");

    if (s.contains("shell/terminalArgs"))
        o.terminalArgs = s.value("shell/terminalArgs").toStringList();

    o.sshProgram        = s.value("shell/ssh", o.sshProgram).toString().trimmed();
    o.passwordHelper    = s.value("shell/passwordHelper", o.passwordHelper).toString().trimmed();
    o.helperSearchPaths = s.value("shell/helperSearchPaths").toStringList();
    o.retryIntervalMs   = s.value("shell/retryIntervalMs", o.retryIntervalMs).toInt();
    o.stopTimeoutMs     = s.value("shell/stopTimeoutMs", o.stopTimeoutMs).toInt();
    o.editorCommand     = s.value("editor/command", o.editorCommand).toString().trimmed();

    if (o.retryIntervalMs < 0) o.retryIntervalMs = 0;
    if (o.stopTimeoutMs < 100) o.stopTimeoutMs = 100;
    return o;
}

TransferOptions transferOptions()
{
    QSettings s;
    TransferOptions o;

    o.remoteTempDir = s.value("transfer/remoteTempDir", o.remoteTempDir).toString().trimmed();
    o.localTempDir  = s.value("transfer/localTempDir", o.localTempDir).toString().trimmed();
    o.localTar      = s.value("transfer/localTar", o.localTar).toString().trimmed();

    if (o.remoteTempDir.isEmpty()) o.remoteTempDir = QStringLiteral("/tmp");
    if (o.localTempDir.isEmpty())  o.localTempDir = QDir::tempPath();
    return o;
}

int connectTimeoutSec()
{
    QSettings s;
    const int v = s.value("ssh/connectTimeoutSec", 8).toInt();
    return v > 0 ? v : 8;
}

int logLevel()
{
    QSettings s;
    return s.value("log/level", 1).toInt();
}

QString logFileOverride()
{
    QSettings s;
    return s.value("log/fileOverride").toString().trimmed();
}

QString auditDirOverride()
{
    QSettings s;
    return s.value("audit/dirOverride").toString().trimmed();
}

} // namespace AppSettings
