#pragma once
#include <QString>

namespace Logger {
    // Installs the Qt message handler. Log file:
    //   fileOverride if non-empty, else <AppLocalDataLocation>/logs/<appName>.log
    void install(const QString& appName, const QString& fileOverride = QString());

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);

    QString logFilePath();

    // Restores the default handler and closes the file.
    void uninstall();
}
