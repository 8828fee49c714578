#pragma once

#include <QString>

#include "ShellCommand.h"
#include "TransferPipeline.h"

// QSettings-backed configuration (keys documented in AppSettings.cpp).
namespace AppSettings {
    ShellLaunchOptions shellLaunchOptions();
    TransferOptions transferOptions();

    int connectTimeoutSec();

    // 0=Errors only, 1=Normal, 2=Debug
    int logLevel();
    QString logFileOverride();
    QString auditDirOverride();
}
