/*
 * MintTerm - remote-session workbench
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QApplication>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QUuid>
#include <QDebug>

#include <sodium.h>

#include "AppSettings.h"
#include "AuditLogger.h"
#include "Logger.h"
#include "MainWindow.h"
#include "RemoteError.h"

// main.cpp
// --------
// Application entry point.
//
// - Application identity first: QSettings and QStandardPaths depend on it
//   (~/.config/MintTerm/mintterm/sessions.json, ~/.local/share/MintTerm/mintterm/).
// - Logging and audit are installed before any other component logs.
// - libsodium is initialized once; the secret-wipe helpers rely on it.
int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QCoreApplication::setOrganizationName("MintTerm");
    QCoreApplication::setApplicationName("mintterm");
    QGuiApplication::setApplicationDisplayName("MintTerm");
    QCoreApplication::setApplicationVersion("0.4.0");

    Logger::install("mintterm", AppSettings::logFileOverride());
    Logger::setLogLevel(AppSettings::logLevel());

    AuditLogger::install("mintterm", AppSettings::auditDirOverride());
    AuditLogger::setRunId(QUuid::createUuid().toString(QUuid::WithoutBraces));
    AuditLogger::writeEvent("app.start");

    if (sodium_init() < 0)
        qWarning().noquote() << "[SSH] libsodium init failed; secrets are wiped with a plain fill";

    qRegisterMetaType<RemoteError>("RemoteError");

    MainWindow w;
    w.show();

    const int rc = app.exec();
    Logger::uninstall();
    return rc;
}
