#pragma once

#include <QString>
#include <QStringList>

#include "RemoteError.h"

// Local side of folder transfers: runs the local `tar` binary.
// Blocking; call from a worker thread.
class LocalArchiver
{
public:
    explicit LocalArchiver(const QString& tarProgram = QStringLiteral("tar"));

    // tar -czf <archivePath> -C <parent of sourceDir> <name of sourceDir>
    bool createArchive(const QString& sourceDir, const QString& archivePath, RemoteError* err = nullptr) const;

    // tar -xzf <archivePath> -C <destDir>   (destDir is created if missing)
    bool extractArchive(const QString& archivePath, const QString& destDir, RemoteError* err = nullptr) const;

private:
    bool runTar(const QStringList& args, RemoteError* err) const;

    QString m_tar;
};
