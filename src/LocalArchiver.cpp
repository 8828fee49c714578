// LocalArchiver.cpp
#include "LocalArchiver.h"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QDebug>

LocalArchiver::LocalArchiver(const QString& tarProgram)
    : m_tar(tarProgram.trimmed().isEmpty() ? QStringLiteral("tar") : tarProgram.trimmed())
{
}

bool LocalArchiver::createArchive(const QString& sourceDir, const QString& archivePath, RemoteError* err) const
{
    const QFileInfo fi(sourceDir);
    if (!fi.exists() || !fi.isDir()) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QStringLiteral("Local folder '%1' does not exist.").arg(sourceDir));
        return false;
    }

    const QString parent = fi.absoluteDir().absolutePath();
    const QString name = fi.fileName();

    return runTar({ "-czf", archivePath, "-C", parent, name }, err);
}

bool LocalArchiver::extractArchive(const QString& archivePath, const QString& destDir, RemoteError* err) const
{
    if (!QDir().mkpath(destDir)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QStringLiteral("Cannot create local folder '%1'.").arg(destDir));
        return false;
    }

    return runTar({ "-xzf", archivePath, "-C", destDir }, err);
}

bool LocalArchiver::runTar(const QStringList& args, RemoteError* err) const
{
    qInfo().noquote() << QString("[XFER] local: %1 %2").arg(m_tar, args.join(' '));

    QProcess p;
    p.start(m_tar, args);

    if (!p.waitForStarted()) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QStringLiteral("Cannot run local '%1': %2").arg(m_tar, p.errorString()));
        return false;
    }

    // No timeout: archive size is unbounded.
    if (!p.waitForFinished(-1)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QStringLiteral("Local '%1' did not finish: %2").arg(m_tar, p.errorString()));
        return false;
    }

    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        const QString e = QString::fromLocal8Bit(p.readAllStandardError()).trimmed();
        setRemoteError(err, RemoteErrorKind::Transfer,
                       e.isEmpty()
                           ? QStringLiteral("Local tar failed (exit %1).").arg(p.exitCode())
                           : QStringLiteral("Local tar failed (exit %1): %2").arg(p.exitCode()).arg(e));
        return false;
    }
    return true;
}
