// TransferPipeline.cpp
//
// Folder download:
//   remote tar -czf <tmp> -C <parent> <name>
//   -> SFTP download to a local temp archive
//   -> local tar -xzf -C <dest>
//   -> rm -f <tmp> (remote), delete local temp (always)
//
// Folder upload is the mirror image. Temp names carry a UUID so concurrent
// sessions never collide.

#include "TransferPipeline.h"
#include "RemotePath.h"

#include <QFile>
#include <QFileInfo>
#include <QUuid>
#include <QDebug>

using RemotePath::shQuote;

TransferPipeline::TransferPipeline(ControlChannel& control,
                                   FileChannel& files,
                                   const TransferOptions& options)
    : m_control(control)
    , m_files(files)
    , m_options(options)
    , m_archiver(options.localTar)
{
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
bool TransferPipeline::runRemote(const QString& command, RemoteError* err)
{
    qInfo().noquote() << QString("[XFER] remote: %1").arg(command);

    CommandResult r;
    RemoteError e;
    if (!m_control.run(command, &r, &e)) {
        setRemoteError(err, RemoteErrorKind::Transfer, e.message);
        return false;
    }
    if (!r.succeeded()) {
        setRemoteError(err, RemoteErrorKind::Transfer, r.failureText());
        return false;
    }
    return true;
}

PendingTransfer TransferPipeline::newTransfer(const QString& source, const QString& destination) const
{
    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);

    PendingTransfer t;
    t.sourcePath        = source;
    t.destinationPath   = destination;
    t.remoteArchivePath = RemotePath::join(m_options.remoteTempDir, QString("mintterm-%1.tar.gz").arg(id));
    t.localArchivePath  = QDir(m_options.localTempDir).filePath(QString("mintterm-%1.tar.gz").arg(id));
    return t;
}

// Best-effort: both archives, each independently.
void TransferPipeline::cleanup(const PendingTransfer& t)
{
    CommandResult r;
    RemoteError e;
    const QString rm = QString("rm -f %1").arg(shQuote(t.remoteArchivePath));
    if (!m_control.run(rm, &r, &e))
        qWarning().noquote() << QString("[XFER] cleanup remote '%1' failed: %2").arg(t.remoteArchivePath, e.message);
    else if (!r.succeeded())
        qWarning().noquote() << QString("[XFER] cleanup remote '%1' failed: %2").arg(t.remoteArchivePath, r.failureText());

    if (QFile::exists(t.localArchivePath) && !QFile::remove(t.localArchivePath))
        qWarning().noquote() << QString("[XFER] cleanup local '%1' failed").arg(t.localArchivePath);
}

// ------------------------------------------------------------
// Folder download
// ------------------------------------------------------------
bool TransferPipeline::downloadFolder(const QString& remoteDir,
                                      const QString& localDestDir,
                                      RemoteError* err,
                                      PendingTransfer* record)
{
    if (err) err->clear();

    const QString src = RemotePath::normalize(remoteDir);
    if (RemotePath::isRoot(src)) {
        setRemoteError(err, RemoteErrorKind::Transfer, QStringLiteral("Cannot transfer the root directory."));
        return false;
    }

    const PendingTransfer t = newTransfer(src, localDestDir);
    if (record) *record = t;

    qInfo().noquote() << QString("[XFER] folder download %1 -> %2").arg(src, localDestDir);

    bool ok = runRemote(QString("tar -czf %1 -C %2 %3")
                            .arg(shQuote(t.remoteArchivePath),
                                 shQuote(RemotePath::parent(src)),
                                 shQuote(RemotePath::baseName(src))),
                        err);

    if (ok) {
        QFile local(t.localArchivePath);
        if (!local.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            setRemoteError(err, RemoteErrorKind::Transfer,
                           QString("Cannot create '%1': %2").arg(t.localArchivePath, local.errorString()));
            ok = false;
        } else {
            ok = m_files.download(t.remoteArchivePath, &local, err);
            local.close();
        }
    }

    if (ok)
        ok = m_archiver.extractArchive(t.localArchivePath, localDestDir, err);

    cleanup(t);

    if (!ok)
        qWarning().noquote() << QString("[XFER] folder download FAILED: %1").arg(err ? err->message : QString());
    return ok;
}

// ------------------------------------------------------------
// Folder upload
// ------------------------------------------------------------
bool TransferPipeline::uploadFolder(const QString& localDir,
                                    const QString& remoteDestDir,
                                    RemoteError* err,
                                    PendingTransfer* record)
{
    if (err) err->clear();

    const QString dest = RemotePath::normalize(remoteDestDir);
    const PendingTransfer t = newTransfer(QFileInfo(localDir).absoluteFilePath(), dest);
    if (record) *record = t;

    qInfo().noquote() << QString("[XFER] folder upload %1 -> %2").arg(t.sourcePath, dest);

    bool ok = m_archiver.createArchive(t.sourcePath, t.localArchivePath, err);

    if (ok) {
        QFile local(t.localArchivePath);
        if (!local.open(QIODevice::ReadOnly)) {
            setRemoteError(err, RemoteErrorKind::Transfer,
                           QString("Cannot read '%1': %2").arg(t.localArchivePath, local.errorString()));
            ok = false;
        } else {
            ok = m_files.upload(&local, t.remoteArchivePath, err);
            local.close();
        }
    }

    if (ok) {
        ok = runRemote(QString("tar -xzf %1 -C %2")
                           .arg(shQuote(t.remoteArchivePath), shQuote(dest)),
                       err);
    }

    cleanup(t);

    if (!ok)
        qWarning().noquote() << QString("[XFER] folder upload FAILED: %1").arg(err ? err->message : QString());
    return ok;
}

// ------------------------------------------------------------
// Single files
// ------------------------------------------------------------
bool TransferPipeline::downloadFile(const QString& remotePath, const QString& localPath, RemoteError* err)
{
    if (err) err->clear();

    const QFileInfo li(localPath);
    if (!QDir().mkpath(li.absolutePath())) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QString("Cannot create local folder '%1'.").arg(li.absolutePath()));
        return false;
    }

    const QString tmpLocal = localPath + ".part";
    QFile out(tmpLocal);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QString("Cannot create '%1': %2").arg(tmpLocal, out.errorString()));
        return false;
    }

    const bool ok = m_files.download(remotePath, &out, err);
    out.close();

    if (!ok) {
        out.remove();
        return false;
    }

    if (QFile::exists(localPath) && !QFile::remove(localPath)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QString("Cannot replace existing '%1'.").arg(localPath));
        out.remove();
        return false;
    }
    if (!QFile::rename(tmpLocal, localPath)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QStringLiteral("Failed to rename downloaded temp file to final path."));
        out.remove();
        return false;
    }
    return true;
}

bool TransferPipeline::uploadFile(const QString& localPath, const QString& remotePath, RemoteError* err)
{
    if (err) err->clear();

    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly)) {
        setRemoteError(err, RemoteErrorKind::Transfer,
                       QString("Cannot read '%1': %2").arg(localPath, in.errorString()));
        return false;
    }

    const bool ok = m_files.upload(&in, remotePath, err);
    in.close();
    return ok;
}

// ------------------------------------------------------------
// Compress / extract in place
// ------------------------------------------------------------
QString TransferPipeline::compressCommand(const QString& remotePath, ArchiveFormat format)
{
    const QString path   = RemotePath::normalize(remotePath);
    const QString parent = RemotePath::parent(path);
    const QString name   = RemotePath::baseName(path);

    if (format == ArchiveFormat::Zip) {
        return QString("cd %1 && zip -r %2 %3")
            .arg(shQuote(parent), shQuote(name + ".zip"), shQuote(name));
    }

    return QString("tar -czf %1 -C %2 %3")
        .arg(shQuote(RemotePath::join(parent, name + ".tar.gz")), shQuote(parent), shQuote(name));
}

QString TransferPipeline::extractCommand(const QString& remotePath)
{
    const QString path   = RemotePath::normalize(remotePath);
    const QString parent = RemotePath::parent(path);
    const QString lower  = RemotePath::baseName(path).toLower();

    if (lower.endsWith(".zip"))
        return QString("unzip -o %1 -d %2").arg(shQuote(path), shQuote(parent));
    if (lower.endsWith(".tar.gz") || lower.endsWith(".tgz"))
        return QString("tar -xzf %1 -C %2").arg(shQuote(path), shQuote(parent));
    if (lower.endsWith(".tar"))
        return QString("tar -xf %1 -C %2").arg(shQuote(path), shQuote(parent));

    return QString();
}

bool TransferPipeline::isSupportedArchive(const QString& name)
{
    return !extractCommand(RemotePath::join("/", name)).isEmpty();
}

bool TransferPipeline::compressEntry(const QString& remotePath,
                                     ArchiveFormat format,
                                     RemoteError* err,
                                     QString* archivePathOut)
{
    if (err) err->clear();

    const QString path = RemotePath::normalize(remotePath);
    if (RemotePath::isRoot(path)) {
        setRemoteError(err, RemoteErrorKind::Transfer, QStringLiteral("Cannot compress the root directory."));
        return false;
    }

    if (archivePathOut) {
        *archivePathOut = path + (format == ArchiveFormat::Zip ? ".zip" : ".tar.gz");
    }

    return runRemote(compressCommand(path, format), err);
}

bool TransferPipeline::extractEntry(const QString& remotePath,
                                    ExtractOutcome* outcome,
                                    RemoteError* err)
{
    if (err) err->clear();

    const QString cmd = extractCommand(remotePath);
    if (cmd.isEmpty()) {
        if (outcome) *outcome = ExtractOutcome::Unsupported;
        qInfo().noquote() << QString("[XFER] extract skipped, unsupported archive: %1").arg(remotePath);
        return true;
    }

    if (outcome) *outcome = ExtractOutcome::Extracted;
    return runRemote(cmd, err);
}
