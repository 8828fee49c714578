#pragma once

#include <QDir>
#include <QString>

#include "LocalArchiver.h"
#include "RemoteChannels.h"
#include "RemoteError.h"

// Where temporary archives go and which local tar to run.
struct TransferOptions
{
    QString remoteTempDir = QStringLiteral("/tmp");
    QString localTempDir  = QDir::tempPath();
    QString localTar      = QStringLiteral("tar");
};

// Temporary archives of one folder transfer. Both are removed on every
// exit path.
struct PendingTransfer
{
    QString localArchivePath;
    QString remoteArchivePath;
    QString sourcePath;
    QString destinationPath;
};

enum class ArchiveFormat { TarGz, Zip };

enum class ExtractOutcome { Extracted, Unsupported };

/*
    TransferPipeline
    ----------------
    Whole-folder transfers through a temporary tar.gz, plus in-place
    compress/extract of a single remote entry and single-file transfers.

    Borrowed collaborators:
    - ControlChannel: remote tar/zip/unzip/rm
    - FileChannel:    archive upload/download
    - LocalArchiver:  local tar

    Blocking; run on a worker thread. Cleanup failures are logged, never
    returned; the primary failure is always the one reported.
*/
class TransferPipeline
{
public:
    TransferPipeline(ControlChannel& control,
                     FileChannel& files,
                     const TransferOptions& options = TransferOptions());

    // Remote dir -> local destDir/<name>
    bool downloadFolder(const QString& remoteDir,
                        const QString& localDestDir,
                        RemoteError* err = nullptr,
                        PendingTransfer* record = nullptr);

    // Local dir -> remoteDestDir/<name>
    bool uploadFolder(const QString& localDir,
                      const QString& remoteDestDir,
                      RemoteError* err = nullptr,
                      PendingTransfer* record = nullptr);

    // Single file; the local file is written through "<localPath>.part".
    bool downloadFile(const QString& remotePath, const QString& localPath, RemoteError* err = nullptr);
    bool uploadFile(const QString& localPath, const QString& remotePath, RemoteError* err = nullptr);

    // Creates <parent>/<name>.tar.gz or <parent>/<name>.zip next to the entry.
    bool compressEntry(const QString& remotePath,
                       ArchiveFormat format,
                       RemoteError* err = nullptr,
                       QString* archivePathOut = nullptr);

    // Extracts into the archive's own directory. An unknown suffix is not
    // an error: *outcome becomes Unsupported and nothing runs.
    bool extractEntry(const QString& remotePath,
                      ExtractOutcome* outcome,
                      RemoteError* err = nullptr);

    // Command builders (all paths single-quoted).
    static QString compressCommand(const QString& remotePath, ArchiveFormat format);
    static QString extractCommand(const QString& remotePath);   // empty if unsupported
    static bool isSupportedArchive(const QString& name);

private:
    bool runRemote(const QString& command, RemoteError* err);
    PendingTransfer newTransfer(const QString& source, const QString& destination) const;
    void cleanup(const PendingTransfer& t);

    ControlChannel& m_control;
    FileChannel&    m_files;
    TransferOptions m_options;
    LocalArchiver   m_archiver;
};
