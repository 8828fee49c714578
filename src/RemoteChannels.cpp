// RemoteChannels.cpp
#include "RemoteChannels.h"

#include <QDateTime>

QString FileEntry::sizeText() const
{
    if (isDirectory || isParentLink) return QStringLiteral("-");
    return QString::number(sizeBytes);
}

QString FileEntry::modifiedText() const
{
    if (isDirectory || isParentLink || modifiedAt <= 0) return QStringLiteral("-");
    return QDateTime::fromSecsSinceEpoch(modifiedAt).toString("yyyy-MM-dd HH:mm");
}

FileEntry FileEntry::parentLink()
{
    FileEntry e;
    e.name = QStringLiteral("..");
    e.isDirectory = true;
    e.isParentLink = true;
    return e;
}

QString CommandResult::failureText() const
{
    const QString e = stderrText.trimmed();
    return e.isEmpty()
        ? QString("Remote command failed (exit %1).").arg(exitStatus)
        : QString("Remote command failed (exit %1): %2").arg(exitStatus).arg(e);
}
