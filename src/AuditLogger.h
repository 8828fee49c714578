#pragma once

#include <QString>
#include <QJsonObject>

struct SessionRecord;

// Append-only JSONL trail of session and transfer events, one file per day
// under <AppLocalDataLocation>/audit (or the override directory).
namespace AuditLogger {
    void install(const QString& appName, const QString& dirOverride = QString());

    // Correlates all events of one application run.
    void setRunId(const QString& runId);

    QString currentLogFilePath();

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());

    // name/host/port/username/auth method; never credentials
    QJsonObject sessionFields(const SessionRecord& session);

    // cmd_hash + cmd_head instead of the raw command line
    QJsonObject commandFields(const QString& command);
}
