#pragma once

#include <QString>
#include <QVector>

#include "SessionRecord.h"

/*
    SessionStore
    ------------
    Static utility class responsible for persisting the session list.

    Responsibilities:
    - Define where sessions.json lives (AppConfigLocation)
    - Load sessions from disk (JSON), seeding a default on first run
    - Save sessions to disk (JSON, atomic replace)

    Design notes:
    - Stateless apart from an optional path override used by tests.
    - Unknown JSON fields are ignored on load.
*/

class SessionStore
{
public:
    /*
        Absolute path to sessions.json.
        Default: <AppConfigLocation>/sessions.json
    */
    static QString configPath();

    // Empty => use default location.
    static void setConfigPathOverride(const QString& absoluteFilePath);

    // First-run session list (one placeholder entry).
    static QVector<SessionRecord> defaults();

    /*
        Save all sessions to disk.
        - Creates the parent directory if missing
        - Writes through QSaveFile (old file stays intact on failure)
    */
    static bool save(const QVector<SessionRecord>& sessions, QString* err = nullptr);

    /*
        Load sessions from disk.

        Behavior:
        - If sessions.json does not exist:
              -> defaults() are written and returned
        - If JSON is invalid:
              -> returns empty vector and sets err
        - Records missing host or username are skipped
        - Missing name becomes "username@host"
    */
    static QVector<SessionRecord> load(QString* err = nullptr);
};
