#pragma once

#include <QObject>
#include <QTemporaryDir>

class SessionStoreTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanupTestCase();

    void testMissingFileSeedsDefaults();
    void testRoundTrip();
    void testIncompleteRecordsSkipped();
    void testMissingNameBecomesTarget();
    void testInvalidJsonReportsError();
    void testOptionalFieldsOmitted();

private:
    QString storePath() const;

    QTemporaryDir m_dir;
    int m_case = 0;
};
