// Own
#include "ConnectionTest.h"

// Qt
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

#include "AuditLogger.h"
#include "Connection.h"
#include "FakeChannels.h"
#include "FakeSurface.h"
#include "LocalChannels.h"
#include "ShellCommand.h"
#include "ShellHost.h"
#include "Workbench.h"

static SessionRecord passwordSession()
{
    SessionRecord s;
    s.name = "box";
    s.host = "example.org";
    s.username = "u";
    s.password = "pw";
    return s;
}

static FileEntry dirEntry(const QString& name)
{
    FileEntry e;
    e.name = name;
    e.isDirectory = true;
    return e;
}

static FileEntry fileEntry(const QString& name, quint64 size, qint64 mtime)
{
    FileEntry e;
    e.name = name;
    e.sizeBytes = size;
    e.modifiedAt = mtime;
    return e;
}

static qint64 newYearMorning()
{
    return QDateTime(QDate(2024, 1, 1), QTime(10, 0)).toSecsSinceEpoch();
}

static QStringList names(const Connection& c)
{
    QStringList out;
    for (const FileEntry& e : c.entries())
        out << e.name;
    return out;
}

static int counter(const FakeRemote& r, int FakeRemote::*field)
{
    QMutexLocker lock(&r.mutex);
    return r.*field;
}

static RemoteError firstError(const QSignalSpy& spy)
{
    return spy.at(0).at(0).value<RemoteError>();
}

// Runs `script` through /bin/sh in place of the terminal.
static ShellLaunchOptions shellScript(const QString& script)
{
    ShellLaunchOptions opt;
    opt.terminalProgram = "/bin/sh";
    opt.terminalArgs = { "-c", script, "--" };
    opt.retryIntervalMs = 5;
    opt.stopTimeoutMs = 1000;
    return opt;
}

// Audit records named `event` in today's file, oldest first.
static QVector<QJsonObject> auditEvents(const QString& event)
{
    QVector<QJsonObject> out;
    QFile audit(AuditLogger::currentLogFilePath());
    if (!audit.open(QIODevice::ReadOnly))
        return out;
    const QList<QByteArray> lines = audit.readAll().split('\n');
    for (const QByteArray& line : lines) {
        const QJsonObject o = QJsonDocument::fromJson(line).object();
        if (o.value("event").toString() == event)
            out << o;
    }
    return out;
}

// ------------------------------------------------------------
// Fixture
// ------------------------------------------------------------
void ConnectionTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<RemoteError>("RemoteError");
    qRegisterMetaType<Connection::State>("Connection::State");

    QVERIFY(m_auditDir.isValid());
    AuditLogger::install("mintterm-test", m_auditDir.path());
}

void ConnectionTest::init()
{
    m_remote = std::make_shared<FakeRemote>();
    m_remote->addDir("/", { dirEntry("home"), dirEntry("tmp") });
    m_remote->addDir("/home", { dirEntry("u") });
    m_remote->addDir("/home/u", { fileEntry("a.txt", 120, newYearMorning()), dirEntry("docs") });
    m_remote->addDir("/home/u/docs", {});
    m_remote->addFile("/home/u/a.txt", 120, newYearMorning(), "hello");
}

void ConnectionTest::cleanup()
{
    m_remote.reset();
}

// Connects and waits until the initial root listing has landed.
void ConnectionTest::connectAndSettle(Connection& c)
{
    QSignalSpy listed(&c, &Connection::listingChanged);
    QVERIFY(c.connectSession(nullptr));
    QTRY_VERIFY(c.isConnected());
    QTRY_VERIFY(listed.count() >= 1);
    QTRY_VERIFY(!c.isBusy());
}

void ConnectionTest::openHome(Connection& c)
{
    QVERIFY(c.openPath("/home/u"));
    QTRY_COMPARE(c.currentPath(), QStringLiteral("/home/u"));
    QTRY_VERIFY(!c.isBusy());
}

// ------------------------------------------------------------
// Connect / disconnect
// ------------------------------------------------------------
void ConnectionTest::testConnectWithoutCredentialsCreatesNoChannel()
{
    SessionRecord s = passwordSession();
    s.password.clear();

    Connection c(s, std::make_shared<FakeChannelFactory>(m_remote));
    QSignalSpy errors(&c, &Connection::errorReported);

    QVERIFY(!c.connectSession(nullptr));
    QCOMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::AuthConfig);
    QCOMPARE(c.state(), Connection::State::Idle);
    QCOMPARE(counter(*m_remote, &FakeRemote::fileChannelsCreated), 0);
    QCOMPARE(counter(*m_remote, &FakeRemote::controlChannelsCreated), 0);
}

void ConnectionTest::testConnectFailureReturnsToIdle()
{
    m_remote->connectFailure = RemoteErrorKind::Auth;

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    QSignalSpy errors(&c, &Connection::errorReported);
    QSignalSpy states(&c, &Connection::stateChanged);

    QVERIFY(c.connectSession(nullptr));
    QCOMPARE(c.state(), Connection::State::Connecting);

    QTRY_COMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Auth);
    QCOMPARE(c.state(), Connection::State::Idle);
    QVERIFY(!c.isBusy());
    QVERIFY(c.entries().isEmpty());
    QCOMPARE(states.count(), 2);
    QCOMPARE(m_remote->listCount(), 0);
}

void ConnectionTest::testConnectListsRootAndWritesAudit()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    QSignalSpy states(&c, &Connection::stateChanged);

    connectAndSettle(c);

    QCOMPARE(c.currentPath(), QStringLiteral("/"));
    QCOMPARE(names(c), (QStringList{ "home", "tmp" }));
    QVERIFY(c.statusText().startsWith("Connected: u@example.org"));
    QCOMPARE(states.count(), 2);
    QCOMPARE(states.at(0).at(0).value<Connection::State>(), Connection::State::Connecting);
    QCOMPARE(states.at(1).at(0).value<Connection::State>(), Connection::State::Connected);

    QFile audit(AuditLogger::currentLogFilePath());
    QVERIFY(audit.open(QIODevice::ReadOnly));
    const QByteArray log = audit.readAll();
    QVERIFY(log.contains("\"event\":\"session.connect\""));
    QVERIFY(!log.contains("\"pw\""));
}

void ConnectionTest::testDisconnectTwiceIsSafe()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);

    QSignalSpy states(&c, &Connection::stateChanged);
    c.disconnectSession();
    c.disconnectSession();

    QCOMPARE(c.state(), Connection::State::Idle);
    QVERIFY(c.entries().isEmpty());
    QCOMPARE(c.statusText(), QStringLiteral("Disconnected"));
    QCOMPARE(states.count(), 2);   // Disconnecting, Idle
    QCOMPARE(counter(*m_remote, &FakeRemote::fileDisconnects), 1);

    // Operations now fail fast
    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(!c.refreshFiles());
    QVERIFY(!c.sync());
    QCOMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Connect);
}

void ConnectionTest::testDisconnectDuringTaskDiscardsResult()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);

    m_remote->mutex.lock();
    m_remote->listDelayMs = 200;
    m_remote->mutex.unlock();

    QSignalSpy listed(&c, &Connection::listingChanged);
    QVERIFY(c.openPath("/home/u"));
    c.disconnectSession();
    QCOMPARE(listed.count(), 1);   // cleared by disconnect

    // The channel stays open for the worker and is closed after it returns.
    QCOMPARE(counter(*m_remote, &FakeRemote::fileDisconnects), 0);
    QTRY_COMPARE(counter(*m_remote, &FakeRemote::fileDisconnects), 1);

    QCOMPARE(listed.count(), 1);
    QCOMPARE(c.state(), Connection::State::Idle);
    QVERIFY(c.entries().isEmpty());
    QCOMPARE(c.currentPath(), QStringLiteral("/"));
}

void ConnectionTest::testShellExitDisconnectsSession()
{
    FakeSurface surface;
    surface.setReady(true);

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    c.shellHost()->setOptions(shellScript("sleep 1; exit 0"));

    QSignalSpy info(&c, &Connection::infoReported);
    QSignalSpy attached(c.shellHost(), &ShellHost::attached);

    QVERIFY(c.connectSession(&surface));
    QTRY_VERIFY(c.isConnected());
    QTRY_COMPARE(attached.count(), 1);

    QTRY_COMPARE(c.state(), Connection::State::Idle);
    QTRY_COMPARE(info.count(), 1);
    QVERIFY(info.at(0).at(0).toString().startsWith("Shell exited"));
    QCOMPARE(c.statusText(), QStringLiteral("Disconnected"));
    QCOMPARE(counter(*m_remote, &FakeRemote::fileDisconnects), 1);
    QCOMPARE(c.shellHost()->state(), ShellHost::State::Idle);
    QVERIFY(c.entries().isEmpty());
}

void ConnectionTest::testConnectFailureStopsShell()
{
    m_remote->connectFailure = RemoteErrorKind::Auth;

    FakeSurface surface;
    surface.setReady(true);

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    c.shellHost()->setOptions(shellScript("sleep 30"));

    QSignalSpy errors(&c, &Connection::errorReported);
    QSignalSpy info(&c, &Connection::infoReported);
    QSignalSpy exited(c.shellHost(), &ShellHost::exited);

    QVERIFY(c.connectSession(&surface));
    QCOMPARE(c.shellHost()->state(), ShellHost::State::WaitingForSurface);

    QTRY_COMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Auth);
    QCOMPARE(c.state(), Connection::State::Idle);
    QCOMPARE(c.shellHost()->state(), ShellHost::State::Idle);
    QVERIFY(!c.shellHost()->isActive());

    // A stopped shell does not report an exit that would disconnect again
    QTest::qWait(50);
    QCOMPARE(exited.count(), 0);
    QCOMPARE(info.count(), 0);
}

// ------------------------------------------------------------
// Listing / navigation
// ------------------------------------------------------------
void ConnectionTest::testArrangeListingOrder()
{
    const QVector<FileEntry> raw = {
        fileEntry("beta.txt", 1, 1), dirEntry("Zeta"), fileEntry("Alpha.txt", 1, 1),
        dirEntry("."), dirEntry(".."), dirEntry("alpha"), fileEntry("", 0, 0)
    };

    QVector<FileEntry> out = Connection::arrangeListing("/srv", raw);
    QStringList got;
    for (const FileEntry& e : out)
        got << e.name;
    QCOMPARE(got, (QStringList{ "..", "alpha", "Zeta", "Alpha.txt", "beta.txt" }));
    QVERIFY(out.first().isParentLink);

    out = Connection::arrangeListing("/", raw);
    QCOMPARE(out.first().name, QStringLiteral("alpha"));
}

void ConnectionTest::testListingRowsForHomeDirectory()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    const QVector<FileEntry>& rows = c.entries();
    QCOMPARE(rows.size(), 3);

    QCOMPARE(rows.at(0).name, QStringLiteral(".."));
    QCOMPARE(rows.at(0).sizeText(), QStringLiteral("-"));

    QCOMPARE(rows.at(1).name, QStringLiteral("docs"));
    QCOMPARE(rows.at(1).sizeText(), QStringLiteral("-"));
    QCOMPARE(rows.at(1).modifiedText(), QStringLiteral("-"));

    QCOMPARE(rows.at(2).name, QStringLiteral("a.txt"));
    QCOMPARE(rows.at(2).sizeText(), QStringLiteral("120"));
    QCOMPARE(rows.at(2).modifiedText(), QStringLiteral("2024-01-01 10:00"));

    QVERIFY(c.statusText().endsWith(":/home/u"));
}

void ConnectionTest::testRefreshFailureKeepsListing()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    m_remote->mutex.lock();
    m_remote->failList.insert("/home/u");
    m_remote->mutex.unlock();

    QSignalSpy errors(&c, &Connection::errorReported);
    QSignalSpy listed(&c, &Connection::listingChanged);
    QVERIFY(c.refreshFiles());
    QTRY_COMPARE(errors.count(), 1);

    QCOMPARE(firstError(errors).kind, RemoteErrorKind::List);
    QCOMPARE(listed.count(), 0);
    QCOMPARE(c.currentPath(), QStringLiteral("/home/u"));
    QCOMPARE(names(c), (QStringList{ "..", "docs", "a.txt" }));
    QVERIFY(c.isConnected());
}

void ConnectionTest::testOpenMissingPathKeepsCurrentPath()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QSignalSpy errors(&c, &Connection::errorReported);
    QSignalSpy moved(&c, &Connection::currentPathChanged);
    QVERIFY(c.openPath("/nope"));
    QTRY_COMPARE(errors.count(), 1);

    QCOMPARE(firstError(errors).kind, RemoteErrorKind::List);
    QCOMPARE(moved.count(), 0);
    QCOMPARE(c.currentPath(), QStringLiteral("/home/u"));

    // Empty input does nothing
    QVERIFY(!c.openPath("   "));
}

void ConnectionTest::testActivateDirectoryNavigates()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QSignalSpy moved(&c, &Connection::currentPathChanged);
    QVERIFY(c.activateEntry("docs"));
    QTRY_COMPARE(c.currentPath(), QStringLiteral("/home/u/docs"));
    QTRY_VERIFY(!c.isBusy());

    QCOMPARE(moved.count(), 1);
    QCOMPARE(names(c), (QStringList{ ".." }));
}

void ConnectionTest::testActivateFileRequestsEdit()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QSignalSpy edits(&c, &Connection::editRequested);
    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.activateEntry("a.txt"));
    QTRY_COMPARE(edits.count(), 1);
    QCOMPARE(edits.at(0).at(0).toString(), QStringLiteral("/home/u/a.txt"));
    QCOMPARE(c.currentPath(), QStringLiteral("/home/u"));

    // A vanished entry is skipped silently
    QVERIFY(c.activateEntry("gone.txt"));
    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(edits.count(), 1);
    QCOMPARE(errors.count(), 0);
}

void ConnectionTest::testActivateParentGoesUp()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QVERIFY(c.activateEntry(".."));
    QTRY_COMPARE(c.currentPath(), QStringLiteral("/home"));
    QTRY_VERIFY(!c.isBusy());

    QVERIFY(c.goUp());
    QTRY_COMPARE(c.currentPath(), QStringLiteral("/"));
    QTRY_VERIFY(!c.isBusy());

    // Already at root
    QVERIFY(!c.goUp());
}

void ConnectionTest::testSecondRequestWhileBusyIsRejected()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);

    m_remote->mutex.lock();
    m_remote->listDelayMs = 150;
    m_remote->mutex.unlock();

    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.refreshFiles());
    QVERIFY(c.isBusy());
    QVERIFY(!c.openPath("/home"));

    QCOMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Busy);

    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(c.currentPath(), QStringLiteral("/"));
}

// ------------------------------------------------------------
// Sync
// ------------------------------------------------------------
void ConnectionTest::testSyncMovesToRemoteWorkingDirectory()
{
    CommandResult pwd;
    pwd.exitStatus = 0;
    pwd.stdoutText = "/home/u/\n";
    m_remote->commandResults.insert("pwd", pwd);

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);

    QVERIFY(c.sync());
    QTRY_COMPARE(c.currentPath(), QStringLiteral("/home/u"));
    QTRY_VERIFY(!c.isBusy());

    QCOMPARE(names(c), (QStringList{ "..", "docs", "a.txt" }));
    QCOMPARE(m_remote->commandLog(), (QStringList{ "pwd" }));
    QCOMPARE(counter(*m_remote, &FakeRemote::openControlChannels), 0);
}

void ConnectionTest::testSyncFailureKeepsPath()
{
    CommandResult pwd;
    pwd.exitStatus = 1;
    pwd.stderrText = "pwd: failed";
    m_remote->commandResults.insert("pwd", pwd);

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.sync());
    QTRY_COMPARE(errors.count(), 1);

    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Command);
    QCOMPARE(c.currentPath(), QStringLiteral("/home/u"));
    QCOMPARE(counter(*m_remote, &FakeRemote::openControlChannels), 0);
}

// ------------------------------------------------------------
// Entry operations
// ------------------------------------------------------------
void ConnectionTest::testRenameRefreshesOnce()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    const int listsBefore = m_remote->listCount();

    QVERIFY(c.renameEntry("a.txt", " b.txt "));
    QTRY_COMPARE(m_remote->listCount(), listsBefore + 1);
    QTRY_VERIFY(!c.isBusy());

    {
        QMutexLocker lock(&m_remote->mutex);
        QCOMPARE(m_remote->renames.size(), 1);
        QCOMPARE(m_remote->renames.at(0).first, QStringLiteral("/home/u/a.txt"));
        QCOMPARE(m_remote->renames.at(0).second, QStringLiteral("/home/u/b.txt"));
    }
    QCOMPARE(names(c), (QStringList{ "..", "docs", "b.txt" }));
}

void ConnectionTest::testRenameIgnoresInvalidNames()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QVERIFY(!c.renameEntry("a.txt", ""));
    QVERIFY(!c.renameEntry("a.txt", "a.txt"));
    QVERIFY(!c.renameEntry("a.txt", "sub/b.txt"));
    QVERIFY(!c.renameEntry("..", "x"));
    QVERIFY(!c.isBusy());

    QMutexLocker lock(&m_remote->mutex);
    QVERIFY(m_remote->renames.isEmpty());
}

void ConnectionTest::testDeleteRunsQuotedRemove()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    const int listsBefore = m_remote->listCount();

    QVERIFY(c.deleteEntry("docs"));
    QTRY_COMPARE(m_remote->listCount(), listsBefore + 1);
    QTRY_VERIFY(!c.isBusy());

    QCOMPARE(m_remote->commandLog(), (QStringList{ "rm -rf -- '/home/u/docs'" }));
    QCOMPARE(counter(*m_remote, &FakeRemote::openControlChannels), 0);

    QVERIFY(!c.deleteEntry(".."));
}

void ConnectionTest::testCompressRunsTarAndRefreshes()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QVERIFY(c.compressEntry("docs", ArchiveFormat::TarGz));
    QTRY_VERIFY(!m_remote->commandLog().isEmpty());
    QTRY_VERIFY(!c.isBusy());

    QCOMPARE(m_remote->commandLog(), (QStringList{ "tar -czf '/home/u/docs.tar.gz' -C '/home/u' 'docs'" }));
    QCOMPARE(counter(*m_remote, &FakeRemote::openControlChannels), 0);
}

void ConnectionTest::testExtractUnsupportedReportsInfo()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    const int listsBefore = m_remote->listCount();

    QSignalSpy info(&c, &Connection::infoReported);
    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.extractEntry("a.txt"));
    QTRY_COMPARE(info.count(), 1);
    QTRY_COMPARE(m_remote->listCount(), listsBefore + 1);
    QTRY_VERIFY(!c.isBusy());

    QVERIFY(info.at(0).at(0).toString().contains("a.txt"));
    QCOMPARE(errors.count(), 0);
    QVERIFY(m_remote->commandLog().isEmpty());
    QCOMPARE(counter(*m_remote, &FakeRemote::openControlChannels), 0);
}

void ConnectionTest::testFolderTransfersThroughLocalChannels()
{
    QTemporaryDir work;
    QVERIFY(work.isValid());

    const QString remoteDir = work.filePath("remote");
    const QString src = work.filePath("src/site");
    QVERIFY(QDir().mkpath(remoteDir));
    QVERIFY(QDir().mkpath(src + "/css"));
    QVERIFY(QDir().mkpath(work.filePath("remote-tmp")));
    QVERIFY(QDir().mkpath(work.filePath("local-tmp")));
    {
        QFile f(src + "/css/main.css");
        QVERIFY(f.open(QIODevice::WriteOnly));
        QCOMPARE(f.write("body { margin: 0; }\n"), qint64(20));
    }

    TransferOptions opts;
    opts.remoteTempDir = work.filePath("remote-tmp");
    opts.localTempDir = work.filePath("local-tmp");

    Connection c(passwordSession(), std::make_shared<LocalChannelFactory>(), opts);
    connectAndSettle(c);

    QVERIFY(c.openPath(remoteDir));
    QTRY_COMPARE(c.currentPath(), remoteDir);
    QTRY_VERIFY(!c.isBusy());

    QSignalSpy errors(&c, &Connection::errorReported);

    QVERIFY(c.uploadFolder(src));
    QTRY_VERIFY(names(c).contains("site"));
    QTRY_VERIFY(!c.isBusy());
    QVERIFY(QFile::exists(remoteDir + "/site/css/main.css"));

    QSignalSpy info(&c, &Connection::infoReported);
    QVERIFY(c.downloadEntry("site", work.filePath("back")));
    QTRY_COMPARE(info.count(), 1);
    QTRY_VERIFY(!c.isBusy());

    QFile back(work.filePath("back/site/css/main.css"));
    QVERIFY(back.open(QIODevice::ReadOnly));
    QCOMPARE(back.readAll(), QByteArray("body { margin: 0; }\n"));

    QCOMPARE(errors.count(), 0);
    QVERIFY(QDir(opts.remoteTempDir).isEmpty());
    QVERIFY(QDir(opts.localTempDir).isEmpty());
}

void ConnectionTest::testInspectEntryUsesServerAttributes()
{
    // Listed as a plain file, but the server resolves it to a directory
    m_remote->addDir("/home/u", { fileEntry("a.txt", 120, newYearMorning()), dirEntry("docs"),
                                  fileEntry("shared", 0, newYearMorning()) });
    m_remote->addDir("/home/u/shared", {});

    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    QSignalSpy inspected(&c, &Connection::entryInspected);
    QVERIFY(c.inspectEntry("shared"));
    QTRY_COMPARE(inspected.count(), 1);
    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(inspected.at(0).at(0).toString(), QStringLiteral("shared"));
    QCOMPARE(inspected.at(0).at(1).toBool(), true);

    QVERIFY(c.inspectEntry("a.txt"));
    QTRY_COMPARE(inspected.count(), 2);
    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(inspected.at(1).at(1).toBool(), false);

    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.inspectEntry("gone"));
    QTRY_COMPARE(errors.count(), 1);
    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(inspected.count(), 2);
    QVERIFY(!c.inspectEntry(".."));
}

void ConnectionTest::testBusyOperationIsNotAudited()
{
    Connection c(passwordSession(), std::make_shared<FakeChannelFactory>(m_remote));
    connectAndSettle(c);
    openHome(c);

    const int before = auditEvents("entry.delete").size();

    m_remote->mutex.lock();
    m_remote->listDelayMs = 150;
    m_remote->mutex.unlock();

    QSignalSpy errors(&c, &Connection::errorReported);
    QVERIFY(c.refreshFiles());
    QVERIFY(!c.deleteEntry("docs"));
    QCOMPARE(errors.count(), 1);
    QCOMPARE(firstError(errors).kind, RemoteErrorKind::Busy);
    QTRY_VERIFY(!c.isBusy());
    QCOMPARE(auditEvents("entry.delete").size(), before);
    QVERIFY(m_remote->commandLog().isEmpty());

    m_remote->mutex.lock();
    m_remote->listDelayMs = 0;
    m_remote->mutex.unlock();

    QVERIFY(c.deleteEntry("docs"));
    QTRY_COMPARE(m_remote->commandLog().size(), 1);
    QTRY_VERIFY(!c.isBusy());

    const QVector<QJsonObject> events = auditEvents("entry.delete");
    QCOMPARE(events.size(), before + 1);
    QCOMPARE(events.last().value("ok").toBool(), true);
    QVERIFY(!events.last().contains("error"));
}

// ------------------------------------------------------------
// Workbench
// ------------------------------------------------------------
void ConnectionTest::testWorkbenchCreatesConnectionsLazily()
{
    SessionRecord other = passwordSession();
    other.name = "other";

    Workbench bench(std::make_shared<FakeChannelFactory>(m_remote));
    bench.setSessions({ passwordSession(), other });

    QCOMPARE(bench.openCount(), 0);
    QVERIFY(!bench.connectionFor("missing"));
    QVERIFY(!bench.existingConnection("box"));

    Connection* box = bench.connectionFor("box");
    QVERIFY(box);
    QCOMPARE(bench.connectionFor("box"), box);
    QCOMPARE(bench.existingConnection("box"), box);
    QCOMPARE(bench.openCount(), 1);

    // Edited records reach the open connection
    SessionRecord edited = passwordSession();
    edited.host = "new.example.org";
    bench.setSessions({ edited, other });
    QCOMPARE(box->session().host, QStringLiteral("new.example.org"));
}

void ConnectionTest::testWorkbenchCloseSessionDisconnects()
{
    Workbench bench(std::make_shared<FakeChannelFactory>(m_remote));
    bench.setSessions({ passwordSession() });

    Connection* box = bench.connectionFor("box");
    QVERIFY(box);
    connectAndSettle(*box);

    bench.closeSession("box");
    QCOMPARE(bench.openCount(), 0);
    QVERIFY(!bench.existingConnection("box"));
    QCOMPARE(counter(*m_remote, &FakeRemote::fileDisconnects), 1);

    bench.closeSession("box");
    QCOMPARE(bench.openCount(), 0);
}

QTEST_GUILESS_MAIN(ConnectionTest)

#include "moc_ConnectionTest.cpp"
