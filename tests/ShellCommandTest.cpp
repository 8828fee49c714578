// Own
#include "ShellCommandTest.h"

// Qt
#include <QFile>
#include <QStandardPaths>
#include <QTest>

#include "ShellCommand.h"

static SessionRecord passwordSession()
{
    SessionRecord s;
    s.name = "box";
    s.host = "example.org";
    s.username = "alice";
    s.password = "hunter2";
    return s;
}

void ShellCommandTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_helperDir.isValid());

    QFile helper(m_helperDir.filePath("sshpass"));
    QVERIFY(helper.open(QIODevice::WriteOnly));
    QVERIFY(helper.write("#!/bin/sh\nexit 0\n") > 0);
    helper.close();
    QVERIFY(helper.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner));
}

void ShellCommandTest::testSshCommandDefaultPort()
{
    ShellLaunchOptions opt;
    const QStringList cmd = ShellCommand::sshCommand(passwordSession(), opt);
    QCOMPARE(cmd, (QStringList{ "ssh", "alice@example.org" }));
}

void ShellCommandTest::testSshCommandCustomPortAndKey()
{
    SessionRecord s = passwordSession();
    s.port = 2222;
    s.privateKeyPath = "/keys/id_ed25519";

    ShellLaunchOptions opt;
    const QStringList cmd = ShellCommand::sshCommand(s, opt, true);
    QCOMPARE(cmd, (QStringList{ "ssh", "-t", "-p", "2222", "-i", "/keys/id_ed25519", "alice@example.org" }));
}

void ShellCommandTest::testShellSubstitutesSurface()
{
    SessionRecord s = passwordSession();
    s.password.clear();
    s.privateKeyPath = "/keys/k";

    ShellLaunchOptions opt;
    const ShellInvocation inv = ShellCommand::buildShell(s, "12345", opt);

    QCOMPARE(inv.program, QStringLiteral("xterm"));
    QCOMPARE(inv.arguments,
             (QStringList{ "-into", "12345", "-fa", "Monospace", "-fs", "11", "-e",
                           "ssh", "-i", "/keys/k", "alice@example.org" }));
    QVERIFY(!inv.passwordViaEnv);
    QVERIFY(inv.warning.isEmpty());
}

void ShellCommandTest::testShellUsesHelperForPassword()
{
    ShellLaunchOptions opt;
    opt.helperSearchPaths = { m_helperDir.path() };

    const ShellInvocation inv = ShellCommand::buildShell(passwordSession(), "7", opt);

    const QString helper = m_helperDir.filePath("sshpass");
    const int e = inv.arguments.indexOf("-e");
    QVERIFY(e >= 0);
    QCOMPARE(inv.arguments.mid(e + 1),
             (QStringList{ helper, "-e", "ssh", "alice@example.org" }));
    QVERIFY(inv.passwordViaEnv);
    QVERIFY(inv.warning.isEmpty());
}

void ShellCommandTest::testShellWarnsWhenHelperMissing()
{
    ShellLaunchOptions opt;
    opt.passwordHelper = "mintterm-no-such-helper";

    const ShellInvocation inv = ShellCommand::buildShell(passwordSession(), "7", opt);

    QVERIFY(!inv.passwordViaEnv);
    QVERIFY(!inv.warning.isEmpty());
    QCOMPARE(inv.arguments.last(), QStringLiteral("alice@example.org"));
    QCOMPARE(inv.arguments.at(inv.arguments.size() - 2), QStringLiteral("ssh"));
}

void ShellCommandTest::testKeyWinsOverPassword()
{
    SessionRecord s = passwordSession();
    s.privateKeyPath = "/keys/k";

    ShellLaunchOptions opt;
    opt.helperSearchPaths = { m_helperDir.path() };

    const ShellInvocation inv = ShellCommand::buildShell(s, "7", opt);
    QVERIFY(!inv.passwordViaEnv);
    QVERIFY(!inv.arguments.contains(m_helperDir.filePath("sshpass")));
    QVERIFY(inv.arguments.contains("-i"));
}

void ShellCommandTest::testEditorCommand()
{
    SessionRecord s = passwordSession();
    s.password.clear();
    s.privateKeyPath = "/keys/k";

    ShellLaunchOptions opt;
    const ShellInvocation inv = ShellCommand::buildEditor(s, "/etc/my file.conf", opt);

    QCOMPARE(inv.program, QStringLiteral("ssh"));
    QCOMPARE(inv.arguments,
             (QStringList{ "-t", "-i", "/keys/k", "alice@example.org", "nano", "'/etc/my file.conf'" }));
}

void ShellCommandTest::testDescribeHasNoSecret()
{
    ShellLaunchOptions opt;
    opt.helperSearchPaths = { m_helperDir.path() };

    const ShellInvocation inv = ShellCommand::buildEditor(passwordSession(), "/tmp/x", opt);
    QVERIFY(inv.passwordViaEnv);
    QCOMPARE(inv.program, m_helperDir.filePath("sshpass"));

    const QString text = ShellCommand::describe(inv);
    QVERIFY(!text.contains("hunter2"));
    QVERIFY(!inv.arguments.join(' ').contains("hunter2"));
}

QTEST_GUILESS_MAIN(ShellCommandTest)

#include "moc_ShellCommandTest.cpp"
