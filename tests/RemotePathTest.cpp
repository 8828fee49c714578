// Own
#include "RemotePathTest.h"

// Qt
#include <QTest>

#include "RemotePath.h"

void RemotePathTest::testNormalize_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("root")            << "/"                 << "/";
    QTest::newRow("empty")           << ""                  << "/";
    QTest::newRow("trailing slash")  << "/home/u/"          << "/home/u";
    QTest::newRow("double slashes")  << "//home//u"         << "/home/u";
    QTest::newRow("dot segments")    << "/home/./u/."       << "/home/u";
    QTest::newRow("dotdot")          << "/home/u/../v"      << "/home/v";
    QTest::newRow("dotdot past root")<< "/../.."            << "/";
    QTest::newRow("relative")        << "tmp/x"             << "/tmp/x";
    QTest::newRow("whitespace")      << "  /srv/data \n"    << "/srv/data";
}

void RemotePathTest::testNormalize()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(RemotePath::normalize(input), expected);
}

void RemotePathTest::testJoin()
{
    QCOMPARE(RemotePath::join("/", "etc"), QStringLiteral("/etc"));
    QCOMPARE(RemotePath::join("/home/u", "docs"), QStringLiteral("/home/u/docs"));
    QCOMPARE(RemotePath::join("/home/u", ".."), QStringLiteral("/home"));
    QCOMPARE(RemotePath::join("/home/u/", "a b.txt"), QStringLiteral("/home/u/a b.txt"));
}

void RemotePathTest::testParentAndBaseName()
{
    QCOMPARE(RemotePath::parent("/home/u/docs"), QStringLiteral("/home/u"));
    QCOMPARE(RemotePath::parent("/home"), QStringLiteral("/"));
    QCOMPARE(RemotePath::parent("/"), QStringLiteral("/"));

    QCOMPARE(RemotePath::baseName("/home/u/docs"), QStringLiteral("docs"));
    QCOMPARE(RemotePath::baseName("/home/u/docs/"), QStringLiteral("docs"));
    QVERIFY(RemotePath::baseName("/").isEmpty());
}

void RemotePathTest::testIsRoot()
{
    QVERIFY(RemotePath::isRoot("/"));
    QVERIFY(RemotePath::isRoot("/a/.."));
    QVERIFY(!RemotePath::isRoot("/a"));
}

void RemotePathTest::testShQuote()
{
    QCOMPARE(RemotePath::shQuote("/home/u"), QStringLiteral("'/home/u'"));
    QCOMPARE(RemotePath::shQuote("a b"), QStringLiteral("'a b'"));
    QCOMPARE(RemotePath::shQuote("it's"), QStringLiteral("'it'\"'\"'s'"));
    QCOMPARE(RemotePath::shQuote(""), QStringLiteral("''"));
}

QTEST_GUILESS_MAIN(RemotePathTest)

#include "moc_RemotePathTest.cpp"
