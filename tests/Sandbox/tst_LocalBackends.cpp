#include <QtTest/QtTest>

#include "sandbox/LocalProcessBackend.h"
#include "sandbox/NoneBackend.h"

#include <QTemporaryDir>

using namespace Hawk;

class tst_LocalBackends : public QObject
{
    Q_OBJECT

private slots:
    void testFindFreeDisplay();
    void testProfileContents();
    void testResolveJailPath();
    void testLocalProcessRejectsOtherPlatforms();
    void testNoneBackendExec();
    void testNoneBackendRequiresStart();
    void testNoneBackendNoTransfers();
};

void tst_LocalBackends::testFindFreeDisplay()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QCOMPARE(LocalProcessBackend::findFreeDisplay(dir.path()), LocalProcessBackend::kFirstDisplay);

    for (int display : {100, 101}) {
        QFile lock(dir.filePath(QStringLiteral(".X%1-lock").arg(display)));
        QVERIFY(lock.open(QIODevice::WriteOnly));
    }
    QCOMPARE(LocalProcessBackend::findFreeDisplay(dir.path()), 102);
}

void tst_LocalBackends::testProfileContents()
{
    const QString profile = LocalProcessBackend::profileContents(QStringLiteral("/tmp/jail"));
    QVERIFY(profile.contains(QStringLiteral("private /tmp/jail\n")));
    QVERIFY(profile.contains(QStringLiteral("whitelist /tmp/jail\n")));
    QVERIFY(profile.contains(QStringLiteral("net none\n")));
    QVERIFY(profile.contains(QStringLiteral("caps.drop all\n")));
}

void tst_LocalBackends::testResolveJailPath()
{
    const QString root = QStringLiteral("/tmp/jail");
    QCOMPARE(LocalProcessBackend::resolveJailPath(root, QStringLiteral("/home/user/a.txt")),
             QStringLiteral("/tmp/jail/home/user/a.txt"));
    QCOMPARE(LocalProcessBackend::resolveJailPath(root, QStringLiteral("docs/./b.txt")),
             QStringLiteral("/tmp/jail/docs/b.txt"));
    QVERIFY(LocalProcessBackend::resolveJailPath(root, QStringLiteral("../etc/passwd")).isEmpty());
    QVERIFY(LocalProcessBackend::resolveJailPath(root, QStringLiteral("a/../../x")).isEmpty());
    QVERIFY(LocalProcessBackend::resolveJailPath(root, QStringLiteral("/")).isEmpty());
}

void tst_LocalBackends::testLocalProcessRejectsOtherPlatforms()
{
    LocalProcessBackend backend;
    SandboxOptions options;
    options.platform = QStringLiteral("windows");
    QString error;
    QVERIFY(!backend.start(options, &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(backend.backendId().isEmpty());
}

void tst_LocalBackends::testNoneBackendExec()
{
#ifdef Q_OS_UNIX
    NoneBackend backend;
    QVERIFY(backend.start(SandboxOptions(), nullptr));
    QVERIFY(backend.backendId().startsWith(QStringLiteral("none_")));

    const ExecResult result = backend.exec(QStringLiteral("echo hawk"), 5000);
    QVERIFY2(result.succeeded(), qPrintable(result.errorSummary()));
    QCOMPARE(result.stdOut.trimmed(), QStringLiteral("hawk"));

    const ExecResult failed = backend.exec(QStringLiteral("exit 3"), 5000);
    QCOMPARE(failed.exitCode, 3);
    backend.stop();
#else
    QSKIP("Shell commands are POSIX only");
#endif
}

void tst_LocalBackends::testNoneBackendRequiresStart()
{
    NoneBackend backend;
    const ExecResult result = backend.exec(QStringLiteral("echo hawk"), 1000);
    QVERIFY(!result.succeeded());
    QCOMPARE(result.stdErr, QStringLiteral("Host backend is not started"));
}

void tst_LocalBackends::testNoneBackendNoTransfers()
{
    NoneBackend backend;
    QVERIFY(backend.start(SandboxOptions(), nullptr));
    QString error;
    QVERIFY(!backend.upload(QStringLiteral("a"), QStringLiteral("b"), &error));
    QCOMPARE(error, QStringLiteral("File transfer is not supported without a sandbox"));
}

QTEST_MAIN(tst_LocalBackends)
#include "tst_LocalBackends.moc"
