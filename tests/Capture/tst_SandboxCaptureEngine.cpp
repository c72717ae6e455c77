#include <QtTest/QtTest>

#include "capture/SandboxCaptureEngine.h"
#include "capture/ScreenCapture.h"
#include "MockCommandRunner.h"

using namespace Hawk;

namespace {

QString encodedFrame(const QSize& size)
{
    QImage image(size, QImage::Format_RGB32);
    image.fill(Qt::blue);
    return QString::fromLatin1(ScreenCapture::encodePng(image).toBase64());
}

} // namespace

class tst_SandboxCaptureEngine : public QObject
{
    Q_OBJECT

private slots:
    void testCaptureCommandFullScreen();
    void testCaptureCommandRegion();
    void testDecodeFrame();
    void testCaptureThroughRunner();
    void testCaptureRequiresStart();
    void testFailedCommand();
    void testUndecodableOutput();
    void testOnlyMonitorZero();
    void testNegativeRegionRejected();
};

void tst_SandboxCaptureEngine::testCaptureCommandFullScreen()
{
    const QStringList command = SandboxCaptureEngine::captureCommand(QRect());
    QCOMPARE(command.size(), 3);
    QCOMPARE(command.at(0), QStringLiteral("sh"));
    QCOMPARE(command.at(1), QStringLiteral("-c"));
    QCOMPARE(command.at(2), QStringLiteral("import -window root png:- | base64 -w0"));
}

void tst_SandboxCaptureEngine::testCaptureCommandRegion()
{
    const QStringList command = SandboxCaptureEngine::captureCommand(QRect(5, 6, 100, 40));
    QCOMPARE(command.at(2),
             QStringLiteral("import -window root -crop 100x40+5+6 +repage png:- | base64 -w0"));
}

void tst_SandboxCaptureEngine::testDecodeFrame()
{
    const QImage image = SandboxCaptureEngine::decodeFrame(encodedFrame(QSize(30, 20)).toLatin1() + "\n");
    QCOMPARE(image.size(), QSize(30, 20));
    QVERIFY(SandboxCaptureEngine::decodeFrame(QByteArray()).isNull());
    QVERIFY(SandboxCaptureEngine::decodeFrame(QByteArrayLiteral("bm90IGEgcG5n")).isNull());
}

void tst_SandboxCaptureEngine::testCaptureThroughRunner()
{
    MockCommandRunner runner;
    ExecResult result;
    result.exitCode = 0;
    result.stdOut = encodedFrame(QSize(40, 30));
    runner.setDefaultResult(result);

    SandboxCaptureEngine engine(&runner);
    QVERIFY(engine.setRegion(QRect(0, 0, 40, 30)));
    QVERIFY(engine.start());
    const QImage frame = engine.captureFrame();
    QCOMPARE(frame.size(), QSize(40, 30));

    QCOMPARE(runner.commands().size(), 1);
    QVERIFY(runner.lastCommand().at(2).contains(QStringLiteral("-crop 40x30+0+0")));
    QCOMPARE(runner.lastTimeoutMs(), SandboxCaptureEngine::kCaptureTimeoutMs);
}

void tst_SandboxCaptureEngine::testCaptureRequiresStart()
{
    MockCommandRunner runner;
    SandboxCaptureEngine engine(&runner);
    QVERIFY(engine.captureFrame().isNull());
    QCOMPARE(engine.lastError(), QStringLiteral("Capture engine is not running"));
    QVERIFY(runner.commands().isEmpty());
}

void tst_SandboxCaptureEngine::testFailedCommand()
{
    MockCommandRunner runner;
    ExecResult result;
    result.exitCode = 1;
    result.stdErr = QStringLiteral("import: unable to open X server");
    runner.setDefaultResult(result);

    SandboxCaptureEngine engine(&runner);
    QVERIFY(engine.start());
    QVERIFY(engine.captureFrame().isNull());
    QVERIFY(engine.lastError().startsWith(QStringLiteral("Sandbox capture failed")));
}

void tst_SandboxCaptureEngine::testUndecodableOutput()
{
    MockCommandRunner runner;
    ExecResult result;
    result.exitCode = 0;
    result.stdOut = QStringLiteral("garbage");
    runner.setDefaultResult(result);

    SandboxCaptureEngine engine(&runner);
    QVERIFY(engine.start());
    QVERIFY(engine.captureFrame().isNull());
    QCOMPARE(engine.lastError(), QStringLiteral("Sandbox capture returned no decodable image"));
}

void tst_SandboxCaptureEngine::testOnlyMonitorZero()
{
    MockCommandRunner runner;
    SandboxCaptureEngine engine(&runner);
    engine.setMonitor(1);
    QVERIFY(!engine.start());
    QVERIFY(!engine.isRunning());

    SandboxCaptureEngine noRunner(nullptr);
    QVERIFY(!noRunner.start());
    QCOMPARE(noRunner.lastError(), QStringLiteral("No command runner configured"));
}

void tst_SandboxCaptureEngine::testNegativeRegionRejected()
{
    MockCommandRunner runner;
    SandboxCaptureEngine engine(&runner);
    QVERIFY(!engine.setRegion(QRect(-5, 0, 10, 10)));
    QVERIFY(engine.setRegion(QRect()));
}

QTEST_MAIN(tst_SandboxCaptureEngine)
#include "tst_SandboxCaptureEngine.moc"
