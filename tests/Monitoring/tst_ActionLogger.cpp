#include <QtTest/QtTest>

#include "capture/ScreenCapture.h"
#include "monitoring/ActionLogger.h"
#include "version.h"

#include <QJsonDocument>
#include <QTemporaryDir>

using namespace Hawk;

namespace {

ActionTrace makeTrace(const QString& traceId, const QString& sessionId, int events)
{
    ActionTrace trace(traceId, sessionId);
    for (int i = 0; i < events; ++i) {
        ActionEvent event;
        event.stepId = QStringLiteral("s%1").arg(i + 1);
        event.status = ActionEventStatus::Success;
        trace.addEvent(event);
    }
    return trace;
}

QJsonObject readJson(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QJsonObject();
    }
    return QJsonDocument::fromJson(file.readAll()).object();
}

} // namespace

class tst_ActionLogger : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testTraceFileName();
    void testSaveTraceLayout();
    void testSaveTraceRequiresIds();
    void testSavesNeverOverwrite();
    void testLoadTrace();
    void testLoadPicksNewestSave();
    void testLoadMissingTrace();
    void testListTraces();
    void testLogEventAppends();
    void testSaveScreenshot();
    void testSaveScreenshotFromImage();
    void testSaveScreenshotWithoutData();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
};

void tst_ActionLogger::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void tst_ActionLogger::cleanup()
{
    m_dir.reset();
}

void tst_ActionLogger::testTraceFileName()
{
    const QDateTime time(QDate(2026, 3, 1), QTime(9, 8, 7, 6));
    QCOMPARE(ActionLogger::timestampSuffix(time), QStringLiteral("20260301_090807_006"));
    QCOMPARE(ActionLogger::traceFileName(QStringLiteral("trace_ab"), time),
             QStringLiteral("trace_trace_ab_20260301_090807_006.json"));
}

void tst_ActionLogger::testSaveTraceLayout()
{
    ActionLogger logger(m_dir->path());
    const ActionTrace trace = makeTrace(QStringLiteral("trace_one"), QStringLiteral("hawk-20260301-abcdef"), 2);

    QString path;
    QString error;
    QVERIFY2(logger.saveTrace(trace, &path, &error), qPrintable(error));
    QVERIFY(QFileInfo::exists(path));
    QCOMPARE(QFileInfo(path).absolutePath(),
             QFileInfo(logger.sessionDirectory(QStringLiteral("hawk-20260301-abcdef"))).absoluteFilePath());
    QVERIFY(QFileInfo(path).fileName().startsWith(QStringLiteral("trace_trace_one_")));

    const QJsonObject json = readJson(path);
    QCOMPARE(json.value("trace_id").toString(), QStringLiteral("trace_one"));
    const QJsonObject metadata = json.value("_metadata").toObject();
    QCOMPARE(metadata.value("version").toString(), QStringLiteral(HAWK_TRACE_FORMAT_VERSION));
    QCOMPARE(metadata.value("session_id").toString(), QStringLiteral("hawk-20260301-abcdef"));
    QVERIFY(QDateTime::fromString(metadata.value("saved_at").toString(), Qt::ISODateWithMs).isValid());
}

void tst_ActionLogger::testSaveTraceRequiresIds()
{
    ActionLogger logger(m_dir->path());
    QString error;
    QVERIFY(!logger.saveTrace(ActionTrace(), nullptr, &error));
    QCOMPARE(error, QStringLiteral("Trace needs a trace id and a session id"));
}

void tst_ActionLogger::testSavesNeverOverwrite()
{
    ActionLogger logger(m_dir->path());
    const ActionTrace trace = makeTrace(QStringLiteral("trace_one"), QStringLiteral("session"), 1);

    QString first;
    QString second;
    QVERIFY(logger.saveTrace(trace, &first));
    QVERIFY(logger.saveTrace(trace, &second));
    QVERIFY(first != second);
    QVERIFY(QFileInfo::exists(first));
    QVERIFY(QFileInfo::exists(second));
}

void tst_ActionLogger::testLoadTrace()
{
    ActionLogger logger(m_dir->path());
    ActionTrace trace = makeTrace(QStringLiteral("trace_load"), QStringLiteral("session_a"), 3);
    trace.setPlanId(QStringLiteral("tp_1"));
    trace.markComplete();
    QVERIFY(logger.saveTrace(trace));

    ActionTrace loaded;
    QString error;
    QVERIFY2(logger.loadTrace(QStringLiteral("trace_load"), &loaded, &error), qPrintable(error));
    QCOMPARE(loaded.traceId(), QStringLiteral("trace_load"));
    QCOMPARE(loaded.sessionId(), QStringLiteral("session_a"));
    QCOMPARE(loaded.planId(), QStringLiteral("tp_1"));
    QCOMPARE(loaded.stepIds(), QStringList({"s1", "s2", "s3"}));
    QVERIFY(loaded.isComplete());
}

void tst_ActionLogger::testLoadPicksNewestSave()
{
    ActionLogger logger(m_dir->path());
    QVERIFY(logger.saveTrace(makeTrace(QStringLiteral("trace_x"), QStringLiteral("session"), 1)));
    QTest::qWait(10);
    QVERIFY(logger.saveTrace(makeTrace(QStringLiteral("trace_x"), QStringLiteral("session"), 4)));

    ActionTrace loaded;
    QVERIFY(logger.loadTrace(QStringLiteral("trace_x"), &loaded));
    QCOMPARE(loaded.events().size(), 4);
}

void tst_ActionLogger::testLoadMissingTrace()
{
    ActionLogger logger(m_dir->path());
    ActionTrace loaded;
    QString error;
    QVERIFY(!logger.loadTrace(QStringLiteral("trace_none"), &loaded, &error));
    QCOMPARE(error, QStringLiteral("Trace not found: trace_none"));
}

void tst_ActionLogger::testListTraces()
{
    ActionLogger logger(m_dir->path());
    QVERIFY(logger.saveTrace(makeTrace(QStringLiteral("trace_a"), QStringLiteral("one"), 1)));
    QTest::qWait(10);
    QVERIFY(logger.saveTrace(makeTrace(QStringLiteral("trace_b"), QStringLiteral("two"), 2)));

    const QVector<TraceSummary> all = logger.listTraces();
    QCOMPARE(all.size(), 2);
    QCOMPARE(all.at(0).traceId, QStringLiteral("trace_b"));
    QCOMPARE(all.at(0).eventCount, 2);
    QCOMPARE(all.at(1).traceId, QStringLiteral("trace_a"));

    const QVector<TraceSummary> one = logger.listTraces(QStringLiteral("one"));
    QCOMPARE(one.size(), 1);
    QCOMPARE(one.first().sessionId, QStringLiteral("one"));

    QVERIFY(logger.listTraces(QStringLiteral("nobody")).isEmpty());
}

void tst_ActionLogger::testLogEventAppends()
{
    ActionLogger logger(m_dir->path());
    ActionEvent retry;
    retry.eventId = 1;
    retry.stepId = QStringLiteral("s1");
    retry.status = ActionEventStatus::Retry;
    retry.error = QStringLiteral("not found");
    ActionEvent success = retry;
    success.eventId = 2;
    success.status = ActionEventStatus::Success;
    success.attempt = 2;
    success.error.clear();

    QString error;
    QVERIFY2(logger.logEvent(QStringLiteral("session"), retry, &error), qPrintable(error));
    QVERIFY(logger.logEvent(QStringLiteral("session"), success, &error));

    QFile file(QDir(logger.sessionDirectory(QStringLiteral("session"))).filePath(QStringLiteral("events.jsonl")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QList<QByteArray> lines = file.readAll().trimmed().split('\n');
    QCOMPARE(lines.size(), 2);
    QCOMPARE(QJsonDocument::fromJson(lines.at(0)).object().value("status").toString(), QStringLiteral("retry"));
    QCOMPARE(QJsonDocument::fromJson(lines.at(1)).object().value("attempt").toInt(), 2);
}

void tst_ActionLogger::testSaveScreenshot()
{
    QImage image(16, 8, QImage::Format_RGB32);
    image.fill(Qt::green);
    ScreenshotPayload payload;
    payload.sessionId = QStringLiteral("session");
    payload.frame = ScreenCapture::encodePng(image).toBase64();

    ActionLogger logger(m_dir->path());
    QString path;
    QString error;
    QVERIFY2(logger.saveScreenshot(payload, QStringLiteral("s4"), &path, &error), qPrintable(error));
    QVERIFY(path.contains(QStringLiteral("/screenshots/screenshot_s4_")));
    QVERIFY(path.endsWith(QStringLiteral(".png")));

    QImage saved(path);
    QCOMPARE(saved.size(), QSize(16, 8));
}

void tst_ActionLogger::testSaveScreenshotFromImage()
{
    ScreenshotPayload payload;
    payload.sessionId = QStringLiteral("session");
    payload.image = QImage(4, 4, QImage::Format_RGB32);
    payload.image.fill(Qt::black);

    ActionLogger logger(m_dir->path());
    QString path;
    QVERIFY(logger.saveScreenshot(payload, QStringLiteral("s1"), &path));
    QCOMPARE(QImage(path).size(), QSize(4, 4));
}

void tst_ActionLogger::testSaveScreenshotWithoutData()
{
    ScreenshotPayload payload;
    payload.sessionId = QStringLiteral("session");

    ActionLogger logger(m_dir->path());
    QString error;
    QVERIFY(!logger.saveScreenshot(payload, QStringLiteral("s1"), nullptr, &error));
    QCOMPARE(error, QStringLiteral("Screenshot has no image data"));
}

QTEST_MAIN(tst_ActionLogger)
#include "tst_ActionLogger.moc"
