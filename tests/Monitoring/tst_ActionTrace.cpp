#include <QtTest/QtTest>

#include "monitoring/TraceTypes.h"

#include <QJsonArray>

using namespace Hawk;

namespace {

ActionEvent makeEvent(const QString& stepId, ActionEventStatus status, int attempt = 1)
{
    ActionEvent event;
    event.stepId = stepId;
    event.status = status;
    event.attempt = attempt;
    event.timestamp = 1700000000.125;
    event.latencyMs = 42;
    return event;
}

} // namespace

class tst_ActionTrace : public QObject
{
    Q_OBJECT

private slots:
    void testEventIdsAreSequential();
    void testStepIdsInFirstSeenOrder();
    void testMarkCompleteOnce();
    void testEventJson();
    void testEventJsonRejectsUnknownStatus();
    void testTraceJson();
    void testTraceJsonOptionalFields();
    void testTraceFromJsonRequiresId();
};

void tst_ActionTrace::testEventIdsAreSequential()
{
    ActionTrace trace(QStringLiteral("trace_1"), QStringLiteral("session_1"));
    ActionEvent first = makeEvent(QStringLiteral("s1"), ActionEventStatus::Success);
    ActionEvent second = makeEvent(QStringLiteral("s2"), ActionEventStatus::Retry);

    QCOMPARE(trace.addEvent(first), 1);
    QCOMPARE(trace.addEvent(second), 2);
    QCOMPARE(first.eventId, 1);
    QCOMPARE(trace.events().size(), 2);
    QCOMPARE(trace.events().at(1).eventId, 2);
}

void tst_ActionTrace::testStepIdsInFirstSeenOrder()
{
    ActionTrace trace(QStringLiteral("trace_1"), QStringLiteral("session_1"));
    for (const QString& stepId : {"s2", "s2", "s1", "s3", "s1"}) {
        ActionEvent event = makeEvent(stepId, ActionEventStatus::Success);
        trace.addEvent(event);
    }
    QCOMPARE(trace.stepIds(), QStringList({"s2", "s1", "s3"}));
}

void tst_ActionTrace::testMarkCompleteOnce()
{
    ActionTrace trace(QStringLiteral("trace_1"), QStringLiteral("session_1"));
    QVERIFY(!trace.isComplete());

    const QDateTime first = QDateTime::currentDateTimeUtc();
    QVERIFY(trace.markComplete(first));
    QVERIFY(trace.isComplete());
    QVERIFY(!trace.markComplete(first.addSecs(10)));
    QCOMPARE(trace.completedAt(), first);
}

void tst_ActionTrace::testEventJson()
{
    ActionEvent event = makeEvent(QStringLiteral("s1"), ActionEventStatus::Failure, 3);
    event.eventId = 7;
    event.error = QStringLiteral("Element ok not found");

    const QJsonObject json = event.toJson();
    QCOMPARE(json.value("event_id").toInt(), 7);
    QCOMPARE(json.value("step_id").toString(), QStringLiteral("s1"));
    QCOMPARE(json.value("status").toString(), QStringLiteral("failure"));
    QCOMPARE(json.value("latency_ms").toInt(), 42);
    QCOMPARE(json.value("attempt").toInt(), 3);
    QCOMPARE(json.value("error").toString(), QStringLiteral("Element ok not found"));

    ActionEvent parsed;
    QVERIFY(ActionEvent::fromJson(json, &parsed));
    QCOMPARE(parsed.status, ActionEventStatus::Failure);
    QCOMPARE(parsed.attempt, 3);
    QCOMPARE(parsed.latencyMs, qint64(42));

    QVERIFY(makeEvent(QStringLiteral("s1"), ActionEventStatus::Success).toJson().value("error").isNull());
}

void tst_ActionTrace::testEventJsonRejectsUnknownStatus()
{
    QJsonObject json = makeEvent(QStringLiteral("s1"), ActionEventStatus::Success).toJson();
    json["status"] = QStringLiteral("skipped");

    ActionEvent parsed;
    QString error;
    QVERIFY(!ActionEvent::fromJson(json, &parsed, &error));
    QVERIFY(error.contains(QStringLiteral("skipped")));
}

void tst_ActionTrace::testTraceJson()
{
    const QDateTime started = QDateTime::fromString(QStringLiteral("2026-03-01T10:00:00.000Z"),
                                                    Qt::ISODateWithMs);
    ActionTrace trace(QStringLiteral("trace_abc"), QStringLiteral("hawk-20260301-a1b2c3"), started);
    trace.setPlanId(QStringLiteral("tp_12345678"));
    ActionEvent retry = makeEvent(QStringLiteral("s1"), ActionEventStatus::Retry, 1);
    retry.error = QStringLiteral("boom");
    ActionEvent success = makeEvent(QStringLiteral("s1"), ActionEventStatus::Success, 2);
    trace.addEvent(retry);
    trace.addEvent(success);
    trace.markComplete(started.addSecs(5));

    const QJsonObject json = trace.toJson();
    QCOMPARE(json.value("trace_id").toString(), QStringLiteral("trace_abc"));
    QCOMPARE(json.value("plan_id").toString(), QStringLiteral("tp_12345678"));
    QCOMPARE(json.value("events").toArray().size(), 2);
    QVERIFY(!json.value("completed_at").isNull());

    ActionTrace parsed;
    QString error;
    QVERIFY2(ActionTrace::fromJson(json, &parsed, &error), qPrintable(error));
    QCOMPARE(parsed.sessionId(), QStringLiteral("hawk-20260301-a1b2c3"));
    QCOMPARE(parsed.planId(), QStringLiteral("tp_12345678"));
    QCOMPARE(parsed.events().size(), 2);
    QCOMPARE(parsed.events().at(0).error, QStringLiteral("boom"));
    QCOMPARE(parsed.startedAt(), started);
    QCOMPARE(parsed.completedAt(), started.addSecs(5));
}

void tst_ActionTrace::testTraceJsonOptionalFields()
{
    ActionTrace trace(QStringLiteral("trace_abc"), QStringLiteral("session"));
    QJsonObject json = trace.toJson();
    QVERIFY(!json.contains("plan_id"));
    QVERIFY(!json.contains("validation_errors"));
    QVERIFY(json.value("completed_at").isNull());

    trace.addValidationError(QStringLiteral("Step s1: Click action missing target"));
    json = trace.toJson();
    QCOMPARE(json.value("validation_errors").toArray().size(), 1);

    ActionTrace parsed;
    QVERIFY(ActionTrace::fromJson(json, &parsed));
    QCOMPARE(parsed.validationErrors(), QStringList({"Step s1: Click action missing target"}));
    QVERIFY(!parsed.isComplete());
}

void tst_ActionTrace::testTraceFromJsonRequiresId()
{
    ActionTrace parsed;
    QString error;
    QVERIFY(!ActionTrace::fromJson(QJsonObject{{"session_id", "s"}}, &parsed, &error));
    QCOMPARE(error, QStringLiteral("Trace has no trace_id"));
}

QTEST_MAIN(tst_ActionTrace)
#include "tst_ActionTrace.moc"
