#include <QtTest/QtTest>

#include "planner/RemotePlanningBackend.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace Hawk;

namespace {

QByteArray completion(const QString& content)
{
    QJsonObject message{{"role", "assistant"}, {"content", content}};
    QJsonObject choice{{"index", 0}, {"message", message}};
    QJsonObject body{{"choices", QJsonArray{choice}}};
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

} // namespace

class tst_RemotePlanningBackend : public QObject
{
    Q_OBJECT

private slots:
    void testIsConfigured();
    void testRequestBody();
    void testParseCompletion();
    void testParseFencedCompletion();
    void testParseRejectsProse();
    void testParseRejectsEmptyPlan();
    void testParseRejectsMissingChoices();
    void testStripCodeFence();
};

void tst_RemotePlanningBackend::testIsConfigured()
{
    RemotePlanningBackend::Config config;
    config.endpoint = QStringLiteral("https://api.example.com/v1/chat/completions");
    config.model = QStringLiteral("planner-model");
    QVERIFY(!RemotePlanningBackend(config).isConfigured());

    config.apiKey = QStringLiteral("secret");
    RemotePlanningBackend backend(config);
    QVERIFY(backend.isConfigured());
    QCOMPARE(backend.name(), QStringLiteral("openai:planner-model"));
}

void tst_RemotePlanningBackend::testRequestBody()
{
    RemotePlanningBackend::Config config;
    config.model = QStringLiteral("planner-model");

    const QJsonObject body = QJsonDocument::fromJson(
        RemotePlanningBackend::buildRequestBody(config, QStringLiteral("SYSTEM"),
                                                QStringLiteral("open mail"))).object();
    QCOMPARE(body.value("model").toString(), QStringLiteral("planner-model"));
    QCOMPARE(body.value("max_tokens").toInt(), 2000);
    QCOMPARE(body.value("temperature").toDouble(), 0.3);

    const QJsonArray messages = body.value("messages").toArray();
    QCOMPARE(messages.size(), 2);
    QCOMPARE(messages.at(0).toObject().value("role").toString(), QStringLiteral("system"));
    QCOMPARE(messages.at(0).toObject().value("content").toString(), QStringLiteral("SYSTEM"));
    QCOMPARE(messages.at(1).toObject().value("content").toString(),
             QStringLiteral("Create a task plan for: open mail"));
}

void tst_RemotePlanningBackend::testParseCompletion()
{
    const QString content = QStringLiteral(
        R"({"plan_id":"p1","goal":"open mail","steps":[{"step_id":"s1","action":"click","target":"mail_icon"}]})");

    TaskPlan plan;
    QString error;
    QVERIFY2(RemotePlanningBackend::parseCompletionResponse(completion(content), &plan, &error),
             qPrintable(error));
    QCOMPARE(plan.planId, QStringLiteral("p1"));
    QCOMPARE(plan.steps.size(), 1);
    QCOMPARE(plan.steps.first().target, QStringLiteral("mail_icon"));
}

void tst_RemotePlanningBackend::testParseFencedCompletion()
{
    const QString content = QStringLiteral(
        "```json\n{\"steps\":[{\"step_id\":\"s1\",\"action\":\"wait\",\"delay\":2}]}\n```");

    TaskPlan plan;
    QVERIFY(RemotePlanningBackend::parseCompletionResponse(completion(content), &plan, nullptr));
    QCOMPARE(plan.steps.first().delay, 2.0);
}

void tst_RemotePlanningBackend::testParseRejectsProse()
{
    QString error;
    QVERIFY(!RemotePlanningBackend::parseCompletionResponse(
        completion(QStringLiteral("Sure! Here is your plan.")), nullptr, &error));
    QVERIFY(error.startsWith(QStringLiteral("Model output is not a JSON object")));
}

void tst_RemotePlanningBackend::testParseRejectsEmptyPlan()
{
    QString error;
    QVERIFY(!RemotePlanningBackend::parseCompletionResponse(
        completion(QStringLiteral(R"({"steps":[]})")), nullptr, &error));
    QCOMPARE(error, QStringLiteral("Model returned a plan without steps"));
}

void tst_RemotePlanningBackend::testParseRejectsMissingChoices()
{
    QString error;
    QVERIFY(!RemotePlanningBackend::parseCompletionResponse(
        QByteArrayLiteral(R"({"choices":[]})"), nullptr, &error));
    QCOMPARE(error, QStringLiteral("Completion response has no choices"));

    QVERIFY(!RemotePlanningBackend::parseCompletionResponse(
        QByteArrayLiteral("not json"), nullptr, &error));
    QCOMPARE(error, QStringLiteral("Invalid completion response"));
}

void tst_RemotePlanningBackend::testStripCodeFence()
{
    QCOMPARE(RemotePlanningBackend::stripCodeFence(QStringLiteral("  {\"a\":1} ")),
             QStringLiteral("{\"a\":1}"));
    QCOMPARE(RemotePlanningBackend::stripCodeFence(QStringLiteral("```\n{}\n```")),
             QStringLiteral("{}"));
    QCOMPARE(RemotePlanningBackend::stripCodeFence(QStringLiteral("```json")), QString());
}

QTEST_MAIN(tst_RemotePlanningBackend)
#include "tst_RemotePlanningBackend.moc"
