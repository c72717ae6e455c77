#include <QtTest/QtTest>

#include "planner/TaskTypes.h"

#include <QJsonArray>
#include <QJsonDocument>

using namespace Hawk;

class tst_TaskTypes : public QObject
{
    Q_OBJECT

private slots:
    void testActionNames();
    void testStepDefaults();
    void testKeysAsString();
    void testKeysAsList();
    void testNullFieldsSerializeAsNull();
    void testUnknownActionRejected();
    void testMissingStepIdRejected();
    void testNonStringKeyRejected();
    void testPlanFromJson();
    void testPlanRequiresSteps();
    void testFindStep();
};

void tst_TaskTypes::testActionNames()
{
    StepAction action = StepAction::Wait;
    QVERIFY(stepActionFromName(QStringLiteral("keypress"), &action));
    QCOMPARE(action, StepAction::KeyPress);
    QVERIFY(stepActionFromName(QStringLiteral(" Click "), &action));
    QCOMPARE(action, StepAction::Click);
    QVERIFY(!stepActionFromName(QStringLiteral("hover"), &action));
    QCOMPARE(stepActionName(StepAction::Screenshot), QStringLiteral("screenshot"));
}

void tst_TaskTypes::testStepDefaults()
{
    const TaskStep step = TaskStep::click(QStringLiteral("s1"), QStringLiteral("ok_button"));
    QCOMPARE(step.delay, TaskStep::kDefaultDelaySeconds);
    QVERIFY(!step.confidence.has_value());
    QVERIFY(step.hasTarget());
    QVERIFY(!step.hasKeys());
}

void tst_TaskTypes::testKeysAsString()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"step_id":"s1","action":"type","keys":"hello world"})").object();

    TaskStep step;
    QString error;
    QVERIFY2(TaskStep::fromJson(json, &step, &error), qPrintable(error));
    QCOMPARE(step.action, StepAction::Type);
    QCOMPARE(step.text(), QStringLiteral("hello world"));
    QVERIFY(!step.keysIsList);
    QCOMPARE(step.toJson().value("keys").toString(), QStringLiteral("hello world"));
}

void tst_TaskTypes::testKeysAsList()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"step_id":"s2","action":"keypress","keys":["ctrl+s","enter"],"delay":0.5,"confidence":0.8})").object();

    TaskStep step;
    QVERIFY(TaskStep::fromJson(json, &step));
    QCOMPARE(step.keys, QStringList({"ctrl+s", "enter"}));
    QVERIFY(step.keysIsList);
    QCOMPARE(step.delay, 0.5);
    QCOMPARE(step.confidence.value(), 0.8);

    const QJsonArray keys = step.toJson().value("keys").toArray();
    QCOMPARE(keys.size(), 2);
    QCOMPARE(keys.at(1).toString(), QStringLiteral("enter"));
}

void tst_TaskTypes::testNullFieldsSerializeAsNull()
{
    const QJsonObject json = TaskStep::wait(QStringLiteral("s1"), 2.0).toJson();
    QVERIFY(json.value("target").isNull());
    QVERIFY(json.value("keys").isNull());
    QVERIFY(json.value("confidence").isNull());
    QCOMPARE(json.value("delay").toDouble(), 2.0);
    QCOMPARE(json.value("action").toString(), QStringLiteral("wait"));
}

void tst_TaskTypes::testUnknownActionRejected()
{
    const QJsonObject json{{"step_id", "s1"}, {"action", "hover"}};
    QString error;
    QVERIFY(!TaskStep::fromJson(json, nullptr, &error));
    QVERIFY(error.contains(QStringLiteral("hover")));
}

void tst_TaskTypes::testMissingStepIdRejected()
{
    const QJsonObject json{{"action", "wait"}};
    QString error;
    QVERIFY(!TaskStep::fromJson(json, nullptr, &error));
    QVERIFY(error.contains(QStringLiteral("step_id")));
}

void tst_TaskTypes::testNonStringKeyRejected()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"step_id":"s1","action":"keypress","keys":["ctrl", 5]})").object();
    QString error;
    QVERIFY(!TaskStep::fromJson(json, nullptr, &error));
    QVERIFY(!error.isEmpty());
}

void tst_TaskTypes::testPlanFromJson()
{
    const QJsonObject json = QJsonDocument::fromJson(R"({
        "plan_id": "plan_1",
        "goal": "save the file",
        "steps": [
            {"step_id": "s1", "action": "keypress", "keys": ["ctrl+s"]},
            {"step_id": "s2", "action": "screenshot"}
        ]
    })").object();

    TaskPlan plan;
    QString error;
    QVERIFY2(TaskPlan::fromJson(json, &plan, &error), qPrintable(error));
    QCOMPARE(plan.planId, QStringLiteral("plan_1"));
    QCOMPARE(plan.goal, QStringLiteral("save the file"));
    QCOMPARE(plan.steps.size(), 2);
    QCOMPARE(plan.steps.at(1).action, StepAction::Screenshot);
    QCOMPARE(plan.toJson().value("steps").toArray().size(), 2);
}

void tst_TaskTypes::testPlanRequiresSteps()
{
    const QJsonObject json{{"plan_id", "plan_1"}, {"goal", "nothing"}};
    QString error;
    QVERIFY(!TaskPlan::fromJson(json, nullptr, &error));
    QVERIFY(error.contains(QStringLiteral("steps")));
}

void tst_TaskTypes::testFindStep()
{
    TaskPlan plan;
    plan.steps.append(TaskStep::wait(QStringLiteral("s1"), 1.0));
    plan.steps.append(TaskStep::click(QStringLiteral("s2"), QStringLiteral("ok")));

    const TaskStep* step = plan.findStep(QStringLiteral("s2"));
    QVERIFY(step != nullptr);
    QCOMPARE(step->target, QStringLiteral("ok"));
    QVERIFY(plan.findStep(QStringLiteral("s9")) == nullptr);
}

QTEST_MAIN(tst_TaskTypes)
#include "tst_TaskTypes.moc"
