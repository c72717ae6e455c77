#include <QtTest/QtTest>

#include "sandbox/SandboxManager.h"
#include "session/Session.h"
#include "MockCaptureEngine.h"
#include "MockCommandRunner.h"
#include "MockElementDetector.h"
#include "MockInputDriver.h"
#include "MockPlanningBackend.h"
#include "MockSandboxBackend.h"

#include <QElapsedTimer>
#include <QSignalSpy>
#include <QTemporaryDir>

using namespace Hawk;

namespace {

// Handles to the mocks a session owns once it has started.
struct Fixture
{
    MockCaptureEngine* engine = nullptr;
    MockElementDetector* detector = nullptr;
    MockInputDriver* input = nullptr;
    ElementGraph graph;
    bool failCapture = false;
};

ElementGraph dialogGraph()
{
    ElementGraph graph;
    graph.elements.append(MockElementDetector::makeElement(
        QStringLiteral("elm_ok"), QStringLiteral("button"), QStringLiteral("OK"), QRect(600, 540, 100, 30)));
    graph.elements.append(MockElementDetector::makeElement(
        QStringLiteral("elm_name"), QStringLiteral("input"), QStringLiteral("Name"), QRect(100, 100, 300, 30)));
    return graph;
}

TaskPlan dialogPlan()
{
    TaskPlan plan;
    plan.planId = QStringLiteral("tp_dialog");
    plan.goal = QStringLiteral("fill in the dialog");
    plan.steps.append(TaskStep::click(QStringLiteral("s1"), QStringLiteral("name_input")));
    plan.steps.append(TaskStep::type(QStringLiteral("s2"), QStringLiteral("hawk")));
    plan.steps.append(TaskStep::keyPress(QStringLiteral("s3"), {QStringLiteral("ctrl+s")}));
    plan.steps.append(TaskStep::click(QStringLiteral("s4"), QStringLiteral("ok_button")));
    for (TaskStep& step : plan.steps) {
        step.delay = 0.0;
    }
    return plan;
}

} // namespace

class tst_Session : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testStateNames();
    void testRunPlanToCompletion();
    void testRunGoalUsesPlanner();
    void testStateTransitions();
    void testFailingStepRetriesThenAborts();
    void testCaptureFailureAborts();
    void testChainExhaustedAborts();
    void testRemoteVmFailureFallsBackToLocal();
    void testExecTimeoutReachesRunner();
    void testInvalidPlanRecordsValidationErrors();
    void testRunRequiresStart();
    void testCloseIsIdempotent();
    void testWaitForElement();
    void testWaitForElementTimesOut();
    void testReplayPlan();
    void testReplayUnknownTrace();

private:
    std::unique_ptr<Session> makeSession(int maxRetries = 3);
    void useWorkingChain();

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<SandboxManager> m_manager;
    std::shared_ptr<MockSandboxBackend::State> m_backend;
    Fixture m_fixture;
};

void tst_Session::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_manager = std::make_unique<SandboxManager>();
    m_backend = std::make_shared<MockSandboxBackend::State>();
    m_fixture = Fixture();
    m_fixture.graph = dialogGraph();
    useWorkingChain();
}

void tst_Session::cleanup()
{
    m_manager.reset();
    m_dir.reset();
}

void tst_Session::useWorkingChain()
{
    m_manager->setBackendChain({{SandboxBackendKind::LocalProcess,
                                 MockSandboxBackend::factory(SandboxBackendKind::LocalProcess, m_backend)}});
}

std::unique_ptr<Session> tst_Session::makeSession(int maxRetries)
{
    SessionOptions options;
    options.maxRetries = maxRetries;
    options.retryBackoffMs = 0;
    options.fpsTarget = 1000;
    options.logDirectory = m_dir->path();

    auto session = std::make_unique<Session>(*m_manager, options);
    Fixture* fixture = &m_fixture;
    session->setComponentFactory([fixture](SandboxManager&, const SandboxHandle&, const SessionOptions& opts) {
        SessionComponents components;

        auto engine = std::make_unique<MockCaptureEngine>();
        engine->setCaptureFails(fixture->failCapture);
        fixture->engine = engine.get();
        components.capture = std::make_unique<ScreenCapture>(std::move(engine), opts.fpsTarget);

        auto detector = std::make_unique<MockElementDetector>();
        detector->setGraph(fixture->graph);
        fixture->detector = detector.get();
        components.detector = std::move(detector);

        auto input = std::make_unique<MockInputDriver>();
        fixture->input = input.get();
        components.motor = std::make_unique<MotorController>(std::move(input));
        components.motor->setPauseMs(0);
        return components;
    });
    return session;
}

void tst_Session::testStateNames()
{
    QCOMPARE(sessionStateName(SessionState::SandboxAcquiring), QStringLiteral("sandbox_acquiring"));
    QCOMPARE(sessionStateName(SessionState::Aborted), QStringLiteral("aborted"));
    QVERIFY(isTerminalState(SessionState::Closed));
    QVERIFY(isTerminalState(SessionState::Aborted));
    QVERIFY(!isTerminalState(SessionState::Executing));
    QCOMPARE(stepErrorKindName(StepErrorKind::ElementNotFound), QStringLiteral("element_not_found"));
}

void tst_Session::testRunPlanToCompletion()
{
    QStringList inputCalls;
    std::unique_ptr<Session> session = makeSession();
    connect(session.get(), &Session::stateChanged, this, [&](SessionState state) {
        if (state == SessionState::Completing) {
            inputCalls = m_fixture.input->calls();
        }
    });

    QVERIFY(session->start());
    QCOMPARE(session->state(), SessionState::Planning);
    QVERIFY2(session->run(dialogPlan()), qPrintable(session->lastError()));

    QCOMPARE(session->state(), SessionState::Closed);
    QCOMPARE(inputCalls, QStringList({"click 250,115 left x1", "type hawk", "key ctrl+s",
                                      "click 650,555 left x1"}));

    const ActionTrace& trace = session->trace();
    QCOMPARE(trace.events().size(), 4);
    for (const ActionEvent& event : trace.events()) {
        QCOMPARE(event.status, ActionEventStatus::Success);
        QCOMPARE(event.attempt, 1);
    }
    QCOMPARE(trace.planId(), QStringLiteral("tp_dialog"));
    QVERIFY(trace.isComplete());

    QVERIFY(QFileInfo::exists(session->savedTracePath()));
    QCOMPARE(m_backend->stopCalls.load(), 1);
}

void tst_Session::testRunGoalUsesPlanner()
{
    TaskPlan scripted;
    scripted.steps.append(TaskStep::click(QStringLiteral("a"), QStringLiteral("ok_button")));
    scripted.steps.first().delay = 0.0;
    auto backend = std::make_unique<MockPlanningBackend>();
    backend->setPlan(scripted);
    MockPlanningBackend* mock = backend.get();

    std::unique_ptr<Session> session = makeSession();
    session->setPlanner(std::make_unique<TaskPlanner>(std::move(backend)));
    QVERIFY(session->start());
    QVERIFY2(session->run(QStringLiteral("confirm the dialog")), qPrintable(session->lastError()));

    QCOMPARE(mock->requestCount(), 1);
    QCOMPARE(session->goal(), QStringLiteral("confirm the dialog"));
    QVERIFY(session->taskPlan().has_value());
    QCOMPARE(session->taskPlan()->steps.size(), 1);
    QCOMPARE(session->state(), SessionState::Closed);
}

void tst_Session::testStateTransitions()
{
    QVector<SessionState> states;
    std::unique_ptr<Session> session = makeSession();
    connect(session.get(), &Session::stateChanged, this, [&](SessionState state) {
        states.append(state);
    });

    QVERIFY(session->start());
    QVERIFY(session->run(dialogPlan()));

    const QVector<SessionState> expected = {SessionState::SandboxAcquiring, SessionState::Planning,
                                            SessionState::Executing, SessionState::Completing,
                                            SessionState::Closed};
    QCOMPARE(states, expected);
}

void tst_Session::testFailingStepRetriesThenAborts()
{
    std::unique_ptr<Session> session = makeSession(3);
    QSignalSpy finishedSpy(session.get(), &Session::stepFinished);
    QVERIFY(session->start());

    TaskPlan plan;
    plan.planId = QStringLiteral("tp_missing");
    plan.steps.append(TaskStep::click(QStringLiteral("s1"), QStringLiteral("cancel_link")));

    QVERIFY(!session->run(plan));
    QCOMPARE(session->state(), SessionState::Aborted);
    QVERIFY(session->lastError().contains(QStringLiteral("Step s1 failed after 3 attempts")));
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.first().at(0).toString(), QStringLiteral("s1"));
    QCOMPARE(finishedSpy.first().at(1).toBool(), false);

    const QVector<ActionEvent>& events = session->trace().events();
    QCOMPARE(events.size(), 3);
    QCOMPARE(events.at(0).status, ActionEventStatus::Retry);
    QCOMPARE(events.at(1).status, ActionEventStatus::Retry);
    QCOMPARE(events.at(2).status, ActionEventStatus::Failure);
    QCOMPARE(events.at(2).attempt, 3);
    QCOMPARE(events.at(2).error, QStringLiteral("Element cancel_link not found"));
    QCOMPARE(m_fixture.detector->detectCallCount(), 3);
    QVERIFY(m_fixture.input->calls().isEmpty());

    session->close();
    QCOMPARE(session->state(), SessionState::Aborted);
    QVERIFY(QFileInfo::exists(session->savedTracePath()));
    QCOMPARE(m_backend->stopCalls.load(), 1);
}

void tst_Session::testCaptureFailureAborts()
{
    m_fixture.failCapture = true;
    std::unique_ptr<Session> session = makeSession(2);
    QVERIFY(session->start());

    TaskPlan plan;
    plan.steps.append(TaskStep::type(QStringLiteral("s1"), QStringLiteral("text")));
    QVERIFY(!session->run(plan));

    const QVector<ActionEvent>& events = session->trace().events();
    QCOMPARE(events.size(), 2);
    QVERIFY(events.last().error.startsWith(QStringLiteral("Capture failed:")));
    QVERIFY(m_fixture.input->calls().isEmpty());
}

void tst_Session::testChainExhaustedAborts()
{
    m_backend->startSucceeds = false;
    std::unique_ptr<Session> session = makeSession();

    QVERIFY(!session->start());
    QCOMPARE(session->state(), SessionState::Aborted);
    QVERIFY(session->lastError().startsWith(QStringLiteral("Sandbox acquisition failed:")));
    QVERIFY(!session->sandboxHandle().isValid());
    QVERIFY(!session->run(dialogPlan()));
}

void tst_Session::testRemoteVmFailureFallsBackToLocal()
{
    auto remote = std::make_shared<MockSandboxBackend::State>();
    remote->startThrows = true;
    m_manager->setBackendChain({
        {SandboxBackendKind::RemoteVm, MockSandboxBackend::factory(SandboxBackendKind::RemoteVm, remote)},
        {SandboxBackendKind::LocalProcess, MockSandboxBackend::factory(SandboxBackendKind::LocalProcess, m_backend)}});

    std::unique_ptr<Session> session = makeSession();
    QVERIFY2(session->start(), qPrintable(session->lastError()));
    QCOMPARE(session->state(), SessionState::Planning);
    QCOMPARE(session->sandboxHandle().backend(), SandboxBackendKind::LocalProcess);
    QCOMPARE(remote->startCalls.load(), 1);
    QCOMPARE(m_backend->startCalls.load(), 1);

    QVERIFY2(session->run(dialogPlan()), qPrintable(session->lastError()));
    QCOMPARE(session->state(), SessionState::Closed);
}

void tst_Session::testExecTimeoutReachesRunner()
{
    SessionOptions options;
    options.execTimeoutMs = 1500;
    options.fpsTarget = 1000;

    auto runner = std::make_unique<MockCommandRunner>();
    MockCommandRunner* commands = runner.get();
    SessionComponents components = createSessionComponents(std::move(runner), options);
    QVERIFY(components.isComplete());
    components.motor->setPauseMs(0);

    QString error;
    QVERIFY2(components.motor->click(QPoint(20, 30), MouseButton::Left, &error), qPrintable(error));
    QCOMPARE(commands->lastCommand().first(), QStringLiteral("xdotool"));
    QCOMPARE(commands->lastTimeoutMs(), 1500);

    QImage frame(16, 16, QImage::Format_RGB32);
    frame.fill(Qt::white);
    ExecResult png;
    png.exitCode = 0;
    png.stdOut = QString::fromLatin1(ScreenCapture::encodePng(frame).toBase64());
    commands->enqueueResult(png);

    ScreenshotPayload payload;
    QVERIFY2(components.capture->capture(QStringLiteral("sess_timeout"), &payload, &error), qPrintable(error));
    QCOMPARE(payload.resolution, QSize(16, 16));
    QCOMPARE(commands->lastCommand().first(), QStringLiteral("sh"));
    QCOMPARE(commands->lastTimeoutMs(), 1500);

    components.reset();
}

void tst_Session::testInvalidPlanRecordsValidationErrors()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(session->start());

    TaskPlan plan;
    plan.steps.append(TaskStep::click(QStringLiteral("s1"), QString()));
    plan.steps.append(TaskStep::wait(QStringLiteral("s1"), 0.1));

    QVERIFY(!session->run(plan));
    QCOMPARE(session->state(), SessionState::Aborted);
    QCOMPARE(session->trace().validationErrors(),
             QStringList({"Step s1: Click action missing target", "Step s1: Duplicate step_id"}));
    QVERIFY(session->trace().events().isEmpty());
    QVERIFY(m_fixture.detector->detectCallCount() == 0);
}

void tst_Session::testRunRequiresStart()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(!session->run(dialogPlan()));
    QCOMPARE(session->state(), SessionState::Created);
    QCOMPARE(session->lastError(), QStringLiteral("Session is created, expected planning"));
}

void tst_Session::testCloseIsIdempotent()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(session->start());

    session->close();
    const QString firstPath = session->savedTracePath();
    QVERIFY(QFileInfo::exists(firstPath));
    QCOMPARE(session->state(), SessionState::Closed);

    session->close();
    session.reset();
    QCOMPARE(m_backend->stopCalls.load(), 1);

    const QString sessionDir = QFileInfo(firstPath).absolutePath();
    QCOMPARE(QDir(sessionDir).entryList({QStringLiteral("trace_*.json")}, QDir::Files).size(), 1);
}

void tst_Session::testWaitForElement()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(session->start());

    const std::optional<Element> element = session->waitForElement(QStringLiteral("ok_button"), 2000);
    QVERIFY(element.has_value());
    QCOMPARE(element->id, QStringLiteral("elm_ok"));
    QCOMPARE(session->findElementsByRole(QStringLiteral("input")).size(), 1);
    QCOMPARE(session->findElementsByText(QStringLiteral("ok")).size(), 1);
}

void tst_Session::testWaitForElementTimesOut()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(session->start());

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!session->waitForElement(QStringLiteral("cancel_link"), 0).has_value());
    QVERIFY(timer.elapsed() < Session::kElementPollIntervalMs);
    QCOMPARE(m_fixture.detector->detectCallCount(), 1);
}

void tst_Session::testReplayPlan()
{
    const TaskPlan plan = dialogPlan();
    QString traceId;
    {
        std::unique_ptr<Session> first = makeSession();
        QVERIFY(first->start());
        QVERIFY(first->run(plan));
        traceId = first->trace().traceId();
    }

    std::unique_ptr<Session> replay = makeSession();
    QVERIFY(replay->start());
    QVERIFY2(replay->replayPlan(traceId, plan), qPrintable(replay->lastError()));
    QCOMPARE(replay->state(), SessionState::Closed);
    QCOMPARE(replay->trace().stepIds(), QStringList({"s1", "s2", "s3", "s4"}));
    QVERIFY(replay->trace().planId() != plan.planId);
}

void tst_Session::testReplayUnknownTrace()
{
    std::unique_ptr<Session> session = makeSession();
    QVERIFY(session->start());
    QVERIFY(!session->replayPlan(QStringLiteral("trace_missing"), dialogPlan()));
    QCOMPARE(session->lastError(), QStringLiteral("Trace not found: trace_missing"));
    QCOMPARE(session->state(), SessionState::Planning);
}

QTEST_MAIN(tst_Session)
#include "tst_Session.moc"
