#include "session/Session.h"

#include "detection/ElementResolver.h"
#include "sandbox/SandboxManager.h"
#include "utils/IdUtils.h"

#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QSet>
#include <QThread>

namespace Hawk {

namespace {

void sleepSeconds(double seconds)
{
    if (seconds > 0.0) {
        QThread::msleep(static_cast<unsigned long>(seconds * 1000.0));
    }
}

} // namespace

Session::Session(SandboxManager& sandboxManager, const SessionOptions& options, QObject* parent)
    : QObject(parent)
    , m_sandboxManager(sandboxManager)
    , m_options(options)
    , m_sessionId(IdUtils::newSessionId())
    , m_componentFactory(createDefaultSessionComponents)
    , m_planner(std::make_unique<TaskPlanner>())
    , m_logger(options.logDirectory)
    , m_trace(IdUtils::newTraceId(), m_sessionId)
{
    if (m_options.maxRetries < 1) {
        m_options.maxRetries = 1;
    }
}

Session::~Session()
{
    close();
}

void Session::setComponentFactory(const SessionComponentFactory& factory)
{
    m_componentFactory = factory ? factory : SessionComponentFactory(createDefaultSessionComponents);
}

void Session::setPlanner(std::unique_ptr<TaskPlanner> planner)
{
    if (planner) {
        m_planner = std::move(planner);
    }
}

void Session::setState(SessionState state)
{
    if (m_state == state) {
        return;
    }
    qDebug() << "Session:" << m_sessionId << sessionStateName(m_state) << "->"
             << sessionStateName(state);
    m_state = state;
    emit stateChanged(state);
}

void Session::fail(const QString& message)
{
    m_lastError = message;
    qWarning() << "Session:" << m_sessionId << message;
    if (!isTerminalState(m_state)) {
        setState(SessionState::Aborted);
    }
}

bool Session::start()
{
    if (m_state != SessionState::Created) {
        m_lastError = QStringLiteral("Session already started");
        return false;
    }

    qInfo() << "Session: Starting" << m_sessionId;
    setState(SessionState::SandboxAcquiring);

    QString sandboxError;
    if (!m_sandboxManager.start(m_options.sandboxOptions(), &m_handle, &sandboxError)) {
        fail(QStringLiteral("Sandbox acquisition failed: %1").arg(sandboxError));
        return false;
    }
    qInfo() << "Session: Using" << sandboxBackendName(m_handle.backend()) << "sandbox"
            << m_handle.backendId();

    if (m_abortRequested) {
        fail(QStringLiteral("Aborted"));
        return false;
    }

    m_components = m_componentFactory(m_sandboxManager, m_handle, m_options);
    if (!m_components.isComplete()) {
        fail(QStringLiteral("Failed to create perception and motor components"));
        return false;
    }
    if (!m_components.detector->isInitialized() && !m_components.detector->initialize()) {
        fail(QStringLiteral("Failed to initialize %1 detector").arg(m_components.detector->name()));
        return false;
    }

    setState(SessionState::Planning);
    return true;
}

bool Session::run(const QString& goal)
{
    if (m_state != SessionState::Planning) {
        m_lastError = QStringLiteral("Session is %1, expected planning").arg(sessionStateName(m_state));
        return false;
    }

    m_goal = goal;
    qInfo() << "Session: Planning task for goal:" << goal;
    const TaskPlan plan = m_planner->plan(goal);
    qInfo() << "Session: Plan" << plan.planId << "from" << TaskPlanner::sourceName(m_planner->lastSource())
            << "with" << plan.steps.size() << "steps";
    return run(plan);
}

bool Session::run(const TaskPlan& plan)
{
    if (m_state != SessionState::Planning) {
        m_lastError = QStringLiteral("Session is %1, expected planning").arg(sessionStateName(m_state));
        return false;
    }
    if (m_goal.isEmpty()) {
        m_goal = plan.goal;
    }

    const QStringList errors = TaskPlanner::validatePlan(plan);
    if (!errors.isEmpty()) {
        for (const QString& error : errors) {
            m_trace.addValidationError(error);
        }
        fail(QStringLiteral("Invalid plan: %1").arg(errors.join(QStringLiteral("; "))));
        return false;
    }

    m_plan = plan;
    m_trace.setPlanId(plan.planId);
    setState(SessionState::Executing);

    for (const TaskStep& step : m_plan->steps) {
        if (m_abortRequested) {
            fail(QStringLiteral("Aborted before step %1").arg(step.stepId));
            return false;
        }
        const StepResult result = executeStep(step);
        if (!result.succeeded()) {
            fail(QStringLiteral("Step %1 failed after %2 attempts: %3")
                     .arg(step.stepId)
                     .arg(result.attempts)
                     .arg(result.error->message));
            return false;
        }
    }

    setState(SessionState::Completing);
    m_trace.markComplete();
    qInfo() << "Session: Task completed successfully";
    close();
    return true;
}

void Session::recordEvent(const TaskStep& step, ActionEventStatus status, qint64 latencyMs,
                          int attempt, const QString& error)
{
    ActionEvent event;
    event.stepId = step.stepId;
    event.timestamp = QDateTime::currentMSecsSinceEpoch() / 1000.0;
    event.status = status;
    event.latencyMs = latencyMs;
    event.attempt = attempt;
    event.error = error;
    m_trace.addEvent(event);

    QString logError;
    if (!m_logger.logEvent(m_sessionId, event, &logError)) {
        qWarning() << "Session:" << logError;
    }
}

StepResult Session::executeStep(const TaskStep& step)
{
    qDebug() << "Session: Executing step" << step.stepId << stepActionName(step.action);

    std::optional<BoundingBox> hint;
    StepResult result;
    for (int attempt = 1; attempt <= m_options.maxRetries; ++attempt) {
        if (m_abortRequested) {
            result = StepResult::failure(StepErrorKind::Aborted, QStringLiteral("Aborted"));
            result.attempts = attempt - 1;
            return result;
        }

        QElapsedTimer timer;
        timer.start();
        result = attemptStep(step, &hint);
        result.attempts = attempt;

        if (result.succeeded()) {
            recordEvent(step, ActionEventStatus::Success, timer.elapsed(), attempt, QString());
            emit stepFinished(step.stepId, true);
            // A wait step already spent its delay.
            if (step.action != StepAction::Wait) {
                sleepSeconds(step.delay);
            }
            return result;
        }

        const bool lastAttempt = attempt == m_options.maxRetries;
        qWarning() << "Session: Step" << step.stepId << "attempt" << attempt << "failed:"
                   << result.error->message;
        recordEvent(step, lastAttempt ? ActionEventStatus::Failure : ActionEventStatus::Retry,
                    timer.elapsed(), attempt, result.error->message);
        if (!lastAttempt) {
            QThread::msleep(static_cast<unsigned long>(m_options.retryBackoffMs));
        }
    }

    emit stepFinished(step.stepId, false);
    return result;
}

bool Session::captureAndDetect(ScreenshotPayload* payload, QString* errorMessage)
{
    if (!m_components.isComplete()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Session not started");
        }
        return false;
    }
    if (!m_components.capture->capture(m_sessionId, payload, errorMessage)) {
        return false;
    }
    m_graph = m_components.detector->detect(payload->image);
    return true;
}

StepResult Session::attemptStep(const TaskStep& step, std::optional<BoundingBox>* hint)
{
    ScreenshotPayload payload;
    QString error;
    if (!captureAndDetect(&payload, &error)) {
        return StepResult::failure(StepErrorKind::CaptureFailed,
                                   QStringLiteral("Capture failed: %1").arg(error));
    }

    if (m_options.saveScreenshots && step.action != StepAction::Screenshot) {
        QString saveError;
        if (!m_logger.saveScreenshot(payload, step.stepId, nullptr, &saveError)) {
            qWarning() << "Session:" << saveError;
        }
    }

    MotorController& motor = *m_components.motor;
    StepResult result;
    switch (step.action) {
    case StepAction::Click: {
        const BoundingBox* hintBox = hint->has_value() ? &hint->value() : nullptr;
        const std::optional<Element> element = ElementResolver::resolve(m_graph, step.target, hintBox);
        if (!element) {
            return StepResult::failure(StepErrorKind::ElementNotFound,
                                       QStringLiteral("Element %1 not found").arg(step.target));
        }
        *hint = element->bbox;
        result.resolvedBox = element->bbox;
        if (!motor.click(element->bbox, MouseButton::Left, &error)) {
            return StepResult::failure(StepErrorKind::InputFailed, error);
        }
        break;
    }
    case StepAction::Type:
        if (!motor.typeText(step.text(), &error)) {
            return StepResult::failure(StepErrorKind::InputFailed, error);
        }
        break;
    case StepAction::KeyPress:
        if (!motor.pressKeys(step.keys, &error)) {
            return StepResult::failure(StepErrorKind::InputFailed, error);
        }
        break;
    case StepAction::Wait:
        sleepSeconds(step.delay > 0.0 ? step.delay : kDefaultWaitSeconds);
        break;
    case StepAction::Screenshot:
        if (!m_logger.saveScreenshot(payload, step.stepId, nullptr, &error)) {
            return StepResult::failure(StepErrorKind::ScreenshotFailed, error);
        }
        break;
    }
    return result;
}

std::optional<Element> Session::waitForElement(const QString& target, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (!m_abortRequested) {
        ScreenshotPayload payload;
        QString error;
        if (captureAndDetect(&payload, &error)) {
            const std::optional<Element> element = ElementResolver::resolve(m_graph, target);
            if (element) {
                return element;
            }
        } else {
            qWarning() << "Session: waitForElement capture failed:" << error;
        }

        if (timer.elapsed() + kElementPollIntervalMs > timeoutMs) {
            break;
        }
        QThread::msleep(kElementPollIntervalMs);
    }
    return std::nullopt;
}

QVector<Element> Session::findElementsByText(const QString& text) const
{
    return m_graph.findByText(text);
}

QVector<Element> Session::findElementsByRole(const QString& role) const
{
    return m_graph.findByRole(role);
}

bool Session::replayPlan(const QString& traceId, const TaskPlan& plan)
{
    if (m_state != SessionState::Planning) {
        m_lastError = QStringLiteral("Session is %1, expected planning").arg(sessionStateName(m_state));
        return false;
    }

    ActionTrace recorded;
    QString error;
    if (!m_logger.loadTrace(traceId, &recorded, &error)) {
        m_lastError = error;
        return false;
    }

    TaskPlan replay;
    replay.planId = IdUtils::newPlanId();
    replay.goal = plan.goal;
    for (const QString& stepId : recorded.stepIds()) {
        const TaskStep* step = plan.findStep(stepId);
        if (!step) {
            m_lastError = QStringLiteral("Step %1 of trace %2 is not in plan %3")
                              .arg(stepId, traceId, plan.planId);
            return false;
        }
        replay.steps.append(*step);
    }
    if (replay.steps.isEmpty()) {
        m_lastError = QStringLiteral("Trace %1 has no recorded steps").arg(traceId);
        return false;
    }

    qInfo() << "Session: Replaying trace" << traceId << "with" << replay.steps.size() << "steps";
    return run(replay);
}

void Session::abort()
{
    m_abortRequested = true;
    if (m_state != SessionState::Executing && !isTerminalState(m_state)) {
        fail(QStringLiteral("Aborted"));
    }
}

void Session::close()
{
    if (m_closed) {
        return;
    }
    m_closed = true;
    qInfo() << "Session: Cleaning up" << m_sessionId;

    m_trace.markComplete();
    if (m_state != SessionState::Created) {
        QString error;
        if (!m_logger.saveTrace(m_trace, &m_savedTracePath, &error)) {
            qWarning() << "Session:" << error;
        }
    }

    if (m_components.capture) {
        m_components.capture->close();
    }
    m_components.reset();
    m_sandboxManager.stop(m_handle);

    if (m_state != SessionState::Aborted) {
        setState(SessionState::Closed);
    }
}

} // namespace Hawk
