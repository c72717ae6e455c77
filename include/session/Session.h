#ifndef SESSION_H
#define SESSION_H

#include "detection/ElementTypes.h"
#include "monitoring/ActionLogger.h"
#include "monitoring/TraceTypes.h"
#include "planner/TaskPlanner.h"
#include "planner/TaskTypes.h"
#include "sandbox/SandboxHandle.h"
#include "session/SessionComponents.h"
#include "session/SessionTypes.h"

#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <memory>
#include <optional>

namespace Hawk {

class SandboxManager;

/**
 * @brief Owns the lifecycle of one goal.
 *
 * Created -> SandboxAcquiring -> Planning -> Executing -> Completing -> Closed,
 * with Aborted reachable from every non-terminal state. Steps run one at a
 * time on the calling thread; each step is captured, detected, resolved and
 * acted on again on every attempt.
 *
 * close() finalizes and saves the trace, then releases the sandbox. It runs
 * once, on success from run() and otherwise from the destructor at the
 * latest.
 */
class Session : public QObject
{
    Q_OBJECT

public:
    static constexpr int kElementPollIntervalMs = 500;
    static constexpr double kDefaultWaitSeconds = 1.0;

    Session(SandboxManager& sandboxManager, const SessionOptions& options,
            QObject* parent = nullptr);
    ~Session() override;

    QString sessionId() const { return m_sessionId; }
    QString goal() const { return m_goal; }
    SessionState state() const { return m_state; }
    SessionOptions options() const { return m_options; }
    QString lastError() const { return m_lastError; }

    const SandboxHandle& sandboxHandle() const { return m_handle; }
    const std::optional<TaskPlan>& taskPlan() const { return m_plan; }
    const ActionTrace& trace() const { return m_trace; }
    QString savedTracePath() const { return m_savedTracePath; }
    ActionLogger& actionLogger() { return m_logger; }

    // Must be set before start().
    void setComponentFactory(const SessionComponentFactory& factory);
    void setPlanner(std::unique_ptr<TaskPlanner> planner);
    TaskPlanner& planner() { return *m_planner; }

    /**
     * @brief Acquire a sandbox and build the perception and motor components.
     * @return false, with the session aborted, if no backend could start
     */
    bool start();

    /**
     * @brief Plan the goal and execute it.
     * @return true if every step succeeded; the session is then closed
     */
    bool run(const QString& goal);

    /**
     * @brief Execute a caller-supplied plan.
     *
     * An invalid plan aborts before any step runs; its validation errors go
     * into the trace.
     */
    bool run(const TaskPlan& plan);

    /**
     * @brief Run one step with retries.
     *
     * Makes at most maxRetries attempts with a fixed backoff between them and
     * logs one event per attempt.
     */
    StepResult executeStep(const TaskStep& step);

    // Poll capture and detection until target resolves or the timeout elapses.
    std::optional<Element> waitForElement(const QString& target, int timeoutMs);

    // Lookups on the most recently detected graph.
    QVector<Element> findElementsByText(const QString& text) const;
    QVector<Element> findElementsByRole(const QString& role) const;
    const ElementGraph& latestGraph() const { return m_graph; }

    /**
     * @brief Re-run the steps recorded in a saved trace.
     *
     * The trace only carries step ids, so the steps come from plan, in the
     * order the trace first recorded them.
     */
    bool replayPlan(const QString& traceId, const TaskPlan& plan);

    // Stops execution at the next attempt boundary.
    void abort();

    void close();

signals:
    void stateChanged(Hawk::SessionState state);
    void stepFinished(const QString& stepId, bool success);

private:
    void setState(SessionState state);
    void fail(const QString& message);
    StepResult attemptStep(const TaskStep& step, std::optional<BoundingBox>* hint);
    bool captureAndDetect(ScreenshotPayload* payload, QString* errorMessage);
    void recordEvent(const TaskStep& step, ActionEventStatus status, qint64 latencyMs,
                     int attempt, const QString& error);

    SandboxManager& m_sandboxManager;
    SessionOptions m_options;
    QString m_sessionId;
    QString m_goal;
    SessionState m_state = SessionState::Created;
    QString m_lastError;

    SandboxHandle m_handle;
    SessionComponentFactory m_componentFactory;
    SessionComponents m_components;
    std::unique_ptr<TaskPlanner> m_planner;
    ActionLogger m_logger;

    std::optional<TaskPlan> m_plan;
    ActionTrace m_trace;
    ElementGraph m_graph;
    QString m_savedTracePath;

    std::atomic<bool> m_abortRequested{false};
    bool m_closed = false;
};

} // namespace Hawk

#endif // SESSION_H
