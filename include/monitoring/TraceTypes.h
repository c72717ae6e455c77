#ifndef TRACETYPES_H
#define TRACETYPES_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

namespace Hawk {

enum class ActionEventStatus {
    Success,
    Retry,
    Failure
};

QString actionEventStatusName(ActionEventStatus status);
bool actionEventStatusFromName(const QString& name, ActionEventStatus* status);

struct ActionEvent
{
    int eventId = 0;              // 1-based, assigned by ActionTrace::addEvent
    QString stepId;
    double timestamp = 0.0;       // unix seconds with millisecond precision
    ActionEventStatus status = ActionEventStatus::Success;
    qint64 latencyMs = 0;
    int attempt = 1;
    QString error;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, ActionEvent* event, QString* errorMessage = nullptr);
};

/**
 * @brief Ordered record of everything a session did.
 *
 * Event ids are assigned on insertion and never reused. completedAt is set
 * by the first markComplete() call; later calls keep the original time.
 */
class ActionTrace
{
public:
    ActionTrace() = default;
    ActionTrace(const QString& traceId, const QString& sessionId,
                const QDateTime& startedAt = QDateTime::currentDateTimeUtc());

    QString traceId() const { return m_traceId; }
    QString sessionId() const { return m_sessionId; }
    QDateTime startedAt() const { return m_startedAt; }
    QDateTime completedAt() const { return m_completedAt; }
    bool isComplete() const { return m_completedAt.isValid(); }

    QString planId() const { return m_planId; }
    void setPlanId(const QString& planId) { m_planId = planId; }

    // Stamps the next event id onto event and returns it.
    int addEvent(ActionEvent& event);
    const QVector<ActionEvent>& events() const { return m_events; }
    QStringList stepIds() const;

    // Returns false when the trace was already complete.
    bool markComplete(const QDateTime& at = QDateTime::currentDateTimeUtc());

    void addValidationError(const QString& message) { m_validationErrors.append(message); }
    QStringList validationErrors() const { return m_validationErrors; }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, ActionTrace* trace, QString* errorMessage = nullptr);

private:
    QString m_traceId;
    QString m_sessionId;
    QString m_planId;
    QVector<ActionEvent> m_events;
    QStringList m_validationErrors;
    QDateTime m_startedAt;
    QDateTime m_completedAt;
};

struct TraceSummary
{
    QString traceId;
    QString sessionId;
    int eventCount = 0;
    QString startedAt;
    QString completedAt;
    QString savedAt;
    QString filePath;

    QJsonObject toJson() const;
};

} // namespace Hawk

#endif // TRACETYPES_H
