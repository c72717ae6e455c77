#include "monitoring/TraceTypes.h"

#include <QJsonArray>
#include <QSet>

namespace Hawk {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QString formatTime(const QDateTime& time)
{
    return time.isValid() ? time.toString(Qt::ISODateWithMs) : QString();
}

} // namespace

QString actionEventStatusName(ActionEventStatus status)
{
    switch (status) {
    case ActionEventStatus::Success:
        return QStringLiteral("success");
    case ActionEventStatus::Retry:
        return QStringLiteral("retry");
    case ActionEventStatus::Failure:
        return QStringLiteral("failure");
    }
    return QString();
}

bool actionEventStatusFromName(const QString& name, ActionEventStatus* status)
{
    static const ActionEventStatus all[] = {
        ActionEventStatus::Success, ActionEventStatus::Retry, ActionEventStatus::Failure};
    for (ActionEventStatus candidate : all) {
        if (actionEventStatusName(candidate) == name) {
            if (status) {
                *status = candidate;
            }
            return true;
        }
    }
    return false;
}

QJsonObject ActionEvent::toJson() const
{
    QJsonObject json;
    json["event_id"] = eventId;
    json["step_id"] = stepId;
    json["timestamp"] = timestamp;
    json["status"] = actionEventStatusName(status);
    json["latency_ms"] = static_cast<double>(latencyMs);
    json["attempt"] = attempt;
    json["error"] = error.isEmpty() ? QJsonValue() : QJsonValue(error);
    return json;
}

bool ActionEvent::fromJson(const QJsonObject& json, ActionEvent* event, QString* errorMessage)
{
    if (!event) {
        setError(errorMessage, QStringLiteral("Null event"));
        return false;
    }

    ActionEvent parsed;
    parsed.eventId = json.value("event_id").toInt();
    parsed.stepId = json.value("step_id").toString();
    parsed.timestamp = json.value("timestamp").toDouble();
    parsed.latencyMs = static_cast<qint64>(json.value("latency_ms").toDouble());
    parsed.attempt = json.value("attempt").toInt(1);
    parsed.error = json.value("error").toString();

    if (parsed.stepId.isEmpty()) {
        setError(errorMessage, QStringLiteral("Event %1 has no step_id").arg(parsed.eventId));
        return false;
    }
    const QString statusName = json.value("status").toString();
    if (!actionEventStatusFromName(statusName, &parsed.status)) {
        setError(errorMessage, QStringLiteral("Event %1 has unknown status \"%2\"")
                                   .arg(parsed.eventId)
                                   .arg(statusName));
        return false;
    }

    *event = parsed;
    return true;
}

ActionTrace::ActionTrace(const QString& traceId, const QString& sessionId, const QDateTime& startedAt)
    : m_traceId(traceId)
    , m_sessionId(sessionId)
    , m_startedAt(startedAt)
{
}

int ActionTrace::addEvent(ActionEvent& event)
{
    event.eventId = m_events.size() + 1;
    m_events.append(event);
    return event.eventId;
}

QStringList ActionTrace::stepIds() const
{
    QStringList ids;
    QSet<QString> seen;
    for (const ActionEvent& event : m_events) {
        if (!seen.contains(event.stepId)) {
            seen.insert(event.stepId);
            ids.append(event.stepId);
        }
    }
    return ids;
}

bool ActionTrace::markComplete(const QDateTime& at)
{
    if (m_completedAt.isValid()) {
        return false;
    }
    m_completedAt = at;
    return true;
}

QJsonObject ActionTrace::toJson() const
{
    QJsonObject json;
    json["trace_id"] = m_traceId;
    json["session_id"] = m_sessionId;
    if (!m_planId.isEmpty()) {
        json["plan_id"] = m_planId;
    }

    QJsonArray events;
    for (const ActionEvent& event : m_events) {
        events.append(event.toJson());
    }
    json["events"] = events;

    if (!m_validationErrors.isEmpty()) {
        json["validation_errors"] = QJsonArray::fromStringList(m_validationErrors);
    }

    json["started_at"] = formatTime(m_startedAt);
    json["completed_at"] = m_completedAt.isValid() ? QJsonValue(formatTime(m_completedAt))
                                                   : QJsonValue();
    return json;
}

bool ActionTrace::fromJson(const QJsonObject& json, ActionTrace* trace, QString* errorMessage)
{
    if (!trace) {
        setError(errorMessage, QStringLiteral("Null trace"));
        return false;
    }

    const QString traceId = json.value("trace_id").toString();
    if (traceId.isEmpty()) {
        setError(errorMessage, QStringLiteral("Trace has no trace_id"));
        return false;
    }

    ActionTrace parsed(traceId, json.value("session_id").toString(),
                       QDateTime::fromString(json.value("started_at").toString(), Qt::ISODateWithMs));
    parsed.m_planId = json.value("plan_id").toString();

    const QJsonArray events = json.value("events").toArray();
    for (const QJsonValue& value : events) {
        ActionEvent event;
        if (!ActionEvent::fromJson(value.toObject(), &event, errorMessage)) {
            return false;
        }
        parsed.m_events.append(event);
    }

    for (const QJsonValue& value : json.value("validation_errors").toArray()) {
        parsed.m_validationErrors.append(value.toString());
    }

    const QString completedAt = json.value("completed_at").toString();
    if (!completedAt.isEmpty()) {
        parsed.m_completedAt = QDateTime::fromString(completedAt, Qt::ISODateWithMs);
    }

    *trace = parsed;
    return true;
}

QJsonObject TraceSummary::toJson() const
{
    QJsonObject json;
    json["trace_id"] = traceId;
    json["session_id"] = sessionId;
    json["event_count"] = eventCount;
    json["started_at"] = startedAt;
    json["completed_at"] = completedAt.isEmpty() ? QJsonValue() : QJsonValue(completedAt);
    json["saved_at"] = savedAt;
    json["filepath"] = filePath;
    return json;
}

} // namespace Hawk
