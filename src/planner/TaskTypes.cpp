#include "planner/TaskTypes.h"

#include <QJsonArray>

namespace Hawk {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

QString stepActionName(StepAction action)
{
    switch (action) {
    case StepAction::Click:
        return QStringLiteral("click");
    case StepAction::Type:
        return QStringLiteral("type");
    case StepAction::KeyPress:
        return QStringLiteral("keypress");
    case StepAction::Wait:
        return QStringLiteral("wait");
    case StepAction::Screenshot:
        return QStringLiteral("screenshot");
    }
    return QStringLiteral("wait");
}

bool stepActionFromName(const QString& name, StepAction* action)
{
    static const StepAction kActions[] = {
        StepAction::Click, StepAction::Type, StepAction::KeyPress,
        StepAction::Wait, StepAction::Screenshot
    };
    const QString normalized = name.trimmed().toLower();
    for (StepAction candidate : kActions) {
        if (stepActionName(candidate) == normalized) {
            if (action) {
                *action = candidate;
            }
            return true;
        }
    }
    return false;
}

bool TaskStep::hasKeys() const
{
    for (const QString& key : keys) {
        if (!key.isEmpty()) {
            return true;
        }
    }
    return false;
}

QString TaskStep::text() const
{
    return keys.join(QString());
}

QJsonObject TaskStep::toJson() const
{
    QJsonObject json;
    json["step_id"] = stepId;
    json["action"] = stepActionName(action);
    json["target"] = hasTarget() ? QJsonValue(target) : QJsonValue();
    if (keys.isEmpty()) {
        json["keys"] = QJsonValue();
    } else if (keysIsList) {
        json["keys"] = QJsonArray::fromStringList(keys);
    } else {
        json["keys"] = text();
    }
    json["delay"] = delay;
    json["confidence"] = confidence ? QJsonValue(*confidence) : QJsonValue();
    return json;
}

bool TaskStep::fromJson(const QJsonObject& json, TaskStep* step, QString* errorMessage)
{
    TaskStep parsed;

    const QJsonValue idValue = json.value(QStringLiteral("step_id"));
    if (!idValue.isString() || idValue.toString().trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Step is missing 'step_id'"));
        return false;
    }
    parsed.stepId = idValue.toString().trimmed();

    const QJsonValue actionValue = json.value(QStringLiteral("action"));
    if (!actionValue.isString() || !stepActionFromName(actionValue.toString(), &parsed.action)) {
        setError(errorMessage, QStringLiteral("Step %1: unknown action '%2'")
                                   .arg(parsed.stepId, actionValue.toVariant().toString()));
        return false;
    }

    const QJsonValue targetValue = json.value(QStringLiteral("target"));
    if (targetValue.isString()) {
        parsed.target = targetValue.toString();
    } else if (!targetValue.isNull() && !targetValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("Step %1: 'target' must be a string").arg(parsed.stepId));
        return false;
    }

    const QJsonValue keysValue = json.value(QStringLiteral("keys"));
    if (keysValue.isString()) {
        parsed.keys = QStringList{keysValue.toString()};
        parsed.keysIsList = false;
    } else if (keysValue.isArray()) {
        const QJsonArray array = keysValue.toArray();
        for (const QJsonValue& key : array) {
            if (!key.isString()) {
                setError(errorMessage, QStringLiteral("Step %1: 'keys' entries must be strings")
                                           .arg(parsed.stepId));
                return false;
            }
            parsed.keys.append(key.toString());
        }
        parsed.keysIsList = true;
    } else if (!keysValue.isNull() && !keysValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("Step %1: 'keys' must be a string or a list of strings")
                                   .arg(parsed.stepId));
        return false;
    }

    const QJsonValue delayValue = json.value(QStringLiteral("delay"));
    if (delayValue.isDouble()) {
        parsed.delay = delayValue.toDouble();
    } else if (!delayValue.isNull() && !delayValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("Step %1: 'delay' must be a number").arg(parsed.stepId));
        return false;
    }

    const QJsonValue confidenceValue = json.value(QStringLiteral("confidence"));
    if (confidenceValue.isDouble()) {
        parsed.confidence = confidenceValue.toDouble();
    } else if (!confidenceValue.isNull() && !confidenceValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("Step %1: 'confidence' must be a number")
                                   .arg(parsed.stepId));
        return false;
    }

    if (step) {
        *step = parsed;
    }
    return true;
}

TaskStep TaskStep::click(const QString& stepId, const QString& target, std::optional<double> confidence)
{
    TaskStep step;
    step.stepId = stepId;
    step.action = StepAction::Click;
    step.target = target;
    step.confidence = confidence;
    return step;
}

TaskStep TaskStep::type(const QString& stepId, const QString& text, std::optional<double> confidence)
{
    TaskStep step;
    step.stepId = stepId;
    step.action = StepAction::Type;
    step.keys = QStringList{text};
    step.keysIsList = false;
    step.confidence = confidence;
    return step;
}

TaskStep TaskStep::keyPress(const QString& stepId, const QStringList& keys, std::optional<double> confidence)
{
    TaskStep step;
    step.stepId = stepId;
    step.action = StepAction::KeyPress;
    step.keys = keys;
    step.keysIsList = true;
    step.confidence = confidence;
    return step;
}

TaskStep TaskStep::wait(const QString& stepId, double seconds, std::optional<double> confidence)
{
    TaskStep step;
    step.stepId = stepId;
    step.action = StepAction::Wait;
    step.delay = seconds;
    step.confidence = confidence;
    return step;
}

const TaskStep* TaskPlan::findStep(const QString& stepId) const
{
    for (const TaskStep& step : steps) {
        if (step.stepId == stepId) {
            return &step;
        }
    }
    return nullptr;
}

QJsonObject TaskPlan::toJson() const
{
    QJsonArray stepArray;
    for (const TaskStep& step : steps) {
        stepArray.append(step.toJson());
    }

    QJsonObject json;
    json["plan_id"] = planId;
    json["goal"] = goal;
    json["steps"] = stepArray;
    return json;
}

bool TaskPlan::fromJson(const QJsonObject& json, TaskPlan* plan, QString* errorMessage)
{
    TaskPlan parsed;
    const QJsonValue planIdValue = json.value(QStringLiteral("plan_id"));
    if (planIdValue.isString()) {
        parsed.planId = planIdValue.toString();
    } else if (!planIdValue.isNull() && !planIdValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("'plan_id' must be a string"));
        return false;
    }

    const QJsonValue goalValue = json.value(QStringLiteral("goal"));
    if (goalValue.isString()) {
        parsed.goal = goalValue.toString();
    } else if (!goalValue.isNull() && !goalValue.isUndefined()) {
        setError(errorMessage, QStringLiteral("'goal' must be a string"));
        return false;
    }

    const QJsonValue stepsValue = json.value(QStringLiteral("steps"));
    if (!stepsValue.isArray()) {
        setError(errorMessage, QStringLiteral("'steps' must be a list"));
        return false;
    }

    const QJsonArray stepArray = stepsValue.toArray();
    for (int i = 0; i < stepArray.size(); ++i) {
        if (!stepArray.at(i).isObject()) {
            setError(errorMessage, QStringLiteral("Step at index %1 is not an object").arg(i));
            return false;
        }
        TaskStep step;
        if (!TaskStep::fromJson(stepArray.at(i).toObject(), &step, errorMessage)) {
            return false;
        }
        parsed.steps.append(step);
    }

    if (plan) {
        *plan = parsed;
    }
    return true;
}

} // namespace Hawk
