#ifndef TASKTYPES_H
#define TASKTYPES_H

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace Hawk {

enum class StepAction {
    Click,
    Type,
    KeyPress,
    Wait,
    Screenshot
};

QString stepActionName(StepAction action);
bool stepActionFromName(const QString& name, StepAction* action);

/**
 * @brief One atomic action of a TaskPlan.
 *
 * keys holds either a single string (type text) or a list (keypress);
 * keysIsList remembers which JSON form it came from.
 */
struct TaskStep
{
    static constexpr double kDefaultDelaySeconds = 0.1;

    QString stepId;
    StepAction action = StepAction::Wait;
    QString target;
    QStringList keys;
    bool keysIsList = false;
    double delay = kDefaultDelaySeconds;
    std::optional<double> confidence;

    bool hasTarget() const { return !target.trimmed().isEmpty(); }
    bool hasKeys() const;

    // keys joined into the text typed by a type step.
    QString text() const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, TaskStep* step, QString* errorMessage = nullptr);

    static TaskStep click(const QString& stepId, const QString& target,
                          std::optional<double> confidence = std::nullopt);
    static TaskStep type(const QString& stepId, const QString& text,
                         std::optional<double> confidence = std::nullopt);
    static TaskStep keyPress(const QString& stepId, const QStringList& keys,
                             std::optional<double> confidence = std::nullopt);
    static TaskStep wait(const QString& stepId, double seconds,
                         std::optional<double> confidence = std::nullopt);
};

struct TaskPlan
{
    QString planId;
    QString goal;
    QVector<TaskStep> steps;

    bool isEmpty() const { return steps.isEmpty(); }
    const TaskStep* findStep(const QString& stepId) const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, TaskPlan* plan, QString* errorMessage = nullptr);
};

} // namespace Hawk

#endif // TASKTYPES_H
