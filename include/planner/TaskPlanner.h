#ifndef TASKPLANNER_H
#define TASKPLANNER_H

#include "planner/IPlanningBackend.h"
#include "planner/TaskTypes.h"

#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

namespace Hawk {

struct PlanTemplate
{
    QString name;
    QString pattern;
    QVector<TaskStep> steps; // step ids are assigned when the template is used
};

/**
 * @brief Converts a natural language goal into a TaskPlan.
 *
 * Planning is tiered: the first matching template wins, then the remote
 * backend if one is configured, then keyword rules. plan() always returns
 * at least one step.
 */
class TaskPlanner
{
public:
    enum class Source {
        Template,
        RemoteModel,
        Rules
    };

    static constexpr double kTemplateConfidence = 0.9;
    static constexpr int kDefaultRemoteTimeoutMs = 30000;

    TaskPlanner();
    explicit TaskPlanner(std::unique_ptr<IPlanningBackend> backend);
    ~TaskPlanner();

    /**
     * @brief Planner configured from PlannerSettingsManager.
     *
     * Adds the remote backend when an API key is available and appends the
     * templates file when one is set. A broken templates file is logged and
     * skipped.
     */
    static std::unique_ptr<TaskPlanner> createFromSettings();

    TaskPlan plan(const QString& goal);

    /**
     * @brief Check a plan before execution.
     * @return One message per problem; empty when the plan is valid
     */
    static QStringList validatePlan(const TaskPlan& plan);

    QVector<PlanTemplate> templates() const { return m_templates; }
    void addTemplate(const PlanTemplate& planTemplate);

    /**
     * @brief Append templates from a JSON file.
     *
     * The file holds an array of {"name", "pattern", "steps"} objects, or an
     * object with a "templates" array.
     */
    bool loadTemplatesFromFile(const QString& path, QString* errorMessage = nullptr);

    void setBackend(std::unique_ptr<IPlanningBackend> backend);
    IPlanningBackend* backend() const { return m_backend.get(); }

    void setRemoteTimeoutMs(int timeoutMs) { m_remoteTimeoutMs = timeoutMs; }
    int remoteTimeoutMs() const { return m_remoteTimeoutMs; }

    Source lastSource() const { return m_lastSource; }
    static QString sourceName(Source source);

    static QString systemInstruction();
    static QVector<PlanTemplate> builtinTemplates();

private:
    bool planFromTemplate(const QString& goal, TaskPlan* plan) const;
    bool planWithBackend(const QString& goal, TaskPlan* plan);
    TaskPlan planWithRules(const QString& goal) const;

    QVector<PlanTemplate> m_templates;
    std::unique_ptr<IPlanningBackend> m_backend;
    int m_remoteTimeoutMs = kDefaultRemoteTimeoutMs;
    Source m_lastSource = Source::Rules;
};

} // namespace Hawk

#endif // TASKPLANNER_H
