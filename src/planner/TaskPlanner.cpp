#include "planner/TaskPlanner.h"

#include "planner/RemotePlanningBackend.h"
#include "settings/PlannerSettingsManager.h"
#include "utils/IdUtils.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>

namespace Hawk {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool parseTemplate(const QJsonObject& json, PlanTemplate* planTemplate, QString* errorMessage)
{
    PlanTemplate parsed;
    parsed.name = json.value("name").toString().trimmed();
    parsed.pattern = json.value("pattern").toString();
    if (parsed.name.isEmpty() || parsed.pattern.isEmpty()) {
        setError(errorMessage, QStringLiteral("Template needs a 'name' and a 'pattern'"));
        return false;
    }

    const QRegularExpression regex(parsed.pattern);
    if (!regex.isValid()) {
        setError(errorMessage, QStringLiteral("Template %1: invalid pattern: %2")
                                   .arg(parsed.name, regex.errorString()));
        return false;
    }

    const QJsonArray steps = json.value("steps").toArray();
    if (steps.isEmpty()) {
        setError(errorMessage, QStringLiteral("Template %1 has no steps").arg(parsed.name));
        return false;
    }

    for (int i = 0; i < steps.size(); ++i) {
        QJsonObject stepJson = steps.at(i).toObject();
        // Template steps carry no ids of their own.
        stepJson["step_id"] = QStringLiteral("s%1").arg(i + 1);
        TaskStep step;
        QString stepError;
        if (!TaskStep::fromJson(stepJson, &step, &stepError)) {
            setError(errorMessage, QStringLiteral("Template %1: %2").arg(parsed.name, stepError));
            return false;
        }
        parsed.steps.append(step);
    }

    *planTemplate = parsed;
    return true;
}

} // namespace

TaskPlanner::TaskPlanner()
    : m_templates(builtinTemplates())
{
}

TaskPlanner::TaskPlanner(std::unique_ptr<IPlanningBackend> backend)
    : m_templates(builtinTemplates())
    , m_backend(std::move(backend))
{
}

TaskPlanner::~TaskPlanner() = default;

std::unique_ptr<TaskPlanner> TaskPlanner::createFromSettings()
{
    const auto& settings = PlannerSettingsManager::instance();
    auto planner = std::make_unique<TaskPlanner>();
    planner->setRemoteTimeoutMs(settings.timeoutMs());

    auto backend = std::make_unique<RemotePlanningBackend>(RemotePlanningBackend::configFromSettings());
    if (backend->isConfigured()) {
        planner->setBackend(std::move(backend));
    } else {
        qDebug() << "TaskPlanner: No planner API key, remote planning disabled";
    }

    const QString templatesPath = settings.templatesPath();
    if (!templatesPath.isEmpty()) {
        QString error;
        if (!planner->loadTemplatesFromFile(templatesPath, &error)) {
            qWarning() << "TaskPlanner: Ignoring templates file" << templatesPath << ":" << error;
        }
    }
    return planner;
}

QString TaskPlanner::systemInstruction()
{
    return QStringLiteral(
        "You are a task planning agent for the Hawk UI automation system.\n"
        "Your role is to convert natural language goals into precise, executable TaskPlan JSON.\n"
        "\n"
        "Guidelines:\n"
        "1. Break down complex tasks into atomic UI actions (click, type, keypress)\n"
        "2. Identify specific UI elements by their visual characteristics\n"
        "3. Include appropriate delays between actions for UI responsiveness\n"
        "4. Add confidence scores based on action complexity\n"
        "5. Prefer keyboard shortcuts when available for efficiency\n"
        "\n"
        "Output only valid TaskPlan JSON matching this schema:\n"
        "{\n"
        "  \"plan_id\": \"string\",\n"
        "  \"goal\": \"string\",\n"
        "  \"steps\": [\n"
        "    {\n"
        "      \"step_id\": \"string\",\n"
        "      \"action\": \"click|type|keypress|wait|screenshot\",\n"
        "      \"target\": \"element_id (for clicks)\",\n"
        "      \"keys\": \"string or array (for type/keypress)\",\n"
        "      \"delay\": 0.1,\n"
        "      \"confidence\": 0.0-1.0\n"
        "    }\n"
        "  ]\n"
        "}");
}

QVector<PlanTemplate> TaskPlanner::builtinTemplates()
{
    PlanTemplate exportDocument;
    exportDocument.name = QStringLiteral("export_document");
    exportDocument.pattern = QStringLiteral("export .* from .*");
    exportDocument.steps = {
        TaskStep::click(QString(), QStringLiteral("file_menu")),
        TaskStep::click(QString(), QStringLiteral("export_option")),
        TaskStep::type(QString(), QStringLiteral("{filename}")),
        TaskStep::keyPress(QString(), {QStringLiteral("ENTER")}),
    };

    PlanTemplate fillForm;
    fillForm.name = QStringLiteral("fill_form");
    fillForm.pattern = QStringLiteral("fill .* form");
    fillForm.steps = {
        TaskStep::click(QString(), QStringLiteral("first_input_field")),
        TaskStep::type(QString(), QStringLiteral("{field_value}")),
        TaskStep::keyPress(QString(), {QStringLiteral("TAB")}),
    };

    return {exportDocument, fillForm};
}

QString TaskPlanner::sourceName(Source source)
{
    switch (source) {
    case Source::Template:
        return QStringLiteral("template");
    case Source::RemoteModel:
        return QStringLiteral("remote_model");
    case Source::Rules:
        return QStringLiteral("rules");
    }
    return QStringLiteral("rules");
}

void TaskPlanner::addTemplate(const PlanTemplate& planTemplate)
{
    m_templates.append(planTemplate);
}

bool TaskPlanner::loadTemplatesFromFile(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Cannot open template file %1: %2")
                                   .arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Template file %1 is not valid JSON: %2")
                                   .arg(path, parseError.errorString()));
        return false;
    }

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().value("templates").isArray()) {
        entries = doc.object().value("templates").toArray();
    } else {
        setError(errorMessage, QStringLiteral("Template file %1 has no template list").arg(path));
        return false;
    }

    // Parse everything first so a bad entry leaves the planner untouched.
    QVector<PlanTemplate> loaded;
    for (const QJsonValue& entry : entries) {
        PlanTemplate planTemplate;
        if (!entry.isObject() || !parseTemplate(entry.toObject(), &planTemplate, errorMessage)) {
            if (!entry.isObject()) {
                setError(errorMessage, QStringLiteral("Template entries must be objects"));
            }
            return false;
        }
        loaded.append(planTemplate);
    }

    m_templates += loaded;
    qDebug() << "TaskPlanner: Loaded" << loaded.size() << "templates from" << path;
    return true;
}

void TaskPlanner::setBackend(std::unique_ptr<IPlanningBackend> backend)
{
    m_backend = std::move(backend);
}

TaskPlan TaskPlanner::plan(const QString& goal)
{
    qInfo() << "TaskPlanner: Planning task for goal:" << goal;

    TaskPlan result;
    if (planFromTemplate(goal, &result)) {
        m_lastSource = Source::Template;
        return result;
    }

    if (planWithBackend(goal, &result)) {
        m_lastSource = Source::RemoteModel;
        return result;
    }

    m_lastSource = Source::Rules;
    return planWithRules(goal);
}

bool TaskPlanner::planFromTemplate(const QString& goal, TaskPlan* plan) const
{
    for (const PlanTemplate& planTemplate : m_templates) {
        const QRegularExpression regex(planTemplate.pattern,
                                       QRegularExpression::CaseInsensitiveOption);
        if (!regex.isValid() || !regex.match(goal).hasMatch()) {
            continue;
        }

        qInfo() << "TaskPlanner: Using template:" << planTemplate.name;
        plan->planId = IdUtils::newPlanId();
        plan->goal = goal;
        plan->steps.clear();
        for (int i = 0; i < planTemplate.steps.size(); ++i) {
            TaskStep step = planTemplate.steps.at(i);
            step.stepId = QStringLiteral("s%1").arg(i + 1);
            step.confidence = kTemplateConfidence;
            plan->steps.append(step);
        }
        return true;
    }
    return false;
}

bool TaskPlanner::planWithBackend(const QString& goal, TaskPlan* plan)
{
    if (!m_backend) {
        return false;
    }
    if (!m_backend->isConfigured()) {
        qWarning() << "TaskPlanner: Backend" << m_backend->name()
                   << "is not configured, using rule-based planner";
        return false;
    }

    TaskPlan remotePlan;
    QString errorMessage;
    if (!m_backend->requestPlan(systemInstruction(), goal, m_remoteTimeoutMs,
                                &remotePlan, &errorMessage)) {
        qWarning() << "TaskPlanner: Remote planning failed:" << errorMessage;
        return false;
    }
    if (remotePlan.isEmpty()) {
        qWarning() << "TaskPlanner: Remote planner returned no steps";
        return false;
    }

    if (remotePlan.planId.isEmpty()) {
        remotePlan.planId = IdUtils::newPlanId();
    }
    if (remotePlan.goal.isEmpty()) {
        remotePlan.goal = goal;
    }
    *plan = remotePlan;
    return true;
}

TaskPlan TaskPlanner::planWithRules(const QString& goal) const
{
    TaskPlan plan;
    plan.planId = IdUtils::newPlanId();
    plan.goal = goal;

    const QString lowered = goal.toLower();
    if (lowered.contains(QLatin1String("export"))) {
        plan.steps.append(TaskStep::click(QStringLiteral("s1"), QStringLiteral("elm_file_menu"), 0.7));
        plan.steps.append(TaskStep::click(QStringLiteral("s2"), QStringLiteral("elm_export"), 0.7));
        plan.steps.append(TaskStep::wait(QStringLiteral("s3"), 1.0));
    } else if (lowered.contains(QLatin1String("click"))) {
        plan.steps.append(TaskStep::click(QStringLiteral("s1"), QStringLiteral("elm_target"), 0.8));
    } else if (lowered.contains(QLatin1String("type")) || lowered.contains(QLatin1String("enter"))) {
        plan.steps.append(TaskStep::type(QStringLiteral("s1"), QStringLiteral("user input"), 0.8));
    } else {
        plan.steps.append(TaskStep::wait(QStringLiteral("s1"), 1.0, 0.5));
    }
    return plan;
}

QStringList TaskPlanner::validatePlan(const TaskPlan& plan)
{
    QStringList errors;
    if (plan.steps.isEmpty()) {
        errors.append(QStringLiteral("Plan has no steps"));
    }

    QSet<QString> seenIds;
    for (int i = 0; i < plan.steps.size(); ++i) {
        const TaskStep& step = plan.steps.at(i);
        const QString label = step.stepId.isEmpty()
            ? QStringLiteral("Step %1").arg(i + 1)
            : QStringLiteral("Step %1").arg(step.stepId);

        if (step.stepId.isEmpty()) {
            errors.append(QStringLiteral("%1: Missing step_id").arg(label));
        } else if (seenIds.contains(step.stepId)) {
            errors.append(QStringLiteral("%1: Duplicate step_id").arg(label));
        } else {
            seenIds.insert(step.stepId);
        }

        if (step.action == StepAction::Click && !step.hasTarget()) {
            errors.append(QStringLiteral("%1: Click action missing target").arg(label));
        }
        if ((step.action == StepAction::Type || step.action == StepAction::KeyPress)
            && !step.hasKeys()) {
            errors.append(QStringLiteral("%1: %2 action missing keys")
                              .arg(label, stepActionName(step.action)));
        }
        if (step.delay < 0.0) {
            errors.append(QStringLiteral("%1: Invalid delay value").arg(label));
        }
        if (step.confidence && (*step.confidence < 0.0 || *step.confidence > 1.0)) {
            errors.append(QStringLiteral("%1: Confidence must be between 0 and 1").arg(label));
        }
    }
    return errors;
}

} // namespace Hawk
