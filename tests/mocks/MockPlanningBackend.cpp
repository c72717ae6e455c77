#include "MockPlanningBackend.h"

bool MockPlanningBackend::requestPlan(const QString& systemInstruction, const QString& goal,
                                      int timeoutMs, Hawk::TaskPlan* plan, QString* errorMessage)
{
    ++m_requests;
    m_lastGoal = goal;
    m_lastInstruction = systemInstruction;
    m_lastTimeoutMs = timeoutMs;

    if (m_fails) {
        if (errorMessage) {
            *errorMessage = m_failure;
        }
        return false;
    }
    *plan = m_plan;
    return true;
}
