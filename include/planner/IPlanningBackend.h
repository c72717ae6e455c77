#ifndef IPLANNINGBACKEND_H
#define IPLANNINGBACKEND_H

#include "planner/TaskTypes.h"

#include <QString>

namespace Hawk {

/**
 * @brief Remote model that turns a goal into a TaskPlan.
 *
 * Implementations block until the plan arrives or timeoutMs elapses. Any
 * failure is reported through the return value; the planner then falls
 * back to its rules.
 */
class IPlanningBackend
{
public:
    virtual ~IPlanningBackend() = default;

    virtual QString name() const = 0;

    /**
     * @brief Whether the backend has what it needs (endpoint, credentials).
     */
    virtual bool isConfigured() const = 0;

    /**
     * @brief Request a plan.
     * @param systemInstruction Fixed instruction describing the plan schema
     * @param goal Natural language goal
     * @param timeoutMs Upper bound for the whole request
     * @param plan Receives the parsed plan on success
     * @param errorMessage Receives the failure reason
     * @return true when a plan was parsed
     */
    virtual bool requestPlan(const QString& systemInstruction,
                             const QString& goal,
                             int timeoutMs,
                             TaskPlan* plan,
                             QString* errorMessage) = 0;
};

} // namespace Hawk

#endif // IPLANNINGBACKEND_H
