#include "sandbox/CostTracker.h"

#include <QDebug>

namespace Hawk {

CostTracker::CostTracker(double limit)
    : m_limit(limit)
{
}

bool CostTracker::record(const QString& sandboxId, double cost)
{
    QMutexLocker locker(&m_mutex);
    if (m_costs.contains(sandboxId)) {
        return false;
    }

    m_costs.insert(sandboxId, cost);
    m_total += cost;
    qInfo() << "CostTracker: Sandbox" << sandboxId << "cost" << cost
            << "total" << m_total;
    if (m_total > m_limit) {
        qWarning() << "CostTracker: Cost limit exceeded:" << m_total << ">" << m_limit;
    }
    return true;
}

double CostTracker::total() const
{
    QMutexLocker locker(&m_mutex);
    return m_total;
}

double CostTracker::limit() const
{
    QMutexLocker locker(&m_mutex);
    return m_limit;
}

void CostTracker::setLimit(double limit)
{
    QMutexLocker locker(&m_mutex);
    m_limit = limit;
}

bool CostTracker::isOverLimit() const
{
    QMutexLocker locker(&m_mutex);
    return m_total > m_limit;
}

bool CostTracker::hasRecord(const QString& sandboxId) const
{
    QMutexLocker locker(&m_mutex);
    return m_costs.contains(sandboxId);
}

int CostTracker::recordCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_costs.size();
}

double CostTracker::hourlyCost(double hourlyRate, double runtimeSeconds)
{
    return (runtimeSeconds / 3600.0) * hourlyRate;
}

} // namespace Hawk
