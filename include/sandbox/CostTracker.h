#ifndef COSTTRACKER_H
#define COSTTRACKER_H

#include <QHash>
#include <QMutex>
#include <QString>

namespace Hawk {

/**
 * @brief Accumulates the final cost of stopped sandboxes.
 *
 * Each sandbox id is billed once; a second record for the same id is
 * ignored. Thread-safe.
 */
class CostTracker
{
public:
    explicit CostTracker(double limit = 100.0);

    // Returns false when the id was already billed.
    bool record(const QString& sandboxId, double cost);

    double total() const;
    double limit() const;
    void setLimit(double limit);
    bool isOverLimit() const;
    bool hasRecord(const QString& sandboxId) const;
    int recordCount() const;

    static double hourlyCost(double hourlyRate, double runtimeSeconds);

private:
    mutable QMutex m_mutex;
    QHash<QString, double> m_costs;
    double m_total = 0.0;
    double m_limit;
};

} // namespace Hawk

#endif // COSTTRACKER_H
