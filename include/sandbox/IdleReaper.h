#ifndef IDLEREAPER_H
#define IDLEREAPER_H

#include <QFuture>
#include <QMutex>
#include <QWaitCondition>
#include <functional>

namespace Hawk {

/**
 * @brief Runs a sweep callback periodically on a pool thread.
 *
 * stop() wakes the loop and waits for the current sweep to finish.
 */
class IdleReaper
{
public:
    using Sweep = std::function<void()>;

    explicit IdleReaper(Sweep sweep);
    ~IdleReaper();

    IdleReaper(const IdleReaper&) = delete;
    IdleReaper& operator=(const IdleReaper&) = delete;

    void start(int intervalMs);
    void stop();
    bool isRunning() const;

private:
    void run();

    Sweep m_sweep;
    QFuture<void> m_future;
    mutable QMutex m_mutex;
    QWaitCondition m_wake;
    int m_intervalMs = 60000;
    bool m_stopRequested = false;
    bool m_running = false;
};

} // namespace Hawk

#endif // IDLEREAPER_H
