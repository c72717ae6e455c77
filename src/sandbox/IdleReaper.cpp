#include "sandbox/IdleReaper.h"

#include <QDebug>
#include <QtConcurrent>

namespace Hawk {

IdleReaper::IdleReaper(Sweep sweep)
    : m_sweep(std::move(sweep))
{
}

IdleReaper::~IdleReaper()
{
    stop();
}

void IdleReaper::start(int intervalMs)
{
    QMutexLocker locker(&m_mutex);
    if (m_running) {
        return;
    }
    m_intervalMs = qMax(1, intervalMs);
    m_stopRequested = false;
    m_running = true;
    m_future = QtConcurrent::run([this]() {
        run();
    });
    qDebug() << "IdleReaper: Started with interval" << m_intervalMs << "ms";
}

void IdleReaper::stop()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_running) {
            return;
        }
        m_stopRequested = true;
        m_wake.wakeAll();
    }
    m_future.waitForFinished();

    QMutexLocker locker(&m_mutex);
    m_running = false;
    qDebug() << "IdleReaper: Stopped";
}

bool IdleReaper::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_running;
}

void IdleReaper::run()
{
    QMutexLocker locker(&m_mutex);
    while (!m_stopRequested) {
        m_wake.wait(&m_mutex, static_cast<unsigned long>(m_intervalMs));
        if (m_stopRequested) {
            break;
        }
        locker.unlock();
        m_sweep();
        locker.relock();
    }
}

} // namespace Hawk
