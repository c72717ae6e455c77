#ifndef SANDBOXMANAGER_H
#define SANDBOXMANAGER_H

#include "sandbox/CostTracker.h"
#include "sandbox/IdleReaper.h"
#include "sandbox/ISandboxBackend.h"
#include "sandbox/SandboxHandle.h"
#include "sandbox/SandboxTypes.h"

#include <QHash>
#include <QMutex>
#include <QVector>
#include <atomic>
#include <functional>
#include <memory>

namespace Hawk {

/**
 * @brief Acquires and releases isolated environments.
 *
 * start() walks an ordered chain of backend factories until one backend
 * comes up. Every live sandbox is kept in a registry owned by this object;
 * handles refer to registry entries and become inert once the entry is
 * stopped or reclaimed by the idle reaper.
 *
 * Each entry has a busy lock held for the duration of exec/transfer calls.
 * The reaper only try-locks it, so a sandbox with a call in flight is never
 * reclaimed.
 */
class SandboxManager
{
public:
    using BackendFactory = std::function<std::unique_ptr<ISandboxBackend>()>;

    struct BackendSlot {
        SandboxBackendKind kind;
        BackendFactory create;
    };

    static constexpr int kDefaultExecTimeoutMs = 30000;

    SandboxManager();
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Acquire a sandbox from the first backend in the chain that starts.
     * @param options Platform, isolation and fallback preferences
     * @param handle Receives the handle on success
     * @param errorMessage Receives every backend's failure when the chain is exhausted
     * @return true if a backend started
     */
    bool start(const SandboxOptions& options, SandboxHandle* handle, QString* errorMessage = nullptr);

    ExecResult exec(const SandboxHandle& handle, const QString& command,
                    int timeoutMs = kDefaultExecTimeoutMs);

    bool upload(const SandboxHandle& handle, const QString& localPath,
                const QString& remotePath, QString* errorMessage = nullptr);
    bool download(const SandboxHandle& handle, const QString& remotePath,
                  const QString& localPath, QString* errorMessage = nullptr);

    /**
     * @brief Release the sandbox and invalidate the handle.
     *
     * A no-op for handles that are already invalid or whose sandbox was
     * reclaimed. Metered sandboxes are billed here, once.
     */
    void stop(SandboxHandle& handle);

    bool isActive(const SandboxHandle& handle) const;
    QVector<SandboxInfo> list() const;
    int activeCount() const;

    // Stops every sandbox idle for longer than the threshold. Returns the
    // number reclaimed.
    int reclaimIdle();

    void startIdleReaper();
    void startIdleReaper(int intervalMs);
    void stopIdleReaper();

    void setIdleThresholdMs(qint64 thresholdMs);
    qint64 idleThresholdMs() const;

    // Stops the reaper and every remaining sandbox.
    void shutdown();

    CostTracker& costTracker() { return m_costTracker; }
    const CostTracker& costTracker() const { return m_costTracker; }

    // Replaces the chain derived from options; an empty list restores it.
    void setBackendChain(const QVector<BackendSlot>& chain);
    QVector<BackendSlot> backendChain(const SandboxOptions& options) const;
    static QVector<BackendSlot> defaultChain(const SandboxOptions& options);

private:
    struct Entry;

    // One chain attempt. Exceptions from the factory or the backend are
    // reported as a failure of that attempt.
    std::unique_ptr<ISandboxBackend> startBackend(const BackendSlot& slot, const SandboxOptions& options,
                                                  QString* errorMessage);

    std::shared_ptr<Entry> lookup(const SandboxHandle& handle) const;
    std::shared_ptr<Entry> take(quint64 token);
    double finalize(const std::shared_ptr<Entry>& entry, const char* reason);

    mutable QMutex m_registryMutex;
    QHash<quint64, std::shared_ptr<Entry>> m_entries;
    quint64 m_nextToken = 1;

    QVector<BackendSlot> m_chainOverride;
    CostTracker m_costTracker;
    std::atomic<qint64> m_idleThresholdMs;
    int m_reaperIntervalMs;
    IdleReaper m_reaper;
};

} // namespace Hawk

#endif // SANDBOXMANAGER_H
