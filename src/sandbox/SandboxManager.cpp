#include "sandbox/SandboxManager.h"

#include "sandbox/HttpRemoteVmProvider.h"
#include "sandbox/LocalProcessBackend.h"
#include "sandbox/NoneBackend.h"
#include "sandbox/RemoteVmBackend.h"
#include "settings/SandboxSettingsManager.h"

#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>

#include <exception>

namespace Hawk {

struct SandboxManager::Entry
{
    std::unique_ptr<ISandboxBackend> backend;
    SandboxBackendKind kind = SandboxBackendKind::None;
    QString id;
    QString display;
    double hourlyRate = 0.0;
    QElapsedTimer runtime;
    std::atomic<qint64> lastActivityMs{0};

    // Held while a call runs against the backend; guards retired.
    QMutex busy;
    bool retired = false;

    void touch() { lastActivityMs = QDateTime::currentMSecsSinceEpoch(); }
};

SandboxManager::SandboxManager()
    : m_costTracker(SandboxSettingsManager::instance().costLimit())
    , m_idleThresholdMs(static_cast<qint64>(SandboxSettingsManager::instance().idleTimeoutSeconds()) * 1000)
    , m_reaperIntervalMs(SandboxSettingsManager::instance().reaperIntervalSeconds() * 1000)
    , m_reaper([this]() { reclaimIdle(); })
{
}

SandboxManager::~SandboxManager()
{
    shutdown();
}

QVector<SandboxManager::BackendSlot> SandboxManager::defaultChain(const SandboxOptions& options)
{
    QVector<BackendSlot> chain;
    if (!options.sandboxed) {
        chain.append({SandboxBackendKind::None, []() {
            return std::make_unique<NoneBackend>();
        }});
        return chain;
    }

    if (options.preferRemoteVm) {
        chain.append({SandboxBackendKind::RemoteVm, []() {
            return std::make_unique<RemoteVmBackend>(std::make_unique<HttpRemoteVmProvider>(
                HttpRemoteVmProvider::configFromSettings()));
        }});
    }
    chain.append({SandboxBackendKind::LocalProcess, []() {
        return std::make_unique<LocalProcessBackend>();
    }});
    if (options.allowUnsandboxedFallback) {
        chain.append({SandboxBackendKind::None, []() {
            return std::make_unique<NoneBackend>();
        }});
    }
    return chain;
}

void SandboxManager::setBackendChain(const QVector<BackendSlot>& chain)
{
    m_chainOverride = chain;
}

QVector<SandboxManager::BackendSlot> SandboxManager::backendChain(const SandboxOptions& options) const
{
    return m_chainOverride.isEmpty() ? defaultChain(options) : m_chainOverride;
}

std::unique_ptr<ISandboxBackend> SandboxManager::startBackend(const BackendSlot& slot,
                                                             const SandboxOptions& options,
                                                             QString* errorMessage)
{
    const QString name = sandboxBackendName(slot.kind);
    std::unique_ptr<ISandboxBackend> backend;
    try {
        backend = slot.create ? slot.create() : nullptr;
        if (!backend) {
            *errorMessage = QStringLiteral("backend could not be created");
            return nullptr;
        }

        qInfo() << "SandboxManager: Starting" << name << "sandbox";
        if (backend->start(options, errorMessage)) {
            return backend;
        }
    } catch (const std::exception& e) {
        *errorMessage = QStringLiteral("exception: %1").arg(QString::fromLocal8Bit(e.what()));
    }

    qWarning() << "SandboxManager:" << name << "sandbox failed:" << *errorMessage;
    if (backend) {
        try {
            backend->stop();
        } catch (const std::exception& e) {
            qWarning() << "SandboxManager: Cleanup of" << name << "sandbox failed:" << e.what();
        }
    }
    return nullptr;
}

bool SandboxManager::start(const SandboxOptions& options, SandboxHandle* handle, QString* errorMessage)
{
    const QVector<BackendSlot> chain = backendChain(options);
    if (chain.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No sandbox backend is available for this run");
        }
        return false;
    }

    QStringList failures;
    for (const BackendSlot& slot : chain) {
        const QString name = sandboxBackendName(slot.kind);
        QString startError;
        std::unique_ptr<ISandboxBackend> backend = startBackend(slot, options, &startError);
        if (!backend) {
            failures.append(QStringLiteral("%1: %2").arg(name, startError));
            continue;
        }

        auto entry = std::make_shared<Entry>();
        entry->kind = backend->kind();
        entry->id = backend->backendId();
        entry->display = backend->display();
        entry->hourlyRate = backend->hourlyRate();
        entry->backend = std::move(backend);
        entry->runtime.start();
        entry->touch();

        quint64 token = 0;
        {
            QMutexLocker locker(&m_registryMutex);
            token = m_nextToken++;
            m_entries.insert(token, entry);
        }

        qInfo() << "SandboxManager: Sandbox ready:" << name << entry->id;
        if (handle) {
            *handle = SandboxHandle(token, entry->kind, entry->id, entry->display);
        }
        return true;
    }

    if (errorMessage) {
        *errorMessage = QStringLiteral("All sandbox backends failed: %1").arg(failures.join(QStringLiteral("; ")));
    }
    return false;
}

std::shared_ptr<SandboxManager::Entry> SandboxManager::lookup(const SandboxHandle& handle) const
{
    if (!handle.isValid()) {
        return nullptr;
    }
    QMutexLocker locker(&m_registryMutex);
    return m_entries.value(handle.m_token);
}

std::shared_ptr<SandboxManager::Entry> SandboxManager::take(quint64 token)
{
    QMutexLocker locker(&m_registryMutex);
    return m_entries.take(token);
}

ExecResult SandboxManager::exec(const SandboxHandle& handle, const QString& command, int timeoutMs)
{
    const std::shared_ptr<Entry> entry = lookup(handle);
    if (!entry) {
        return ExecResult::failure(QStringLiteral("Sandbox handle is not active"));
    }

    QMutexLocker busy(&entry->busy);
    if (entry->retired) {
        return ExecResult::failure(QStringLiteral("Sandbox %1 was reclaimed").arg(entry->id));
    }
    entry->touch();
    ExecResult result = entry->backend->exec(command, timeoutMs);
    entry->touch();
    return result;
}

bool SandboxManager::upload(const SandboxHandle& handle, const QString& localPath,
                            const QString& remotePath, QString* errorMessage)
{
    const std::shared_ptr<Entry> entry = lookup(handle);
    if (!entry) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Sandbox handle is not active");
        }
        return false;
    }
    if (!QFileInfo::exists(localPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Local file not found: %1").arg(localPath);
        }
        return false;
    }

    QMutexLocker busy(&entry->busy);
    if (entry->retired) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Sandbox %1 was reclaimed").arg(entry->id);
        }
        return false;
    }
    entry->touch();
    const bool ok = entry->backend->upload(localPath, remotePath, errorMessage);
    entry->touch();
    return ok;
}

bool SandboxManager::download(const SandboxHandle& handle, const QString& remotePath,
                              const QString& localPath, QString* errorMessage)
{
    const std::shared_ptr<Entry> entry = lookup(handle);
    if (!entry) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Sandbox handle is not active");
        }
        return false;
    }

    QMutexLocker busy(&entry->busy);
    if (entry->retired) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Sandbox %1 was reclaimed").arg(entry->id);
        }
        return false;
    }
    entry->touch();
    const bool ok = entry->backend->download(remotePath, localPath, errorMessage);
    entry->touch();
    return ok;
}

double SandboxManager::finalize(const std::shared_ptr<Entry>& entry, const char* reason)
{
    QMutexLocker busy(&entry->busy);
    entry->retired = true;
    entry->backend->stop();

    const double runtimeSeconds = entry->runtime.elapsed() / 1000.0;
    const double cost = CostTracker::hourlyCost(entry->hourlyRate, runtimeSeconds);
    if (entry->hourlyRate > 0.0) {
        m_costTracker.record(entry->id, cost);
    }
    qInfo() << "SandboxManager: Stopped" << sandboxBackendName(entry->kind) << "sandbox"
            << entry->id << "(" << reason << ") after" << runtimeSeconds << "s";
    return cost;
}

void SandboxManager::stop(SandboxHandle& handle)
{
    if (!handle.isValid()) {
        return;
    }

    const std::shared_ptr<Entry> entry = take(handle.m_token);
    handle.m_token = 0;
    if (!entry) {
        qDebug() << "SandboxManager: Sandbox" << handle.m_backendId << "was already released";
        return;
    }

    const double cost = finalize(entry, "stopped");
    if (entry->hourlyRate > 0.0) {
        handle.m_costEstimate = cost;
    }
}

bool SandboxManager::isActive(const SandboxHandle& handle) const
{
    return lookup(handle) != nullptr;
}

QVector<SandboxInfo> SandboxManager::list() const
{
    QVector<SandboxInfo> infos;
    QMutexLocker locker(&m_registryMutex);
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        const std::shared_ptr<Entry>& entry = it.value();
        SandboxInfo info;
        info.id = entry->id;
        info.backend = entry->kind;
        info.display = entry->display;
        info.runtimeSeconds = entry->runtime.elapsed() / 1000.0;
        info.costEstimate = CostTracker::hourlyCost(entry->hourlyRate, info.runtimeSeconds);
        info.lastActivity = QDateTime::fromMSecsSinceEpoch(entry->lastActivityMs);
        infos.append(info);
    }
    return infos;
}

int SandboxManager::activeCount() const
{
    QMutexLocker locker(&m_registryMutex);
    return m_entries.size();
}

int SandboxManager::reclaimIdle()
{
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const qint64 threshold = m_idleThresholdMs;

    QVector<std::shared_ptr<Entry>> idle;
    {
        QMutexLocker locker(&m_registryMutex);
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            const std::shared_ptr<Entry>& entry = it.value();
            if (now - entry->lastActivityMs > threshold && entry->busy.tryLock()) {
                entry->retired = true;
                entry->busy.unlock();
                idle.append(entry);
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const std::shared_ptr<Entry>& entry : idle) {
        qWarning() << "SandboxManager: Reclaiming idle sandbox" << entry->id;
        finalize(entry, "idle");
    }
    return idle.size();
}

void SandboxManager::startIdleReaper()
{
    startIdleReaper(m_reaperIntervalMs);
}

void SandboxManager::startIdleReaper(int intervalMs)
{
    m_reaper.start(intervalMs);
}

void SandboxManager::stopIdleReaper()
{
    m_reaper.stop();
}

void SandboxManager::setIdleThresholdMs(qint64 thresholdMs)
{
    m_idleThresholdMs = thresholdMs;
}

qint64 SandboxManager::idleThresholdMs() const
{
    return m_idleThresholdMs;
}

void SandboxManager::shutdown()
{
    m_reaper.stop();

    QVector<std::shared_ptr<Entry>> remaining;
    {
        QMutexLocker locker(&m_registryMutex);
        remaining = m_entries.values();
        m_entries.clear();
    }
    for (const std::shared_ptr<Entry>& entry : remaining) {
        finalize(entry, "shutdown");
    }
}

} // namespace Hawk
