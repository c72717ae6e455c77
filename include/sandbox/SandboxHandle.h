#ifndef SANDBOXHANDLE_H
#define SANDBOXHANDLE_H

#include "sandbox/SandboxTypes.h"

#include <QString>
#include <optional>

namespace Hawk {

class SandboxManager;

/**
 * @brief Move-only reference to a sandbox acquired from SandboxManager.
 *
 * Only SandboxManager::start() produces valid handles. SandboxManager::stop()
 * invalidates the handle and records the final cost on it.
 */
class SandboxHandle
{
public:
    SandboxHandle() = default;
    SandboxHandle(SandboxHandle&& other) noexcept;
    SandboxHandle& operator=(SandboxHandle&& other) noexcept;
    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    bool isValid() const { return m_token != 0; }
    SandboxBackendKind backend() const { return m_backend; }
    QString backendId() const { return m_backendId; }
    QString display() const { return m_display; }

    // Set once the sandbox was stopped by a metered backend.
    std::optional<double> costEstimate() const { return m_costEstimate; }

private:
    friend class SandboxManager;

    SandboxHandle(quint64 token, SandboxBackendKind backend,
                  const QString& backendId, const QString& display);

    quint64 m_token = 0;
    SandboxBackendKind m_backend = SandboxBackendKind::None;
    QString m_backendId;
    QString m_display;
    std::optional<double> m_costEstimate;
};

} // namespace Hawk

#endif // SANDBOXHANDLE_H
