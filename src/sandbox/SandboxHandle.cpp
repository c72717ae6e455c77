#include "sandbox/SandboxHandle.h"

#include <utility>

namespace Hawk {

SandboxHandle::SandboxHandle(quint64 token, SandboxBackendKind backend,
                             const QString& backendId, const QString& display)
    : m_token(token)
    , m_backend(backend)
    , m_backendId(backendId)
    , m_display(display)
{
}

SandboxHandle::SandboxHandle(SandboxHandle&& other) noexcept
    : m_token(std::exchange(other.m_token, 0))
    , m_backend(other.m_backend)
    , m_backendId(std::move(other.m_backendId))
    , m_display(std::move(other.m_display))
    , m_costEstimate(std::exchange(other.m_costEstimate, std::nullopt))
{
}

SandboxHandle& SandboxHandle::operator=(SandboxHandle&& other) noexcept
{
    if (this != &other) {
        m_token = std::exchange(other.m_token, 0);
        m_backend = other.m_backend;
        m_backendId = std::move(other.m_backendId);
        m_display = std::move(other.m_display);
        m_costEstimate = std::exchange(other.m_costEstimate, std::nullopt);
    }
    return *this;
}

} // namespace Hawk
