#ifndef ISANDBOXBACKEND_H
#define ISANDBOXBACKEND_H

#include "sandbox/SandboxTypes.h"

#include <QString>

namespace Hawk {

/**
 * @brief One isolation strategy in the sandbox fallback chain.
 *
 * A backend instance owns at most one environment: start() creates it,
 * stop() tears it down. SandboxManager serializes calls per instance.
 */
class ISandboxBackend
{
public:
    virtual ~ISandboxBackend() = default;

    virtual SandboxBackendKind kind() const = 0;

    /**
     * @brief Acquire the environment.
     * @param options Requested platform and timeouts
     * @param errorMessage Receives the reason when acquisition fails
     * @return true when the environment is ready for exec()
     */
    virtual bool start(const SandboxOptions& options, QString* errorMessage) = 0;

    /**
     * @brief Run a shell command inside the environment.
     */
    virtual ExecResult exec(const QString& command, int timeoutMs) = 0;

    virtual bool upload(const QString& localPath, const QString& remotePath,
                        QString* errorMessage) = 0;
    virtual bool download(const QString& remotePath, const QString& localPath,
                          QString* errorMessage) = 0;

    /**
     * @brief Tear the environment down. Safe to call more than once.
     */
    virtual void stop() = 0;

    // Identifier of the environment once started (VM id, display, ...).
    virtual QString backendId() const = 0;

    // X display inside the environment, empty when there is none.
    virtual QString display() const { return QString(); }

    // Cost per hour of runtime; 0 for unmetered backends.
    virtual double hourlyRate() const { return 0.0; }
};

} // namespace Hawk

#endif // ISANDBOXBACKEND_H
