#ifndef REMOTEVMBACKEND_H
#define REMOTEVMBACKEND_H

#include "sandbox/IRemoteVmProvider.h"
#include "sandbox/ISandboxBackend.h"

#include <QStringList>
#include <memory>

namespace Hawk {

/**
 * @brief Sandbox backed by a remote micro-VM.
 *
 * After spawning, outbound traffic is restricted to DNS, HTTP(S) and
 * established connections; Linux images also get an Xvfb display on :99.
 * A failure in either setup phase is logged and does not fail start().
 * A pinned image digest that disagrees with the recorded one fails start()
 * before anything is spawned.
 */
class RemoteVmBackend : public ISandboxBackend
{
public:
    static constexpr double kTtlHours = 6.0;
    static constexpr double kMaxTtlHours = 336.0;
    static constexpr double kBaseHourlyRate = 0.08;
    static constexpr double kGpuHourlyRate = 0.60;
    static constexpr double kLargeImageMultiplier = 1.5;
    static constexpr const char* kDisplay = ":99";

    explicit RemoteVmBackend(std::unique_ptr<IRemoteVmProvider> provider);
    ~RemoteVmBackend() override;

    SandboxBackendKind kind() const override { return SandboxBackendKind::RemoteVm; }
    bool start(const SandboxOptions& options, QString* errorMessage) override;
    ExecResult exec(const QString& command, int timeoutMs) override;
    bool upload(const QString& localPath, const QString& remotePath, QString* errorMessage) override;
    bool download(const QString& remotePath, const QString& localPath, QString* errorMessage) override;
    void stop() override;
    QString backendId() const override { return m_vmId; }
    QString display() const override { return m_display; }
    double hourlyRate() const override { return m_hourlyRate; }

    QString image() const { return m_image; }
    bool hasGpu() const { return m_gpu; }

    static QString imageForPlatform(const QString& platform);
    static double hourlyRateFor(const QString& image, bool gpu);
    static double cappedTtlHours(double hours);
    static bool verifyImageDigest(const QString& image, const QString& digest, QString* errorMessage);
    static QStringList egressRules();
    static QStringList displaySetupCommands();

private:
    void applyEgressRules();
    void setupVirtualDisplay();

    std::unique_ptr<IRemoteVmProvider> m_provider;
    QString m_vmId;
    QString m_image;
    QString m_display;
    double m_hourlyRate = 0.0;
    bool m_gpu = false;
};

} // namespace Hawk

#endif // REMOTEVMBACKEND_H
