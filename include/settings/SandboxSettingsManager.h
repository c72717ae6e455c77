#ifndef SANDBOXSETTINGSMANAGER_H
#define SANDBOXSETTINGSMANAGER_H

#include <QByteArray>
#include <QString>

/**
 * @brief Persistent sandbox configuration.
 *
 * Remote VM credentials and the reaper thresholds can be overridden through
 * E2B_API_KEY, E2B_IDLE_TIMEOUT_SECONDS and E2B_COST_LIMIT. GPU VMs are
 * only granted when E2B_GPU_BETA_ENABLED is set, and the expected digest of
 * an image comes from E2B_IMAGE_SHA256_<IMAGE>.
 */
class SandboxSettingsManager
{
public:
    static SandboxSettingsManager& instance();

    bool isSandboxEnabled() const;
    void setSandboxEnabled(bool enabled);

    bool preferRemoteVm() const;
    void setPreferRemoteVm(bool prefer);

    bool allowUnsandboxedFallback() const;
    void setAllowUnsandboxedFallback(bool allow);

    QString remoteVmEndpoint() const;
    void setRemoteVmEndpoint(const QString& endpoint);

    QString remoteVmApiKey() const;
    void setRemoteVmApiKey(const QString& apiKey);

    int idleTimeoutSeconds() const;
    void setIdleTimeoutSeconds(int seconds);

    int reaperIntervalSeconds() const;
    void setReaperIntervalSeconds(int seconds);

    double costLimit() const;
    void setCostLimit(double limit);

    bool gpuRequested() const;
    void setGpuRequested(bool requested);

    bool gpuBetaEnabled() const;
    void setGpuBetaEnabled(bool enabled);

    // Clamped to (0, kMaxVmTtlHours].
    double vmTtlHours() const;
    void setVmTtlHours(double hours);

    // Digest a run pins its image to; empty means unpinned.
    QString imageDigest() const;
    void setImageDigest(const QString& digest);

    // Digest an image is known to have; empty when none is recorded.
    QString expectedImageDigest(const QString& image) const;
    void setExpectedImageDigest(const QString& image, const QString& digest);
    static QByteArray imageDigestVariable(const QString& image);

    static constexpr bool kDefaultSandboxEnabled = true;
    static constexpr bool kDefaultPreferRemoteVm = true;
    static constexpr bool kDefaultAllowUnsandboxedFallback = false;
    static constexpr const char* kDefaultRemoteVmEndpoint = "https://api.e2b.dev";
    static constexpr int kDefaultIdleTimeoutSeconds = 900;
    static constexpr int kDefaultReaperIntervalSeconds = 60;
    static constexpr double kDefaultCostLimit = 100.0;
    static constexpr double kDefaultVmTtlHours = 6.0;
    static constexpr double kMaxVmTtlHours = 336.0;

private:
    SandboxSettingsManager() = default;
    ~SandboxSettingsManager() = default;
    SandboxSettingsManager(const SandboxSettingsManager&) = delete;
    SandboxSettingsManager& operator=(const SandboxSettingsManager&) = delete;

    static constexpr const char* kSettingsKeySandboxEnabled = "sandbox/enabled";
    static constexpr const char* kSettingsKeyPreferRemoteVm = "sandbox/preferRemoteVm";
    static constexpr const char* kSettingsKeyAllowUnsandboxed = "sandbox/allowUnsandboxedFallback";
    static constexpr const char* kSettingsKeyRemoteVmEndpoint = "sandbox/remoteVmEndpoint";
    static constexpr const char* kSettingsKeyRemoteVmApiKey = "sandbox/remoteVmApiKey";
    static constexpr const char* kSettingsKeyIdleTimeoutSeconds = "sandbox/idleTimeoutSeconds";
    static constexpr const char* kSettingsKeyReaperIntervalSeconds = "sandbox/reaperIntervalSeconds";
    static constexpr const char* kSettingsKeyCostLimit = "sandbox/costLimit";
    static constexpr const char* kSettingsKeyGpuRequested = "sandbox/gpu";
    static constexpr const char* kSettingsKeyGpuBetaEnabled = "sandbox/gpuBetaEnabled";
    static constexpr const char* kSettingsKeyVmTtlHours = "sandbox/vmTtlHours";
    static constexpr const char* kSettingsKeyImageDigest = "sandbox/imageDigest";
    static constexpr const char* kSettingsGroupExpectedDigests = "sandbox/expectedImageDigests";
};

#endif // SANDBOXSETTINGSMANAGER_H
