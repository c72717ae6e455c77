#include "sandbox/RemoteVmBackend.h"

#include "settings/SandboxSettingsManager.h"
#include "utils/AtomicFileWriter.h"

#include <QDebug>
#include <QFile>
#include <QJsonObject>

namespace Hawk {

namespace {

constexpr int kSetupCommandTimeoutMs = 300000;

} // namespace

RemoteVmBackend::RemoteVmBackend(std::unique_ptr<IRemoteVmProvider> provider)
    : m_provider(std::move(provider))
{
}

RemoteVmBackend::~RemoteVmBackend()
{
    stop();
}

QString RemoteVmBackend::imageForPlatform(const QString& platform)
{
    const QString normalized = platform.trimmed().toLower();
    if (normalized == QLatin1String("linux")) {
        return QStringLiteral("ubuntu-22-04-browser");
    }
    if (normalized == QLatin1String("macos")) {
        return QStringLiteral("macos-14-browser");
    }
    return QStringLiteral("windows-11-browser");
}

double RemoteVmBackend::hourlyRateFor(const QString& image, bool gpu)
{
    double rate = gpu ? kGpuHourlyRate : kBaseHourlyRate;
    if (image.contains(QLatin1String("large"))) {
        rate *= kLargeImageMultiplier;
    }
    return rate;
}

double RemoteVmBackend::cappedTtlHours(double hours)
{
    if (hours <= 0.0) {
        return kTtlHours;
    }
    return qMin(hours, kMaxTtlHours);
}

bool RemoteVmBackend::verifyImageDigest(const QString& image, const QString& digest,
                                        QString* errorMessage)
{
    if (digest.isEmpty()) {
        return true;
    }
    const QString expected = SandboxSettingsManager::instance().expectedImageDigest(image);
    if (expected.isEmpty() || expected.compare(digest.trimmed(), Qt::CaseInsensitive) == 0) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = QStringLiteral("Image digest mismatch for %1").arg(image);
    }
    return false;
}

QStringList RemoteVmBackend::egressRules()
{
    return {
        QStringLiteral("iptables -P OUTPUT DROP"),
        QStringLiteral("iptables -A OUTPUT -o lo -j ACCEPT"),
        QStringLiteral("iptables -A OUTPUT -p udp --dport 53 -j ACCEPT"),
        QStringLiteral("iptables -A OUTPUT -p tcp --dport 53 -j ACCEPT"),
        QStringLiteral("iptables -A OUTPUT -p tcp --dport 80 -j ACCEPT"),
        QStringLiteral("iptables -A OUTPUT -p tcp --dport 443 -j ACCEPT"),
        QStringLiteral("iptables -A OUTPUT -m state --state ESTABLISHED,RELATED -j ACCEPT"),
    };
}

QStringList RemoteVmBackend::displaySetupCommands()
{
    return {
        QStringLiteral("apt-get update"),
        QStringLiteral("apt-get install -y xvfb x11vnc imagemagick xdotool"),
        QStringLiteral("nohup Xvfb :99 -screen 0 1920x1080x24 >/dev/null 2>&1 &"),
    };
}

bool RemoteVmBackend::start(const SandboxOptions& options, QString* errorMessage)
{
    if (!m_provider || !m_provider->isConfigured()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Remote VM provider is not configured");
        }
        return false;
    }

    RemoteVmSpec spec;
    spec.image = imageForPlatform(options.platform);
    if (!verifyImageDigest(spec.image, options.imageDigest, errorMessage)) {
        qWarning() << "RemoteVmBackend: Refusing" << spec.image << "with digest" << options.imageDigest;
        return false;
    }
    spec.ttlHours = cappedTtlHours(options.vmTtlHours);
    spec.gpu = options.gpu;
    if (spec.gpu && !SandboxSettingsManager::instance().gpuBetaEnabled()) {
        qWarning() << "RemoteVmBackend: GPU requested but E2B_GPU_BETA_ENABLED is not set";
        spec.gpu = false;
    }
    spec.metadata = QJsonObject{
        {QStringLiteral("purpose"), QStringLiteral("hawk_automation")},
        {QStringLiteral("platform"), options.platform},
    };
    if (!options.imageDigest.isEmpty()) {
        spec.metadata.insert(QStringLiteral("image_digest"), options.imageDigest);
    }
    spec.spawnTimeoutMs = options.startTimeoutMs;

    QString vmId;
    if (!m_provider->spawn(spec, &vmId, errorMessage)) {
        return false;
    }

    m_vmId = vmId;
    m_image = spec.image;
    m_gpu = spec.gpu;
    m_hourlyRate = hourlyRateFor(m_image, m_gpu);
    qInfo() << "RemoteVmBackend: Started VM" << m_vmId << "with" << m_image
            << (m_gpu ? "(gpu)" : "") << "ttl" << spec.ttlHours << "h";

    applyEgressRules();
    if (options.platform.compare(QLatin1String("linux"), Qt::CaseInsensitive) == 0) {
        setupVirtualDisplay();
    }
    return true;
}

void RemoteVmBackend::applyEgressRules()
{
    for (const QString& rule : egressRules()) {
        const ExecResult result = m_provider->exec(m_vmId, rule, kSetupCommandTimeoutMs);
        if (!result.succeeded()) {
            qWarning() << "RemoteVmBackend: Egress rule failed:" << rule << result.errorSummary();
        }
    }
}

void RemoteVmBackend::setupVirtualDisplay()
{
    for (const QString& command : displaySetupCommands()) {
        const ExecResult result = m_provider->exec(m_vmId, command, kSetupCommandTimeoutMs);
        if (!result.succeeded()) {
            qWarning() << "RemoteVmBackend: Display setup command failed:" << command
                       << result.errorSummary();
        }
    }
    m_display = QString::fromLatin1(kDisplay);
}

ExecResult RemoteVmBackend::exec(const QString& command, int timeoutMs)
{
    if (m_vmId.isEmpty()) {
        return ExecResult::failure(QStringLiteral("Remote VM is not running"));
    }
    const QString wrapped = m_display.isEmpty()
        ? command
        : QStringLiteral("export DISPLAY=%1; %2").arg(m_display, command);
    return m_provider->exec(m_vmId, wrapped, timeoutMs);
}

bool RemoteVmBackend::upload(const QString& localPath, const QString& remotePath, QString* errorMessage)
{
    if (m_vmId.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Remote VM is not running");
        }
        return false;
    }

    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot read %1: %2").arg(localPath, file.errorString());
        }
        return false;
    }
    return m_provider->upload(m_vmId, remotePath, file.readAll(), errorMessage);
}

bool RemoteVmBackend::download(const QString& remotePath, const QString& localPath, QString* errorMessage)
{
    if (m_vmId.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Remote VM is not running");
        }
        return false;
    }

    QByteArray content;
    if (!m_provider->download(m_vmId, remotePath, &content, errorMessage)) {
        return false;
    }

    AtomicFileWriter::Error writeError;
    if (!AtomicFileWriter::writeBytes(content, localPath, &writeError)) {
        if (errorMessage) {
            *errorMessage = writeError.message;
        }
        return false;
    }
    return true;
}

void RemoteVmBackend::stop()
{
    if (m_vmId.isEmpty()) {
        return;
    }

    QString errorMessage;
    if (!m_provider->kill(m_vmId, &errorMessage)) {
        qWarning() << "RemoteVmBackend: Failed to kill VM" << m_vmId << ":" << errorMessage;
    } else {
        qInfo() << "RemoteVmBackend: Killed VM" << m_vmId;
    }
    m_vmId.clear();
    m_display.clear();
}

} // namespace Hawk
