#ifndef SANDBOXCAPTUREENGINE_H
#define SANDBOXCAPTUREENGINE_H

#include "ICaptureEngine.h"

#include <QStringList>

namespace Hawk {

class ICommandRunner;

/**
 * @brief Captures the display of a sandbox through its command contract
 *
 * Runs ImageMagick's import against the root window, pipes the PNG through
 * base64 and decodes the output here. Virtual displays have one monitor.
 */
class SandboxCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    static constexpr int kCaptureTimeoutMs = 15000;

    explicit SandboxCaptureEngine(ICommandRunner *runner, int timeoutMs = kCaptureTimeoutMs,
                                  QObject *parent = nullptr);
    ~SandboxCaptureEngine() override;

    bool setRegion(const QRect &region) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override;
    QImage captureFrame() override;
    QString engineName() const override { return QStringLiteral("Sandbox import"); }
    int timeoutMs() const { return m_timeoutMs; }

    static QStringList captureCommand(const QRect &region);
    static QImage decodeFrame(const QByteArray &base64Png);

private:
    ICommandRunner *m_runner;
    int m_timeoutMs;
    bool m_running = false;
};

} // namespace Hawk

#endif // SANDBOXCAPTUREENGINE_H
