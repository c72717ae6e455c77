#ifndef ACTIONLOGGER_H
#define ACTIONLOGGER_H

#include "monitoring/TraceTypes.h"

#include <QDateTime>
#include <QString>
#include <QVector>

namespace Hawk {

struct ScreenshotPayload;

/**
 * @brief Persists traces, event logs and step screenshots.
 *
 * Layout under the log directory:
 *   <session_id>/trace_<trace_id>_<yyyyMMdd_HHmmss_zzz>.json
 *   <session_id>/events.jsonl
 *   <session_id>/screenshots/screenshot_<step_id>_<yyyyMMdd_HHmmss_zzz>.png
 *
 * Trace and screenshot files are written atomically and never replace an
 * existing file.
 */
class ActionLogger
{
public:
    // An empty directory selects TraceSettingsManager::logDirectory().
    explicit ActionLogger(const QString& logDirectory = QString());

    QString logDirectory() const { return m_logDirectory; }
    QString sessionDirectory(const QString& sessionId) const;

    /**
     * @brief Save a trace with a _metadata block.
     * @param trace Trace to save
     * @param savedPath Receives the written file path
     * @param errorMessage Receives the reason on failure
     * @return true if the file was written
     */
    bool saveTrace(const ActionTrace& trace, QString* savedPath = nullptr,
                   QString* errorMessage = nullptr) const;

    // Loads the most recently saved file for trace_id from any session.
    bool loadTrace(const QString& traceId, ActionTrace* trace,
                   QString* errorMessage = nullptr) const;

    // Newest first. An empty session id lists every session.
    QVector<TraceSummary> listTraces(const QString& sessionId = QString()) const;

    bool logEvent(const QString& sessionId, const ActionEvent& event,
                  QString* errorMessage = nullptr) const;

    bool saveScreenshot(const ScreenshotPayload& payload, const QString& stepId,
                        QString* savedPath = nullptr, QString* errorMessage = nullptr) const;

    static QString timestampSuffix(const QDateTime& time);
    static QString traceFileName(const QString& traceId, const QDateTime& savedAt);

private:
    QStringList traceFiles(const QString& directory, const QString& pattern) const;
    static bool readTraceFile(const QString& path, QJsonObject* json, QString* errorMessage);

    QString m_logDirectory;
};

} // namespace Hawk

#endif // ACTIONLOGGER_H
