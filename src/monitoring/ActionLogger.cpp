#include "monitoring/ActionLogger.h"

#include "capture/ScreenCapture.h"
#include "settings/TraceSettingsManager.h"
#include "utils/AtomicFileWriter.h"
#include "version.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <algorithm>

namespace Hawk {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QString sanitizeComponent(const QString& value)
{
    QString sanitized = value;
    static const QString kForbidden = QStringLiteral("/\\:*?\"<>|");
    for (QChar& ch : sanitized) {
        if (kForbidden.contains(ch) || ch.isSpace()) {
            ch = QLatin1Char('_');
        }
    }
    return sanitized;
}

} // namespace

ActionLogger::ActionLogger(const QString& logDirectory)
    : m_logDirectory(QDir::cleanPath(logDirectory.isEmpty()
                                         ? TraceSettingsManager::instance().logDirectory()
                                         : logDirectory))
{
}

QString ActionLogger::sessionDirectory(const QString& sessionId) const
{
    return QDir(m_logDirectory).filePath(sanitizeComponent(sessionId));
}

QString ActionLogger::timestampSuffix(const QDateTime& time)
{
    return time.toString(QStringLiteral("yyyyMMdd_HHmmss_zzz"));
}

QString ActionLogger::traceFileName(const QString& traceId, const QDateTime& savedAt)
{
    return QStringLiteral("trace_%1_%2.json").arg(sanitizeComponent(traceId), timestampSuffix(savedAt));
}

bool ActionLogger::saveTrace(const ActionTrace& trace, QString* savedPath, QString* errorMessage) const
{
    if (trace.traceId().isEmpty() || trace.sessionId().isEmpty()) {
        setError(errorMessage, QStringLiteral("Trace needs a trace id and a session id"));
        return false;
    }

    const QDateTime savedAt = QDateTime::currentDateTime();
    QJsonObject json = trace.toJson();
    QJsonObject metadata;
    metadata["version"] = QStringLiteral(HAWK_TRACE_FORMAT_VERSION);
    metadata["session_id"] = trace.sessionId();
    metadata["saved_at"] = savedAt.toString(Qt::ISODateWithMs);
    json["_metadata"] = metadata;

    const QString path = AtomicFileWriter::uniquePath(
        QDir(sessionDirectory(trace.sessionId())).filePath(traceFileName(trace.traceId(), savedAt)));

    AtomicFileWriter::Error writeError;
    if (!AtomicFileWriter::writeBytes(QJsonDocument(json).toJson(QJsonDocument::Indented), path,
                                      &writeError)) {
        qWarning() << "ActionLogger: Failed to save trace" << trace.traceId() << "("
                   << writeError.stage << "):" << writeError.message;
        setError(errorMessage, QStringLiteral("Failed to save trace: %1").arg(writeError.message));
        return false;
    }

    qInfo() << "ActionLogger: Saved trace to" << path;
    if (savedPath) {
        *savedPath = path;
    }
    return true;
}

bool ActionLogger::readTraceFile(const QString& path, QJsonObject* json, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorMessage, QStringLiteral("Invalid trace file %1: %2")
                                   .arg(path, parseError.errorString()));
        return false;
    }

    *json = doc.object();
    return true;
}

QStringList ActionLogger::traceFiles(const QString& directory, const QString& pattern) const
{
    QStringList files;
    if (!QFileInfo(directory).isDir()) {
        return files;
    }
    QDirIterator it(directory, QStringList{pattern}, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(it.next());
    }
    return files;
}

bool ActionLogger::loadTrace(const QString& traceId, ActionTrace* trace, QString* errorMessage) const
{
    if (traceId.isEmpty()) {
        setError(errorMessage, QStringLiteral("Empty trace id"));
        return false;
    }

    const QString pattern = QStringLiteral("trace_%1_*.json").arg(sanitizeComponent(traceId));
    QString newestPath;
    QJsonObject newestJson;
    QString newestSavedAt;

    for (const QString& path : traceFiles(m_logDirectory, pattern)) {
        QJsonObject json;
        QString readError;
        if (!readTraceFile(path, &json, &readError)) {
            qWarning() << "ActionLogger:" << readError;
            continue;
        }
        if (json.value("trace_id").toString() != traceId) {
            continue;
        }
        const QString savedAt = json.value("_metadata").toObject().value("saved_at").toString();
        if (newestPath.isEmpty() || savedAt > newestSavedAt) {
            newestPath = path;
            newestJson = json;
            newestSavedAt = savedAt;
        }
    }

    if (newestPath.isEmpty()) {
        setError(errorMessage, QStringLiteral("Trace not found: %1").arg(traceId));
        return false;
    }

    newestJson.remove("_metadata");
    return ActionTrace::fromJson(newestJson, trace, errorMessage);
}

QVector<TraceSummary> ActionLogger::listTraces(const QString& sessionId) const
{
    QVector<TraceSummary> summaries;
    const QString directory = sessionId.isEmpty() ? m_logDirectory : sessionDirectory(sessionId);

    for (const QString& path : traceFiles(directory, QStringLiteral("trace_*.json"))) {
        QJsonObject json;
        QString readError;
        if (!readTraceFile(path, &json, &readError)) {
            qWarning() << "ActionLogger:" << readError;
            continue;
        }

        TraceSummary summary;
        summary.traceId = json.value("trace_id").toString();
        summary.sessionId = json.value("session_id").toString();
        summary.eventCount = json.value("events").toArray().size();
        summary.startedAt = json.value("started_at").toString();
        summary.completedAt = json.value("completed_at").toString();
        summary.savedAt = json.value("_metadata").toObject().value("saved_at").toString();
        summary.filePath = path;
        summaries.append(summary);
    }

    std::sort(summaries.begin(), summaries.end(), [](const TraceSummary& a, const TraceSummary& b) {
        return a.savedAt > b.savedAt;
    });
    return summaries;
}

bool ActionLogger::logEvent(const QString& sessionId, const ActionEvent& event,
                            QString* errorMessage) const
{
    if (event.status == ActionEventStatus::Success) {
        qInfo() << "ActionLogger: Action" << event.stepId << actionEventStatusName(event.status)
                << "(latency:" << event.latencyMs << "ms)";
    } else {
        qWarning() << "ActionLogger: Action" << event.stepId << actionEventStatusName(event.status)
                   << "attempt" << event.attempt << "(latency:" << event.latencyMs << "ms)"
                   << event.error;
    }

    const QString directory = sessionDirectory(sessionId);
    if (!QDir().mkpath(directory)) {
        setError(errorMessage, QStringLiteral("Cannot create %1").arg(directory));
        return false;
    }

    QFile file(QDir(directory).filePath(QStringLiteral("events.jsonl")));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        setError(errorMessage, QStringLiteral("Cannot open event log: %1").arg(file.errorString()));
        return false;
    }

    QByteArray line = QJsonDocument(event.toJson()).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (file.write(line) != line.size()) {
        setError(errorMessage, QStringLiteral("Failed to append event: %1").arg(file.errorString()));
        return false;
    }
    return true;
}

bool ActionLogger::saveScreenshot(const ScreenshotPayload& payload, const QString& stepId,
                                  QString* savedPath, QString* errorMessage) const
{
    const QByteArray png = payload.frame.isEmpty() ? ScreenCapture::encodePng(payload.image)
                                                   : QByteArray::fromBase64(payload.frame);
    if (png.isEmpty()) {
        setError(errorMessage, QStringLiteral("Screenshot has no image data"));
        return false;
    }

    const QString fileName = QStringLiteral("screenshot_%1_%2.png")
                                 .arg(sanitizeComponent(stepId),
                                      timestampSuffix(QDateTime::currentDateTime()));
    const QString path = AtomicFileWriter::uniquePath(
        QDir(sessionDirectory(payload.sessionId)).filePath(QStringLiteral("screenshots/") + fileName));

    AtomicFileWriter::Error writeError;
    if (!AtomicFileWriter::writeBytes(png, path, &writeError)) {
        qWarning() << "ActionLogger: Failed to save screenshot for" << stepId << ":"
                   << writeError.message;
        setError(errorMessage, QStringLiteral("Failed to save screenshot: %1").arg(writeError.message));
        return false;
    }

    if (savedPath) {
        *savedPath = path;
    }
    return true;
}

} // namespace Hawk
