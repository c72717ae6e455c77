#include "cli/PlanFileHelper.h"

#include "utils/AtomicFileWriter.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Hawk {
namespace CLI {

CLIResult loadPlanFile(const QString& path, TaskPlan* plan)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Cannot open plan file %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Plan file %1 is not a JSON object: %2")
                                    .arg(path, parseError.errorString()));
    }

    QString error;
    if (!TaskPlan::fromJson(doc.object(), plan, &error)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Invalid plan in %1: %2").arg(path, error));
    }
    return CLIResult::success();
}

QByteArray toJsonBytes(const QJsonObject& json)
{
    return QJsonDocument(json).toJson(QJsonDocument::Indented);
}

CLIResult writeJsonFile(const QJsonObject& json, const QString& path)
{
    AtomicFileWriter::Error error;
    if (!AtomicFileWriter::writeBytes(toJsonBytes(json), path, &error)) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Failed to write %1: %2").arg(path, error.message));
    }
    return CLIResult::success(QString("Saved to %1").arg(path));
}

} // namespace CLI
} // namespace Hawk
