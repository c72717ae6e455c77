#ifndef PLANFILEHELPER_H
#define PLANFILEHELPER_H

#include "cli/CLIResult.h"
#include "planner/TaskTypes.h"

#include <QJsonObject>
#include <QString>

namespace Hawk {
namespace CLI {

/**
 * @brief Read a TaskPlan JSON file.
 * @return Success, or FileError/InvalidArguments describing the problem
 */
CLIResult loadPlanFile(const QString& path, TaskPlan* plan);

// Pretty-printed JSON written atomically to path.
CLIResult writeJsonFile(const QJsonObject& json, const QString& path);

QByteArray toJsonBytes(const QJsonObject& json);

} // namespace CLI
} // namespace Hawk

#endif // PLANFILEHELPER_H
