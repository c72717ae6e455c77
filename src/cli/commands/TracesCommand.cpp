#include "cli/commands/TracesCommand.h"

#include "monitoring/ActionLogger.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace Hawk {
namespace CLI {

QString TracesCommand::name() const { return "traces"; }

QString TracesCommand::description() const { return "List saved action traces"; }

void TracesCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"s", "session"}, "Only traces of this session", "session_id"});
    parser.addOption({"log-dir", "Trace directory", "dir"});
    parser.addOption({"json", "Print the list as JSON"});
}

CLIResult TracesCommand::execute(const QCommandLineParser& parser)
{
    const ActionLogger logger(parser.value("log-dir"));
    const QVector<TraceSummary> summaries = logger.listTraces(parser.value("session"));

    if (parser.isSet("json")) {
        QJsonArray array;
        for (const TraceSummary& summary : summaries) {
            array.append(summary.toJson());
        }
        return CLIResult::withData(QJsonDocument(array).toJson(QJsonDocument::Indented));
    }

    if (summaries.isEmpty()) {
        return CLIResult::success(QString("No traces in %1").arg(logger.logDirectory()));
    }

    QString output;
    QTextStream out(&output);
    for (const TraceSummary& summary : summaries) {
        out << QString("%1  %2  %3 events  saved %4\n")
                   .arg(summary.traceId)
                   .arg(summary.sessionId)
                   .arg(summary.eventCount)
                   .arg(summary.savedAt);
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Hawk
