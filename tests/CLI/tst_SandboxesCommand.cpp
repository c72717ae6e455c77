#include <QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "cli/CLIHandler.h"
#include "cli/commands/SandboxesCommand.h"
#include "settings/Settings.h"
#include "MockRemoteVmProvider.h"

using Hawk::CLI::CLIHandler;
using Hawk::CLI::CLIResult;
using Hawk::CLI::SandboxesCommand;

class tst_SandboxesCommand : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void list_empty();
    void list_text();
    void list_json();
    void list_failure();
    void kill_terminatesVm();
    void kill_requiresId();
    void execute_requiresCredentials();

private:
    void clearCredentials();
};

void tst_SandboxesCommand::init()
{
    clearCredentials();
}

void tst_SandboxesCommand::cleanup()
{
    clearCredentials();
}

void tst_SandboxesCommand::clearCredentials()
{
    auto settings = Hawk::getSettings();
    settings.remove("sandbox/remoteVmApiKey");
    settings.sync();
    qunsetenv("E2B_API_KEY");
}

void tst_SandboxesCommand::list_empty()
{
    MockRemoteVmProvider provider;
    const CLIResult result = SandboxesCommand::listRemoteVms(provider, false);
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("No remote VMs running"));
}

void tst_SandboxesCommand::list_text()
{
    MockRemoteVmProvider provider;
    provider.setListed(QJsonArray{
        QJsonObject{{"sandbox_id", "vm_orphan"}, {"image", "ubuntu-22-04-browser"},
                    {"started_at", "2026-10-18T09:00:00Z"}},
        QJsonObject{{"id", "vm_other"}},
    });

    const CLIResult result = SandboxesCommand::listRemoteVms(provider, false);
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("vm_orphan  ubuntu-22-04-browser  started 2026-10-18T09:00:00Z"));
    QVERIFY(result.message.contains("vm_other  -  started -"));
}

void tst_SandboxesCommand::list_json()
{
    MockRemoteVmProvider provider;
    provider.setListed(QJsonArray{QJsonObject{{"sandbox_id", "vm_1"}}});

    const CLIResult result = SandboxesCommand::listRemoteVms(provider, true);
    QVERIFY(result.isSuccess());
    const QJsonArray array = QJsonDocument::fromJson(result.data).array();
    QCOMPARE(array.size(), 1);
    QCOMPARE(array.at(0).toObject().value("sandbox_id").toString(), QString("vm_1"));
}

void tst_SandboxesCommand::list_failure()
{
    MockRemoteVmProvider provider;
    provider.setListFails(true);
    const CLIResult result = SandboxesCommand::listRemoteVms(provider, false);
    QCOMPARE(result.code, CLIResult::Code::SandboxError);
    QCOMPARE(result.message, QString("Failed to list remote VMs: Mock list failure"));
}

void tst_SandboxesCommand::kill_terminatesVm()
{
    MockRemoteVmProvider provider;
    const CLIResult result = SandboxesCommand::killRemoteVm(provider, "vm_orphan");
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("Terminated vm_orphan"));
    QCOMPARE(provider.killed(), QStringList({"vm_orphan"}));
}

void tst_SandboxesCommand::kill_requiresId()
{
    MockRemoteVmProvider provider;
    const CLIResult result = SandboxesCommand::killRemoteVm(provider, QString());
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(provider.killed().isEmpty());
}

void tst_SandboxesCommand::execute_requiresCredentials()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"hawk", "sandboxes"});
    QCOMPARE(result.code, CLIResult::Code::SandboxError);
    QVERIFY(result.message.contains("E2B_API_KEY"));
}

QTEST_MAIN(tst_SandboxesCommand)
#include "tst_SandboxesCommand.moc"
