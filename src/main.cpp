#include "AppSettings.h"
#include "DbManager.h"
#include "MigrationRunner.h"
#include "InventoryEngine.h"
#include "CommandRunner.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("stockledger");
    QCoreApplication::setOrganizationName("StockLedger");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QString("Stock ledger and consistency engine.\n\n") + CommandRunner::commandsHelp());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption("config", "INI configuration file.", "ini");
    const QCommandLineOption dbOption("db", "Database file (overrides configuration).", "path");
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOptions(CommandRunner::options());
    parser.addPositionalArgument("command", "Command to run.", "<command> [args...]");
    parser.process(app);

    QTextStream err(stderr);

    AppSettings settings(parser.value(configOption));
    EngineConfig config = settings.load();
    if (parser.isSet(dbOption)) {
        config.databasePath = parser.value(dbOption);
    }

    DbManager& dbManager = DbManager::instance();
    if (!dbManager.initialize(config.databasePath, config.storageTimeoutMs)) {
        err << "Cannot open database " << config.databasePath << "\n";
        return CommandRunner::StorageError;
    }

    MigrationRunner migrationRunner(dbManager.database());
    if (!migrationRunner.runMigrations()) {
        err << "Cannot apply database migrations\n";
        dbManager.close();
        return CommandRunner::StorageError;
    }

    int code = CommandRunner::Success;
    {
        InventoryEngine engine(dbManager.database(), config);
        engine.subscribeLowStock([&err](int productId, const QString &productName, int quantity) {
            err << "Low stock: " << productName << " (#" << productId << ") has " << quantity << " left\n";
            err.flush();
        });

        engine.start();

        CommandRunner runner(engine, parser);
        code = runner.run(parser.positionalArguments());

        QCoreApplication::processEvents();
    }

    dbManager.close();
    return code;
}
