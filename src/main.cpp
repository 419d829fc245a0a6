#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QFileInfo>
#include <QPair>
#include <QTextStream>
#include <QDebug>

#include "kelivosync_version.h"
#include "appconfig.h"
#include "app/logoutput.h"

// Backup engine
#include "backup/backuptypes.h"
#include "backup/davclient.h"
#include "backup/datadirectories.h"
#include "backup/jsonchatstore.h"
#include "backup/preferencesstore.h"
#include "backup/syncorchestrator.h"

using namespace Backup;

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

int usageError(const QString &message)
{
    qCritical().noquote() << message;
    return ExitUsage;
}

// The message itself already went out through errorOccurred
int reportResult(const BackupResult &result)
{
    if (!result.success) {
        if (result.httpStatus > 0) {
            qCritical().noquote() << QString("Failed: %1, HTTP %2")
                .arg(backupErrorName(result.error)).arg(result.httpStatus);
        } else {
            qCritical().noquote() << QString("Failed: %1").arg(backupErrorName(result.error));
        }
        return ExitFailure;
    }
    qInfo().noquote() << QString("Done in %1 ms").arg(result.durationMs());
    return ExitSuccess;
}

bool findRemoteItem(SyncOrchestrator &orchestrator, LogOutput &log, const WebDavConfig &cfg,
                    const QString &name, BackupFileItem *found, BackupResult *result)
{
    QList<BackupFileItem> items;
    *result = orchestrator.listBackupFiles(cfg, &items);
    if (!result->success) {
        return false;
    }

    for (const BackupFileItem &item : items) {
        if (item.displayName == name || item.href.fileName() == name) {
            *found = item;
            return true;
        }
    }

    *result = BackupResult::failure(BackupError::FileError,
        QString("No remote backup named %1").arg(name));
    log.logError(result->errorMessage);
    return false;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("KelivoSync");
    app.setApplicationVersion(KELIVOSYNC_VERSION_STRING);
    app.setOrganizationName("KelivoSync");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Back up and restore settings, chats and files to a WebDAV server.\n\n"
        "Commands:\n"
        "  test                 Check the WebDAV connection\n"
        "  backup               Upload a new backup\n"
        "  export [dest]        Write a backup archive to a local file or directory,\n"
        "                       by default the directory of the last export\n"
        "  list                 List remote backups, newest first\n"
        "  restore <name>       Restore a remote backup\n"
        "  import <file>        Restore a local backup archive\n"
        "  delete <name>        Delete a remote backup");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "test, backup, export, list, restore, import or delete");
    parser.addPositionalArgument("argument", "Destination, backup name or file", "[argument]");

    // Connection
    QCommandLineOption urlOption("url", "WebDAV server URL.", "url");
    QCommandLineOption userOption("user", "WebDAV username.", "name");
    QCommandLineOption passwordOption("password", "WebDAV password.", "password");
    QCommandLineOption pathOption("path", "Remote collection path.", "path");
    QCommandLineOption noChatsOption("no-chats", "Leave chats out of backups and restores.");
    QCommandLineOption noFilesOption("no-files", "Leave files out of backups and restores.");
    QCommandLineOption saveConfigOption("save-config", "Remember the connection options.");

    // Restore
    QCommandLineOption modeOption("mode", "Restore everything with overwrite or merge.", "mode");
    QCommandLineOption settingsOption("settings", "Settings action: ignore, merge or overwrite.", "action");
    QCommandLineOption providersOption("providers", "Providers action: ignore, merge or overwrite.", "action");
    QCommandLineOption chatsOption("chats", "Chats action: ignore, merge or overwrite.", "action");
    QCommandLineOption filesOption("files", "Files action: ignore, merge or overwrite.", "action");

    // General
    QCommandLineOption dataDirOption("data-dir", "Application data directory.", "dir");
    QCommandLineOption verboseOption("verbose", "Show debug output.");

    parser.addOptions({urlOption, userOption, passwordOption, pathOption, noChatsOption,
                       noFilesOption, saveConfigOption, modeOption, settingsOption,
                       providersOption, chatsOption, filesOption, dataDirOption, verboseOption});
    parser.process(app);

    AppConfig config;
    LogOutput::install(parser.isSet(verboseOption) || config.debugLogging());
    LogOutput log;

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError("No command given (see --help)");
    }
    const QString command = args.first();
    const QString argument = args.value(1);

    static const QStringList commands = {"test", "backup", "export", "list", "restore", "import", "delete"};
    if (!commands.contains(command)) {
        return usageError(QString("Unknown command: %1").arg(command));
    }
    if ((command == "restore" || command == "import" || command == "delete")
        && argument.isEmpty()) {
        return usageError(QString("%1 needs an argument").arg(command));
    }

    // ========== Connection config ==========

    WebDavConfig cfg = config.webDavConfig();
    if (parser.isSet(urlOption)) cfg.url = parser.value(urlOption).trimmed();
    if (parser.isSet(userOption)) cfg.username = parser.value(userOption).trimmed();
    if (parser.isSet(passwordOption)) cfg.password = parser.value(passwordOption);
    if (parser.isSet(pathOption)) {
        const QString p = parser.value(pathOption).trimmed();
        cfg.path = p.isEmpty() ? WebDavConfig::defaultPath() : p;
    }
    if (parser.isSet(noChatsOption)) cfg.includeChats = false;
    if (parser.isSet(noFilesOption)) cfg.includeFiles = false;

    if (parser.isSet(saveConfigOption)) {
        config.setWebDavConfig(cfg);
        config.sync();
        log.logInfo(QString("Saved connection settings to %1").arg(config.fileName()));
    }

    // ========== Restore options ==========

    RestoreOptions options;
    if (parser.isSet(modeOption)) {
        const QString mode = parser.value(modeOption).trimmed().toLower();
        if (mode == "overwrite") {
            options = RestoreOptions::fromMode(RestoreMode::Overwrite);
        } else if (mode == "merge") {
            options = RestoreOptions::fromMode(RestoreMode::Merge);
        } else {
            return usageError(QString("Invalid --mode: %1").arg(mode));
        }
    }

    const QList<QPair<QCommandLineOption, RestoreAction*>> actionOptions = {
        {settingsOption, &options.settingsAction},
        {providersOption, &options.providersAction},
        {chatsOption, &options.chatsAction},
        {filesOption, &options.filesAction},
    };
    for (const auto &entry : actionOptions) {
        if (!parser.isSet(entry.first)) continue;
        const QString value = parser.value(entry.first);
        if (!restoreActionFromName(value, entry.second)) {
            return usageError(QString("Invalid --%1: %2").arg(entry.first.names().first(), value));
        }
    }

    // ========== Local state ==========

    const QString dataRoot = parser.isSet(dataDirOption) ? parser.value(dataDirOption)
                                                         : config.dataRoot();
    if (!QDir().mkpath(dataRoot)) {
        qCritical().noquote() << "Cannot create data directory" << dataRoot;
        return ExitFailure;
    }
    qDebug() << "[main] Data root:" << dataRoot;

    QDir root(dataRoot);
    PreferencesStore preferences(root.filePath("preferences.json"));
    JsonChatStore chats(root.filePath("chats.json"));

    NetworkDavClient client;
    client.setTransferTimeout(config.transferTimeoutMs());

    SyncOrchestrator orchestrator(&preferences, &chats, DataDirectories::fromRoot(dataRoot), &client);
    if (!config.tempDirectory().isEmpty()) {
        orchestrator.setTempDirectory(config.tempDirectory());
    }

    QObject::connect(&orchestrator, &SyncOrchestrator::logMessage, &log, &LogOutput::logInfo);
    QObject::connect(&orchestrator, &SyncOrchestrator::warningOccurred, &log, &LogOutput::logWarning);
    QObject::connect(&orchestrator, &SyncOrchestrator::errorOccurred, &log, &LogOutput::logError);
    if (LogOutput::isVerbose()) {
        QObject::connect(&orchestrator, &SyncOrchestrator::progressUpdated,
                         [&log](int current, int total, const QString &message) {
                             log.logDebug(QString("(%1/%2) %3").arg(current).arg(total).arg(message));
                         });
    }

    // ========== Commands ==========

    QTextStream out(stdout);
    BackupResult result;

    if (command == "test") {
        result = orchestrator.testWebDav(cfg);
        if (result.success) out << "Connection OK" << Qt::endl;
    } else if (command == "backup") {
        result = orchestrator.backupToWebDav(cfg);
    } else if (command == "export") {
        QString written;
        result = orchestrator.exportToFile(cfg, config.exportDestination(argument), &written);
        if (result.success) {
            config.setLastExportPath(QFileInfo(written).absolutePath());
            out << written << Qt::endl;
        }
    } else if (command == "list") {
        QList<BackupFileItem> items;
        result = orchestrator.listBackupFiles(cfg, &items);
        for (const BackupFileItem &item : items) {
            out << item.displayName << '\t' << item.size << '\t'
                << (item.lastModified.isValid() ? item.lastModified.toString(Qt::ISODate) : QString("-"))
                << Qt::endl;
        }
    } else if (command == "restore") {
        BackupFileItem item;
        if (findRemoteItem(orchestrator, log, cfg, argument, &item, &result)) {
            result = orchestrator.restoreFromWebDav(cfg, item, options);
        }
    } else if (command == "import") {
        result = orchestrator.restoreFromLocalFile(argument, cfg, options);
    } else if (command == "delete") {
        BackupFileItem item;
        if (findRemoteItem(orchestrator, log, cfg, argument, &item, &result)) {
            result = orchestrator.deleteWebDavBackupFile(cfg, item);
        }
    }

    return reportResult(result);
}
