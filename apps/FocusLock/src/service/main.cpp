#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QLockFile>
#include <QStandardPaths>

#include "logger/logger.h"
#include "../core/CommandRunner.h"
#include "../core/DomainResolver.h"
#include "../core/FirewallManager.h"
#include "../managers/ConfigManager.h"
#include "Elevation.h"
#include "FocusLockService.h"
#include "ServiceManager.h"

namespace {

int runServiceControl(ConfigManager& config,
                      const QCommandLineParser& parser,
                      const QCommandLineOption& installOption,
                      const QCommandLineOption& uninstallOption,
                      const QCommandLineOption& startOption,
                      const QCommandLineOption& stopOption)
{
    ProcessCommandRunner runner;
    HostInfoResolver resolver;
    FirewallManager firewall(config.firewallRulePrefix(),
                             config.dataFilePath("allowlist_active.flag"),
                             &runner, &resolver);
    ServiceManager serviceManager(&runner, &firewall);

    bool success = false;
    if (parser.isSet(installOption)) {
        LOG_INFO("Installing service...");
        success = serviceManager.installService();
    } else if (parser.isSet(uninstallOption)) {
        LOG_INFO("Uninstalling service...");
        success = serviceManager.uninstallService();
    } else if (parser.isSet(startOption)) {
        LOG_INFO("Starting service...");
        success = serviceManager.startService();
    } else if (parser.isSet(stopOption)) {
        LOG_INFO("Stopping service...");
        success = serviceManager.stopService();
    }
    return success ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("FocusLock");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("FocusLock blocking service");
    parser.addHelpOption();
    parser.addVersionOption();

    // Service control options
    QCommandLineOption installOption("install", "Register the logon task");
    QCommandLineOption uninstallOption("uninstall", "Remove the logon task and every firewall rule");
    QCommandLineOption startOption("start", "Run the logon task now");
    QCommandLineOption stopOption("stop", "End the logon task");
    QCommandLineOption consoleOption("console", "Run in the foreground");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level");

    // Actions taken once the service is up
    QCommandLineOption blackoutOption("blackout", "Start a blackout of the given length", "minutes");
    QCommandLineOption blockOption("block", "Block the given platforms (comma separated) for --block-minutes", "platforms");
    QCommandLineOption blockMinutesOption("block-minutes", "Length of the platform block", "minutes", "60");
    QCommandLineOption lockedOption("locked", "Make the blackout or platform block impossible to cancel");
    QCommandLineOption allowlistOption("allowlist", "Enable allow-list mode");

    parser.addOption(installOption);
    parser.addOption(uninstallOption);
    parser.addOption(startOption);
    parser.addOption(stopOption);
    parser.addOption(consoleOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);
    parser.addOption(blackoutOption);
    parser.addOption(blockOption);
    parser.addOption(blockMinutesOption);
    parser.addOption(lockedOption);
    parser.addOption(allowlistOption);

    parser.process(app);

    const QString dataDir = ConfigManager::defaultDataDir();
    QDir().mkpath(dataDir);

    // Initialize logger. LogFilePath replaces the default file, and the
    // command line wins over LogLevel and LogFilePath.
    Logger::instance()->setLogFile(dataDir + "/focuslock.log");

    QString levelOverride;
    if (parser.isSet(logLevelOption)) {
        bool levelOk = false;
        Logger::levelFromString(parser.value(logLevelOption), &levelOk);
        if (levelOk) {
            levelOverride = parser.value(logLevelOption);
        } else {
            LOG_WARNING("Unknown log level " + parser.value(logLevelOption) + ", keeping the configured one");
        }
    }
    ConfigManager::setLogOverrides(levelOverride, parser.value(logFileOption));

    ConfigManager config;
    if (!config.initialize()) {
        LOG_ERROR("Failed to initialize configuration");
        return 1;
    }
    if (!config.loadLocalConfig()) {
        LOG_WARNING("Failed to load configuration file, using defaults");
    }

    LOG_INFO("FocusLock starting...");

    if (!Elevation::isElevated()) {
        LOG_WARNING("FocusLock needs administrator rights, requesting an elevated restart");
        return Elevation::relaunchElevated(QCoreApplication::arguments().mid(1)) ? 0 : 1;
    }

    if (parser.isSet(installOption) || parser.isSet(uninstallOption)
        || parser.isSet(startOption) || parser.isSet(stopOption)) {
        return runServiceControl(config, parser, installOption, uninstallOption, startOption, stopOption);
    }

    QDir().mkpath(config.dataDir());
    QLockFile instanceLock(config.dataFilePath("focuslock.instance.lock"));
    instanceLock.setStaleLockTime(0);
    if (!instanceLock.tryLock(0)) {
        LOG_ERROR("Another FocusLock instance is already running");
        return 1;
    }

    if (parser.isSet(consoleOption)) {
        LOG_INFO("Running in console mode");
    }

    FocusLockService service;

    if (!service.initialize()) {
        LOG_ERROR("Failed to initialize service");
        return 1;
    }

    if (!service.start()) {
        LOG_ERROR("Failed to start service");
        return 1;
    }

    if (parser.isSet(blackoutOption)) {
        bool ok = false;
        const int minutes = parser.value(blackoutOption).toInt(&ok);
        if (!ok || !service.startBlackout(minutes, parser.isSet(lockedOption))) {
            LOG_ERROR("Blackout request rejected: " + parser.value(blackoutOption));
        }
    }

    if (parser.isSet(blockOption)) {
        bool ok = false;
        const int minutes = parser.value(blockMinutesOption).toInt(&ok);
        const QStringList platformIds = parser.value(blockOption).split(',', Qt::SkipEmptyParts);
        if (!ok || !service.startTimedBlock(platformIds, minutes, parser.isSet(lockedOption))) {
            LOG_ERROR("Platform block request rejected: " + parser.value(blockOption));
        }
    }

    if (parser.isSet(allowlistOption) && !service.enableAllowlist()) {
        LOG_ERROR("Failed to enable allow-list mode");
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        LOG_INFO("Application shutting down...");
        service.stop();
    });

    return app.exec();
}
