#include "ServiceManager.h"
#include "../core/CommandRunner.h"
#include "../core/FirewallManager.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>

ServiceManager::ServiceManager(CommandRunner* commandRunner, FirewallManager* firewallManager, QObject *parent)
    : QObject(parent)
    , m_commandRunner(commandRunner)
    , m_firewallManager(firewallManager)
    , m_executable(QDir::toNativeSeparators(QCoreApplication::applicationFilePath()))
{
}

ServiceManager::~ServiceManager()
{
}

QString ServiceManager::serviceName() const
{
    return "FocusLock";
}

QString ServiceManager::serviceExecutable() const
{
    return m_executable;
}

void ServiceManager::setServiceExecutable(const QString& path)
{
    m_executable = path;
}

bool ServiceManager::installService()
{
    LOG_INFO("Installing scheduled task: " + serviceName());

    const QString command = QString("\"%1\" --console").arg(serviceExecutable());
    return runSchtasks(QStringList() << "/Create" << "/F"
                                     << "/TN" << serviceName()
                                     << "/TR" << command
                                     << "/SC" << "ONLOGON"
                                     << "/RL" << "HIGHEST",
                       "install");
}

bool ServiceManager::uninstallService()
{
    LOG_INFO("Uninstalling scheduled task: " + serviceName());

    bool success = runSchtasks(QStringList() << "/Delete" << "/F" << "/TN" << serviceName(), "uninstall");

    // Firewall rules are removed by exact name even when the task is gone
    if (m_firewallManager && !m_firewallManager->cleanupAllRules()) {
        LOG_ERROR("Some firewall rules could not be removed");
        success = false;
    }
    return success;
}

bool ServiceManager::startService()
{
    LOG_INFO("Starting scheduled task: " + serviceName());
    return runSchtasks(QStringList() << "/Run" << "/TN" << serviceName(), "start");
}

bool ServiceManager::stopService()
{
    LOG_INFO("Stopping scheduled task: " + serviceName());
    return runSchtasks(QStringList() << "/End" << "/TN" << serviceName(), "stop");
}

bool ServiceManager::runSchtasks(const QStringList& arguments, const QString& action)
{
#ifdef Q_OS_WIN
    const CommandResult result = m_commandRunner->run("schtasks", arguments);
    if (!result.succeeded()) {
        LOG_ERROR(QString("Failed to %1 task: %2").arg(action, result.output.trimmed()));
        return false;
    }
    LOG_INFO(QString("Task %1 succeeded").arg(action));
    return true;
#else
    Q_UNUSED(arguments);
    LOG_ERROR(QString("Cannot %1 task: scheduled tasks are only supported on Windows").arg(action));
    return false;
#endif
}
