#include "ProcessManager.h"
#include "CommandRunner.h"
#include "Platform.h"
#include "logger/logger.h"
#include <QRegularExpression>

namespace {

const int kProcessTimeoutMs = 10000;

bool isSafeProcessName(const QString& name)
{
    static const QRegularExpression pattern("^[A-Za-z0-9._ -]+$");
    return pattern.match(name).hasMatch();
}

} // namespace

ProcessManager::ProcessManager(CommandRunner* commandRunner)
    : m_commandRunner(commandRunner)
{
}

bool ProcessManager::killProcessByName(const QString& processName)
{
    if (!m_commandRunner || !isSafeProcessName(processName)) {
        LOG_WARNING("Refusing to kill process with unexpected name: " + processName);
        return false;
    }

#ifdef Q_OS_WIN
    const CommandResult result = m_commandRunner->run(
        "taskkill", QStringList() << "/F" << "/IM" << processName, kProcessTimeoutMs);
    if (result.succeeded()) {
        LOG_INFO("Killed process (taskkill): " + processName);
        return true;
    }

    if (result.output.contains("denied", Qt::CaseInsensitive)) {
        LOG_DEBUG("taskkill access denied for " + processName + ", trying PowerShell");
    }
    if (killWithPowerShell(processName) && !isProcessRunning(processName)) {
        LOG_INFO("Killed process (PowerShell): " + processName);
        return true;
    }
    return false;
#else
    const CommandResult result = m_commandRunner->run("pkill", QStringList() << "-x" << processName, kProcessTimeoutMs);
    if (result.succeeded()) {
        LOG_INFO("Killed process: " + processName);
        return true;
    }
    return false;
#endif
}

bool ProcessManager::killWithPowerShell(const QString& processName)
{
    QString baseName = processName;
    if (baseName.endsWith(".exe", Qt::CaseInsensitive)) {
        baseName.chop(4);
    }

    const QString command = QString("Get-Process -Name '%1' -ErrorAction SilentlyContinue | "
                                    "Stop-Process -Force -ErrorAction SilentlyContinue").arg(baseName);
    const CommandResult result = m_commandRunner->run(
        "powershell", QStringList() << "-NoProfile" << "-NonInteractive" << "-Command" << command, kProcessTimeoutMs);
    return result.succeeded();
}

bool ProcessManager::isProcessRunning(const QString& processName)
{
    if (!m_commandRunner || !isSafeProcessName(processName)) {
        return false;
    }

#ifdef Q_OS_WIN
    const CommandResult result = m_commandRunner->run(
        "tasklist", QStringList() << "/FO" << "CSV" << "/NH", kProcessTimeoutMs);
    if (!result.started) {
        return false;
    }
    return result.output.contains(QString("\"%1\"").arg(processName), Qt::CaseInsensitive);
#else
    return m_commandRunner->run("pgrep", QStringList() << "-x" << processName, kProcessTimeoutMs).succeeded();
#endif
}

bool ProcessManager::killPlatformProcesses(const Platform& platform)
{
    if (platform.processNames.isEmpty()) {
        LOG_DEBUG("No processes configured for " + platform.displayName);
        return false;
    }

    bool killedAny = false;
    for (const QString& processName : platform.processNames) {
        if (killProcessByName(processName)) {
            killedAny = true;
        }
    }

    if (killedAny) {
        LOG_INFO(platform.displayName + " app processes terminated");
    } else {
        LOG_DEBUG("No " + platform.displayName + " app processes were running");
    }
    return killedAny;
}

bool ProcessManager::isPlatformRunning(const Platform& platform)
{
    for (const QString& processName : platform.processNames) {
        if (isProcessRunning(processName)) {
            return true;
        }
    }
    return false;
}
