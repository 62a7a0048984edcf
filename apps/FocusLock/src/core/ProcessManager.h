#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include <QString>

class CommandRunner;
struct Platform;

// Detects and terminates the desktop apps of a platform
class ProcessManager
{
public:
    explicit ProcessManager(CommandRunner* commandRunner);

    // taskkill first, PowerShell Stop-Process for packaged apps that
    // taskkill cannot reach. True if the process is gone afterwards.
    bool killProcessByName(const QString& processName);

    bool isProcessRunning(const QString& processName);

    // Kills every configured process; true if any was killed
    bool killPlatformProcesses(const Platform& platform);
    bool isPlatformRunning(const Platform& platform);

private:
    bool killWithPowerShell(const QString& processName);

    CommandRunner* m_commandRunner;
};

#endif // PROCESSMANAGER_H
