#ifndef SERVICEMANAGER_H
#define SERVICEMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>

class CommandRunner;
class FirewallManager;

// Registers the process as a logon-time scheduled task running with
// highest privileges, and tears it down again on uninstall.
class ServiceManager : public QObject
{
    Q_OBJECT
public:
    ServiceManager(CommandRunner* commandRunner, FirewallManager* firewallManager, QObject *parent = nullptr);
    ~ServiceManager();

    bool installService();
    bool uninstallService();
    bool startService();
    bool stopService();

    QString serviceName() const;
    QString serviceExecutable() const;
    void setServiceExecutable(const QString& path);

private:
    bool runSchtasks(const QStringList& arguments, const QString& action);

    CommandRunner* m_commandRunner;
    FirewallManager* m_firewallManager;
    QString m_executable;
};

#endif // SERVICEMANAGER_H
