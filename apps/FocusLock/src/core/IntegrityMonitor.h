#ifndef INTEGRITYMONITOR_H
#define INTEGRITYMONITOR_H

#include <QObject>
#include <QString>

class BlockPolicy;
class FirewallManager;
class HostsManager;
class PeriodicWorker;

// Re-asserts the intended blocks on a fixed interval: enforced regions are
// applied, regions lifted by a running session are removed. Steady-state
// ticks are no-ops because HostsManager skips identical writes; a tick only
// writes after something changed the file, including a session that started
// while the previous tick was applying.
class IntegrityMonitor : public QObject
{
    Q_OBJECT
public:
    struct Report
    {
        int regionsChecked = 0;
        int regionsRepaired = 0;
        int regionsLifted = 0;
        int failures = 0;
        bool dnsLockRepaired = false;
    };

    IntegrityMonitor(HostsManager* hostsManager,
                     FirewallManager* firewallManager,
                     BlockPolicy* policy,
                     int intervalMs,
                     QObject* parent = nullptr);
    ~IntegrityMonitor();

    bool start();
    void stop();
    bool isRunning() const;

    Report checkOnce();

signals:
    void driftRepaired(const QString& markerId);
    void dnsLockRepaired();

private:
    HostsManager* m_hostsManager;
    FirewallManager* m_firewallManager;
    BlockPolicy* m_policy;
    PeriodicWorker* m_worker;
};

#endif // INTEGRITYMONITOR_H
