#ifndef FOCUSLOCKSERVICE_H
#define FOCUSLOCKSERVICE_H

#include <QObject>
#include <QMap>
#include <QScopedPointer>
#include <QString>
#include <QStringList>

#include "../core/BlockPolicy.h"
#include "../core/Platform.h"

class BlackoutSession;
class CommandRunner;
class ConfigManager;
class DomainResolver;
class FirewallManager;
class HostsManager;
class IntegrityMonitor;
class Notifier;
class PermanentBlockStore;
class PlatformSession;
class ProcessManager;
class ScheduleManager;
class TimedBlock;
class UsageTracker;

/**
 * Owns every engine and drives the boot sequence, the background loops and
 * the exit fail-safe. Boot order matters: a running blackout is rebuilt
 * first, then the permanent region and the DNS lock are asserted (both
 * fatal on failure), then leftovers of an unclean shutdown are cleaned up.
 *
 * Collaborators left null are created with their production
 * implementations; tests pass fakes. Engines are children of the service
 * and every loop is joined in the destructor before any of them goes.
 */
class FocusLockService : public QObject, public BlockPolicy
{
    Q_OBJECT
public:
    explicit FocusLockService(CommandRunner* commandRunner = nullptr,
                              DomainResolver* resolver = nullptr,
                              Notifier* notifier = nullptr,
                              QObject *parent = nullptr);
    ~FocusLockService();

    bool initialize();
    bool start();
    bool stop();
    bool isRunning() const;

    // BlockPolicy
    QList<HostsBlock> enforcedBlocks() const override;
    QStringList liftedMarkers() const override;

    HostsBlock permanentBlock() const;

    bool startPlatformSession(const QString& platformId);
    bool pausePlatformSession(const QString& platformId);
    bool stopPlatformSession(const QString& platformId);

    bool startBlackout(int minutes, bool locked);

    // Keeps the platforms closed for the given time, allowance or not
    bool startTimedBlock(const QStringList& platformIds, int minutes, bool locked);
    bool stopTimedBlock();

    bool enableAllowlist();
    bool disableAllowlist();

    ConfigManager* configManager() const { return m_configManager; }
    HostsManager* hostsManager() const { return m_hostsManager; }
    FirewallManager* firewallManager() const { return m_firewallManager; }
    UsageTracker* usageTracker() const { return m_usageTracker.data(); }
    PermanentBlockStore* permanentBlocks() const { return m_permanentBlocks; }
    BlackoutSession* blackoutSession() const { return m_blackoutSession; }
    ScheduleManager* scheduleManager() const { return m_scheduleManager; }
    IntegrityMonitor* integrityMonitor() const { return m_integrityMonitor; }
    TimedBlock* timedBlock() const { return m_timedBlock; }
    PlatformSession* platformSession(const QString& platformId) const;

    static QString permanentMarkerId();

private slots:
    void onPermanentBlocksChanged();
    void onTimedBlockStarted(const QStringList& platformIds);

private:
    bool createComponents();
    bool applyPermanentBlock();
    void blockAllPlatforms();
    void setupSignalHandlers();
    void stopLoops();

    QScopedPointer<CommandRunner> m_ownedCommandRunner;
    QScopedPointer<DomainResolver> m_ownedResolver;
    CommandRunner* m_commandRunner;
    DomainResolver* m_resolver;
    Notifier* m_notifier;

    ConfigManager* m_configManager;
    HostsManager* m_hostsManager;
    FirewallManager* m_firewallManager;
    QScopedPointer<ProcessManager> m_processManager;
    QScopedPointer<UsageTracker> m_usageTracker;
    PermanentBlockStore* m_permanentBlocks;
    BlackoutSession* m_blackoutSession;
    ScheduleManager* m_scheduleManager;
    IntegrityMonitor* m_integrityMonitor;
    TimedBlock* m_timedBlock;
    QList<Platform> m_platforms;
    QMap<QString, PlatformSession*> m_sessions;

    bool m_initialized;
    bool m_isRunning;
};

#endif // FOCUSLOCKSERVICE_H
