#ifndef FIREWALLMANAGER_H
#define FIREWALLMANAGER_H

#include <QObject>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QMutex>
#include <QString>
#include <QStringList>

class CommandRunner;
class DomainResolver;
class IpRange;
class PeriodicWorker;

/**
 * @brief Network-lock engine over the Windows firewall (netsh advfirewall)
 *
 * Two independent features share the rule prefix:
 *  - DNS lock: outbound blocks to well-known public resolvers and to the
 *    DNS-over-TLS port, so the hosts file cannot be bypassed by switching
 *    resolvers. Stays installed across restarts, removed only on uninstall.
 *  - Allow-list mode: outbound traffic is blocked everywhere except the
 *    resolved addresses of a small domain set. A refresh loop re-resolves
 *    the set because CDN addresses rotate. The system's own DNS servers
 *    stay reachable so the allowed names keep resolving.
 *
 * Every rule has a fixed name, is updated in place with set-rule and is
 * removed with a single delete-by-name call. The active flag file outlives the process so a crash can be
 * detected on the next boot.
 */
class FirewallManager : public QObject
{
    Q_OBJECT
public:
    FirewallManager(const QString& rulePrefix,
                    const QString& flagPath,
                    CommandRunner* commandRunner,
                    DomainResolver* resolver,
                    QObject* parent = nullptr);
    ~FirewallManager();

    // DNS lock
    bool applyDnsLock();
    bool removeDnsLock();
    bool isDnsLocked();

    // Allow-list mode. Re-entrant: an active allow-list has its rules rewritten
    // for the new domains.
    bool enableAllowlistMode(const QStringList& domains);
    bool disableAllowlistMode();
    bool refreshAllowlist();
    bool isAllowlistActive() const;
    QStringList allowlistDomains() const;
    bool isRefreshRunning() const;
    // Joins the refresh loop and leaves the rules as they are
    void stopRefreshLoop();
    QList<QHostAddress> systemResolvers() const;

    // Boot-time crash recovery. Deletes every allow-list rule if the flag
    // was left behind; returns whether it was.
    bool cleanupOrphanedRules();

    // Uninstall: removes the DNS lock and the allow-list
    bool cleanupAllRules();

    void setRefreshIntervalSeconds(int seconds);
    void setResolverAddresses(const QStringList& addresses);

    QString dnsRuleName() const;
    QString dotRuleName() const;
    QStringList allowlistRuleNames() const;
    QStringList allRuleNames() const;
    QString flagPath() const;

    static QStringList publicResolvers();

signals:
    void allowlistStateChanged(bool active);

private:
    QList<QHostAddress> resolveAll(const QStringList& domains);
    bool installAllowlistRules(const QList<QHostAddress>& allowed);
    void removeAllowlistRules();
    QList<IpRange> excludedRanges(QAbstractSocket::NetworkLayerProtocol family, const QList<QHostAddress>& allowed) const;
    QList<QHostAddress> querySystemResolvers();

    bool addRule(const QString& name, const QStringList& parameters);
    bool writeRule(const QString& name, const QStringList& parameters);
    bool deleteRule(const QString& name);
    bool ruleExists(const QString& name);

    QString m_prefix;
    QString m_flagPath;
    CommandRunner* m_commandRunner;
    DomainResolver* m_resolver;
    PeriodicWorker* m_refreshWorker;

    mutable QMutex m_mutex;
    bool m_allowlistActive;
    QStringList m_allowlistDomains;
    QStringList m_resolverAddresses;
    QList<QHostAddress> m_systemResolvers;
    QHash<QString, QList<QHostAddress>> m_lastResolved;
};

#endif // FIREWALLMANAGER_H
