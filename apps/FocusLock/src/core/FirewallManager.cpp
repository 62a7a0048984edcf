#include "FirewallManager.h"
#include "AtomicFile.h"
#include "CommandRunner.h"
#include "DomainResolver.h"
#include "HostsFile.h"
#include "IpRange.h"
#include "PeriodicWorker.h"
#include "logger/logger.h"

#include <QRegularExpression>

namespace {

const int kNetshTimeoutMs = 10000;
const int kDefaultRefreshSeconds = 300;
const int kMinimumRefreshSeconds = 30;

// A dotted quad, or anything with a colon that could be IPv6 with an optional zone
const QRegularExpression kAddressToken("^(\\d{1,3}(\\.\\d{1,3}){3}|[0-9A-Fa-f]*:[0-9A-Fa-f:.]*(%\\w+)?)$");

// Ranges that stay reachable while the allow-list is active
const char* const kReservedV4[] = {
    "0.0.0.0/8", "10.0.0.0/8", "127.0.0.0/8", "169.254.0.0/16",
    "172.16.0.0/12", "192.168.0.0/16", "224.0.0.0/4", "255.255.255.255/32"
};

const char* const kReservedV6[] = {
    "::/128", "::1/128", "fc00::/7", "fe80::/10", "ff00::/8"
};

} // namespace

FirewallManager::FirewallManager(const QString& rulePrefix,
                                 const QString& flagPath,
                                 CommandRunner* commandRunner,
                                 DomainResolver* resolver,
                                 QObject* parent)
    : QObject(parent)
    , m_prefix(rulePrefix)
    , m_flagPath(flagPath)
    , m_commandRunner(commandRunner)
    , m_resolver(resolver)
    , m_refreshWorker(nullptr)
    , m_allowlistActive(false)
{
    m_refreshWorker = new PeriodicWorker("allowlist-refresh", kDefaultRefreshSeconds * 1000,
                                         [this]() { refreshAllowlist(); }, this);
}

FirewallManager::~FirewallManager()
{
    m_refreshWorker->stopLoop();
}

QStringList FirewallManager::publicResolvers()
{
    return QStringList()
        // Google, Cloudflare, OpenDNS, Quad9
        << "8.8.8.8" << "8.8.4.4"
        << "1.1.1.1" << "1.0.0.1"
        << "208.67.222.222" << "208.67.220.220"
        << "9.9.9.9" << "149.112.112.112"
        << "2001:4860:4860::8888" << "2001:4860:4860::8844"
        << "2606:4700:4700::1111" << "2606:4700:4700::1001"
        << "2620:119:35::35" << "2620:119:53::53"
        << "2620:fe::fe" << "2620:fe::9";
}

QString FirewallManager::dnsRuleName() const
{
    return m_prefix + "-DNS-Lock";
}

QString FirewallManager::dotRuleName() const
{
    return m_prefix + "-DoT-Lock";
}

QStringList FirewallManager::allowlistRuleNames() const
{
    return QStringList()
        << m_prefix + "-Allowlist-Block-v4"
        << m_prefix + "-Allowlist-Block-v6"
        << m_prefix + "-Allowlist-Allow"
        << m_prefix + "-Allowlist-Essential";
}

QStringList FirewallManager::allRuleNames() const
{
    return QStringList() << dnsRuleName() << dotRuleName() << allowlistRuleNames();
}

QString FirewallManager::flagPath() const
{
    return m_flagPath;
}

bool FirewallManager::applyDnsLock()
{
    QMutexLocker locker(&m_mutex);

    deleteRule(dnsRuleName());
    deleteRule(dotRuleName());

    const QStringList resolvers = publicResolvers();
    const bool dnsOk = addRule(dnsRuleName(), QStringList()
                               << "dir=out" << "action=block" << "protocol=any"
                               << "remoteip=" + resolvers.join(','));
    if (dnsOk) {
        LOG_INFO(QString("DNS lock applied: %1 public resolvers blocked").arg(resolvers.size()));
    } else {
        LOG_ERROR("Failed to apply DNS lock rule");
    }

    const bool dotOk = addRule(dotRuleName(), QStringList()
                               << "dir=out" << "action=block" << "protocol=tcp" << "remoteport=853");
    if (dotOk) {
        LOG_INFO("DoT lock applied: outbound TCP 853 blocked");
    } else {
        LOG_ERROR("Failed to apply DoT lock rule");
    }

    return dnsOk && dotOk;
}

bool FirewallManager::removeDnsLock()
{
    QMutexLocker locker(&m_mutex);

    const bool dnsOk = deleteRule(dnsRuleName());
    const bool dotOk = deleteRule(dotRuleName());
    if (dnsOk || dotOk) {
        LOG_INFO("DNS lock removed");
    }
    return dnsOk && dotOk;
}

bool FirewallManager::isDnsLocked()
{
    QMutexLocker locker(&m_mutex);
    return ruleExists(dnsRuleName()) && ruleExists(dotRuleName());
}

bool FirewallManager::enableAllowlistMode(const QStringList& domains)
{
    const QStringList normalized = HostsFile::normalizeDomains(domains);
    if (normalized.isEmpty()) {
        LOG_WARNING("Refusing to enable allow-list mode with no valid domains");
        return false;
    }

    // The refresh loop must be down before its rules are replaced
    m_refreshWorker->stopLoop();

    {
        QMutexLocker locker(&m_mutex);

        if (m_allowlistActive) {
            // Rewritten in place below, so the block never lapses
            LOG_INFO("Allow-list already active, replacing its rules");
        } else {
            removeAllowlistRules();
        }

        m_allowlistDomains = normalized;
        m_systemResolvers = querySystemResolvers();
        const QList<QHostAddress> allowed = resolveAll(m_allowlistDomains);
        if (!installAllowlistRules(allowed)) {
            LOG_ERROR("Failed to install allow-list rules, rolling back");
            removeAllowlistRules();
            m_allowlistActive = false;
            QString error;
            if (!AtomicFile::removeFile(m_flagPath, &error)) {
                LOG_WARNING("Could not clear allow-list flag: " + error);
            }
            return false;
        }

        m_allowlistActive = true;
        QString error;
        if (AtomicFile::writeFlag(m_flagPath, &error) != AtomicFile::Ok) {
            LOG_WARNING("Could not persist allow-list flag: " + error);
        }
        LOG_INFO(QString("Allow-list mode active: %1 domains, %2 addresses")
                     .arg(m_allowlistDomains.size()).arg(allowed.size()));
    }

    m_refreshWorker->startLoop();
    emit allowlistStateChanged(true);
    return true;
}

bool FirewallManager::disableAllowlistMode()
{
    m_refreshWorker->stopLoop();

    QMutexLocker locker(&m_mutex);
    const bool wasActive = m_allowlistActive;

    removeAllowlistRules();
    m_allowlistActive = false;
    m_allowlistDomains.clear();
    m_lastResolved.clear();

    QString error;
    if (!AtomicFile::removeFile(m_flagPath, &error)) {
        LOG_WARNING("Could not clear allow-list flag: " + error);
    }

    if (wasActive) {
        LOG_INFO("Allow-list mode disabled, full network access restored");
        locker.unlock();
        emit allowlistStateChanged(false);
    }
    return true;
}

bool FirewallManager::refreshAllowlist()
{
    QMutexLocker locker(&m_mutex);
    if (!m_allowlistActive) {
        return false;
    }

    LOG_DEBUG("Refreshing allow-list addresses");
    const QList<QHostAddress> allowed = resolveAll(m_allowlistDomains);

    const QList<QHostAddress> systemResolvers = querySystemResolvers();
    if (!systemResolvers.isEmpty()) {
        m_systemResolvers = systemResolvers;
    }

    // Rules are rewritten, never deleted, so a failing netsh leaves the
    // previous set in force
    if (!installAllowlistRules(allowed)) {
        LOG_WARNING("Allow-list refresh failed, previous rules kept until the next cycle");
        return false;
    }
    return true;
}

bool FirewallManager::isAllowlistActive() const
{
    QMutexLocker locker(&m_mutex);
    return m_allowlistActive;
}

QStringList FirewallManager::allowlistDomains() const
{
    QMutexLocker locker(&m_mutex);
    return m_allowlistDomains;
}

bool FirewallManager::isRefreshRunning() const
{
    return m_refreshWorker->isRunning();
}

void FirewallManager::stopRefreshLoop()
{
    m_refreshWorker->stopLoop();
}

QList<QHostAddress> FirewallManager::systemResolvers() const
{
    QMutexLocker locker(&m_mutex);
    return m_systemResolvers;
}

bool FirewallManager::cleanupOrphanedRules()
{
    if (!AtomicFile::exists(m_flagPath)) {
        return false;
    }

    LOG_WARNING("Allow-list flag found from a previous run, removing orphaned rules");

    QMutexLocker locker(&m_mutex);
    removeAllowlistRules();
    m_allowlistActive = false;

    QString error;
    if (!AtomicFile::removeFile(m_flagPath, &error)) {
        LOG_WARNING("Could not clear allow-list flag: " + error);
    }
    return true;
}

bool FirewallManager::cleanupAllRules()
{
    const bool allowlistCleared = disableAllowlistMode();
    const bool removed = removeDnsLock();
    LOG_INFO("All firewall rules cleaned up");
    return allowlistCleared && removed;
}

void FirewallManager::setRefreshIntervalSeconds(int seconds)
{
    if (seconds < kMinimumRefreshSeconds) {
        LOG_WARNING(QString("Allow-list refresh interval %1 s raised to %2 s").arg(seconds).arg(kMinimumRefreshSeconds));
        seconds = kMinimumRefreshSeconds;
    }
    m_refreshWorker->setInterval(seconds * 1000);
}

void FirewallManager::setResolverAddresses(const QStringList& addresses)
{
    QMutexLocker locker(&m_mutex);
    m_resolverAddresses = addresses;
}

QList<QHostAddress> FirewallManager::resolveAll(const QStringList& domains)
{
    QList<QHostAddress> allowed;
    for (const QString& domain : domains) {
        QList<QHostAddress> addresses = m_resolver ? m_resolver->resolve(domain) : QList<QHostAddress>();

        if (addresses.isEmpty()) {
            // Keep the last good answer so one failed lookup does not cut the site off
            addresses = m_lastResolved.value(domain);
            if (!addresses.isEmpty()) {
                LOG_WARNING(QString("Could not resolve %1, keeping %2 cached addresses").arg(domain).arg(addresses.size()));
            } else {
                LOG_WARNING(QString("Could not resolve %1").arg(domain));
            }
        } else {
            m_lastResolved.insert(domain, addresses);
        }

        for (const QHostAddress& address : addresses) {
            if (!allowed.contains(address)) {
                allowed.append(address);
            }
        }
    }
    return allowed;
}

QList<IpRange> FirewallManager::excludedRanges(QAbstractSocket::NetworkLayerProtocol family,
                                               const QList<QHostAddress>& allowed) const
{
    QList<IpRange> ranges;
    if (family == QAbstractSocket::IPv4Protocol) {
        for (const char* cidr : kReservedV4) {
            ranges.append(IpRange::fromCidr(QString::fromLatin1(cidr)));
        }
    } else {
        for (const char* cidr : kReservedV6) {
            ranges.append(IpRange::fromCidr(QString::fromLatin1(cidr)));
        }
    }

    for (const QString& resolver : m_resolverAddresses) {
        const QHostAddress address(resolver);
        if (address.protocol() == family) {
            ranges.append(IpRange::single(address));
        }
    }

    for (const QHostAddress& address : m_systemResolvers) {
        if (address.protocol() == family) {
            ranges.append(IpRange::single(address));
        }
    }

    for (const QHostAddress& address : allowed) {
        if (address.protocol() == family) {
            ranges.append(IpRange::single(address));
        }
    }
    return ranges;
}

QList<QHostAddress> FirewallManager::querySystemResolvers()
{
    QList<QHostAddress> resolvers;
    if (!m_commandRunner) {
        return resolvers;
    }

    const QStringList families = QStringList() << "ipv4" << "ipv6";
    for (const QString& family : families) {
        const CommandResult result = m_commandRunner->run(
            "netsh", QStringList() << "interface" << family << "show" << "dnsservers", kNetshTimeoutMs);
        if (!result.succeeded()) {
            LOG_DEBUG(QString("Could not list %1 DNS servers: %2").arg(family, result.output.trimmed()));
            continue;
        }

        // Addresses sit at the end of the label lines and alone on continuation lines
        const QStringList tokens = result.output.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        for (const QString& token : tokens) {
            QHostAddress address;
            if (!kAddressToken.match(token).hasMatch() || !address.setAddress(token) || address.isLoopback()) {
                continue;
            }
            address.setScopeId(QString());
            if (!resolvers.contains(address)) {
                resolvers.append(address);
            }
        }
    }

    if (!resolvers.isEmpty()) {
        QStringList printable;
        for (const QHostAddress& address : resolvers) {
            printable.append(address.toString());
        }
        LOG_DEBUG("System DNS servers kept reachable: " + printable.join(", "));
    }
    return resolvers;
}

bool FirewallManager::installAllowlistRules(const QList<QHostAddress>& allowed)
{
    const QStringList names = allowlistRuleNames();

    // Block rules win over allow rules in the Windows firewall, so the deny
    // side is every address except the permitted ones
    const QList<QAbstractSocket::NetworkLayerProtocol> families =
        QList<QAbstractSocket::NetworkLayerProtocol>() << QAbstractSocket::IPv4Protocol << QAbstractSocket::IPv6Protocol;

    for (int i = 0; i < families.size(); ++i) {
        QStringList blocked;
        for (const IpRange& range : IpRange::complement(excludedRanges(families.at(i), allowed), families.at(i))) {
            blocked.append(range.toString());
        }
        if (blocked.isEmpty()) {
            continue;
        }

        if (!writeRule(names.at(i), QStringList() << "dir=out" << "action=block" << "protocol=any"
                                                  << "remoteip=" + blocked.join(','))) {
            LOG_ERROR("Failed to write allow-list block rule " + names.at(i));
            return false;
        }
    }

    if (!allowed.isEmpty()) {
        QStringList addresses;
        for (const QHostAddress& address : allowed) {
            addresses.append(address.toString());
        }
        if (!writeRule(names.at(2), QStringList() << "dir=out" << "action=allow" << "protocol=any"
                                                  << "remoteip=" + addresses.join(','))) {
            LOG_WARNING("Failed to write allow rule for the resolved addresses");
        }
    }

    if (!writeRule(names.at(3), QStringList() << "dir=out" << "action=allow" << "protocol=any"
                                              << "remoteip=localsubnet,dns,dhcp,defaultgateway")) {
        LOG_WARNING("Failed to write essential allow rule");
    }

    LOG_DEBUG(QString("Allow-list rules written for %1 addresses").arg(allowed.size()));
    return true;
}

void FirewallManager::removeAllowlistRules()
{
    for (const QString& name : allowlistRuleNames()) {
        deleteRule(name);
    }
}

bool FirewallManager::addRule(const QString& name, const QStringList& parameters)
{
    if (!m_commandRunner) {
        return false;
    }

    QStringList arguments;
    arguments << "advfirewall" << "firewall" << "add" << "rule" << "name=" + name;
    arguments << parameters;
    arguments << "enable=yes";

    const CommandResult result = m_commandRunner->run("netsh", arguments, kNetshTimeoutMs);
    if (!result.succeeded()) {
        LOG_WARNING(QString("netsh add rule %1 failed: %2").arg(name, result.output.trimmed()));
        return false;
    }
    return true;
}

bool FirewallManager::writeRule(const QString& name, const QStringList& parameters)
{
    if (!m_commandRunner) {
        return false;
    }

    // Updating in place keeps the rule enforced while its addresses change
    QStringList arguments;
    arguments << "advfirewall" << "firewall" << "set" << "rule" << "name=" + name << "new";
    arguments << parameters;

    const CommandResult result = m_commandRunner->run("netsh", arguments, kNetshTimeoutMs);
    if (result.succeeded()) {
        return true;
    }
    if (ruleExists(name)) {
        LOG_WARNING(QString("netsh set rule %1 failed: %2").arg(name, result.output.trimmed()));
        return false;
    }
    return addRule(name, parameters);
}

bool FirewallManager::deleteRule(const QString& name)
{
    if (!m_commandRunner) {
        return false;
    }

    // Removes every rule carrying the name in one call, and is a harmless
    // failure when none exists
    const CommandResult result = m_commandRunner->run(
        "netsh", QStringList() << "advfirewall" << "firewall" << "delete" << "rule" << "name=" + name,
        kNetshTimeoutMs);
    return result.succeeded();
}

bool FirewallManager::ruleExists(const QString& name)
{
    if (!m_commandRunner) {
        return false;
    }

    const CommandResult result = m_commandRunner->run(
        "netsh", QStringList() << "advfirewall" << "firewall" << "show" << "rule" << "name=" + name,
        kNetshTimeoutMs);
    return result.succeeded() && result.output.contains(name);
}
