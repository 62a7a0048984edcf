#include "IntegrityMonitor.h"
#include "BlockPolicy.h"
#include "FirewallManager.h"
#include "HostsManager.h"
#include "PeriodicWorker.h"
#include "logger/logger.h"

IntegrityMonitor::IntegrityMonitor(HostsManager* hostsManager,
                                   FirewallManager* firewallManager,
                                   BlockPolicy* policy,
                                   int intervalMs,
                                   QObject* parent)
    : QObject(parent)
    , m_hostsManager(hostsManager)
    , m_firewallManager(firewallManager)
    , m_policy(policy)
    , m_worker(nullptr)
{
    m_worker = new PeriodicWorker("integrity", intervalMs, [this]() { checkOnce(); }, this);
}

IntegrityMonitor::~IntegrityMonitor()
{
    m_worker->stopLoop();
}

bool IntegrityMonitor::start()
{
    LOG_INFO(QString("Integrity monitor started (every %1 ms)").arg(m_worker->interval()));
    return m_worker->startLoop();
}

void IntegrityMonitor::stop()
{
    m_worker->stopLoop();
    LOG_INFO("Integrity monitor stopped");
}

bool IntegrityMonitor::isRunning() const
{
    return m_worker->isRunning();
}

IntegrityMonitor::Report IntegrityMonitor::checkOnce()
{
    Report report;

    const QList<HostsBlock> blocks = m_policy ? m_policy->enforcedBlocks() : QList<HostsBlock>();
    for (const HostsBlock& block : blocks) {
        ++report.regionsChecked;

        const HostsManager::Result result = m_hostsManager->apply(block.markerId, block.domains, block.description);
        if (result == HostsManager::Applied) {
            ++report.regionsRepaired;
            LOG_WARNING(QString("Hosts region %1 drifted from its intended state, re-applied").arg(block.markerId));
            emit driftRepaired(block.markerId);
        } else if (!HostsManager::isSuccess(result)) {
            // Transient here, the next tick retries
            ++report.failures;
            LOG_WARNING(QString("Integrity check could not assert %1: %2")
                            .arg(block.markerId, HostsManager::resultToString(result)));
        }
    }

    const QStringList lifted = m_policy ? m_policy->liftedMarkers() : QStringList();
    for (const QString& markerId : lifted) {
        const HostsManager::Result result = m_hostsManager->remove(markerId);
        if (result == HostsManager::Applied) {
            ++report.regionsLifted;
            LOG_INFO(QString("Hosts region %1 present during a running session, removed").arg(markerId));
        } else if (!HostsManager::isSuccess(result)) {
            ++report.failures;
            LOG_WARNING(QString("Integrity check could not lift %1: %2")
                            .arg(markerId, HostsManager::resultToString(result)));
        }
    }

    if (m_firewallManager && !m_firewallManager->isDnsLocked()) {
        LOG_WARNING("DNS lock rules missing, re-applying");
        if (m_firewallManager->applyDnsLock()) {
            report.dnsLockRepaired = true;
            emit dnsLockRepaired();
        } else {
            ++report.failures;
        }
    }

    if (report.regionsRepaired == 0 && report.regionsLifted == 0 && report.failures == 0 && !report.dnsLockRepaired) {
        LOG_DEBUG(QString("Integrity check clean (%1 regions)").arg(report.regionsChecked));
    }
    return report;
}
