#include "FocusLockService.h"
#include "../core/AtomicFile.h"
#include "../core/BlackoutSession.h"
#include "../core/CommandRunner.h"
#include "../core/DomainResolver.h"
#include "../core/FirewallManager.h"
#include "../core/HostsManager.h"
#include "../core/IntegrityMonitor.h"
#include "../core/Notifier.h"
#include "../core/PermanentBlockStore.h"
#include "../core/PlatformSession.h"
#include "../core/ProcessManager.h"
#include "../core/ScheduleManager.h"
#include "../core/TimedBlock.h"
#include "../core/UsageTracker.h"
#include "../managers/ConfigManager.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <csignal>

// Signal handler for graceful shutdown
void signalHandler(int signal)
{
    LOG_INFO(QString("Received signal: %1").arg(signal));
    QCoreApplication::quit();
}

FocusLockService::FocusLockService(CommandRunner* commandRunner,
                                   DomainResolver* resolver,
                                   Notifier* notifier,
                                   QObject *parent)
    : QObject(parent)
    , m_commandRunner(commandRunner)
    , m_resolver(resolver)
    , m_notifier(notifier)
    , m_configManager(nullptr)
    , m_hostsManager(nullptr)
    , m_firewallManager(nullptr)
    , m_permanentBlocks(nullptr)
    , m_blackoutSession(nullptr)
    , m_scheduleManager(nullptr)
    , m_integrityMonitor(nullptr)
    , m_timedBlock(nullptr)
    , m_initialized(false)
    , m_isRunning(false)
{
    if (!m_commandRunner) {
        m_ownedCommandRunner.reset(new ProcessCommandRunner());
        m_commandRunner = m_ownedCommandRunner.data();
    }
    if (!m_resolver) {
        m_ownedResolver.reset(new HostInfoResolver());
        m_resolver = m_ownedResolver.data();
    }
    if (!m_notifier) {
        m_notifier = new LogNotifier(this);
    }

    setupSignalHandlers();
}

FocusLockService::~FocusLockService()
{
    if (m_isRunning) {
        stop();
    }

    // Child engines outlive the runner, resolver and tracker below, so no
    // loop may still be calling into them
    stopLoops();
}

void FocusLockService::stopLoops()
{
    if (m_integrityMonitor) {
        m_integrityMonitor->stop();
    }
    if (m_scheduleManager) {
        m_scheduleManager->stop();
    }
    for (PlatformSession* session : m_sessions) {
        session->stop();
    }
    if (m_timedBlock) {
        m_timedBlock->stopLoop();
    }
    if (m_blackoutSession) {
        m_blackoutSession->stopLoop();
    }
    if (m_firewallManager) {
        m_firewallManager->stopRefreshLoop();
    }
}

QString FocusLockService::permanentMarkerId()
{
    return "FOCUSLOCK-PERMANENT";
}

bool FocusLockService::initialize()
{
    if (m_initialized) {
        LOG_WARNING("FocusLockService already initialized");
        return true;
    }

    LOG_INFO("Initializing FocusLockService");

    m_configManager = new ConfigManager(this);
    if (!m_configManager->initialize()) {
        LOG_ERROR("Failed to initialize ConfigManager");
        return false;
    }

    if (!m_configManager->loadLocalConfig()) {
        LOG_WARNING("Failed to load configuration file, using defaults");
    }

    if (!createComponents()) {
        return false;
    }

    // A blackout that survived a kill is rebuilt before anything else
    if (m_blackoutSession->restore()) {
        LOG_INFO(QString("Blackout resumed, %1 seconds remaining (locked: %2)")
                     .arg(m_blackoutSession->remainingSeconds())
                     .arg(m_blackoutSession->isLocked() ? "yes" : "no"));
    }
    if (m_timedBlock->restore()) {
        LOG_INFO(QString("Platform block resumed for %1, %2 seconds remaining")
                     .arg(m_timedBlock->platformIds().join(", "))
                     .arg(m_timedBlock->remainingSeconds()));
    }

    if (!applyPermanentBlock()) {
        LOG_FATAL("Permanent block could not be applied, refusing to run unprotected");
        return false;
    }

    blockAllPlatforms();

    if (!m_firewallManager->applyDnsLock()) {
        LOG_FATAL("DNS lock could not be installed, refusing to run unprotected");
        return false;
    }

    const bool wasAllowlistActive = AtomicFile::exists(m_firewallManager->flagPath());
    if (m_firewallManager->cleanupOrphanedRules()) {
        LOG_WARNING("Removed allow-list rules left over from an unclean shutdown");
    }

    if (wasAllowlistActive && m_configManager->reapplyAllowlistOnBoot()) {
        LOG_INFO("Allow-list mode was active at shutdown, re-enabling");
        if (!enableAllowlist()) {
            LOG_ERROR("Failed to re-enable allow-list mode");
        }
    }

    m_initialized = true;
    LOG_INFO("FocusLockService initialized successfully");
    return true;
}

bool FocusLockService::createComponents()
{
    const QString dataDir = m_configManager->dataDir();
    if (!QDir().mkpath(dataDir)) {
        LOG_ERROR("Failed to create data directory: " + dataDir);
        return false;
    }

    m_hostsManager = new HostsManager(m_configManager->hostsFilePath(),
                                      m_configManager->dataFilePath("hosts.backup"),
                                      m_configManager->redirectAddress(),
                                      m_commandRunner,
                                      this);

    m_firewallManager = new FirewallManager(m_configManager->firewallRulePrefix(),
                                            m_configManager->dataFilePath("allowlist_active.flag"),
                                            m_commandRunner,
                                            m_resolver,
                                            this);
    m_firewallManager->setRefreshIntervalSeconds(m_configManager->allowlistRefreshSeconds());
    m_firewallManager->setResolverAddresses(m_configManager->allowlistResolvers());

    m_processManager.reset(new ProcessManager(m_commandRunner));
    m_usageTracker.reset(new UsageTracker(dataDir, m_configManager->resetHour()));

    m_permanentBlocks = new PermanentBlockStore(m_configManager->dataFilePath("permanent_blocks.json"),
                                                ConfigManager::defaultPermanentDomains(),
                                                this);
    if (!m_permanentBlocks->load()) {
        LOG_WARNING("Permanent block list could not be read, using the built-in list only");
    }
    connect(m_permanentBlocks, &PermanentBlockStore::blocksChanged,
            this, &FocusLockService::onPermanentBlocksChanged);

    m_platforms = m_configManager->platforms();
    QStringList platformIds;
    for (const Platform& platform : m_platforms) {
        PlatformSession* session = new PlatformSession(platform, m_usageTracker.data(), m_hostsManager,
                                                       m_processManager.data(), m_notifier,
                                                       m_configManager->warningSteps(),
                                                       m_configManager->usageTickMs(),
                                                       this);
        m_sessions.insert(platform.id, session);
        platformIds << platform.id;
    }

    m_timedBlock = new TimedBlock(m_configManager->dataFilePath("web_block_state.json"),
                                  platformIds, m_notifier, 1000, this);
    connect(m_timedBlock, &TimedBlock::blockStarted,
            this, &FocusLockService::onTimedBlockStarted);

    m_blackoutSession = new BlackoutSession(m_configManager->dataFilePath("blackout_state.json"),
                                            m_configManager->dataFilePath("blackout.lock"),
                                            m_notifier,
                                            1000,
                                            this);

    m_scheduleManager = new ScheduleManager(m_configManager->dataFilePath("schedules.json"),
                                            m_blackoutSession,
                                            m_configManager->scheduleIntervalMs(),
                                            this);
    if (!m_scheduleManager->load()) {
        LOG_WARNING("Schedules could not be read, starting with none");
    }

    m_integrityMonitor = new IntegrityMonitor(m_hostsManager, m_firewallManager, this,
                                              m_configManager->integrityIntervalMs(),
                                              this);
    return true;
}

bool FocusLockService::start()
{
    if (m_isRunning) {
        LOG_WARNING("FocusLockService is already running");
        return true;
    }

    if (!m_initialized) {
        LOG_ERROR("FocusLockService not initialized");
        return false;
    }

    LOG_INFO("Starting FocusLockService");

    if (!m_blackoutSession->startLoop()) {
        LOG_ERROR("Failed to start blackout countdown");
        return false;
    }

    if (!m_timedBlock->startLoop()) {
        LOG_ERROR("Failed to start platform block countdown");
        return false;
    }

    if (!m_scheduleManager->start()) {
        LOG_ERROR("Failed to start scheduler");
        return false;
    }

    if (!m_integrityMonitor->start()) {
        LOG_ERROR("Failed to start integrity monitor");
        return false;
    }

    m_isRunning = true;
    LOG_INFO("FocusLockService started successfully");
    return true;
}

bool FocusLockService::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("FocusLockService is not running");
        return true;
    }

    LOG_INFO("Stopping FocusLockService");

    m_integrityMonitor->stop();
    m_scheduleManager->stop();
    m_blackoutSession->stopLoop();
    m_timedBlock->stopLoop();

    // Exit fail-safe: everything blocked, the DNS lock stays installed
    for (PlatformSession* session : m_sessions) {
        session->stop();
    }
    blockAllPlatforms();
    if (!applyPermanentBlock()) {
        LOG_ERROR("Failed to re-assert the permanent block on shutdown");
    }
    if (m_firewallManager->isAllowlistActive() && !m_firewallManager->disableAllowlistMode()) {
        LOG_ERROR("Failed to disable allow-list mode on shutdown");
    }

    m_isRunning = false;
    LOG_INFO("FocusLockService stopped successfully");
    return true;
}

bool FocusLockService::isRunning() const
{
    return m_isRunning;
}

HostsBlock FocusLockService::permanentBlock() const
{
    HostsBlock block;
    block.markerId = permanentMarkerId();
    block.description = "FocusLock - permanent block";
    block.domains = m_permanentBlocks ? m_permanentBlocks->allDomains() : QStringList();
    return block;
}

QList<HostsBlock> FocusLockService::enforcedBlocks() const
{
    QList<HostsBlock> blocks;
    blocks << permanentBlock();

    for (const Platform& platform : m_platforms) {
        PlatformSession* session = m_sessions.value(platform.id);
        if (session && session->isRunning()) {
            continue;
        }
        HostsBlock block;
        block.markerId = platform.markerId();
        block.description = QString("FocusLock - %1 block").arg(platform.displayName);
        block.domains = platform.domains;
        blocks << block;
    }
    return blocks;
}

QStringList FocusLockService::liftedMarkers() const
{
    QStringList markers;
    for (const Platform& platform : m_platforms) {
        PlatformSession* session = m_sessions.value(platform.id);
        if (session && session->isRunning()) {
            markers << platform.markerId();
        }
    }
    return markers;
}

PlatformSession* FocusLockService::platformSession(const QString& platformId) const
{
    return m_sessions.value(platformId, nullptr);
}

bool FocusLockService::startPlatformSession(const QString& platformId)
{
    PlatformSession* session = platformSession(platformId);
    if (!session) {
        LOG_WARNING("Unknown platform: " + platformId);
        return false;
    }
    if (m_timedBlock->blocksPlatform(platformId)) {
        LOG_INFO(QString("%1 is under a platform block for %2 more seconds, session refused")
                     .arg(session->platform().displayName).arg(m_timedBlock->remainingSeconds()));
        Notifier::deliver(m_notifier, session->platform().displayName,
                          "Blocked until the platform block ends.");
        return false;
    }
    return session->start();
}

bool FocusLockService::pausePlatformSession(const QString& platformId)
{
    PlatformSession* session = platformSession(platformId);
    if (!session) {
        LOG_WARNING("Unknown platform: " + platformId);
        return false;
    }
    return session->pause();
}

bool FocusLockService::stopPlatformSession(const QString& platformId)
{
    PlatformSession* session = platformSession(platformId);
    if (!session) {
        LOG_WARNING("Unknown platform: " + platformId);
        return false;
    }
    return session->stop();
}

bool FocusLockService::startBlackout(int minutes, bool locked)
{
    const BlackoutSession::StartResult result = m_blackoutSession->start(minutes, locked);
    LOG_INFO(QString("Blackout request for %1 minutes: %2")
                 .arg(minutes).arg(BlackoutSession::startResultToString(result)));
    return result == BlackoutSession::Started || result == BlackoutSession::Restarted;
}

bool FocusLockService::startTimedBlock(const QStringList& platformIds, int minutes, bool locked)
{
    const TimedBlock::StartResult result = m_timedBlock->start(platformIds, minutes, locked);
    LOG_INFO(QString("Platform block request for %1 minutes: %2")
                 .arg(minutes).arg(TimedBlock::startResultToString(result)));
    return result == TimedBlock::Started || result == TimedBlock::Restarted;
}

bool FocusLockService::stopTimedBlock()
{
    const TimedBlock::StopResult result = m_timedBlock->stop();
    LOG_INFO("Platform block stop request: " + TimedBlock::stopResultToString(result));
    return result == TimedBlock::Stopped;
}

bool FocusLockService::enableAllowlist()
{
    const QStringList domains = m_configManager->allowlistDomains();
    if (domains.isEmpty()) {
        LOG_WARNING("Allow-list is empty, refusing to cut off all traffic");
        return false;
    }
    return m_firewallManager->enableAllowlistMode(domains);
}

bool FocusLockService::disableAllowlist()
{
    return m_firewallManager->disableAllowlistMode();
}

void FocusLockService::onPermanentBlocksChanged()
{
    LOG_INFO("Permanent block list changed, re-applying");
    if (!applyPermanentBlock()) {
        LOG_WARNING("Permanent block re-apply failed, integrity monitor will retry");
    }
}

void FocusLockService::onTimedBlockStarted(const QStringList& platformIds)
{
    // Open sessions close at once; stop() puts the region back
    for (const QString& platformId : platformIds) {
        PlatformSession* session = m_sessions.value(platformId);
        if (session && session->state() != PlatformSession::Idle) {
            session->stop();
        }
    }
    blockAllPlatforms();
}

bool FocusLockService::applyPermanentBlock()
{
    const HostsBlock block = permanentBlock();
    const HostsManager::Result result = m_hostsManager->apply(block.markerId, block.domains, block.description);
    if (!HostsManager::isSuccess(result)) {
        LOG_ERROR("Permanent block failed: " + HostsManager::resultToString(result));
        return false;
    }
    return true;
}

void FocusLockService::blockAllPlatforms()
{
    for (const HostsBlock& block : enforcedBlocks()) {
        if (block.markerId == permanentMarkerId()) {
            continue;
        }
        const HostsManager::Result result = m_hostsManager->apply(block.markerId, block.domains, block.description);
        if (!HostsManager::isSuccess(result)) {
            LOG_ERROR(QString("Failed to block %1: %2").arg(block.markerId, HostsManager::resultToString(result)));
        }
    }
}

void FocusLockService::setupSignalHandlers()
{
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGHUP, signalHandler);
#endif
}
