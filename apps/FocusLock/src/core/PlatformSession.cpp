#include "PlatformSession.h"
#include "HostsManager.h"
#include "Notifier.h"
#include "PeriodicWorker.h"
#include "ProcessManager.h"
#include "logger/logger.h"

PlatformSession::PlatformSession(const Platform& platform,
                                 UsageTracker* usageTracker,
                                 HostsManager* hostsManager,
                                 ProcessManager* processManager,
                                 Notifier* notifier,
                                 const QList<int>& warningMinutes,
                                 int tickMs,
                                 QObject* parent)
    : QObject(parent)
    , m_platform(platform)
    , m_usageTracker(usageTracker)
    , m_hostsManager(hostsManager)
    , m_processManager(processManager)
    , m_notifier(notifier)
    , m_warnings(warningMinutes)
    , m_worker(nullptr)
    , m_state(Idle)
{
    m_worker = new PeriodicWorker(QString("usage-%1").arg(platform.id), tickMs, [this]() { onTick(); }, this);
}

PlatformSession::~PlatformSession()
{
    m_worker->stopLoop();
}

bool PlatformSession::start(const QDateTime& now)
{
    QMutexLocker locker(&m_mutex);

    if (m_state == Running) {
        return true;
    }

    const UsageSnapshot usage = m_usageTracker->snapshot(m_platform, now);
    if (usage.blocked) {
        LOG_INFO(m_platform.displayName + " allowance already spent for today, start refused");
        Notifier::deliver(m_notifier, m_platform.displayName,
                          "Daily limit reached. Access opens again after the reset hour.");
        m_state = Exhausted;
        return false;
    }

    const HostsManager::Result result = m_hostsManager->remove(m_platform.markerId());
    if (!HostsManager::isSuccess(result)) {
        LOG_ERROR(QString("Cannot unblock %1: %2").arg(m_platform.displayName, HostsManager::resultToString(result)));
        return false;
    }

    const bool resuming = m_state == Paused;
    if (!resuming) {
        m_warnings.reset();
        m_usageTracker->incrementSessionCount(m_platform, now);
    }

    m_state = Running;
    m_elapsed.start();
    locker.unlock();

    // The loop takes m_mutex in its tick, so it is started unlocked. A stop
    // that slipped in meanwhile already ended the session.
    m_worker->startLoop();
    if (!isRunning()) {
        m_worker->stopLoop();
        return false;
    }

    LOG_INFO(QString("%1 session %2, %3 remaining")
                 .arg(m_platform.displayName, resuming ? "resumed" : "started",
                      UsageTracker::formatSeconds(usage.remainingSeconds)));
    emit stateChanged(m_platform.id, Running);
    return true;
}

bool PlatformSession::pause(const QDateTime& now)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != Running) {
            return false;
        }
    }

    endSession(Paused, now);
    return true;
}

bool PlatformSession::stop(const QDateTime& now)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_state == Idle) {
            return false;
        }
        if (m_state != Running) {
            m_state = Idle;
            locker.unlock();
            emit stateChanged(m_platform.id, Idle);
            return true;
        }
    }

    endSession(Idle, now);
    return true;
}

UsageSnapshot PlatformSession::accountUsage(double seconds, const QDateTime& now)
{
    QMutexLocker locker(&m_mutex);

    if (m_state != Running) {
        return m_usageTracker->snapshot(m_platform, now);
    }

    const UsageSnapshot usage = m_usageTracker->addUsage(m_platform, seconds, now);
    locker.unlock();

    emit usageUpdated(m_platform.id, usage.remainingSeconds);

    const int threshold = m_warnings.check(usage.remainingSeconds);
    if (threshold > 0) {
        LOG_INFO(QString("%1: %2 minute warning").arg(m_platform.displayName).arg(threshold));
        Notifier::deliver(m_notifier, m_platform.displayName,
                          QString("%1 left today").arg(UsageTracker::formatSeconds(usage.remainingSeconds)));
        emit warningIssued(m_platform.id, threshold);
    }

    if (usage.blocked) {
        locker.relock();
        if (m_state != Running) {
            return usage;
        }
        m_state = Exhausted;
        locker.unlock();

        LOG_INFO(m_platform.displayName + " allowance exhausted, blocking");
        m_worker->stopLoop();
        blockPlatform();
        Notifier::deliver(m_notifier, m_platform.displayName, "Time is up. Blocked until the daily reset.");
        emit allowanceExhausted(m_platform.id);
        emit stateChanged(m_platform.id, Exhausted);
    }
    return usage;
}

PlatformSession::State PlatformSession::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

bool PlatformSession::isRunning() const
{
    return state() == Running;
}

const Platform& PlatformSession::platform() const
{
    return m_platform;
}

UsageSnapshot PlatformSession::snapshot(const QDateTime& now) const
{
    return m_usageTracker->snapshot(m_platform, now);
}

QString PlatformSession::stateToString(State state)
{
    switch (state) {
    case Idle:      return "Idle";
    case Running:   return "Running";
    case Paused:    return "Paused";
    case Exhausted: return "Exhausted";
    }
    return "Unknown";
}

void PlatformSession::onTick()
{
    double seconds = 0.0;
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != Running) {
            return;
        }
        seconds = m_elapsed.restart() / 1000.0;
    }
    accountUsage(seconds, QDateTime::currentDateTime());
}

void PlatformSession::endSession(State newState, const QDateTime& now)
{
    // The loop takes m_mutex in its tick, so it is stopped unlocked
    m_worker->stopLoop();

    double seconds = 0.0;
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != Running) {
            return;
        }
        seconds = m_elapsed.restart() / 1000.0;
        if (seconds > 0.0) {
            m_usageTracker->addUsage(m_platform, seconds, now);
        }
        m_state = newState;
    }

    blockPlatform();
    LOG_INFO(QString("%1 session %2").arg(m_platform.displayName, newState == Paused ? "paused" : "stopped"));
    emit stateChanged(m_platform.id, newState);
}

bool PlatformSession::blockPlatform()
{
    const HostsManager::Result result = m_hostsManager->apply(
        m_platform.markerId(), m_platform.domains, QString("FocusLock - %1 block").arg(m_platform.displayName));
    if (!HostsManager::isSuccess(result)) {
        LOG_WARNING(QString("Failed to block %1 (%2), integrity monitor will retry")
                        .arg(m_platform.displayName, HostsManager::resultToString(result)));
    }

    if (m_processManager && m_processManager->isPlatformRunning(m_platform)) {
        m_processManager->killPlatformProcesses(m_platform);
    }
    return HostsManager::isSuccess(result);
}
