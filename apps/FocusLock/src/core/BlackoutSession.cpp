#include "BlackoutSession.h"
#include "AtomicFile.h"
#include "Notifier.h"
#include "PeriodicWorker.h"
#include "logger/logger.h"
#include <QJsonObject>

BlackoutSession::BlackoutSession(const QString& stateFilePath,
                                 const QString& watchdogLockPath,
                                 Notifier* notifier,
                                 int tickMs,
                                 QObject* parent)
    : QObject(parent)
    , m_stateFilePath(stateFilePath)
    , m_watchdogLockPath(watchdogLockPath)
    , m_notifier(notifier)
    , m_worker(nullptr)
    , m_active(false)
    , m_locked(false)
    , m_durationMinutes(0)
    , m_nextTaskId(1)
{
    m_worker = new PeriodicWorker("blackout-countdown", tickMs, [this]() { tick(); }, this);
}

BlackoutSession::~BlackoutSession()
{
    m_worker->stopLoop();
}

BlackoutSession::StartResult BlackoutSession::start(int minutes, bool locked, const QDateTime& now)
{
    if (minutes <= 0) {
        LOG_WARNING(QString("Rejected blackout with invalid duration: %1 min").arg(minutes));
        return InvalidDuration;
    }

    StartResult result = Started;
    QDateTime endTime;
    {
        QMutexLocker locker(&m_mutex);

        const bool running = m_active && now < m_endTime;
        if (running && m_locked) {
            LOG_WARNING(QString("Locked blackout running until %1, start request rejected")
                            .arg(m_endTime.toString(Qt::ISODate)));
            return RejectedLocked;
        }
        if (running) {
            result = Restarted;
        }

        m_active = true;
        m_locked = locked;
        m_durationMinutes = minutes;
        m_endTime = now.addSecs(static_cast<qint64>(minutes) * 60);
        endTime = m_endTime;

        if (!persistState()) {
            LOG_ERROR("Blackout state could not be persisted, session will not survive a restart");
        }
    }

    LOG_INFO(QString("Blackout %1 for %2 min until %3%4")
                 .arg(result == Restarted ? "restarted" : "started")
                 .arg(minutes)
                 .arg(endTime.toString("HH:mm:ss"), locked ? " [LOCKED]" : ""));
    emit sessionStarted(endTime, locked);
    return result;
}

BlackoutSession::StopResult BlackoutSession::stop(bool force)
{
    {
        QMutexLocker locker(&m_mutex);

        if (!m_active) {
            return NotActive;
        }
        if (m_locked && !force) {
            LOG_WARNING("Blackout is locked, stop refused");
            return Locked;
        }

        resetState();
    }

    LOG_INFO(force ? "Blackout ended" : "Blackout cancelled");
    emit sessionStopped();
    return Stopped;
}

bool BlackoutSession::restore(const QDateTime& now)
{
    QJsonObject object;
    QString error;
    AtomicFile::Status status = AtomicFile::readJsonObject(m_stateFilePath, object, &error);
    if (status == AtomicFile::NotFound) {
        return false;
    }

    QMutexLocker locker(&m_mutex);

    if (status != AtomicFile::Ok) {
        LOG_WARNING("Discarding unreadable blackout state: " + error);
        clearPersistedState();
        return false;
    }

    const QDateTime endTime = QDateTime::fromString(object.value("end_time").toString(), Qt::ISODate);
    if (!endTime.isValid() || endTime <= now) {
        LOG_INFO("Persisted blackout already expired, clearing it");
        clearPersistedState();
        return false;
    }

    m_active = true;
    m_locked = object.value("locked").toBool(false);
    m_endTime = endTime;
    m_durationMinutes = object.value("duration_minutes").toInt();

    // Rewrites the watchdog lock file too
    if (!persistState()) {
        LOG_WARNING("Could not refresh persisted blackout state");
    }

    const bool locked = m_locked;
    const qint64 remaining = now.secsTo(endTime);
    locker.unlock();

    LOG_INFO(QString("Recovered blackout from previous run: %1 s remaining%2")
                 .arg(remaining).arg(locked ? " [LOCKED]" : ""));
    emit sessionStarted(endTime, locked);
    return true;
}

bool BlackoutSession::isActive(const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    return m_active && now < m_endTime;
}

bool BlackoutSession::isLocked() const
{
    QMutexLocker locker(&m_mutex);
    return m_active && m_locked;
}

QDateTime BlackoutSession::endTime() const
{
    QMutexLocker locker(&m_mutex);
    return m_endTime;
}

int BlackoutSession::durationMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_durationMinutes;
}

qint64 BlackoutSession::remainingSeconds(const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    if (!m_active) {
        return 0;
    }
    return qMax<qint64>(0, now.secsTo(m_endTime));
}

QList<BlackoutSession::QueuedTask> BlackoutSession::queueFocusBlock(int workMinutes, int breakMinutes, bool locked,
                                                                    int delayMinutes, const QDateTime& now)
{
    QList<QueuedTask> queued;
    if (workMinutes <= 0 || breakMinutes < 0 || delayMinutes < 0) {
        LOG_WARNING("Rejected focus block with invalid durations");
        return queued;
    }

    const QDateTime workStart = now.addSecs(static_cast<qint64>(delayMinutes) * 60);
    queued.append(enqueue(QString("Work %1m").arg(workMinutes), workStart, workMinutes, locked));

    if (breakMinutes > 0) {
        // Breaks are never locked, whatever the work block was
        const QDateTime breakStart = workStart.addSecs(static_cast<qint64>(workMinutes) * 60);
        queued.append(enqueue(QString("Break %1m").arg(breakMinutes), breakStart, breakMinutes, false));
    }

    LOG_INFO(QString("Focus block %1/%2 queued%3").arg(workMinutes).arg(breakMinutes).arg(locked ? " [LOCKED]" : ""));
    return queued;
}

BlackoutSession::QueuedTask BlackoutSession::queueAt(const QTime& timeOfDay, int minutes, bool locked, const QDateTime& now)
{
    if (!timeOfDay.isValid() || minutes <= 0) {
        LOG_WARNING("Rejected timed blackout with invalid time or duration");
        return QueuedTask();
    }

    QDateTime trigger(now.date(), QTime(timeOfDay.hour(), timeOfDay.minute()), now.timeZone());
    if (trigger < now) {
        trigger = trigger.addDays(1);
    }
    return enqueue(timeOfDay.toString("HH:mm"), trigger, minutes, locked);
}

bool BlackoutSession::cancelTask(const QString& taskId)
{
    QMutexLocker locker(&m_mutex);
    for (int i = 0; i < m_tasks.size(); ++i) {
        if (m_tasks.at(i).id != taskId) {
            continue;
        }
        if (m_tasks.at(i).locked) {
            LOG_WARNING("Locked task cannot be cancelled: " + m_tasks.at(i).label);
            return false;
        }
        LOG_INFO("Task cancelled: " + m_tasks.at(i).label);
        m_tasks.removeAt(i);
        return true;
    }
    return false;
}

QList<BlackoutSession::QueuedTask> BlackoutSession::pendingTasks() const
{
    QMutexLocker locker(&m_mutex);
    return m_tasks;
}

void BlackoutSession::tick(const QDateTime& now)
{
    bool expired = false;
    {
        // Checked and cleared under one lock so a concurrent restart is never cut short
        QMutexLocker locker(&m_mutex);
        if (m_active && now >= m_endTime) {
            resetState();
            expired = true;
        }
    }

    if (expired) {
        LOG_INFO("Blackout completed");
        Notifier::deliver(m_notifier, "Blackout", "Focus session complete.");
        emit sessionStopped();
        emit sessionCompleted();
    }

    QList<QueuedTask> due;
    {
        QMutexLocker locker(&m_mutex);
        for (const QueuedTask& task : m_tasks) {
            if (now >= task.trigger) {
                due.append(task);
            }
        }
    }

    for (const QueuedTask& task : due) {
        const StartResult result = start(task.minutes, task.locked, now);
        if (result == RejectedLocked) {
            // Stays queued until the locked session is over
            continue;
        }

        {
            QMutexLocker locker(&m_mutex);
            for (int i = 0; i < m_tasks.size(); ++i) {
                if (m_tasks.at(i).id == task.id) {
                    m_tasks.removeAt(i);
                    break;
                }
            }
        }

        if (result == Started || result == Restarted) {
            LOG_INFO(QString("Task triggered: %1 (%2 min blackout)").arg(task.label).arg(task.minutes));
            emit taskTriggered(task.label, task.minutes, task.locked);
        }
    }
}

bool BlackoutSession::startLoop()
{
    return m_worker->startLoop();
}

void BlackoutSession::stopLoop()
{
    m_worker->stopLoop();
}

bool BlackoutSession::isBlackoutActive(const QDateTime& now) const
{
    return isActive(now);
}

bool BlackoutSession::launchBlackout(int minutes, bool locked, const QString& reason, const QDateTime& now)
{
    const StartResult result = start(minutes, locked, now);
    if (result != Started && result != Restarted) {
        LOG_WARNING(QString("%1: blackout not started (%2)").arg(reason, startResultToString(result)));
        return false;
    }
    Notifier::deliver(m_notifier, "Blackout", QString("%1 - %2 minutes").arg(reason).arg(minutes));
    return true;
}

QString BlackoutSession::stateFilePath() const
{
    return m_stateFilePath;
}

QString BlackoutSession::watchdogLockPath() const
{
    return m_watchdogLockPath;
}

QString BlackoutSession::startResultToString(StartResult result)
{
    switch (result) {
    case Started:         return "Started";
    case Restarted:       return "Restarted";
    case RejectedLocked:  return "RejectedLocked";
    case InvalidDuration: return "InvalidDuration";
    }
    return "Unknown";
}

QString BlackoutSession::stopResultToString(StopResult result)
{
    switch (result) {
    case Stopped:   return "Stopped";
    case NotActive: return "NotActive";
    case Locked:    return "Locked";
    }
    return "Unknown";
}

BlackoutSession::QueuedTask BlackoutSession::enqueue(const QString& label, const QDateTime& trigger, int minutes, bool locked)
{
    QMutexLocker locker(&m_mutex);

    QueuedTask task;
    task.id = QString::number(m_nextTaskId++);
    task.label = label;
    task.trigger = trigger;
    task.minutes = minutes;
    task.locked = locked;
    m_tasks.append(task);
    return task;
}

bool BlackoutSession::persistState()
{
    QJsonObject object;
    object["end_time"] = m_endTime.toUTC().toString(Qt::ISODate);
    object["duration_minutes"] = m_durationMinutes;
    object["locked"] = m_locked;

    QString error;
    bool ok = AtomicFile::writeJsonObject(m_stateFilePath, object, &error) == AtomicFile::Ok;
    if (!ok) {
        LOG_ERROR("Failed to save blackout state: " + error);
    }

    // The revival watchdog only reads the end as epoch seconds
    const QByteArray lockContent = QByteArray::number(m_endTime.toSecsSinceEpoch()) + "\n";
    if (!m_watchdogLockPath.isEmpty() && AtomicFile::writeAll(m_watchdogLockPath, lockContent, &error) != AtomicFile::Ok) {
        LOG_WARNING("Failed to write watchdog lock file: " + error);
    }
    return ok;
}

void BlackoutSession::resetState()
{
    m_active = false;
    m_locked = false;
    m_endTime = QDateTime();
    m_durationMinutes = 0;
    clearPersistedState();
}

void BlackoutSession::clearPersistedState()
{
    QString error;
    if (!AtomicFile::removeFile(m_stateFilePath, &error)) {
        LOG_ERROR("Failed to clear blackout state: " + error);
    }
    if (!m_watchdogLockPath.isEmpty() && !AtomicFile::removeFile(m_watchdogLockPath, &error)) {
        LOG_WARNING("Failed to remove watchdog lock file: " + error);
    }
}
