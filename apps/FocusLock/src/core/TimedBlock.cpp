#include "TimedBlock.h"
#include "AtomicFile.h"
#include "Notifier.h"
#include "PeriodicWorker.h"
#include "logger/logger.h"
#include <QJsonArray>
#include <QJsonObject>

TimedBlock::TimedBlock(const QString& stateFilePath,
                       const QStringList& knownPlatformIds,
                       Notifier* notifier,
                       int tickMs,
                       QObject* parent)
    : QObject(parent)
    , m_stateFilePath(stateFilePath)
    , m_knownPlatformIds(knownPlatformIds)
    , m_notifier(notifier)
    , m_worker(nullptr)
    , m_active(false)
    , m_locked(false)
    , m_durationMinutes(0)
{
    m_worker = new PeriodicWorker("timed-block", tickMs, [this]() { tick(); }, this);
}

TimedBlock::~TimedBlock()
{
    m_worker->stopLoop();
}

TimedBlock::StartResult TimedBlock::start(const QStringList& platformIds, int minutes, bool locked,
                                          const QDateTime& now)
{
    if (minutes <= 0) {
        LOG_WARNING(QString("Rejected platform block with invalid duration: %1 min").arg(minutes));
        return InvalidDuration;
    }

    const QStringList ids = knownIds(platformIds);
    if (ids.isEmpty()) {
        LOG_WARNING("Rejected platform block without a known platform: " + platformIds.join(", "));
        return NoPlatforms;
    }

    StartResult result = Started;
    QStringList replaced;
    QDateTime endTime;
    {
        QMutexLocker locker(&m_mutex);

        const bool running = m_active && now < m_endTime;
        if (running && m_locked) {
            LOG_WARNING(QString("Locked platform block running until %1, start request rejected")
                            .arg(m_endTime.toString(Qt::ISODate)));
            return RejectedLocked;
        }
        if (running) {
            result = Restarted;
            replaced = m_platformIds;
        }

        m_active = true;
        m_locked = locked;
        m_platformIds = ids;
        m_durationMinutes = minutes;
        m_endTime = now.addSecs(static_cast<qint64>(minutes) * 60);
        endTime = m_endTime;

        if (!persistState()) {
            LOG_ERROR("Platform block state could not be persisted, it will not survive a restart");
        }
    }

    LOG_INFO(QString("Platform block %1 for %2 min until %3: %4%5")
                 .arg(result == Restarted ? "restarted" : "started")
                 .arg(minutes)
                 .arg(endTime.toString("HH:mm:ss"), ids.join(", "), locked ? " [LOCKED]" : ""));
    if (!replaced.isEmpty()) {
        emit blockEnded(replaced);
    }
    emit blockStarted(ids, endTime, locked);
    return result;
}

TimedBlock::StopResult TimedBlock::stop(bool force, const QDateTime& now)
{
    QStringList ids;
    {
        QMutexLocker locker(&m_mutex);

        if (!m_active) {
            return NotActive;
        }
        if (m_locked && !force && now < m_endTime) {
            LOG_WARNING("Platform block is locked, stop refused");
            return Locked;
        }

        ids = m_platformIds;
        resetState();
    }

    LOG_INFO(QString("Platform block %1: %2").arg(force ? "ended" : "cancelled", ids.join(", ")));
    emit blockEnded(ids);
    return Stopped;
}

bool TimedBlock::restore(const QDateTime& now)
{
    QJsonObject object;
    QString error;
    const AtomicFile::Status status = AtomicFile::readJsonObject(m_stateFilePath, object, &error);
    if (status == AtomicFile::NotFound) {
        return false;
    }

    QMutexLocker locker(&m_mutex);

    if (status != AtomicFile::Ok) {
        LOG_WARNING("Discarding unreadable platform block state: " + error);
        resetState();
        return false;
    }

    QStringList stored;
    for (const QJsonValue& value : object.value("platform_ids").toArray()) {
        stored.append(value.toString());
    }
    const QStringList ids = knownIds(stored);
    const QDateTime endTime = QDateTime::fromString(object.value("end_time").toString(), Qt::ISODate);

    if (ids.isEmpty() || !endTime.isValid()) {
        LOG_WARNING("Persisted platform block is incomplete, clearing it");
        resetState();
        return false;
    }
    if (endTime <= now) {
        LOG_INFO("Persisted platform block expired while stopped, clearing it");
        resetState();
        return false;
    }

    m_active = true;
    m_locked = object.value("locked").toBool(false);
    m_platformIds = ids;
    m_endTime = endTime;
    m_durationMinutes = object.value("duration_minutes").toInt();

    const bool locked = m_locked;
    locker.unlock();

    LOG_INFO(QString("Recovered platform block from previous run: %1, %2 s remaining%3")
                 .arg(ids.join(", ")).arg(now.secsTo(endTime)).arg(locked ? " [LOCKED]" : ""));
    emit blockStarted(ids, endTime, locked);
    return true;
}

void TimedBlock::tick(const QDateTime& now)
{
    bool expired = false;
    QStringList ids;
    {
        QMutexLocker locker(&m_mutex);
        if (m_active && now >= m_endTime) {
            ids = m_platformIds;
            resetState();
            expired = true;
        }
    }

    if (expired) {
        LOG_INFO("Platform block completed: " + ids.join(", "));
        Notifier::deliver(m_notifier, "Platform block", "Block over. Daily allowances apply again.");
        emit blockEnded(ids);
    }
}

bool TimedBlock::startLoop()
{
    return m_worker->startLoop();
}

void TimedBlock::stopLoop()
{
    m_worker->stopLoop();
}

bool TimedBlock::isActive(const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    return m_active && now < m_endTime;
}

bool TimedBlock::isLocked() const
{
    QMutexLocker locker(&m_mutex);
    return m_active && m_locked;
}

bool TimedBlock::blocksPlatform(const QString& platformId, const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    return m_active && now < m_endTime && m_platformIds.contains(platformId);
}

QStringList TimedBlock::platformIds() const
{
    QMutexLocker locker(&m_mutex);
    return m_platformIds;
}

QDateTime TimedBlock::endTime() const
{
    QMutexLocker locker(&m_mutex);
    return m_endTime;
}

qint64 TimedBlock::remainingSeconds(const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    if (!m_active) {
        return 0;
    }
    return qMax<qint64>(0, now.secsTo(m_endTime));
}

QString TimedBlock::stateFilePath() const
{
    return m_stateFilePath;
}

QString TimedBlock::startResultToString(StartResult result)
{
    switch (result) {
    case Started:         return "Started";
    case Restarted:       return "Restarted";
    case RejectedLocked:  return "RejectedLocked";
    case InvalidDuration: return "InvalidDuration";
    case NoPlatforms:     return "NoPlatforms";
    }
    return "Unknown";
}

QString TimedBlock::stopResultToString(StopResult result)
{
    switch (result) {
    case Stopped:   return "Stopped";
    case NotActive: return "NotActive";
    case Locked:    return "Locked";
    }
    return "Unknown";
}

QStringList TimedBlock::knownIds(const QStringList& platformIds) const
{
    QStringList ids;
    for (const QString& id : platformIds) {
        const QString trimmed = id.trimmed().toLower();
        if (m_knownPlatformIds.contains(trimmed) && !ids.contains(trimmed)) {
            ids.append(trimmed);
        }
    }
    return ids;
}

bool TimedBlock::persistState()
{
    QJsonObject object;
    object["end_time"] = m_endTime.toUTC().toString(Qt::ISODate);
    object["platform_ids"] = QJsonArray::fromStringList(m_platformIds);
    object["duration_minutes"] = m_durationMinutes;
    object["locked"] = m_locked;

    QString error;
    if (AtomicFile::writeJsonObject(m_stateFilePath, object, &error) != AtomicFile::Ok) {
        LOG_ERROR("Failed to save platform block state: " + error);
        return false;
    }
    return true;
}

void TimedBlock::resetState()
{
    m_active = false;
    m_locked = false;
    m_platformIds.clear();
    m_endTime = QDateTime();
    m_durationMinutes = 0;

    QString error;
    if (!AtomicFile::removeFile(m_stateFilePath, &error)) {
        LOG_ERROR("Failed to clear platform block state: " + error);
    }
}
