#include "UsageTracker.h"
#include "AtomicFile.h"
#include "Platform.h"
#include "logger/logger.h"
#include <QDir>
#include <QJsonObject>
#include <QtMath>

UsageTracker::UsageTracker(const QString& dataDir, int resetHour)
    : m_dataDir(dataDir)
    , m_resetHour(qBound(0, resetHour, 23))
{
}

QDate UsageTracker::logicalDay(const QDateTime& now) const
{
    if (now.time().hour() < m_resetHour) {
        return now.date().addDays(-1);
    }
    return now.date();
}

int UsageTracker::resetHour() const
{
    return m_resetHour;
}

QString UsageTracker::usageFilePath(const Platform& platform) const
{
    return QDir(m_dataDir).filePath(platform.usageFileName());
}

UsageSnapshot UsageTracker::addUsage(const Platform& platform, double seconds, const QDateTime& now)
{
    QSharedPointer<QMutex> lock = lockFor(platform.id);
    QMutexLocker locker(lock.data());

    UsageRecord record = load(platform, logicalDay(now));
    if (seconds > 0.0) {
        record.usedSeconds += seconds;
    }
    save(platform, record);
    return derive(platform, record);
}

UsageSnapshot UsageTracker::snapshot(const Platform& platform, const QDateTime& now)
{
    QSharedPointer<QMutex> lock = lockFor(platform.id);
    QMutexLocker locker(lock.data());
    return derive(platform, load(platform, logicalDay(now)));
}

double UsageTracker::usedSeconds(const Platform& platform, const QDateTime& now)
{
    return snapshot(platform, now).usedSeconds;
}

double UsageTracker::remainingSeconds(const Platform& platform, const QDateTime& now)
{
    return snapshot(platform, now).remainingSeconds;
}

bool UsageTracker::isLimitReached(const Platform& platform, const QDateTime& now)
{
    return snapshot(platform, now).blocked;
}

int UsageTracker::incrementSessionCount(const Platform& platform, const QDateTime& now)
{
    QSharedPointer<QMutex> lock = lockFor(platform.id);
    QMutexLocker locker(lock.data());

    UsageRecord record = load(platform, logicalDay(now));
    record.sessions += 1;
    save(platform, record);
    return record.sessions;
}

int UsageTracker::sessionCount(const Platform& platform, const QDateTime& now)
{
    return snapshot(platform, now).sessions;
}

bool UsageTracker::resetPlatform(const Platform& platform, const QDateTime& now)
{
    QSharedPointer<QMutex> lock = lockFor(platform.id);
    QMutexLocker locker(lock.data());

    UsageRecord record;
    record.date = logicalDay(now);
    if (!save(platform, record)) {
        return false;
    }
    LOG_INFO("Usage data reset for " + platform.displayName);
    return true;
}

QString UsageTracker::formatSeconds(double totalSeconds)
{
    const qint64 whole = totalSeconds > 0.0 ? static_cast<qint64>(qFloor(totalSeconds)) : 0;
    return QString("%1:%2")
        .arg(whole / 60, 2, 10, QChar('0'))
        .arg(whole % 60, 2, 10, QChar('0'));
}

QSharedPointer<QMutex> UsageTracker::lockFor(const QString& platformId)
{
    QMutexLocker locker(&m_locksMutex);
    QSharedPointer<QMutex> lock = m_platformLocks.value(platformId);
    if (!lock) {
        lock = QSharedPointer<QMutex>::create();
        m_platformLocks.insert(platformId, lock);
    }
    return lock;
}

UsageRecord UsageTracker::load(const Platform& platform, const QDate& today) const
{
    UsageRecord fresh;
    fresh.date = today;

    QJsonObject object;
    QString error;
    AtomicFile::Status status = AtomicFile::readJsonObject(usageFilePath(platform), object, &error);
    if (status == AtomicFile::NotFound) {
        return fresh;
    }
    if (status != AtomicFile::Ok) {
        LOG_WARNING(QString("Unreadable usage file for %1, resetting: %2").arg(platform.displayName, error));
        return fresh;
    }

    const QDate stored = QDate::fromString(object.value("date").toString(), Qt::ISODate);
    if (stored != today) {
        LOG_INFO(QString("New day for %1, usage counter reset for %2")
                     .arg(platform.displayName, today.toString(Qt::ISODate)));
        return fresh;
    }

    UsageRecord record;
    record.date = stored;
    record.usedSeconds = qMax(0.0, object.value("used_seconds").toDouble());
    record.sessions = qMax(0, object.value("sessions").toInt());
    return record;
}

bool UsageTracker::save(const Platform& platform, const UsageRecord& record) const
{
    QJsonObject object;
    object["date"] = record.date.toString(Qt::ISODate);
    object["used_seconds"] = record.usedSeconds;
    object["sessions"] = record.sessions;

    QString error;
    if (AtomicFile::writeJsonObject(usageFilePath(platform), object, &error) != AtomicFile::Ok) {
        LOG_ERROR(QString("Failed to save usage for %1: %2").arg(platform.displayName, error));
        return false;
    }
    return true;
}

UsageSnapshot UsageTracker::derive(const Platform& platform, const UsageRecord& record)
{
    UsageSnapshot snapshot;
    snapshot.usedSeconds = record.usedSeconds;
    snapshot.sessions = record.sessions;
    snapshot.remainingSeconds = qMax(0.0, platform.dailyLimitSeconds - record.usedSeconds);
    snapshot.blocked = snapshot.remainingSeconds <= 0.0;
    return snapshot;
}
