#include "ScheduleManager.h"
#include "AtomicFile.h"
#include "BlackoutLauncher.h"
#include "PeriodicWorker.h"
#include "logger/logger.h"
#include <QJsonArray>
#include <QJsonObject>

ScheduleManager::ScheduleManager(const QString& filePath, BlackoutLauncher* launcher, int intervalMs, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_launcher(launcher)
    , m_worker(nullptr)
{
    m_worker = new PeriodicWorker("scheduler", intervalMs, [this]() { evaluate(); }, this);
}

ScheduleManager::~ScheduleManager()
{
    m_worker->stopLoop();
}

bool ScheduleManager::load()
{
    QJsonObject root;
    QString error;
    AtomicFile::Status status = AtomicFile::readJsonObject(m_filePath, root, &error);

    QMutexLocker locker(&m_mutex);
    m_schedules.clear();

    if (status == AtomicFile::NotFound) {
        return true;
    }
    if (status != AtomicFile::Ok) {
        LOG_WARNING("Failed to load schedules: " + error);
        return false;
    }

    bool assignedIds = false;
    for (const QJsonValue& value : root.value("schedules").toArray()) {
        bool ok = false;
        Schedule schedule = Schedule::fromJson(value.toObject(), &ok);
        if (!ok || (!schedule.id.isEmpty() && indexOf(schedule.id) >= 0)) {
            LOG_WARNING(QString("Skipping invalid schedule entry '%1'").arg(schedule.name));
            continue;
        }
        if (schedule.id.isEmpty()) {
            do {
                schedule.id = Schedule::generateId();
            } while (indexOf(schedule.id) >= 0);
            assignedIds = true;
        }
        m_schedules.append(schedule);
    }

    // Hand-written entries carry no id; store the assigned ones
    if (assignedIds && !save(m_schedules)) {
        LOG_WARNING("Assigned schedule ids could not be saved, they change on the next load");
    }

    LOG_INFO(QString("Loaded %1 schedules").arg(m_schedules.size()));
    return true;
}

ScheduleManager::Error ScheduleManager::addSchedule(Schedule& schedule)
{
    Error error = validate(schedule);
    if (error != NoError) {
        return error;
    }

    {
        QMutexLocker locker(&m_mutex);

        if (schedule.id.isEmpty()) {
            do {
                schedule.id = Schedule::generateId();
            } while (indexOf(schedule.id) >= 0);
        } else if (indexOf(schedule.id) >= 0) {
            return DuplicateId;
        }

        QList<Schedule> updated = m_schedules;
        updated.append(schedule);
        if (!save(updated)) {
            return PersistFailed;
        }
        m_schedules = updated;
    }

    LOG_INFO(QString("Schedule added: %1 (%2-%3)")
                 .arg(schedule.name, schedule.start.toString("HH:mm"), schedule.end.toString("HH:mm")));
    emit schedulesChanged();
    return NoError;
}

ScheduleManager::Error ScheduleManager::updateSchedule(const Schedule& schedule)
{
    Error error = validate(schedule);
    if (error != NoError) {
        return error;
    }

    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(schedule.id);
        if (index < 0) {
            return NotFound;
        }

        QList<Schedule> updated = m_schedules;
        updated[index] = schedule;
        if (!save(updated)) {
            return PersistFailed;
        }
        m_schedules = updated;
    }

    LOG_INFO("Schedule updated: " + schedule.name);
    emit schedulesChanged();
    return NoError;
}

ScheduleManager::Error ScheduleManager::removeSchedule(const QString& scheduleId)
{
    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(scheduleId);
        if (index < 0) {
            return NotFound;
        }

        QList<Schedule> updated = m_schedules;
        updated.removeAt(index);
        if (!save(updated)) {
            return PersistFailed;
        }
        m_schedules = updated;
        m_triggeredToday.remove(scheduleId);
    }

    LOG_INFO("Schedule removed: " + scheduleId);
    emit schedulesChanged();
    return NoError;
}

ScheduleManager::Error ScheduleManager::setEnabled(const QString& scheduleId, bool enabled)
{
    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(scheduleId);
        if (index < 0) {
            return NotFound;
        }
        if (m_schedules.at(index).enabled == enabled) {
            return NoError;
        }

        QList<Schedule> updated = m_schedules;
        updated[index].enabled = enabled;
        if (!save(updated)) {
            return PersistFailed;
        }
        m_schedules = updated;
        LOG_INFO(QString("Schedule '%1' %2").arg(updated.at(index).name, enabled ? "enabled" : "disabled"));
    }

    emit schedulesChanged();
    return NoError;
}

ScheduleManager::Error ScheduleManager::toggleSchedule(const QString& scheduleId)
{
    bool enabled = false;
    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(scheduleId);
        if (index < 0) {
            return NotFound;
        }
        enabled = !m_schedules.at(index).enabled;
    }
    return setEnabled(scheduleId, enabled);
}

QList<Schedule> ScheduleManager::schedules() const
{
    QMutexLocker locker(&m_mutex);
    return m_schedules;
}

bool ScheduleManager::isTriggeredToday(const QString& scheduleId) const
{
    QMutexLocker locker(&m_mutex);
    return m_triggeredToday.contains(scheduleId);
}

bool ScheduleManager::start()
{
    LOG_INFO(QString("Scheduler started with %1 schedules").arg(schedules().size()));
    return m_worker->startLoop(true);
}

void ScheduleManager::stop()
{
    m_worker->stopLoop();
    LOG_INFO("Scheduler stopped");
}

QString ScheduleManager::evaluate(const QDateTime& now)
{
    QString firedId;
    QString firedName;
    int firedMinutes = 0;

    {
        QMutexLocker locker(&m_mutex);

        if (now.date() != m_lastCheckDate) {
            m_triggeredToday.clear();
            m_lastCheckDate = now.date();
        }

        // A running blackout defers every window; nothing is marked, so the
        // window can still fire once the blackout ends
        if (!m_launcher || m_launcher->isBlackoutActive(now)) {
            return QString();
        }

        for (const Schedule& schedule : m_schedules) {
            if (m_triggeredToday.contains(schedule.id) || !schedule.isActiveAt(now)) {
                continue;
            }

            const int minutes = schedule.remainingMinutes(now);
            if (minutes <= 0) {
                continue;
            }

            LOG_INFO(QString("Schedule '%1' triggered, blackout for %2 min").arg(schedule.name).arg(minutes));
            if (!m_launcher->launchBlackout(minutes, false, QString("Schedule: %1").arg(schedule.name), now)) {
                LOG_WARNING(QString("Schedule '%1' could not start a blackout, retrying next tick").arg(schedule.name));
                return QString();
            }

            m_triggeredToday.insert(schedule.id);
            firedId = schedule.id;
            firedName = schedule.name;
            firedMinutes = minutes;
            // One blackout at a time
            break;
        }
    }

    if (!firedId.isEmpty()) {
        emit scheduleTriggered(firedId, firedName, firedMinutes);
    }
    return firedId;
}

QString ScheduleManager::errorToString(Error error)
{
    switch (error) {
    case NoError:          return "No error";
    case InvalidTimeRange: return "Start time must be before end time";
    case InvalidDays:      return "At least one weekday (0-6) is required";
    case DuplicateId:      return "A schedule with this id already exists";
    case NotFound:         return "Schedule not found";
    case PersistFailed:    return "Could not save schedules";
    }
    return "Unknown error";
}

bool ScheduleManager::save(const QList<Schedule>& schedules)
{
    QJsonArray array;
    for (const Schedule& schedule : schedules) {
        array.append(schedule.toJson());
    }

    QJsonObject root;
    root["schedules"] = array;

    QString error;
    if (AtomicFile::writeJsonObject(m_filePath, root, &error) != AtomicFile::Ok) {
        LOG_ERROR("Failed to save schedules: " + error);
        return false;
    }
    return true;
}

int ScheduleManager::indexOf(const QString& scheduleId) const
{
    for (int i = 0; i < m_schedules.size(); ++i) {
        if (m_schedules.at(i).id == scheduleId) {
            return i;
        }
    }
    return -1;
}

ScheduleManager::Error ScheduleManager::validate(const Schedule& schedule)
{
    if (!schedule.hasValidTimeRange()) {
        return InvalidTimeRange;
    }
    if (!schedule.hasValidDays()) {
        return InvalidDays;
    }
    return NoError;
}
