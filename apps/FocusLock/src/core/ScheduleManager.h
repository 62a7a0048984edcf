#ifndef SCHEDULEMANAGER_H
#define SCHEDULEMANAGER_H

#include <QObject>
#include <QDate>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QSet>
#include <QString>
#include "Schedule.h"

class BlackoutLauncher;
class PeriodicWorker;

/**
 * @brief Recurring schedule engine
 *
 * Holds the schedule collection (schedules.json) and evaluates it on a
 * fixed tick. A schedule whose window is open and has not fired today
 * starts an unlocked blackout for the rest of the window. Mutations are
 * persisted immediately; the tick only reads.
 */
class ScheduleManager : public QObject
{
    Q_OBJECT
public:
    enum Error {
        NoError,
        InvalidTimeRange,
        InvalidDays,
        DuplicateId,
        NotFound,
        PersistFailed
    };

    ScheduleManager(const QString& filePath, BlackoutLauncher* launcher, int intervalMs, QObject* parent = nullptr);
    ~ScheduleManager();

    bool load();

    // Assigns an id when the schedule has none
    Error addSchedule(Schedule& schedule);
    Error updateSchedule(const Schedule& schedule);
    Error removeSchedule(const QString& scheduleId);
    Error setEnabled(const QString& scheduleId, bool enabled);
    Error toggleSchedule(const QString& scheduleId);

    QList<Schedule> schedules() const;
    bool isTriggeredToday(const QString& scheduleId) const;

    bool start();
    void stop();

    // One evaluation pass; returns the id of the schedule that fired, if any
    QString evaluate(const QDateTime& now = QDateTime::currentDateTime());

    static QString errorToString(Error error);

signals:
    void scheduleTriggered(const QString& scheduleId, const QString& name, int minutes);
    void schedulesChanged();

private:
    // Caller holds m_mutex
    bool save(const QList<Schedule>& schedules);
    int indexOf(const QString& scheduleId) const;
    static Error validate(const Schedule& schedule);

    QString m_filePath;
    BlackoutLauncher* m_launcher;
    PeriodicWorker* m_worker;

    mutable QMutex m_mutex;
    QList<Schedule> m_schedules;
    QSet<QString> m_triggeredToday;
    QDate m_lastCheckDate;
};

#endif // SCHEDULEMANAGER_H
