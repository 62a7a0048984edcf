#ifndef SCHEDULE_H
#define SCHEDULE_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QTime>

// Recurring weekly window. Days are 0 = Monday .. 6 = Sunday; the window
// is [start, end) on each of those days and never crosses midnight.
struct Schedule
{
    QString id;
    QString name;
    QList<int> days;
    QTime start;
    QTime end;
    bool enabled = true;

    bool hasValidTimeRange() const;
    bool hasValidDays() const;

    bool isActiveAt(const QDateTime& now) const;

    // Whole minutes (rounded up) from now until the window closes
    int remainingMinutes(const QDateTime& now) const;

    QJsonObject toJson() const;
    // A missing id is left empty for the caller to assign
    static Schedule fromJson(const QJsonObject& object, bool* ok = nullptr);

    static QString generateId();
};

#endif // SCHEDULE_H
