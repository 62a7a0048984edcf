#include "Schedule.h"
#include <QJsonArray>
#include <QUuid>

namespace {

const char* const kTimeFormat = "HH:mm";

} // namespace

bool Schedule::hasValidTimeRange() const
{
    return start.isValid() && end.isValid() && start < end;
}

bool Schedule::hasValidDays() const
{
    if (days.isEmpty()) {
        return false;
    }
    for (int day : days) {
        if (day < 0 || day > 6) {
            return false;
        }
    }
    return true;
}

bool Schedule::isActiveAt(const QDateTime& now) const
{
    if (!enabled || !hasValidTimeRange()) {
        return false;
    }

    // QDate::dayOfWeek() is 1 = Monday .. 7 = Sunday
    const int weekday = now.date().dayOfWeek() - 1;
    if (!days.contains(weekday)) {
        return false;
    }

    const QTime time = now.time();
    return start <= time && time < end;
}

int Schedule::remainingMinutes(const QDateTime& now) const
{
    const int seconds = now.time().secsTo(end);
    if (seconds <= 0) {
        return 0;
    }
    return (seconds + 59) / 60;
}

QJsonObject Schedule::toJson() const
{
    QJsonArray dayArray;
    for (int day : days) {
        dayArray.append(day);
    }

    QJsonObject object;
    object["id"] = id;
    object["name"] = name;
    object["days"] = dayArray;
    object["start"] = start.toString(kTimeFormat);
    object["end"] = end.toString(kTimeFormat);
    object["enabled"] = enabled;
    return object;
}

Schedule Schedule::fromJson(const QJsonObject& object, bool* ok)
{
    Schedule schedule;
    schedule.id = object.value("id").toString();
    schedule.name = object.value("name").toString();
    for (const QJsonValue& value : object.value("days").toArray()) {
        schedule.days.append(value.toInt(-1));
    }
    schedule.start = QTime::fromString(object.value("start").toString(), kTimeFormat);
    schedule.end = QTime::fromString(object.value("end").toString(), kTimeFormat);
    schedule.enabled = object.value("enabled").toBool(true);

    if (ok) {
        *ok = schedule.hasValidDays() && schedule.hasValidTimeRange();
    }
    return schedule;
}

QString Schedule::generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
}
