#ifndef PLATFORM_H
#define PLATFORM_H

#include <QList>
#include <QString>
#include <QStringList>

// A time-limited platform. Loaded once at startup and never mutated.
struct Platform
{
    QString id;
    QString displayName;
    int dailyLimitSeconds = 0;
    QStringList domains;
    QStringList processNames;
    QString markerTag;

    bool isValid() const { return !id.isEmpty() && !markerTag.isEmpty(); }

    // Hosts region identifier, e.g. "FOCUSLOCK-INSTAGRAM"
    QString markerId() const;
    QString usageFileName() const;

    static const Platform* findById(const QList<Platform>& platforms, const QString& id);
};

#endif // PLATFORM_H
