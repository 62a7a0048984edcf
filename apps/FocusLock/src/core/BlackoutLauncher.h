#ifndef BLACKOUTLAUNCHER_H
#define BLACKOUTLAUNCHER_H

#include <QDateTime>
#include <QString>

// Capability handed to the schedule engine: it may start a blackout but
// never sees the session itself.
class BlackoutLauncher
{
public:
    virtual ~BlackoutLauncher() = default;

    virtual bool isBlackoutActive(const QDateTime& now) const = 0;
    virtual bool launchBlackout(int minutes, bool locked, const QString& reason, const QDateTime& now) = 0;
};

#endif // BLACKOUTLAUNCHER_H
