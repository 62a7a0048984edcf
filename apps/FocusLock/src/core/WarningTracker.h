#ifndef WARNINGTRACKER_H
#define WARNINGTRACKER_H

#include <QList>
#include <QMutex>
#include <QSet>

// Remaining-time warnings for one platform session. Each threshold fires at
// most once until reset() starts a new session.
class WarningTracker
{
public:
    explicit WarningTracker(const QList<int>& thresholdMinutes);

    // Returns the threshold (minutes) to announce, or -1. When several are
    // crossed in one step only the lowest is announced; the rest are
    // consumed silently.
    int check(double remainingSeconds);

    void reset();

    QList<int> thresholds() const;
    QList<int> firedThresholds() const;

private:
    mutable QMutex m_mutex;
    QList<int> m_thresholds;
    QSet<int> m_fired;
};

#endif // WARNINGTRACKER_H
