#include "WarningTracker.h"
#include <algorithm>
#include <functional>

WarningTracker::WarningTracker(const QList<int>& thresholdMinutes)
{
    for (int minutes : thresholdMinutes) {
        if (minutes > 0 && !m_thresholds.contains(minutes)) {
            m_thresholds.append(minutes);
        }
    }
    std::sort(m_thresholds.begin(), m_thresholds.end(), std::greater<int>());
}

int WarningTracker::check(double remainingSeconds)
{
    QMutexLocker locker(&m_mutex);

    int announce = -1;
    for (int minutes : m_thresholds) {
        if (m_fired.contains(minutes) || remainingSeconds > minutes * 60.0) {
            continue;
        }
        m_fired.insert(minutes);
        announce = minutes;
    }

    // Exhaustion has its own notification
    if (remainingSeconds <= 0.0) {
        return -1;
    }
    return announce;
}

void WarningTracker::reset()
{
    QMutexLocker locker(&m_mutex);
    m_fired.clear();
}

QList<int> WarningTracker::thresholds() const
{
    QMutexLocker locker(&m_mutex);
    return m_thresholds;
}

QList<int> WarningTracker::firedThresholds() const
{
    QMutexLocker locker(&m_mutex);
    QList<int> fired;
    for (int minutes : m_thresholds) {
        if (m_fired.contains(minutes)) {
            fired.append(minutes);
        }
    }
    return fired;
}
