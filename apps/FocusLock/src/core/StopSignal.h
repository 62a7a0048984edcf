#ifndef STOPSIGNAL_H
#define STOPSIGNAL_H

#include <QMutex>
#include <QWaitCondition>

// Resettable cancellation flag for the background loops. A loop sleeps in
// wait() and wakes early when set() is called. clear() must run before the
// loop is started again, otherwise the new loop sees the old request and exits.
class StopSignal
{
public:
    StopSignal();

    void set();
    void clear();
    bool isSet() const;

    // Returns true if the signal was (or became) set within timeoutMs
    bool wait(int timeoutMs);

private:
    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_set;
};

#endif // STOPSIGNAL_H
