#include "StopSignal.h"
#include <QDeadlineTimer>

StopSignal::StopSignal()
    : m_set(false)
{
}

void StopSignal::set()
{
    QMutexLocker locker(&m_mutex);
    m_set = true;
    m_condition.wakeAll();
}

void StopSignal::clear()
{
    QMutexLocker locker(&m_mutex);
    m_set = false;
}

bool StopSignal::isSet() const
{
    QMutexLocker locker(&m_mutex);
    return m_set;
}

bool StopSignal::wait(int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline(timeoutMs);
    while (!m_set) {
        // Spurious wakeups fall through to the loop condition
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }
    return m_set;
}
