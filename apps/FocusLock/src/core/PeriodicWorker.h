#ifndef PERIODICWORKER_H
#define PERIODICWORKER_H

#include <QThread>
#include <QString>
#include <functional>
#include "StopSignal.h"

// One background loop on its own thread: run the tick, sleep, repeat until the
// stop signal is set. A tick that throws is logged and the loop carries on.
class PeriodicWorker : public QThread
{
    Q_OBJECT
public:
    PeriodicWorker(const QString& name, int intervalMs, std::function<void()> tick, QObject* parent = nullptr);
    ~PeriodicWorker() override;

    // Clears the stop signal before starting, so a previous stopLoop() never
    // leaks into the new run. No-op if already running.
    bool startLoop(bool tickImmediately = false);

    // Sets the stop signal and joins the thread. Safe to call from the worker
    // itself, in which case the join is skipped.
    void stopLoop(int timeoutMs = 5000);

    // Sets the stop signal without waiting
    void requestStop();

    bool isStopRequested() const;
    int interval() const;
    void setInterval(int intervalMs);
    QString name() const;
    int ticksRun() const;

protected:
    void run() override;

private:
    void runTick();

    QString m_name;
    int m_intervalMs;
    std::function<void()> m_tick;
    StopSignal m_stopSignal;
    bool m_tickImmediately;
    QAtomicInt m_ticksRun;
};

#endif // PERIODICWORKER_H
