#include "PeriodicWorker.h"
#include "logger/logger.h"
#include <exception>

PeriodicWorker::PeriodicWorker(const QString& name, int intervalMs, std::function<void()> tick, QObject* parent)
    : QThread(parent)
    , m_name(name)
    , m_intervalMs(intervalMs)
    , m_tick(std::move(tick))
    , m_tickImmediately(false)
    , m_ticksRun(0)
{
    setObjectName(name);
}

PeriodicWorker::~PeriodicWorker()
{
    stopLoop();
}

bool PeriodicWorker::startLoop(bool tickImmediately)
{
    if (isRunning()) {
        if (!m_stopSignal.isSet()) {
            LOG_DEBUG(QString("Loop '%1' already running").arg(m_name));
            return true;
        }
        if (QThread::currentThread() == this) {
            return false;
        }
        // Still winding down from the previous stopLoop()
        wait();
    }

    m_stopSignal.clear();
    m_tickImmediately = tickImmediately;
    start();
    LOG_DEBUG(QString("Loop '%1' started (interval %2 ms)").arg(m_name).arg(m_intervalMs));
    return true;
}

void PeriodicWorker::stopLoop(int timeoutMs)
{
    m_stopSignal.set();

    if (QThread::currentThread() == this) {
        return;
    }

    if (isRunning() && !wait(timeoutMs)) {
        LOG_WARNING(QString("Loop '%1' did not stop within %2 ms").arg(m_name).arg(timeoutMs));
    }
}

void PeriodicWorker::requestStop()
{
    m_stopSignal.set();
}

bool PeriodicWorker::isStopRequested() const
{
    return m_stopSignal.isSet();
}

int PeriodicWorker::interval() const
{
    return m_intervalMs;
}

void PeriodicWorker::setInterval(int intervalMs)
{
    m_intervalMs = intervalMs;
}

QString PeriodicWorker::name() const
{
    return m_name;
}

int PeriodicWorker::ticksRun() const
{
    return m_ticksRun.loadRelaxed();
}

void PeriodicWorker::run()
{
    if (m_tickImmediately && !m_stopSignal.isSet()) {
        runTick();
    }

    while (!m_stopSignal.wait(m_intervalMs)) {
        runTick();
    }

    LOG_DEBUG(QString("Loop '%1' exited").arg(m_name));
}

void PeriodicWorker::runTick()
{
    try {
        m_tick();
    } catch (const std::exception& e) {
        LOG_ERROR(QString("Loop '%1' tick failed: %2").arg(m_name, QString::fromUtf8(e.what())));
    }
    m_ticksRun.fetchAndAddRelaxed(1);
}
