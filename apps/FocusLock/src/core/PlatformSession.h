#ifndef PLATFORMSESSION_H
#define PLATFORMSESSION_H

#include <QObject>
#include <QDateTime>
#include <QElapsedTimer>
#include <QMutex>
#include "Platform.h"
#include "UsageTracker.h"
#include "WarningTracker.h"

class HostsManager;
class Notifier;
class PeriodicWorker;
class ProcessManager;

/**
 * @brief Timed access window for one platform
 *
 * start() lifts the platform's hosts region and begins charging usage on a
 * per-platform loop. pause(), stop() and running out of allowance all put
 * the region back and kill the platform's desktop apps.
 */
class PlatformSession : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle,
        Running,
        Paused,
        Exhausted
    };
    Q_ENUM(State)

    PlatformSession(const Platform& platform,
                    UsageTracker* usageTracker,
                    HostsManager* hostsManager,
                    ProcessManager* processManager,
                    Notifier* notifier,
                    const QList<int>& warningMinutes,
                    int tickMs,
                    QObject* parent = nullptr);
    ~PlatformSession();

    // Starts a new session or resumes a paused one. Refused when the
    // allowance is spent or the platform cannot be unblocked.
    bool start(const QDateTime& now = QDateTime::currentDateTime());
    bool pause(const QDateTime& now = QDateTime::currentDateTime());
    bool stop(const QDateTime& now = QDateTime::currentDateTime());

    // Charges elapsed seconds; called by the session loop every tick
    UsageSnapshot accountUsage(double seconds, const QDateTime& now = QDateTime::currentDateTime());

    State state() const;
    bool isRunning() const;
    const Platform& platform() const;
    UsageSnapshot snapshot(const QDateTime& now = QDateTime::currentDateTime()) const;

    static QString stateToString(State state);

signals:
    void stateChanged(const QString& platformId, PlatformSession::State state);
    void usageUpdated(const QString& platformId, double remainingSeconds);
    void warningIssued(const QString& platformId, int thresholdMinutes);
    void allowanceExhausted(const QString& platformId);

private:
    void onTick();
    void endSession(State newState, const QDateTime& now);
    bool blockPlatform();

    Platform m_platform;
    UsageTracker* m_usageTracker;
    HostsManager* m_hostsManager;
    ProcessManager* m_processManager;
    Notifier* m_notifier;
    WarningTracker m_warnings;
    PeriodicWorker* m_worker;

    mutable QMutex m_mutex;
    State m_state;
    QElapsedTimer m_elapsed;
};

#endif // PLATFORMSESSION_H
