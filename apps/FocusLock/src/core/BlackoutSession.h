#ifndef BLACKOUTSESSION_H
#define BLACKOUTSESSION_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QString>
#include <QTime>
#include "BlackoutLauncher.h"

class Notifier;
class PeriodicWorker;

/**
 * @brief Countdown state behind the full-screen blackout overlay
 *
 * Inactive -> Running(end, locked) -> Inactive. The state file
 * (blackout_state.json) is written on every transition and is the only
 * source of truth across restarts: restore() rebuilds a running session
 * from it, never the other way round.
 *
 * A locked session refuses stop() and any new start() until it expires
 * on its own. The countdown loop also fires queued focus tasks.
 */
class BlackoutSession : public QObject, public BlackoutLauncher
{
    Q_OBJECT
public:
    enum StartResult {
        Started,
        Restarted,       ///< An unlocked session was replaced
        RejectedLocked,  ///< A locked session is running
        InvalidDuration
    };

    enum StopResult {
        Stopped,
        NotActive,
        Locked           ///< Locked session, stop refused, nothing changed
    };

    struct QueuedTask
    {
        QString id;
        QString label;
        QDateTime trigger;
        int minutes = 0;
        bool locked = false;
    };

    BlackoutSession(const QString& stateFilePath,
                    const QString& watchdogLockPath,
                    Notifier* notifier,
                    int tickMs = 1000,
                    QObject* parent = nullptr);
    ~BlackoutSession();

    StartResult start(int minutes, bool locked = false, const QDateTime& now = QDateTime::currentDateTime());

    // force bypasses the lock and is reserved for natural expiry; it is
    // never offered to the user
    StopResult stop(bool force = false);

    // Boot-time recovery from the state file. Returns true if a session
    // was resumed; an expired or unreadable file is deleted.
    bool restore(const QDateTime& now = QDateTime::currentDateTime());

    bool isActive(const QDateTime& now = QDateTime::currentDateTime()) const;
    bool isLocked() const;
    QDateTime endTime() const;
    int durationMinutes() const;
    qint64 remainingSeconds(const QDateTime& now = QDateTime::currentDateTime()) const;

    // Work block after delayMinutes, then an unlocked break of
    // breakMinutes (skipped when 0). Returns the queued tasks.
    QList<QueuedTask> queueFocusBlock(int workMinutes, int breakMinutes, bool locked, int delayMinutes = 0,
                                      const QDateTime& now = QDateTime::currentDateTime());

    // One-shot blackout at the next occurrence of timeOfDay
    QueuedTask queueAt(const QTime& timeOfDay, int minutes, bool locked,
                       const QDateTime& now = QDateTime::currentDateTime());

    // Locked tasks cannot be cancelled once queued
    bool cancelTask(const QString& taskId);
    QList<QueuedTask> pendingTasks() const;

    // Expiry first, then due tasks. Driven by the countdown loop.
    void tick(const QDateTime& now = QDateTime::currentDateTime());

    bool startLoop();
    void stopLoop();

    // BlackoutLauncher
    bool isBlackoutActive(const QDateTime& now) const override;
    bool launchBlackout(int minutes, bool locked, const QString& reason, const QDateTime& now) override;

    QString stateFilePath() const;
    QString watchdogLockPath() const;

    static QString startResultToString(StartResult result);
    static QString stopResultToString(StopResult result);

signals:
    void sessionStarted(const QDateTime& endTime, bool locked);
    void sessionStopped();
    void sessionCompleted();
    void taskTriggered(const QString& label, int minutes, bool locked);

private:
    QueuedTask enqueue(const QString& label, const QDateTime& trigger, int minutes, bool locked);

    // Caller holds m_mutex
    bool persistState();
    void resetState();
    void clearPersistedState();

    QString m_stateFilePath;
    QString m_watchdogLockPath;
    Notifier* m_notifier;
    PeriodicWorker* m_worker;

    mutable QMutex m_mutex;
    bool m_active;
    bool m_locked;
    QDateTime m_endTime;
    int m_durationMinutes;
    QList<QueuedTask> m_tasks;
    int m_nextTaskId;
};

#endif // BLACKOUTSESSION_H
