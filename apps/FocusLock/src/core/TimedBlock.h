#ifndef TIMEDBLOCK_H
#define TIMEDBLOCK_H

#include <QObject>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QStringList>

class Notifier;
class PeriodicWorker;

/**
 * @brief Fixed-length block on a chosen set of platforms
 *
 * While active, the selected platforms cannot be opened by a usage
 * session even with allowance left. The block ends on its own at the end
 * time; a locked block also refuses stop() and any replacement until then.
 *
 * web_block_state.json is written on every transition and restore()
 * rebuilds an unexpired block from it at boot.
 */
class TimedBlock : public QObject
{
    Q_OBJECT
public:
    enum StartResult {
        Started,
        Restarted,       ///< An unlocked block was replaced
        RejectedLocked,
        InvalidDuration,
        NoPlatforms      ///< None of the ids is in the catalogue
    };

    enum StopResult {
        Stopped,
        NotActive,
        Locked
    };

    TimedBlock(const QString& stateFilePath,
               const QStringList& knownPlatformIds,
               Notifier* notifier,
               int tickMs = 1000,
               QObject* parent = nullptr);
    ~TimedBlock();

    StartResult start(const QStringList& platformIds, int minutes, bool locked = false,
                      const QDateTime& now = QDateTime::currentDateTime());

    // force is used on expiry only
    StopResult stop(bool force = false, const QDateTime& now = QDateTime::currentDateTime());

    // Returns true if an unexpired block was resumed. Expired or
    // unreadable state is deleted.
    bool restore(const QDateTime& now = QDateTime::currentDateTime());

    void tick(const QDateTime& now = QDateTime::currentDateTime());

    bool startLoop();
    void stopLoop();

    bool isActive(const QDateTime& now = QDateTime::currentDateTime()) const;
    bool isLocked() const;
    bool blocksPlatform(const QString& platformId, const QDateTime& now = QDateTime::currentDateTime()) const;
    QStringList platformIds() const;
    QDateTime endTime() const;
    qint64 remainingSeconds(const QDateTime& now = QDateTime::currentDateTime()) const;

    QString stateFilePath() const;

    static QString startResultToString(StartResult result);
    static QString stopResultToString(StopResult result);

signals:
    void blockStarted(const QStringList& platformIds, const QDateTime& endTime, bool locked);
    void blockEnded(const QStringList& platformIds);

private:
    QStringList knownIds(const QStringList& platformIds) const;

    // Caller holds m_mutex
    bool persistState();
    void resetState();

    QString m_stateFilePath;
    QStringList m_knownPlatformIds;
    Notifier* m_notifier;
    PeriodicWorker* m_worker;

    mutable QMutex m_mutex;
    bool m_active;
    bool m_locked;
    QStringList m_platformIds;
    QDateTime m_endTime;
    int m_durationMinutes;
};

#endif // TIMEDBLOCK_H
