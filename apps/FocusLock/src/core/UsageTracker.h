#ifndef USAGETRACKER_H
#define USAGETRACKER_H

#include <QDate>
#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QSharedPointer>
#include <QString>

struct Platform;

struct UsageRecord
{
    QDate date;
    double usedSeconds = 0.0;
    int sessions = 0;
};

// Everything a caller needs about a platform's allowance, derived once from
// a single record. "blocked" is remainingSeconds <= 0 and nothing else.
struct UsageSnapshot
{
    double usedSeconds = 0.0;
    double remainingSeconds = 0.0;
    int sessions = 0;
    bool blocked = false;
};

/**
 * @brief Per-platform daily usage counters
 *
 * One JSON file per platform (usage_<id>.json) holding today's record.
 * The day rolls over at the configured reset hour rather than midnight.
 * Each platform has its own lock, so unrelated platforms never contend.
 */
class UsageTracker
{
public:
    UsageTracker(const QString& dataDir, int resetHour);

    UsageSnapshot addUsage(const Platform& platform, double seconds,
                           const QDateTime& now = QDateTime::currentDateTime());
    UsageSnapshot snapshot(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());

    double usedSeconds(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());
    double remainingSeconds(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());
    bool isLimitReached(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());

    int incrementSessionCount(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());
    int sessionCount(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());
    bool resetPlatform(const Platform& platform, const QDateTime& now = QDateTime::currentDateTime());

    // Calendar date the usage belongs to; before the reset hour that is yesterday
    QDate logicalDay(const QDateTime& now) const;
    int resetHour() const;

    QString usageFilePath(const Platform& platform) const;

    // MM:SS, negative values clamp to 00:00
    static QString formatSeconds(double totalSeconds);

private:
    QSharedPointer<QMutex> lockFor(const QString& platformId);

    // Caller holds the platform lock
    UsageRecord load(const Platform& platform, const QDate& today) const;
    bool save(const Platform& platform, const UsageRecord& record) const;

    static UsageSnapshot derive(const Platform& platform, const UsageRecord& record);

    QString m_dataDir;
    int m_resetHour;

    QMutex m_locksMutex;
    QHash<QString, QSharedPointer<QMutex>> m_platformLocks;
};

#endif // USAGETRACKER_H
