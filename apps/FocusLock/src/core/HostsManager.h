#ifndef HOSTSMANAGER_H
#define HOSTSMANAGER_H

#include <QObject>
#include <QMutex>
#include <QString>
#include <QStringList>

class CommandRunner;
class HostsFile;

/**
 * @brief Name-block engine over the system hosts file
 *
 * Every mutation is a locked read-modify-write of a single marker region.
 * Content outside the region is never touched, and the whole file is
 * replaced atomically. apply() compares the result with what is on disk
 * and skips the write when nothing changed, so the integrity loop can call
 * it every tick.
 */
class HostsManager : public QObject
{
    Q_OBJECT
public:
    enum Result {
        Applied,          ///< File rewritten
        Unchanged,        ///< Region already in the requested state
        PermissionDenied, ///< Hosts file not writable (process not elevated)
        IoError           ///< Any other read or write failure
    };

    HostsManager(const QString& hostsPath,
                 const QString& backupPath,
                 const QString& redirectAddress,
                 CommandRunner* commandRunner,
                 QObject* parent = nullptr);

    // Rewrites the region to exactly the given domains. An empty domain set
    // removes the region.
    Result apply(const QString& markerId, const QStringList& domains, const QString& description = QString());
    Result remove(const QString& markerId);

    bool hasRegion(const QString& markerId) const;
    bool isApplied(const QString& markerId, const QStringList& domains) const;
    QStringList blockedDomains(const QString& markerId) const;

    // Copies the backup taken before the first write of this process back
    // over the hosts file
    bool restoreBackup();

    void setDnsFlushEnabled(bool enabled);

    QString hostsPath() const;
    QString backupPath() const;
    QString redirectAddress() const;

    static QString resultToString(Result result);
    static bool isSuccess(Result result) { return result == Applied || result == Unchanged; }
    static bool looksCorrupted(const QByteArray& raw);

signals:
    void regionChanged(const QString& markerId, bool present);

private:
    // Both expect m_mutex to be held
    bool load(HostsFile& file, QByteArray& raw, Result& failure) const;
    Result store(const QByteArray& original, const QByteArray& content);

    void ensureBackup(const QByteArray& original);
    void clearReadOnly();
    void flushDns();

    QString m_hostsPath;
    QString m_backupPath;
    QString m_redirectAddress;
    CommandRunner* m_commandRunner;
    bool m_backupTaken;
    bool m_flushDns;
    mutable QMutex m_mutex;
};

#endif // HOSTSMANAGER_H
