#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QSettings>
#include <QString>
#include <QStringList>

#include "../core/Platform.h"

class ConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit ConfigManager(QObject *parent = nullptr);
    ~ConfigManager();

    bool initialize();

    // Getters
    QString dataDir() const;
    QString hostsFilePath() const;
    QString redirectAddress() const;
    int resetHour() const;
    QList<int> warningSteps() const;
    int usageTickMs() const;
    int integrityIntervalMs() const;
    int scheduleIntervalMs() const;
    int allowlistRefreshSeconds() const;
    QStringList allowlistDomains() const;
    QStringList allowlistResolvers() const;
    bool reapplyAllowlistOnBoot() const;
    QString firewallRulePrefix() const;
    QString logLevel() const;
    QString logFilePath() const;
    qint64 logMaxBytes() const;

    // Catalogue with the DailyLimitMinutes overrides applied
    QList<Platform> platforms() const;

    // Setters
    void setDataDir(const QString &path);
    void setHostsFilePath(const QString &path);
    void setRedirectAddress(const QString &address);
    void setResetHour(int hour);
    void setWarningSteps(const QList<int> &minutes);
    void setUsageTickMs(int milliseconds);
    void setIntegrityIntervalMs(int milliseconds);
    void setScheduleIntervalMs(int milliseconds);
    void setAllowlistRefreshSeconds(int seconds);
    void setAllowlistDomains(const QStringList &domains);
    void setAllowlistResolvers(const QStringList &addresses);
    void setReapplyAllowlistOnBoot(bool enabled);
    void setFirewallRulePrefix(const QString &prefix);
    void setLogLevel(const QString &level);
    void setLogFilePath(const QString &path);
    void setLogMaxBytes(qint64 bytes);
    void setDailyLimitMinutes(const QString &platformId, int minutes);

    // Configuration operations
    bool loadLocalConfig();
    bool saveLocalConfig();

    QString configFilePath() const;

    // Paths derived from the data directory
    QString dataFilePath(const QString &fileName) const;

    static QList<Platform> defaultPlatforms();
    static QStringList defaultPermanentDomains();
    static QStringList defaultAllowlistDomains();
    static QString defaultHostsFilePath();
    static QString defaultDataDir();

    static const int MinAllowlistRefreshSeconds = 30;

    // Command-line values that take precedence over LogLevel and LogFilePath
    // on every load. Empty strings clear them.
    static void setLogOverrides(const QString &level, const QString &filePath);

signals:
    void configChanged();

private:
    // Helper methods
    void loadDefaults();
    bool configFileExists() const;
    void applyLogSettings();
    static QList<int> normalizeWarningSteps(const QList<int> &minutes);

    QSettings* m_settings;
    QMutex m_mutex;

    QString m_dataDir;
    QString m_hostsFilePath;
    QString m_redirectAddress;
    int m_resetHour;
    QList<int> m_warningSteps;
    int m_usageTickMs;
    int m_integrityIntervalMs;
    int m_scheduleIntervalMs;
    int m_allowlistRefreshSeconds;
    QStringList m_allowlistDomains;
    QStringList m_allowlistResolvers;
    bool m_reapplyAllowlistOnBoot;
    QString m_firewallRulePrefix;
    QString m_logLevel;
    QString m_logFilePath;
    qint64 m_logMaxBytes;
    QMap<QString, int> m_dailyLimitMinutes;
    bool m_initialized;
};
#endif // CONFIGMANAGER_H
