#include "ConfigManager.h"
#include "logger/logger.h"
#include <QDir>
#include <QFileInfo>
#include <QHostAddress>
#include <QMutexLocker>
#include <QStandardPaths>
#include <algorithm>
#include <functional>

namespace {

QStringList withWww(const QStringList& bareDomains)
{
    QStringList result;
    for (const QString& domain : bareDomains) {
        result << domain << "www." + domain;
    }
    return result;
}

QMutex g_logOverrideMutex;
QString g_logLevelOverride;
QString g_logFileOverride;

} // namespace

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_initialized(false)
{
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
    delete m_settings;
}

bool ConfigManager::initialize()
{
    if (m_initialized) {
        LOG_WARNING("ConfigManager already initialized");
        return true;
    }

    LOG_INFO("Initializing ConfigManager");

    QString configPath = configFilePath();
    LOG_INFO("Config file path: " + configPath);

    QDir dir = QFileInfo(configPath).dir();
    if (!dir.exists()) {
        LOG_INFO("Creating config directory: " + dir.path());
        if (!dir.mkpath(".")) {
            LOG_ERROR("Failed to create config directory");
            return false;
        }
    }

    m_settings = new QSettings(configPath, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Error initializing QSettings: " + QString::number(m_settings->status()));
        return false;
    }

    m_initialized = true;
    return true;
}

void ConfigManager::loadDefaults()
{
    m_dataDir = defaultDataDir();
    m_hostsFilePath = defaultHostsFilePath();
    m_redirectAddress = "127.0.0.1";
    m_resetHour = 4;
    m_warningSteps = QList<int>() << 5 << 1;
    m_usageTickMs = 1000;
    m_integrityIntervalMs = 30000;
    m_scheduleIntervalMs = 60000;
    m_allowlistRefreshSeconds = 300;
    m_allowlistDomains = defaultAllowlistDomains();
    m_allowlistResolvers.clear();
    m_reapplyAllowlistOnBoot = true;
    m_firewallRulePrefix = "FocusLock";
    m_logLevel = "info";
    m_logFilePath = "";
    m_logMaxBytes = 5 * 1024 * 1024;
    m_dailyLimitMinutes.clear();
}

QString ConfigManager::configFilePath() const
{
    QString configDir = qEnvironmentVariable("FOCUSLOCK_CONFIG_DIR");
    if (configDir.isEmpty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + "/FocusLock";
    }
    return QDir(configDir).filePath("focuslock.conf");
}

QString ConfigManager::dataFilePath(const QString &fileName) const
{
    return QDir(dataDir()).filePath(fileName);
}

bool ConfigManager::configFileExists() const
{
    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    QFileInfo info(m_settings->fileName());
    return info.exists() && info.size() > 0;
}

bool ConfigManager::loadLocalConfig()
{
    LOG_INFO("Loading local configuration");

    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    if (configFileExists()) {
        LOG_INFO("Configuration file found: " + m_settings->fileName());
        LOG_DEBUG("Config contains " + QString::number(m_settings->allKeys().size()) + " keys");
    } else {
        LOG_INFO("Configuration file not found, writing defaults");
        if (!saveLocalConfig()) {
            return false;
        }
        applyLogSettings();
        return true;
    }

    {
        QMutexLocker locker(&m_mutex);

        m_dataDir = m_settings->value("DataDir", m_dataDir).toString();
        m_hostsFilePath = m_settings->value("HostsFilePath", m_hostsFilePath).toString();
        m_redirectAddress = m_settings->value("RedirectAddress", m_redirectAddress).toString();
        m_resetHour = m_settings->value("ResetHour", m_resetHour).toInt();
        m_usageTickMs = m_settings->value("UsageTickMs", m_usageTickMs).toInt();
        m_integrityIntervalMs = m_settings->value("IntegrityIntervalMs", m_integrityIntervalMs).toInt();
        m_scheduleIntervalMs = m_settings->value("ScheduleIntervalMs", m_scheduleIntervalMs).toInt();
        m_allowlistRefreshSeconds = m_settings->value("AllowlistRefreshSeconds", m_allowlistRefreshSeconds).toInt();
        m_allowlistDomains = m_settings->value("AllowlistDomains", m_allowlistDomains).toStringList();
        m_allowlistResolvers = m_settings->value("AllowlistResolvers", m_allowlistResolvers).toStringList();
        m_reapplyAllowlistOnBoot = m_settings->value("ReapplyAllowlistOnBoot", m_reapplyAllowlistOnBoot).toBool();
        m_firewallRulePrefix = m_settings->value("FirewallRulePrefix", m_firewallRulePrefix).toString();
        m_logLevel = m_settings->value("LogLevel", m_logLevel).toString();
        m_logFilePath = m_settings->value("LogFilePath", m_logFilePath).toString();
        m_logMaxBytes = m_settings->value("LogMaxBytes", m_logMaxBytes).toLongLong();

        QStringList stepTexts;
        for (int step : m_warningSteps) {
            stepTexts << QString::number(step);
        }
        stepTexts = m_settings->value("WarningSteps", stepTexts).toStringList();
        QList<int> steps;
        for (const QString& text : stepTexts) {
            bool ok = false;
            const int value = text.trimmed().toInt(&ok);
            if (ok) {
                steps << value;
            } else {
                LOG_WARNING("Ignoring non-numeric WarningSteps entry: " + text);
            }
        }
        m_warningSteps = normalizeWarningSteps(steps);

        m_dailyLimitMinutes.clear();
        for (const Platform& platform : defaultPlatforms()) {
            const QString key = "Platforms/" + platform.id + "/DailyLimitMinutes";
            if (!m_settings->contains(key)) {
                continue;
            }
            bool ok = false;
            const int minutes = m_settings->value(key).toInt(&ok);
            if (!ok || minutes < 0) {
                LOG_WARNING("Invalid " + key + " ignored, using " +
                            QString::number(platform.dailyLimitSeconds / 60) + " minutes");
                continue;
            }
            m_dailyLimitMinutes.insert(platform.id, minutes);
        }

        // Validate and correct settings
        if (m_dataDir.isEmpty()) {
            m_dataDir = defaultDataDir();
            LOG_WARNING("Empty DataDir corrected to " + m_dataDir);
        }

        if (m_hostsFilePath.isEmpty()) {
            m_hostsFilePath = defaultHostsFilePath();
            LOG_WARNING("Empty HostsFilePath corrected to " + m_hostsFilePath);
        }

        if (QHostAddress(m_redirectAddress).isNull()) {
            LOG_WARNING("Invalid RedirectAddress " + m_redirectAddress + " corrected to 127.0.0.1");
            m_redirectAddress = "127.0.0.1";
        }

        if (m_resetHour < 0 || m_resetHour > 23) {
            const int corrected = qBound(0, m_resetHour, 23);
            LOG_WARNING("Invalid ResetHour corrected from " + QString::number(m_resetHour) +
                        " to " + QString::number(corrected));
            m_resetHour = corrected;
        }

        if (m_usageTickMs < 100) {
            LOG_WARNING("Invalid UsageTickMs corrected from " + QString::number(m_usageTickMs) + " to 1000");
            m_usageTickMs = 1000;
        }

        if (m_integrityIntervalMs < 1000) {
            LOG_WARNING("Invalid IntegrityIntervalMs corrected from " + QString::number(m_integrityIntervalMs) + " to 30000");
            m_integrityIntervalMs = 30000;
        }

        if (m_scheduleIntervalMs < 1000) {
            LOG_WARNING("Invalid ScheduleIntervalMs corrected from " + QString::number(m_scheduleIntervalMs) + " to 60000");
            m_scheduleIntervalMs = 60000;
        }

        if (m_allowlistRefreshSeconds < MinAllowlistRefreshSeconds) {
            LOG_WARNING("AllowlistRefreshSeconds corrected from " + QString::number(m_allowlistRefreshSeconds) +
                        " to " + QString::number(MinAllowlistRefreshSeconds));
            m_allowlistRefreshSeconds = MinAllowlistRefreshSeconds;
        }

        if (m_firewallRulePrefix.trimmed().isEmpty()) {
            LOG_WARNING("Empty FirewallRulePrefix corrected to FocusLock");
            m_firewallRulePrefix = "FocusLock";
        }

        bool levelOk = false;
        Logger::levelFromString(m_logLevel, &levelOk);
        if (!levelOk) {
            LOG_WARNING("Unknown LogLevel " + m_logLevel + " corrected to info");
            m_logLevel = "info";
        }

        if (m_logMaxBytes < 0) {
            LOG_WARNING("Negative LogMaxBytes corrected to 0 (rotation disabled)");
            m_logMaxBytes = 0;
        }
    }

    applyLogSettings();

    LOG_INFO("Local configuration loaded successfully");
    return true;
}

bool ConfigManager::saveLocalConfig()
{
    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    LOG_INFO("Saving configuration to: " + m_settings->fileName());

    {
        QMutexLocker locker(&m_mutex);

        m_settings->setValue("DataDir", m_dataDir);
        m_settings->setValue("HostsFilePath", m_hostsFilePath);
        m_settings->setValue("RedirectAddress", m_redirectAddress);
        m_settings->setValue("ResetHour", m_resetHour);

        QStringList stepTexts;
        for (int step : m_warningSteps) {
            stepTexts << QString::number(step);
        }
        m_settings->setValue("WarningSteps", stepTexts);

        m_settings->setValue("UsageTickMs", m_usageTickMs);
        m_settings->setValue("IntegrityIntervalMs", m_integrityIntervalMs);
        m_settings->setValue("ScheduleIntervalMs", m_scheduleIntervalMs);
        m_settings->setValue("AllowlistRefreshSeconds", m_allowlistRefreshSeconds);
        m_settings->setValue("AllowlistDomains", m_allowlistDomains);
        m_settings->setValue("AllowlistResolvers", m_allowlistResolvers);
        m_settings->setValue("ReapplyAllowlistOnBoot", m_reapplyAllowlistOnBoot);
        m_settings->setValue("FirewallRulePrefix", m_firewallRulePrefix);
        m_settings->setValue("LogLevel", m_logLevel);
        m_settings->setValue("LogFilePath", m_logFilePath);
        m_settings->setValue("LogMaxBytes", m_logMaxBytes);

        for (auto it = m_dailyLimitMinutes.constBegin(); it != m_dailyLimitMinutes.constEnd(); ++it) {
            m_settings->setValue("Platforms/" + it.key() + "/DailyLimitMinutes", it.value());
        }

        m_settings->sync();
    }

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration, error code: " + QString::number(status));
        return false;
    }

    LOG_INFO("Configuration saved successfully");
    return true;
}

void ConfigManager::setLogOverrides(const QString &level, const QString &filePath)
{
    QMutexLocker locker(&g_logOverrideMutex);
    g_logLevelOverride = level;
    g_logFileOverride = filePath;
}

void ConfigManager::applyLogSettings()
{
    QString level;
    QString filePath;
    qint64 maxBytes;
    {
        QMutexLocker locker(&m_mutex);
        level = m_logLevel;
        filePath = m_logFilePath;
        maxBytes = m_logMaxBytes;
    }
    {
        QMutexLocker locker(&g_logOverrideMutex);
        if (!g_logLevelOverride.isEmpty()) {
            level = g_logLevelOverride;
        }
        if (!g_logFileOverride.isEmpty()) {
            filePath = g_logFileOverride;
        }
    }

    Logger::instance()->setLogLevel(Logger::levelFromString(level));
    Logger::instance()->setMaxFileSize(maxBytes);

    if (!filePath.isEmpty() && !Logger::instance()->setLogFile(filePath)) {
        LOG_WARNING("Could not open log file " + filePath);
    }
}

QList<int> ConfigManager::normalizeWarningSteps(const QList<int> &minutes)
{
    QList<int> result;
    for (int value : minutes) {
        if (value > 0 && !result.contains(value)) {
            result << value;
        } else if (value <= 0) {
            LOG_WARNING("Ignoring non-positive warning step " + QString::number(value));
        }
    }
    std::sort(result.begin(), result.end(), std::greater<int>());
    return result;
}

QList<Platform> ConfigManager::defaultPlatforms()
{
    Platform instagram;
    instagram.id = "instagram";
    instagram.displayName = "Instagram";
    instagram.dailyLimitSeconds = 10 * 60;
    instagram.domains = QStringList()
        << "instagram.com" << "www.instagram.com" << "api.instagram.com"
        << "i.instagram.com" << "graph.instagram.com" << "l.instagram.com"
        << "static.cdninstagram.com" << "scontent.cdninstagram.com"
        << "edge-chat.instagram.com" << "scontent-mad1-1.cdninstagram.com"
        << "scontent-mad2-1.cdninstagram.com";
    instagram.processNames = QStringList() << "Instagram.exe" << "InstagramApp.exe";
    instagram.markerTag = "INSTAGRAM";

    Platform youtube;
    youtube.id = "youtube";
    youtube.displayName = "YouTube";
    youtube.dailyLimitSeconds = 60 * 60;
    youtube.domains = QStringList()
        << "youtube.com" << "www.youtube.com" << "m.youtube.com" << "youtu.be"
        << "youtube-nocookie.com" << "www.youtube-nocookie.com"
        << "youtubei.googleapis.com" << "yt3.ggpht.com"
        << "yt3.googleusercontent.com" << "i.ytimg.com" << "s.ytimg.com";
    youtube.markerTag = "YOUTUBE";

    return QList<Platform>() << instagram << youtube;
}

QStringList ConfigManager::defaultPermanentDomains()
{
    QStringList domains = QStringList()
        << "instagram.com" << "www.instagram.com"
        << "api.instagram.com" << "i.instagram.com"
        << "graph.instagram.com" << "l.instagram.com"
        << "static.cdninstagram.com" << "scontent.cdninstagram.com"
        << "edge-chat.instagram.com"
        << "youtube.com" << "www.youtube.com"
        << "m.youtube.com" << "youtu.be"
        << "youtube-nocookie.com" << "www.youtube-nocookie.com"
        << "youtubei.googleapis.com"
        << "yt3.ggpht.com" << "yt3.googleusercontent.com"
        << "i.ytimg.com" << "s.ytimg.com";

    // Adult content, video and cam sites, paid content platforms
    domains << withWww(QStringList()
        << "pornhub.com" << "xvideos.com" << "xnxx.com" << "xhamster.com"
        << "redtube.com" << "youporn.com" << "tube8.com" << "spankbang.com"
        << "beeg.com" << "eporner.com" << "hqporner.com" << "tnaflix.com"
        << "drtuber.com" << "motherless.com" << "ixxx.com" << "thumbzilla.com"
        << "porn.com" << "4tube.com" << "nuvid.com" << "porntrex.com"
        << "fuq.com" << "fapello.com"
        << "chaturbate.com" << "stripchat.com" << "bongacams.com" << "cam4.com"
        << "myfreecams.com" << "camsoda.com" << "livejasmin.com"
        << "onlyfans.com" << "fansly.com"
        << "hentaihaven.xxx" << "hanime.tv" << "nhentai.net");

    return domains;
}

QStringList ConfigManager::defaultAllowlistDomains()
{
    return QStringList()
        << "docs.google.com" << "drive.google.com" << "mail.google.com"
        << "calendar.google.com" << "meet.google.com"
        << "stackoverflow.com" << "github.com" << "gitlab.com" << "pypi.org"
        << "npmjs.com" << "developer.mozilla.org"
        << "slack.com" << "notion.so" << "linear.app";
}

QString ConfigManager::defaultHostsFilePath()
{
#ifdef Q_OS_WIN
    return "C:/Windows/System32/drivers/etc/hosts";
#else
    return "/etc/hosts";
#endif
}

QString ConfigManager::defaultDataDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + "/FocusLock";
}

// Getters
QString ConfigManager::dataDir() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_dataDir;
}

QString ConfigManager::hostsFilePath() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_hostsFilePath;
}

QString ConfigManager::redirectAddress() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_redirectAddress;
}

int ConfigManager::resetHour() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_resetHour;
}

QList<int> ConfigManager::warningSteps() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_warningSteps;
}

int ConfigManager::usageTickMs() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_usageTickMs;
}

int ConfigManager::integrityIntervalMs() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_integrityIntervalMs;
}

int ConfigManager::scheduleIntervalMs() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_scheduleIntervalMs;
}

int ConfigManager::allowlistRefreshSeconds() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_allowlistRefreshSeconds;
}

QStringList ConfigManager::allowlistDomains() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_allowlistDomains;
}

QStringList ConfigManager::allowlistResolvers() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_allowlistResolvers;
}

bool ConfigManager::reapplyAllowlistOnBoot() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_reapplyAllowlistOnBoot;
}

QString ConfigManager::firewallRulePrefix() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_firewallRulePrefix;
}

QString ConfigManager::logLevel() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_logLevel;
}

QString ConfigManager::logFilePath() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_logFilePath;
}

qint64 ConfigManager::logMaxBytes() const
{
    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    return m_logMaxBytes;
}

QList<Platform> ConfigManager::platforms() const
{
    QList<Platform> result = defaultPlatforms();

    QMutexLocker locker(const_cast<QMutex*>(&m_mutex));
    for (Platform& platform : result) {
        if (m_dailyLimitMinutes.contains(platform.id)) {
            platform.dailyLimitSeconds = m_dailyLimitMinutes.value(platform.id) * 60;
        }
    }
    return result;
}

// Setters emit outside the lock so slots may read the new values
void ConfigManager::setDataDir(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (path.isEmpty() || m_dataDir == path) {
            return;
        }
        m_dataDir = path;
    }
    emit configChanged();
}

void ConfigManager::setHostsFilePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (path.isEmpty() || m_hostsFilePath == path) {
            return;
        }
        m_hostsFilePath = path;
    }
    emit configChanged();
}

void ConfigManager::setRedirectAddress(const QString &address)
{
    {
        QMutexLocker locker(&m_mutex);
        if (QHostAddress(address).isNull() || m_redirectAddress == address) {
            return;
        }
        m_redirectAddress = address;
    }
    emit configChanged();
}

void ConfigManager::setResetHour(int hour)
{
    {
        QMutexLocker locker(&m_mutex);
        if (hour < 0 || hour > 23 || m_resetHour == hour) {
            return;
        }
        m_resetHour = hour;
    }
    emit configChanged();
}

void ConfigManager::setWarningSteps(const QList<int> &minutes)
{
    const QList<int> steps = normalizeWarningSteps(minutes);
    {
        QMutexLocker locker(&m_mutex);
        if (m_warningSteps == steps) {
            return;
        }
        m_warningSteps = steps;
    }
    emit configChanged();
}

void ConfigManager::setUsageTickMs(int milliseconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (milliseconds < 100 || m_usageTickMs == milliseconds) {
            return;
        }
        m_usageTickMs = milliseconds;
    }
    emit configChanged();
}

void ConfigManager::setIntegrityIntervalMs(int milliseconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (milliseconds < 1000 || m_integrityIntervalMs == milliseconds) {
            return;
        }
        m_integrityIntervalMs = milliseconds;
    }
    emit configChanged();
}

void ConfigManager::setScheduleIntervalMs(int milliseconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (milliseconds < 1000 || m_scheduleIntervalMs == milliseconds) {
            return;
        }
        m_scheduleIntervalMs = milliseconds;
    }
    emit configChanged();
}

void ConfigManager::setAllowlistRefreshSeconds(int seconds)
{
    const int corrected = qMax(seconds, static_cast<int>(MinAllowlistRefreshSeconds));
    {
        QMutexLocker locker(&m_mutex);
        if (m_allowlistRefreshSeconds == corrected) {
            return;
        }
        m_allowlistRefreshSeconds = corrected;
    }
    emit configChanged();
}

void ConfigManager::setAllowlistDomains(const QStringList &domains)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_allowlistDomains == domains) {
            return;
        }
        m_allowlistDomains = domains;
    }
    emit configChanged();
}

void ConfigManager::setAllowlistResolvers(const QStringList &addresses)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_allowlistResolvers == addresses) {
            return;
        }
        m_allowlistResolvers = addresses;
    }
    emit configChanged();
}

void ConfigManager::setReapplyAllowlistOnBoot(bool enabled)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_reapplyAllowlistOnBoot == enabled) {
            return;
        }
        m_reapplyAllowlistOnBoot = enabled;
    }
    emit configChanged();
}

void ConfigManager::setFirewallRulePrefix(const QString &prefix)
{
    {
        QMutexLocker locker(&m_mutex);
        if (prefix.trimmed().isEmpty() || m_firewallRulePrefix == prefix) {
            return;
        }
        m_firewallRulePrefix = prefix;
    }
    emit configChanged();
}

void ConfigManager::setLogLevel(const QString &level)
{
    bool ok = false;
    Logger::levelFromString(level, &ok);
    {
        QMutexLocker locker(&m_mutex);
        if (!ok || m_logLevel == level) {
            return;
        }
        m_logLevel = level;
    }
    emit configChanged();
}

void ConfigManager::setLogFilePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logFilePath == path) {
            return;
        }
        m_logFilePath = path;
    }
    emit configChanged();
}

void ConfigManager::setLogMaxBytes(qint64 bytes)
{
    {
        QMutexLocker locker(&m_mutex);
        if (bytes < 0 || m_logMaxBytes == bytes) {
            return;
        }
        m_logMaxBytes = bytes;
    }
    emit configChanged();
}

void ConfigManager::setDailyLimitMinutes(const QString &platformId, int minutes)
{
    if (minutes < 0) {
        LOG_WARNING("Rejected negative daily limit for " + platformId);
        return;
    }
    {
        QMutexLocker locker(&m_mutex);
        if (m_dailyLimitMinutes.value(platformId, -1) == minutes) {
            return;
        }
        m_dailyLimitMinutes.insert(platformId, minutes);
    }
    emit configChanged();
}
