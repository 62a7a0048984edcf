#include "HostsManager.h"
#include "AtomicFile.h"
#include "CommandRunner.h"
#include "HostsFile.h"
#include "logger/logger.h"
#include <QFile>
#include <QStringDecoder>

HostsManager::HostsManager(const QString& hostsPath,
                           const QString& backupPath,
                           const QString& redirectAddress,
                           CommandRunner* commandRunner,
                           QObject* parent)
    : QObject(parent)
    , m_hostsPath(hostsPath)
    , m_backupPath(backupPath)
    , m_redirectAddress(redirectAddress)
    , m_commandRunner(commandRunner)
    , m_backupTaken(false)
    , m_flushDns(true)
{
}

HostsManager::Result HostsManager::apply(const QString& markerId, const QStringList& domains, const QString& description)
{
    const QStringList entries = HostsFile::entryLines(m_redirectAddress, domains);
    if (entries.isEmpty()) {
        LOG_DEBUG(QString("No valid domains for %1, removing region").arg(markerId));
        return remove(markerId);
    }

    QStringList lines;
    if (!description.isEmpty()) {
        lines.append(QString("# %1").arg(description));
    }
    lines.append(entries);

    QMutexLocker locker(&m_mutex);

    HostsFile file;
    QByteArray raw;
    Result result = IoError;
    if (!load(file, raw, result)) {
        return result;
    }

    file.setRegion(markerId, lines);
    result = store(raw, file.serialize());

    if (result == Applied) {
        LOG_INFO(QString("Hosts region %1 applied (%2 domains)").arg(markerId).arg(entries.size()));
        locker.unlock();
        emit regionChanged(markerId, true);
    }
    return result;
}

HostsManager::Result HostsManager::remove(const QString& markerId)
{
    QMutexLocker locker(&m_mutex);

    HostsFile file;
    QByteArray raw;
    Result result = IoError;
    if (!load(file, raw, result)) {
        return result;
    }

    if (!file.removeRegion(markerId) && !file.wasRepaired()) {
        return Unchanged;
    }

    result = store(raw, file.serialize());
    if (result == Applied) {
        LOG_INFO(QString("Hosts region %1 removed").arg(markerId));
        locker.unlock();
        emit regionChanged(markerId, false);
    }
    return result;
}

bool HostsManager::hasRegion(const QString& markerId) const
{
    QMutexLocker locker(&m_mutex);

    HostsFile file;
    QByteArray raw;
    Result failure = IoError;
    if (!load(file, raw, failure)) {
        return false;
    }
    return file.hasRegion(markerId);
}

bool HostsManager::isApplied(const QString& markerId, const QStringList& domains) const
{
    const QStringList expected = HostsFile::entryLines(m_redirectAddress, domains);

    QMutexLocker locker(&m_mutex);

    HostsFile file;
    QByteArray raw;
    Result failure = IoError;
    if (!load(file, raw, failure) || file.regionCount(markerId) != 1) {
        return false;
    }

    QStringList actual;
    for (const QString& line : file.regionLines(markerId)) {
        if (!line.startsWith('#') && !line.isEmpty()) {
            actual.append(line);
        }
    }
    return actual == expected;
}

QStringList HostsManager::blockedDomains(const QString& markerId) const
{
    QMutexLocker locker(&m_mutex);

    HostsFile file;
    QByteArray raw;
    Result failure = IoError;
    if (!load(file, raw, failure)) {
        return QStringList();
    }

    QStringList domains;
    for (const QString& line : file.regionLines(markerId)) {
        if (line.startsWith('#')) {
            continue;
        }
        const QStringList parts = line.split(' ', Qt::SkipEmptyParts);
        if (parts.size() >= 2) {
            domains.append(parts.at(1));
        }
    }
    return domains;
}

bool HostsManager::restoreBackup()
{
    QMutexLocker locker(&m_mutex);

    QByteArray backup;
    QString error;
    if (AtomicFile::readAll(m_backupPath, backup, &error) != AtomicFile::Ok) {
        LOG_ERROR("Cannot restore hosts backup: " + error);
        return false;
    }
    if (looksCorrupted(backup)) {
        LOG_ERROR("Hosts backup is itself corrupted, not restoring: " + m_backupPath);
        return false;
    }

    clearReadOnly();
    if (AtomicFile::writeAll(m_hostsPath, backup, &error) != AtomicFile::Ok) {
        LOG_ERROR("Cannot restore hosts backup: " + error);
        return false;
    }

    LOG_INFO("Hosts file restored from " + m_backupPath);
    flushDns();
    return true;
}

void HostsManager::setDnsFlushEnabled(bool enabled)
{
    m_flushDns = enabled;
}

QString HostsManager::hostsPath() const
{
    return m_hostsPath;
}

QString HostsManager::backupPath() const
{
    return m_backupPath;
}

QString HostsManager::redirectAddress() const
{
    return m_redirectAddress;
}

QString HostsManager::resultToString(Result result)
{
    switch (result) {
    case Applied:          return "Applied";
    case Unchanged:        return "Unchanged";
    case PermissionDenied: return "PermissionDenied";
    case IoError:          return "IoError";
    }
    return "Unknown";
}

bool HostsManager::looksCorrupted(const QByteArray& raw)
{
    if (raw.contains('\0')) {
        return true;
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    QString decoded = decoder.decode(raw);
    Q_UNUSED(decoded);
    return decoder.hasError();
}

bool HostsManager::load(HostsFile& file, QByteArray& raw, Result& failure) const
{
    QString error;
    AtomicFile::Status status = AtomicFile::readAll(m_hostsPath, raw, &error);

    if (status == AtomicFile::NotFound) {
        LOG_WARNING("Hosts file missing, starting from an empty file: " + m_hostsPath);
        raw.clear();
    } else if (status == AtomicFile::PermissionDenied) {
        LOG_ERROR("Permission denied reading hosts file, process is not elevated: " + error);
        failure = PermissionDenied;
        return false;
    } else if (status != AtomicFile::Ok) {
        LOG_WARNING(error);
        failure = IoError;
        return false;
    }

    QByteArray base = raw;
    if (looksCorrupted(raw)) {
        QByteArray backup;
        if (AtomicFile::readAll(m_backupPath, backup) == AtomicFile::Ok && !looksCorrupted(backup)) {
            LOG_WARNING("Hosts file is corrupted, rebuilding from backup " + m_backupPath);
            base = backup;
        } else {
            LOG_ERROR("Hosts file is corrupted and no usable backup exists, dropping NUL bytes");
            base.replace('\0', QByteArray());
        }
    }

    file = HostsFile::parse(base);
    if (file.wasRepaired()) {
        LOG_WARNING("Malformed markers found in hosts file, repairing on next write");
    }
    return true;
}

HostsManager::Result HostsManager::store(const QByteArray& original, const QByteArray& content)
{
    if (content == original) {
        return Unchanged;
    }

    ensureBackup(original);
    clearReadOnly();

    QString error;
    AtomicFile::Status status = AtomicFile::writeAll(m_hostsPath, content, &error);
    if (status == AtomicFile::PermissionDenied) {
        LOG_ERROR("Permission denied writing hosts file, process is not elevated: " + error);
        return PermissionDenied;
    }
    if (status != AtomicFile::Ok) {
        LOG_WARNING("Hosts file write failed: " + error);
        return IoError;
    }

    flushDns();
    return Applied;
}

void HostsManager::ensureBackup(const QByteArray& original)
{
    if (m_backupTaken || m_backupPath.isEmpty()) {
        return;
    }

    if (looksCorrupted(original)) {
        // Keep whatever good backup a previous run left behind
        m_backupTaken = true;
        return;
    }

    QString error;
    if (AtomicFile::writeAll(m_backupPath, original, &error) == AtomicFile::Ok) {
        LOG_INFO("Hosts file backup created at " + m_backupPath);
        m_backupTaken = true;
    } else {
        LOG_WARNING("Could not create hosts backup: " + error);
    }
}

void HostsManager::clearReadOnly()
{
    QFile file(m_hostsPath);
    if (!file.exists()) {
        return;
    }

    QFileDevice::Permissions permissions = file.permissions();
    if (!(permissions & QFileDevice::WriteOwner)) {
        if (file.setPermissions(permissions | QFileDevice::WriteOwner | QFileDevice::WriteUser)) {
            LOG_INFO("Removed read-only attribute from hosts file");
        } else {
            LOG_DEBUG("Could not remove read-only attribute from hosts file");
        }
    }
}

void HostsManager::flushDns()
{
    if (!m_flushDns || !m_commandRunner) {
        return;
    }

#ifdef Q_OS_WIN
    CommandResult result = m_commandRunner->run("ipconfig", QStringList() << "/flushdns", 10000);
#else
    CommandResult result = m_commandRunner->run("resolvectl", QStringList() << "flush-caches", 10000);
#endif

    if (!result.succeeded()) {
        LOG_WARNING("DNS cache flush failed: " + result.output.trimmed());
    } else {
        LOG_DEBUG("DNS cache flushed");
    }
}
