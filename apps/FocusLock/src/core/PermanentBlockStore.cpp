#include "PermanentBlockStore.h"
#include "AtomicFile.h"
#include "HostsFile.h"
#include "logger/logger.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

PermanentBlockStore::PermanentBlockStore(const QString& filePath, const QStringList& builtInDomains, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_builtInDomains(HostsFile::normalizeDomains(builtInDomains))
{
}

bool PermanentBlockStore::load()
{
    QByteArray raw;
    QString error;
    AtomicFile::Status status = AtomicFile::readAll(m_filePath, raw, &error);

    QMutexLocker locker(&m_mutex);
    m_userBlocks.clear();

    if (status == AtomicFile::NotFound) {
        return true;
    }
    if (status != AtomicFile::Ok) {
        LOG_WARNING("Failed to load user blocks: " + error);
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_WARNING("Ignoring malformed " + m_filePath + ": " + parseError.errorString());
        return false;
    }

    for (const QJsonValue& value : doc.array()) {
        const QJsonObject object = value.toObject();
        BlockEntry entry;
        entry.label = object.value("label").toString().trimmed();
        for (const QJsonValue& domain : object.value("domains").toArray()) {
            entry.domains.append(domain.toString());
        }
        entry.domains = HostsFile::normalizeDomains(entry.domains);
        if (!entry.label.isEmpty() && !entry.domains.isEmpty()) {
            m_userBlocks.append(entry);
        }
    }

    LOG_INFO(QString("Loaded %1 user permanent blocks").arg(m_userBlocks.size()));
    return true;
}

bool PermanentBlockStore::addBlock(const QString& label, const QStringList& domains)
{
    BlockEntry entry;
    entry.label = label.trimmed();
    entry.domains = HostsFile::normalizeDomains(domains);
    if (entry.label.isEmpty() || entry.domains.isEmpty()) {
        LOG_WARNING("Rejected permanent block without label or valid domains");
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        QList<BlockEntry> blocks = m_userBlocks;

        bool replaced = false;
        for (BlockEntry& existing : blocks) {
            if (existing.label == entry.label) {
                existing = entry;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            blocks.append(entry);
        }

        if (!save(blocks)) {
            return false;
        }
        m_userBlocks = blocks;
    }

    LOG_INFO(QString("Added permanent block: %1 (%2 domains)").arg(entry.label).arg(entry.domains.size()));
    emit blocksChanged();
    return true;
}

bool PermanentBlockStore::removeBlock(const QString& label)
{
    {
        QMutexLocker locker(&m_mutex);
        QList<BlockEntry> blocks = m_userBlocks;

        int removed = 0;
        for (int i = blocks.size() - 1; i >= 0; --i) {
            if (blocks.at(i).label == label) {
                blocks.removeAt(i);
                ++removed;
            }
        }
        if (removed == 0) {
            return false;
        }

        if (!save(blocks)) {
            return false;
        }
        m_userBlocks = blocks;
    }

    LOG_INFO("Removed permanent block: " + label);
    emit blocksChanged();
    return true;
}

QList<BlockEntry> PermanentBlockStore::userBlocks() const
{
    QMutexLocker locker(&m_mutex);
    return m_userBlocks;
}

QStringList PermanentBlockStore::builtInDomains() const
{
    return m_builtInDomains;
}

QStringList PermanentBlockStore::allDomains() const
{
    QMutexLocker locker(&m_mutex);

    QStringList domains = m_builtInDomains;
    for (const BlockEntry& entry : m_userBlocks) {
        domains.append(entry.domains);
    }
    return HostsFile::normalizeDomains(domains);
}

QList<BlockEntry> PermanentBlockStore::presets()
{
    return QList<BlockEntry>()
        << BlockEntry{"Twitter / X", QStringList() << "twitter.com" << "www.twitter.com" << "x.com" << "www.x.com"}
        << BlockEntry{"TikTok", QStringList() << "tiktok.com" << "www.tiktok.com" << "vm.tiktok.com" << "m.tiktok.com"}
        << BlockEntry{"Reddit", QStringList() << "reddit.com" << "www.reddit.com" << "old.reddit.com" << "i.redd.it"}
        << BlockEntry{"Facebook", QStringList() << "facebook.com" << "www.facebook.com" << "m.facebook.com" << "web.facebook.com"};
}

bool PermanentBlockStore::save(const QList<BlockEntry>& blocks)
{
    QJsonArray array;
    for (const BlockEntry& entry : blocks) {
        QJsonObject object;
        object["label"] = entry.label;
        object["domains"] = QJsonArray::fromStringList(entry.domains);
        array.append(object);
    }

    QString error;
    if (AtomicFile::writeAll(m_filePath, QJsonDocument(array).toJson(QJsonDocument::Indented), &error) != AtomicFile::Ok) {
        LOG_ERROR("Failed to save user blocks: " + error);
        return false;
    }
    return true;
}
