#ifndef PERMANENTBLOCKSTORE_H
#define PERMANENTBLOCKSTORE_H

#include <QObject>
#include <QList>
#include <QMutex>
#include <QString>
#include <QStringList>

struct BlockEntry
{
    QString label;
    QStringList domains;
};

// Permanent domain blocks: a built-in list plus user entries persisted in
// permanent_blocks.json as [{label, domains}]. Nothing here ever unblocks;
// removing a user entry only shrinks the permanent region.
class PermanentBlockStore : public QObject
{
    Q_OBJECT
public:
    PermanentBlockStore(const QString& filePath, const QStringList& builtInDomains, QObject* parent = nullptr);

    bool load();

    bool addBlock(const QString& label, const QStringList& domains);
    bool removeBlock(const QString& label);

    QList<BlockEntry> userBlocks() const;
    QStringList builtInDomains() const;

    // Built-in first, then user entries in insertion order, de-duplicated
    QStringList allDomains() const;

    static QList<BlockEntry> presets();

signals:
    void blocksChanged();

private:
    bool save(const QList<BlockEntry>& blocks);

    QString m_filePath;
    QStringList m_builtInDomains;
    QList<BlockEntry> m_userBlocks;
    mutable QMutex m_mutex;
};

#endif // PERMANENTBLOCKSTORE_H
