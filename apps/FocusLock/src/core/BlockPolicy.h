#ifndef BLOCKPOLICY_H
#define BLOCKPOLICY_H

#include <QList>
#include <QString>
#include <QStringList>

struct HostsBlock
{
    QString markerId;
    QString description;
    QStringList domains;
};

// The hosts regions that must currently be present, and the ones that must
// be absent. Queried by the integrity monitor on every tick, so the answer
// follows live session state.
class BlockPolicy
{
public:
    virtual ~BlockPolicy() = default;

    virtual QList<HostsBlock> enforcedBlocks() const = 0;

    // Marker ids of blocks lifted by a running session
    virtual QStringList liftedMarkers() const = 0;
};

#endif // BLOCKPOLICY_H
