#ifndef IPRANGE_H
#define IPRANGE_H

#include <QAbstractSocket>
#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QString>

// Inclusive address range of a single family. Addresses are kept as
// big-endian byte strings (4 or 16 bytes) so IPv4 and IPv6 share the math.
class IpRange
{
public:
    IpRange();
    IpRange(const QHostAddress& first, const QHostAddress& last);

    static IpRange single(const QHostAddress& address);
    static IpRange fromCidr(const QString& cidr);

    bool isValid() const;
    QAbstractSocket::NetworkLayerProtocol family() const;
    QHostAddress first() const;
    QHostAddress last() const;
    bool contains(const QHostAddress& address) const;

    // "a.b.c.d" for a single address, "first-last" otherwise (netsh syntax)
    QString toString() const;

    // Sorted, overlapping and adjacent ranges joined
    static QList<IpRange> merge(const QList<IpRange>& ranges);

    // Every address of the family not covered by the given ranges
    static QList<IpRange> complement(const QList<IpRange>& excluded, QAbstractSocket::NetworkLayerProtocol family);

    bool operator==(const IpRange& other) const;

private:
    IpRange(const QByteArray& first, const QByteArray& last, QAbstractSocket::NetworkLayerProtocol family);

    static QByteArray toBytes(const QHostAddress& address);
    static QHostAddress fromBytes(const QByteArray& bytes);
    static int compare(const QByteArray& a, const QByteArray& b);
    static bool increment(QByteArray& bytes);
    static bool decrement(QByteArray& bytes);

    QByteArray m_first;
    QByteArray m_last;
    QAbstractSocket::NetworkLayerProtocol m_family;
};

#endif // IPRANGE_H
