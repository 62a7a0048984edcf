#include "IpRange.h"
#include <algorithm>

IpRange::IpRange()
    : m_family(QAbstractSocket::UnknownNetworkLayerProtocol)
{
}

IpRange::IpRange(const QHostAddress& first, const QHostAddress& last)
    : m_first(toBytes(first))
    , m_last(toBytes(last))
    , m_family(first.protocol())
{
    if (first.protocol() != last.protocol() || m_first.isEmpty() || compare(m_first, m_last) > 0) {
        m_first.clear();
        m_last.clear();
        m_family = QAbstractSocket::UnknownNetworkLayerProtocol;
    }
}

IpRange::IpRange(const QByteArray& first, const QByteArray& last, QAbstractSocket::NetworkLayerProtocol family)
    : m_first(first)
    , m_last(last)
    , m_family(family)
{
}

IpRange IpRange::single(const QHostAddress& address)
{
    return IpRange(address, address);
}

IpRange IpRange::fromCidr(const QString& cidr)
{
    const QPair<QHostAddress, int> subnet = QHostAddress::parseSubnet(cidr);
    if (subnet.first.isNull() || subnet.second < 0) {
        return IpRange();
    }

    QByteArray first = toBytes(subnet.first);
    if (first.isEmpty()) {
        return IpRange();
    }
    QByteArray last = first;

    const int totalBits = first.size() * 8;
    for (int bit = subnet.second; bit < totalBits; ++bit) {
        const int byteIndex = bit / 8;
        const quint8 mask = static_cast<quint8>(0x80 >> (bit % 8));
        first[byteIndex] = static_cast<char>(static_cast<quint8>(first.at(byteIndex)) & ~mask);
        last[byteIndex] = static_cast<char>(static_cast<quint8>(last.at(byteIndex)) | mask);
    }

    return IpRange(first, last, subnet.first.protocol());
}

bool IpRange::isValid() const
{
    return m_family != QAbstractSocket::UnknownNetworkLayerProtocol;
}

QAbstractSocket::NetworkLayerProtocol IpRange::family() const
{
    return m_family;
}

QHostAddress IpRange::first() const
{
    return fromBytes(m_first);
}

QHostAddress IpRange::last() const
{
    return fromBytes(m_last);
}

bool IpRange::contains(const QHostAddress& address) const
{
    const QByteArray bytes = toBytes(address);
    if (!isValid() || bytes.size() != m_first.size()) {
        return false;
    }
    return compare(m_first, bytes) <= 0 && compare(bytes, m_last) <= 0;
}

QString IpRange::toString() const
{
    if (!isValid()) {
        return QString();
    }
    if (m_first == m_last) {
        return first().toString();
    }
    return QString("%1-%2").arg(first().toString(), last().toString());
}

QList<IpRange> IpRange::merge(const QList<IpRange>& ranges)
{
    QList<IpRange> sorted;
    for (const IpRange& range : ranges) {
        if (range.isValid()) {
            sorted.append(range);
        }
    }

    std::sort(sorted.begin(), sorted.end(), [](const IpRange& a, const IpRange& b) {
        if (a.m_family != b.m_family) {
            return a.m_family < b.m_family;
        }
        return compare(a.m_first, b.m_first) < 0;
    });

    QList<IpRange> merged;
    for (const IpRange& range : sorted) {
        if (merged.isEmpty() || merged.last().m_family != range.m_family) {
            merged.append(range);
            continue;
        }

        IpRange& current = merged.last();
        QByteArray next = current.m_last;
        const bool overflowed = !increment(next);
        if (overflowed || compare(range.m_first, next) <= 0) {
            if (compare(range.m_last, current.m_last) > 0) {
                current.m_last = range.m_last;
            }
        } else {
            merged.append(range);
        }
    }
    return merged;
}

QList<IpRange> IpRange::complement(const QList<IpRange>& excluded, QAbstractSocket::NetworkLayerProtocol family)
{
    const int size = family == QAbstractSocket::IPv6Protocol ? 16 : 4;
    QList<IpRange> sameFamily;
    for (const IpRange& range : excluded) {
        if (range.m_family == family) {
            sameFamily.append(range);
        }
    }

    QList<IpRange> result;
    QByteArray cursor(size, '\0');
    const QByteArray maximum(size, '\xFF');
    bool exhausted = false;

    for (const IpRange& range : merge(sameFamily)) {
        if (compare(cursor, range.m_first) < 0) {
            QByteArray gapEnd = range.m_first;
            decrement(gapEnd);
            result.append(IpRange(cursor, gapEnd, family));
        }

        cursor = range.m_last;
        if (!increment(cursor)) {
            exhausted = true;
            break;
        }
    }

    if (!exhausted) {
        result.append(IpRange(cursor, maximum, family));
    }
    return result;
}

bool IpRange::operator==(const IpRange& other) const
{
    return m_family == other.m_family && m_first == other.m_first && m_last == other.m_last;
}

QByteArray IpRange::toBytes(const QHostAddress& address)
{
    if (address.protocol() == QAbstractSocket::IPv4Protocol) {
        const quint32 value = address.toIPv4Address();
        QByteArray bytes(4, '\0');
        for (int i = 0; i < 4; ++i) {
            bytes[i] = static_cast<char>((value >> (24 - 8 * i)) & 0xFF);
        }
        return bytes;
    }

    if (address.protocol() == QAbstractSocket::IPv6Protocol) {
        const Q_IPV6ADDR value = address.toIPv6Address();
        return QByteArray(reinterpret_cast<const char*>(value.c), 16);
    }

    return QByteArray();
}

QHostAddress IpRange::fromBytes(const QByteArray& bytes)
{
    if (bytes.size() == 4) {
        quint32 value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | static_cast<quint8>(bytes.at(i));
        }
        return QHostAddress(value);
    }

    if (bytes.size() == 16) {
        Q_IPV6ADDR value;
        for (int i = 0; i < 16; ++i) {
            value.c[i] = static_cast<quint8>(bytes.at(i));
        }
        return QHostAddress(value);
    }

    return QHostAddress();
}

int IpRange::compare(const QByteArray& a, const QByteArray& b)
{
    for (int i = 0; i < a.size() && i < b.size(); ++i) {
        const quint8 left = static_cast<quint8>(a.at(i));
        const quint8 right = static_cast<quint8>(b.at(i));
        if (left != right) {
            return left < right ? -1 : 1;
        }
    }
    return a.size() - b.size();
}

// Both return false on wrap-around
bool IpRange::increment(QByteArray& bytes)
{
    for (int i = bytes.size() - 1; i >= 0; --i) {
        const quint8 value = static_cast<quint8>(bytes.at(i));
        if (value != 0xFF) {
            bytes[i] = static_cast<char>(value + 1);
            return true;
        }
        bytes[i] = '\0';
    }
    return false;
}

bool IpRange::decrement(QByteArray& bytes)
{
    for (int i = bytes.size() - 1; i >= 0; --i) {
        const quint8 value = static_cast<quint8>(bytes.at(i));
        if (value != 0x00) {
            bytes[i] = static_cast<char>(value - 1);
            return true;
        }
        bytes[i] = '\xFF';
    }
    return false;
}
