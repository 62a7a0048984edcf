#include "DomainResolver.h"
#include "logger/logger.h"
#include <QHostInfo>

QList<QHostAddress> HostInfoResolver::resolve(const QString& domain)
{
    const QHostInfo info = QHostInfo::fromName(domain);
    if (info.error() != QHostInfo::NoError) {
        LOG_DEBUG(QString("Could not resolve %1: %2").arg(domain, info.errorString()));
        return QList<QHostAddress>();
    }

    QList<QHostAddress> addresses;
    for (const QHostAddress& address : info.addresses()) {
        if ((address.protocol() == QAbstractSocket::IPv4Protocol || address.protocol() == QAbstractSocket::IPv6Protocol)
            && !addresses.contains(address)) {
            addresses.append(address);
        }
    }
    return addresses;
}
