#ifndef DOMAINRESOLVER_H
#define DOMAINRESOLVER_H

#include <QHostAddress>
#include <QList>
#include <QString>

class DomainResolver
{
public:
    virtual ~DomainResolver() = default;

    // Blocking lookup of A and AAAA records; empty on failure
    virtual QList<QHostAddress> resolve(const QString& domain) = 0;
};

class HostInfoResolver : public DomainResolver
{
public:
    QList<QHostAddress> resolve(const QString& domain) override;
};

#endif // DOMAINRESOLVER_H
