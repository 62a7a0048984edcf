#include "Platform.h"

QString Platform::markerId() const
{
    return QString("FOCUSLOCK-%1").arg(markerTag.toUpper());
}

QString Platform::usageFileName() const
{
    return QString("usage_%1.json").arg(id);
}

const Platform* Platform::findById(const QList<Platform>& platforms, const QString& id)
{
    for (const Platform& platform : platforms) {
        if (platform.id == id) {
            return &platform;
        }
    }
    return nullptr;
}
