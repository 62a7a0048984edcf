#include "Notifier.h"
#include "logger/logger.h"
#include <exception>

void Notifier::deliver(Notifier* notifier, const QString& title, const QString& message)
{
    if (!notifier) {
        return;
    }

    try {
        notifier->notify(title, message);
    } catch (const std::exception& e) {
        LOG_WARNING(QString("Notification '%1' failed: %2").arg(title, QString::fromUtf8(e.what())));
    }
}

LogNotifier::LogNotifier(QObject* parent)
    : QObject(parent)
{
}

void LogNotifier::notify(const QString& title, const QString& message)
{
    LOG_INFO(QString("[notify] %1: %2").arg(title, message));
    emit notificationPosted(title, message);
}
