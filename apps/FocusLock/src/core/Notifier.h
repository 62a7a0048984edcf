#ifndef NOTIFIER_H
#define NOTIFIER_H

#include <QObject>
#include <QString>

// Fire-and-forget notification surface (tray balloon, toast, log)
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const QString& title, const QString& message) = 0;

    // Callers in background loops use this; a failing notifier is logged
    // and never reaches the loop.
    static void deliver(Notifier* notifier, const QString& title, const QString& message);
};

// Default notifier for the headless process: logs the notification and
// re-emits it so a presentation layer can pick it up.
class LogNotifier : public QObject, public Notifier
{
    Q_OBJECT
public:
    explicit LogNotifier(QObject* parent = nullptr);

    void notify(const QString& title, const QString& message) override;

signals:
    void notificationPosted(const QString& title, const QString& message);
};

#endif // NOTIFIER_H
