#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QString>
#include <QStringList>

struct CommandResult
{
    bool started = false;
    int exitCode = -1;
    QString output;

    bool succeeded() const { return started && exitCode == 0; }
};

// Every external command (netsh, taskkill, ipconfig, schtasks) goes through
// this interface so the engines can run against a fake in tests.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const QString& program, const QStringList& arguments, int timeoutMs = 30000) = 0;
};

class ProcessCommandRunner : public CommandRunner
{
public:
    CommandResult run(const QString& program, const QStringList& arguments, int timeoutMs = 30000) override;
};

#endif // COMMANDRUNNER_H
