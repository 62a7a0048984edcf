#include "CommandRunner.h"
#include "logger/logger.h"
#include <QProcess>

CommandResult ProcessCommandRunner::run(const QString& program, const QStringList& arguments, int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);

    if (!process.waitForStarted(timeoutMs)) {
        LOG_WARNING(QString("Failed to start %1: %2").arg(program, process.errorString()));
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs)) {
        LOG_WARNING(QString("%1 timed out after %2 ms, killing it").arg(program).arg(timeoutMs));
        process.kill();
        process.waitForFinished(1000);
        result.output = QString::fromLocal8Bit(process.readAll());
        return result;
    }

    result.output = QString::fromLocal8Bit(process.readAll());
    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;

    LOG_DEBUG(QString("%1 %2 -> exit %3").arg(program, arguments.join(' ')).arg(result.exitCode));
    return result;
}
