#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

// Initialize static member to nullptr
Logger* Logger::m_instance = nullptr;

// Double-checked locking so background loops can log before main() finishes setup
Logger* Logger::instance() {
    if (m_instance == nullptr) {
        static QMutex mutex;
        QMutexLocker locker(&mutex);

        if (m_instance == nullptr) {
            m_instance = new Logger();
        }
    }
    return m_instance;
}

Logger::LogLevel Logger::levelFromString(const QString& text, bool* ok) {
    const QString level = text.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (level == "debug") {
        return Debug;
    } else if (level == "info") {
        return Info;
    } else if (level == "warning" || level == "warn") {
        return Warning;
    } else if (level == "error") {
        return Error;
    } else if (level == "fatal") {
        return Fatal;
    }

    if (ok) {
        *ok = false;
    }
    return Info;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
    , m_maxFileSize(5 * 1024 * 1024)
{
    // No file until setLogFile(); the entry process decides where logs go
}

Logger::~Logger() {
    closeLogFile();
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    m_logFilePath = filePath;
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    if (!openLogFile()) {
        qWarning() << "Failed to open log file:" << filePath;
        return false;
    }

    // Direct write, log() would re-enter the mutex
    writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    return true;
}

void Logger::closeLogFile() {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logStream.setDevice(nullptr);
        m_logFile.close();
    }
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), QString(), -1));
}

void Logger::setMaxFileSize(qint64 bytes) {
    QMutexLocker locker(&m_mutex);
    m_maxFileSize = bytes < 0 ? 0 : bytes;
}

bool Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
    return m_consoleOutput;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    // Format outside the lock to keep the critical section short
    QString formattedMessage = formatLogMessage(level, message, source, line);

    QMutexLocker locker(&m_mutex);
    writeToLog(formattedMessage);

    if (m_consoleOutput) {
        switch (level) {
            case Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case Info:
                qInfo().noquote() << formattedMessage;
                break;
            case Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case Error:
            case Fatal:
                qCritical().noquote() << formattedMessage;
                break;
        }
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    QStringList logParts;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        logParts.append(QString("%1: %2").arg(it.key(), it.value().toString()));
    }

    log(level, logParts.join(", "), source, line);
}

QString Logger::logLevelToString(LogLevel level) const {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::cleanSource(const QString& source) const {
    QString sourceInfo = source;

    // Drop the parameter list
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }

    // Drop the return type ("bool HostsManager::apply" -> "HostsManager::apply")
    int spacePos = sourceInfo.lastIndexOf(' ');
    if (spacePos >= 0) {
        sourceInfo = sourceInfo.mid(spacePos + 1);
    }

    // MSVC decorates with __cdecl, and lambdas show up as "<lambda_...>"
    sourceInfo.remove("__cdecl");
    static const QRegularExpression lambdaPattern("::<lambda_[0-9a-f]+>.*$");
    sourceInfo.remove(lambdaPattern);

    if (sourceInfo.contains("::")) {
        QStringList parts = sourceInfo.split("::");
        if (parts.size() >= 2 && parts[parts.size() - 2] == parts[parts.size() - 1]) {
            sourceInfo = parts[parts.size() - 2] + "::constructor";
        }
    }

    return sourceInfo;
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString pid = QString::number(QCoreApplication::applicationPid());
    QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    QString levelStr = logLevelToString(level);

    if (source.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5")
            .arg(timestamp, levelStr, pid, threadId, message);
    }

    QString sourceInfo = cleanSource(source);
    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }

    return QString("[%1] [%2] [PID:%3] [TID:%4] [%5] %6")
        .arg(timestamp, levelStr, pid, threadId, sourceInfo, message);
}

bool Logger::openLogFile() {
    if (m_logFilePath.isEmpty()) {
        return false;
    }

    m_logFile.setFileName(m_logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_logStream.setDevice(&m_logFile);
    return true;
}

void Logger::rotateIfNeeded() {
    if (m_maxFileSize <= 0 || !m_logFile.isOpen() || m_logFile.size() < m_maxFileSize) {
        return;
    }

    m_logStream.flush();
    m_logStream.setDevice(nullptr);
    m_logFile.close();

    const QString rotated = m_logFilePath + ".1";
    QFile::remove(rotated);
    if (!QFile::rename(m_logFilePath, rotated)) {
        qWarning() << "Failed to rotate log file:" << m_logFilePath;
    }

    if (!openLogFile()) {
        qWarning() << "Failed to reopen log file after rotation:" << m_logFilePath;
    }
}

void Logger::writeToLog(const QString& message) {
    if (!m_logFile.isOpen()) {
        return;
    }

    rotateIfNeeded();
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}

Logger::LogLevel Logger::getLogLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString Logger::getLogFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

qint64 Logger::getMaxFileSize() const {
    QMutexLocker locker(&m_mutex);
    return m_maxFileSize;
}

bool Logger::isConsoleOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}
