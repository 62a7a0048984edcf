#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QVariant>
#include <QThread>

// Define the logger_global macro for export/import
#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define DECL_EXPORT __declspec(dllexport)
#  define DECL_IMPORT __declspec(dllimport)
#else
#  define DECL_EXPORT     __attribute__((visibility("default")))
#  define DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(LOGGER_LIBRARY)
#  define LOGGER_EXPORT DECL_EXPORT
#else
#  define LOGGER_EXPORT DECL_IMPORT
#endif

/**
 * @brief Singleton logger shared by every engine and background loop
 *
 * Writes to an append-only log file guarded by a mutex and optionally mirrors
 * each line to the Qt message handlers. The file is rotated to a single
 * ".1" generation once it grows past the configured size.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
     */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< State transitions and normal operation
        Warning,  ///< Recoverable failures, retried on the next tick
        Error,    ///< Failed operations
        Fatal     ///< Boot-time failures that stop the process
    };

    /**
     * @brief Gets the singleton instance of the logger
     * @return Pointer to the Logger instance
     */
    static Logger* instance();

    /**
     * @brief Parses a textual level ("debug", "info", ...)
     * @param text Level name, case insensitive
     * @param ok Set to false when the text is not a known level
     * @return The parsed level, Info when unknown
     */
    static LogLevel levelFromString(const QString& text, bool* ok = nullptr);

    /**
     * @brief Sets the output log file path
     * @param filePath The full path to the log file
     * @return True if the file could be opened for appending
     */
    bool setLogFile(const QString& filePath);

    /**
     * @brief Closes the current log file, console output is unaffected
     */
    void closeLogFile();

    void setLogLevel(LogLevel level);

    /**
     * @brief Sets the size after which the log file is rotated
     * @param bytes Maximum size in bytes, 0 disables rotation
     */
    void setMaxFileSize(qint64 bytes);

    /**
     * @brief Enables or disables console output
     * @param enable True to enable console output, false to disable
     * @return The new console output state
     */
    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line Source line, -1 when unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message built from key-value pairs
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

    LogLevel getLogLevel() const;
    QString getLogFilePath() const;
    qint64 getMaxFileSize() const;
    bool isConsoleOutputEnabled() const;

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    qint64 m_maxFileSize;
    mutable QMutex m_mutex;
    QString m_logFilePath;

    QString logLevelToString(LogLevel level) const;
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const;
    QString cleanSource(const QString& source) const;

    // Both expect m_mutex to be held
    bool openLogFile();
    void rotateIfNeeded();
    void writeToLog(const QString& message);
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

// Macro for logging with data
#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
