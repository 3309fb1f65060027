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
 * @brief Process-wide logger shared by the agent, the watch client and the libraries
 *
 * Thread-safe: formatting happens outside the lock, writes are serialized.
 * Output goes to a log file and optionally to the Qt message handlers.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Recoverable problems (failed upload, stale heartbeat)
        Error,    ///< Failed operations surfaced to the user
        Fatal     ///< The process cannot continue
    };
    Q_ENUM(LogLevel)

    static Logger* instance();

    /**
     * @brief Sets the output log file path, creating the directory if needed
     * @param filePath The full path to the log file
     * @return true if the file could be opened for appending
     */
    bool setLogFile(const QString& filePath);
    void setLogLevel(LogLevel level);

    /**
     * @brief Parses a level name ("debug", "info", "warning", "error", "fatal")
     * @param name Case-insensitive level name
     * @param fallback Level returned when the name is not recognized
     */
    static LogLevel levelFromString(const QString& name, LogLevel fallback = Info);

    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs key-value pairs as "key: value, key: value"
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

    LogLevel getLogLevel() const;
    QString getLogFilePath() const;
    bool isConsoleOutputEnabled() const;

signals:
    // Emitted for every message that passes the level filter
    void messageLogged(int level, const QString& formattedMessage);

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;
    QString m_logFilePath;

    static QString logLevelToString(LogLevel level);
    static QString cleanSource(const QString& source);
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line);
    void writeToLog(const QString& message);
};

#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
