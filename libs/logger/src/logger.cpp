#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>

Logger* Logger::m_instance = nullptr;

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

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
{
    // Default location until main() or the config points somewhere else.
    // Opened directly: setLogFile() logs, and logging needs the instance.
    QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(logDir);
    m_logFilePath = logDir + "/deskpulse.log";
    m_logFile.setFileName(m_logFilePath);

    if (m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        m_logStream.setDevice(&m_logFile);
    } else {
        qWarning() << "Failed to open log file:" << m_logFilePath;
    }
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (filePath == m_logFilePath && m_logFile.isOpen()) {
        return true;
    }

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    QDir().mkpath(QFileInfo(filePath).absolutePath());

    m_logFilePath = filePath;
    m_logFile.setFileName(filePath);
    bool opened = m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);

    if (opened) {
        m_logStream.setDevice(&m_logFile);
        writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    } else {
        qWarning() << "Failed to open log file:" << filePath;
    }
    return opened;
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), QString(), -1));
}

Logger::LogLevel Logger::levelFromString(const QString& name, LogLevel fallback) {
    const QString level = name.trimmed().toLower();
    if (level == "debug") return Debug;
    if (level == "info") return Info;
    if (level == "warning" || level == "warn") return Warning;
    if (level == "error") return Error;
    if (level == "fatal") return Fatal;
    return fallback;
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

    {
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

    emit messageLogged(static_cast<int>(level), formattedMessage);
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

QString Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::cleanSource(const QString& source) {
    QString sourceInfo = source;

    // Drop the parameter list
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }

    // GCC/Clang: "bool SessionController::checkIn" -> "SessionController::checkIn"
    int lastSpace = sourceInfo.lastIndexOf(' ');
    if (lastSpace >= 0) {
        sourceInfo = sourceInfo.mid(lastSpace + 1);
    }

    // Lambdas: "SessionController::start()::<lambda>" is cut at '(' already;
    // template arguments are noise in a log line
    static const QRegularExpression templateArgs("<[^<>]*>");
    sourceInfo.remove(templateArgs);

    // Constructors read better as "Class::constructor"
    QStringList parts = sourceInfo.split("::");
    if (parts.size() >= 2 && parts[parts.size() - 2] == parts[parts.size() - 1]) {
        sourceInfo = parts[parts.size() - 2] + "::constructor";
    }

    return sourceInfo;
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) {
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

void Logger::writeToLog(const QString& message) {
    // Always called with m_mutex held
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

bool Logger::isConsoleOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}
