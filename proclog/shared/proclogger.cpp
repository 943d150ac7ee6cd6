#include "proclogger.h"
#include <QDateTime>
#include <QDir>
#include <QDebug>

std::unique_ptr<ProcLogger> ProcLogger::s_instance = nullptr;
QMutex ProcLogger::s_instanceMutex;

ProcLogger::ProcLogger() : QObject(nullptr) {
}

ProcLogger::~ProcLogger() {
    closeLogFile();
}

void ProcLogger::initialize(const ProcLoggerConfig& config) {
    if (isInitialized()) {
        qWarning() << "ProcLogger already initialized, ignoring re-initialization";
        return;
    }

    // Set up outside the instance lock: qWarning/qCritical may be routed back here
    auto logger = std::make_unique<ProcLogger>();
    logger->initializeWithConfig(config);

    QMutexLocker locker(&s_instanceMutex);
    if (!s_instance) {
        s_instance = std::move(logger);
    }
}

ProcLogger& ProcLogger::instance() {
    QMutexLocker locker(&s_instanceMutex);

    if (!s_instance) {
        qFatal("ProcLogger not initialized! Call ProcLogger::initialize() first.");
    }

    return *s_instance;
}

bool ProcLogger::isInitialized() {
    QMutexLocker locker(&s_instanceMutex);
    return s_instance != nullptr;
}

void ProcLogger::shutdown() {
    QMutexLocker locker(&s_instanceMutex);
    s_instance.reset();
}

void ProcLogger::initializeWithConfig(const ProcLoggerConfig& config) {
    m_config = config;
    m_defaultCategory = m_config.appName.isEmpty() ? QString("proclog") : m_config.appName;

    if (m_config.fileEnabled && !m_config.logDir.isEmpty()) {
        QDir dir(m_config.logDir);
        if (!dir.mkpath("_proclog")) {
            qCritical() << "Failed to create diagnostics directory under:" << m_config.logDir;
        }
        m_logFilePath = dir.absoluteFilePath(QString("_proclog/%1.log").arg(m_defaultCategory));
        openLogFile();
    }

    log(LogLevel::Debug, m_defaultCategory,
        QString("ProcLogger initialized for '%1'%2")
        .arg(m_defaultCategory)
        .arg(m_logFilePath.isEmpty() ? QString() : QString(", diagnostics in %1").arg(m_logFilePath)));
}

void ProcLogger::openLogFile() {
    auto file = std::make_unique<QFile>(m_logFilePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qCritical() << "Failed to open log file:" << m_logFilePath << file->errorString();
        m_logFilePath.clear();
        return;
    }

    m_stream = std::make_unique<QTextStream>(file.get());
    m_file = std::move(file);
}

void ProcLogger::closeLogFile() {
    QMutexLocker locker(&m_mutex);

    if (m_stream) {
        m_stream->flush();
        m_stream.reset();
    }
    if (m_file) {
        m_file->close();
        m_file.reset();
    }
}

void ProcLogger::log(LogLevel level, const QString& category, const QString& message) {
    QMutexLocker locker(&m_mutex);

    if (level < m_config.minLevel) {
        return;
    }

    if (m_config.consoleEnabled) {
        writeToConsole(level, category, message);
    }

    writeToFile(level, category, message);
}

void ProcLogger::writeToFile(LogLevel level, const QString& category, const QString& message) {
    if (!m_stream) {
        return;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    *m_stream << timestamp << " [" << levelToString(level) << "] ";

    if (category != m_defaultCategory) {
        *m_stream << "[" << category << "] ";
    }

    *m_stream << message << "\n";

    // Flush for important messages
    if (level >= LogLevel::Warning) {
        m_stream->flush();
    }
}

void ProcLogger::writeToConsole(LogLevel level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString levelStr = levelToString(level);

    QTextStream out(stderr);

    if (m_config.consoleColors) {
        out << levelToColorCode(level) << timestamp << " [" << levelStr << "] ";

        if (category != m_defaultCategory) {
            out << "[" << category << "] ";
        }

        out << message << "\033[0m" << Qt::endl;
    } else {
        out << timestamp << " [" << levelStr << "] ";

        if (category != m_defaultCategory) {
            out << "[" << category << "] ";
        }

        out << message << Qt::endl;
    }
}

QString ProcLogger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

QString ProcLogger::levelToColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "\033[36m";  // Cyan
        case LogLevel::Info:     return "\033[32m";  // Green
        case LogLevel::Warning:  return "\033[33m";  // Yellow
        case LogLevel::Error:    return "\033[31m";  // Red
        case LogLevel::Critical: return "\033[35m";  // Magenta
        default:                 return "\033[0m";
    }
}

void ProcLogger::flush() {
    QMutexLocker locker(&m_mutex);

    if (m_stream) {
        m_stream->flush();
    }
}

void ProcLogger::debug(const QString& message) {
    log(LogLevel::Debug, m_defaultCategory, message);
}

void ProcLogger::info(const QString& message) {
    log(LogLevel::Info, m_defaultCategory, message);
}

void ProcLogger::warning(const QString& message) {
    log(LogLevel::Warning, m_defaultCategory, message);
}

void ProcLogger::error(const QString& message) {
    log(LogLevel::Error, m_defaultCategory, message);
}
