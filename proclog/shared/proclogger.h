#ifndef PROCLOGGER_H
#define PROCLOGGER_H

#include <QObject>
#include <QString>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <memory>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

struct ProcLoggerConfig {
    QString appName;                    // Required: "proclog" or "proclog-tests"
    QString logDir;                     // Diagnostics land in <logDir>/_proclog/<appName>.log
    bool fileEnabled = true;
    bool consoleEnabled = true;
    bool consoleColors = true;
    LogLevel minLevel = LogLevel::Info;
};

// Diagnostic logger for ProcLog itself. Stream content captured from
// supervised processes goes through LogBuffer, never through here.
class ProcLogger : public QObject {
    Q_OBJECT

public:
    static void initialize(const ProcLoggerConfig& config);

    static ProcLogger& instance();

    static bool isInitialized();

    // Flush and destroy the singleton (tests and shutdown)
    static void shutdown();

    void log(LogLevel level, const QString& category, const QString& message);

    void debug(const QString& message);
    void info(const QString& message);
    void warning(const QString& message);
    void error(const QString& message);

    QString logFilePath() const { return m_logFilePath; }

    void flush();

    ProcLogger();
    ~ProcLogger();

private:
    void initializeWithConfig(const ProcLoggerConfig& config);
    void openLogFile();
    void closeLogFile();
    void writeToFile(LogLevel level, const QString& category, const QString& message);
    void writeToConsole(LogLevel level, const QString& category, const QString& message);
    QString levelToString(LogLevel level) const;
    QString levelToColorCode(LogLevel level) const;

    ProcLoggerConfig m_config;
    QString m_logFilePath;
    QString m_defaultCategory;
    mutable QMutex m_mutex;

    std::unique_ptr<QFile> m_file;
    std::unique_ptr<QTextStream> m_stream;

    static std::unique_ptr<ProcLogger> s_instance;
    static QMutex s_instanceMutex;
};

#define PROCLOG_LOG_DEBUG(msg) ProcLogger::instance().debug(msg)
#define PROCLOG_LOG_INFO(msg) ProcLogger::instance().info(msg)
#define PROCLOG_LOG_WARNING(msg) ProcLogger::instance().warning(msg)
#define PROCLOG_LOG_ERROR(msg) ProcLogger::instance().error(msg)

#endif // PROCLOGGER_H
