#ifndef COMMON_H
#define COMMON_H

#include <QString>
#include "error_codes.h"

namespace ProcLogCommon {

    // Configuration constants
    namespace Config {
        constexpr const char* APP_NAME = "proclog";

        #ifdef PROCLOG_VERSION
            constexpr const char* APP_VERSION = PROCLOG_VERSION;
        #else
            constexpr const char* APP_VERSION = "0.0.0";
        #endif

        constexpr int MAX_LOG_LINES = 5000;           // In-memory lines per stream
        constexpr int HISTORY_CHUNK = 500;            // Default history page size
        constexpr int WRITER_QUEUE_CAPACITY = 10000;  // Pending write jobs before drops
        constexpr int WRITER_POLL_INTERVAL_MS = 200;
        constexpr int WRITER_CLOSE_TIMEOUT_MS = 2000;

        constexpr const char* ENV_LOG_DIR = "PROCLOG_LOG_DIR";
        constexpr const char* ENV_MAX_LINES = "PROCLOG_MAX_LINES";
        constexpr const char* ENV_HISTORY_CHUNK = "PROCLOG_HISTORY_CHUNK";
        constexpr const char* ENV_WRITER_QUEUE = "PROCLOG_WRITER_QUEUE";
    }

    // Effective settings after applying command line > environment > defaults
    struct LogSettings {
        QString logDir;
        int maxLines = Config::MAX_LOG_LINES;
        int historyChunk = Config::HISTORY_CHUNK;
        int writerQueueCapacity = Config::WRITER_QUEUE_CAPACITY;
    };

    // Overrides left empty / zero fall through to the environment, then defaults
    struct LogSettingsOverrides {
        QString logDir;
        int maxLines = 0;
        int historyChunk = 0;
    };

    LogSettings resolveLogSettings(const LogSettingsOverrides& overrides = LogSettingsOverrides());

    // <GenericDataLocation>/ProcLog
    QString getProcLogDataPath();

    // <GenericDataLocation>/ProcLog/logs
    QString getDefaultLogDir();

    // Positive integer from an environment variable, or 0 if unset/invalid
    int positiveIntFromEnvironment(const char* name);
}

#endif // COMMON_H
