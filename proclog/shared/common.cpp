#include "common.h"
#include <QDir>
#include <QStandardPaths>

namespace ProcLogCommon {

QString getProcLogDataPath() {
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return QDir(dataPath).absoluteFilePath("ProcLog");
}

QString getDefaultLogDir() {
    return QDir(getProcLogDataPath()).absoluteFilePath("logs");
}

int positiveIntFromEnvironment(const char* name) {
    QString value = qEnvironmentVariable(name);
    if (value.isEmpty()) {
        return 0;
    }

    bool ok = false;
    int parsed = value.trimmed().toInt(&ok);
    return (ok && parsed > 0) ? parsed : 0;
}

LogSettings resolveLogSettings(const LogSettingsOverrides& overrides) {
    LogSettings settings;

    // Priority 1: command line, priority 2: environment, priority 3: default
    if (!overrides.logDir.isEmpty()) {
        settings.logDir = QDir(overrides.logDir).absolutePath();
    } else {
        QString envDir = qEnvironmentVariable(Config::ENV_LOG_DIR);
        settings.logDir = envDir.isEmpty() ? getDefaultLogDir() : QDir(envDir).absolutePath();
    }

    if (overrides.maxLines > 0) {
        settings.maxLines = overrides.maxLines;
    } else if (int env = positiveIntFromEnvironment(Config::ENV_MAX_LINES)) {
        settings.maxLines = env;
    }

    if (overrides.historyChunk > 0) {
        settings.historyChunk = overrides.historyChunk;
    } else if (int env = positiveIntFromEnvironment(Config::ENV_HISTORY_CHUNK)) {
        settings.historyChunk = env;
    }

    if (int env = positiveIntFromEnvironment(Config::ENV_WRITER_QUEUE)) {
        settings.writerQueueCapacity = env;
    }

    return settings;
}

} // namespace ProcLogCommon
