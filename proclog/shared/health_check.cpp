#include "health_check.h"
#include "proclogger.h"
#include "core/async_file_writer.h"
#include "core/log_buffer.h"
#include "core/logfile.h"
#include <QDir>
#include <QTemporaryDir>
#include <QTemporaryFile>

using namespace ProcLogCommon;

namespace ProcLogHealthCheck {

void printCheckResult(const CheckResult& result, bool verbose) {
    QString prefix;
    LogLevel level;

    switch (result.status) {
        case CheckStatus::Passed:
            prefix = "  ✓";
            level = LogLevel::Info;
            break;
        case CheckStatus::Warning:
            prefix = "  ⚠";
            level = LogLevel::Warning;
            break;
        case CheckStatus::Failed:
        default:
            prefix = "  ✗";
            level = LogLevel::Error;
            break;
    }

    QString output = QString("%1 %2").arg(prefix).arg(result.test);
    if (!result.message.isEmpty() && (verbose || result.status != CheckStatus::Passed)) {
        output += QString(": %1").arg(result.message);
    }

    ProcLogger::instance().log(level, "check", output);
}

HealthCheckSummary calculateSummary(const QList<CheckResult>& results) {
    HealthCheckSummary summary = {0, 0, 0, false, ""};

    for (const auto& result : results) {
        switch (result.status) {
            case CheckStatus::Passed:
                summary.passed++;
                break;
            case CheckStatus::Warning:
                summary.warnings++;
                break;
            case CheckStatus::Failed:
                summary.failed++;
                if (result.critical) {
                    summary.hasBlockingFailures = true;
                }
                break;
        }
    }

    if (summary.hasBlockingFailures) {
        summary.overallStatus = "FAILED (Critical errors)";
    } else if (summary.failed > 0) {
        summary.overallStatus = "FAILED";
    } else if (summary.warnings > 0) {
        summary.overallStatus = "PASSED with warnings";
    } else {
        summary.overallStatus = "PASSED";
    }

    return summary;
}

void printSummary(const HealthCheckSummary& summary) {
    ProcLogger::instance().info("[Summary]");
    ProcLogger::instance().info(QString("  Checks: %1 passed, %2 warnings, %3 failed")
        .arg(summary.passed)
        .arg(summary.warnings)
        .arg(summary.failed));

    if (summary.failed > 0) {
        ProcLogger::instance().error(QString("  Result: %1").arg(summary.overallStatus));
    } else if (summary.warnings > 0) {
        ProcLogger::instance().warning(QString("  Result: %1").arg(summary.overallStatus));
    } else {
        ProcLogger::instance().info(QString("  Result: %1").arg(summary.overallStatus));
    }
}

void printSystemInformation(const HealthCheckConfig& config) {
    ProcLogger::instance().info("[System Information]");
    ProcLogger::instance().info(QString("  Version:     %1").arg(Config::APP_VERSION));
    ProcLogger::instance().info(QString("  Qt version:  %1").arg(qVersion()));

    #ifdef QT_DEBUG
    QString buildType = "Debug";
    #else
    QString buildType = "Release";
    #endif
    ProcLogger::instance().info(QString("  Build type:  %1").arg(buildType));

    if (config.verbose) {
        ProcLogger::instance().info(QString("  Log dir:     %1").arg(config.settings.logDir));
        ProcLogger::instance().info(QString("  Diagnostics: %1").arg(ProcLogger::instance().logFilePath()));
    }
}

QList<CheckResult> checkConfiguration(const HealthCheckConfig& config) {
    QList<CheckResult> results;
    const LogSettings& settings = config.settings;

    results.append({
        "Configuration",
        "In-memory line limit",
        CheckStatus::Passed,
        QString("%1 lines per stream").arg(settings.maxLines),
        false
    });

    results.append({
        "Configuration",
        "History page size",
        settings.historyChunk <= settings.maxLines ? CheckStatus::Passed : CheckStatus::Warning,
        settings.historyChunk <= settings.maxLines
            ? QString("%1 lines").arg(settings.historyChunk)
            : QString("%1 lines, larger than the in-memory limit of %2")
                .arg(settings.historyChunk).arg(settings.maxLines),
        false
    });

    results.append({
        "Configuration",
        "Writer queue capacity",
        CheckStatus::Passed,
        QString("%1 pending chunks").arg(settings.writerQueueCapacity),
        false
    });

    return results;
}

QList<CheckResult> checkFileSystem(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    QString logDir = config.settings.logDir;
    QDir logDirectory(logDir);
    if (!logDirectory.exists() && !logDirectory.mkpath(".")) {
        results.append({
            "File System",
            "Log directory",
            CheckStatus::Failed,
            QString("Cannot create: %1").arg(logDir),
            true
        });
        return results;
    }

    QTemporaryFile testFile(logDirectory.absoluteFilePath("proclog_test_XXXXXX"));
    if (testFile.open()) {
        results.append({
            "File System",
            "Log directory",
            CheckStatus::Passed,
            QString("Writable: %1").arg(logDir),
            false
        });
        testFile.close();
    } else {
        results.append({
            "File System",
            "Log directory",
            CheckStatus::Failed,
            QString("Not writable: %1").arg(logDir),
            true
        });
    }

    return results;
}

QList<CheckResult> checkWriter(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    QTemporaryDir scratch;
    if (!scratch.isValid()) {
        results.append({"Writer", "Background write", CheckStatus::Warning,
                        "Skipped (no temporary directory)", false});
        return results;
    }

    ProcLog::AsyncFileWriter writer;
    QString target = QDir(scratch.path()).absoluteFilePath("nested/writer-check.log");
    writer.write(target, "first\n");
    writer.write(target, "second\n");

    bool drained = writer.waitForIdle(config.writerTimeoutMs);
    QString content;
    ProcLog::IoResult readResult = ProcLog::LogFile::readAll(target, content);

    if (drained && readResult && content == "first\nsecond\n") {
        results.append({"Writer", "Background write", CheckStatus::Passed,
                        "Queued chunks persisted in order", false});
    } else {
        results.append({"Writer", "Background write", CheckStatus::Failed,
                        drained ? (readResult ? QString("Unexpected content: %1").arg(content) : readResult.error)
                                : QString("Queue not drained within %1ms").arg(config.writerTimeoutMs),
                        true});
    }

    bool closed = writer.close(config.writerTimeoutMs);
    results.append({"Writer", "Shutdown", closed ? CheckStatus::Passed : CheckStatus::Failed,
                    closed ? "Worker exited" : "Worker still running after close", false});

    return results;
}

QList<CheckResult> checkLogBuffer(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    QTemporaryDir scratch;
    if (!scratch.isValid()) {
        results.append({"Log Buffer", "Round trip", CheckStatus::Warning,
                        "Skipped (no temporary directory)", false});
        return results;
    }

    ProcLog::AsyncFileWriter writer;
    ProcLog::LogBuffer::Config bufferConfig;
    bufferConfig.logDir = scratch.path();
    bufferConfig.maxLines = config.settings.maxLines;
    bufferConfig.historyChunk = config.settings.historyChunk;
    ProcLog::LogBuffer buffer("health-check", writer, bufferConfig);

    buffer.append(QString("health check "));
    buffer.append(QString("\x1b[32mline\x1b[0m\n"));
    if (!writer.waitForIdle(config.writerTimeoutMs)) {
        results.append({"Log Buffer", "Round trip", CheckStatus::Failed,
                        QString("Line not persisted within %1ms").arg(config.writerTimeoutMs), false});
        writer.close(config.writerTimeoutMs);
        return results;
    }

    ProcLog::LogBuffer::SearchResult found = buffer.search("HEALTH CHECK LINE");
    int count = buffer.lineCount();
    if (found.matches == 1 && count == 1) {
        results.append({"Log Buffer", "Round trip", CheckStatus::Passed,
                        "Line persisted, re-read and found by search", false});
    } else {
        results.append({"Log Buffer", "Round trip", CheckStatus::Failed,
                        QString("Expected 1 line and 1 match, got %1 line(s) and %2 match(es)")
                            .arg(count).arg(found.matches),
                        false});
    }

    writer.close(config.writerTimeoutMs);
    return results;
}

int runHealthCheck(const HealthCheckConfig& config) {
    ProcLogger::instance().info("===============================================");
    ProcLogger::instance().info("ProcLog Health Check");
    ProcLogger::instance().info("===============================================");

    printSystemInformation(config);

    QList<CheckResult> allResults;

    auto runSection = [&](const QString& title, const QList<CheckResult>& sectionResults) {
        ProcLogger::instance().info(QString("[%1]").arg(title));
        for (const auto& result : sectionResults) {
            printCheckResult(result, config.verbose);
            allResults.append(result);
        }
    };

    runSection("Configuration", checkConfiguration(config));
    runSection("File System", checkFileSystem(config));
    runSection("Writer", checkWriter(config));
    runSection("Log Buffer", checkLogBuffer(config));

    auto summary = calculateSummary(allResults);
    printSummary(summary);

    ProcLogger::instance().info("===============================================");
    if (summary.hasBlockingFailures || summary.failed > 0) {
        ProcLogger::instance().error("CHECK FAILED");
        return 1;
    }
    ProcLogger::instance().info("CHECK PASSED");
    return 0;
}

} // namespace ProcLogHealthCheck
