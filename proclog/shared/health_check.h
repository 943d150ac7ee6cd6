#ifndef PROCLOG_HEALTH_CHECK_H
#define PROCLOG_HEALTH_CHECK_H

#include <QString>
#include <QList>
#include "common.h"

namespace ProcLogHealthCheck {

    enum class CheckStatus {
        Passed,
        Warning,
        Failed
    };

    struct CheckResult {
        QString category;
        QString test;
        CheckStatus status;
        QString message;
        bool critical;  // If true, failure means logs will not be persisted
    };

    struct HealthCheckConfig {
        ProcLogCommon::LogSettings settings;
        bool verbose = false;
        int writerTimeoutMs = 2000;
    };

    struct HealthCheckSummary {
        int passed;
        int warnings;
        int failed;
        bool hasBlockingFailures;
        QString overallStatus;
    };

    // Returns exit code (0 = success, 1 = failure)
    int runHealthCheck(const HealthCheckConfig& config);

    void printSystemInformation(const HealthCheckConfig& config);
    QList<CheckResult> checkConfiguration(const HealthCheckConfig& config);
    QList<CheckResult> checkFileSystem(const HealthCheckConfig& config);
    QList<CheckResult> checkWriter(const HealthCheckConfig& config);
    QList<CheckResult> checkLogBuffer(const HealthCheckConfig& config);

    void printCheckResult(const CheckResult& result, bool verbose);
    void printSummary(const HealthCheckSummary& summary);
    HealthCheckSummary calculateSummary(const QList<CheckResult>& results);
}

#endif // PROCLOG_HEALTH_CHECK_H
