#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <iostream>
#include <cstdlib>
#include <QString>

namespace ProcLogCommon {

    // Exit codes for the proclog binary
    enum class ExitCode : int {
        SUCCESS = 0,

        // General errors (1-19)
        GENERAL_ERROR = 1,
        INVALID_ARGUMENTS = 2,

        // Log directory errors (20-39)
        LOG_DIR_CREATE_FAILED = 20,

        // Writer errors (40-49)
        WRITER_DRAIN_TIMEOUT = 41,

        // Logger errors (100-109)
        LOGGER_INIT_FAILED = 100,

        // Health check (110-119)
        CHECK_FAILED = 110
    };

    inline const char* exitCodeToString(ExitCode code) {
        switch (code) {
            case ExitCode::SUCCESS: return "Success";
            case ExitCode::GENERAL_ERROR: return "General error";
            case ExitCode::INVALID_ARGUMENTS: return "Invalid command line arguments";

            case ExitCode::LOG_DIR_CREATE_FAILED: return "Failed to create log directory";

            case ExitCode::WRITER_DRAIN_TIMEOUT: return "Log writer did not drain before shutdown";

            case ExitCode::LOGGER_INIT_FAILED: return "Logger initialization failed";

            case ExitCode::CHECK_FAILED: return "Health check failed";

            default: return "Unknown error";
        }
    }

    // Helper to exit with proper error code and message
    inline void exitWithError(ExitCode code, const QString& additionalInfo = QString()) {
        if (!additionalInfo.isEmpty()) {
            std::cerr << exitCodeToString(code) << ": " << additionalInfo.toStdString() << std::endl;
        } else {
            std::cerr << exitCodeToString(code) << std::endl;
        }
        std::exit(static_cast<int>(code));
    }
}

#endif // ERROR_CODES_H
