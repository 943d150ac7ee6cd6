#ifndef PROCLOG_CLI_ARGS_H
#define PROCLOG_CLI_ARGS_H

#include <cstring>
#include <cstdlib>
#include <string>
#include <iostream>
#include <QtCore/QtGlobal>
#include <QtCore/QString>
#include "common.h"

namespace ProcLogCLI {

struct Args {
    // What to do with the stream once it is opened
    enum class Command {
        None,
        Ingest,   // Read stdin to EOF and append every chunk
        Tail,     // Print the in-memory lines (after --ingest) or the last page of history
        Count,    // Print the number of history lines
        Page,     // Print one history page ending at pageEnd
        Search,   // Print history lines containing the pattern
        Clear     // Truncate the stream's log
    };
    Command command = Command::None;

    std::string name;              // Stream name, file is <logDir>/<name>.log
    std::string logDir;            // Overrides PROCLOG_LOG_DIR
    int maxLines = 0;              // 0 = PROCLOG_MAX_LINES or default
    int pageSize = 0;              // 0 = PROCLOG_HISTORY_CHUNK or default
    int pageEnd = 0;               // --page <end>
    std::string pattern;           // --search <pattern>

    bool tailAfterIngest = false;  // --ingest --tail
    bool quiet = false;            // Do not echo ingested lines
    bool verbose = false;          // Debug diagnostics on stderr

    bool check = false;            // Verify log directory and writer
    bool showHelp = false;
    bool showVersion = false;

    bool hasError = false;
    std::string errorMessage;
};

// Parse a strictly positive integer option value
inline bool parsePositiveInt(const char* nextArg, int& i, int& value, Args& args, const char* argName) {
    if (nextArg == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a value";
        return false;
    }

    char* end = nullptr;
    long parsed = std::strtol(nextArg, &end, 10);
    if (end == nextArg || *end != '\0' || parsed <= 0 || parsed > 100000000L) {
        args.hasError = true;
        args.errorMessage = std::string("Invalid value for ") + argName + ": " + nextArg;
        return false;
    }

    value = static_cast<int>(parsed);
    i++;
    return true;
}

inline bool parseString(const char* nextArg, int& i, std::string& value, Args& args, const char* argName) {
    if (nextArg == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a value";
        return false;
    }
    value = nextArg;
    i++;
    return true;
}

inline bool setCommand(Args& args, Args::Command command, const char* argName) {
    // --tail combines with --ingest; every other pairing is ambiguous
    if (command == Args::Command::Tail && args.command == Args::Command::Ingest) {
        args.tailAfterIngest = true;
        return true;
    }
    if (command == Args::Command::Ingest && args.command == Args::Command::Tail) {
        args.command = Args::Command::Ingest;
        args.tailAfterIngest = true;
        return true;
    }
    if (args.command != Args::Command::None) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " cannot be combined with another command";
        return false;
    }
    args.command = command;
    return true;
}

// Process a single argument. Returns true if the argument was recognized.
// Advances i past a consumed value. Check args.hasError afterwards.
inline bool parseArg(const char* arg, const char* nextArg, int& i, Args& args) {
    if (std::strcmp(arg, "--name") == 0) {
        parseString(nextArg, i, args.name, args, "--name");
        return true;
    }
    else if (std::strcmp(arg, "--log-dir") == 0) {
        parseString(nextArg, i, args.logDir, args, "--log-dir");
        return true;
    }
    else if (std::strcmp(arg, "--max-lines") == 0) {
        parsePositiveInt(nextArg, i, args.maxLines, args, "--max-lines");
        return true;
    }
    else if (std::strcmp(arg, "--page-size") == 0) {
        parsePositiveInt(nextArg, i, args.pageSize, args, "--page-size");
        return true;
    }
    // Commands
    else if (std::strcmp(arg, "--ingest") == 0) {
        setCommand(args, Args::Command::Ingest, arg);
        return true;
    }
    else if (std::strcmp(arg, "--tail") == 0) {
        setCommand(args, Args::Command::Tail, arg);
        return true;
    }
    else if (std::strcmp(arg, "--count") == 0) {
        setCommand(args, Args::Command::Count, arg);
        return true;
    }
    else if (std::strcmp(arg, "--page") == 0) {
        if (setCommand(args, Args::Command::Page, arg)) {
            parsePositiveInt(nextArg, i, args.pageEnd, args, "--page");
        }
        return true;
    }
    else if (std::strcmp(arg, "--search") == 0) {
        if (setCommand(args, Args::Command::Search, arg)) {
            parseString(nextArg, i, args.pattern, args, "--search");
        }
        return true;
    }
    else if (std::strcmp(arg, "--clear") == 0) {
        setCommand(args, Args::Command::Clear, arg);
        return true;
    }
    // Other
    else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
        args.quiet = true;
        return true;
    }
    else if (std::strcmp(arg, "--verbose") == 0) {
        args.verbose = true;
        return true;
    }
    else if (std::strcmp(arg, "--check") == 0) {
        args.check = true;
        return true;
    }
    else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
        args.showHelp = true;
        return true;
    }
    else if (std::strcmp(arg, "--version") == 0) {
        args.showVersion = true;
        return true;
    }

    return false;
}

// Parse a full argv. Unknown arguments are an error.
inline Args parseArguments(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc && !args.hasError; ++i) {
        const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;
        if (!parseArg(argv[i], nextArg, i, args)) {
            args.hasError = true;
            args.errorMessage = std::string("Unknown option: ") + argv[i];
        }
    }
    return args;
}

// Validate arguments for conflicts and dependencies
inline bool validateArguments(Args& args) {
    if (args.hasError) {
        return false;
    }

    // Informational modes need nothing else
    if (args.showHelp || args.showVersion || args.check) {
        return true;
    }

    if (args.command == Args::Command::None) {
        args.hasError = true;
        args.errorMessage = "No command given (use --ingest, --tail, --count, --page, --search or --clear)";
        return false;
    }

    if (args.name.empty()) {
        args.hasError = true;
        args.errorMessage = "--name is required";
        return false;
    }

    if (args.name.find('/') != std::string::npos || args.name.find('\\') != std::string::npos ||
        args.name == "." || args.name == "..") {
        args.hasError = true;
        args.errorMessage = "Stream name must not contain path separators: " + args.name;
        return false;
    }

    if (args.quiet && args.command != Args::Command::Ingest) {
        args.hasError = true;
        args.errorMessage = "--quiet only applies to --ingest";
        return false;
    }

    return true;
}

inline ProcLogCommon::LogSettingsOverrides toSettingsOverrides(const Args& args) {
    ProcLogCommon::LogSettingsOverrides overrides;
    overrides.logDir = QString::fromStdString(args.logDir);
    overrides.maxLines = args.maxLines;
    overrides.historyChunk = args.pageSize;
    return overrides;
}

} // namespace ProcLogCLI

#endif // PROCLOG_CLI_ARGS_H
