#include "cli_help.h"
#include "common.h"
#include <sstream>

namespace ProcLogCLI {

std::string generateHelpText(const char* programName) {
    std::ostringstream help;

    help << "Usage: " << programName << " --name <stream> [options] <command>\n"
         << "       " << programName << " --check | --help | --version\n"
         << "\n";

    help << "Commands:\n"
         << "  --ingest                 Read stdin until EOF and append it to the stream\n"
         << "                           (echoes each completed line unless --quiet)\n"
         << "  --tail                   Print the in-memory lines (with --ingest) or the\n"
         << "                           last history page\n"
         << "  --count                  Print the number of history lines\n"
         << "  --page <end>             Print the history page ending before line <end>\n"
         << "  --search <pattern>       Print history lines containing <pattern>\n"
         << "                           (case-insensitive)\n"
         << "  --clear                  Empty the stream's log file\n"
         << "\n";

    help << "Options:\n"
         << "  --name <stream>          Stream name, logged to <log-dir>/<stream>.log\n"
         << "  --log-dir <dir>          Log directory (env: " << ProcLogCommon::Config::ENV_LOG_DIR << ")\n"
         << "  --max-lines <n>          In-memory line limit (default: "
         << ProcLogCommon::Config::MAX_LOG_LINES << ", env: " << ProcLogCommon::Config::ENV_MAX_LINES << ")\n"
         << "  --page-size <n>          History page size (default: "
         << ProcLogCommon::Config::HISTORY_CHUNK << ", env: " << ProcLogCommon::Config::ENV_HISTORY_CHUNK << ")\n"
         << "  -q, --quiet              Do not echo ingested lines\n"
         << "  --verbose                Enable verbose diagnostics\n"
         << "\n";

    help << "Other:\n"
         << "  --check                  Verify the log directory and background writer\n"
         << "  -h, --help               Show this help message\n"
         << "  --version                Show version information\n";

    return help.str();
}

std::string generateVersionString() {
    std::ostringstream version;
    version << ProcLogCommon::Config::APP_NAME << " version " << ProcLogCommon::Config::APP_VERSION;
    return version.str();
}

} // namespace ProcLogCLI
