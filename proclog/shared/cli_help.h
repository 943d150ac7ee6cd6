#ifndef CLI_HELP_H
#define CLI_HELP_H

#include <string>

namespace ProcLogCLI {

/**
 * Generate complete help text for command-line usage
 * @param programName Name of the executable
 * @return Formatted help text string ready for console output
 */
std::string generateHelpText(const char* programName);

/**
 * @return Version string in format "proclog version X.Y.Z"
 */
std::string generateVersionString();

} // namespace ProcLogCLI

#endif // CLI_HELP_H
