// =============================================================================
// numgen - Command Output Helpers
// =============================================================================
// Shared helpers for the text and JSON output of the subcommands.
// =============================================================================

#ifndef NUMGEN_COMMANDS_COMMAND_OUTPUT_H
#define NUMGEN_COMMANDS_COMMAND_OUTPUT_H

#include <string>
#include <string_view>

#include "numgen/common/error.h"

namespace numgen::commands {

/// @brief Quote and escape a string for a JSON document.
[[nodiscard]] std::string jsonString(std::string_view value);

/// @brief Report a failed operation on stderr and in the log.
/// @return The exit code for the error.
/// @note Storage failures are reported to the user as a generic message; the
///       specific cause only goes to the log.
int reportFailure(std::string_view operation, const Error& error);

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_COMMAND_OUTPUT_H
