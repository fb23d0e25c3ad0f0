// =============================================================================
// numgen - Generate Command
// =============================================================================
// Command handler for a generation request.
//
// This module provides:
// - GenerateCommand: opens the segment database, runs the engine and prints
//   the count and the files to fetch
// - GenerateOptions: configuration, filter and output options
// =============================================================================

#ifndef NUMGEN_COMMANDS_GENERATE_COMMAND_H
#define NUMGEN_COMMANDS_GENERATE_COMMAND_H

#include <memory>

#include "numgen/common/cancellation.h"
#include "numgen/common/config.h"
#include "numgen/engine/generation_engine.h"
#include "numgen/gen/filter_validator.h"

namespace numgen::commands {

/// @brief Configuration options for the generate command.
struct GenerateOptions {
    /// @brief Engine configuration.
    Config config;

    /// @brief Filter as entered on the command line.
    gen::RawFilter filter;

    /// @brief Print the result as JSON.
    bool jsonOutput = false;

    /// @brief Optional cancellation signal (SIGINT, --timeout).
    const CancellationToken* cancellation = nullptr;
};

/// @brief Command handler for generation requests.
class GenerateCommand {
public:
    explicit GenerateCommand(GenerateOptions options);

    ~GenerateCommand();

    GenerateCommand(const GenerateCommand&) = delete;
    GenerateCommand& operator=(const GenerateCommand&) = delete;

    /// @brief Execute the generate command.
    /// @return Exit code (0 = success, 4 = no matches, otherwise the error code).
    [[nodiscard]] int execute();

    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    void printText(const engine::GenerationResult& result) const;
    void printJson(const engine::GenerationResult& result) const;

    GenerateOptions options_;
};

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_GENERATE_COMMAND_H
