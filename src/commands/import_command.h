// =============================================================================
// numgen - Import Command
// =============================================================================
// Command handler that loads the segment table from CSV into the database.
// =============================================================================

#ifndef NUMGEN_COMMANDS_IMPORT_COMMAND_H
#define NUMGEN_COMMANDS_IMPORT_COMMAND_H

#include <filesystem>

namespace numgen::commands {

/// @brief Default CSV source of the segment table.
inline constexpr const char* kDefaultCsvPath = "data/phone_location.csv";

/// @brief Configuration options for the import command.
struct ImportCommandOptions {
    std::filesystem::path csvPath = kDefaultCsvPath;
    std::filesystem::path databasePath;

    /// @brief Replace existing rows.
    bool force = false;

    /// @brief Only report the current row count.
    bool statusOnly = false;

    bool jsonOutput = false;
};

/// @brief Command handler for CSV import.
class ImportCommand {
public:
    explicit ImportCommand(ImportCommandOptions options);

    /// @brief Execute the import command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ImportCommandOptions& options() const noexcept { return options_; }

private:
    int printStatus();

    ImportCommandOptions options_;
};

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_IMPORT_COMMAND_H
