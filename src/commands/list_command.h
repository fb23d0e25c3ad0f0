// =============================================================================
// numgen - List Command
// =============================================================================
// Command handler for the provinces and cities listings, used to pick valid
// filter values before generating.
// =============================================================================

#ifndef NUMGEN_COMMANDS_LIST_COMMAND_H
#define NUMGEN_COMMANDS_LIST_COMMAND_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace numgen::commands {

/// @brief Configuration options for the list command.
struct ListOptions {
    /// @brief Segment database.
    std::filesystem::path databasePath;

    /// @brief List the cities of this province; provinces when unset.
    std::optional<std::string> province;

    /// @brief Print as a JSON array.
    bool jsonOutput = false;
};

/// @brief Command handler for province and city listings.
class ListCommand {
public:
    explicit ListCommand(ListOptions options);

    /// @brief Execute the list command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ListOptions& options() const noexcept { return options_; }

private:
    void print(const std::vector<std::string>& values) const;

    ListOptions options_;
};

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_LIST_COMMAND_H
