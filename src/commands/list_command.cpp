// =============================================================================
// numgen - List Command Implementation
// =============================================================================

#include "list_command.h"

#include <iostream>
#include <utility>

#include "command_output.h"
#include "numgen/lookup/segment_lookup.h"

namespace numgen::commands {

ListCommand::ListCommand(ListOptions options) : options_(std::move(options)) {}

int ListCommand::execute() {
    auto lookup = lookup::SqliteSegmentLookup::open(options_.databasePath);
    if (!lookup) {
        return reportFailure("segment lookup", lookup.error());
    }

    auto values = options_.province.has_value() ? (*lookup)->listCities(*options_.province)
                                                : (*lookup)->listProvinces();
    if (!values) {
        return reportFailure("listing", values.error());
    }

    print(*values);
    return toExitCode(ErrorCode::kSuccess);
}

void ListCommand::print(const std::vector<std::string>& values) const {
    if (!options_.jsonOutput) {
        for (const auto& value : values) {
            std::cout << value << std::endl;
        }
        return;
    }

    std::cout << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        std::cout << (i == 0 ? "" : ", ") << jsonString(values[i]);
    }
    std::cout << "]" << std::endl;
}

}  // namespace numgen::commands
