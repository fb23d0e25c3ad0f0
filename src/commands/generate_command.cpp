// =============================================================================
// numgen - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <iostream>
#include <utility>

#include "command_output.h"
#include "numgen/common/logger.h"
#include "numgen/lookup/segment_lookup.h"

namespace numgen::commands {

GenerateCommand::GenerateCommand(GenerateOptions options) : options_(std::move(options)) {}

GenerateCommand::~GenerateCommand() = default;

int GenerateCommand::execute() {
    if (auto valid = options_.config.validate(); !valid) {
        return reportFailure("generation", valid.error());
    }

    auto lookup = lookup::SqliteSegmentLookup::open(options_.config.databasePath);
    if (!lookup) {
        return reportFailure("segment lookup", lookup.error());
    }

    engine::GenerationEngine engine(options_.config, **lookup);
    auto result = engine.run(options_.filter, options_.cancellation);
    if (!result) {
        return reportFailure("generation", result.error());
    }

    if (options_.jsonOutput) {
        printJson(*result);
    } else {
        printText(*result);
    }

    if (result->noMatches()) {
        return toExitCode(ErrorCode::kNoMatches);
    }
    return toExitCode(ErrorCode::kSuccess);
}

void GenerateCommand::printText(const engine::GenerationResult& result) const {
    if (result.noMatches()) {
        std::cout << "No segments match the filter." << std::endl;
        return;
    }

    std::cout << "Generated " << result.count << " identifiers";
    if (result.partitioned) {
        std::cout << " in " << result.files.size() << " files";
    }
    std::cout << std::endl;

    for (const auto& file : result.files) {
        std::cout << "  " << file.name << "  (" << file.humanSize << ")  "
                  << file.relativeDownloadPath << std::endl;
    }
}

void GenerateCommand::printJson(const engine::GenerationResult& result) const {
    std::cout << "{" << std::endl;
    std::cout << "  \"count\": " << result.count << "," << std::endl;
    std::cout << "  \"no_matches\": " << (result.noMatches() ? "true" : "false") << ","
              << std::endl;
    std::cout << "  \"partitioned\": " << (result.partitioned ? "true" : "false") << ","
              << std::endl;
    std::cout << "  \"files\": [";
    for (std::size_t i = 0; i < result.files.size(); ++i) {
        const auto& file = result.files[i];
        std::cout << (i == 0 ? "" : ",") << std::endl;
        std::cout << "    {\"name\": " << jsonString(file.name)
                  << ", \"size\": " << jsonString(file.humanSize)
                  << ", \"size_bytes\": " << file.sizeBytes
                  << ", \"download_path\": " << jsonString(file.relativeDownloadPath) << "}";
    }
    if (!result.files.empty()) {
        std::cout << std::endl << "  ";
    }
    std::cout << "]" << std::endl;
    std::cout << "}" << std::endl;
}

}  // namespace numgen::commands
