// =============================================================================
// numgen - Import Command Implementation
// =============================================================================

#include "import_command.h"

#include <iostream>
#include <system_error>
#include <utility>

#include "command_output.h"
#include "numgen/lookup/segment_importer.h"

namespace numgen::commands {

ImportCommand::ImportCommand(ImportCommandOptions options) : options_(std::move(options)) {}

int ImportCommand::printStatus() {
    lookup::SegmentImporter importer(options_.databasePath);
    auto rows = importer.rowCount();
    if (!rows) {
        return reportFailure("status", rows.error());
    }

    std::error_code ec;
    const bool csvExists = std::filesystem::exists(options_.csvPath, ec);
    if (options_.jsonOutput) {
        std::cout << "{\"csv\": " << jsonString(options_.csvPath.string())
                  << ", \"csv_exists\": " << (csvExists ? "true" : "false")
                  << ", \"database\": " << jsonString(options_.databasePath.string())
                  << ", \"rows\": " << *rows << "}" << std::endl;
    } else {
        std::cout << "CSV:      " << options_.csvPath.string()
                  << (csvExists ? "" : " (missing)") << std::endl;
        std::cout << "Database: " << options_.databasePath.string() << std::endl;
        std::cout << "Rows:     " << *rows << std::endl;
    }
    return toExitCode(ErrorCode::kSuccess);
}

int ImportCommand::execute() {
    if (options_.statusOnly) {
        return printStatus();
    }

    lookup::SegmentImporter importer(options_.databasePath);
    lookup::ImportOptions importOptions;
    importOptions.force = options_.force;

    auto report = importer.importCsv(options_.csvPath, importOptions);
    if (!report) {
        return reportFailure("import", report.error());
    }

    if (options_.jsonOutput) {
        std::cout << "{\"imported\": " << report->imported << ", \"skipped\": " << report->skipped
                  << ", \"total_rows\": " << report->totalRows << ", \"already_populated\": "
                  << (report->alreadyPopulated ? "true" : "false") << ", \"encoding\": "
                  << jsonString(lookup::encodingName(report->encoding)) << "}" << std::endl;
    } else if (report->alreadyPopulated) {
        std::cout << "Database already holds " << report->totalRows
                  << " rows; use --force to re-import." << std::endl;
    } else {
        std::cout << "Imported " << report->imported << " rows ("
                  << lookup::encodingName(report->encoding) << "), skipped " << report->skipped
                  << "; database holds " << report->totalRows << " rows." << std::endl;
    }
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace numgen::commands
