// =============================================================================
// numgen - Identifier Generation and Artifact Partitioning
// =============================================================================
// Main entry point for the numgen command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: generate, provinces, cities, import, cleanup, verify
// - Global options shared by all subcommands, each also readable from a
//   NUMGEN_* environment variable and from the optional config file
// - SIGINT and --timeout wired to the cancellation token
// =============================================================================

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "numgen/common/cancellation.h"
#include "numgen/common/config.h"
#include "numgen/common/error.h"
#include "numgen/common/logger.h"
#include "numgen/common/types.h"

// Command implementations
#include "commands/cleanup_command.h"
#include "commands/generate_command.h"
#include "commands/import_command.h"
#include "commands/list_command.h"
#include "commands/verify_command.h"

namespace numgen::commands {
int runGenerate(CLI::App* app);
int runProvinces(CLI::App* app);
int runCities(CLI::App* app);
int runImport(CLI::App* app);
int runCleanup(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace numgen::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "numgen: generate every identifier of the number segments matching a filter\n"
    "Writes the result as a text file in the store and splits files that exceed\n"
    "the partition size into numbered parts.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    numgen::Config config;
    std::string logFile = numgen::kDefaultLogFile;
    std::string logLevel = "info";
    int verbosity = 0;
    bool quiet = false;
    bool json = false;
};

GlobalOptions gOptions;

// =============================================================================
// Cancellation
// =============================================================================

/// @brief Token cancelled by SIGINT/SIGTERM while a command runs.
std::atomic<numgen::CancellationToken*> gActiveToken{nullptr};

void onInterrupt(int /*signum*/) {
    if (auto* token = gActiveToken.load()) {
        token->cancel();
    }
}

/// @brief Installs the interrupt handler for the lifetime of a command.
class InterruptScope {
public:
    explicit InterruptScope(numgen::CancellationToken& token) {
        gActiveToken.store(&token);
        previousInt_ = std::signal(SIGINT, onInterrupt);
        previousTerm_ = std::signal(SIGTERM, onInterrupt);
    }

    ~InterruptScope() {
        std::signal(SIGINT, previousInt_);
        std::signal(SIGTERM, previousTerm_);
        gActiveToken.store(nullptr);
    }

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    void (*previousInt_)(int) = SIG_DFL;
    void (*previousTerm_)(int) = SIG_DFL;
};

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    std::string prefix;
    std::string province;
    std::string city;
    std::string suffix4;
    std::string suffix3;
    std::vector<int> operators;
    std::uint64_t timeoutSeconds = 0;  // 0 = no deadline
};

CliGenerateOptions gGenerateOpts;

// =============================================================================
// List / Import / Cleanup / Verify Command Options
// =============================================================================

struct CliCitiesOptions {
    std::string province;
};

CliCitiesOptions gCitiesOpts;

struct CliImportOptions {
    std::string csv = numgen::commands::kDefaultCsvPath;
    bool force = false;
    bool status = false;
};

CliImportOptions gImportOpts;

struct CliCleanupOptions {
    bool watch = false;
};

CliCleanupOptions gCleanupOpts;

struct CliVerifyOptions {
    std::string artifact;
    bool checkSizes = false;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Generate the identifiers matching a filter");
    generate->alias("g");

    generate->add_option("-p,--prefix", gGenerateOpts.prefix, "3-digit prefix")->required();
    generate->add_option("--province", gGenerateOpts.province, "Province")->required();
    generate->add_option("--city", gGenerateOpts.city, "City")->required();

    generate->add_option("--suffix4", gGenerateOpts.suffix4,
                         "Fix the last 4 digits (one identifier per segment)");
    generate->add_option("--suffix3", gGenerateOpts.suffix3,
                         "Fix the last 3 digits (ten identifiers per segment)");

    generate->add_option("-o,--operator", gGenerateOpts.operators,
                         "Operator codes 1-5 (repeat or comma-separate; default any)")
        ->delimiter(',');

    generate->add_option("--timeout", gGenerateOpts.timeoutSeconds,
                         "Abort after this many seconds (0 = no limit)")
        ->default_val(0);
}

void setupListCommands(CLI::App& app) {
    app.add_subcommand("provinces", "List the provinces in the segment database");

    auto* cities = app.add_subcommand("cities", "List the cities of a province");
    cities->add_option("province", gCitiesOpts.province, "Province")->required();
}

void setupImportCommand(CLI::App& app) {
    auto* importCmd = app.add_subcommand("import", "Load the segment table from a CSV file");

    importCmd->add_option("--csv", gImportOpts.csv, "CSV file (prefix,suffix,province,city,operator)")
        ->envname("NUMGEN_CSV");
    importCmd->add_flag("-f,--force", gImportOpts.force, "Replace existing rows");
    importCmd->add_flag("--status", gImportOpts.status, "Only show the current row count");
}

void setupCleanupCommand(CLI::App& app) {
    auto* cleanup = app.add_subcommand("cleanup", "Remove expired files from the store");

    cleanup->add_flag("-w,--watch", gCleanupOpts.watch, "Keep sweeping until interrupted");
    cleanup->add_option("--interval-minutes", gOptions.config.sweepIntervalMinutes,
                        "Minutes between sweeps in watch mode")
        ->envname("NUMGEN_SWEEP_INTERVAL_MINUTES")
        ->check(CLI::PositiveNumber);
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Check an artifact against its partitions");
    verify->alias("v");

    verify->add_option("artifact", gVerifyOpts.artifact, "Artifact file name in the store")
        ->required();
    verify->add_flag("--check-sizes", gVerifyOpts.checkSizes,
                     "Also check partitions against the partition size");
    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show every check");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "numgen.toml", "Read options from a TOML/INI file");

    auto& cfg = gOptions.config;

    // Global options
    app.add_option("--max-count", cfg.maxCount, "Maximum identifiers per request")
        ->envname("NUMGEN_MAX_COUNT")
        ->capture_default_str();

    app.add_option("--partition-size-mb", cfg.partitionSizeLimitMB,
                   "Split files larger than this many MB")
        ->envname("NUMGEN_PARTITION_SIZE_MB")
        ->capture_default_str();

    app.add_option("--expiry-hours", cfg.artifactExpiryHours,
                   "Remove files older than this many hours")
        ->envname("NUMGEN_EXPIRY_HOURS")
        ->capture_default_str();

    app.add_option("--store", cfg.storeDir, "Directory holding generated files (default: downloads)")
        ->envname("NUMGEN_STORE_DIR");

    app.add_option("--database", cfg.databasePath,
                   "Segment database (default: data/phone_location.db)")
        ->envname("NUMGEN_DATABASE");

    app.add_option("--download-route", cfg.downloadRoute, "Route prefix of download paths")
        ->envname("NUMGEN_DOWNLOAD_ROUTE")
        ->capture_default_str();

    app.add_option("-t,--threads", cfg.threads, "Number of threads (0 = auto-detect)")
        ->envname("NUMGEN_THREADS")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("--verify-partitions,!--no-verify-partitions", cfg.verifyPartitions,
                 "Check partitions against the file they were split from")
        ->default_val(true);

    app.add_option("--log-file", gOptions.logFile, "Log file (empty disables file logging)")
        ->envname("NUMGEN_LOG_FILE")
        ->capture_default_str();

    app.add_option("--log-level", gOptions.logLevel, "trace, debug, info, warning, error")
        ->envname("NUMGEN_LOG_LEVEL")
        ->capture_default_str();

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v for debug)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error log output");
    app.add_flag("--json", gOptions.json, "Print results as JSON");

    // Setup subcommands
    setupGenerateCommand(app);
    setupListCommands(app);
    setupImportCommand(app);
    setupCleanupCommand(app);
    setupVerifyCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    const auto level = numgen::log::parseLevel(gOptions.logLevel);
    if (!level) {
        std::cerr << "Unknown log level: " << gOptions.logLevel << std::endl;
        return static_cast<int>(numgen::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        numgen::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = *level;
        if (gOptions.quiet) {
            logConfig.level = numgen::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = numgen::log::Level::kDebug;
        }
        numgen::log::init(logConfig);
        NUMGEN_LOG_DEBUG("Logging at level {}", numgen::log::levelName(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        // Global options apply to every subcommand
        (void)numgen::unwrapOrThrow(gOptions.config.validate());

        if (app.got_subcommand("generate")) {
            exitCode = numgen::commands::runGenerate(app.get_subcommand("generate"));
        } else if (app.got_subcommand("provinces")) {
            exitCode = numgen::commands::runProvinces(app.get_subcommand("provinces"));
        } else if (app.got_subcommand("cities")) {
            exitCode = numgen::commands::runCities(app.get_subcommand("cities"));
        } else if (app.got_subcommand("import")) {
            exitCode = numgen::commands::runImport(app.get_subcommand("import"));
        } else if (app.got_subcommand("cleanup")) {
            exitCode = numgen::commands::runCleanup(app.get_subcommand("cleanup"));
        } else if (app.got_subcommand("verify")) {
            exitCode = numgen::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const numgen::NumgenException& ex) {
        NUMGEN_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        NUMGEN_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    numgen::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace numgen::commands {

int runGenerate([[maybe_unused]] CLI::App* app) {
    std::unique_ptr<CancellationToken> token;
    if (gGenerateOpts.timeoutSeconds > 0) {
        token = std::make_unique<CancellationToken>(
            CancellationToken::Clock::now() + std::chrono::seconds(gGenerateOpts.timeoutSeconds));
    } else {
        token = std::make_unique<CancellationToken>();
    }
    InterruptScope interrupts(*token);

    GenerateOptions opts;
    opts.config = gOptions.config;
    opts.filter.prefix = gGenerateOpts.prefix;
    opts.filter.province = gGenerateOpts.province;
    opts.filter.city = gGenerateOpts.city;
    opts.filter.suffix4 = gGenerateOpts.suffix4;
    opts.filter.suffix3 = gGenerateOpts.suffix3;
    opts.filter.operators = gGenerateOpts.operators;
    opts.jsonOutput = gOptions.json;
    opts.cancellation = token.get();

    GenerateCommand cmd(std::move(opts));
    return cmd.execute();
}

int runProvinces([[maybe_unused]] CLI::App* app) {
    ListOptions opts;
    opts.databasePath = gOptions.config.databasePath;
    opts.jsonOutput = gOptions.json;

    ListCommand cmd(std::move(opts));
    return cmd.execute();
}

int runCities([[maybe_unused]] CLI::App* app) {
    ListOptions opts;
    opts.databasePath = gOptions.config.databasePath;
    opts.province = gCitiesOpts.province;
    opts.jsonOutput = gOptions.json;

    ListCommand cmd(std::move(opts));
    return cmd.execute();
}

int runImport([[maybe_unused]] CLI::App* app) {
    ImportCommandOptions opts;
    opts.csvPath = gImportOpts.csv;
    opts.databasePath = gOptions.config.databasePath;
    opts.force = gImportOpts.force;
    opts.statusOnly = gImportOpts.status;
    opts.jsonOutput = gOptions.json;

    ImportCommand cmd(std::move(opts));
    return cmd.execute();
}

int runCleanup([[maybe_unused]] CLI::App* app) {
    CancellationToken token;
    InterruptScope interrupts(token);

    CleanupOptions opts;
    opts.config = gOptions.config;
    opts.watch = gCleanupOpts.watch;
    opts.jsonOutput = gOptions.json;
    opts.cancellation = &token;

    CleanupCommand cmd(std::move(opts));
    return cmd.execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.storeDir = gOptions.config.storeDir;
    opts.artifactName = gVerifyOpts.artifact;
    opts.verbose = gVerifyOpts.verbose;
    opts.jsonOutput = gOptions.json;
    if (gVerifyOpts.checkSizes) {
        opts.partitionSizeLimitMB = gOptions.config.partitionSizeLimitMB;
    }

    VerifyCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace numgen::commands
