// =============================================================================
// rarity-core - NFT Collection Rarity Ranker
// =============================================================================
// Main entry point for the rarity command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: rank, summary
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "rarity/common/error.h"
#include "rarity/common/logger.h"
#include "rarity/common/types.h"
#include "rarity/ranking/sort_view.h"
#include "rarity/scoring/rarity_scorer.h"

#include "commands/rank_command.h"
#include "commands/summary_command.h"

namespace rarity::commands {
int runRank(CLI::App* app);
int runSummary(CLI::App* app);
}  // namespace rarity::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "rarity: rank the items of an NFT collection by trait rarity\n"
    "Input is a tab-separated trait table: <id> TAB <category> TAB <value> per line.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;        // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Rank Command Options
// =============================================================================

struct CliRankOptions {
    std::string input;
    std::string sort = "most-rare";
    std::string model = "statistical";
    int precision = rarity::kDefaultDisplayPrecision;
    bool json = false;
    bool totalsOnly = false;
};

CliRankOptions gRankOpts;

// =============================================================================
// Summary Command Options
// =============================================================================

struct CliSummaryOptions {
    std::string input;
    bool json = false;
};

CliSummaryOptions gSummaryOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupRankCommand(CLI::App& app) {
    auto* rank = app.add_subcommand("rank", "Score and rank every item of a collection");
    rank->alias("r");

    rank->add_option("-i,--input", gRankOpts.input, "Input trait table (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    rank->add_option("-s,--sort", gRankOpts.sort,
                     "Output order: serial-asc, serial-desc, most-rare, least-rare")
        ->default_val("most-rare")
        ->check(CLI::IsMember({"serial-asc", "serial-desc", "most-rare", "least-rare"}));

    rank->add_option("-m,--model", gRankOpts.model, "Scoring model: statistical, trait-count")
        ->default_val("statistical")
        ->check(CLI::IsMember({"statistical", "trait-count"}));

    rank->add_option("-p,--precision", gRankOpts.precision, "Decimals for rarity values")
        ->default_val(rarity::kDefaultDisplayPrecision)
        ->check(CLI::Range(0, rarity::kMaxDisplayPrecision));

    rank->add_flag("--json", gRankOpts.json, "Output as JSON");

    rank->add_flag("--totals-only", gRankOpts.totalsOnly,
                   "Omit per-trait contributions from the output");
}

void setupSummaryCommand(CLI::App& app) {
    auto* summary = app.add_subcommand("summary", "Display collection trait statistics");
    summary->alias("s");

    summary->add_option("-i,--input", gSummaryOpts.input, "Input trait table (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    summary->add_flag("--json", gSummaryOpts.json, "Output as JSON");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupRankCommand(app);
    setupSummaryCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        auto logLevel = rarity::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = rarity::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = rarity::log::Level::kTrace;
        } else if (gOptions.verbosity == 1) {
            logLevel = rarity::log::Level::kDebug;
        }
        rarity::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("rank")) {
            exitCode = rarity::commands::runRank(app.get_subcommand("rank"));
        } else if (app.got_subcommand("summary")) {
            exitCode = rarity::commands::runSummary(app.get_subcommand("summary"));
        }
    } catch (const rarity::RarityException& ex) {
        RARITY_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        RARITY_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    rarity::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace rarity::commands {

int runRank([[maybe_unused]] CLI::App* app) {
    RankOptions opts;
    opts.inputPath = gRankOpts.input;
    opts.sortMode = unwrapOrThrow(ranking::parseSortMode(gRankOpts.sort));
    opts.model = unwrapOrThrow(scoring::parseScoringModelKind(gRankOpts.model));
    opts.threads = gOptions.threads;
    opts.precision = gRankOpts.precision;
    opts.jsonOutput = gRankOpts.json;
    opts.totalsOnly = gRankOpts.totalsOnly;

    auto cmd = createRankCommand(std::move(opts));
    return cmd->execute();
}

int runSummary([[maybe_unused]] CLI::App* app) {
    auto cmd = createSummaryCommand(gSummaryOpts.input, gOptions.threads, gSummaryOpts.json);
    return cmd->execute();
}

}  // namespace rarity::commands
