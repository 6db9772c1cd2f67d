// =============================================================================
// rarity-core - Summary Command Implementation
// =============================================================================

#include "summary_command.h"

#include <iostream>

#include "rarity/catalog/collection_summary.h"
#include "rarity/catalog/trait_catalog.h"
#include "rarity/common/logger.h"
#include "rarity/io/trait_table_reader.h"
#include "rarity/report/report_writer.h"

namespace rarity::commands {

SummaryCommand::SummaryCommand(SummaryOptions options) : options_(std::move(options)) {}

SummaryCommand::~SummaryCommand() = default;

SummaryCommand::SummaryCommand(SummaryCommand&&) noexcept = default;
SummaryCommand& SummaryCommand::operator=(SummaryCommand&&) noexcept = default;

int SummaryCommand::execute() {
    try {
        io::TraitTableReader reader(options_.inputPath);
        auto items = unwrapOrThrow(reader.readAll());

        catalog::CatalogBuildConfig config;
        config.numThreads = options_.threads;
        auto traitCatalog = unwrapOrThrow(catalog::buildCatalog(items, config));

        const auto summary = catalog::summarizeCatalog(traitCatalog);
        if (options_.jsonOutput) {
            report::writeSummaryJson(std::cout, summary);
        } else {
            report::writeSummaryText(std::cout, summary);
        }
        std::cout.flush();

        return toExitCode(ErrorCode::kSuccess);

    } catch (const RarityException& e) {
        RARITY_LOG_ERROR("Summary command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RARITY_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInvalidState);
    }
}

std::unique_ptr<SummaryCommand> createSummaryCommand(const std::string& inputPath,
                                                     std::size_t threads, bool jsonOutput) {
    SummaryOptions opts;
    opts.inputPath = inputPath;
    opts.threads = threads;
    opts.jsonOutput = jsonOutput;
    return std::make_unique<SummaryCommand>(std::move(opts));
}

}  // namespace rarity::commands
