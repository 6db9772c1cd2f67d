// =============================================================================
// rarity-core - Rank Command Implementation
// =============================================================================

#include "rank_command.h"

#include <iostream>
#include <memory>
#include <utility>

#include "rarity/common/logger.h"
#include "rarity/io/trait_table_reader.h"
#include "rarity/pipeline/rarity_pipeline.h"
#include "rarity/report/report_writer.h"

namespace rarity::commands {

RankCommand::RankCommand(RankOptions options) : options_(std::move(options)) {}

RankCommand::~RankCommand() = default;

RankCommand::RankCommand(RankCommand&&) noexcept = default;
RankCommand& RankCommand::operator=(RankCommand&&) noexcept = default;

int RankCommand::execute() {
    try {
        report::ReportOptions reportOptions;
        reportOptions.precision = options_.precision;
        reportOptions.includeContributions = !options_.totalsOnly;
        reportOptions.sortMode = options_.sortMode;
        reportOptions.model = options_.model;
        unwrapOrThrow(reportOptions.validate());

        io::TraitTableReader reader(options_.inputPath);
        auto items = unwrapOrThrow(reader.readAll());
        RARITY_LOG_INFO("Loaded {} items ({} traits) from {}", reader.stats().itemsRead,
                        reader.stats().traitsRead, options_.inputPath.string());

        pipeline::PipelineConfig config;
        config.numThreads = options_.threads;
        config.model = options_.model;

        pipeline::RarityPipeline rarityPipeline(config);
        auto result = unwrapOrThrow(rarityPipeline.run(items));

        auto view = ranking::sortedView(result.ranked, options_.sortMode);
        if (options_.jsonOutput) {
            report::writeRankingJson(std::cout, view, reportOptions);
        } else {
            report::writeRankingText(std::cout, view, reportOptions);
        }
        std::cout.flush();

        return toExitCode(ErrorCode::kSuccess);

    } catch (const RarityException& e) {
        RARITY_LOG_ERROR("Rank command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RARITY_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInvalidState);
    }
}

std::unique_ptr<RankCommand> createRankCommand(RankOptions options) {
    return std::make_unique<RankCommand>(std::move(options));
}

}  // namespace rarity::commands
