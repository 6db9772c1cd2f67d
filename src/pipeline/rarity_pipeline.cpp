// =============================================================================
// rarity-core - Rarity Pipeline Implementation
// =============================================================================

#include "rarity/pipeline/rarity_pipeline.h"

#include <algorithm>
#include <chrono>

#include <tbb/task_arena.h>

#include "rarity/common/logger.h"
#include "rarity/ranking/ranking_engine.h"

namespace rarity::pipeline {

// =============================================================================
// PipelineConfig Implementation
// =============================================================================

VoidResult PipelineConfig::validate() const {
    if (catalogGrainSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "catalogGrainSize must be > 0");
    }
    return makeVoidSuccess();
}

// =============================================================================
// RarityReport Implementation
// =============================================================================

const scoring::ItemRarity* RarityReport::findItem(const ExternalId& id) const noexcept {
    auto it = std::find_if(ranked.begin(), ranked.end(),
                           [&id](const scoring::ItemRarity& item) { return item.id == id; });
    return it != ranked.end() ? &*it : nullptr;
}

// =============================================================================
// RarityPipeline Implementation
// =============================================================================

RarityPipeline::RarityPipeline(PipelineConfig config)
    : config_(std::move(config)), model_(scoring::makeScoringModel(config_.model)) {}

RarityPipeline::~RarityPipeline() = default;

RarityPipeline::RarityPipeline(RarityPipeline&&) noexcept = default;
RarityPipeline& RarityPipeline::operator=(RarityPipeline&&) noexcept = default;

Result<RarityReport> RarityPipeline::run(std::span<const Item> items) const {
    if (!model_) {
        return makeError<RarityReport>(ErrorCode::kInvalidState,
                                       "pipeline has been moved from");
    }
    if (auto valid = config_.validate(); !valid) {
        return makeError<RarityReport>(std::move(valid.error()));
    }

    auto startTime = std::chrono::steady_clock::now();

    Result<RarityReport> report = makeError<RarityReport>(ErrorCode::kInvalidState,
                                                          "pipeline did not run");
    if (config_.numThreads > 0) {
        tbb::task_arena arena(static_cast<int>(config_.numThreads));
        arena.execute([&]() { report = runStages(items); });
    } else {
        report = runStages(items);
    }

    if (!report) {
        RARITY_LOG_DEBUG("Rarity analysis aborted: {}", report.error().describe());
        return report;
    }

    auto endTime = std::chrono::steady_clock::now();
    report->stats.processingTimeMs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());
    report->stats.threadsUsed = config_.numThreads;

    RARITY_LOG_INFO("Ranked {} items over {} categories in {} ms", report->stats.totalItems,
                    report->stats.totalCategories, report->stats.processingTimeMs);
    return report;
}

Result<RarityReport> RarityPipeline::runStages(std::span<const Item> items) const {
    catalog::CatalogBuildConfig catalogConfig;
    catalogConfig.numThreads = config_.numThreads;
    catalogConfig.grainSize = config_.catalogGrainSize;

    auto builtCatalog = catalog::buildCatalog(items, catalogConfig);
    if (!builtCatalog) {
        return makeError<RarityReport>(std::move(builtCatalog.error()));
    }

    auto scored = scoring::scoreItems(*builtCatalog, items, *model_);
    if (!scored) {
        return makeError<RarityReport>(std::move(scored.error()));
    }

    auto ranked = ranking::rankItems(std::move(*scored));
    if (!ranked) {
        return makeError<RarityReport>(std::move(ranked.error()));
    }

    RarityReport report;
    report.summary = catalog::summarizeCatalog(*builtCatalog);
    report.catalog = std::move(*builtCatalog);
    report.ranked = std::move(*ranked);
    report.model = model_->kind();
    report.stats.totalItems = report.catalog.totalItems();
    report.stats.totalCategories = report.catalog.categoryCount();
    return report;
}

}  // namespace rarity::pipeline
