// =============================================================================
// rarity-core - Rarity Pipeline
// =============================================================================
// Runs the full analysis of one collection:
// 1. Build the trait catalog (sequential or partitioned TBB reduction)
// 2. Score every item against the shared catalog (TBB parallel_for)
// 3. Rank all items (barrier: needs every score)
// 4. Summarize the catalog for display
//
// The run is fail-fast: the first fatal error (by item position) aborts it
// and no partial catalog, score table or ranking is returned.
//
// Usage:
// @code
// PipelineConfig config;
// config.numThreads = 4;
//
// RarityPipeline pipeline(config);
// auto report = pipeline.run(items);
// if (report) {
//     // report->ranked is ordered by rank (1..N)
// }
// @endcode
// =============================================================================

#ifndef RARITY_PIPELINE_RARITY_PIPELINE_H
#define RARITY_PIPELINE_RARITY_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "rarity/catalog/collection_summary.h"
#include "rarity/catalog/trait_catalog.h"
#include "rarity/common/error.h"
#include "rarity/common/types.h"
#include "rarity/scoring/rarity_scorer.h"

namespace rarity::pipeline {

// =============================================================================
// Pipeline Configuration
// =============================================================================

/// @brief Configuration for a rarity analysis run.
struct PipelineConfig {
    /// @brief Number of worker threads (0 = TBB default).
    std::size_t numThreads = 0;

    /// @brief Scoring model applied to every item.
    scoring::ScoringModelKind model = scoring::ScoringModelKind::kStatistical;

    /// @brief Items per task when building the catalog in parallel.
    std::size_t catalogGrainSize = catalog::kDefaultCatalogGrainSize;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Pipeline Statistics
// =============================================================================

/// @brief Statistics collected during a run.
struct PipelineStats {
    /// @brief Items analyzed.
    std::uint64_t totalItems = 0;

    /// @brief Categories found in the catalog.
    std::size_t totalCategories = 0;

    /// @brief Processing time (milliseconds).
    std::uint64_t processingTimeMs = 0;

    /// @brief Thread limit the run executed with (0 = TBB default).
    std::size_t threadsUsed = 0;
};

// =============================================================================
// Rarity Report
// =============================================================================

/// @brief Complete result of one analysis run.
struct RarityReport {
    /// @brief Catalog every score was computed against.
    catalog::TraitCatalog catalog;

    /// @brief Aggregate statistics for display.
    catalog::CollectionSummary summary;

    /// @brief Every item, ordered by rank 1..N.
    std::vector<scoring::ItemRarity> ranked;

    /// @brief Model the items were scored with.
    scoring::ScoringModelKind model = scoring::ScoringModelKind::kStatistical;

    /// @brief Run statistics.
    PipelineStats stats;

    /// @brief Number of items in the collection.
    [[nodiscard]] ItemCount totalItems() const noexcept { return catalog.totalItems(); }

    /// @brief Find an item's result by external id.
    [[nodiscard]] const scoring::ItemRarity* findItem(const ExternalId& id) const noexcept;
};

// =============================================================================
// Rarity Pipeline
// =============================================================================

/// @brief Orchestrates catalog building, scoring and ranking.
class RarityPipeline {
public:
    /// @brief Construct with configuration.
    explicit RarityPipeline(PipelineConfig config = {});

    ~RarityPipeline();

    // Non-copyable, movable
    RarityPipeline(const RarityPipeline&) = delete;
    RarityPipeline& operator=(const RarityPipeline&) = delete;
    RarityPipeline(RarityPipeline&&) noexcept;
    RarityPipeline& operator=(RarityPipeline&&) noexcept;

    /// @brief Analyze a collection.
    /// @param items All items of the collection.
    /// @return Full report, or the first fatal error. A moved-from pipeline
    ///         fails with kInvalidState.
    [[nodiscard]] Result<RarityReport> run(std::span<const Item> items) const;

    /// @brief Get current configuration.
    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<RarityReport> runStages(std::span<const Item> items) const;

    PipelineConfig config_;
    std::unique_ptr<scoring::ScoringModel> model_;
};

}  // namespace rarity::pipeline

#endif  // RARITY_PIPELINE_RARITY_PIPELINE_H
