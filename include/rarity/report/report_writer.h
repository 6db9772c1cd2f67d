// =============================================================================
// rarity-core - Report Writer
// =============================================================================
// Renders ranked items and collection summaries as plain text tables or
// JSON documents (nlohmann::json). Rarity values are rounded to a fixed
// number of decimals so that displayed values are stable between runs.
// =============================================================================

#ifndef RARITY_REPORT_REPORT_WRITER_H
#define RARITY_REPORT_REPORT_WRITER_H

#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "rarity/catalog/collection_summary.h"
#include "rarity/common/error.h"
#include "rarity/common/types.h"
#include "rarity/ranking/sort_view.h"
#include "rarity/scoring/rarity_scorer.h"

namespace rarity::report {

/// @brief Rendering options.
struct ReportOptions {
    /// @brief Decimals used for rarity values.
    int precision = kDefaultDisplayPrecision;

    /// @brief Emit per-category contributions for every item.
    bool includeContributions = true;

    /// @brief Ordering the items are listed in (informational).
    ranking::SortMode sortMode = ranking::SortMode::kMostRare;

    /// @brief Scoring model the items were scored with (informational).
    scoring::ScoringModelKind model = scoring::ScoringModelKind::kStatistical;

    /// @brief Validate options.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Format a rarity value with a fixed number of decimals.
[[nodiscard]] std::string formatRarity(double value, int precision = kDefaultDisplayPrecision);

/// @brief Write items as a text table, in the given order.
void writeRankingText(std::ostream& out, std::span<const scoring::ItemRarity> items,
                      const ReportOptions& options = {});

/// @brief Write items as a JSON document, in the given order.
void writeRankingJson(std::ostream& out, std::span<const scoring::ItemRarity> items,
                      const ReportOptions& options = {});

/// @brief Write a collection summary as text.
void writeSummaryText(std::ostream& out, const catalog::CollectionSummary& summary);

/// @brief Write a collection summary as JSON.
void writeSummaryJson(std::ostream& out, const catalog::CollectionSummary& summary);

}  // namespace rarity::report

#endif  // RARITY_REPORT_REPORT_WRITER_H
