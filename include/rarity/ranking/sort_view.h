// =============================================================================
// rarity-core - Sort View
// =============================================================================
// Read-only alternate orderings of a ranked collection for presentation.
// A view is a reordered copy; ranks and totals are never modified.
// =============================================================================

#ifndef RARITY_RANKING_SORT_VIEW_H
#define RARITY_RANKING_SORT_VIEW_H

#include <span>
#include <string_view>
#include <vector>

#include "rarity/common/error.h"
#include "rarity/scoring/rarity_scorer.h"

namespace rarity::ranking {

/// @brief Presentation orderings.
enum class SortMode {
    /// @brief External id ascending ("Serial ASC").
    kSerialAscending,

    /// @brief External id descending ("Serial DESC").
    kSerialDescending,

    /// @brief Rank ascending ("Most Rare").
    kMostRare,

    /// @brief Rank descending ("Least Rare").
    kLeastRare
};

/// @brief Parse a sort mode from its display label ("Most Rare") or CLI
///        spelling ("most-rare").
[[nodiscard]] Result<SortMode> parseSortMode(std::string_view text);

/// @brief Display label of a sort mode.
[[nodiscard]] std::string_view sortModeLabel(SortMode mode) noexcept;

/// @brief CLI spelling of a sort mode.
[[nodiscard]] std::string_view sortModeOption(SortMode mode) noexcept;

/// @brief Produce an ordering of ranked items.
/// @param ranked Ranked items (any order).
/// @param mode Requested ordering.
/// @return Copy of the items in the requested order (stable).
[[nodiscard]] std::vector<scoring::ItemRarity> sortedView(
    std::span<const scoring::ItemRarity> ranked, SortMode mode);

}  // namespace rarity::ranking

#endif  // RARITY_RANKING_SORT_VIEW_H
