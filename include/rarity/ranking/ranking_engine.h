// =============================================================================
// rarity-core - Ranking Engine
// =============================================================================
// Assigns dense ranks 1..N to a fully scored collection:
// - higher total rarity ranks first
// - neighbouring totals within kTieTolerance of each other are ties
// - ties are broken by ascending external id
//
// Items are first put in exact (total, id) order. Each run of neighbours that
// tie pairwise then forms one group, listed by id. The exact order does not
// depend on input order, so neither do the groups or the ranks.
// Ranking is a barrier: it needs every item's total before any rank is final.
// =============================================================================

#ifndef RARITY_RANKING_RANKING_ENGINE_H
#define RARITY_RANKING_RANKING_ENGINE_H

#include <vector>

#include "rarity/common/error.h"
#include "rarity/scoring/rarity_scorer.h"

namespace rarity::ranking {

/// @brief Relative tolerance under which two total rarities are ties.
/// @note Absolute for totals below 1.0. Sums of the same contributions in a
///       different order differ by far less; distinct count ratios of
///       collections below ~10^6 items differ by far more.
inline constexpr double kTieTolerance = 1e-9;

/// @brief Check whether two totals count as equal for ranking.
[[nodiscard]] bool totalsTie(double lhs, double rhs) noexcept;

/// @brief Rank a scored collection.
/// @param scored Every item's rarity (rank fields are overwritten).
/// @return Items ordered by rank with rank = 1..N, EmptyCollectionError for an
///         empty input, or DataError if two items share an external id.
[[nodiscard]] Result<std::vector<scoring::ItemRarity>> rankItems(
    std::vector<scoring::ItemRarity> scored);

}  // namespace rarity::ranking

#endif  // RARITY_RANKING_RANKING_ENGINE_H
