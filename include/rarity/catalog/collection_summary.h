// =============================================================================
// rarity-core - Collection Summary
// =============================================================================
// Aggregate statistics shown next to the per-item rarity table: collection
// size and, per category, how many values exist, how many items carry or
// lack the category, and which values are the rarest and the most common.
// =============================================================================

#ifndef RARITY_CATALOG_COLLECTION_SUMMARY_H
#define RARITY_CATALOG_COLLECTION_SUMMARY_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "rarity/catalog/trait_catalog.h"
#include "rarity/common/types.h"

namespace rarity::catalog {

/// @brief Summary of one category.
struct CategorySummary {
    std::string name;

    /// @brief Number of distinct values observed.
    std::size_t distinctValues = 0;

    /// @brief Items carrying the category.
    ItemCount itemsWithCategory = 0;

    /// @brief Items lacking the category.
    ItemCount itemsMissing = 0;

    /// @brief Least frequent value (lexicographically smallest on ties).
    std::string rarestValue;
    ItemCount rarestCount = 0;

    /// @brief Most frequent value (lexicographically smallest on ties).
    std::string mostCommonValue;
    ItemCount mostCommonCount = 0;

    [[nodiscard]] bool operator==(const CategorySummary& other) const = default;
};

/// @brief Summary of a whole collection.
struct CollectionSummary {
    ItemCount totalItems = 0;

    /// @brief One entry per category, in lexicographic order.
    std::vector<CategorySummary> categories;

    /// @brief Find the summary of a category.
    [[nodiscard]] const CategorySummary* find(std::string_view category) const noexcept;

    [[nodiscard]] bool operator==(const CollectionSummary& other) const = default;
};

/// @brief Summarize a catalog.
[[nodiscard]] CollectionSummary summarizeCatalog(const TraitCatalog& catalog);

}  // namespace rarity::catalog

#endif  // RARITY_CATALOG_COLLECTION_SUMMARY_H
