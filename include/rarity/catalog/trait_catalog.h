// =============================================================================
// rarity-core - Trait Catalog
// =============================================================================
// Builds the occurrence statistics every rarity score is computed against:
// 1. Count, per category, how many items carry each value
// 2. Count how many items carry each category at all
// 3. Record the distribution of trait counts (traits per item)
// 4. Record the collection size N
//
// The catalog is immutable once built and is shared read-only by all scorers.
// Categories and values are kept in ordered maps so every iteration over the
// catalog visits them in lexicographic order.
//
// Building can run as one sequential pass or as a TBB parallel reduction
// over partitioned sub-catalogs; both produce identical catalogs.
// =============================================================================

#ifndef RARITY_CATALOG_TRAIT_CATALOG_H
#define RARITY_CATALOG_TRAIT_CATALOG_H

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rarity/common/error.h"
#include "rarity/common/types.h"

namespace rarity::catalog {

// =============================================================================
// Constants
// =============================================================================

/// @brief Items per TBB task when building a catalog in parallel.
inline constexpr std::size_t kDefaultCatalogGrainSize = 4096;

// =============================================================================
// Catalog
// =============================================================================

/// @brief Value -> number of items carrying it, ordered by value.
using ValueCounts = std::map<std::string, ItemCount, std::less<>>;

/// @brief Category -> value counts, ordered by category name.
using CategoryTable = std::map<std::string, ValueCounts, std::less<>>;

/// @brief Occurrence statistics of one collection.
///
/// Invariants:
/// - every stored count is >= 1
/// - for each category, the sum of its value counts is <= totalItems()
class TraitCatalog {
public:
    /// @brief Number of items N the catalog was built from.
    [[nodiscard]] ItemCount totalItems() const noexcept { return totalItems_; }

    /// @brief All categories with their value counts.
    [[nodiscard]] const CategoryTable& categories() const noexcept { return categories_; }

    /// @brief Number of distinct categories observed.
    [[nodiscard]] std::size_t categoryCount() const noexcept { return categories_.size(); }

    /// @brief Category names in lexicographic order.
    [[nodiscard]] std::vector<std::string> categoryNames() const;

    /// @brief Check if any item carries the category.
    [[nodiscard]] bool hasCategory(std::string_view category) const noexcept {
        return categories_.find(category) != categories_.end();
    }

    /// @brief Value counts of a category, or nullptr if never observed.
    [[nodiscard]] const ValueCounts* findCategory(std::string_view category) const noexcept;

    /// @brief Number of items carrying a value (0 if never observed).
    [[nodiscard]] ItemCount valueCount(std::string_view category,
                                       std::string_view value) const noexcept;

    /// @brief Number of items that carry the category with any value.
    [[nodiscard]] ItemCount itemsWithCategory(std::string_view category) const noexcept;

    /// @brief Number of items lacking the category (N - itemsWithCategory).
    [[nodiscard]] ItemCount itemsMissingCategory(std::string_view category) const noexcept {
        return totalItems_ - itemsWithCategory(category);
    }

    /// @brief Trait count -> number of items carrying that many traits.
    [[nodiscard]] const std::map<std::size_t, ItemCount>& traitCountHistogram() const noexcept {
        return traitCounts_;
    }

    /// @brief Number of items carrying exactly traitCount traits.
    [[nodiscard]] ItemCount itemsWithTraitCount(std::size_t traitCount) const noexcept;

    [[nodiscard]] bool operator==(const TraitCatalog& other) const = default;

private:
    friend class CatalogBuilder;

    ItemCount totalItems_ = 0;
    CategoryTable categories_;
    std::map<std::string, ItemCount, std::less<>> carriers_;
    std::map<std::size_t, ItemCount> traitCounts_;
};

// =============================================================================
// Catalog Builder
// =============================================================================

/// @brief Accumulates items into a catalog.
///
/// A builder owns partial counts only; it never exposes a catalog until
/// build() succeeds. Builders over disjoint item partitions can be merged.
class CatalogBuilder {
public:
    CatalogBuilder() = default;

    /// @brief Count one item.
    /// @return DataError if the item lists a category twice; the builder is
    ///         left unchanged in that case.
    [[nodiscard]] VoidResult add(const Item& item);

    /// @brief Fold the counts of another builder into this one.
    void merge(const CatalogBuilder& other);

    /// @brief Number of items counted so far.
    [[nodiscard]] ItemCount itemCount() const noexcept { return catalog_.totalItems_; }

    /// @brief Finish building.
    /// @return The catalog, or EmptyCollectionError if no item was added.
    [[nodiscard]] Result<TraitCatalog> build() const;

private:
    TraitCatalog catalog_;
};

// =============================================================================
// Build Configuration
// =============================================================================

/// @brief Configuration for catalog building.
struct CatalogBuildConfig {
    /// @brief Number of threads (0 = TBB default, 1 = sequential pass).
    std::size_t numThreads = 0;

    /// @brief Items per parallel task; collections this small build sequentially.
    std::size_t grainSize = kDefaultCatalogGrainSize;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Build Functions
// =============================================================================

/// @brief Build the catalog of a collection.
/// @param items All items of the collection.
/// @param config Threading configuration.
/// @return The catalog, EmptyCollectionError for an empty collection, or the
///         DataError of the malformed item with the lowest position.
[[nodiscard]] Result<TraitCatalog> buildCatalog(std::span<const Item> items,
                                                const CatalogBuildConfig& config = {});

}  // namespace rarity::catalog

#endif  // RARITY_CATALOG_TRAIT_CATALOG_H
