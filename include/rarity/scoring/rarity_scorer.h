// =============================================================================
// rarity-core - Rarity Scorer
// =============================================================================
// Turns one item plus the shared catalog into per-trait rarity contributions
// and a total rarity:
//
//   contribution(category) = N / count(value)            item has the category
//   contribution(category) = N / (N - carriers)          item lacks it
//   contribution(category) = N                           lacks it, nobody else does
//   total                  = sum over catalog categories, lexicographic order
//
// N / count is the inverse of the value's frequency count / N. It is computed
// as a single division so a value seen once contributes exactly N.
//
// Scoring models are pluggable behind ScoringModel. Every model is a pure
// function of (catalog, item), so items can be scored concurrently; see
// scoreItems() for the TBB-parallel batch form.
// =============================================================================

#ifndef RARITY_SCORING_RARITY_SCORER_H
#define RARITY_SCORING_RARITY_SCORER_H

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rarity/catalog/trait_catalog.h"
#include "rarity/common/error.h"
#include "rarity/common/types.h"

namespace rarity::scoring {

// =============================================================================
// Constants
// =============================================================================

/// @brief Pseudo-category scored by the trait-count model.
inline constexpr std::string_view kTraitCountCategory = "Trait Count";

// =============================================================================
// Scoring Results
// =============================================================================

/// @brief Contribution of one category to an item's total rarity.
struct TraitContribution {
    /// @brief Category name.
    std::string category;

    /// @brief The item's value, or std::nullopt for the "missing" pseudo-value.
    std::optional<std::string> value;

    /// @brief Items sharing this value (or sharing the absence of the category).
    ItemCount occurrences = 0;

    /// @brief Inverse frequency N / occurrences.
    double rarity = 0.0;

    [[nodiscard]] bool isMissing() const noexcept { return !value.has_value(); }

    [[nodiscard]] bool operator==(const TraitContribution& other) const = default;
};

/// @brief Rarity of one item.
/// @note totalRarity never changes after scoring; rank is filled in by the
///       ranking engine once every item has been scored.
struct ItemRarity {
    ExternalId id;

    /// @brief One entry per scored category, in summation order.
    std::vector<TraitContribution> contributions;

    double totalRarity = 0.0;

    Rank rank = kUnranked;

    [[nodiscard]] bool isRanked() const noexcept { return rank != kUnranked; }

    /// @brief Find the contribution of a category.
    [[nodiscard]] const TraitContribution* findContribution(
        std::string_view category) const noexcept;

    [[nodiscard]] bool operator==(const ItemRarity& other) const = default;
};

// =============================================================================
// Scoring Models
// =============================================================================

/// @brief Available scoring models.
enum class ScoringModelKind {
    /// @brief Inverse value frequency summed over categories.
    kStatistical,

    /// @brief Statistical model plus the inverse frequency of the item's
    ///        trait count as an extra pseudo-category.
    kTraitCount
};

/// @brief Parse a model name ("statistical", "trait-count").
[[nodiscard]] Result<ScoringModelKind> parseScoringModelKind(std::string_view name);

/// @brief Name of a model kind.
[[nodiscard]] std::string_view scoringModelKindToString(ScoringModelKind kind) noexcept;

/// @brief Interface for rarity scoring strategies.
/// @note Implementations must be stateless with respect to score() so that a
///       single instance can be shared by concurrent workers.
class ScoringModel {
public:
    virtual ~ScoringModel() = default;

    /// @brief Model kind.
    [[nodiscard]] virtual ScoringModelKind kind() const noexcept = 0;

    /// @brief Score one item against the catalog.
    /// @return ItemRarity with rank unset, DataError for a duplicated category,
    ///         or DegenerateCategoryError if the item does not belong to the
    ///         catalog.
    [[nodiscard]] virtual Result<ItemRarity> score(const catalog::TraitCatalog& catalog,
                                                   const Item& item) const = 0;
};

/// @brief Inverse-frequency scoring over the catalog categories.
class StatisticalRarityModel : public ScoringModel {
public:
    [[nodiscard]] ScoringModelKind kind() const noexcept override {
        return ScoringModelKind::kStatistical;
    }

    [[nodiscard]] Result<ItemRarity> score(const catalog::TraitCatalog& catalog,
                                           const Item& item) const override;
};

/// @brief Statistical model extended with a trait-count pseudo-category.
/// @note The pseudo-category is appended after all real categories and is
///       weighted like any other category.
class TraitCountRarityModel final : public StatisticalRarityModel {
public:
    [[nodiscard]] ScoringModelKind kind() const noexcept override {
        return ScoringModelKind::kTraitCount;
    }

    [[nodiscard]] Result<ItemRarity> score(const catalog::TraitCatalog& catalog,
                                           const Item& item) const override;
};

/// @brief Create a scoring model.
[[nodiscard]] std::unique_ptr<ScoringModel> makeScoringModel(ScoringModelKind kind);

// =============================================================================
// Scoring Functions
// =============================================================================

/// @brief Score one item with the statistical model.
[[nodiscard]] Result<ItemRarity> scoreItem(const catalog::TraitCatalog& catalog,
                                           const Item& item);

/// @brief Score every item, in parallel, with the given model.
/// @param catalog Catalog built from exactly these items.
/// @param items Items to score.
/// @param model Scoring model shared by all workers.
/// @return One ItemRarity per item in input order, or the error of the
///         failing item with the lowest position.
/// @note Runs in the calling thread's task arena.
[[nodiscard]] Result<std::vector<ItemRarity>> scoreItems(const catalog::TraitCatalog& catalog,
                                                         std::span<const Item> items,
                                                         const ScoringModel& model);

}  // namespace rarity::scoring

#endif  // RARITY_SCORING_RARITY_SCORER_H
