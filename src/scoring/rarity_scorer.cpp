// =============================================================================
// rarity-core - Rarity Scorer Implementation
// =============================================================================

#include "rarity/scoring/rarity_scorer.h"

#include <algorithm>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "rarity/common/logger.h"

namespace rarity::scoring {

namespace {

[[nodiscard]] double inverseFrequency(ItemCount total, ItemCount occurrences) noexcept {
    return static_cast<double>(total) / static_cast<double>(occurrences);
}

[[nodiscard]] ErrorContext itemContext(const Item& item, std::string_view category) {
    ErrorContext context;
    context.withItem(item.id.toString()).withCategory(std::string(category));
    return context;
}

}  // namespace

// =============================================================================
// ItemRarity Implementation
// =============================================================================

const TraitContribution* ItemRarity::findContribution(std::string_view category) const noexcept {
    auto it = std::find_if(contributions.begin(), contributions.end(),
                           [category](const TraitContribution& c) {
                               return c.category == category;
                           });
    return it != contributions.end() ? &*it : nullptr;
}

// =============================================================================
// Model Selection
// =============================================================================

Result<ScoringModelKind> parseScoringModelKind(std::string_view name) {
    if (name == "statistical") {
        return ScoringModelKind::kStatistical;
    }
    if (name == "trait-count") {
        return ScoringModelKind::kTraitCount;
    }
    return makeError<ScoringModelKind>(ErrorCode::kUsageError,
                                       fmt::format("unknown scoring model: {}", name));
}

std::string_view scoringModelKindToString(ScoringModelKind kind) noexcept {
    switch (kind) {
        case ScoringModelKind::kStatistical:
            return "statistical";
        case ScoringModelKind::kTraitCount:
            return "trait-count";
    }
    return "statistical";
}

std::unique_ptr<ScoringModel> makeScoringModel(ScoringModelKind kind) {
    switch (kind) {
        case ScoringModelKind::kTraitCount:
            return std::make_unique<TraitCountRarityModel>();
        case ScoringModelKind::kStatistical:
            break;
    }
    return std::make_unique<StatisticalRarityModel>();
}

// =============================================================================
// StatisticalRarityModel Implementation
// =============================================================================

Result<ItemRarity> StatisticalRarityModel::score(const catalog::TraitCatalog& catalog,
                                                 const Item& item) const {
    if (auto duplicate = item.findDuplicateCategory()) {
        return makeError<ItemRarity>(
            ErrorCode::kDataError,
            fmt::format("category \"{}\" is listed more than once", *duplicate),
            itemContext(item, *duplicate));
    }

    // Every trait the item claims must have been counted by the catalog
    for (const auto& trait : item.traits) {
        if (!catalog.hasCategory(trait.category)) {
            return makeError<ItemRarity>(
                ErrorCode::kDegenerateCategory,
                fmt::format("item has value \"{}\" for a category no catalog item carries",
                            trait.value),
                itemContext(item, trait.category));
        }
    }

    const ItemCount total = catalog.totalItems();

    ItemRarity rarity;
    rarity.id = item.id;
    rarity.contributions.reserve(catalog.categoryCount());

    for (const auto& [category, counts] : catalog.categories()) {
        TraitContribution contribution;
        contribution.category = category;

        if (auto value = item.find(category)) {
            auto it = counts.find(*value);
            if (it == counts.end() || it->second == 0) {
                return makeError<ItemRarity>(
                    ErrorCode::kDegenerateCategory,
                    fmt::format("value \"{}\" was never counted by the catalog", *value),
                    itemContext(item, category));
            }
            contribution.value = std::string(*value);
            contribution.occurrences = it->second;
            contribution.rarity = inverseFrequency(total, it->second);
        } else {
            // "missing" is scored as its own value; if the catalog saw no item
            // without the category the absence is as rare as it gets
            const ItemCount missing = catalog.itemsMissingCategory(category);
            contribution.occurrences = missing;
            contribution.rarity =
                missing == 0 ? static_cast<double>(total) : inverseFrequency(total, missing);
        }

        rarity.totalRarity += contribution.rarity;
        rarity.contributions.push_back(std::move(contribution));
    }

    return rarity;
}

// =============================================================================
// TraitCountRarityModel Implementation
// =============================================================================

Result<ItemRarity> TraitCountRarityModel::score(const catalog::TraitCatalog& catalog,
                                                const Item& item) const {
    auto rarity = StatisticalRarityModel::score(catalog, item);
    if (!rarity) {
        return rarity;
    }

    const ItemCount sameCount = catalog.itemsWithTraitCount(item.traitCount());
    if (sameCount == 0) {
        return makeError<ItemRarity>(
            ErrorCode::kDegenerateCategory,
            fmt::format("no catalog item carries {} traits", item.traitCount()),
            itemContext(item, kTraitCountCategory));
    }

    TraitContribution contribution;
    contribution.category = std::string(kTraitCountCategory);
    contribution.value = std::to_string(item.traitCount());
    contribution.occurrences = sameCount;
    contribution.rarity = inverseFrequency(catalog.totalItems(), sameCount);

    rarity->totalRarity += contribution.rarity;
    rarity->contributions.push_back(std::move(contribution));
    return rarity;
}

// =============================================================================
// Scoring Functions
// =============================================================================

Result<ItemRarity> scoreItem(const catalog::TraitCatalog& catalog, const Item& item) {
    return StatisticalRarityModel{}.score(catalog, item);
}

Result<std::vector<ItemRarity>> scoreItems(const catalog::TraitCatalog& catalog,
                                           std::span<const Item> items,
                                           const ScoringModel& model) {
    std::vector<ItemRarity> scored(items.size());
    std::vector<std::optional<Error>> errors(items.size());

    // Each slot is written by exactly one task; the catalog is only read
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, items.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                          for (std::size_t i = range.begin(); i != range.end(); ++i) {
                              auto result = model.score(catalog, items[i]);
                              if (result) {
                                  scored[i] = std::move(*result);
                              } else {
                                  errors[i] = std::move(result.error());
                              }
                          }
                      });

    for (auto& error : errors) {
        if (error.has_value()) {
            return makeError<std::vector<ItemRarity>>(std::move(*error));
        }
    }

    RARITY_LOG_DEBUG("Scored {} items with the {} model", scored.size(),
                     scoringModelKindToString(model.kind()));
    return scored;
}

}  // namespace rarity::scoring
