// =============================================================================
// rarity-core - Collection Summary Implementation
// =============================================================================

#include "rarity/catalog/collection_summary.h"

#include <algorithm>

namespace rarity::catalog {

const CategorySummary* CollectionSummary::find(std::string_view category) const noexcept {
    auto it = std::find_if(categories.begin(), categories.end(),
                           [category](const CategorySummary& s) { return s.name == category; });
    return it != categories.end() ? &*it : nullptr;
}

CollectionSummary summarizeCatalog(const TraitCatalog& catalog) {
    CollectionSummary summary;
    summary.totalItems = catalog.totalItems();
    summary.categories.reserve(catalog.categoryCount());

    for (const auto& [name, counts] : catalog.categories()) {
        CategorySummary category;
        category.name = name;
        category.distinctValues = counts.size();
        category.itemsWithCategory = catalog.itemsWithCategory(name);
        category.itemsMissing = catalog.itemsMissingCategory(name);

        // Values are visited in ascending order; strict comparisons keep the
        // first (smallest) value on ties.
        bool first = true;
        for (const auto& [value, count] : counts) {
            if (first || count < category.rarestCount) {
                category.rarestValue = value;
                category.rarestCount = count;
            }
            if (first || count > category.mostCommonCount) {
                category.mostCommonValue = value;
                category.mostCommonCount = count;
            }
            first = false;
        }

        summary.categories.push_back(std::move(category));
    }

    return summary;
}

}  // namespace rarity::catalog
