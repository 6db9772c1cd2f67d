// =============================================================================
// rarity-core - Ranking Engine Implementation
// =============================================================================

#include "rarity/ranking/ranking_engine.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <fmt/format.h>

#include "rarity/common/logger.h"

namespace rarity::ranking {

namespace {

bool exactOrder(const scoring::ItemRarity& lhs, const scoring::ItemRarity& rhs) noexcept {
    if (lhs.totalRarity != rhs.totalRarity) {
        return lhs.totalRarity > rhs.totalRarity;
    }
    return lhs.id < rhs.id;
}

bool idOrder(const scoring::ItemRarity& lhs, const scoring::ItemRarity& rhs) noexcept {
    return lhs.id < rhs.id;
}

}  // namespace

bool totalsTie(double lhs, double rhs) noexcept {
    const double scale = std::max({1.0, std::abs(lhs), std::abs(rhs)});
    return std::abs(lhs - rhs) <= kTieTolerance * scale;
}

Result<std::vector<scoring::ItemRarity>> rankItems(std::vector<scoring::ItemRarity> scored) {
    if (scored.empty()) {
        return makeError<std::vector<scoring::ItemRarity>>(ErrorCode::kEmptyCollection,
                                                           "cannot rank an empty collection");
    }

    // The tie-break is only a total order if ids are unique
    std::vector<const ExternalId*> ids;
    ids.reserve(scored.size());
    for (const auto& item : scored) {
        ids.push_back(&item.id);
    }
    std::sort(ids.begin(), ids.end(),
              [](const ExternalId* lhs, const ExternalId* rhs) { return *lhs < *rhs; });
    auto duplicate = std::adjacent_find(
        ids.begin(), ids.end(),
        [](const ExternalId* lhs, const ExternalId* rhs) { return *lhs == *rhs; });
    if (duplicate != ids.end()) {
        const std::string id = (*duplicate)->toString();
        return makeError<std::vector<scoring::ItemRarity>>(
            ErrorCode::kDataError, fmt::format("external id {} is used by more than one item", id),
            ErrorContext{}.withItem(id));
    }

    std::sort(scored.begin(), scored.end(), exactOrder);

    // A tie is not transitive, so ties are grouped along the exact order
    auto group = scored.begin();
    for (auto it = scored.begin(); it != scored.end(); ++it) {
        const auto next = std::next(it);
        if (next == scored.end() || !totalsTie(it->totalRarity, next->totalRarity)) {
            std::sort(group, next, idOrder);
            group = next;
        }
    }

    Rank rank = 1;
    for (auto& item : scored) {
        item.rank = rank++;
    }

    RARITY_LOG_DEBUG("Ranked {} items", scored.size());
    return scored;
}

}  // namespace rarity::ranking
