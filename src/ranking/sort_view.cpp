// =============================================================================
// rarity-core - Sort View Implementation
// =============================================================================

#include "rarity/ranking/sort_view.h"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

namespace rarity::ranking {

namespace {

struct SortModeName {
    SortMode mode;
    std::string_view label;
    std::string_view option;
};

constexpr std::array<SortModeName, 4> kSortModeNames = {{
    {SortMode::kSerialAscending, "Serial ASC", "serial-asc"},
    {SortMode::kSerialDescending, "Serial DESC", "serial-desc"},
    {SortMode::kMostRare, "Most Rare", "most-rare"},
    {SortMode::kLeastRare, "Least Rare", "least-rare"},
}};

}  // namespace

Result<SortMode> parseSortMode(std::string_view text) {
    for (const auto& name : kSortModeNames) {
        if (text == name.label || text == name.option) {
            return name.mode;
        }
    }
    return makeError<SortMode>(ErrorCode::kUsageError, fmt::format("unknown sort mode: {}", text));
}

std::string_view sortModeLabel(SortMode mode) noexcept {
    for (const auto& name : kSortModeNames) {
        if (name.mode == mode) {
            return name.label;
        }
    }
    return "Serial ASC";
}

std::string_view sortModeOption(SortMode mode) noexcept {
    for (const auto& name : kSortModeNames) {
        if (name.mode == mode) {
            return name.option;
        }
    }
    return "serial-asc";
}

std::vector<scoring::ItemRarity> sortedView(std::span<const scoring::ItemRarity> ranked,
                                            SortMode mode) {
    std::vector<scoring::ItemRarity> view(ranked.begin(), ranked.end());

    using scoring::ItemRarity;
    switch (mode) {
        case SortMode::kSerialAscending:
            std::stable_sort(view.begin(), view.end(),
                             [](const ItemRarity& a, const ItemRarity& b) { return a.id < b.id; });
            break;
        case SortMode::kSerialDescending:
            std::stable_sort(view.begin(), view.end(),
                             [](const ItemRarity& a, const ItemRarity& b) { return b.id < a.id; });
            break;
        case SortMode::kMostRare:
            std::stable_sort(view.begin(), view.end(), [](const ItemRarity& a, const ItemRarity& b) {
                return a.rank < b.rank;
            });
            break;
        case SortMode::kLeastRare:
            std::stable_sort(view.begin(), view.end(), [](const ItemRarity& a, const ItemRarity& b) {
                return b.rank < a.rank;
            });
            break;
    }
    return view;
}

}  // namespace rarity::ranking
