// =============================================================================
// rarity-core - Sort View Tests
// =============================================================================

#include "rarity/ranking/sort_view.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "rarity/ranking/ranking_engine.h"

namespace rarity::ranking {
namespace {

using scoring::ItemRarity;

std::vector<ItemRarity> rankedSample() {
    std::vector<ItemRarity> items(4);
    items[0].id = ExternalId(3);
    items[0].totalRarity = 1.5;
    items[1].id = ExternalId(1);
    items[1].totalRarity = 6.0;
    items[2].id = ExternalId("zed");
    items[2].totalRarity = 3.0;
    items[3].id = ExternalId(20);
    items[3].totalRarity = 0.5;
    return *rankItems(std::move(items));
}

std::vector<ExternalId> idsOf(const std::vector<ItemRarity>& items) {
    std::vector<ExternalId> ids;
    for (const auto& item : items) {
        ids.push_back(item.id);
    }
    return ids;
}

TEST(SortViewTest, SerialAscending) {
    const auto ranked = rankedSample();
    auto view = sortedView(ranked, SortMode::kSerialAscending);
    EXPECT_EQ(idsOf(view), (std::vector<ExternalId>{1, 3, 20, "zed"}));
}

TEST(SortViewTest, SerialDescending) {
    const auto ranked = rankedSample();
    auto view = sortedView(ranked, SortMode::kSerialDescending);
    EXPECT_EQ(idsOf(view), (std::vector<ExternalId>{"zed", 20, 3, 1}));
}

TEST(SortViewTest, MostAndLeastRare) {
    const auto ranked = rankedSample();

    auto mostRare = sortedView(ranked, SortMode::kMostRare);
    EXPECT_EQ(idsOf(mostRare), (std::vector<ExternalId>{1, "zed", 3, 20}));

    auto leastRare = sortedView(ranked, SortMode::kLeastRare);
    EXPECT_EQ(idsOf(leastRare), (std::vector<ExternalId>{20, 3, "zed", 1}));
}

TEST(SortViewTest, ViewsNeverChangeRankOrTotal) {
    const auto ranked = rankedSample();
    for (SortMode mode : {SortMode::kSerialAscending, SortMode::kSerialDescending,
                          SortMode::kMostRare, SortMode::kLeastRare}) {
        auto view = sortedView(ranked, mode);
        ASSERT_EQ(view.size(), ranked.size());
        for (const auto& item : view) {
            auto original = std::find_if(ranked.begin(), ranked.end(),
                                         [&](const ItemRarity& r) { return r.id == item.id; });
            ASSERT_NE(original, ranked.end());
            EXPECT_EQ(item, *original);
        }
    }
}

TEST(SortViewTest, ParseLabelsAndOptions) {
    EXPECT_EQ(parseSortMode("Serial ASC").value(), SortMode::kSerialAscending);
    EXPECT_EQ(parseSortMode("serial-desc").value(), SortMode::kSerialDescending);
    EXPECT_EQ(parseSortMode("Most Rare").value(), SortMode::kMostRare);
    EXPECT_EQ(parseSortMode("least-rare").value(), SortMode::kLeastRare);

    auto unknown = parseSortMode("random");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::kUsageError);

    EXPECT_EQ(sortModeLabel(SortMode::kLeastRare), "Least Rare");
    EXPECT_EQ(sortModeOption(SortMode::kSerialAscending), "serial-asc");
}

}  // namespace
}  // namespace rarity::ranking
