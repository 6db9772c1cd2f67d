// =============================================================================
// rarity-core - Rarity Pipeline Property Tests
// =============================================================================
// Property-based tests for the end-to-end TBB pipeline.
//
// **Property 1: Repeated runs yield bit-identical totals and identical ranks**
// **Property 2: Parallel and single-threaded runs agree**
// **Property 3: Totals do not depend on input order**
// **Property 4: The first fatal error aborts the run**
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "rarity/common/types.h"
#include "rarity/pipeline/rarity_pipeline.h"

namespace rarity::pipeline::test {

// =============================================================================
// Test Fixtures
// =============================================================================

class RarityPipelineTest : public ::testing::Test {
protected:
    static Item makeItem(ExternalId id,
                         std::vector<std::pair<std::string, std::string>> traits) {
        Item item{std::move(id), {}};
        for (auto& [category, value] : traits) {
            item.addTrait(std::move(category), std::move(value));
        }
        return item;
    }
};

// =============================================================================
// Generators
// =============================================================================

namespace gen {

/// @brief Generate a collection of items with unique ids and 0-5 traits each.
rc::Gen<std::vector<Item>> collection(std::size_t minCount = 1, std::size_t maxCount = 250) {
    return rc::gen::mapcat(
        rc::gen::inRange(minCount, maxCount + 1), [](std::size_t count) {
            return rc::gen::map(
                rc::gen::container<std::vector<std::vector<int>>>(
                    count, rc::gen::container<std::vector<int>>(5, rc::gen::inRange(-1, 4))),
                [](const std::vector<std::vector<int>>& choices) {
                    static const char* const kCategories[] = {"Background", "Clothes", "Eyes",
                                                              "Fur", "Hat"};
                    std::vector<Item> items;
                    items.reserve(choices.size());
                    for (std::size_t i = 0; i < choices.size(); ++i) {
                        // Mix integer and string ids
                        Item item{i % 5 == 0 ? ExternalId("ape" + std::to_string(i))
                                             : ExternalId(static_cast<std::int64_t>(i)),
                                  {}};
                        for (std::size_t c = 0; c < choices[i].size(); ++c) {
                            if (choices[i][c] >= 0) {
                                item.addTrait(kCategories[c], std::int64_t{choices[i][c]});
                            }
                        }
                        items.push_back(std::move(item));
                    }
                    return items;
                });
        });
}

}  // namespace gen

// =============================================================================
// Unit Tests
// =============================================================================

TEST_F(RarityPipelineTest, RanksSingleCategoryCollection) {
    const std::vector<Item> items = {
        makeItem(1, {{"Color", "Red"}}),
        makeItem(2, {{"Color", "Red"}}),
        makeItem(3, {{"Color", "Red"}}),
        makeItem(4, {{"Color", "Blue"}}),
    };

    RarityPipeline rarityPipeline;
    auto report = rarityPipeline.run(items);
    ASSERT_TRUE(report.has_value()) << report.error().describe();

    EXPECT_EQ(report->totalItems(), 4u);
    ASSERT_EQ(report->ranked.size(), 4u);
    EXPECT_EQ(report->ranked[0].id, ExternalId(4));
    EXPECT_DOUBLE_EQ(report->ranked[0].totalRarity, 4.0);
    EXPECT_EQ(report->ranked[1].id, ExternalId(1));
    EXPECT_EQ(report->ranked[2].id, ExternalId(2));
    EXPECT_EQ(report->ranked[3].id, ExternalId(3));
    EXPECT_DOUBLE_EQ(report->ranked[3].totalRarity, 4.0 / 3.0);

    const auto* blue = report->findItem(ExternalId(4));
    ASSERT_NE(blue, nullptr);
    EXPECT_EQ(blue->rank, 1u);
    EXPECT_EQ(report->findItem(ExternalId(99)), nullptr);

    EXPECT_EQ(report->summary.totalItems, 4u);
    EXPECT_EQ(report->stats.totalItems, 4u);
    EXPECT_EQ(report->stats.totalCategories, 1u);
    EXPECT_EQ(report->model, scoring::ScoringModelKind::kStatistical);
}

TEST_F(RarityPipelineTest, TraitCountModel) {
    const std::vector<Item> items = {
        makeItem(1, {{"Color", "Red"}, {"Hat", "Cap"}}),
        makeItem(2, {{"Color", "Red"}, {"Hat", "Cap"}}),
        makeItem(3, {{"Color", "Red"}}),
    };

    PipelineConfig config;
    config.model = scoring::ScoringModelKind::kTraitCount;
    RarityPipeline rarityPipeline(config);

    auto report = rarityPipeline.run(items);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->model, scoring::ScoringModelKind::kTraitCount);

    const auto* bare = report->findItem(ExternalId(3));
    ASSERT_NE(bare, nullptr);
    EXPECT_EQ(bare->rank, 1u);
    ASSERT_NE(bare->findContribution(scoring::kTraitCountCategory), nullptr);
    // Color 3/3 + missing Hat 3/1 + one-trait count 3/1
    EXPECT_DOUBLE_EQ(bare->totalRarity, 1.0 + 3.0 + 3.0);
}

TEST_F(RarityPipelineTest, EmptyCollectionFails) {
    RarityPipeline rarityPipeline;
    auto report = rarityPipeline.run({});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kEmptyCollection);
}

TEST_F(RarityPipelineTest, DuplicateCategoryAbortsRun) {
    const std::vector<Item> items = {
        makeItem(1, {{"Color", "Red"}}),
        makeItem(2, {{"Color", "Red"}, {"Color", "Blue"}}),
    };

    RarityPipeline rarityPipeline;
    auto report = rarityPipeline.run(items);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kDataError);
    EXPECT_EQ(report.error().context()->itemId, "2");
}

TEST_F(RarityPipelineTest, DuplicateIdAbortsRun) {
    const std::vector<Item> items = {
        makeItem("alpha", {{"Color", "Red"}}),
        makeItem("beta", {{"Color", "Blue"}}),
        makeItem("alpha", {{"Color", "Green"}}),
    };

    RarityPipeline rarityPipeline;
    auto report = rarityPipeline.run(items);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kDataError);
    EXPECT_EQ(report.error().context()->itemId, "alpha");
}

TEST_F(RarityPipelineTest, InvalidConfig) {
    PipelineConfig config;
    config.catalogGrainSize = 0;
    EXPECT_FALSE(config.validate().has_value());

    RarityPipeline rarityPipeline(config);
    const std::vector<Item> items = {makeItem(1, {})};
    auto report = rarityPipeline.run(items);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kUsageError);
}

TEST_F(RarityPipelineTest, MovedFromPipelineReportsInvalidState) {
    PipelineConfig config;
    config.model = scoring::ScoringModelKind::kTraitCount;
    RarityPipeline original(config);
    RarityPipeline moved(std::move(original));

    const std::vector<Item> items = {makeItem(1, {{"Color", "Red"}})};
    auto report = moved.run(items);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->model, scoring::ScoringModelKind::kTraitCount);

    // NOLINTNEXTLINE(bugprone-use-after-move)
    auto stale = original.run(items);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code(), ErrorCode::kInvalidState);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(RarityPipelinePropertyTest, RepeatedRunsAreIdentical, ()) {
    const auto items = *gen::collection();

    RarityPipeline rarityPipeline;
    auto first = rarityPipeline.run(items);
    auto second = rarityPipeline.run(items);
    RC_ASSERT(first.has_value());
    RC_ASSERT(second.has_value());
    RC_ASSERT(first->ranked == second->ranked);
}

RC_GTEST_PROP(RarityPipelinePropertyTest, ParallelMatchesSingleThreaded, ()) {
    const auto items = *gen::collection();

    PipelineConfig serialConfig;
    serialConfig.numThreads = 1;

    PipelineConfig parallelConfig;
    parallelConfig.numThreads = 4;
    parallelConfig.catalogGrainSize = 16;

    auto serial = RarityPipeline(serialConfig).run(items);
    auto parallel = RarityPipeline(parallelConfig).run(items);
    RC_ASSERT(serial.has_value());
    RC_ASSERT(parallel.has_value());
    RC_ASSERT(serial->catalog == parallel->catalog);
    RC_ASSERT(serial->summary == parallel->summary);
    RC_ASSERT(serial->ranked == parallel->ranked);
}

RC_GTEST_PROP(RarityPipelinePropertyTest, TotalsIndependentOfInputOrder, ()) {
    const auto items = *gen::collection(2);
    const auto seed = *rc::gen::arbitrary<std::uint32_t>();

    auto shuffled = items;
    std::mt19937 rng(seed);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    RarityPipeline rarityPipeline;
    auto a = rarityPipeline.run(items);
    auto b = rarityPipeline.run(shuffled);
    RC_ASSERT(a.has_value());
    RC_ASSERT(b.has_value());
    RC_ASSERT(a->ranked == b->ranked);
}

RC_GTEST_PROP(RarityPipelinePropertyTest, IdenticalTraitsRankByAscendingId, ()) {
    const auto count = *rc::gen::inRange<std::int64_t>(1, 100);

    std::vector<Item> items;
    for (std::int64_t id = count; id >= 1; --id) {
        Item item{ExternalId(id), {}};
        item.addTrait("Background", std::string("Blue")).addTrait("Fur", true);
        items.push_back(std::move(item));
    }

    auto report = RarityPipeline().run(items);
    RC_ASSERT(report.has_value());
    for (std::size_t i = 0; i < report->ranked.size(); ++i) {
        const auto& item = report->ranked[i];
        RC_ASSERT(item.totalRarity == report->ranked.front().totalRarity);
        RC_ASSERT(item.id == ExternalId(static_cast<std::int64_t>(i + 1)));
        RC_ASSERT(item.rank == static_cast<Rank>(i + 1));
    }
}

}  // namespace rarity::pipeline::test
