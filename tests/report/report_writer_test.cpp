// =============================================================================
// rarity-core - Report Writer Tests
// =============================================================================

#include "rarity/report/report_writer.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "rarity/catalog/collection_summary.h"
#include "rarity/catalog/trait_catalog.h"
#include "rarity/pipeline/rarity_pipeline.h"

namespace rarity::report {
namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

pipeline::RarityReport sampleReport() {
    std::vector<Item> items(3);
    items[0].id = ExternalId(1);
    items[0].addTrait("Color", std::string("Red")).addTrait("Hat", std::string("Cap"));
    items[1].id = ExternalId(2);
    items[1].addTrait("Color", std::string("Red"));
    items[2].id = ExternalId("gold \"one\"");
    items[2].addTrait("Color", std::string("Gold"));

    auto report = pipeline::RarityPipeline().run(items);
    EXPECT_TRUE(report.has_value());
    return *report;
}

// =============================================================================
// Formatting Helpers
// =============================================================================

TEST(ReportWriterTest, FormatRarityUsesFixedPrecision) {
    EXPECT_EQ(formatRarity(4.0 / 3.0), "1.3333");
    EXPECT_EQ(formatRarity(4.0), "4.0000");
    EXPECT_EQ(formatRarity(2.0 / 3.0, 2), "0.67");
    EXPECT_EQ(formatRarity(7.6, 0), "8");
}

TEST(ReportWriterTest, OptionsValidation) {
    ReportOptions options;
    EXPECT_TRUE(options.validate().has_value());

    options.precision = kMaxDisplayPrecision + 1;
    EXPECT_FALSE(options.validate().has_value());

    options.precision = -1;
    EXPECT_FALSE(options.validate().has_value());
}

// =============================================================================
// Ranking Output
// =============================================================================

TEST(ReportWriterTest, RankingText) {
    const auto report = sampleReport();
    std::ostringstream out;
    writeRankingText(out, report.ranked);

    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "Most Rare"));
    EXPECT_TRUE(contains(text, "Hat = <missing>"));
    EXPECT_TRUE(contains(text, "gold \"one\""));
    EXPECT_TRUE(contains(text, "Total items: 3"));
}

TEST(ReportWriterTest, RankingTextTotalsOnly) {
    const auto report = sampleReport();
    ReportOptions options;
    options.includeContributions = false;

    std::ostringstream out;
    writeRankingText(out, report.ranked, options);
    EXPECT_FALSE(contains(out.str(), "Color ="));
}

TEST(ReportWriterTest, RankingJson) {
    const auto report = sampleReport();
    ReportOptions options;
    options.sortMode = ranking::SortMode::kSerialAscending;

    std::ostringstream out;
    writeRankingJson(out, ranking::sortedView(report.ranked, options.sortMode), options);

    const auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ(json["sort"], "Serial ASC");
    EXPECT_EQ(json["model"], "statistical");
    EXPECT_EQ(json["totalItems"], 3);

    // Integer ids come first in serial order
    const auto& items = json["items"];
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["id"], 1);
    EXPECT_EQ(items[1]["id"], 2);
    EXPECT_EQ(items[2]["id"], "gold \"one\"");

    // Item 2 has no hat
    const auto& bareTraits = items[1]["traits"];
    ASSERT_EQ(bareTraits.size(), 2u);
    EXPECT_EQ(bareTraits[1]["category"], "Hat");
    EXPECT_TRUE(bareTraits[1]["value"].is_null());

    // Gold is unique among 3 items
    const auto& gold = items[2]["traits"][0];
    EXPECT_EQ(gold["value"], "Gold");
    EXPECT_EQ(gold["occurrences"], 1);
    EXPECT_DOUBLE_EQ(gold["rarity"].get<double>(), 3.0);
}

TEST(ReportWriterTest, RankingJsonRoundsToPrecision) {
    const auto report = sampleReport();
    ReportOptions options;
    options.precision = 2;
    options.includeContributions = false;

    std::ostringstream out;
    writeRankingJson(out, report.ranked, options);

    const auto json = nlohmann::json::parse(out.str());
    const auto& red = json["items"][2];
    EXPECT_EQ(red["id"], 2);
    // Color 3/2 + missing Hat 3/2
    EXPECT_DOUBLE_EQ(red["totalRarity"].get<double>(), 3.0);
    EXPECT_FALSE(red.contains("traits"));
}

TEST(ReportWriterTest, RankingJsonReplacesInvalidUtf8) {
    std::vector<Item> items(1);
    items[0].id = ExternalId(std::string("bad\xff"));
    items[0].addTrait("Color", std::string("R\xc3"));
    auto report = pipeline::RarityPipeline().run(items);
    ASSERT_TRUE(report.has_value());

    std::ostringstream out;
    writeRankingJson(out, report->ranked);
    EXPECT_NO_THROW((void)nlohmann::json::parse(out.str()));
}

TEST(ReportWriterTest, EmptyRankingJson) {
    std::ostringstream out;
    writeRankingJson(out, {});

    const auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ(json["totalItems"], 0);
    EXPECT_TRUE(json["items"].is_array());
    EXPECT_TRUE(json["items"].empty());
}

// =============================================================================
// Summary Output
// =============================================================================

TEST(ReportWriterTest, SummaryText) {
    const auto report = sampleReport();
    std::ostringstream out;
    writeSummaryText(out, report.summary);

    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "Total items:    3"));
    EXPECT_TRUE(contains(text, "--- Color ---"));
    EXPECT_TRUE(contains(text, "Most common:     Red (2 items)"));
    EXPECT_TRUE(contains(text, "Items without:   2"));
}

TEST(ReportWriterTest, SummaryJson) {
    const auto report = sampleReport();
    std::ostringstream out;
    writeSummaryJson(out, report.summary);

    const auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ(json["totalItems"], 3);
    ASSERT_EQ(json["categories"].size(), 2u);

    const auto& color = json["categories"][0];
    EXPECT_EQ(color["name"], "Color");
    EXPECT_EQ(color["rarest"]["value"], "Gold");
    EXPECT_EQ(color["rarest"]["count"], 1);
    EXPECT_EQ(color["mostCommon"]["value"], "Red");
    EXPECT_EQ(color["mostCommon"]["count"], 2);

    const auto& hat = json["categories"][1];
    EXPECT_EQ(hat["name"], "Hat");
    EXPECT_EQ(hat["itemsMissing"], 2);
}

}  // namespace
}  // namespace rarity::report
