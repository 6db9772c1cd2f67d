// =============================================================================
// rarity-core - Report Writer Implementation
// =============================================================================

#include "rarity/report/report_writer.h"

#include <cmath>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace rarity::report {

namespace {

/// @brief Placeholder shown for the "missing" pseudo-value in text output.
constexpr std::string_view kMissingValueLabel = "<missing>";

using Json = nlohmann::ordered_json;

[[nodiscard]] Json jsonId(const ExternalId& id) {
    if (id.isInteger()) {
        return id.asInteger();
    }
    return id.asString();
}

/// @brief Rarity rounded to the display precision, so JSON and text agree.
[[nodiscard]] double roundRarity(double value, int precision) {
    const double scale = std::pow(10.0, precision);
    return std::round(value * scale) / scale;
}

/// @brief Pretty-print a document; invalid UTF-8 is replaced, never emitted.
void writeDocument(std::ostream& out, const Json& document) {
    out << document.dump(2, ' ', false, Json::error_handler_t::replace) << '\n';
}

}  // namespace

// =============================================================================
// Options
// =============================================================================

VoidResult ReportOptions::validate() const {
    if (precision < 0 || precision > kMaxDisplayPrecision) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("precision must be in range [0, {}]",
                                         kMaxDisplayPrecision));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Formatting Helpers
// =============================================================================

std::string formatRarity(double value, int precision) {
    return fmt::format("{:.{}f}", value, precision);
}

// =============================================================================
// Ranking Output
// =============================================================================

void writeRankingText(std::ostream& out, std::span<const scoring::ItemRarity> items,
                      const ReportOptions& options) {
    out << fmt::format("=== Rarity Ranking ({}, {}) ===\n",
                       ranking::sortModeLabel(options.sortMode),
                       scoring::scoringModelKindToString(options.model));
    out << fmt::format("{:>8}  {:<24}  {:>14}\n", "Rank", "ID", "Total Rarity");

    for (const auto& item : items) {
        out << fmt::format("{:>8}  {:<24}  {:>14}\n", item.rank, item.id.toString(),
                           formatRarity(item.totalRarity, options.precision));

        if (!options.includeContributions) {
            continue;
        }
        for (const auto& contribution : item.contributions) {
            const std::string_view value = contribution.value.has_value()
                                               ? std::string_view(*contribution.value)
                                               : kMissingValueLabel;
            out << fmt::format("{:>10}{} = {} ({} items): {}\n", "", contribution.category, value,
                               contribution.occurrences,
                               formatRarity(contribution.rarity, options.precision));
        }
    }
    out << fmt::format("Total items: {}\n", items.size());
}

void writeRankingJson(std::ostream& out, std::span<const scoring::ItemRarity> items,
                      const ReportOptions& options) {
    Json entries = Json::array();
    for (const auto& item : items) {
        Json entry = {
            {"id", jsonId(item.id)},
            {"rank", item.rank},
            {"totalRarity", roundRarity(item.totalRarity, options.precision)},
        };

        if (options.includeContributions) {
            Json traits = Json::array();
            for (const auto& contribution : item.contributions) {
                traits.push_back({
                    {"category", contribution.category},
                    {"value", contribution.value.has_value() ? Json(*contribution.value)
                                                             : Json(nullptr)},
                    {"occurrences", contribution.occurrences},
                    {"rarity", roundRarity(contribution.rarity, options.precision)},
                });
            }
            entry["traits"] = std::move(traits);
        }
        entries.push_back(std::move(entry));
    }

    const Json document = {
        {"model", std::string(scoring::scoringModelKindToString(options.model))},
        {"sort", std::string(ranking::sortModeLabel(options.sortMode))},
        {"totalItems", items.size()},
        {"items", std::move(entries)},
    };
    writeDocument(out, document);
}

// =============================================================================
// Summary Output
// =============================================================================

void writeSummaryText(std::ostream& out, const catalog::CollectionSummary& summary) {
    out << "=== Collection Summary ===\n";
    out << fmt::format("Total items:    {}\n", summary.totalItems);
    out << fmt::format("Categories:     {}\n", summary.categories.size());

    for (const auto& category : summary.categories) {
        out << "\n";
        out << fmt::format("--- {} ---\n", category.name);
        out << fmt::format("Distinct values: {}\n", category.distinctValues);
        out << fmt::format("Items with:      {}\n", category.itemsWithCategory);
        out << fmt::format("Items without:   {}\n", category.itemsMissing);
        out << fmt::format("Rarest:          {} ({} items)\n", category.rarestValue,
                           category.rarestCount);
        out << fmt::format("Most common:     {} ({} items)\n", category.mostCommonValue,
                           category.mostCommonCount);
    }
}

void writeSummaryJson(std::ostream& out, const catalog::CollectionSummary& summary) {
    Json categories = Json::array();
    for (const auto& category : summary.categories) {
        categories.push_back({
            {"name", category.name},
            {"distinctValues", category.distinctValues},
            {"itemsWithCategory", category.itemsWithCategory},
            {"itemsMissing", category.itemsMissing},
            {"rarest", {{"value", category.rarestValue}, {"count", category.rarestCount}}},
            {"mostCommon",
             {{"value", category.mostCommonValue}, {"count", category.mostCommonCount}}},
        });
    }

    const Json document = {
        {"totalItems", summary.totalItems},
        {"categories", std::move(categories)},
    };
    writeDocument(out, document);
}

}  // namespace rarity::report
