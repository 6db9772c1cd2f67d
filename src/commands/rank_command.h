// =============================================================================
// rarity-core - Rank Command
// =============================================================================
// Command handler that loads a trait table, runs the rarity pipeline and
// prints every item with its rank, total rarity and per-trait contributions.
// =============================================================================

#ifndef RARITY_COMMANDS_RANK_COMMAND_H
#define RARITY_COMMANDS_RANK_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "rarity/common/error.h"
#include "rarity/common/types.h"
#include "rarity/ranking/sort_view.h"
#include "rarity/scoring/rarity_scorer.h"

namespace rarity::commands {

// =============================================================================
// Rank Options
// =============================================================================

/// @brief Configuration options for the rank command.
struct RankOptions {
    /// @brief Input trait table ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output ordering.
    ranking::SortMode sortMode = ranking::SortMode::kMostRare;

    /// @brief Scoring model.
    scoring::ScoringModelKind model = scoring::ScoringModelKind::kStatistical;

    /// @brief Number of threads (0 = auto).
    std::size_t threads = 0;

    /// @brief Decimals for rarity values.
    int precision = kDefaultDisplayPrecision;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Omit per-trait contributions.
    bool totalsOnly = false;
};

// =============================================================================
// RankCommand Class
// =============================================================================

/// @brief Command handler for ranking a collection.
class RankCommand {
public:
    explicit RankCommand(RankOptions options);

    ~RankCommand();

    // Non-copyable, movable
    RankCommand(const RankCommand&) = delete;
    RankCommand& operator=(const RankCommand&) = delete;
    RankCommand(RankCommand&&) noexcept;
    RankCommand& operator=(RankCommand&&) noexcept;

    /// @brief Execute the rank command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const RankOptions& options() const noexcept { return options_; }

private:
    RankOptions options_;
};

/// @brief Create a rank command from CLI options.
[[nodiscard]] std::unique_ptr<RankCommand> createRankCommand(RankOptions options);

}  // namespace rarity::commands

#endif  // RARITY_COMMANDS_RANK_COMMAND_H
