// =============================================================================
// rarity-core - Summary Command
// =============================================================================
// Command handler that prints collection statistics: item count and, per
// category, value counts and the rarest and most common values.
// =============================================================================

#ifndef RARITY_COMMANDS_SUMMARY_COMMAND_H
#define RARITY_COMMANDS_SUMMARY_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "rarity/common/error.h"

namespace rarity::commands {

/// @brief Configuration options for the summary command.
struct SummaryOptions {
    /// @brief Input trait table ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Number of threads (0 = auto).
    std::size_t threads = 0;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Command handler for summarizing a collection.
class SummaryCommand {
public:
    explicit SummaryCommand(SummaryOptions options);

    ~SummaryCommand();

    // Non-copyable, movable
    SummaryCommand(const SummaryCommand&) = delete;
    SummaryCommand& operator=(const SummaryCommand&) = delete;
    SummaryCommand(SummaryCommand&&) noexcept;
    SummaryCommand& operator=(SummaryCommand&&) noexcept;

    /// @brief Execute the summary command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const SummaryOptions& options() const noexcept { return options_; }

private:
    SummaryOptions options_;
};

/// @brief Create a summary command from CLI options.
[[nodiscard]] std::unique_ptr<SummaryCommand> createSummaryCommand(const std::string& inputPath,
                                                                   std::size_t threads,
                                                                   bool jsonOutput);

}  // namespace rarity::commands

#endif  // RARITY_COMMANDS_SUMMARY_COMMAND_H
