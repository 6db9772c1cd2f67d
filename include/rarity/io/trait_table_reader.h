// =============================================================================
// rarity-core - Trait Table Reader
// =============================================================================
// Loads a collection from a tab-separated trait table for the command-line
// tool. Each line carries one trait of one item:
//
//   <id> TAB <category> TAB <value>
//
// - A line holding only an id declares an item without traits
// - Blank lines and lines starting with '#' are ignored
// - Items are returned in order of first mention
// - Ids made of decimal digits (optional leading '-') are integer ids,
//   unless they carry leading zeros or overflow int64
// - Values "true"/"false" are booleans, numeric text in canonical form is
//   a number, anything else (including "007" or "2.0") is a string
//
// The same category listed twice for one id is passed through unchanged so
// the catalog builder can report it as a data error.
//
// Usage:
//   TraitTableReader reader("/path/to/collection.tsv");
//   auto items = reader.readAll();
// =============================================================================

#ifndef RARITY_IO_TRAIT_TABLE_READER_H
#define RARITY_IO_TRAIT_TABLE_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rarity/common/error.h"
#include "rarity/common/types.h"

namespace rarity::io {

/// @brief Field separator of the trait table.
inline constexpr char kFieldSeparator = '\t';

/// @brief Comment marker at the start of a line.
inline constexpr char kCommentMarker = '#';

/// @brief Statistics collected while reading.
struct TraitTableStats {
    /// @brief Physical lines read (including blank and comment lines).
    std::uint64_t linesRead = 0;

    /// @brief Trait lines accepted.
    std::uint64_t traitsRead = 0;

    /// @brief Distinct items found.
    std::uint64_t itemsRead = 0;
};

/// @brief Reader for tab-separated trait tables.
class TraitTableReader {
public:
    /// @brief Read from a file ("-" reads standard input).
    explicit TraitTableReader(std::filesystem::path filePath);

    /// @brief Read from an already opened stream.
    explicit TraitTableReader(std::unique_ptr<std::istream> stream,
                              std::string sourceName = "<stream>");

    ~TraitTableReader();

    // Non-copyable, movable
    TraitTableReader(const TraitTableReader&) = delete;
    TraitTableReader& operator=(const TraitTableReader&) = delete;
    TraitTableReader(TraitTableReader&&) noexcept;
    TraitTableReader& operator=(TraitTableReader&&) noexcept;

    /// @brief Read the whole table.
    /// @return Items in order of first mention, IOError if the source cannot
    ///         be opened, or FormatError naming the offending line.
    [[nodiscard]] Result<std::vector<Item>> readAll();

    /// @brief Statistics of the last readAll() call.
    [[nodiscard]] const TraitTableStats& stats() const noexcept { return stats_; }

private:
    [[nodiscard]] VoidResult open();

    std::filesystem::path filePath_;
    std::string sourceName_;
    std::unique_ptr<std::istream> stream_;
    TraitTableStats stats_;
};

/// @brief Interpret the text of a value field.
[[nodiscard]] RawTraitValue parseRawTraitValue(std::string_view text);

/// @brief Interpret the text of an id field.
[[nodiscard]] ExternalId parseExternalId(std::string_view text);

}  // namespace rarity::io

#endif  // RARITY_IO_TRAIT_TABLE_READER_H
