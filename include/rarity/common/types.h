// =============================================================================
// rarity-core - Common Type Definitions
// =============================================================================
// Core type definitions for the rarity-core library.
//
// This module defines:
// - ExternalId: integer or string identifier of an item, totally ordered
// - RawTraitValue: trait value as delivered upstream (string/number/bool)
// - TraitEntry: one (category, normalized value) pair
// - Item: an external id plus the trait entries of one NFT
// - ItemCount, Rank: Type aliases for counters and ranks
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef RARITY_COMMON_TYPES_H
#define RARITY_COMMON_TYPES_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rarity {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Number of items (collection size, occurrence counts).
using ItemCount = std::uint64_t;

/// @brief Dense 1-based rank; 0 means "not ranked yet".
using Rank = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Rank value carried by an ItemRarity before ranking.
inline constexpr Rank kUnranked = 0;

/// @brief Number of decimals used when displaying rarity values.
inline constexpr int kDefaultDisplayPrecision = 4;

/// @brief Largest accepted display precision.
inline constexpr int kMaxDisplayPrecision = 12;

// =============================================================================
// Natural String Ordering
// =============================================================================

/// @brief Compare two strings treating embedded digit runs as numbers.
/// @note "item2" < "item10". Letters compare case-insensitively first; strings
///       that are still equivalent are ordered byte-wise, so the result is
///       a strict total order consistent with string equality.
[[nodiscard]] std::strong_ordering naturalCompare(std::string_view lhs,
                                                  std::string_view rhs) noexcept;

// =============================================================================
// External Identifier
// =============================================================================

/// @brief Stable identifier of an item (serial number or string name).
/// @note Ordering: all integer ids precede all string ids; integers compare
///       numerically and strings with naturalCompare().
class ExternalId {
public:
    /// @brief Default id (integer 0).
    ExternalId() noexcept : value_(std::int64_t{0}) {}

    /// @brief Construct an integer id.
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    ExternalId(T serial) noexcept : value_(static_cast<std::int64_t>(serial)) {}

    /// @brief Construct a string id.
    ExternalId(std::string name) : value_(std::move(name)) {}

    /// @brief Construct a string id from a literal.
    ExternalId(const char* name) : value_(std::string(name)) {}

    [[nodiscard]] bool isInteger() const noexcept {
        return std::holds_alternative<std::int64_t>(value_);
    }

    [[nodiscard]] bool isString() const noexcept {
        return std::holds_alternative<std::string>(value_);
    }

    /// @brief Integer value; only meaningful when isInteger().
    [[nodiscard]] std::int64_t asInteger() const noexcept {
        const auto* serial = std::get_if<std::int64_t>(&value_);
        return serial != nullptr ? *serial : 0;
    }

    /// @brief String value; empty unless isString().
    [[nodiscard]] std::string_view asString() const noexcept {
        const auto* name = std::get_if<std::string>(&value_);
        return name != nullptr ? std::string_view(*name) : std::string_view{};
    }

    /// @brief Display form used in reports and error messages.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] friend bool operator==(const ExternalId& lhs,
                                         const ExternalId& rhs) noexcept = default;

    [[nodiscard]] friend std::strong_ordering operator<=>(const ExternalId& lhs,
                                                          const ExternalId& rhs) noexcept;

private:
    std::variant<std::int64_t, std::string> value_;
};

// =============================================================================
// Trait Values
// =============================================================================

/// @brief Trait value as received from the ingestion layer.
using RawTraitValue = std::variant<std::string, std::int64_t, double, bool>;

/// @brief Normalize a raw value into the canonical string key used for counting.
/// @note Booleans become "true"/"false", numbers use their shortest
///       round-trip decimal form (2.0 and 2 both become "2"), strings are kept.
[[nodiscard]] std::string normalizeTraitValue(const RawTraitValue& value);

/// @brief One trait of an item: category name and normalized value.
struct TraitEntry {
    std::string category;
    std::string value;

    [[nodiscard]] bool operator==(const TraitEntry& other) const = default;
};

// =============================================================================
// Item
// =============================================================================

/// @brief One NFT of a collection.
/// @note Traits keep the order they were delivered in. A well-formed item
///       lists each category at most once; duplicates are reported by the
///       catalog builder and the scorer as data errors.
struct Item {
    /// @brief Stable external identifier.
    ExternalId id;

    /// @brief Trait entries in arrival order.
    std::vector<TraitEntry> traits;

    /// @brief Append a trait, normalizing its value.
    Item& addTrait(std::string category, const RawTraitValue& value);

    /// @brief Look up the value of a category.
    /// @return The normalized value, or std::nullopt if the item lacks it.
    [[nodiscard]] std::optional<std::string_view> find(std::string_view category) const noexcept;

    /// @brief Check whether the item carries a category.
    [[nodiscard]] bool has(std::string_view category) const noexcept {
        return find(category).has_value();
    }

    /// @brief Number of trait entries.
    [[nodiscard]] std::size_t traitCount() const noexcept { return traits.size(); }

    /// @brief First category listed more than once, in arrival order.
    [[nodiscard]] std::optional<std::string_view> findDuplicateCategory() const noexcept;
};

}  // namespace rarity

#endif  // RARITY_COMMON_TYPES_H
