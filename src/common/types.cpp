// =============================================================================
// rarity-core - Common Type Implementation
// =============================================================================

#include "rarity/common/types.h"

#include <algorithm>
#include <cctype>
#include <type_traits>

#include <fmt/format.h>

namespace rarity {

namespace {

[[nodiscard]] bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] char foldCase(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

/// @brief Compare two digit runs by numeric value without converting them.
[[nodiscard]] std::strong_ordering compareDigitRuns(std::string_view lhs,
                                                    std::string_view rhs) noexcept {
    auto stripZeros = [](std::string_view run) {
        std::size_t pos = 0;
        while (pos + 1 < run.size() && run[pos] == '0') {
            ++pos;
        }
        return run.substr(pos);
    };

    const std::string_view a = stripZeros(lhs);
    const std::string_view b = stripZeros(rhs);
    if (a.size() != b.size()) {
        return a.size() <=> b.size();
    }
    const int cmp = a.compare(b);
    return cmp <=> 0;
}

}  // namespace

// =============================================================================
// Natural Ordering
// =============================================================================

std::strong_ordering naturalCompare(std::string_view lhs, std::string_view rhs) noexcept {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        if (isDigit(lhs[i]) && isDigit(rhs[j])) {
            std::size_t iEnd = i;
            std::size_t jEnd = j;
            while (iEnd < lhs.size() && isDigit(lhs[iEnd])) {
                ++iEnd;
            }
            while (jEnd < rhs.size() && isDigit(rhs[jEnd])) {
                ++jEnd;
            }
            const auto runOrder =
                compareDigitRuns(lhs.substr(i, iEnd - i), rhs.substr(j, jEnd - j));
            if (runOrder != std::strong_ordering::equal) {
                return runOrder;
            }
            i = iEnd;
            j = jEnd;
            continue;
        }

        const char a = foldCase(lhs[i]);
        const char b = foldCase(rhs[j]);
        if (a != b) {
            return static_cast<unsigned char>(a) <=> static_cast<unsigned char>(b);
        }
        ++i;
        ++j;
    }

    if (i < lhs.size() || j < rhs.size()) {
        return (lhs.size() - i) <=> (rhs.size() - j);
    }

    // Equivalent under natural ordering ("a01" vs "a1", "A" vs "a")
    const int cmp = lhs.compare(rhs);
    return cmp <=> 0;
}

// =============================================================================
// ExternalId Implementation
// =============================================================================

std::string ExternalId::toString() const {
    if (isInteger()) {
        return std::to_string(asInteger());
    }
    return std::string(asString());
}

std::strong_ordering operator<=>(const ExternalId& lhs, const ExternalId& rhs) noexcept {
    if (lhs.isInteger() != rhs.isInteger()) {
        return lhs.isInteger() ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    if (lhs.isInteger()) {
        return lhs.asInteger() <=> rhs.asInteger();
    }
    return naturalCompare(lhs.asString(), rhs.asString());
}

// =============================================================================
// Trait Value Normalization
// =============================================================================

std::string normalizeTraitValue(const RawTraitValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

// =============================================================================
// Item Implementation
// =============================================================================

Item& Item::addTrait(std::string category, const RawTraitValue& value) {
    traits.push_back(TraitEntry{std::move(category), normalizeTraitValue(value)});
    return *this;
}

std::optional<std::string_view> Item::find(std::string_view category) const noexcept {
    auto it = std::find_if(traits.begin(), traits.end(),
                           [category](const TraitEntry& t) { return t.category == category; });
    if (it == traits.end()) {
        return std::nullopt;
    }
    return std::string_view(it->value);
}

std::optional<std::string_view> Item::findDuplicateCategory() const noexcept {
    for (std::size_t i = 1; i < traits.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (traits[i].category == traits[j].category) {
                return std::string_view(traits[i].category);
            }
        }
    }
    return std::nullopt;
}

}  // namespace rarity
