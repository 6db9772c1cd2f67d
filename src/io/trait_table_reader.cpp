// =============================================================================
// rarity-core - Trait Table Reader Implementation
// =============================================================================

#include "rarity/io/trait_table_reader.h"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <iostream>
#include <map>
#include <system_error>

#include <fmt/format.h>

#include "rarity/common/logger.h"

namespace rarity::io {

namespace {

/// @brief Split a line on the field separator.
std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = line.find(kFieldSeparator, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

/// @brief Numeric text: digits plus sign, decimal point and exponent only.
[[nodiscard]] bool looksNumeric(std::string_view text) noexcept {
    const bool hasDigit = std::any_of(text.begin(), text.end(),
                                      [](char c) { return c >= '0' && c <= '9'; });
    const bool onlyNumeric = std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' ||
               c == 'E';
    });
    return hasDigit && onlyNumeric;
}

template <typename T>
[[nodiscard]] bool parseWhole(std::string_view text, T& out) noexcept {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

}  // namespace

// =============================================================================
// Field Interpretation
// =============================================================================

RawTraitValue parseRawTraitValue(std::string_view text) {
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    // A number is kept only when it prints back to the same text; "007" or
    // digit strings beyond int64 stay strings so distinct values never merge
    if (looksNumeric(text)) {
        std::int64_t integer = 0;
        if (parseWhole(text, integer)) {
            RawTraitValue parsed = integer;
            if (normalizeTraitValue(parsed) == text) {
                return parsed;
            }
        } else {
            double real = 0.0;
            if (parseWhole(text, real)) {
                RawTraitValue parsed = real;
                if (normalizeTraitValue(parsed) == text) {
                    return parsed;
                }
            }
        }
    }
    return std::string(text);
}

ExternalId parseExternalId(std::string_view text) {
    const std::string_view digits = (!text.empty() && text.front() == '-') ? text.substr(1) : text;
    const bool allDigits = !digits.empty() && std::all_of(digits.begin(), digits.end(), [](char c) {
        return c >= '0' && c <= '9';
    });

    std::int64_t serial = 0;
    if (allDigits && parseWhole(text, serial) && fmt::format("{}", serial) == text) {
        return ExternalId(serial);
    }
    return ExternalId(std::string(text));
}

// =============================================================================
// TraitTableReader Implementation
// =============================================================================

TraitTableReader::TraitTableReader(std::filesystem::path filePath)
    : filePath_(std::move(filePath)), sourceName_(filePath_.string()) {}

TraitTableReader::TraitTableReader(std::unique_ptr<std::istream> stream, std::string sourceName)
    : sourceName_(std::move(sourceName)), stream_(std::move(stream)) {}

TraitTableReader::~TraitTableReader() = default;

TraitTableReader::TraitTableReader(TraitTableReader&&) noexcept = default;
TraitTableReader& TraitTableReader::operator=(TraitTableReader&&) noexcept = default;

VoidResult TraitTableReader::open() {
    if (stream_) {
        return makeVoidSuccess();
    }

    if (filePath_ == "-") {
        stream_ = std::make_unique<std::istream>(std::cin.rdbuf());
        RARITY_LOG_DEBUG("Reading trait table from stdin");
        return makeVoidSuccess();
    }

    auto fileStream = std::make_unique<std::ifstream>(filePath_);
    if (!fileStream->is_open()) {
        const std::error_code ec(errno, std::generic_category());
        ErrorContext context;
        context.withFile(sourceName_);
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to open trait table: {}", ec.message()),
                             context);
    }
    stream_ = std::move(fileStream);
    RARITY_LOG_DEBUG("Opened trait table: {}", sourceName_);
    return makeVoidSuccess();
}

Result<std::vector<Item>> TraitTableReader::readAll() {
    if (auto opened = open(); !opened) {
        return makeError<std::vector<Item>>(std::move(opened.error()));
    }

    stats_ = TraitTableStats{};
    std::vector<Item> items;
    std::map<ExternalId, std::size_t> positions;

    auto formatError = [this](std::string message) {
        ErrorContext context;
        context.withFile(sourceName_).withLine(stats_.linesRead);
        return makeError<std::vector<Item>>(ErrorCode::kFormatError, std::move(message), context);
    };

    std::string line;
    while (std::getline(*stream_, line)) {
        ++stats_.linesRead;

        std::string_view view(line);
        if (!view.empty() && view.back() == '\r') {
            view.remove_suffix(1);
        }
        if (view.empty() || view.front() == kCommentMarker) {
            continue;
        }

        const auto fields = splitFields(view);
        if (fields.size() > 3) {
            return formatError(fmt::format("expected at most 3 fields, found {}", fields.size()));
        }
        if (fields[0].empty()) {
            return formatError("missing item id");
        }

        const ExternalId id = parseExternalId(fields[0]);
        auto [position, inserted] = positions.try_emplace(id, items.size());
        if (inserted) {
            items.push_back(Item{id, {}});
        }
        Item& item = items[position->second];

        const std::string_view category = fields.size() > 1 ? fields[1] : std::string_view{};
        const std::string_view value = fields.size() > 2 ? fields[2] : std::string_view{};

        if (category.empty()) {
            if (!value.empty()) {
                return formatError("value given without a category");
            }
            continue;
        }
        if (fields.size() < 3) {
            return formatError(fmt::format("category \"{}\" has no value field", category));
        }

        item.addTrait(std::string(category), parseRawTraitValue(value));
        ++stats_.traitsRead;
    }

    if (stream_->bad()) {
        ErrorContext context;
        context.withFile(sourceName_).withLine(stats_.linesRead);
        return makeError<std::vector<Item>>(ErrorCode::kIOError, "failed to read trait table",
                                            context);
    }

    stats_.itemsRead = items.size();
    RARITY_LOG_DEBUG("Read {} traits of {} items from {}", stats_.traitsRead, stats_.itemsRead,
                     sourceName_);
    return items;
}

}  // namespace rarity::io
