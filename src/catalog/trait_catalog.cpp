// =============================================================================
// rarity-core - Trait Catalog Implementation
// =============================================================================

#include "rarity/catalog/trait_catalog.h"

#include <optional>
#include <utility>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>
#include <tbb/task_arena.h>

#include "rarity/common/logger.h"

namespace rarity::catalog {

// =============================================================================
// TraitCatalog Implementation
// =============================================================================

std::vector<std::string> TraitCatalog::categoryNames() const {
    std::vector<std::string> names;
    names.reserve(categories_.size());
    for (const auto& [name, counts] : categories_) {
        names.push_back(name);
    }
    return names;
}

const ValueCounts* TraitCatalog::findCategory(std::string_view category) const noexcept {
    auto it = categories_.find(category);
    return it != categories_.end() ? &it->second : nullptr;
}

ItemCount TraitCatalog::valueCount(std::string_view category,
                                   std::string_view value) const noexcept {
    const ValueCounts* counts = findCategory(category);
    if (counts == nullptr) {
        return 0;
    }
    auto it = counts->find(value);
    return it != counts->end() ? it->second : 0;
}

ItemCount TraitCatalog::itemsWithCategory(std::string_view category) const noexcept {
    auto it = carriers_.find(category);
    return it != carriers_.end() ? it->second : 0;
}

ItemCount TraitCatalog::itemsWithTraitCount(std::size_t traitCount) const noexcept {
    auto it = traitCounts_.find(traitCount);
    return it != traitCounts_.end() ? it->second : 0;
}

// =============================================================================
// CatalogBuilder Implementation
// =============================================================================

VoidResult CatalogBuilder::add(const Item& item) {
    if (auto duplicate = item.findDuplicateCategory()) {
        return makeVoidError(
            ErrorCode::kDataError,
            fmt::format("category \"{}\" is listed more than once", *duplicate),
            ErrorContext{}.withItem(item.id.toString()).withCategory(std::string(*duplicate)));
    }

    for (const auto& trait : item.traits) {
        ++catalog_.categories_[trait.category][trait.value];
        ++catalog_.carriers_[trait.category];
    }
    ++catalog_.traitCounts_[item.traitCount()];
    ++catalog_.totalItems_;
    return makeVoidSuccess();
}

void CatalogBuilder::merge(const CatalogBuilder& other) {
    for (const auto& [category, counts] : other.catalog_.categories_) {
        ValueCounts& target = catalog_.categories_[category];
        for (const auto& [value, count] : counts) {
            target[value] += count;
        }
    }
    for (const auto& [category, count] : other.catalog_.carriers_) {
        catalog_.carriers_[category] += count;
    }
    for (const auto& [traitCount, count] : other.catalog_.traitCounts_) {
        catalog_.traitCounts_[traitCount] += count;
    }
    catalog_.totalItems_ += other.catalog_.totalItems_;
}

Result<TraitCatalog> CatalogBuilder::build() const {
    if (catalog_.totalItems_ == 0) {
        return makeError<TraitCatalog>(ErrorCode::kEmptyCollection,
                                       "rarity is undefined for a collection without items");
    }
    return catalog_;
}

// =============================================================================
// CatalogBuildConfig Implementation
// =============================================================================

VoidResult CatalogBuildConfig::validate() const {
    if (grainSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "grainSize must be > 0");
    }
    return makeVoidSuccess();
}

// =============================================================================
// Parallel Reduction
// =============================================================================

namespace {

/// @brief parallel_reduce body: one sub-catalog per task, merged on join.
/// @note Keeps only the error with the lowest item position so the reported
///       failure does not depend on scheduling.
class CatalogReduceBody {
public:
    explicit CatalogReduceBody(std::span<const Item> items) : items_(items) {}

    CatalogReduceBody(CatalogReduceBody& other, tbb::split) : items_(other.items_) {}

    void operator()(const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
            if (firstError_.has_value() && firstError_->first < i) {
                return;
            }
            auto added = builder_.add(items_[i]);
            if (!added) {
                keepError(i, std::move(added.error()));
            }
        }
    }

    void join(CatalogReduceBody& rhs) {
        builder_.merge(rhs.builder_);
        if (rhs.firstError_.has_value()) {
            keepError(rhs.firstError_->first, std::move(rhs.firstError_->second));
        }
    }

    [[nodiscard]] const CatalogBuilder& builder() const noexcept { return builder_; }

    [[nodiscard]] std::optional<std::pair<std::size_t, Error>>& firstError() noexcept {
        return firstError_;
    }

private:
    void keepError(std::size_t position, Error error) {
        if (!firstError_.has_value() || position < firstError_->first) {
            firstError_.emplace(position, std::move(error));
        }
    }

    std::span<const Item> items_;
    CatalogBuilder builder_;
    std::optional<std::pair<std::size_t, Error>> firstError_;
};

Result<TraitCatalog> buildSequential(std::span<const Item> items) {
    CatalogBuilder builder;
    for (const auto& item : items) {
        auto added = builder.add(item);
        if (!added) {
            return makeError<TraitCatalog>(std::move(added.error()));
        }
    }
    return builder.build();
}

Result<TraitCatalog> buildParallel(std::span<const Item> items, const CatalogBuildConfig& config) {
    CatalogReduceBody body(items);
    auto reduce = [&]() {
        tbb::parallel_reduce(tbb::blocked_range<std::size_t>(0, items.size(), config.grainSize),
                             body);
    };

    if (config.numThreads > 1) {
        tbb::task_arena arena(static_cast<int>(config.numThreads));
        arena.execute(reduce);
    } else {
        reduce();
    }

    if (body.firstError().has_value()) {
        return makeError<TraitCatalog>(std::move(body.firstError()->second));
    }
    return body.builder().build();
}

}  // namespace

// =============================================================================
// Build Functions
// =============================================================================

Result<TraitCatalog> buildCatalog(std::span<const Item> items, const CatalogBuildConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return makeError<TraitCatalog>(std::move(valid.error()));
    }

    if (items.empty()) {
        return makeError<TraitCatalog>(ErrorCode::kEmptyCollection,
                                       "rarity is undefined for a collection without items");
    }

    const bool sequential = config.numThreads == 1 || items.size() <= config.grainSize;
    auto result = sequential ? buildSequential(items) : buildParallel(items, config);

    if (result) {
        RARITY_LOG_DEBUG("Catalog built: {} items, {} categories ({})", result->totalItems(),
                         result->categoryCount(), sequential ? "sequential" : "parallel");
    }
    return result;
}

}  // namespace rarity::catalog
