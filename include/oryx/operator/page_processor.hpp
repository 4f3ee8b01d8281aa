#pragma once

#include <oryx/codegen/page_function.hpp>
#include <oryx/core/page.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace oryx::operator_ {

/// Column-at-a-time filter and projection over whole pages.
///
/// The filter (optional) runs first; every projection is then evaluated over
/// the selected positions. Output is split into pages of at most
/// `max_batch_size` rows with one channel per projection, in order.
class PageProcessor {
   public:
    static constexpr std::size_t kDefaultMaxBatchSize = 8192;

    /// `filter` may be null (every row selected). Throws std::invalid_argument
    /// for a null projection or a zero batch size.
    PageProcessor(std::unique_ptr<codegen::PageFilter> filter,
                  std::vector<std::unique_ptr<codegen::PageProjection>> projections,
                  std::size_t max_batch_size = kDefaultMaxBatchSize);

    /// Empty when no row is selected.
    [[nodiscard]] auto process(const Page& page) -> std::vector<Page>;

    [[nodiscard]] auto has_filter() const noexcept -> bool { return filter_ != nullptr; }
    /// Null when constructed without a filter.
    [[nodiscard]] auto filter() const noexcept -> const codegen::PageFilter* {
        return filter_.get();
    }
    [[nodiscard]] auto projection_count() const noexcept -> std::size_t {
        return projections_.size();
    }
    [[nodiscard]] auto max_batch_size() const noexcept -> std::size_t { return max_batch_size_; }

    [[nodiscard]] auto input_positions() const noexcept -> std::size_t { return input_positions_; }
    [[nodiscard]] auto output_positions() const noexcept -> std::size_t {
        return output_positions_;
    }

   private:
    std::unique_ptr<codegen::PageFilter> filter_;
    std::vector<std::unique_ptr<codegen::PageProjection>> projections_;
    std::size_t max_batch_size_;
    std::size_t input_positions_ = 0;
    std::size_t output_positions_ = 0;
};

}  // namespace oryx::operator_
