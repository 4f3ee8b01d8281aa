#include <oryx/core/error.hpp>
#include <oryx/operator/page_processor.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace oryx::operator_ {

PageProcessor::PageProcessor(std::unique_ptr<codegen::PageFilter> filter,
                             std::vector<std::unique_ptr<codegen::PageProjection>> projections,
                             std::size_t max_batch_size)
    : filter_(std::move(filter)),
      projections_(std::move(projections)),
      max_batch_size_(max_batch_size) {
    if (max_batch_size_ == 0) {
        throw std::invalid_argument("page processor batch size must be positive");
    }
    for (std::size_t i = 0; i < projections_.size(); ++i) {
        if (projections_[i] == nullptr) {
            throw std::invalid_argument(fmt::format("page processor projection {} is null", i));
        }
    }
}

auto PageProcessor::process(const Page& page) -> std::vector<Page> {
    input_positions_ += page.position_count();

    SelectedPositions selected;
    if (filter_ != nullptr) {
        selected = filter_->filter(page);
    } else {
        selected.resize(page.position_count());
        std::iota(selected.begin(), selected.end(), 0);
    }
    if (selected.empty()) {
        return {};
    }

    std::vector<Page> output;
    output.reserve((selected.size() + max_batch_size_ - 1) / max_batch_size_);
    const std::span<const std::int32_t> all{selected};
    for (std::size_t start = 0; start < all.size(); start += max_batch_size_) {
        const auto batch = all.subspan(start, std::min(max_batch_size_, all.size() - start));
        std::vector<std::shared_ptr<const Block>> blocks;
        blocks.reserve(projections_.size());
        for (std::size_t channel = 0; channel < projections_.size(); ++channel) {
            auto block = projections_[channel]->project(page, batch);
            if (block == nullptr || block->size() != batch.size()) {
                throw OryxException(
                    ErrorCode::InvalidInput,
                    fmt::format("projection {} produced {} positions, expected {}", channel,
                                block == nullptr ? 0 : block->size(), batch.size()));
            }
            blocks.push_back(std::move(block));
        }
        output.emplace_back(batch.size(), std::move(blocks));
        output_positions_ += batch.size();
    }
    return output;
}

}  // namespace oryx::operator_
