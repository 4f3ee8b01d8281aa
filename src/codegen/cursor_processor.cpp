#include <oryx/codegen/cursor_processor.hpp>

#include <fmt/format.h>

#include <atomic>

namespace oryx::codegen {

namespace {

std::atomic<std::uint64_t> g_class_counter{0};

}  // namespace

auto make_class_name(std::string_view prefix) -> std::string {
    return fmt::format("{}_{}", prefix, g_class_counter.fetch_add(1, std::memory_order_relaxed));
}

CompiledCursorProcessor::CompiledCursorProcessor(std::string class_name,
                                                 expr::RowExpressionPtr filter,
                                                 std::vector<expr::RowExpressionPtr> projections)
    : class_name_(std::move(class_name)),
      filter_(std::move(filter)),
      projections_(std::move(projections)) {
    description_ = fmt::format("{}{{filter={}, projections={}}}", class_name_,
                               filter_ ? filter_->to_string() : "null",
                               expr::format_list(projections_));
}

}  // namespace oryx::codegen
