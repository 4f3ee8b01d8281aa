#pragma once

#include <oryx/core/page.hpp>
#include <oryx/cursor/record_cursor.hpp>
#include <oryx/expr/expression.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace oryx::codegen {

struct CursorProcessorOutput {
    std::size_t processed_positions = 0;
    /// True when the cursor is exhausted; false when the page builder filled up.
    bool finished = false;
};

/// A row-at-a-time filter and projection evaluator.
///
/// Instances are stateful (register file, counters) and must only be used
/// by one execution at a time. Obtain a fresh instance per split.
class CursorProcessor {
   public:
    CursorProcessor() = default;
    virtual ~CursorProcessor() = default;

    CursorProcessor(const CursorProcessor&) = delete;
    auto operator=(const CursorProcessor&) -> CursorProcessor& = delete;

    /// Advance `cursor` until it is exhausted or `page_builder` is full,
    /// appending one output row (one value per projection) for every row
    /// that passes the filter.
    [[nodiscard]] virtual auto process(cursor::RecordCursor& cursor, PageBuilder& page_builder)
        -> CursorProcessorOutput = 0;

    /// Rows read by this instance so far.
    [[nodiscard]] virtual auto processed_positions() const noexcept -> std::size_t = 0;

    /// Diagnostic rendering of the compiled filter and projections.
    [[nodiscard]] virtual auto to_string() const -> std::string = 0;
};

/// The compiled artifact for a filter and projection list.
///
/// Immutable once generated and shared read-only by the cache and every
/// factory holding it; new_instance() produces independent processors.
class CompiledCursorProcessor {
   public:
    CompiledCursorProcessor(std::string class_name, expr::RowExpressionPtr filter,
                            std::vector<expr::RowExpressionPtr> projections);
    virtual ~CompiledCursorProcessor() = default;

    CompiledCursorProcessor(const CompiledCursorProcessor&) = delete;
    auto operator=(const CompiledCursorProcessor&) -> CompiledCursorProcessor& = delete;

    /// Construct a fresh processor. May throw if resources are exhausted.
    [[nodiscard]] virtual auto new_instance() const -> std::unique_ptr<CursorProcessor> = 0;

    [[nodiscard]] auto class_name() const noexcept -> const std::string& { return class_name_; }
    [[nodiscard]] auto filter() const noexcept -> const expr::RowExpressionPtr& { return filter_; }
    [[nodiscard]] auto projections() const noexcept -> const std::vector<expr::RowExpressionPtr>& {
        return projections_;
    }

    /// `CursorProcessor_3{filter=..., projections=[...]}`
    [[nodiscard]] auto to_string() const noexcept -> const std::string& { return description_; }

   private:
    std::string class_name_;
    expr::RowExpressionPtr filter_;
    std::vector<expr::RowExpressionPtr> projections_;
    std::string description_;
};

/// Row-oriented code generation backend.
class CursorCodeGenerator {
   public:
    virtual ~CursorCodeGenerator() = default;

    /// Generate a processor for `filter` (always present; callers substitute
    /// constant true) and `projections`. Reports failures by throwing.
    [[nodiscard]] virtual auto generate(const expr::RowExpressionPtr& filter,
                                        std::span<const expr::RowExpressionPtr> projections)
        -> std::shared_ptr<const CompiledCursorProcessor> = 0;
};

/// Unique generated class name: `<prefix>_<n>`.
[[nodiscard]] auto make_class_name(std::string_view prefix) -> std::string;

}  // namespace oryx::codegen
