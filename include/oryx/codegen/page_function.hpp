#pragma once

#include <oryx/core/page.hpp>
#include <oryx/expr/expression.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace oryx::codegen {

// ─── Instances ────────────────────────────────────────────────────────────────
//  Column-at-a-time evaluators. Like CursorProcessor, instances are stateful
//  and owned by a single execution.

class PageFilter {
   public:
    PageFilter() = default;
    virtual ~PageFilter() = default;

    PageFilter(const PageFilter&) = delete;
    auto operator=(const PageFilter&) -> PageFilter& = delete;

    /// Positions of `page` for which the filter is TRUE (NULL and FALSE reject).
    [[nodiscard]] virtual auto filter(const Page& page) -> SelectedPositions = 0;

    [[nodiscard]] virtual auto input_channels() const noexcept
        -> std::span<const std::int32_t> = 0;

    /// Positions examined by this instance so far.
    [[nodiscard]] virtual auto processed_positions() const noexcept -> std::size_t = 0;
};

class PageProjection {
   public:
    PageProjection() = default;
    virtual ~PageProjection() = default;

    PageProjection(const PageProjection&) = delete;
    auto operator=(const PageProjection&) -> PageProjection& = delete;

    /// Evaluate the projection at `positions`; the block has one entry per position.
    [[nodiscard]] virtual auto project(const Page& page, std::span<const std::int32_t> positions)
        -> std::shared_ptr<const Block> = 0;

    [[nodiscard]] virtual auto type() const noexcept -> ScalarType = 0;

    [[nodiscard]] virtual auto input_channels() const noexcept
        -> std::span<const std::int32_t> = 0;
};

// ─── Compiled artifacts ───────────────────────────────────────────────────────

class CompiledPageFilter {
   public:
    virtual ~CompiledPageFilter() = default;

    [[nodiscard]] virtual auto new_instance() const -> std::unique_ptr<PageFilter> = 0;
    [[nodiscard]] virtual auto filter() const noexcept -> const expr::RowExpressionPtr& = 0;
    [[nodiscard]] virtual auto input_channels() const noexcept
        -> std::span<const std::int32_t> = 0;
};

class CompiledPageProjection {
   public:
    virtual ~CompiledPageProjection() = default;

    [[nodiscard]] virtual auto new_instance() const -> std::unique_ptr<PageProjection> = 0;
    [[nodiscard]] virtual auto projection() const noexcept -> const expr::RowExpressionPtr& = 0;
    [[nodiscard]] virtual auto input_channels() const noexcept
        -> std::span<const std::int32_t> = 0;
};

/// Column-oriented code generation backend. Each filter and projection is
/// compiled independently. Reports failures by throwing.
class PageFunctionGenerator {
   public:
    virtual ~PageFunctionGenerator() = default;

    [[nodiscard]] virtual auto compile_filter(const expr::RowExpressionPtr& filter)
        -> std::shared_ptr<const CompiledPageFilter> = 0;

    [[nodiscard]] virtual auto compile_projection(const expr::RowExpressionPtr& projection)
        -> std::shared_ptr<const CompiledPageProjection> = 0;
};

}  // namespace oryx::codegen
