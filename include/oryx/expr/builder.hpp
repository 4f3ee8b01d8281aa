#pragma once

#include <oryx/expr/expression.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace oryx::expr {

// ─── Leaves ───────────────────────────────────────────────────────────────────
//  Convenience factories for building expression trees in tests, tools and
//  callers that do not have a planner of their own.

[[nodiscard]] auto field(std::int32_t channel, ScalarType type) -> RowExpressionPtr;
[[nodiscard]] auto constant(Value value, ScalarType type) -> RowExpressionPtr;
[[nodiscard]] auto boolean(bool v) -> RowExpressionPtr;
[[nodiscard]] auto bigint(std::int64_t v) -> RowExpressionPtr;
[[nodiscard]] auto dbl(double v) -> RowExpressionPtr;
[[nodiscard]] auto varchar(std::string v) -> RowExpressionPtr;
[[nodiscard]] auto null_of(ScalarType type) -> RowExpressionPtr;

// ─── Calls and special forms ──────────────────────────────────────────────────

[[nodiscard]] auto call(std::string name, ScalarType type, std::vector<RowExpressionPtr> args)
    -> RowExpressionPtr;

[[nodiscard]] auto and_(RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr;
[[nodiscard]] auto or_(RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr;
[[nodiscard]] auto not_(RowExpressionPtr operand) -> RowExpressionPtr;
[[nodiscard]] auto is_null(RowExpressionPtr operand) -> RowExpressionPtr;
/// A null `else_value` builds the two-argument form (NULL when the condition fails).
[[nodiscard]] auto if_(RowExpressionPtr condition, RowExpressionPtr then_value,
                       RowExpressionPtr else_value = nullptr) -> RowExpressionPtr;
[[nodiscard]] auto coalesce(ScalarType type, std::vector<RowExpressionPtr> args)
    -> RowExpressionPtr;
[[nodiscard]] auto special(Form form, ScalarType type, std::vector<RowExpressionPtr> args)
    -> RowExpressionPtr;

// ─── Common calls ─────────────────────────────────────────────────────────────
//  Result types follow the builtin signatures: comparisons are boolean,
//  arithmetic is bigint when both sides are bigint and double otherwise.

[[nodiscard]] auto compare(std::string name, RowExpressionPtr l, RowExpressionPtr r)
    -> RowExpressionPtr;
[[nodiscard]] auto arithmetic(std::string name, RowExpressionPtr l, RowExpressionPtr r)
    -> RowExpressionPtr;

}  // namespace oryx::expr
