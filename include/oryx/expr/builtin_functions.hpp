#pragma once

#include <oryx/expr/arithmetic.hpp>
#include <oryx/expr/function_registry.hpp>

#include <optional>
#include <string_view>

namespace oryx::expr {

/// Register the builtin scalar functions:
///   add, subtract, multiply, divide, modulus  (bigint/double, mixed -> double)
///   negate, abs
///   equal, not_equal, less_than, less_than_or_equal, greater_than,
///   greater_than_or_equal                     (numeric, varchar, boolean)
///   length, lower, upper, concat              (varchar)
void register_builtin_functions(FunctionRegistry& registry);

/// A registry holding just the builtins.
[[nodiscard]] auto builtin_function_registry() -> FunctionRegistry;

/// Map a builtin function name to its operator, if it is one.
[[nodiscard]] auto arithmetic_op_of(std::string_view name) noexcept -> std::optional<ArithmeticOp>;
[[nodiscard]] auto compare_op_of(std::string_view name) noexcept -> std::optional<CompareOp>;

}  // namespace oryx::expr
