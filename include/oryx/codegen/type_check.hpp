#pragma once

#include <oryx/expr/expression.hpp>
#include <oryx/expr/function_registry.hpp>

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <vector>

namespace oryx::codegen {

/// Failure raised by the reference backends while generating code.
///
/// Backend-specific: the expression compiler never lets it escape and
/// reports a CompilationError instead.
class CodeGenerationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// Validate an expression tree before code generation: every call resolves
/// in `functions` with the declared return type, special forms have the
/// right arity and argument types, constants match their types.
[[nodiscard]] auto check_expression(const expr::RowExpression& expression,
                                    const expr::FunctionRegistry& functions)
    -> std::expected<void, std::string>;

/// check_expression() plus a boolean result type.
[[nodiscard]] auto check_filter(const expr::RowExpression& filter,
                                const expr::FunctionRegistry& functions)
    -> std::expected<void, std::string>;

/// Sorted, distinct channels referenced by the expression.
[[nodiscard]] auto input_channels(const expr::RowExpression& expression)
    -> std::vector<std::int32_t>;

}  // namespace oryx::codegen
