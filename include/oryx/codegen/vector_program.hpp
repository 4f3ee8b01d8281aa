#pragma once

#include <oryx/codegen/page_function.hpp>
#include <oryx/expr/function_registry.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace oryx::codegen {

/// A compiled expression evaluated over a selection of page positions.
///
/// Returns a block with exactly `positions.size()` entries, entry i holding
/// the value at row `positions[i]`. Positions must be ascending and distinct.
using VectorFn =
    std::function<std::shared_ptr<const Block>(const Page&, std::span<const std::int32_t>)>;

/// Compile a type-checked expression into a VectorFn.
///
/// Arithmetic and comparison calls on builtin operator names run typed
/// kernels (with a column-versus-constant fast path); other calls fall back to
/// per-row invocation through the registry. AND, OR, IF and COALESCE narrow
/// the selection so later operands only see rows that still need them.
[[nodiscard]] auto compile_vector_function(const expr::RowExpression& expression,
                                           const expr::FunctionRegistry& functions) -> VectorFn;

/// Column backend built on compile_vector_function().
class VectorizedPageFunctionGenerator final : public PageFunctionGenerator {
   public:
    /// `functions` must outlive the generator; artifacts keep only the overloads they call.
    explicit VectorizedPageFunctionGenerator(const expr::FunctionRegistry& functions)
        : functions_(&functions) {}

    /// Throws CodeGenerationError when the expression fails to type-check.
    [[nodiscard]] auto compile_filter(const expr::RowExpressionPtr& filter)
        -> std::shared_ptr<const CompiledPageFilter> override;

    /// Throws CodeGenerationError when the expression fails to type-check.
    [[nodiscard]] auto compile_projection(const expr::RowExpressionPtr& projection)
        -> std::shared_ptr<const CompiledPageProjection> override;

   private:
    const expr::FunctionRegistry* functions_;
};

}  // namespace oryx::codegen
