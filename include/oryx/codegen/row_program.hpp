#pragma once

#include <oryx/codegen/cursor_processor.hpp>
#include <oryx/expr/function_registry.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace oryx::codegen {

// ─── Register machine ─────────────────────────────────────────────────────────
//  Each expression is lowered to a flat instruction sequence over a register
//  file of Values. Control flow (short-circuit AND/OR, IF, COALESCE) is
//  expressed with forward jumps, so evaluating a row is a single loop with no
//  recursion and no allocation.

enum class OpCode : std::uint8_t {
    LoadField,      // dst <- cursor field `operand` (typed getter for `type`)
    LoadConstant,   // dst <- constants[operand]
    Invoke,         // dst <- function(args...), NULL if any arg is NULL
    Not,            // dst <- NOT a (NULL stays NULL)
    IsNull,         // dst <- a IS NULL
    AndStep,        // dst <- dst AND a (three-valued)
    OrStep,         // dst <- dst OR a (three-valued)
    Move,           // dst <- a
    Jump,           // pc <- target
    JumpIfFalse,    // if dst is FALSE: pc <- target
    JumpIfTrue,     // if dst is TRUE: pc <- target
    JumpIfNotTrue,  // if dst is FALSE or NULL: pc <- target
    JumpIfNotNull,  // if dst is not NULL: pc <- target
};

struct Instruction {
    OpCode op = OpCode::Move;
    std::uint32_t dst = 0;
    /// Source register, field index, constant index or jump target.
    std::uint32_t operand = 0;
    ScalarType type = ScalarType::Boolean;
    std::shared_ptr<const expr::ScalarFunction> function;
    std::vector<std::uint32_t> args;
};

/// A lowered expression: run `code` and read register `result`.
struct RowProgram {
    std::vector<Instruction> code;
    std::vector<Value> constants;
    std::uint32_t register_count = 0;
    std::uint32_t result = 0;
    ScalarType type = ScalarType::Boolean;

    /// Instruction listing, one per line.
    [[nodiscard]] auto disassemble() const -> std::string;
};

/// Lower a type-checked expression. The program keeps the functions it calls.
[[nodiscard]] auto lower_row_program(const expr::RowExpression& expression,
                                     const expr::FunctionRegistry& functions) -> RowProgram;

/// Run `program` for the cursor's current row. `registers` must hold at
/// least program.register_count slots; `scratch` is reused for call arguments.
[[nodiscard]] auto run_row_program(const RowProgram& program, const cursor::RecordCursor& cursor,
                                   std::vector<Value>& registers, std::vector<Value>& scratch)
    -> const Value&;

// ─── Backend ──────────────────────────────────────────────────────────────────

/// Row backend that lowers expressions to RowPrograms.
///
/// Generated artifacts are named `CursorProcessor_<n>`.
class InterpretedCursorCodeGenerator final : public CursorCodeGenerator {
   public:
    /// `functions` must outlive the generator; artifacts keep only the overloads they call.
    explicit InterpretedCursorCodeGenerator(const expr::FunctionRegistry& functions)
        : functions_(&functions) {}

    /// Throws CodeGenerationError when an expression fails to type-check.
    [[nodiscard]] auto generate(const expr::RowExpressionPtr& filter,
                                std::span<const expr::RowExpressionPtr> projections)
        -> std::shared_ptr<const CompiledCursorProcessor> override;

   private:
    const expr::FunctionRegistry* functions_;
};

}  // namespace oryx::codegen
