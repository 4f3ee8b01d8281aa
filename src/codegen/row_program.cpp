#include <oryx/codegen/row_program.hpp>
#include <oryx/codegen/type_check.hpp>
#include <oryx/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace oryx::codegen {

namespace {

using expr::Form;
using expr::RowExpression;

auto op_name(OpCode op) noexcept -> std::string_view {
    switch (op) {
        case OpCode::LoadField:
            return "load_field";
        case OpCode::LoadConstant:
            return "load_const";
        case OpCode::Invoke:
            return "invoke";
        case OpCode::Not:
            return "not";
        case OpCode::IsNull:
            return "is_null";
        case OpCode::AndStep:
            return "and";
        case OpCode::OrStep:
            return "or";
        case OpCode::Move:
            return "move";
        case OpCode::Jump:
            return "jump";
        case OpCode::JumpIfFalse:
            return "jump_if_false";
        case OpCode::JumpIfTrue:
            return "jump_if_true";
        case OpCode::JumpIfNotTrue:
            return "jump_if_not_true";
        case OpCode::JumpIfNotNull:
            return "jump_if_not_null";
    }
    return "?";
}

auto is_true(const Value& value) noexcept -> bool {
    const auto* b = std::get_if<bool>(&value);
    return b != nullptr && *b;
}

auto is_false(const Value& value) noexcept -> bool {
    const auto* b = std::get_if<bool>(&value);
    return b != nullptr && !*b;
}

// ─── Lowering ─────────────────────────────────────────────────────────────────

class RowLowering {
   public:
    explicit RowLowering(const expr::FunctionRegistry& functions) : functions_(functions) {}

    auto lower(const RowExpression& expression) -> std::uint32_t {
        return std::visit(
            [&](const auto& node) -> std::uint32_t {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, expr::InputReference>) {
                    auto dst = allocate();
                    emit({.op = OpCode::LoadField,
                          .dst = dst,
                          .operand = static_cast<std::uint32_t>(node.field),
                          .type = expression.type()});
                    return dst;
                } else if constexpr (std::is_same_v<T, expr::Constant>) {
                    return load_constant(node.value, expression.type());
                } else if constexpr (std::is_same_v<T, expr::Call>) {
                    return lower_call(expression, node);
                } else {
                    return lower_form(expression, node);
                }
            },
            expression.node());
    }

    auto finish(std::uint32_t result, ScalarType type) -> RowProgram {
        program_.result = result;
        program_.type = type;
        return std::move(program_);
    }

   private:
    auto allocate() -> std::uint32_t { return program_.register_count++; }

    auto emit(Instruction instruction) -> std::size_t {
        program_.code.push_back(std::move(instruction));
        return program_.code.size() - 1;
    }

    /// Point the jump at `at` to the next instruction to be emitted.
    void patch(std::size_t at) {
        program_.code[at].operand = static_cast<std::uint32_t>(program_.code.size());
    }

    auto load_constant(Value value, ScalarType type) -> std::uint32_t {
        auto dst = allocate();
        program_.constants.push_back(std::move(value));
        emit({.op = OpCode::LoadConstant,
              .dst = dst,
              .operand = static_cast<std::uint32_t>(program_.constants.size() - 1),
              .type = type});
        return dst;
    }

    auto lower_call(const RowExpression& expression, const expr::Call& call) -> std::uint32_t {
        std::vector<ScalarType> types;
        std::vector<std::uint32_t> args;
        for (const auto& argument : call.arguments) {
            types.push_back(argument->type());
            args.push_back(lower(*argument));
        }
        auto function = functions_.resolve(call.name, types);
        if (function == nullptr) {
            throw CodeGenerationError(fmt::format("unresolved call {}", expression.to_string()));
        }
        auto dst = allocate();
        emit({.op = OpCode::Invoke,
              .dst = dst,
              .type = expression.type(),
              .function = function,
              .args = std::move(args)});
        return dst;
    }

    auto lower_form(const RowExpression& expression, const expr::SpecialForm& form)
        -> std::uint32_t {
        const auto& args = form.arguments;
        switch (form.form) {
            case Form::Not:
            case Form::IsNull: {
                auto operand = lower(*args[0]);
                auto dst = allocate();
                emit({.op = form.form == Form::Not ? OpCode::Not : OpCode::IsNull,
                      .dst = dst,
                      .operand = operand,
                      .type = ScalarType::Boolean});
                return dst;
            }
            case Form::And:
            case Form::Or: {
                const bool is_and = form.form == Form::And;
                auto dst = load_constant(Value{is_and}, ScalarType::Boolean);
                std::vector<std::size_t> exits;
                for (std::size_t i = 0; i < args.size(); ++i) {
                    auto operand = lower(*args[i]);
                    emit({.op = is_and ? OpCode::AndStep : OpCode::OrStep,
                          .dst = dst,
                          .operand = operand});
                    if (i + 1 < args.size()) {
                        exits.push_back(
                            emit({.op = is_and ? OpCode::JumpIfFalse : OpCode::JumpIfTrue,
                                  .dst = dst}));
                    }
                }
                for (auto at : exits) {
                    patch(at);
                }
                return dst;
            }
            case Form::If: {
                auto condition = lower(*args[0]);
                auto dst = allocate();
                auto to_else = emit({.op = OpCode::JumpIfNotTrue, .dst = condition});
                auto then_value = lower(*args[1]);
                emit({.op = OpCode::Move, .dst = dst, .operand = then_value});
                auto to_end = emit({.op = OpCode::Jump});
                patch(to_else);
                auto else_value = args.size() == 3 ? lower(*args[2])
                                                   : load_constant(Value{}, expression.type());
                emit({.op = OpCode::Move, .dst = dst, .operand = else_value});
                patch(to_end);
                return dst;
            }
            case Form::Coalesce: {
                auto dst = allocate();
                std::vector<std::size_t> exits;
                for (std::size_t i = 0; i < args.size(); ++i) {
                    auto operand = lower(*args[i]);
                    emit({.op = OpCode::Move, .dst = dst, .operand = operand});
                    if (i + 1 < args.size()) {
                        exits.push_back(emit({.op = OpCode::JumpIfNotNull, .dst = dst}));
                    }
                }
                for (auto at : exits) {
                    patch(at);
                }
                return dst;
            }
        }
        throw CodeGenerationError(fmt::format("unsupported form {}", expr::form_name(form.form)));
    }

    const expr::FunctionRegistry& functions_;
    RowProgram program_;
};

// ─── Execution ────────────────────────────────────────────────────────────────

auto load_field(const cursor::RecordCursor& cursor, std::uint32_t field, ScalarType type)
    -> Value {
    if (field >= cursor.field_count()) {
        throw OryxException(ErrorCode::InvalidInput,
                            fmt::format("field {} out of range for a cursor with {} fields", field,
                                        cursor.field_count()));
    }
    if (cursor.type(field) != type) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("field {} is {}, expected {}", field,
                                        type_name(cursor.type(field)), type_name(type)));
    }
    if (cursor.is_null(field)) {
        return Value{};
    }
    switch (type) {
        case ScalarType::Boolean:
            return Value{cursor.get_boolean(field)};
        case ScalarType::Bigint:
            return Value{cursor.get_long(field)};
        case ScalarType::Double:
            return Value{cursor.get_double(field)};
        case ScalarType::Varchar:
            return Value{std::string(cursor.get_slice(field))};
    }
    return Value{};
}

auto invoke(const Instruction& instruction, const std::vector<Value>& registers,
            std::vector<Value>& scratch) -> Value {
    scratch.clear();
    for (auto arg : instruction.args) {
        if (is_null(registers[arg])) {
            return Value{};
        }
        scratch.push_back(registers[arg]);
    }
    auto result = instruction.function->implementation(scratch);
    if (!value_matches(instruction.type, result)) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("{} returned {}", instruction.function->signature.to_string(),
                                        format_value(result)));
    }
    return result;
}

}  // namespace

auto RowProgram::disassemble() const -> std::string {
    std::string out;
    for (std::size_t pc = 0; pc < code.size(); ++pc) {
        const auto& in = code[pc];
        out += fmt::format("{:>3}  {:<17} r{}", pc, op_name(in.op), in.dst);
        switch (in.op) {
            case OpCode::LoadField:
                out += fmt::format(", #{} {}", in.operand, type_name(in.type));
                break;
            case OpCode::LoadConstant:
                out += fmt::format(", {}", format_value(constants[in.operand]));
                break;
            case OpCode::Invoke:
                out += fmt::format(", {}(r{})", in.function->signature.name,
                                   fmt::join(in.args, ", r"));
                break;
            case OpCode::Jump:
            case OpCode::JumpIfFalse:
            case OpCode::JumpIfTrue:
            case OpCode::JumpIfNotTrue:
            case OpCode::JumpIfNotNull:
                out += fmt::format(" -> {}", in.operand);
                break;
            default:
                out += fmt::format(", r{}", in.operand);
                break;
        }
        out += '\n';
    }
    out += fmt::format("result r{}\n", result);
    return out;
}

auto lower_row_program(const RowExpression& expression, const expr::FunctionRegistry& functions)
    -> RowProgram {
    RowLowering lowering(functions);
    auto result = lowering.lower(expression);
    return lowering.finish(result, expression.type());
}

auto run_row_program(const RowProgram& program, const cursor::RecordCursor& cursor,
                     std::vector<Value>& registers, std::vector<Value>& scratch) -> const Value& {
    const auto& code = program.code;
    std::size_t pc = 0;
    while (pc < code.size()) {
        const auto& in = code[pc];
        auto& dst = registers[in.dst];
        switch (in.op) {
            case OpCode::LoadField:
                dst = load_field(cursor, in.operand, in.type);
                break;
            case OpCode::LoadConstant:
                dst = program.constants[in.operand];
                break;
            case OpCode::Invoke:
                dst = invoke(in, registers, scratch);
                break;
            case OpCode::Not: {
                const auto& operand = registers[in.operand];
                dst = is_null(operand) ? Value{} : Value{!std::get<bool>(operand)};
                break;
            }
            case OpCode::IsNull:
                dst = Value{is_null(registers[in.operand])};
                break;
            case OpCode::AndStep: {
                const auto& operand = registers[in.operand];
                if (is_false(operand)) {
                    dst = Value{false};
                } else if (is_null(operand) && !is_false(dst)) {
                    dst = Value{};
                }
                break;
            }
            case OpCode::OrStep: {
                const auto& operand = registers[in.operand];
                if (is_true(operand)) {
                    dst = Value{true};
                } else if (is_null(operand) && !is_true(dst)) {
                    dst = Value{};
                }
                break;
            }
            case OpCode::Move:
                dst = registers[in.operand];
                break;
            case OpCode::Jump:
                pc = in.operand;
                continue;
            case OpCode::JumpIfFalse:
                if (is_false(dst)) {
                    pc = in.operand;
                    continue;
                }
                break;
            case OpCode::JumpIfTrue:
                if (is_true(dst)) {
                    pc = in.operand;
                    continue;
                }
                break;
            case OpCode::JumpIfNotTrue:
                if (!is_true(dst)) {
                    pc = in.operand;
                    continue;
                }
                break;
            case OpCode::JumpIfNotNull:
                if (!is_null(dst)) {
                    pc = in.operand;
                    continue;
                }
                break;
        }
        ++pc;
    }
    return registers[program.result];
}

// ─── Generated artifact ───────────────────────────────────────────────────────

namespace {

class InterpretedCompiledCursorProcessor final
    : public CompiledCursorProcessor,
      public std::enable_shared_from_this<InterpretedCompiledCursorProcessor> {
   public:
    InterpretedCompiledCursorProcessor(std::string class_name, expr::RowExpressionPtr filter,
                                       std::vector<expr::RowExpressionPtr> projections,
                                       RowProgram filter_program,
                                       std::vector<RowProgram> projection_programs)
        : CompiledCursorProcessor(std::move(class_name), std::move(filter),
                                  std::move(projections)),
          filter_program_(std::move(filter_program)),
          projection_programs_(std::move(projection_programs)) {
        register_count_ = filter_program_.register_count;
        for (const auto& program : projection_programs_) {
            register_count_ = std::max(register_count_, program.register_count);
        }
    }

    [[nodiscard]] auto new_instance() const -> std::unique_ptr<CursorProcessor> override;

    [[nodiscard]] auto filter_program() const noexcept -> const RowProgram& {
        return filter_program_;
    }
    [[nodiscard]] auto projection_programs() const noexcept -> const std::vector<RowProgram>& {
        return projection_programs_;
    }
    [[nodiscard]] auto register_count() const noexcept -> std::uint32_t { return register_count_; }

   private:
    RowProgram filter_program_;
    std::vector<RowProgram> projection_programs_;
    std::uint32_t register_count_ = 0;
};

class InterpretedCursorProcessor final : public CursorProcessor {
   public:
    explicit InterpretedCursorProcessor(
        std::shared_ptr<const InterpretedCompiledCursorProcessor> compiled)
        : compiled_(std::move(compiled)), registers_(compiled_->register_count()) {}

    [[nodiscard]] auto process(cursor::RecordCursor& cursor, PageBuilder& page_builder)
        -> CursorProcessorOutput override {
        const auto& projections = compiled_->projection_programs();
        if (page_builder.types().size() != projections.size()) {
            throw OryxException(ErrorCode::InvalidInput,
                                fmt::format("page builder has {} channels for {} projections",
                                            page_builder.types().size(), projections.size()));
        }
        for (std::size_t channel = 0; channel < projections.size(); ++channel) {
            if (page_builder.types()[channel] != projections[channel].type) {
                throw OryxException(
                    ErrorCode::TypeMismatch,
                    fmt::format("page builder channel {} is {} but the projection produces {}",
                                channel, type_name(page_builder.types()[channel]),
                                type_name(projections[channel].type)));
            }
        }
        std::size_t positions = 0;
        while (!page_builder.is_full()) {
            if (!cursor.advance_next_position()) {
                return {.processed_positions = positions, .finished = true};
            }
            ++positions;
            ++processed_;
            if (!is_true(run_row_program(compiled_->filter_program(), cursor, registers_,
                                         scratch_))) {
                continue;
            }
            for (std::size_t channel = 0; channel < projections.size(); ++channel) {
                page_builder.block_builder(channel).append(
                    run_row_program(projections[channel], cursor, registers_, scratch_));
            }
            page_builder.declare_position();
        }
        return {.processed_positions = positions, .finished = false};
    }

    [[nodiscard]] auto processed_positions() const noexcept -> std::size_t override {
        return processed_;
    }

    [[nodiscard]] auto to_string() const -> std::string override {
        return compiled_->to_string();
    }

   private:
    std::shared_ptr<const InterpretedCompiledCursorProcessor> compiled_;
    std::vector<Value> registers_;
    std::vector<Value> scratch_;
    std::size_t processed_ = 0;
};

auto InterpretedCompiledCursorProcessor::new_instance() const -> std::unique_ptr<CursorProcessor> {
    return std::make_unique<InterpretedCursorProcessor>(shared_from_this());
}

}  // namespace

// ─── InterpretedCursorCodeGenerator ───────────────────────────────────────────

auto InterpretedCursorCodeGenerator::generate(const expr::RowExpressionPtr& filter,
                                              std::span<const expr::RowExpressionPtr> projections)
    -> std::shared_ptr<const CompiledCursorProcessor> {
    if (filter == nullptr) {
        throw CodeGenerationError("cursor processor requires a filter expression");
    }
    if (auto checked = check_filter(*filter, *functions_); !checked) {
        throw CodeGenerationError(fmt::format("invalid filter: {}", checked.error()));
    }
    std::vector<RowProgram> programs;
    programs.reserve(projections.size());
    for (std::size_t i = 0; i < projections.size(); ++i) {
        if (projections[i] == nullptr) {
            throw CodeGenerationError(fmt::format("projection {} is missing", i));
        }
        if (auto checked = check_expression(*projections[i], *functions_); !checked) {
            throw CodeGenerationError(fmt::format("invalid projection {}: {}", i, checked.error()));
        }
        programs.push_back(lower_row_program(*projections[i], *functions_));
    }
    return std::make_shared<InterpretedCompiledCursorProcessor>(
        make_class_name("CursorProcessor"), filter,
        std::vector<expr::RowExpressionPtr>(projections.begin(), projections.end()),
        lower_row_program(*filter, *functions_), std::move(programs));
}

}  // namespace oryx::codegen
