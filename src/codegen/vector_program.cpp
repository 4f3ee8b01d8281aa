#include <oryx/codegen/type_check.hpp>
#include <oryx/codegen/vector_program.hpp>
#include <oryx/core/error.hpp>
#include <oryx/expr/builtin_functions.hpp>

#include <fmt/format.h>

#include <cmath>
#include <numeric>
#include <optional>
#include <type_traits>

namespace oryx::codegen {

namespace {

using expr::ArithmeticOp;
using expr::CompareOp;
using expr::Form;
using expr::RowExpression;
using BlockPtr = std::shared_ptr<const Block>;
using Positions = std::span<const std::int32_t>;

template <typename T>
constexpr auto scalar_type_of() noexcept -> ScalarType {
    if constexpr (std::is_same_v<T, std::uint8_t>) {
        return ScalarType::Boolean;
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return ScalarType::Bigint;
    } else if constexpr (std::is_same_v<T, double>) {
        return ScalarType::Double;
    } else {
        return ScalarType::Varchar;
    }
}

auto is_numeric(ScalarType type) noexcept -> bool {
    return type == ScalarType::Bigint || type == ScalarType::Double;
}

auto empty_values(ScalarType type) -> BlockValues {
    switch (type) {
        case ScalarType::Boolean:
            return Column<std::uint8_t>{};
        case ScalarType::Bigint:
            return Column<std::int64_t>{};
        case ScalarType::Double:
            return Column<double>{};
        case ScalarType::Varchar:
            return Column<std::string>{};
    }
    throw OryxException(ErrorCode::InvalidInput, "unknown scalar type");
}

// Selections are ascending and distinct, so one as large as the page selects
// every row in order.
auto covers_page(const Page& page, Positions positions) noexcept -> bool {
    return positions.size() == page.position_count();
}

/// Page positions for a subset of a selection, given by local indexes.
auto select(Positions positions, const std::vector<std::int32_t>& local)
    -> std::vector<std::int32_t> {
    std::vector<std::int32_t> out;
    out.reserve(local.size());
    for (auto k : local) {
        out.push_back(positions[static_cast<std::size_t>(k)]);
    }
    return out;
}

auto mismatch(ScalarType expected, ScalarType actual) -> OryxException {
    return OryxException(ErrorCode::TypeMismatch, fmt::format("expected a {} block, got {}",
                                                               type_name(expected),
                                                               type_name(actual)));
}

auto boolean_column(const Block& block) -> const Column<std::uint8_t>& {
    const auto* column = block.column<std::uint8_t>();
    if (column == nullptr) {
        throw mismatch(ScalarType::Boolean, block.type());
    }
    return *column;
}

auto merge_nulls(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs,
                 std::size_t n) -> std::vector<std::uint8_t> {
    if (lhs.empty() && rhs.empty()) {
        return {};
    }
    std::vector<std::uint8_t> out(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = ((!lhs.empty() && lhs[i] != 0) || (!rhs.empty() && rhs[i] != 0)) ? 1 : 0;
    }
    return out;
}

/// Random-access block assembly for IF and COALESCE; every slot starts NULL.
class BlockWriter {
   public:
    BlockWriter(ScalarType type, std::size_t size)
        : type_(type), values_(empty_values(type)), nulls_(size, 1) {
        std::visit([size](auto& col) { col.resize(size); }, values_);
    }

    void copy(std::size_t to, const Block& from, std::size_t position) {
        if (from.type() != type_) {
            throw mismatch(type_, from.type());
        }
        if (from.is_null(position)) {
            nulls_[to] = 1;
            return;
        }
        std::visit(
            [&](auto& col) {
                using C = std::decay_t<decltype(col)>;
                col[to] = std::get<C>(from.values())[position];
            },
            values_);
        nulls_[to] = 0;
    }

    [[nodiscard]] auto finish() -> BlockPtr {
        return std::make_shared<const Block>(type_, std::move(values_), std::move(nulls_));
    }

   private:
    ScalarType type_;
    BlockValues values_;
    std::vector<std::uint8_t> nulls_;
};

// ─── Typed kernels ────────────────────────────────────────────────────────────

/// An argument of a kernel call. Non-null literals are hoisted into
/// `constant` and never broadcast.
struct Argument {
    VectorFn evaluate;
    std::optional<Value> constant;
};

/// One side of a binary kernel: a column (stride 1) or a constant (stride 0).
template <typename T>
struct Operand {
    BlockPtr block;
    T scalar{};
    const T* data = nullptr;
    std::size_t stride = 0;
    std::span<const std::uint8_t> nulls;

    Operand() = default;
    Operand(const Operand&) = delete;
    auto operator=(const Operand&) -> Operand& = delete;
};

template <typename T>
auto scalar_of(const Value& value) -> T {
    if constexpr (std::is_same_v<T, std::uint8_t>) {
        return std::get<bool>(value) ? 1 : 0;
    } else {
        return std::get<T>(value);
    }
}

template <typename T>
void bind(Operand<T>& operand, const Argument& argument, const Page& page, Positions positions) {
    if (argument.constant) {
        operand.scalar = scalar_of<T>(*argument.constant);
        operand.data = &operand.scalar;
        operand.stride = 0;
        return;
    }
    operand.block = argument.evaluate(page, positions);
    const auto* column = operand.block->template column<T>();
    if (column == nullptr) {
        throw mismatch(scalar_type_of<T>(), operand.block->type());
    }
    operand.data = column->data();
    operand.stride = 1;
    operand.nulls = operand.block->nulls();
}

// Element-wise arithmetic: result type = common_type<L, R>. Bigint rows that
// are NULL are skipped so their placeholder zeros never raise errors.
template <typename L, typename R>
void arith_into(ArithmeticOp op, const L* __restrict__ lp, std::size_t ls,
                const R* __restrict__ rp, std::size_t rs,
                std::common_type_t<L, R>* __restrict__ dp, const std::uint8_t* nulls,
                std::size_t n) {
    using Out = std::common_type_t<L, R>;
    if constexpr (std::is_integral_v<Out>) {
        for (std::size_t i = 0; i < n; ++i) {
            if (nulls != nullptr && nulls[i] != 0) {
                dp[i] = 0;
                continue;
            }
            dp[i] = expr::apply_arithmetic(op, lp[i * ls], rp[i * rs]);
        }
    } else {
        switch (op) {
            case ArithmeticOp::Add:
                for (std::size_t i = 0; i < n; ++i)
                    dp[i] = static_cast<Out>(lp[i * ls]) + static_cast<Out>(rp[i * rs]);
                break;
            case ArithmeticOp::Sub:
                for (std::size_t i = 0; i < n; ++i)
                    dp[i] = static_cast<Out>(lp[i * ls]) - static_cast<Out>(rp[i * rs]);
                break;
            case ArithmeticOp::Mul:
                for (std::size_t i = 0; i < n; ++i)
                    dp[i] = static_cast<Out>(lp[i * ls]) * static_cast<Out>(rp[i * rs]);
                break;
            case ArithmeticOp::Div:
                for (std::size_t i = 0; i < n; ++i)
                    dp[i] = static_cast<Out>(lp[i * ls]) / static_cast<Out>(rp[i * rs]);
                break;
            case ArithmeticOp::Mod:
                for (std::size_t i = 0; i < n; ++i)
                    dp[i] = std::fmod(static_cast<Out>(lp[i * ls]), static_cast<Out>(rp[i * rs]));
                break;
        }
    }
}

template <typename Common, typename T>
auto widen(const T& value) -> decltype(auto) {
    if constexpr (std::is_same_v<T, Common>) {
        return (value);
    } else {
        return static_cast<Common>(value);
    }
}

// Element-wise comparison; numeric operands compare in their common type.
template <typename L, typename R>
void cmp_into(CompareOp op, const L* lp, std::size_t ls, const R* rp, std::size_t rs,
              std::uint8_t* __restrict__ mp, std::size_t n) {
    using C = std::common_type_t<L, R>;
    switch (op) {
        case CompareOp::Eq:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) == widen<C>(rp[i * rs]);
            break;
        case CompareOp::Ne:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) != widen<C>(rp[i * rs]);
            break;
        case CompareOp::Lt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) < widen<C>(rp[i * rs]);
            break;
        case CompareOp::Le:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) <= widen<C>(rp[i * rs]);
            break;
        case CompareOp::Gt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) > widen<C>(rp[i * rs]);
            break;
        case CompareOp::Ge:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = widen<C>(lp[i * ls]) >= widen<C>(rp[i * rs]);
            break;
    }
}

template <typename L, typename R>
auto arithmetic_kernel(ArithmeticOp op, Argument lhs, Argument rhs) -> VectorFn {
    return [op, lhs = std::move(lhs), rhs = std::move(rhs)](const Page& page,
                                                            Positions positions) -> BlockPtr {
        using Out = std::common_type_t<L, R>;
        const auto n = positions.size();
        Operand<L> l;
        Operand<R> r;
        bind(l, lhs, page, positions);
        bind(r, rhs, page, positions);
        auto nulls = merge_nulls(l.nulls, r.nulls, n);
        Column<Out> out;
        out.resize(n);
        arith_into(op, l.data, l.stride, r.data, r.stride, out.data(),
                   nulls.empty() ? nullptr : nulls.data(), n);
        return std::make_shared<const Block>(scalar_type_of<Out>(), BlockValues{std::move(out)},
                                             std::move(nulls));
    };
}

template <typename L, typename R>
auto compare_kernel(CompareOp op, Argument lhs, Argument rhs) -> VectorFn {
    return [op, lhs = std::move(lhs), rhs = std::move(rhs)](const Page& page,
                                                            Positions positions) -> BlockPtr {
        const auto n = positions.size();
        Operand<L> l;
        Operand<R> r;
        bind(l, lhs, page, positions);
        bind(r, rhs, page, positions);
        auto nulls = merge_nulls(l.nulls, r.nulls, n);
        Column<std::uint8_t> out;
        out.resize(n);
        cmp_into(op, l.data, l.stride, r.data, r.stride, out.data(), n);
        return std::make_shared<const Block>(ScalarType::Boolean, BlockValues{std::move(out)},
                                             std::move(nulls));
    };
}

// Dispatch over the numeric type combinations.
auto make_arithmetic(ArithmeticOp op, ScalarType lt, ScalarType rt, Argument lhs, Argument rhs)
    -> VectorFn {
    const bool l_bigint = lt == ScalarType::Bigint;
    const bool r_bigint = rt == ScalarType::Bigint;
    if (l_bigint && r_bigint) {
        return arithmetic_kernel<std::int64_t, std::int64_t>(op, std::move(lhs), std::move(rhs));
    }
    if (l_bigint) {
        return arithmetic_kernel<std::int64_t, double>(op, std::move(lhs), std::move(rhs));
    }
    if (r_bigint) {
        return arithmetic_kernel<double, std::int64_t>(op, std::move(lhs), std::move(rhs));
    }
    return arithmetic_kernel<double, double>(op, std::move(lhs), std::move(rhs));
}

auto make_comparison(CompareOp op, ScalarType lt, ScalarType rt, Argument lhs, Argument rhs)
    -> std::optional<VectorFn> {
    if (is_numeric(lt) && is_numeric(rt)) {
        const bool l_bigint = lt == ScalarType::Bigint;
        const bool r_bigint = rt == ScalarType::Bigint;
        if (l_bigint && r_bigint) {
            return compare_kernel<std::int64_t, std::int64_t>(op, std::move(lhs), std::move(rhs));
        }
        if (l_bigint) {
            return compare_kernel<std::int64_t, double>(op, std::move(lhs), std::move(rhs));
        }
        if (r_bigint) {
            return compare_kernel<double, std::int64_t>(op, std::move(lhs), std::move(rhs));
        }
        return compare_kernel<double, double>(op, std::move(lhs), std::move(rhs));
    }
    if (lt == rt && lt == ScalarType::Varchar) {
        return compare_kernel<std::string, std::string>(op, std::move(lhs), std::move(rhs));
    }
    if (lt == rt && lt == ScalarType::Boolean) {
        return compare_kernel<std::uint8_t, std::uint8_t>(op, std::move(lhs), std::move(rhs));
    }
    return std::nullopt;
}

// ─── Leaves and generic calls ─────────────────────────────────────────────────

auto make_input_reference(std::int32_t field, ScalarType type) -> VectorFn {
    const auto channel = static_cast<std::size_t>(field);
    return [channel, type](const Page& page, Positions positions) -> BlockPtr {
        const auto& block = page.block_ptr(channel);
        if (block->type() != type) {
            throw OryxException(ErrorCode::TypeMismatch,
                                fmt::format("channel {} is {}, expected {}", channel,
                                            type_name(block->type()), type_name(type)));
        }
        if (covers_page(page, positions)) {
            return block;
        }
        return std::make_shared<const Block>(block->gather(positions));
    };
}

auto make_constant(Value value, ScalarType type) -> VectorFn {
    return [value = std::move(value), type](const Page&, Positions positions) -> BlockPtr {
        return std::make_shared<const Block>(Block::broadcast(type, value, positions.size()));
    };
}

auto make_generic_call(std::shared_ptr<const expr::ScalarFunction> function, ScalarType type,
                       std::vector<VectorFn> arguments) -> VectorFn {
    return [function = std::move(function), type,
            arguments = std::move(arguments)](const Page& page, Positions positions) -> BlockPtr {
        const auto n = positions.size();
        std::vector<BlockPtr> blocks;
        blocks.reserve(arguments.size());
        for (const auto& argument : arguments) {
            blocks.push_back(argument(page, positions));
        }
        BlockBuilder builder(type, n);
        std::vector<Value> values(blocks.size());
        for (std::size_t i = 0; i < n; ++i) {
            bool has_null = false;
            for (std::size_t a = 0; a < blocks.size() && !has_null; ++a) {
                has_null = blocks[a]->is_null(i);
                if (!has_null) {
                    values[a] = blocks[a]->get(i);
                }
            }
            if (has_null) {
                builder.append_null();
                continue;
            }
            auto result = function->implementation(values);
            if (!value_matches(type, result)) {
                throw OryxException(ErrorCode::TypeMismatch,
                                    fmt::format("{} returned {}", function->signature.to_string(),
                                                format_value(result)));
            }
            builder.append(result);
        }
        return std::make_shared<const Block>(builder.build());
    };
}

// ─── Special forms ────────────────────────────────────────────────────────────

auto make_not(VectorFn operand) -> VectorFn {
    return [operand = std::move(operand)](const Page& page, Positions positions) -> BlockPtr {
        auto input = operand(page, positions);
        const auto& values = boolean_column(*input);
        Column<std::uint8_t> out;
        out.resize(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            out[i] = values[i] == 0 ? 1 : 0;
        }
        std::vector<std::uint8_t> nulls(input->nulls().begin(), input->nulls().end());
        return std::make_shared<const Block>(ScalarType::Boolean, BlockValues{std::move(out)},
                                             std::move(nulls));
    };
}

auto make_is_null(VectorFn operand) -> VectorFn {
    return [operand = std::move(operand)](const Page& page, Positions positions) -> BlockPtr {
        auto input = operand(page, positions);
        Column<std::uint8_t> out;
        out.resize(input->size());
        for (std::size_t i = 0; i < input->size(); ++i) {
            out[i] = input->is_null(i) ? 1 : 0;
        }
        return std::make_shared<const Block>(ScalarType::Boolean, BlockValues{std::move(out)});
    };
}

// Three-valued AND / OR. Rows are dropped from the selection once an operand
// decides them (FALSE for AND, TRUE for OR); later operands never see them.
auto make_logical(bool is_and, std::vector<VectorFn> operands) -> VectorFn {
    return [is_and, operands = std::move(operands)](const Page& page,
                                                    Positions positions) -> BlockPtr {
        const auto n = positions.size();
        const std::uint8_t decisive = is_and ? 0 : 1;
        Column<std::uint8_t> out;
        out.resize(n, is_and ? 1 : 0);
        std::vector<std::uint8_t> nulls(n, 0);
        std::vector<std::int32_t> active(n);
        std::iota(active.begin(), active.end(), 0);
        std::vector<std::int32_t> selection(positions.begin(), positions.end());
        for (const auto& operand : operands) {
            if (active.empty()) {
                break;
            }
            auto input = operand(page, selection);
            const auto& values = boolean_column(*input);
            std::size_t kept = 0;
            for (std::size_t k = 0; k < active.size(); ++k) {
                const auto i = static_cast<std::size_t>(active[k]);
                if (input->is_null(k)) {
                    nulls[i] = 1;
                } else if (values[k] == decisive) {
                    out[i] = decisive;
                    nulls[i] = 0;
                    continue;
                }
                active[kept] = active[k];
                selection[kept] = selection[k];
                ++kept;
            }
            active.resize(kept);
            selection.resize(kept);
        }
        return std::make_shared<const Block>(ScalarType::Boolean, BlockValues{std::move(out)},
                                             std::move(nulls));
    };
}

void fill_rows(BlockWriter& out, const VectorFn& branch, const Page& page, Positions positions,
               const std::vector<std::int32_t>& local) {
    if (local.empty()) {
        return;
    }
    auto selection = select(positions, local);
    auto block = branch(page, selection);
    for (std::size_t k = 0; k < local.size(); ++k) {
        out.copy(static_cast<std::size_t>(local[k]), *block, k);
    }
}

/// `else_value` may be empty: unmatched rows are NULL.
auto make_if(ScalarType type, VectorFn condition, VectorFn then_value, VectorFn else_value)
    -> VectorFn {
    return [type, condition = std::move(condition), then_value = std::move(then_value),
            else_value = std::move(else_value)](const Page& page,
                                                Positions positions) -> BlockPtr {
        const auto n = positions.size();
        auto flags = condition(page, positions);
        const auto& values = boolean_column(*flags);
        std::vector<std::int32_t> then_rows;
        std::vector<std::int32_t> else_rows;
        for (std::size_t k = 0; k < n; ++k) {
            auto& rows = (!flags->is_null(k) && values[k] != 0) ? then_rows : else_rows;
            rows.push_back(static_cast<std::int32_t>(k));
        }
        BlockWriter out(type, n);
        fill_rows(out, then_value, page, positions, then_rows);
        if (else_value) {
            fill_rows(out, else_value, page, positions, else_rows);
        }
        return out.finish();
    };
}

auto make_coalesce(ScalarType type, std::vector<VectorFn> operands) -> VectorFn {
    return [type, operands = std::move(operands)](const Page& page,
                                                  Positions positions) -> BlockPtr {
        const auto n = positions.size();
        BlockWriter out(type, n);
        std::vector<std::int32_t> pending(n);
        std::iota(pending.begin(), pending.end(), 0);
        for (const auto& operand : operands) {
            if (pending.empty()) {
                break;
            }
            auto selection = select(positions, pending);
            auto block = operand(page, selection);
            std::size_t kept = 0;
            for (std::size_t k = 0; k < pending.size(); ++k) {
                if (block->is_null(k)) {
                    pending[kept++] = pending[k];
                } else {
                    out.copy(static_cast<std::size_t>(pending[k]), *block, k);
                }
            }
            pending.resize(kept);
        }
        return out.finish();
    };
}

// ─── Compilation ──────────────────────────────────────────────────────────────

class VectorCompiler {
   public:
    explicit VectorCompiler(const expr::FunctionRegistry& functions) : functions_(functions) {}

    auto compile(const RowExpression& expression) -> VectorFn {
        return std::visit(
            [&](const auto& node) -> VectorFn {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, expr::InputReference>) {
                    return make_input_reference(node.field, expression.type());
                } else if constexpr (std::is_same_v<T, expr::Constant>) {
                    return make_constant(node.value, expression.type());
                } else if constexpr (std::is_same_v<T, expr::Call>) {
                    return compile_call(expression, node);
                } else {
                    return compile_form(expression, node);
                }
            },
            expression.node());
    }

   private:
    auto compile_all(const std::vector<expr::RowExpressionPtr>& expressions)
        -> std::vector<VectorFn> {
        std::vector<VectorFn> out;
        out.reserve(expressions.size());
        for (const auto& expression : expressions) {
            out.push_back(compile(*expression));
        }
        return out;
    }

    auto argument(const RowExpression& expression) -> Argument {
        if (const auto* c = std::get_if<expr::Constant>(&expression.node());
            c != nullptr && !is_null(c->value)) {
            return Argument{.evaluate = {}, .constant = c->value};
        }
        return Argument{.evaluate = compile(expression), .constant = std::nullopt};
    }

    auto compile_kernel(const RowExpression& expression, const expr::Call& call)
        -> std::optional<VectorFn> {
        if (call.arguments.size() != 2) {
            return std::nullopt;
        }
        const auto lt = call.arguments[0]->type();
        const auto rt = call.arguments[1]->type();
        if (auto op = expr::arithmetic_op_of(call.name)) {
            const auto expected = (lt == ScalarType::Bigint && rt == ScalarType::Bigint)
                                      ? ScalarType::Bigint
                                      : ScalarType::Double;
            if (!is_numeric(lt) || !is_numeric(rt) || expression.type() != expected) {
                return std::nullopt;
            }
            return make_arithmetic(*op, lt, rt, argument(*call.arguments[0]),
                                   argument(*call.arguments[1]));
        }
        if (auto op = expr::compare_op_of(call.name)) {
            if (expression.type() != ScalarType::Boolean) {
                return std::nullopt;
            }
            return make_comparison(*op, lt, rt, argument(*call.arguments[0]),
                                   argument(*call.arguments[1]));
        }
        return std::nullopt;
    }

    auto compile_call(const RowExpression& expression, const expr::Call& call) -> VectorFn {
        if (auto kernel = compile_kernel(expression, call)) {
            return std::move(*kernel);
        }
        std::vector<ScalarType> types;
        for (const auto& argument : call.arguments) {
            types.push_back(argument->type());
        }
        auto function = functions_.resolve(call.name, types);
        if (function == nullptr) {
            throw CodeGenerationError(fmt::format("unresolved call {}", expression.to_string()));
        }
        return make_generic_call(std::move(function), expression.type(),
                                 compile_all(call.arguments));
    }

    auto compile_form(const RowExpression& expression, const expr::SpecialForm& form)
        -> VectorFn {
        const auto& args = form.arguments;
        switch (form.form) {
            case Form::And:
            case Form::Or:
                return make_logical(form.form == Form::And, compile_all(args));
            case Form::Not:
                return make_not(compile(*args[0]));
            case Form::IsNull:
                return make_is_null(compile(*args[0]));
            case Form::If:
                return make_if(expression.type(), compile(*args[0]), compile(*args[1]),
                               args.size() == 3 ? compile(*args[2]) : VectorFn{});
            case Form::Coalesce:
                return make_coalesce(expression.type(), compile_all(args));
        }
        throw CodeGenerationError(fmt::format("unsupported form {}", expr::form_name(form.form)));
    }

    const expr::FunctionRegistry& functions_;
};

// ─── Artifacts and instances ──────────────────────────────────────────────────

class VectorizedCompiledPageFilter final
    : public CompiledPageFilter,
      public std::enable_shared_from_this<VectorizedCompiledPageFilter> {
   public:
    VectorizedCompiledPageFilter(expr::RowExpressionPtr filter, VectorFn evaluate)
        : filter_(std::move(filter)),
          evaluate_(std::move(evaluate)),
          input_channels_(codegen::input_channels(*filter_)) {}

    [[nodiscard]] auto new_instance() const -> std::unique_ptr<PageFilter> override;

    [[nodiscard]] auto filter() const noexcept -> const expr::RowExpressionPtr& override {
        return filter_;
    }
    [[nodiscard]] auto input_channels() const noexcept -> std::span<const std::int32_t> override {
        return input_channels_;
    }
    [[nodiscard]] auto evaluate() const noexcept -> const VectorFn& { return evaluate_; }

   private:
    expr::RowExpressionPtr filter_;
    VectorFn evaluate_;
    std::vector<std::int32_t> input_channels_;
};

class VectorizedPageFilter final : public PageFilter {
   public:
    explicit VectorizedPageFilter(std::shared_ptr<const VectorizedCompiledPageFilter> compiled)
        : compiled_(std::move(compiled)) {}

    [[nodiscard]] auto filter(const Page& page) -> SelectedPositions override {
        const auto n = page.position_count();
        if (all_positions_.size() != n) {
            all_positions_.resize(n);
            std::iota(all_positions_.begin(), all_positions_.end(), 0);
        }
        auto result = compiled_->evaluate()(page, all_positions_);
        const auto& values = boolean_column(*result);
        SelectedPositions selected;
        for (std::size_t i = 0; i < n; ++i) {
            if (values[i] != 0 && !result->is_null(i)) {
                selected.push_back(static_cast<std::int32_t>(i));
            }
        }
        processed_ += n;
        return selected;
    }

    [[nodiscard]] auto input_channels() const noexcept -> std::span<const std::int32_t> override {
        return compiled_->input_channels();
    }

    [[nodiscard]] auto processed_positions() const noexcept -> std::size_t override {
        return processed_;
    }

   private:
    std::shared_ptr<const VectorizedCompiledPageFilter> compiled_;
    std::vector<std::int32_t> all_positions_;
    std::size_t processed_ = 0;
};

auto VectorizedCompiledPageFilter::new_instance() const -> std::unique_ptr<PageFilter> {
    return std::make_unique<VectorizedPageFilter>(shared_from_this());
}

class VectorizedCompiledPageProjection final
    : public CompiledPageProjection,
      public std::enable_shared_from_this<VectorizedCompiledPageProjection> {
   public:
    VectorizedCompiledPageProjection(expr::RowExpressionPtr projection, VectorFn evaluate)
        : projection_(std::move(projection)),
          evaluate_(std::move(evaluate)),
          input_channels_(codegen::input_channels(*projection_)) {}

    [[nodiscard]] auto new_instance() const -> std::unique_ptr<PageProjection> override;

    [[nodiscard]] auto projection() const noexcept -> const expr::RowExpressionPtr& override {
        return projection_;
    }
    [[nodiscard]] auto input_channels() const noexcept -> std::span<const std::int32_t> override {
        return input_channels_;
    }
    [[nodiscard]] auto evaluate() const noexcept -> const VectorFn& { return evaluate_; }

   private:
    expr::RowExpressionPtr projection_;
    VectorFn evaluate_;
    std::vector<std::int32_t> input_channels_;
};

class VectorizedPageProjection final : public PageProjection {
   public:
    explicit VectorizedPageProjection(
        std::shared_ptr<const VectorizedCompiledPageProjection> compiled)
        : compiled_(std::move(compiled)) {}

    [[nodiscard]] auto project(const Page& page, std::span<const std::int32_t> positions)
        -> std::shared_ptr<const Block> override {
        return compiled_->evaluate()(page, positions);
    }

    [[nodiscard]] auto type() const noexcept -> ScalarType override {
        return compiled_->projection()->type();
    }

    [[nodiscard]] auto input_channels() const noexcept -> std::span<const std::int32_t> override {
        return compiled_->input_channels();
    }

   private:
    std::shared_ptr<const VectorizedCompiledPageProjection> compiled_;
};

auto VectorizedCompiledPageProjection::new_instance() const -> std::unique_ptr<PageProjection> {
    return std::make_unique<VectorizedPageProjection>(shared_from_this());
}

}  // namespace

auto compile_vector_function(const RowExpression& expression,
                             const expr::FunctionRegistry& functions) -> VectorFn {
    return VectorCompiler(functions).compile(expression);
}

auto VectorizedPageFunctionGenerator::compile_filter(const expr::RowExpressionPtr& filter)
    -> std::shared_ptr<const CompiledPageFilter> {
    if (filter == nullptr) {
        throw CodeGenerationError("page filter requires an expression");
    }
    if (auto checked = check_filter(*filter, *functions_); !checked) {
        throw CodeGenerationError(fmt::format("invalid filter: {}", checked.error()));
    }
    return std::make_shared<VectorizedCompiledPageFilter>(
        filter, compile_vector_function(*filter, *functions_));
}

auto VectorizedPageFunctionGenerator::compile_projection(const expr::RowExpressionPtr& projection)
    -> std::shared_ptr<const CompiledPageProjection> {
    if (projection == nullptr) {
        throw CodeGenerationError("page projection requires an expression");
    }
    if (auto checked = check_expression(*projection, *functions_); !checked) {
        throw CodeGenerationError(fmt::format("invalid projection: {}", checked.error()));
    }
    return std::make_shared<VectorizedCompiledPageProjection>(
        projection, compile_vector_function(*projection, *functions_));
}

}  // namespace oryx::codegen
