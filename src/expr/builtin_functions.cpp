#include <oryx/expr/builtin_functions.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <string>

namespace oryx::expr {

namespace {

constexpr std::array<ArithmeticOp, 5> kArithmeticOps = {
    ArithmeticOp::Add, ArithmeticOp::Sub, ArithmeticOp::Mul, ArithmeticOp::Div, ArithmeticOp::Mod,
};

constexpr std::array<CompareOp, 6> kCompareOps = {
    CompareOp::Eq, CompareOp::Ne, CompareOp::Lt, CompareOp::Le, CompareOp::Gt, CompareOp::Ge,
};

auto as_double(const Value& value) -> double {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(value);
}

void register_arithmetic(FunctionRegistry& registry, ArithmeticOp op) {
    const std::string name{arithmetic_function_name(op)};
    registry.register_scalar(name, {ScalarType::Bigint, ScalarType::Bigint}, ScalarType::Bigint,
                             [op](std::span<const Value> args) -> Value {
                                 return apply_arithmetic(op, std::get<std::int64_t>(args[0]),
                                                         std::get<std::int64_t>(args[1]));
                             });
    auto as_doubles = [op](std::span<const Value> args) -> Value {
        return apply_arithmetic(op, as_double(args[0]), as_double(args[1]));
    };
    registry.register_scalar(name, {ScalarType::Double, ScalarType::Double}, ScalarType::Double,
                             as_doubles);
    registry.register_scalar(name, {ScalarType::Bigint, ScalarType::Double}, ScalarType::Double,
                             as_doubles);
    registry.register_scalar(name, {ScalarType::Double, ScalarType::Bigint}, ScalarType::Double,
                             as_doubles);
}

void register_comparison(FunctionRegistry& registry, CompareOp op) {
    const std::string name{compare_function_name(op)};
    registry.register_scalar(name, {ScalarType::Bigint, ScalarType::Bigint}, ScalarType::Boolean,
                             [op](std::span<const Value> args) -> Value {
                                 return apply_compare(op, std::get<std::int64_t>(args[0]),
                                                      std::get<std::int64_t>(args[1]));
                             });
    auto as_doubles = [op](std::span<const Value> args) -> Value {
        return apply_compare(op, as_double(args[0]), as_double(args[1]));
    };
    registry.register_scalar(name, {ScalarType::Double, ScalarType::Double}, ScalarType::Boolean,
                             as_doubles);
    registry.register_scalar(name, {ScalarType::Bigint, ScalarType::Double}, ScalarType::Boolean,
                             as_doubles);
    registry.register_scalar(name, {ScalarType::Double, ScalarType::Bigint}, ScalarType::Boolean,
                             as_doubles);
    registry.register_scalar(name, {ScalarType::Varchar, ScalarType::Varchar},
                             ScalarType::Boolean, [op](std::span<const Value> args) -> Value {
                                 return apply_compare(op, std::get<std::string>(args[0]),
                                                      std::get<std::string>(args[1]));
                             });
    registry.register_scalar(name, {ScalarType::Boolean, ScalarType::Boolean},
                             ScalarType::Boolean, [op](std::span<const Value> args) -> Value {
                                 return apply_compare(op, std::get<bool>(args[0]),
                                                      std::get<bool>(args[1]));
                             });
}

void register_unary_numeric(FunctionRegistry& registry) {
    registry.register_scalar("negate", {ScalarType::Bigint}, ScalarType::Bigint,
                             [](std::span<const Value> args) -> Value {
                                 auto v = std::get<std::int64_t>(args[0]);
                                 if (v == std::numeric_limits<std::int64_t>::min()) {
                                     throw OryxException(ErrorCode::NumericOverflow,
                                                         "bigint negation overflow");
                                 }
                                 return -v;
                             });
    registry.register_scalar("negate", {ScalarType::Double}, ScalarType::Double,
                             [](std::span<const Value> args) -> Value {
                                 return -std::get<double>(args[0]);
                             });
    registry.register_scalar("abs", {ScalarType::Bigint}, ScalarType::Bigint,
                             [](std::span<const Value> args) -> Value {
                                 auto v = std::get<std::int64_t>(args[0]);
                                 if (v == std::numeric_limits<std::int64_t>::min()) {
                                     throw OryxException(ErrorCode::NumericOverflow,
                                                         "bigint abs overflow");
                                 }
                                 return v < 0 ? -v : v;
                             });
    registry.register_scalar("abs", {ScalarType::Double}, ScalarType::Double,
                             [](std::span<const Value> args) -> Value {
                                 return std::fabs(std::get<double>(args[0]));
                             });
}

void register_strings(FunctionRegistry& registry) {
    registry.register_scalar("length", {ScalarType::Varchar}, ScalarType::Bigint,
                             [](std::span<const Value> args) -> Value {
                                 return static_cast<std::int64_t>(
                                     std::get<std::string>(args[0]).size());
                             });
    registry.register_scalar("lower", {ScalarType::Varchar}, ScalarType::Varchar,
                             [](std::span<const Value> args) -> Value {
                                 auto s = std::get<std::string>(args[0]);
                                 std::ranges::transform(s, s.begin(), [](unsigned char ch) {
                                     return static_cast<char>(std::tolower(ch));
                                 });
                                 return s;
                             });
    registry.register_scalar("upper", {ScalarType::Varchar}, ScalarType::Varchar,
                             [](std::span<const Value> args) -> Value {
                                 auto s = std::get<std::string>(args[0]);
                                 std::ranges::transform(s, s.begin(), [](unsigned char ch) {
                                     return static_cast<char>(std::toupper(ch));
                                 });
                                 return s;
                             });
    registry.register_scalar("concat", {ScalarType::Varchar, ScalarType::Varchar},
                             ScalarType::Varchar, [](std::span<const Value> args) -> Value {
                                 return std::get<std::string>(args[0]) +
                                        std::get<std::string>(args[1]);
                             });
}

}  // namespace

void register_builtin_functions(FunctionRegistry& registry) {
    for (auto op : kArithmeticOps) {
        register_arithmetic(registry, op);
    }
    for (auto op : kCompareOps) {
        register_comparison(registry, op);
    }
    register_unary_numeric(registry);
    register_strings(registry);
}

auto builtin_function_registry() -> FunctionRegistry {
    FunctionRegistry registry;
    register_builtin_functions(registry);
    return registry;
}

auto arithmetic_op_of(std::string_view name) noexcept -> std::optional<ArithmeticOp> {
    for (auto op : kArithmeticOps) {
        if (arithmetic_function_name(op) == name) {
            return op;
        }
    }
    return std::nullopt;
}

auto compare_op_of(std::string_view name) noexcept -> std::optional<CompareOp> {
    for (auto op : kCompareOps) {
        if (compare_function_name(op) == name) {
            return op;
        }
    }
    return std::nullopt;
}

}  // namespace oryx::expr
