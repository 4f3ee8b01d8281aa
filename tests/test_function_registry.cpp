#include <oryx/core/error.hpp>
#include <oryx/expr/builtin_functions.hpp>
#include <oryx/expr/function_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <vector>

using namespace oryx;
using namespace oryx::expr;

namespace {

auto invoke(const FunctionRegistry& registry, const std::string& name, std::vector<Value> args)
    -> Value {
    std::vector<ScalarType> types;
    for (const auto& arg : args) {
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, bool>) {
                    types.push_back(ScalarType::Boolean);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    types.push_back(ScalarType::Bigint);
                } else if constexpr (std::is_same_v<T, double>) {
                    types.push_back(ScalarType::Double);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    types.push_back(ScalarType::Varchar);
                }
            },
            arg);
    }
    auto function = registry.resolve(name, types);
    REQUIRE(function != nullptr);
    return function->implementation(args);
}

auto error_code_of(const auto& fn) -> ErrorCode {
    try {
        fn();
    } catch (const OryxException& e) {
        return e.code();
    }
    FAIL("expected an OryxException");
    return ErrorCode::InvalidInput;
}

}  // namespace

TEST_CASE("FunctionRegistry resolves overloads by argument types", "[expr][functions]") {
    FunctionRegistry registry;
    registry.register_scalar("twice", {ScalarType::Bigint}, ScalarType::Bigint,
                             [](std::span<const Value> args) -> Value {
                                 return std::get<std::int64_t>(args[0]) * 2;
                             });
    registry.register_scalar("twice", {ScalarType::Varchar}, ScalarType::Varchar,
                             [](std::span<const Value> args) -> Value {
                                 return std::get<std::string>(args[0]) +
                                        std::get<std::string>(args[0]);
                             });

    REQUIRE(registry.contains("twice"));
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.overloads("twice").size() == 2);

    const std::vector<ScalarType> varchar_arg{ScalarType::Varchar};
    auto fn = registry.resolve("twice", varchar_arg);
    REQUIRE(fn != nullptr);
    REQUIRE(fn->signature.return_type == ScalarType::Varchar);
    REQUIRE(fn->signature.to_string() == "twice(varchar):varchar");

    const std::vector<ScalarType> double_arg{ScalarType::Double};
    REQUIRE(registry.resolve("twice", double_arg) == nullptr);
    REQUIRE(registry.resolve("thrice", varchar_arg) == nullptr);

    SECTION("re-registering replaces the overload") {
        const std::vector<ScalarType> bigint_arg{ScalarType::Bigint};
        auto before = registry.resolve("twice", bigint_arg);
        registry.register_scalar("twice", {ScalarType::Bigint}, ScalarType::Bigint,
                                 [](std::span<const Value>) -> Value { return std::int64_t{0}; });
        REQUIRE(registry.size() == 2);
        REQUIRE(std::get<std::int64_t>(invoke(registry, "twice", {Value{std::int64_t{4}}})) == 0);

        // Handles resolved earlier keep the overload they were resolved to.
        const std::vector<Value> four{Value{std::int64_t{4}}};
        REQUIRE(std::get<std::int64_t>(before->implementation(four)) == 8);
    }
}

TEST_CASE("Builtin arithmetic", "[expr][functions]") {
    const auto registry = builtin_function_registry();

    REQUIRE(std::get<std::int64_t>(
                invoke(registry, "add", {Value{std::int64_t{2}}, Value{std::int64_t{3}}})) == 5);
    REQUIRE(std::get<double>(invoke(registry, "multiply", {Value{std::int64_t{2}}, Value{1.5}})) ==
            3.0);
    REQUIRE(std::get<std::int64_t>(
                invoke(registry, "divide", {Value{std::int64_t{7}}, Value{std::int64_t{2}}})) == 3);
    REQUIRE(std::get<std::int64_t>(invoke(registry, "modulus",
                                          {Value{std::int64_t{-7}}, Value{std::int64_t{3}}})) ==
            -1);
    REQUIRE(std::get<double>(invoke(registry, "abs", {Value{-2.5}})) == 2.5);

    SECTION("integer division by zero") {
        REQUIRE(error_code_of([&] {
                    static_cast<void>(invoke(registry, "divide",
                                             {Value{std::int64_t{1}}, Value{std::int64_t{0}}}));
                }) == ErrorCode::DivisionByZero);
    }

    SECTION("double division by zero follows IEEE") {
        auto result = std::get<double>(invoke(registry, "divide", {Value{1.0}, Value{0.0}}));
        REQUIRE(result == std::numeric_limits<double>::infinity());
    }

    SECTION("bigint overflow") {
        const auto max = std::numeric_limits<std::int64_t>::max();
        REQUIRE(error_code_of([&] {
                    static_cast<void>(
                        invoke(registry, "add", {Value{max}, Value{std::int64_t{1}}}));
                }) == ErrorCode::NumericOverflow);
        REQUIRE(error_code_of([&] {
                    static_cast<void>(invoke(
                        registry, "negate", {Value{std::numeric_limits<std::int64_t>::min()}}));
                }) == ErrorCode::NumericOverflow);
    }
}

TEST_CASE("Builtin comparisons and strings", "[expr][functions]") {
    const auto registry = builtin_function_registry();

    REQUIRE(std::get<bool>(
        invoke(registry, "less_than", {Value{std::int64_t{1}}, Value{1.5}})));
    REQUIRE(std::get<bool>(invoke(registry, "equal",
                                  {Value{std::string{"a"}}, Value{std::string{"a"}}})));
    REQUIRE(std::get<bool>(invoke(registry, "greater_than", {Value{true}, Value{false}})));
    REQUIRE(std::get<std::int64_t>(invoke(registry, "length", {Value{std::string{"oryx"}}})) ==
            4);
    REQUIRE(std::get<std::string>(invoke(registry, "upper", {Value{std::string{"ab"}}})) == "AB");
    REQUIRE(std::get<std::string>(invoke(registry, "concat",
                                         {Value{std::string{"a"}}, Value{std::string{"b"}}})) ==
            "ab");
}

TEST_CASE("Operator names map to operators", "[expr][functions]") {
    REQUIRE(arithmetic_op_of("subtract") == ArithmeticOp::Sub);
    REQUIRE(compare_op_of("greater_than_or_equal") == CompareOp::Ge);
    REQUIRE_FALSE(arithmetic_op_of("length").has_value());
}
