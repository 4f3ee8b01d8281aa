#include <oryx/expr/builder.hpp>
#include <oryx/expr/expression.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace oryx;
using namespace oryx::expr;

TEST_CASE("Values render for diagnostics", "[expr][type]") {
    REQUIRE(format_value(Value{}) == "null");
    REQUIRE(format_value(Value{true}) == "true");
    REQUIRE(format_value(Value{std::int64_t{42}}) == "42");
    REQUIRE(format_value(Value{2.5}) == "2.5");
    REQUIRE(format_value(Value{std::string{"abc"}}) == "'abc'");
    REQUIRE(format_value(Value{std::numeric_limits<double>::quiet_NaN()}) == "nan");
}

TEST_CASE("value_matches accepts NULL for every type", "[expr][type]") {
    REQUIRE(value_matches(ScalarType::Varchar, Value{}));
    REQUIRE(value_matches(ScalarType::Bigint, Value{std::int64_t{1}}));
    REQUIRE_FALSE(value_matches(ScalarType::Bigint, Value{1.0}));
    REQUIRE_FALSE(value_matches(ScalarType::Boolean, Value{std::string{"true"}}));
}

TEST_CASE("Expressions compare structurally", "[expr]") {
    auto a = compare("greater_than", field(0, ScalarType::Bigint), bigint(10));
    auto b = compare("greater_than", field(0, ScalarType::Bigint), bigint(10));

    REQUIRE(a != b);  // distinct objects
    REQUIRE(*a == *b);
    REQUIRE(a->hash() == b->hash());
    REQUIRE(equivalent(a, b));

    SECTION("any difference breaks equality") {
        REQUIRE_FALSE(*a == *compare("greater_than", field(1, ScalarType::Bigint), bigint(10)));
        REQUIRE_FALSE(*a == *compare("greater_than", field(0, ScalarType::Bigint), bigint(11)));
        REQUIRE_FALSE(*a == *compare("less_than", field(0, ScalarType::Bigint), bigint(10)));
        REQUIRE_FALSE(*field(0, ScalarType::Bigint) == *field(0, ScalarType::Double));
    }

    SECTION("argument order matters") {
        auto x = and_(boolean(true), boolean(false));
        auto y = and_(boolean(false), boolean(true));
        REQUIRE_FALSE(*x == *y);
    }
}

TEST_CASE("NaN constants are equal to themselves", "[expr]") {
    auto a = dbl(std::nan(""));
    auto b = dbl(std::nan(""));
    REQUIRE(*a == *b);
    REQUIRE(a->hash() == b->hash());
}

TEST_CASE("equivalent handles absent expressions", "[expr]") {
    RowExpressionPtr none;
    REQUIRE(equivalent(none, nullptr));
    REQUIRE_FALSE(equivalent(none, boolean(true)));
    REQUIRE(hash_of(none) == hash_of(nullptr));

    std::vector<RowExpressionPtr> lhs{field(0, ScalarType::Bigint), varchar("a")};
    std::vector<RowExpressionPtr> rhs{field(0, ScalarType::Bigint), varchar("a")};
    REQUIRE(equivalent(lhs, rhs));
    rhs.pop_back();
    REQUIRE_FALSE(equivalent(lhs, rhs));
}

TEST_CASE("Expressions render as text", "[expr]") {
    REQUIRE(field(3, ScalarType::Bigint)->to_string() == "#3");
    REQUIRE(arithmetic("add", field(0, ScalarType::Bigint), bigint(1))->to_string() ==
            "add(#0, 1)");
    REQUIRE(and_(boolean(true), expr::is_null(field(1, ScalarType::Varchar)))->to_string() ==
            "AND(true, IS_NULL(#1))");
    REQUIRE(if_(boolean(true), varchar("y"), null_of(ScalarType::Varchar))->to_string() ==
            "IF(true, 'y', null)");
    REQUIRE(format_list({field(0, ScalarType::Bigint), dbl(1.5)}) == "[#0, 1.5]");
    REQUIRE(format_list({}) == "[]");
}

TEST_CASE("Builders assign result types", "[expr]") {
    REQUIRE(arithmetic("add", bigint(1), bigint(2))->type() == ScalarType::Bigint);
    REQUIRE(arithmetic("add", bigint(1), dbl(2.0))->type() == ScalarType::Double);
    REQUIRE(compare("equal", varchar("a"), varchar("b"))->type() == ScalarType::Boolean);
    REQUIRE(if_(boolean(true), dbl(1.0))->type() == ScalarType::Double);
    REQUIRE(if_(boolean(true), dbl(1.0))->arguments().size() == 2);
    REQUIRE(coalesce(ScalarType::Varchar, {varchar("a")})->type() == ScalarType::Varchar);
}
