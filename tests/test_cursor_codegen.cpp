#include <oryx/codegen/row_program.hpp>
#include <oryx/codegen/type_check.hpp>
#include <oryx/core/error.hpp>
#include <oryx/expr/builder.hpp>
#include <oryx/expr/builtin_functions.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace oryx;
using namespace oryx::expr;
using oryx::codegen::CodeGenerationError;
using oryx::codegen::InterpretedCursorCodeGenerator;

namespace {

/// id (bigint), price (double, NULL at row 2), symbol (varchar), divisor (bigint, 0 at row 1)
auto trades() -> Page {
    return Page{std::vector<Block>{
        Block::bigints({1, 2, 3, 4}),
        Block::from_values(ScalarType::Double, {Value{10.0}, Value{20.0}, Value{}, Value{40.0}}),
        Block::varchars({"AAPL", "MSFT", "AAPL", "GOOG"}),
        Block::bigints({1, 0, 2, 4}),
    }};
}

/// Drive a processor over a page until it finishes; return every output row.
auto run_all(codegen::CursorProcessor& processor, const Page& page,
             const std::vector<ScalarType>& types) -> std::vector<std::vector<Value>> {
    cursor::PageRecordCursor cursor{page};
    PageBuilder builder{types};
    std::vector<std::vector<Value>> rows;
    for (;;) {
        auto output = processor.process(cursor, builder);
        auto out = builder.build();
        for (std::size_t r = 0; r < out.position_count(); ++r) {
            std::vector<Value> row;
            for (std::size_t c = 0; c < out.channel_count(); ++c) {
                row.push_back(out.block(c).get(r));
            }
            rows.push_back(std::move(row));
        }
        if (output.finished) {
            return rows;
        }
    }
}

auto first_column(const std::vector<std::vector<Value>>& rows) -> std::vector<Value> {
    std::vector<Value> out;
    for (const auto& row : rows) {
        out.push_back(row.at(0));
    }
    return out;
}

}  // namespace

TEST_CASE("Cursor processor filters and projects", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);

    auto filter = compare("greater_than", field(1, ScalarType::Double), dbl(15.0));
    const std::vector<RowExpressionPtr> projections = {
        field(2, ScalarType::Varchar),
        arithmetic("multiply", field(0, ScalarType::Bigint), bigint(100)),
    };
    auto compiled = generator.generate(filter, projections);
    REQUIRE(compiled->class_name().starts_with("CursorProcessor_"));

    auto processor = compiled->new_instance();
    auto rows = run_all(*processor, trades(), {ScalarType::Varchar, ScalarType::Bigint});

    // Row 3 has a NULL price, so the filter is NULL and the row is dropped.
    REQUIRE(rows.size() == 2);
    REQUIRE(std::get<std::string>(rows[0][0]) == "MSFT");
    REQUIRE(std::get<std::int64_t>(rows[0][1]) == 200);
    REQUIRE(std::get<std::string>(rows[1][0]) == "GOOG");
    REQUIRE(std::get<std::int64_t>(rows[1][1]) == 400);
    REQUIRE(processor->processed_positions() == 4);
}

TEST_CASE("Cursor processor describes itself", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);

    const std::vector<RowExpressionPtr> projections = {field(0, ScalarType::Bigint)};
    auto compiled = generator.generate(boolean(true), projections);
    REQUIRE(compiled->to_string() ==
            compiled->class_name() + "{filter=true, projections=[#0]}");
    REQUIRE(compiled->new_instance()->to_string() == compiled->to_string());
    REQUIRE(compiled->projections().size() == 1);
    REQUIRE(*compiled->filter() == *boolean(true));
}

TEST_CASE("Cursor processor stops when the page builder is full", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    const std::vector<RowExpressionPtr> projections = {field(0, ScalarType::Bigint)};
    auto processor = generator.generate(boolean(true), projections)->new_instance();

    cursor::PageRecordCursor cursor{trades()};
    PageBuilder builder({ScalarType::Bigint}, 3);

    auto first = processor->process(cursor, builder);
    REQUIRE_FALSE(first.finished);
    REQUIRE(first.processed_positions == 3);
    REQUIRE(builder.build().position_count() == 3);

    auto second = processor->process(cursor, builder);
    REQUIRE(second.finished);
    REQUIRE(second.processed_positions == 1);
    REQUIRE(builder.build().position_count() == 1);
}

TEST_CASE("Cursor processor short-circuits AND and OR", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    // id / divisor raises on row 2 (divisor 0) unless the guard skips it.
    auto quotient = arithmetic("divide", field(0, ScalarType::Bigint), field(3, ScalarType::Bigint));
    auto nonzero = compare("not_equal", field(3, ScalarType::Bigint), bigint(0));
    const std::vector<RowExpressionPtr> projections = {field(0, ScalarType::Bigint)};

    SECTION("AND stops at FALSE") {
        auto filter = and_(nonzero, compare("greater_than", quotient, bigint(0)));
        auto processor = generator.generate(filter, projections)->new_instance();
        auto rows = run_all(*processor, trades(), {ScalarType::Bigint});
        REQUIRE(first_column(rows) ==
                std::vector<Value>{Value{std::int64_t{1}}, Value{std::int64_t{3}},
                                   Value{std::int64_t{4}}});
    }

    SECTION("OR stops at TRUE") {
        auto filter = or_(not_(nonzero), compare("greater_than", quotient, bigint(1)));
        auto processor = generator.generate(filter, projections)->new_instance();
        auto rows = run_all(*processor, trades(), {ScalarType::Bigint});
        // Quotients are 1, -, 1, 1: only the zero-divisor row passes.
        REQUIRE(first_column(rows) == std::vector<Value>{Value{std::int64_t{2}}});
    }

    SECTION("unguarded division raises") {
        auto filter = compare("greater_than", quotient, bigint(0));
        auto processor = generator.generate(filter, projections)->new_instance();
        try {
            static_cast<void>(run_all(*processor, trades(), {ScalarType::Bigint}));
            FAIL("expected division by zero");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::DivisionByZero);
        }
    }
}

TEST_CASE("Cursor processor three-valued logic", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    auto price_high = compare("greater_than", field(1, ScalarType::Double), dbl(5.0));
    const std::vector<RowExpressionPtr> projections = {
        and_(price_high, boolean(true)),
        and_(price_high, boolean(false)),
        or_(price_high, boolean(true)),
        or_(price_high, boolean(false)),
        not_(price_high),
        expr::is_null(field(1, ScalarType::Double)),
    };
    auto processor = generator.generate(boolean(true), projections)->new_instance();
    auto rows = run_all(*processor, trades(), std::vector<ScalarType>(6, ScalarType::Boolean));

    // Row 3: price is NULL.
    const auto& null_row = rows.at(2);
    REQUIRE(is_null(null_row[0]));
    REQUIRE(std::get<bool>(null_row[1]) == false);
    REQUIRE(std::get<bool>(null_row[2]) == true);
    REQUIRE(is_null(null_row[3]));
    REQUIRE(is_null(null_row[4]));
    REQUIRE(std::get<bool>(null_row[5]) == true);

    const auto& row = rows.at(0);
    REQUIRE(std::get<bool>(row[0]));
    REQUIRE_FALSE(std::get<bool>(row[4]));
    REQUIRE_FALSE(std::get<bool>(row[5]));
}

TEST_CASE("Cursor processor IF and COALESCE", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    auto is_apple = compare("equal", field(2, ScalarType::Varchar), varchar("AAPL"));
    const std::vector<RowExpressionPtr> projections = {
        if_(is_apple, varchar("apple"), varchar("other")),
        if_(is_apple, field(0, ScalarType::Bigint)),
        coalesce(ScalarType::Double, {field(1, ScalarType::Double), dbl(-1.0)}),
        // The else branch would divide by zero on row 2; IF only evaluates the taken branch.
        if_(compare("equal", field(3, ScalarType::Bigint), bigint(0)), bigint(0),
            arithmetic("divide", field(0, ScalarType::Bigint), field(3, ScalarType::Bigint))),
    };
    auto processor = generator.generate(boolean(true), projections)->new_instance();
    auto rows = run_all(*processor, trades(),
                        {ScalarType::Varchar, ScalarType::Bigint, ScalarType::Double,
                         ScalarType::Bigint});

    REQUIRE(rows.size() == 4);
    REQUIRE(std::get<std::string>(rows[0][0]) == "apple");
    REQUIRE(std::get<std::string>(rows[1][0]) == "other");
    REQUIRE(std::get<std::int64_t>(rows[2][1]) == 3);
    REQUIRE(is_null(rows[3][1]));
    REQUIRE(std::get<double>(rows[1][2]) == 20.0);
    REQUIRE(std::get<double>(rows[2][2]) == -1.0);
    REQUIRE(std::get<std::int64_t>(rows[1][3]) == 0);
    REQUIRE(std::get<std::int64_t>(rows[3][3]) == 1);
}

TEST_CASE("Cursor processor calls registered functions", "[codegen][cursor]") {
    auto functions = builtin_function_registry();
    functions.register_scalar("ticker_rank", {ScalarType::Varchar}, ScalarType::Bigint,
                              [](std::span<const Value> args) -> Value {
                                  return std::get<std::string>(args[0]) == "AAPL"
                                             ? std::int64_t{1}
                                             : std::int64_t{2};
                              });
    InterpretedCursorCodeGenerator generator(functions);
    const std::vector<RowExpressionPtr> projections = {
        call("ticker_rank", ScalarType::Bigint, {field(2, ScalarType::Varchar)}),
        call("length", ScalarType::Bigint, {field(2, ScalarType::Varchar)}),
    };
    auto processor = generator.generate(boolean(true), projections)->new_instance();
    auto rows = run_all(*processor, trades(), {ScalarType::Bigint, ScalarType::Bigint});
    REQUIRE(std::get<std::int64_t>(rows[0][0]) == 1);
    REQUIRE(std::get<std::int64_t>(rows[1][0]) == 2);
    REQUIRE(std::get<std::int64_t>(rows[3][1]) == 4);
}

TEST_CASE("Compiled cursor processors survive later registrations", "[codegen][cursor]") {
    auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    const std::vector<RowExpressionPtr> projections = {
        call("length", ScalarType::Bigint, {field(2, ScalarType::Varchar)})};
    auto compiled = generator.generate(boolean(true), projections);

    // Grow the overload set of the compiled name and replace the compiled overload.
    for (auto type : {ScalarType::Bigint, ScalarType::Double, ScalarType::Boolean}) {
        functions.register_scalar("length", {type}, ScalarType::Bigint,
                                  [](std::span<const Value>) -> Value { return std::int64_t{0}; });
    }
    functions.register_scalar("length", {ScalarType::Varchar}, ScalarType::Bigint,
                              [](std::span<const Value>) -> Value { return std::int64_t{-1}; });

    auto processor = compiled->new_instance();
    auto rows = run_all(*processor, trades(), {ScalarType::Bigint});
    REQUIRE(first_column(rows) ==
            std::vector<Value>{Value{std::int64_t{4}}, Value{std::int64_t{4}},
                               Value{std::int64_t{4}}, Value{std::int64_t{4}}});

    auto recompiled = generator.generate(boolean(true), projections)->new_instance();
    auto replaced = run_all(*recompiled, trades(), {ScalarType::Bigint});
    REQUIRE(std::get<std::int64_t>(replaced[0][0]) == -1);
}

TEST_CASE("Cursor processor instances are independent", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    const std::vector<RowExpressionPtr> projections = {field(0, ScalarType::Bigint)};
    auto compiled = generator.generate(boolean(true), projections);

    auto a = compiled->new_instance();
    auto b = compiled->new_instance();
    REQUIRE(a != b);
    static_cast<void>(run_all(*a, trades(), {ScalarType::Bigint}));
    REQUIRE(a->processed_positions() == 4);
    REQUIRE(b->processed_positions() == 0);

    SECTION("instances outlive the artifact handle") {
        auto orphan = compiled->new_instance();
        compiled.reset();
        REQUIRE(run_all(*orphan, trades(), {ScalarType::Bigint}).size() == 4);
    }
}

TEST_CASE("Cursor code generation rejects ill-typed expressions", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);
    const std::vector<RowExpressionPtr> none;

    SECTION("non-boolean filter") {
        REQUIRE_THROWS_AS(generator.generate(field(0, ScalarType::Bigint), none),
                          CodeGenerationError);
    }

    SECTION("unknown function") {
        const std::vector<RowExpressionPtr> projections = {
            call("no_such_fn", ScalarType::Bigint, {field(0, ScalarType::Bigint)})};
        REQUIRE_THROWS_AS(generator.generate(boolean(true), projections), CodeGenerationError);
    }

    SECTION("declared type disagrees with the overload") {
        const std::vector<RowExpressionPtr> projections = {
            call("add", ScalarType::Varchar, {bigint(1), bigint(2)})};
        REQUIRE_THROWS_AS(generator.generate(boolean(true), projections), CodeGenerationError);
    }

    SECTION("absent filter") {
        REQUIRE_THROWS_AS(generator.generate(nullptr, none), CodeGenerationError);
    }
}

TEST_CASE("Cursor processor reports input errors at run time", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    InterpretedCursorCodeGenerator generator(functions);

    SECTION("field type differs from the cursor") {
        const std::vector<RowExpressionPtr> projections = {field(2, ScalarType::Bigint)};
        auto processor = generator.generate(boolean(true), projections)->new_instance();
        try {
            static_cast<void>(run_all(*processor, trades(), {ScalarType::Bigint}));
            FAIL("expected a type mismatch");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::TypeMismatch);
        }
    }

    SECTION("field beyond the cursor") {
        const std::vector<RowExpressionPtr> projections = {field(9, ScalarType::Bigint)};
        auto processor = generator.generate(boolean(true), projections)->new_instance();
        try {
            static_cast<void>(run_all(*processor, trades(), {ScalarType::Bigint}));
            FAIL("expected invalid input");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::InvalidInput);
        }
    }

    SECTION("page builder channel count differs") {
        const std::vector<RowExpressionPtr> projections = {field(0, ScalarType::Bigint)};
        auto processor = generator.generate(boolean(true), projections)->new_instance();
        cursor::PageRecordCursor cursor{trades()};
        PageBuilder builder({ScalarType::Bigint, ScalarType::Bigint});
        REQUIRE_THROWS_AS(processor->process(cursor, builder), OryxException);
    }

    SECTION("page builder channel type differs") {
        const std::vector<RowExpressionPtr> projections = {
            field(0, ScalarType::Bigint), field(2, ScalarType::Varchar)};
        auto processor = generator.generate(boolean(true), projections)->new_instance();
        cursor::PageRecordCursor cursor{trades()};
        PageBuilder builder({ScalarType::Bigint, ScalarType::Bigint});
        try {
            static_cast<void>(processor->process(cursor, builder));
            FAIL("expected a type mismatch");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::TypeMismatch);
        }
        // Nothing was appended, so the builder is still consistent.
        REQUIRE(processor->processed_positions() == 0);
        REQUIRE(builder.build().position_count() == 0);
    }
}

TEST_CASE("Row programs disassemble", "[codegen][cursor]") {
    const auto functions = builtin_function_registry();
    auto program = codegen::lower_row_program(
        *and_(compare("greater_than", field(0, ScalarType::Bigint), bigint(1)), boolean(true)),
        functions);
    const auto listing = program.disassemble();
    REQUIRE(listing.find("load_field") != std::string::npos);
    REQUIRE(listing.find("invoke") != std::string::npos);
    REQUIRE(listing.find("jump_if_false") != std::string::npos);
    REQUIRE(program.type == ScalarType::Boolean);
}

TEST_CASE("Type checker", "[codegen][types]") {
    const auto functions = builtin_function_registry();

    REQUIRE(codegen::check_filter(*compare("less_than", bigint(1), dbl(2.0)), functions));
    REQUIRE_FALSE(codegen::check_filter(*bigint(1), functions));
    REQUIRE_FALSE(codegen::check_expression(*constant(Value{1.0}, ScalarType::Bigint), functions));
    REQUIRE_FALSE(codegen::check_expression(
        *special(Form::And, ScalarType::Boolean, {boolean(true)}), functions));
    REQUIRE_FALSE(codegen::check_expression(*if_(bigint(1), bigint(2)), functions));
    REQUIRE_FALSE(codegen::check_expression(
        *coalesce(ScalarType::Bigint, {bigint(1), dbl(2.0)}), functions));

    auto unknown = codegen::check_expression(*call("frobnicate", ScalarType::Bigint, {}), functions);
    REQUIRE_FALSE(unknown);
    REQUIRE(unknown.error().find("frobnicate") != std::string::npos);

    auto channels = codegen::input_channels(
        *and_(compare("equal", field(3, ScalarType::Bigint), field(1, ScalarType::Bigint)),
              expr::is_null(field(3, ScalarType::Varchar))));
    REQUIRE(channels == std::vector<std::int32_t>{1, 3});
}
