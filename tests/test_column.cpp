#include <oryx/core/column.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/page.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace oryx;

TEST_CASE("Column<int> basic operations", "[core][column]") {
    Column<int> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column gather copies selected positions in order", "[core][column]") {
    Column<std::string> col{"a", "b", "c", "d"};
    const std::vector<std::int32_t> positions{0, 2, 3};

    auto picked = col.gather(positions);

    REQUIRE(picked.size() == 3);
    REQUIRE(picked[0] == "a");
    REQUIRE(picked[1] == "c");
    REQUIRE(picked[2] == "d");
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    Column<double> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Block typed factories", "[core][block]") {
    auto prices = Block::doubles({1.5, 2.5});
    REQUIRE(prices.type() == ScalarType::Double);
    REQUIRE(prices.size() == 2);
    REQUIRE_FALSE(prices.may_have_nulls());
    REQUIRE(std::get<double>(prices.get(1)) == 2.5);

    auto flags = Block::booleans({true, false});
    REQUIRE(flags.type() == ScalarType::Boolean);
    REQUIRE(std::get<bool>(flags.get(0)));
    REQUIRE_FALSE(std::get<bool>(flags.get(1)));
}

TEST_CASE("Block null mask", "[core][block]") {
    auto block = Block::from_values(ScalarType::Bigint, {Value{std::int64_t{1}}, Value{},
                                                         Value{std::int64_t{3}}});

    REQUIRE(block.may_have_nulls());
    REQUIRE_FALSE(block.is_null(0));
    REQUIRE(block.is_null(1));
    REQUIRE(is_null(block.get(1)));
    REQUIRE(std::get<std::int64_t>(block.get(2)) == 3);

    SECTION("an all-clear mask is dropped") {
        Block clean{ScalarType::Bigint, Column<std::int64_t>{std::vector<std::int64_t>{1, 2}},
                    {0, 0}};
        REQUIRE_FALSE(clean.may_have_nulls());
    }

    SECTION("gather carries the mask") {
        const std::vector<std::int32_t> positions{1, 2};
        auto picked = block.gather(positions);
        REQUIRE(picked.size() == 2);
        REQUIRE(picked.is_null(0));
        REQUIRE_FALSE(picked.is_null(1));
    }
}

TEST_CASE("Block rejects inconsistent storage", "[core][block]") {
    REQUIRE_THROWS_AS(Block(ScalarType::Varchar, Column<std::int64_t>{}), OryxException);
    REQUIRE_THROWS_AS(Block(ScalarType::Bigint,
                            Column<std::int64_t>{std::vector<std::int64_t>{1, 2}}, {0}),
                      OryxException);
}

TEST_CASE("Block broadcast", "[core][block]") {
    auto repeated = Block::broadcast(ScalarType::Varchar, Value{std::string{"x"}}, 3);
    REQUIRE(repeated.size() == 3);
    REQUIRE(std::get<std::string>(repeated.get(2)) == "x");

    auto nulls = Block::broadcast(ScalarType::Double, Value{}, 2);
    REQUIRE(nulls.is_null(0));
    REQUIRE(nulls.is_null(1));

    REQUIRE_THROWS_AS(Block::broadcast(ScalarType::Bigint, Value{1.0}, 1), OryxException);
}

TEST_CASE("BlockBuilder appends and resets", "[core][block]") {
    BlockBuilder builder(ScalarType::Varchar);
    builder.append(Value{std::string{"a"}});
    builder.append_null();
    REQUIRE(builder.size() == 2);

    auto block = builder.build();
    REQUIRE(block.size() == 2);
    REQUIRE(block.is_null(1));
    REQUIRE(builder.size() == 0);

    SECTION("type-checked append") {
        try {
            builder.append(Value{std::int64_t{1}});
            FAIL("expected a type mismatch");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::TypeMismatch);
        }
    }
}

TEST_CASE("Page validates block sizes", "[core][page]") {
    Page page{std::vector<Block>{Block::bigints({1, 2, 3}), Block::varchars({"a", "b", "c"})}};
    REQUIRE(page.position_count() == 3);
    REQUIRE(page.channel_count() == 2);
    REQUIRE(page.block(1).type() == ScalarType::Varchar);

    SECTION("missing channel") {
        try {
            static_cast<void>(page.block(2));
            FAIL("expected an invalid input error");
        } catch (const OryxException& e) {
            REQUIRE(e.code() == ErrorCode::InvalidInput);
        }
    }

    SECTION("mismatched sizes") {
        REQUIRE_THROWS_AS(
            (Page{std::vector<Block>{Block::bigints({1, 2}), Block::bigints({1})}}),
            OryxException);
    }

    SECTION("zero channels keep their position count") {
        Page empty{5, {}};
        REQUIRE(empty.position_count() == 5);
        REQUIRE(empty.channel_count() == 0);
    }
}

TEST_CASE("PageBuilder fills to capacity", "[core][page]") {
    PageBuilder builder({ScalarType::Bigint, ScalarType::Boolean}, 2);
    REQUIRE(builder.is_empty());

    builder.block_builder(0).append(Value{std::int64_t{7}});
    builder.block_builder(1).append(Value{true});
    builder.declare_position();
    REQUIRE_FALSE(builder.is_full());

    builder.block_builder(0).append_null();
    builder.block_builder(1).append(Value{false});
    builder.declare_position();
    REQUIRE(builder.is_full());

    auto page = builder.build();
    REQUIRE(page.position_count() == 2);
    REQUIRE(page.block(0).is_null(1));
    REQUIRE(builder.is_empty());
    REQUIRE(builder.block_builder(0).size() == 0);
}
