#include <oryx/oryx.hpp>

#include <fmt/core.h>

auto main() -> int {
    using namespace oryx;

    // A page of trades: price (bigint), quantity (double), symbol (varchar)
    Page trades{std::vector<Block>{
        Block::bigints({100, 250, 50, 175, 320}),
        Block::doubles({1.5, 2.0, 10.0, 0.5, 3.0}),
        Block::varchars({"AAPL", "MSFT", "AAPL", "GOOG", "MSFT"}),
    }};

    auto functions = expr::builtin_function_registry();
    gen::ExpressionCompiler compiler(functions);

    // price > 100, projecting symbol and price * quantity
    auto filter =
        expr::compare("greater_than", expr::field(0, ScalarType::Bigint), expr::bigint(100));
    std::vector<expr::RowExpressionPtr> projections{
        expr::field(2, ScalarType::Varchar),
        expr::arithmetic("multiply", expr::field(0, ScalarType::Bigint),
                         expr::field(1, ScalarType::Double)),
    };

    fmt::print("=== Row at a time ===\n");
    auto cursor_factory = compiler.compile_cursor_processor(filter, projections);
    auto processor = cursor_factory();
    fmt::print("{}\n", processor->to_string());

    cursor::PageRecordCursor cursor{trades};
    PageBuilder page_builder{std::vector<ScalarType>{ScalarType::Varchar, ScalarType::Double}};
    auto output = processor->process(cursor, page_builder);
    auto rows = page_builder.build();
    fmt::print("read {} rows, kept {}\n", output.processed_positions, rows.position_count());
    for (std::size_t i = 0; i < rows.position_count(); ++i) {
        fmt::print("  {} {}\n", format_value(rows.block(0).get(i)),
                   format_value(rows.block(1).get(i)));
    }

    // The second request for the same expressions is served from the cache.
    auto again = compiler.compile_cursor_processor(filter, projections);
    fmt::print("same artifact: {}\n", again()->to_string() == processor->to_string());
    auto stats = compiler.cursor_cache_stats();
    fmt::print("cache: size={}, hits={}, misses={}\n", compiler.cache_size(), stats.hit_count,
               stats.miss_count);

    fmt::print("\n=== Column at a time ===\n");
    auto page_factory = compiler.compile_page_processor(filter, projections);
    auto page_processor = page_factory();
    for (const auto& page : page_processor->process(trades)) {
        fmt::print("page with {} rows, {} channels\n", page.position_count(),
                   page.channel_count());
    }
    fmt::print("page functions compiled: {}\n", compiler.page_functions_compiled());

    return 0;
}
