#include <oryx/codegen/row_program.hpp>
#include <oryx/codegen/vector_program.hpp>
#include <oryx/core/error.hpp>
#include <oryx/expr/builder.hpp>
#include <oryx/gen/expression_compiler.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace oryx::gen {

namespace {

auto render(const expr::RowExpressionPtr& expression) -> std::string {
    return expression ? expression->to_string() : "<none>";
}

auto describe(const std::exception_ptr& error) -> std::string {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

void reject_null_projections(const std::vector<expr::RowExpressionPtr>& projections) {
    for (std::size_t i = 0; i < projections.size(); ++i) {
        if (projections[i] == nullptr) {
            throw std::invalid_argument(fmt::format("projection {} is null", i));
        }
    }
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace

// ─── Discriminator / CacheKey ─────────────────────────────────────────────────

auto Discriminator::hash() const noexcept -> std::size_t {
    return std::visit(
        [this](const auto& token) -> std::size_t {
            using T = std::decay_t<decltype(token)>;
            const auto kind = token_.index();
            if constexpr (std::is_same_v<T, std::monostate>) {
                return kind;
            } else {
                return hash_combine(kind, std::hash<T>{}(token));
            }
        },
        token_);
}

auto Discriminator::to_string() const -> std::string {
    return std::visit(
        [](const auto& token) -> std::string {
            using T = std::decay_t<decltype(token)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "default";
            } else if constexpr (std::is_same_v<T, const void*>) {
                return fmt::format("object@{}", token);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return fmt::format("id:{}", token);
            } else {
                return fmt::format("name:'{}'", token);
            }
        },
        token_);
}

CacheKey::CacheKey(expr::RowExpressionPtr filter, std::vector<expr::RowExpressionPtr> projections,
                   Discriminator discriminator)
    : filter_(std::move(filter)),
      projections_(std::move(projections)),
      discriminator_(std::move(discriminator)) {
    auto h = expr::hash_of(filter_);
    for (const auto& projection : projections_) {
        h = hash_combine(h, expr::hash_of(projection));
    }
    hash_ = hash_combine(h, discriminator_.hash());
}

auto CacheKey::to_string() const -> std::string {
    return fmt::format("CacheKey{{filter={}, projections={}, discriminator={}}}", render(filter_),
                       expr::format_list(projections_), discriminator_.to_string());
}

auto operator==(const CacheKey& lhs, const CacheKey& rhs) noexcept -> bool {
    return lhs.hash_ == rhs.hash_ && lhs.discriminator_ == rhs.discriminator_ &&
           expr::equivalent(lhs.filter_, rhs.filter_) &&
           expr::equivalent(lhs.projections_, rhs.projections_);
}

// ─── ExpressionCompiler ───────────────────────────────────────────────────────

ExpressionCompiler::ExpressionCompiler(
    std::shared_ptr<codegen::CursorCodeGenerator> cursor_generator,
    std::shared_ptr<codegen::PageFunctionGenerator> page_generator,
    ExpressionCompilerConfig config)
    : cursor_generator_(std::move(cursor_generator)),
      page_generator_(std::move(page_generator)),
      config_(config),
      cursor_cache_(config.cursor_cache_max_size,
                    [this](const CacheKey& key) { return generate_cursor_processor(key); }) {
    if (cursor_generator_ == nullptr || page_generator_ == nullptr) {
        throw std::invalid_argument("expression compiler requires both code generators");
    }
}

ExpressionCompiler::ExpressionCompiler(const expr::FunctionRegistry& functions,
                                       ExpressionCompilerConfig config)
    : ExpressionCompiler(std::make_shared<codegen::InterpretedCursorCodeGenerator>(functions),
                         std::make_shared<codegen::VectorizedPageFunctionGenerator>(functions),
                         config) {}

void ExpressionCompiler::fail_compilation(std::string_view what, const std::string& rendering,
                                          std::exception_ptr cause) {
    compilation_failures_.fetch_add(1, std::memory_order_relaxed);
    auto message = fmt::format("failed to compile {} {}: {}", what, rendering, describe(cause));
    spdlog::warn("{}: {}", error_code_name(ErrorCode::CompilerError), message);
    throw CompilationError(message, std::move(cause));
}

auto ExpressionCompiler::generate_cursor_processor(const CacheKey& key) -> CompiledCursor {
    // An absent filter accepts every row.
    const auto filter = key.filter() ? key.filter() : expr::boolean(true);
    const auto rendering =
        fmt::format("{{filter={}, projections={}}}", render(key.filter()),
                    expr::format_list(key.projections()));
    const auto start = std::chrono::steady_clock::now();

    CompiledCursor compiled;
    try {
        compiled = cursor_generator_->generate(filter, key.projections());
    } catch (...) {
        fail_compilation("cursor processor", rendering, std::current_exception());
    }
    if (compiled == nullptr) {
        fail_compilation("cursor processor", rendering,
                         std::make_exception_ptr(std::runtime_error("backend returned no artifact")));
    }
    spdlog::debug("compiled {} in {:.3f} ms", compiled->to_string(), elapsed_ms(start));
    return compiled;
}

auto ExpressionCompiler::compile_page_filter(const expr::RowExpressionPtr& filter)
    -> std::shared_ptr<const codegen::CompiledPageFilter> {
    const auto start = std::chrono::steady_clock::now();
    std::shared_ptr<const codegen::CompiledPageFilter> compiled;
    try {
        compiled = page_generator_->compile_filter(filter);
    } catch (...) {
        fail_compilation("page filter", filter->to_string(), std::current_exception());
    }
    if (compiled == nullptr) {
        fail_compilation("page filter", filter->to_string(),
                         std::make_exception_ptr(std::runtime_error("backend returned no artifact")));
    }
    page_functions_compiled_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("compiled page filter {} in {:.3f} ms", filter->to_string(), elapsed_ms(start));
    return compiled;
}

auto ExpressionCompiler::compile_page_projection(const expr::RowExpressionPtr& projection)
    -> std::shared_ptr<const codegen::CompiledPageProjection> {
    const auto start = std::chrono::steady_clock::now();
    std::shared_ptr<const codegen::CompiledPageProjection> compiled;
    try {
        compiled = page_generator_->compile_projection(projection);
    } catch (...) {
        fail_compilation("page projection", projection->to_string(), std::current_exception());
    }
    if (compiled == nullptr) {
        fail_compilation("page projection", projection->to_string(),
                         std::make_exception_ptr(std::runtime_error("backend returned no artifact")));
    }
    page_functions_compiled_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("compiled page projection {} in {:.3f} ms", projection->to_string(),
                  elapsed_ms(start));
    return compiled;
}

auto ExpressionCompiler::compile_cursor_processor(
    const expr::RowExpressionPtr& filter, const std::vector<expr::RowExpressionPtr>& projections,
    Discriminator discriminator) -> CursorProcessorFactory {
    reject_null_projections(projections);
    auto compiled = cursor_cache_.get(CacheKey{filter, projections, std::move(discriminator)});

    return [compiled]() -> std::unique_ptr<codegen::CursorProcessor> {
        std::unique_ptr<codegen::CursorProcessor> processor;
        try {
            processor = compiled->new_instance();
        } catch (...) {
            throw InstantiationError(
                fmt::format("failed to instantiate {}: {}", compiled->class_name(),
                            describe(std::current_exception())),
                std::current_exception());
        }
        if (processor == nullptr) {
            throw InstantiationError(
                fmt::format("failed to instantiate {}: no instance", compiled->class_name()));
        }
        return processor;
    };
}

auto ExpressionCompiler::compile_page_processor(
    const expr::RowExpressionPtr& filter, const std::vector<expr::RowExpressionPtr>& projections)
    -> PageProcessorFactory {
    reject_null_projections(projections);

    std::shared_ptr<const codegen::CompiledPageFilter> compiled_filter;
    if (filter != nullptr) {
        compiled_filter = compile_page_filter(filter);
    }
    std::vector<std::shared_ptr<const codegen::CompiledPageProjection>> compiled_projections;
    compiled_projections.reserve(projections.size());
    for (const auto& projection : projections) {
        compiled_projections.push_back(compile_page_projection(projection));
    }

    const auto max_batch_size = config_.page_processor_max_batch_size;
    return [compiled_filter, compiled_projections,
            max_batch_size]() -> std::unique_ptr<operator_::PageProcessor> {
        try {
            std::unique_ptr<codegen::PageFilter> filter_instance;
            if (compiled_filter != nullptr) {
                filter_instance = compiled_filter->new_instance();
            }
            std::vector<std::unique_ptr<codegen::PageProjection>> projection_instances;
            projection_instances.reserve(compiled_projections.size());
            for (const auto& projection : compiled_projections) {
                projection_instances.push_back(projection->new_instance());
            }
            return std::make_unique<operator_::PageProcessor>(
                std::move(filter_instance), std::move(projection_instances), max_batch_size);
        } catch (...) {
            throw InstantiationError(fmt::format("failed to instantiate page processor: {}",
                                                 describe(std::current_exception())),
                                     std::current_exception());
        }
    };
}

}  // namespace oryx::gen
