#pragma once

#include <oryx/cache/loading_cache.hpp>
#include <oryx/codegen/cursor_processor.hpp>
#include <oryx/codegen/page_function.hpp>
#include <oryx/expr/expression.hpp>
#include <oryx/expr/function_registry.hpp>
#include <oryx/operator/page_processor.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oryx::gen {

/// Opaque token that separates cache entries for structurally identical
/// expression sets. Equal iff both hold the same kind and value.
class Discriminator {
   public:
    /// The default token shared by every caller that does not supply one.
    Discriminator() = default;

    [[nodiscard]] static auto identity(const void* object) -> Discriminator {
        return Discriminator{Token{object}};
    }
    [[nodiscard]] static auto id(std::uint64_t value) -> Discriminator {
        return Discriminator{Token{value}};
    }
    [[nodiscard]] static auto name(std::string value) -> Discriminator {
        return Discriminator{Token{std::move(value)}};
    }

    [[nodiscard]] auto is_default() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(token_);
    }
    [[nodiscard]] auto hash() const noexcept -> std::size_t;
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Discriminator&, const Discriminator&) -> bool = default;

   private:
    using Token = std::variant<std::monostate, const void*, std::uint64_t, std::string>;

    explicit Discriminator(Token token) : token_(std::move(token)) {}

    Token token_;
};

/// Key of the cursor processor cache.
///
/// Equality and hash are structural over the filter (absent equals absent)
/// and the projections in order, and value-based over the discriminator.
class CacheKey {
   public:
    CacheKey(expr::RowExpressionPtr filter, std::vector<expr::RowExpressionPtr> projections,
             Discriminator discriminator = {});

    [[nodiscard]] auto filter() const noexcept -> const expr::RowExpressionPtr& { return filter_; }
    [[nodiscard]] auto projections() const noexcept -> const std::vector<expr::RowExpressionPtr>& {
        return projections_;
    }
    [[nodiscard]] auto discriminator() const noexcept -> const Discriminator& {
        return discriminator_;
    }
    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const CacheKey& lhs, const CacheKey& rhs) noexcept -> bool;

   private:
    expr::RowExpressionPtr filter_;
    std::vector<expr::RowExpressionPtr> projections_;
    Discriminator discriminator_;
    std::size_t hash_;
};

struct CacheKeyHash {
    auto operator()(const CacheKey& key) const noexcept -> std::size_t { return key.hash(); }
};

struct ExpressionCompilerConfig {
    /// Maximum number of compiled cursor processors retained.
    std::size_t cursor_cache_max_size = 1000;
    /// Maximum rows per output page of a PageProcessor.
    std::size_t page_processor_max_batch_size = operator_::PageProcessor::kDefaultMaxBatchSize;
};

/// Each invocation returns a new, independent processor. Throws
/// InstantiationError when the compiled artifact cannot be instantiated.
using CursorProcessorFactory = std::function<std::unique_ptr<codegen::CursorProcessor>()>;
using PageProcessorFactory = std::function<std::unique_ptr<operator_::PageProcessor>()>;

/// Compiles filter/projection expressions into processor factories.
///
/// Cursor processors are cached by (filter, projections, discriminator) and
/// compiled at most once per key at a time; concurrent requests for the same
/// key share one compilation. Page processors are compiled on every call and
/// reused through the factory the caller keeps.
///
/// Every backend failure surfaces as CompilationError. Thread-safe.
class ExpressionCompiler {
   public:
    ExpressionCompiler(std::shared_ptr<codegen::CursorCodeGenerator> cursor_generator,
                       std::shared_ptr<codegen::PageFunctionGenerator> page_generator,
                       ExpressionCompilerConfig config = {});

    /// Reference backends over `functions`, which must outlive the compiler.
    explicit ExpressionCompiler(const expr::FunctionRegistry& functions,
                                ExpressionCompilerConfig config = {});

    ExpressionCompiler(const ExpressionCompiler&) = delete;
    auto operator=(const ExpressionCompiler&) -> ExpressionCompiler& = delete;

    /// `filter` may be null (accept every row). Throws std::invalid_argument
    /// for a null projection and CompilationError when generation fails.
    [[nodiscard]] auto compile_cursor_processor(
        const expr::RowExpressionPtr& filter,
        const std::vector<expr::RowExpressionPtr>& projections, Discriminator discriminator = {})
        -> CursorProcessorFactory;

    /// `filter` may be null (no filtering). Compiles the filter and every
    /// projection eagerly; any failure aborts the call with CompilationError.
    [[nodiscard]] auto compile_page_processor(
        const expr::RowExpressionPtr& filter,
        const std::vector<expr::RowExpressionPtr>& projections) -> PageProcessorFactory;

    [[nodiscard]] auto cache_size() const -> std::size_t { return cursor_cache_.size(); }
    [[nodiscard]] auto cursor_cache_stats() const -> cache::CacheStats {
        return cursor_cache_.stats();
    }
    [[nodiscard]] auto page_functions_compiled() const noexcept -> std::uint64_t {
        return page_functions_compiled_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto compilation_failures() const noexcept -> std::uint64_t {
        return compilation_failures_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto config() const noexcept -> const ExpressionCompilerConfig& {
        return config_;
    }

    /// Drop every cached cursor processor. Factories already returned keep working.
    void invalidate_cache() { cursor_cache_.invalidate_all(); }

   private:
    using CompiledCursor = std::shared_ptr<const codegen::CompiledCursorProcessor>;

    auto generate_cursor_processor(const CacheKey& key) -> CompiledCursor;
    auto compile_page_filter(const expr::RowExpressionPtr& filter)
        -> std::shared_ptr<const codegen::CompiledPageFilter>;
    auto compile_page_projection(const expr::RowExpressionPtr& projection)
        -> std::shared_ptr<const codegen::CompiledPageProjection>;

    [[noreturn]] void fail_compilation(std::string_view what, const std::string& rendering,
                                       std::exception_ptr cause);

    std::shared_ptr<codegen::CursorCodeGenerator> cursor_generator_;
    std::shared_ptr<codegen::PageFunctionGenerator> page_generator_;
    ExpressionCompilerConfig config_;
    cache::LoadingCache<CacheKey, CompiledCursor, CacheKeyHash> cursor_cache_;
    std::atomic<std::uint64_t> page_functions_compiled_{0};
    std::atomic<std::uint64_t> compilation_failures_{0};
};

}  // namespace oryx::gen
