#pragma once

#include <oryx/core/type.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace oryx::expr {

class RowExpression;

/// Expressions are immutable and shared freely between threads.
using RowExpressionPtr = std::shared_ptr<const RowExpression>;

/// Reference to an input channel (page block or cursor field).
struct InputReference {
    std::int32_t field = 0;
};

struct Constant {
    Value value;
};

/// Invocation of a registered scalar function, resolved by name and argument types.
struct Call {
    std::string name;
    std::vector<RowExpressionPtr> arguments;
};

/// Forms with evaluation rules of their own (short circuit, null handling).
enum class Form : std::uint8_t {
    And,
    Or,
    Not,
    IsNull,
    If,
    Coalesce,
};

struct SpecialForm {
    Form form = Form::And;
    std::vector<RowExpressionPtr> arguments;
};

[[nodiscard]] auto form_name(Form form) noexcept -> std::string_view;

/// A typed scalar expression tree.
///
/// Equality is structural: two expressions are equal iff they have the same
/// type, node kind, payload and (recursively) equal arguments in order. The
/// hash is computed once at construction so keys built from large trees stay
/// cheap to hash.
class RowExpression {
   public:
    using Node = std::variant<InputReference, Constant, Call, SpecialForm>;

    RowExpression(ScalarType type, Node node);

    [[nodiscard]] auto type() const noexcept -> ScalarType { return type_; }
    [[nodiscard]] auto node() const noexcept -> const Node& { return node_; }
    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }

    /// Child expressions (empty for leaves).
    [[nodiscard]] auto arguments() const noexcept -> const std::vector<RowExpressionPtr>&;

    /// Diagnostic rendering, e.g. `greater_than(#0, 10)`.
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const RowExpression& lhs, const RowExpression& rhs) noexcept -> bool;

   private:
    ScalarType type_;
    Node node_;
    std::size_t hash_;
};

/// Structural equality over possibly-null pointers (null equals null).
[[nodiscard]] auto equivalent(const RowExpressionPtr& lhs, const RowExpressionPtr& rhs) noexcept
    -> bool;

[[nodiscard]] auto equivalent(const std::vector<RowExpressionPtr>& lhs,
                              const std::vector<RowExpressionPtr>& rhs) noexcept -> bool;

/// Hash of a possibly-null pointer, consistent with equivalent().
[[nodiscard]] auto hash_of(const RowExpressionPtr& expression) noexcept -> std::size_t;

/// Render `[a, b, ...]`.
[[nodiscard]] auto format_list(const std::vector<RowExpressionPtr>& expressions) -> std::string;

}  // namespace oryx::expr
