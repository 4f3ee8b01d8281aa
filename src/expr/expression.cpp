#include <oryx/expr/expression.hpp>

#include <fmt/format.h>

#include <functional>

namespace oryx::expr {

namespace {

const std::vector<RowExpressionPtr> kNoArguments;

auto hash_arguments(std::size_t seed, const std::vector<RowExpressionPtr>& arguments) noexcept
    -> std::size_t {
    for (const auto& argument : arguments) {
        seed = hash_combine(seed, hash_of(argument));
    }
    return hash_combine(seed, arguments.size());
}

auto compute_hash(ScalarType type, const RowExpression::Node& node) noexcept -> std::size_t {
    std::size_t seed = hash_combine(static_cast<std::size_t>(type), node.index());
    return std::visit(
        [seed](const auto& n) -> std::size_t {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, InputReference>) {
                return hash_combine(seed, std::hash<std::int32_t>{}(n.field));
            } else if constexpr (std::is_same_v<T, Constant>) {
                return hash_combine(seed, hash_value(n.value));
            } else if constexpr (std::is_same_v<T, Call>) {
                return hash_arguments(hash_combine(seed, std::hash<std::string>{}(n.name)),
                                      n.arguments);
            } else {
                return hash_arguments(hash_combine(seed, static_cast<std::size_t>(n.form)),
                                      n.arguments);
            }
        },
        node);
}

auto join_arguments(const std::vector<RowExpressionPtr>& arguments) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(arguments[i] ? arguments[i]->to_string() : "<null>");
    }
    return out;
}

}  // namespace

auto form_name(Form form) noexcept -> std::string_view {
    switch (form) {
        case Form::And:
            return "AND";
        case Form::Or:
            return "OR";
        case Form::Not:
            return "NOT";
        case Form::IsNull:
            return "IS_NULL";
        case Form::If:
            return "IF";
        case Form::Coalesce:
            return "COALESCE";
    }
    return "UNKNOWN";
}

RowExpression::RowExpression(ScalarType type, Node node)
    : type_(type), node_(std::move(node)), hash_(compute_hash(type_, node_)) {}

auto RowExpression::arguments() const noexcept -> const std::vector<RowExpressionPtr>& {
    if (const auto* call = std::get_if<Call>(&node_)) {
        return call->arguments;
    }
    if (const auto* form = std::get_if<SpecialForm>(&node_)) {
        return form->arguments;
    }
    return kNoArguments;
}

auto RowExpression::to_string() const -> std::string {
    return std::visit(
        [](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, InputReference>) {
                return fmt::format("#{}", n.field);
            } else if constexpr (std::is_same_v<T, Constant>) {
                return format_value(n.value);
            } else if constexpr (std::is_same_v<T, Call>) {
                return fmt::format("{}({})", n.name, join_arguments(n.arguments));
            } else {
                return fmt::format("{}({})", form_name(n.form), join_arguments(n.arguments));
            }
        },
        node_);
}

auto operator==(const RowExpression& lhs, const RowExpression& rhs) noexcept -> bool {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.hash_ != rhs.hash_ || lhs.type_ != rhs.type_ || lhs.node_.index() != rhs.node_.index()) {
        return false;
    }
    return std::visit(
        [&rhs](const auto& l) -> bool {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs.node_);
            if constexpr (std::is_same_v<T, InputReference>) {
                return l.field == r.field;
            } else if constexpr (std::is_same_v<T, Constant>) {
                return values_identical(l.value, r.value);
            } else if constexpr (std::is_same_v<T, Call>) {
                return l.name == r.name && equivalent(l.arguments, r.arguments);
            } else {
                return l.form == r.form && equivalent(l.arguments, r.arguments);
            }
        },
        lhs.node_);
}

auto equivalent(const RowExpressionPtr& lhs, const RowExpressionPtr& rhs) noexcept -> bool {
    if (lhs == rhs) {
        return true;
    }
    if (lhs == nullptr || rhs == nullptr) {
        return false;
    }
    return *lhs == *rhs;
}

auto equivalent(const std::vector<RowExpressionPtr>& lhs,
                const std::vector<RowExpressionPtr>& rhs) noexcept -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!equivalent(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

auto hash_of(const RowExpressionPtr& expression) noexcept -> std::size_t {
    return expression ? expression->hash() : 0x51ed270b27a4f3c1ULL;
}

auto format_list(const std::vector<RowExpressionPtr>& expressions) -> std::string {
    return fmt::format("[{}]", join_arguments(expressions));
}

}  // namespace oryx::expr
