#include <oryx/codegen/type_check.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace oryx::codegen {

namespace {

using expr::Form;
using expr::RowExpression;

auto check_arguments_present(const RowExpression& expression) -> std::expected<void, std::string> {
    for (const auto& argument : expression.arguments()) {
        if (argument == nullptr) {
            return std::unexpected(fmt::format("missing argument in {}", expression.to_string()));
        }
    }
    return {};
}

auto check_form(const RowExpression& expression, const expr::SpecialForm& form)
    -> std::expected<void, std::string> {
    const auto& args = form.arguments;
    const auto name = expr::form_name(form.form);
    auto all_of_type = [&](std::size_t first, ScalarType type) {
        return std::all_of(args.begin() + static_cast<std::ptrdiff_t>(first), args.end(),
                           [type](const auto& a) { return a->type() == type; });
    };

    switch (form.form) {
        case Form::And:
        case Form::Or:
            if (args.size() < 2) {
                return std::unexpected(fmt::format("{} requires at least two arguments", name));
            }
            if (!all_of_type(0, ScalarType::Boolean)) {
                return std::unexpected(fmt::format("{} arguments must be boolean", name));
            }
            break;
        case Form::Not:
            if (args.size() != 1 || args[0]->type() != ScalarType::Boolean) {
                return std::unexpected("NOT requires one boolean argument");
            }
            break;
        case Form::IsNull:
            if (args.size() != 1) {
                return std::unexpected("IS_NULL requires one argument");
            }
            break;
        case Form::If:
            if (args.size() != 2 && args.size() != 3) {
                return std::unexpected("IF requires a condition and one or two branches");
            }
            if (args[0]->type() != ScalarType::Boolean) {
                return std::unexpected("IF condition must be boolean");
            }
            if (!all_of_type(1, expression.type())) {
                return std::unexpected(fmt::format("IF branches must be {}",
                                                   type_name(expression.type())));
            }
            return {};
        case Form::Coalesce:
            if (args.empty()) {
                return std::unexpected("COALESCE requires at least one argument");
            }
            if (!all_of_type(0, expression.type())) {
                return std::unexpected(fmt::format("COALESCE arguments must be {}",
                                                   type_name(expression.type())));
            }
            return {};
    }
    if (expression.type() != ScalarType::Boolean) {
        return std::unexpected(fmt::format("{} must be declared boolean, not {}", name,
                                           type_name(expression.type())));
    }
    return {};
}

auto check_call(const RowExpression& expression, const expr::Call& call,
                const expr::FunctionRegistry& functions) -> std::expected<void, std::string> {
    std::vector<ScalarType> argument_types;
    argument_types.reserve(call.arguments.size());
    for (const auto& argument : call.arguments) {
        argument_types.push_back(argument->type());
    }
    auto function = functions.resolve(call.name, argument_types);
    if (function == nullptr) {
        std::vector<std::string> names;
        for (auto type : argument_types) {
            names.emplace_back(type_name(type));
        }
        if (!functions.contains(call.name)) {
            return std::unexpected(fmt::format("function '{}' not registered", call.name));
        }
        return std::unexpected(fmt::format("no overload of '{}' accepts ({})", call.name,
                                           fmt::join(names, ", ")));
    }
    if (function->signature.return_type != expression.type()) {
        return std::unexpected(fmt::format("{} returns {}, but the call is declared {}",
                                           function->signature.to_string(),
                                           type_name(function->signature.return_type),
                                           type_name(expression.type())));
    }
    return {};
}

void collect_channels(const RowExpression& expression, std::vector<std::int32_t>& out) {
    if (const auto* ref = std::get_if<expr::InputReference>(&expression.node())) {
        out.push_back(ref->field);
        return;
    }
    for (const auto& argument : expression.arguments()) {
        if (argument != nullptr) {
            collect_channels(*argument, out);
        }
    }
}

}  // namespace

auto check_expression(const RowExpression& expression, const expr::FunctionRegistry& functions)
    -> std::expected<void, std::string> {
    if (auto present = check_arguments_present(expression); !present) {
        return present;
    }
    for (const auto& argument : expression.arguments()) {
        if (auto checked = check_expression(*argument, functions); !checked) {
            return checked;
        }
    }
    return std::visit(
        [&](const auto& node) -> std::expected<void, std::string> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::InputReference>) {
                if (node.field < 0) {
                    return std::unexpected(fmt::format("invalid input channel {}", node.field));
                }
                return {};
            } else if constexpr (std::is_same_v<T, expr::Constant>) {
                if (!value_matches(expression.type(), node.value)) {
                    return std::unexpected(fmt::format("constant {} is not a {}",
                                                       format_value(node.value),
                                                       type_name(expression.type())));
                }
                return {};
            } else if constexpr (std::is_same_v<T, expr::Call>) {
                return check_call(expression, node, functions);
            } else {
                return check_form(expression, node);
            }
        },
        expression.node());
}

auto check_filter(const RowExpression& filter, const expr::FunctionRegistry& functions)
    -> std::expected<void, std::string> {
    if (filter.type() != ScalarType::Boolean) {
        return std::unexpected(fmt::format("filter must be boolean, not {}: {}",
                                           type_name(filter.type()), filter.to_string()));
    }
    return check_expression(filter, functions);
}

auto input_channels(const RowExpression& expression) -> std::vector<std::int32_t> {
    std::vector<std::int32_t> channels;
    collect_channels(expression, channels);
    std::ranges::sort(channels);
    channels.erase(std::unique(channels.begin(), channels.end()), channels.end());
    return channels;
}

}  // namespace oryx::codegen
