#include <oryx/expr/builder.hpp>

namespace oryx::expr {

auto field(std::int32_t channel, ScalarType type) -> RowExpressionPtr {
    return std::make_shared<const RowExpression>(type, InputReference{.field = channel});
}

auto constant(Value value, ScalarType type) -> RowExpressionPtr {
    return std::make_shared<const RowExpression>(type, Constant{.value = std::move(value)});
}

auto boolean(bool v) -> RowExpressionPtr {
    return constant(Value{v}, ScalarType::Boolean);
}

auto bigint(std::int64_t v) -> RowExpressionPtr {
    return constant(Value{v}, ScalarType::Bigint);
}

auto dbl(double v) -> RowExpressionPtr {
    return constant(Value{v}, ScalarType::Double);
}

auto varchar(std::string v) -> RowExpressionPtr {
    return constant(Value{std::move(v)}, ScalarType::Varchar);
}

auto null_of(ScalarType type) -> RowExpressionPtr {
    return constant(Value{}, type);
}

auto call(std::string name, ScalarType type, std::vector<RowExpressionPtr> args)
    -> RowExpressionPtr {
    return std::make_shared<const RowExpression>(
        type, Call{.name = std::move(name), .arguments = std::move(args)});
}

auto special(Form form, ScalarType type, std::vector<RowExpressionPtr> args) -> RowExpressionPtr {
    return std::make_shared<const RowExpression>(
        type, SpecialForm{.form = form, .arguments = std::move(args)});
}

auto and_(RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr {
    return special(Form::And, ScalarType::Boolean, {std::move(l), std::move(r)});
}

auto or_(RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr {
    return special(Form::Or, ScalarType::Boolean, {std::move(l), std::move(r)});
}

auto not_(RowExpressionPtr operand) -> RowExpressionPtr {
    return special(Form::Not, ScalarType::Boolean, {std::move(operand)});
}

auto is_null(RowExpressionPtr operand) -> RowExpressionPtr {
    return special(Form::IsNull, ScalarType::Boolean, {std::move(operand)});
}

auto if_(RowExpressionPtr condition, RowExpressionPtr then_value, RowExpressionPtr else_value)
    -> RowExpressionPtr {
    auto type = then_value ? then_value->type() : ScalarType::Boolean;
    if (else_value == nullptr) {
        return special(Form::If, type, {std::move(condition), std::move(then_value)});
    }
    return special(Form::If, type,
                   {std::move(condition), std::move(then_value), std::move(else_value)});
}

auto coalesce(ScalarType type, std::vector<RowExpressionPtr> args) -> RowExpressionPtr {
    return special(Form::Coalesce, type, std::move(args));
}

auto compare(std::string name, RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr {
    return call(std::move(name), ScalarType::Boolean, {std::move(l), std::move(r)});
}

auto arithmetic(std::string name, RowExpressionPtr l, RowExpressionPtr r) -> RowExpressionPtr {
    auto type = (l && r && l->type() == ScalarType::Bigint && r->type() == ScalarType::Bigint)
                    ? ScalarType::Bigint
                    : ScalarType::Double;
    return call(std::move(name), type, {std::move(l), std::move(r)});
}

}  // namespace oryx::expr
