#pragma once

#include <oryx/core/error.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>

namespace oryx::expr {

/// Arithmetic operators shared by the scalar builtins and the vector kernels,
/// so both execution models produce identical results and errors.
enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
};

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

[[nodiscard]] inline auto apply_arithmetic(ArithmeticOp op, std::int64_t l, std::int64_t r)
    -> std::int64_t {
    std::int64_t out = 0;
    switch (op) {
        case ArithmeticOp::Add:
            if (__builtin_add_overflow(l, r, &out))
                throw OryxException(ErrorCode::NumericOverflow, "bigint addition overflow");
            return out;
        case ArithmeticOp::Sub:
            if (__builtin_sub_overflow(l, r, &out))
                throw OryxException(ErrorCode::NumericOverflow, "bigint subtraction overflow");
            return out;
        case ArithmeticOp::Mul:
            if (__builtin_mul_overflow(l, r, &out))
                throw OryxException(ErrorCode::NumericOverflow, "bigint multiplication overflow");
            return out;
        case ArithmeticOp::Div:
            if (r == 0)
                throw OryxException(ErrorCode::DivisionByZero, "division by zero");
            if (l == std::numeric_limits<std::int64_t>::min() && r == -1)
                throw OryxException(ErrorCode::NumericOverflow, "bigint division overflow");
            return l / r;
        case ArithmeticOp::Mod:
            if (r == 0)
                throw OryxException(ErrorCode::DivisionByZero, "division by zero");
            if (r == -1)
                return 0;
            return l % r;
    }
    return out;
}

/// IEEE semantics: division by zero yields inf or nan.
[[nodiscard]] inline auto apply_arithmetic(ArithmeticOp op, double l, double r) noexcept
    -> double {
    switch (op) {
        case ArithmeticOp::Add:
            return l + r;
        case ArithmeticOp::Sub:
            return l - r;
        case ArithmeticOp::Mul:
            return l * r;
        case ArithmeticOp::Div:
            return l / r;
        case ArithmeticOp::Mod:
            return std::fmod(l, r);
    }
    return 0.0;
}

template <typename T>
[[nodiscard]] constexpr auto apply_compare(CompareOp op, const T& l, const T& r) noexcept -> bool {
    switch (op) {
        case CompareOp::Eq:
            return l == r;
        case CompareOp::Ne:
            return l != r;
        case CompareOp::Lt:
            return l < r;
        case CompareOp::Le:
            return l <= r;
        case CompareOp::Gt:
            return l > r;
        case CompareOp::Ge:
            return l >= r;
    }
    return false;
}

[[nodiscard]] constexpr auto arithmetic_function_name(ArithmeticOp op) noexcept
    -> std::string_view {
    switch (op) {
        case ArithmeticOp::Add:
            return "add";
        case ArithmeticOp::Sub:
            return "subtract";
        case ArithmeticOp::Mul:
            return "multiply";
        case ArithmeticOp::Div:
            return "divide";
        case ArithmeticOp::Mod:
            return "modulus";
    }
    return "";
}

[[nodiscard]] constexpr auto compare_function_name(CompareOp op) noexcept -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "equal";
        case CompareOp::Ne:
            return "not_equal";
        case CompareOp::Lt:
            return "less_than";
        case CompareOp::Le:
            return "less_than_or_equal";
        case CompareOp::Gt:
            return "greater_than";
        case CompareOp::Ge:
            return "greater_than_or_equal";
    }
    return "";
}

}  // namespace oryx::expr
