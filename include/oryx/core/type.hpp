#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace oryx {

/// SQL scalar types understood by the expression compiler.
enum class ScalarType : std::uint8_t {
    Boolean,
    Bigint,
    Double,
    Varchar,
};

/// A single scalar value. std::monostate is SQL NULL.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

[[nodiscard]] auto type_name(ScalarType type) noexcept -> std::string_view;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// True if `value` can be stored in a column of `type` (NULL fits every type).
[[nodiscard]] auto value_matches(ScalarType type, const Value& value) noexcept -> bool;

/// Render a value for diagnostics: varchar is single-quoted, NULL is `null`.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

[[nodiscard]] auto hash_value(const Value& value) noexcept -> std::size_t;

/// Exact equality. Doubles compare by bit pattern so NaN equals itself.
[[nodiscard]] auto values_identical(const Value& lhs, const Value& rhs) noexcept -> bool;

/// Boost-style hash mixing.
[[nodiscard]] constexpr auto hash_combine(std::size_t seed, std::size_t value) noexcept
    -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace oryx
