#include <oryx/core/type.hpp>

#include <fmt/format.h>

#include <bit>
#include <cmath>
#include <functional>

namespace oryx {

auto type_name(ScalarType type) noexcept -> std::string_view {
    switch (type) {
        case ScalarType::Boolean:
            return "boolean";
        case ScalarType::Bigint:
            return "bigint";
        case ScalarType::Double:
            return "double";
        case ScalarType::Varchar:
            return "varchar";
    }
    return "unknown";
}

auto value_matches(ScalarType type, const Value& value) noexcept -> bool {
    switch (type) {
        case ScalarType::Boolean:
            return is_null(value) || std::holds_alternative<bool>(value);
        case ScalarType::Bigint:
            return is_null(value) || std::holds_alternative<std::int64_t>(value);
        case ScalarType::Double:
            return is_null(value) || std::holds_alternative<double>(value);
        case ScalarType::Varchar:
            return is_null(value) || std::holds_alternative<std::string>(value);
    }
    return false;
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return fmt::format("'{}'", v);
            }
        },
        value);
}

auto hash_value(const Value& value) noexcept -> std::size_t {
    std::size_t seed = value.index();
    std::visit(
        [&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return;
            } else if constexpr (std::is_same_v<T, double>) {
                seed = hash_combine(seed, std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(v)));
            } else {
                seed = hash_combine(seed, std::hash<T>{}(v));
            }
        },
        value);
    return seed;
}

auto values_identical(const Value& lhs, const Value& rhs) noexcept -> bool {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (const auto* l = std::get_if<double>(&lhs)) {
        return std::bit_cast<std::uint64_t>(*l) == std::bit_cast<std::uint64_t>(std::get<double>(rhs));
    }
    return lhs == rhs;
}

}  // namespace oryx
