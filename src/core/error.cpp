#include <oryx/core/error.hpp>

namespace oryx {

auto error_code_name(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::CompilerError:
            return "COMPILER_ERROR";
        case ErrorCode::InstantiationError:
            return "INSTANTIATION_ERROR";
        case ErrorCode::DivisionByZero:
            return "DIVISION_BY_ZERO";
        case ErrorCode::NumericOverflow:
            return "NUMERIC_VALUE_OUT_OF_RANGE";
        case ErrorCode::TypeMismatch:
            return "TYPE_MISMATCH";
        case ErrorCode::InvalidInput:
            return "INVALID_INPUT";
    }
    return "UNKNOWN";
}

}  // namespace oryx
