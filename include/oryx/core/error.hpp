#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace oryx {

/// Classified error kinds raised by the library.
enum class ErrorCode : std::uint8_t {
    /// Code generation or artifact loading failed.
    CompilerError,
    /// A compiled artifact could not be instantiated.
    InstantiationError,
    DivisionByZero,
    NumericOverflow,
    /// Input data does not have the type the compiled code expects.
    TypeMismatch,
    /// Input data is structurally invalid (missing channel, bad sizes).
    InvalidInput,
};

[[nodiscard]] auto error_code_name(ErrorCode code) noexcept -> std::string_view;

/// Base exception for all classified library errors.
///
/// Optionally carries the exception that caused it, so callers can inspect
/// a backend's original failure without that type crossing the API.
class OryxException : public std::runtime_error {
   public:
    OryxException(ErrorCode code, const std::string& message, std::exception_ptr cause = nullptr)
        : std::runtime_error(message), code_(code), cause_(std::move(cause)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto cause() const noexcept -> const std::exception_ptr& { return cause_; }

    /// Rethrow the cause, if any. Does nothing when there is no cause.
    void rethrow_cause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
    }

   private:
    ErrorCode code_;
    std::exception_ptr cause_;
};

/// Expression compilation failed. The only error kind the compile entry
/// points raise for backend failures.
class CompilationError final : public OryxException {
   public:
    explicit CompilationError(const std::string& message, std::exception_ptr cause = nullptr)
        : OryxException(ErrorCode::CompilerError, message, std::move(cause)) {}
};

/// A successfully compiled artifact could not produce an instance.
/// Transient: invoking the factory again may succeed.
class InstantiationError final : public OryxException {
   public:
    explicit InstantiationError(const std::string& message, std::exception_ptr cause = nullptr)
        : OryxException(ErrorCode::InstantiationError, message, std::move(cause)) {}
};

}  // namespace oryx
