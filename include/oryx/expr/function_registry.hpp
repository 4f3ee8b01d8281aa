#pragma once

#include <oryx/core/type.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace oryx::expr {

/// Type-erased scalar function implementation.
///
/// Receives non-null arguments only: the evaluators return NULL without
/// calling the implementation when any argument is NULL.
using ScalarFn = std::function<Value(std::span<const Value>)>;

struct FunctionSignature {
    std::string name;
    std::vector<ScalarType> argument_types;
    ScalarType return_type = ScalarType::Boolean;

    [[nodiscard]] auto to_string() const -> std::string;
};

struct ScalarFunction {
    FunctionSignature signature;
    ScalarFn implementation;
};

/// Scalar functions available to compiled expressions, overloaded by
/// argument types.
///
/// Populated once at startup and read concurrently afterwards; registration
/// is not synchronized. Resolved overloads are shared: compiled artifacts keep
/// theirs alive across later registrations, and replacing an overload does not
/// affect artifacts compiled before the replacement.
class FunctionRegistry {
   public:
    FunctionRegistry() = default;

    /// Register (or replace) the overload of `name` for `argument_types`.
    void register_scalar(std::string name, std::vector<ScalarType> argument_types,
                         ScalarType return_type, ScalarFn implementation);

    /// Exact-match overload resolution; null if no overload matches.
    [[nodiscard]] auto resolve(const std::string& name,
                               std::span<const ScalarType> argument_types) const
        -> std::shared_ptr<const ScalarFunction>;

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return registry_.contains(name);
    }

    /// Number of registered overloads.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /// Signatures registered under `name` (for error messages).
    [[nodiscard]] auto overloads(const std::string& name) const
        -> std::vector<FunctionSignature>;

   private:
    std::unordered_map<std::string, std::vector<std::shared_ptr<const ScalarFunction>>> registry_;
};

}  // namespace oryx::expr
