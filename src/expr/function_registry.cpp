#include <oryx/expr/function_registry.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace oryx::expr {

auto FunctionSignature::to_string() const -> std::string {
    std::string args;
    for (std::size_t i = 0; i < argument_types.size(); ++i) {
        if (i > 0) {
            args.append(", ");
        }
        args.append(type_name(argument_types[i]));
    }
    return fmt::format("{}({}):{}", name, args, type_name(return_type));
}

void FunctionRegistry::register_scalar(std::string name, std::vector<ScalarType> argument_types,
                                       ScalarType return_type, ScalarFn implementation) {
    auto& overloads = registry_[name];
    auto function = std::make_shared<const ScalarFunction>(ScalarFunction{
        .signature = FunctionSignature{.name = std::move(name),
                                       .argument_types = std::move(argument_types),
                                       .return_type = return_type},
        .implementation = std::move(implementation)});
    auto it = std::find_if(overloads.begin(), overloads.end(), [&](const auto& f) {
        return f->signature.argument_types == function->signature.argument_types;
    });
    if (it != overloads.end()) {
        *it = std::move(function);
    } else {
        overloads.push_back(std::move(function));
    }
}

auto FunctionRegistry::resolve(const std::string& name,
                               std::span<const ScalarType> argument_types) const
    -> std::shared_ptr<const ScalarFunction> {
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return nullptr;
    }
    for (const auto& function : it->second) {
        if (std::ranges::equal(function->signature.argument_types, argument_types)) {
            return function;
        }
    }
    return nullptr;
}

auto FunctionRegistry::size() const noexcept -> std::size_t {
    return std::accumulate(registry_.begin(), registry_.end(), std::size_t{0},
                           [](std::size_t n, const auto& entry) { return n + entry.second.size(); });
}

auto FunctionRegistry::overloads(const std::string& name) const -> std::vector<FunctionSignature> {
    std::vector<FunctionSignature> out;
    if (auto it = registry_.find(name); it != registry_.end()) {
        for (const auto& function : it->second) {
            out.push_back(function->signature);
        }
    }
    return out;
}

}  // namespace oryx::expr
