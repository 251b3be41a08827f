#pragma once

/// @file operation.hpp
/// @brief Operation interface and factory registration for grafiek_engine
///
/// An Operation implements one kind of node. Concrete operations are created
/// by name through a factory table so an editor can list and instance them.

#include "fwd.hpp"
#include "signature.hpp"
#include "value.hpp"

#include <concepts>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace grafiek_engine {

// =============================================================================
// OpPath
// =============================================================================

/// Registry path of an operation (library/operator)
struct OpPath {
    std::string library;
    std::string op;

    [[nodiscard]] std::string to_string() const { return library + "/" + op; }

    bool operator==(const OpPath&) const = default;
};

// =============================================================================
// Operation
// =============================================================================

/// Behaviour of one node kind
class Operation {
public:
    virtual ~Operation() = default;

    /// True if running twice with the same inputs has side effects
    [[nodiscard]] virtual bool is_stateful() const { return false; }

    [[nodiscard]] virtual OpPath op_path() const = 0;

    /// Declare the initial signature and acquire backing resources
    virtual Result<void> setup(ExecutionContext& ctx, SignatureRegistry& registry) {
        (void)ctx;
        (void)registry;
        return grafiek_core::Ok();
    }

    /// Re-derive inputs and outputs from the current config values
    virtual Result<void> configure(ExecutionContext& ctx, std::span<const Value> config,
                                   SignatureRegistry& registry) {
        (void)ctx;
        (void)config;
        (void)registry;
        return grafiek_core::Ok();
    }

    virtual Result<void> execute(ExecutionContext& ctx, const Inputs& inputs, Outputs& outputs) {
        (void)ctx;
        (void)inputs;
        (void)outputs;
        return grafiek_core::Ok();
    }

    /// Release anything acquired in setup
    virtual void teardown(ExecutionContext& ctx) { (void)ctx; }

    virtual Result<void> on_edge_connected(SlotIndex slot, ValueType connected_type,
                                           SignatureRegistry& registry) {
        (void)slot;
        (void)connected_type;
        (void)registry;
        return grafiek_core::Ok();
    }

    virtual Result<void> on_edge_disconnected(SlotIndex slot, ValueType connected_type,
                                              SignatureRegistry& registry) {
        (void)slot;
        (void)connected_type;
        (void)registry;
        return grafiek_core::Ok();
    }
};

// =============================================================================
// OperationFactory
// =============================================================================

using OperationPtr = std::unique_ptr<Operation>;
using BuildFn = Result<OperationPtr> (*)();

/// A registrable operation: static identity plus a constructor
template<typename T>
concept OperationFactory = std::derived_from<T, Operation> && requires {
    { T::LIBRARY } -> std::convertible_to<std::string_view>;
    { T::OPERATOR } -> std::convertible_to<std::string_view>;
    { T::LABEL } -> std::convertible_to<std::string_view>;
    { T::build() } -> std::same_as<Result<OperationPtr>>;
};

/// Type-erased factory stored in the engine's operator table
struct OperationFactoryEntry {
    std::string label;
    BuildFn build = nullptr;

    template<OperationFactory T>
    [[nodiscard]] static OperationFactoryEntry of() {
        return OperationFactoryEntry{std::string(T::LABEL), &T::build};
    }
};

template<OperationFactory T>
[[nodiscard]] OpPath op_path_of() {
    return OpPath{std::string(T::LIBRARY), std::string(T::OPERATOR)};
}

} // namespace grafiek_engine
