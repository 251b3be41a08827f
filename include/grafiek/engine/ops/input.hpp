#pragma once

/// @file input.hpp
/// @brief core/input: a graph parameter edited from outside the graph

#include <grafiek/engine/operation.hpp>

#include <cstdint>

namespace grafiek_engine::ops {

/// Value types an Input node can emit, in config order
enum class InputType : std::int32_t {
    F32 = 0,
    I32,
    Bool,
    String,
};

/// Passes its stored "value" input through to its "value" output
///
/// The "type" config selects the slot type; F32 by default.
class Input : public Operation {
public:
    static constexpr const char* LIBRARY = "core";
    static constexpr const char* OPERATOR = "input";
    static constexpr const char* LABEL = "Input";

    [[nodiscard]] static Result<OperationPtr> build();

    [[nodiscard]] OpPath op_path() const override { return op_path_of<Input>(); }

    Result<void> setup(ExecutionContext& ctx, SignatureRegistry& registry) override;
    Result<void> configure(ExecutionContext& ctx, std::span<const Value> config,
                           SignatureRegistry& registry) override;
    Result<void> execute(ExecutionContext& ctx, const Inputs& inputs, Outputs& outputs) override;

    [[nodiscard]] ValueType value_type() const noexcept { return m_type; }

private:
    ValueType m_type = ValueType::F32;
};

[[nodiscard]] ValueType input_value_type(InputType type) noexcept;

} // namespace grafiek_engine::ops
