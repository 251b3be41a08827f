#pragma once

/// @file output.hpp
/// @brief core/output: exposes whatever reaches its input as a graph result

#include <grafiek/engine/operation.hpp>

namespace grafiek_engine::ops {

/// Sink with a single type-agnostic "value" input
class Output : public Operation {
public:
    static constexpr const char* LIBRARY = "core";
    static constexpr const char* OPERATOR = "output";
    static constexpr const char* LABEL = "Output";

    [[nodiscard]] static Result<OperationPtr> build();

    [[nodiscard]] OpPath op_path() const override { return op_path_of<Output>(); }

    Result<void> setup(ExecutionContext& ctx, SignatureRegistry& registry) override;
    Result<void> configure(ExecutionContext& ctx, std::span<const Value> config,
                           SignatureRegistry& registry) override;
};

} // namespace grafiek_engine::ops
