#pragma once

/// @file arithmetic.hpp
/// @brief math/add: scalar arithmetic selected by config

#include <grafiek/engine/operation.hpp>

#include <cstdint>

namespace grafiek_engine::ops {

/// Arithmetic operator, in config order
enum class ArithOp : std::int32_t {
    Add = 0,
    Subtract,
    Multiply,
    Power,
    Log,
    Divide,
    Min,
    Max,
    Abs,
};

[[nodiscard]] const char* arith_op_name(ArithOp op) noexcept;

/// f32 arithmetic; configure re-declares the inputs the chosen operator takes
///
/// | op                   | inputs                |
/// |----------------------|-----------------------|
/// | Add Multiply Min Max | a, b                  |
/// | Subtract             | minuend, subtrahend   |
/// | Power                | base, exponent        |
/// | Log                  | base, a (log_base(a)) |
/// | Divide               | dividend, divisor     |
/// | Abs                  | a                     |
class Arithmetic : public Operation {
public:
    static constexpr const char* LIBRARY = "math";
    static constexpr const char* OPERATOR = "add";
    static constexpr const char* LABEL = "Add";

    [[nodiscard]] static Result<OperationPtr> build();

    [[nodiscard]] OpPath op_path() const override { return op_path_of<Arithmetic>(); }

    Result<void> setup(ExecutionContext& ctx, SignatureRegistry& registry) override;
    Result<void> configure(ExecutionContext& ctx, std::span<const Value> config,
                           SignatureRegistry& registry) override;
    Result<void> execute(ExecutionContext& ctx, const Inputs& inputs, Outputs& outputs) override;

    [[nodiscard]] ArithOp op() const noexcept { return m_op; }

private:
    ArithOp m_op = ArithOp::Add;
};

} // namespace grafiek_engine::ops
