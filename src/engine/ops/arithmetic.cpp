/// @file arithmetic.cpp
/// @brief math/add operation

#include <grafiek/engine/ops/arithmetic.hpp>

#include <algorithm>
#include <cmath>

namespace grafiek_engine::ops {

const char* arith_op_name(ArithOp op) noexcept {
    switch (op) {
        case ArithOp::Add: return "Add";
        case ArithOp::Subtract: return "Subtract";
        case ArithOp::Multiply: return "Multiply";
        case ArithOp::Power: return "Power";
        case ArithOp::Log: return "Log";
        case ArithOp::Divide: return "Divide";
        case ArithOp::Min: return "Min";
        case ArithOp::Max: return "Max";
        case ArithOp::Abs: return "Abs";
    }
    return "Add";
}

Result<OperationPtr> Arithmetic::build() {
    return OperationPtr(std::make_unique<Arithmetic>());
}

Result<void> Arithmetic::setup(ExecutionContext& ctx, SignatureRegistry& registry) {
    (void)ctx;
    meta::IntEnum choices;
    for (std::int32_t i = 0; i <= static_cast<std::int32_t>(ArithOp::Abs); ++i) {
        choices.options.emplace_back(arith_op_name(static_cast<ArithOp>(i)), i);
    }
    registry.add_config<std::int32_t>("operation").meta(std::move(choices)).build();
    registry.add_input<float>("a").build();
    registry.add_input<float>("b").build();
    registry.add_output<float>("result").build();
    return grafiek_core::Ok();
}

Result<void> Arithmetic::configure(ExecutionContext& ctx, std::span<const Value> config,
                                   SignatureRegistry& registry) {
    (void)ctx;
    std::int32_t selected = 0;
    if (!config.empty()) {
        if (const auto* op = config[0].get<std::int32_t>()) {
            selected = *op;
        }
    }
    if (selected < 0 || selected > static_cast<std::int32_t>(ArithOp::Abs)) {
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::InvalidArgument,
            "math/add: unknown operator " + std::to_string(selected)));
    }
    m_op = static_cast<ArithOp>(selected);

    registry.add_output<float>("result").build();
    switch (m_op) {
        case ArithOp::Add:
        case ArithOp::Multiply:
        case ArithOp::Min:
        case ArithOp::Max:
            registry.add_input<float>("a").build();
            registry.add_input<float>("b").build();
            break;
        case ArithOp::Subtract:
            registry.add_input<float>("minuend").build();
            registry.add_input<float>("subtrahend").build();
            break;
        case ArithOp::Power:
            registry.add_input<float>("base").build();
            registry.add_input<float>("exponent").build();
            break;
        case ArithOp::Log:
            registry.add_input<float>("base").build();
            registry.add_input<float>("a").build();
            break;
        case ArithOp::Divide:
            registry.add_input<float>("dividend").build();
            registry.add_input<float>("divisor").build();
            break;
        case ArithOp::Abs:
            registry.add_input<float>("a").build();
            break;
    }
    return grafiek_core::Ok();
}

Result<void> Arithmetic::execute(ExecutionContext& ctx, const Inputs& inputs, Outputs& outputs) {
    (void)ctx;
    auto a = inputs.extract<float>(0);
    if (!a) {
        return grafiek_core::Err(std::move(a.error()));
    }
    if (m_op == ArithOp::Abs) {
        return outputs.write<float>(0, std::fabs(*a));
    }

    auto b = inputs.extract<float>(1);
    if (!b) {
        return grafiek_core::Err(std::move(b.error()));
    }

    float result = 0.0f;
    switch (m_op) {
        case ArithOp::Add: result = *a + *b; break;
        case ArithOp::Subtract: result = *a - *b; break;
        case ArithOp::Multiply: result = *a * *b; break;
        case ArithOp::Power: result = std::pow(*a, *b); break;
        case ArithOp::Log: result = std::log(*b) / std::log(*a); break;
        case ArithOp::Divide: result = *a / *b; break;
        case ArithOp::Min: result = std::min(*a, *b); break;
        case ArithOp::Max: result = std::max(*a, *b); break;
        case ArithOp::Abs: break;
    }
    return outputs.write<float>(0, result);
}

} // namespace grafiek_engine::ops
