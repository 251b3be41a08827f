/// @file input.cpp
/// @brief core/input operation

#include <grafiek/engine/ops/input.hpp>

namespace grafiek_engine::ops {

ValueType input_value_type(InputType type) noexcept {
    switch (type) {
        case InputType::F32: return ValueType::F32;
        case InputType::I32: return ValueType::I32;
        case InputType::Bool: return ValueType::Bool;
        case InputType::String: return ValueType::String;
    }
    return ValueType::F32;
}

Result<OperationPtr> Input::build() {
    return OperationPtr(std::make_unique<Input>());
}

Result<void> Input::setup(ExecutionContext& ctx, SignatureRegistry& registry) {
    (void)ctx;
    registry.add_config<std::int32_t>("type")
        .meta(meta::IntEnum{{{"f32", 0}, {"i32", 1}, {"bool", 2}, {"string", 3}}, 0})
        .tooltip("Type of value this input provides")
        .build();
    registry.add_input<float>("value").build();
    registry.add_output<float>("value").build();
    return grafiek_core::Ok();
}

Result<void> Input::configure(ExecutionContext& ctx, std::span<const Value> config,
                              SignatureRegistry& registry) {
    (void)ctx;
    std::int32_t selected = 0;
    if (!config.empty()) {
        if (const auto* type = config[0].get<std::int32_t>()) {
            selected = *type;
        }
    }
    if (selected < 0 || selected > static_cast<std::int32_t>(InputType::String)) {
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::InvalidArgument,
            "core/input: unknown value type " + std::to_string(selected)));
    }
    m_type = input_value_type(static_cast<InputType>(selected));

    SlotDef input;
    input.value_type = m_type;
    input.name = "value";
    input.common.on_node_body = true;
    registry.push_input_raw(input);

    SlotDef output;
    output.value_type = m_type;
    output.name = "value";
    registry.push_output_raw(std::move(output));
    return grafiek_core::Ok();
}

Result<void> Input::execute(ExecutionContext& ctx, const Inputs& inputs, Outputs& outputs) {
    (void)ctx;
    const Value* value = inputs.get(0);
    if (!value || outputs.size() == 0) {
        return grafiek_core::Err(grafiek_core::ValueError::bad_index(0));
    }
    auto cast = value->cast(m_type);
    if (!cast) {
        return grafiek_core::Err(grafiek_core::ValueError::type_mismatch(
            value_type_name(m_type), value->to_string()));
    }
    outputs[0] = std::move(*cast);
    return grafiek_core::Ok();
}

} // namespace grafiek_engine::ops
