/// @file output.cpp
/// @brief core/output operation

#include <grafiek/engine/ops/output.hpp>

namespace grafiek_engine::ops {

namespace {

void declare_value(SignatureRegistry& registry) {
    SlotDef value;
    value.value_type = ValueType::Any;
    value.name = "value";
    registry.push_input_raw(std::move(value));
}

} // anonymous namespace

Result<OperationPtr> Output::build() {
    return OperationPtr(std::make_unique<Output>());
}

Result<void> Output::setup(ExecutionContext& ctx, SignatureRegistry& registry) {
    (void)ctx;
    declare_value(registry);
    return grafiek_core::Ok();
}

Result<void> Output::configure(ExecutionContext& ctx, std::span<const Value> config,
                               SignatureRegistry& registry) {
    (void)ctx;
    (void)config;
    declare_value(registry);
    return grafiek_core::Ok();
}

} // namespace grafiek_engine::ops
