/// @file node.cpp
/// @brief Node implementation

#include <grafiek/engine/node.hpp>
#include <grafiek/engine/context.hpp>

namespace grafiek_engine {

using grafiek_core::Error;
using grafiek_core::GraphError;

Node::Node(NodeId id, OperationPtr operation)
    : m_operation(std::move(operation))
    , m_dirty(std::make_shared<std::atomic<bool>>(true)) {
    m_record.id = id;
    m_record.op_path = m_operation->op_path();
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void> Node::setup(ExecutionContext& ctx) {
    m_signature.clear();
    m_signature.clear_config();

    if (auto result = m_operation->setup(ctx, m_signature); !result) {
        return result;
    }
    if (auto result = validate_signature(); !result) {
        return result;
    }

    m_record.config_values.clear();
    for (const auto& def : m_signature.configs()) {
        m_record.config_values.push_back(def.default_value());
    }
    m_record.input_values.clear();
    for (const auto& def : m_signature.inputs()) {
        m_record.input_values.push_back(def.default_value());
    }
    m_outputs.clear();
    for (const auto& def : m_signature.outputs()) {
        m_outputs.push_back(def.default_value());
    }
    m_incoming.assign(m_signature.input_count(), std::nullopt);
    mark_dirty();
    return grafiek_core::Ok();
}

Result<void> Node::configure(ExecutionContext& ctx) {
    m_signature.clear();
    if (auto result = m_operation->configure(ctx, m_record.config_values, m_signature); !result) {
        return result;
    }
    if (auto result = validate_signature(); !result) {
        return result;
    }

    // Drop texture contents but keep their pool ids
    std::vector<Value> previous = std::move(m_outputs);
    m_outputs.clear();
    for (std::size_t i = 0; i < m_signature.output_count(); ++i) {
        Value value = m_signature.output(i)->default_value();
        auto* handle = value.get<TextureHandle>();
        const auto* old = i < previous.size() ? previous[i].get<TextureHandle>() : nullptr;
        if (handle && old && old->id) {
            handle->id = old->id;
        }
        m_outputs.push_back(std::move(value));
    }

    reconcile_values();
    mark_dirty();
    return grafiek_core::Ok();
}

Result<void> Node::execute(ExecutionContext& ctx) {
    std::vector<const Value*> values;
    values.reserve(m_record.input_values.size());
    for (std::size_t i = 0; i < m_record.input_values.size(); ++i) {
        values.push_back(effective_input(i));
    }

    Inputs inputs(std::move(values));
    Outputs outputs(m_outputs);
    auto result = m_operation->execute(ctx, inputs, outputs);
    if (result) {
        clear_dirty();
    }
    return result;
}

void Node::teardown(ExecutionContext& ctx) {
    m_operation->teardown(ctx);
}

Result<void> Node::validate_signature() const {
    return m_signature.validate_unique_names();
}

void Node::reconcile_values() {
    std::vector<Value> inputs;
    inputs.reserve(m_signature.input_count());
    for (std::size_t i = 0; i < m_signature.input_count(); ++i) {
        const SlotDef* def = m_signature.input(i);
        std::optional<Value> kept;
        if (i < m_record.input_values.size()) {
            kept = m_record.input_values[i].cast(def->value_type);
        }
        inputs.push_back(kept ? std::move(*kept) : def->default_value());
    }
    m_record.input_values = std::move(inputs);

    while (m_record.config_values.size() < m_signature.config_count()) {
        m_record.config_values.push_back(m_signature.config(m_record.config_values.size())->default_value());
    }
    m_record.config_values.resize(m_signature.config_count());

    while (m_outputs.size() < m_signature.output_count()) {
        m_outputs.push_back(m_signature.output(m_outputs.size())->default_value());
    }
    m_outputs.resize(m_signature.output_count());

    m_incoming.resize(m_signature.input_count());
}

// =============================================================================
// Editing
// =============================================================================

Result<std::optional<Value>> Node::edit_slot(std::vector<Value>& values, const SlotDef* def,
                                             SlotIndex slot, const SlotEditor& editor,
                                             GraphError missing) {
    if (!def || slot >= values.size()) {
        return Result<std::optional<Value>>(Error(std::move(missing)));
    }

    Value& value = values[slot];
    // Strings are checkpointed on first mutable access
    std::optional<Value> checkpoint;
    if (!value.is<std::string>()) {
        checkpoint = value;
    }

    ValueMut view(value, checkpoint);
    if (auto result = editor(*def, view); !result) {
        if (checkpoint) {
            value = *checkpoint;
        }
        return Result<std::optional<Value>>(std::move(result.error()));
    }

    if (checkpoint && !(*checkpoint == value)) {
        mark_dirty();
        return Result<std::optional<Value>>(std::move(checkpoint));
    }
    return Result<std::optional<Value>>(std::optional<Value>{});
}

Result<std::optional<Value>> Node::edit_input(SlotIndex slot, const SlotEditor& editor) {
    return edit_slot(m_record.input_values, m_signature.input(slot), slot, editor,
                     GraphError::no_input_slot(slot));
}

Result<std::optional<Value>> Node::edit_config(SlotIndex slot, const SlotEditor& editor) {
    return edit_slot(m_record.config_values, m_signature.config(slot), slot, editor,
                     GraphError::no_config_slot(slot));
}

Result<std::optional<Value>> Node::edit_output(SlotIndex slot, const SlotEditor& editor) {
    return edit_slot(m_outputs, m_signature.output(slot), slot, editor,
                     GraphError::no_output_slot(slot));
}

// =============================================================================
// Connections
// =============================================================================

ConnectionProbe Node::probe_connect(const Node& sink, SlotIndex from_slot, SlotIndex to_slot) const {
    const SlotDef* source = m_signature.output(from_slot);
    if (!source) {
        return ConnectionProbe::NoSourceSlot;
    }
    const SlotDef* target = sink.signature().input(to_slot);
    if (!target) {
        return ConnectionProbe::NoSinkSlot;
    }
    if (!can_cast_to(source->value_type, target->value_type)) {
        return ConnectionProbe::Incompatible;
    }
    return ConnectionProbe::Ok;
}

Result<void> Node::on_edge_connected(SlotIndex slot, ValueType connected_type) {
    auto result = m_operation->on_edge_connected(slot, connected_type, m_signature);
    reconcile_values();
    return result;
}

Result<void> Node::on_edge_disconnected(SlotIndex slot, ValueType connected_type) {
    auto result = m_operation->on_edge_disconnected(slot, connected_type, m_signature);
    reconcile_values();
    return result;
}

void Node::push_incoming(SlotIndex slot, Value value) {
    if (slot < m_incoming.size()) {
        m_incoming[slot] = std::move(value);
    }
}

void Node::clear_incoming(SlotIndex slot) {
    if (slot < m_incoming.size()) {
        m_incoming[slot].reset();
    }
}

bool Node::has_incoming(SlotIndex slot) const {
    return slot < m_incoming.size() && m_incoming[slot].has_value();
}

const Value* Node::effective_input(SlotIndex slot) const {
    if (slot < m_incoming.size() && m_incoming[slot]) {
        return &*m_incoming[slot];
    }
    return slot < m_record.input_values.size() ? &m_record.input_values[slot] : nullptr;
}

// =============================================================================
// Textures
// =============================================================================

void Node::sync_textures(ExecutionContext& ctx, NodeIndex self) {
    for (auto& value : m_outputs) {
        if (auto* handle = value.get<TextureHandle>()) {
            ctx.ensure_texture(*handle, TextureOwner::of_node(self));
        }
    }
}

} // namespace grafiek_engine
