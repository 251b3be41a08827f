#pragma once

/// @file node.hpp
/// @brief Graph node: an Operation with its record, signature and slot values

#include "fwd.hpp"
#include "operation.hpp"
#include "signature.hpp"
#include "texture_pool.hpp"
#include "value.hpp"

#include <glm/vec2.hpp>

#include <atomic>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace grafiek_engine {

// =============================================================================
// Records
// =============================================================================

/// Document-stable node identifier (survives undo and save/load)
struct NodeId {
    std::uint64_t value = 0;

    auto operator<=>(const NodeId&) const = default;
};

/// Persistent state of a node
struct NodeRecord {
    NodeId id;
    OpPath op_path;
    std::optional<std::string> label;
    glm::vec2 position{0.0f, 0.0f};
    std::vector<Value> input_values;
    std::vector<Value> config_values;

    bool operator==(const NodeRecord&) const = default;
};

/// Persistent form of an edge
struct EdgeRecord {
    NodeId from_id;
    SlotIndex from_port = 0;
    NodeId to_id;
    SlotIndex to_port = 0;

    bool operator==(const EdgeRecord&) const = default;
};

/// Outcome of Node::probe_connect
enum class ConnectionProbe : std::uint8_t {
    Ok = 0,
    NoSourceSlot,
    NoSinkSlot,
    Incompatible,
};

/// Shared dirty bit; clones observe the same flag from other threads
using DirtyFlag = std::shared_ptr<std::atomic<bool>>;

/// Closure run against one slot by the edit_* methods
using SlotEditor = std::function<Result<void>(const SlotDef&, ValueMut&)>;

// =============================================================================
// Node
// =============================================================================

class Node {
public:
    Node(NodeId id, OperationPtr operation);

    Node(Node&&) noexcept = default;
    Node& operator=(Node&&) noexcept = default;
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Declare the signature and reset all stored values to slot defaults
    Result<void> setup(ExecutionContext& ctx);

    /// Re-derive the signature from config values
    ///
    /// Input values survive per index while still castable to the new slot
    /// type; outputs are reset to their defaults (texture ids are kept).
    /// Edges are not reconciled here.
    Result<void> configure(ExecutionContext& ctx);

    /// Run the operation on the effective inputs; clears dirty on success
    Result<void> execute(ExecutionContext& ctx);

    void teardown(ExecutionContext& ctx);

    // =========================================================================
    // Editing
    // =========================================================================

    /// Each returns the previous value when the edit changed the slot
    Result<std::optional<Value>> edit_input(SlotIndex slot, const SlotEditor& editor);
    Result<std::optional<Value>> edit_config(SlotIndex slot, const SlotEditor& editor);
    Result<std::optional<Value>> edit_output(SlotIndex slot, const SlotEditor& editor);

    // =========================================================================
    // Connections
    // =========================================================================

    /// Check that output @p from_slot of this node may drive input @p to_slot of @p sink
    [[nodiscard]] ConnectionProbe probe_connect(const Node& sink, SlotIndex from_slot,
                                                SlotIndex to_slot) const;

    Result<void> on_edge_connected(SlotIndex slot, ValueType connected_type);
    Result<void> on_edge_disconnected(SlotIndex slot, ValueType connected_type);

    void push_incoming(SlotIndex slot, Value value);
    void clear_incoming(SlotIndex slot);
    [[nodiscard]] bool has_incoming(SlotIndex slot) const;

    /// Incoming value if one was pushed, else the stored input value
    [[nodiscard]] const Value* effective_input(SlotIndex slot) const;

    // =========================================================================
    // Outputs and textures
    // =========================================================================

    [[nodiscard]] std::vector<Value> snapshot_outputs() const { return m_outputs; }
    [[nodiscard]] const std::vector<Value>& output_values() const noexcept { return m_outputs; }
    [[nodiscard]] std::vector<Value>& output_values_mut() noexcept { return m_outputs; }

    /// Allocate or resize the backing texture of every texture output
    void sync_textures(ExecutionContext& ctx, NodeIndex self);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] NodeId id() const noexcept { return m_record.id; }
    [[nodiscard]] const OpPath& op_path() const noexcept { return m_record.op_path; }
    [[nodiscard]] const NodeRecord& record() const noexcept { return m_record; }
    [[nodiscard]] NodeRecord& record() noexcept { return m_record; }
    [[nodiscard]] const SignatureRegistry& signature() const noexcept { return m_signature; }

    [[nodiscard]] Operation& operation() noexcept { return *m_operation; }
    [[nodiscard]] const Operation& operation() const noexcept { return *m_operation; }

    /// Downcast of the owned operation, nullptr if it is not a T
    template<typename T>
    [[nodiscard]] T* operation() noexcept {
        return dynamic_cast<T*>(m_operation.get());
    }

    template<typename T>
    [[nodiscard]] const T* operation() const noexcept {
        return dynamic_cast<const T*>(m_operation.get());
    }

    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty->load(); }
    void mark_dirty() noexcept { m_dirty->store(true); }
    void clear_dirty() noexcept { m_dirty->store(false); }
    [[nodiscard]] DirtyFlag dirty_flag() const { return m_dirty; }

private:
    /// Realign stored values with the current signature
    void reconcile_values();
    Result<void> validate_signature() const;

    Result<std::optional<Value>> edit_slot(std::vector<Value>& values, const SlotDef* def,
                                           SlotIndex slot, const SlotEditor& editor,
                                           grafiek_core::GraphError missing);

    NodeRecord m_record;
    SignatureRegistry m_signature;
    std::vector<Value> m_outputs;
    std::vector<std::optional<Value>> m_incoming;
    OperationPtr m_operation;
    DirtyFlag m_dirty;
};

} // namespace grafiek_engine
