#pragma once

/// @file engine.hpp
/// @brief Graph engine: owns nodes, edges, operators, textures and history
///
/// All graph mutations go through Engine. Every successful mutation is
/// reported as a Message to the optional handler and recorded in the undo
/// history. Mutating calls validate everything before changing the graph.

#include "context.hpp"
#include "fwd.hpp"
#include "history.hpp"
#include "node.hpp"
#include "operation.hpp"
#include "value.hpp"

#include <grafiek/core/config.hpp>
#include <grafiek/core/error.hpp>
#include <grafiek/gpu/backend.hpp>
#include <grafiek/structures/slot_map.hpp>

#include <glm/vec2.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace grafiek_engine {

/// Receives every mutation and event the engine emits
using MessageHandler = std::function<void(const Message&)>;

/// Everything Engine::init needs
struct EngineDescriptor {
    /// Backend to use; created from config.gpu_backend when null
    std::unique_ptr<grafiek_gpu::IGpuBackend> backend;
    MessageHandler on_message;
    grafiek_core::EngineConfig config;
};

/// Connection between an output slot and an input slot
struct Edge {
    SlotIndex source_slot = 0;
    SlotIndex sink_slot = 0;
};

/// Edge together with its endpoints
struct GraphEdge {
    NodeIndex from;
    NodeIndex to;
    Edge edge;
};

/// Persisted graph: node records plus edges addressed by NodeId
struct Document {
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;

    bool operator==(const Document&) const = default;
};

class Engine {
public:
    /// Create an engine with the built-in operators and system textures
    [[nodiscard]] static Result<std::unique_ptr<Engine>> init(EngineDescriptor descriptor);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // =========================================================================
    // Operators
    // =========================================================================

    template<OperationFactory T>
    Result<void> register_op() {
        return register_op(op_path_of<T>(), OperationFactoryEntry::of<T>());
    }

    Result<void> register_op(const OpPath& path, OperationFactoryEntry entry);

    /// Registered libraries, sorted
    [[nodiscard]] std::vector<std::string> node_categories() const;

    /// (operator, label) pairs of one library, sorted by operator
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> iter_category(const std::string& library) const;

    // =========================================================================
    // Nodes
    // =========================================================================

    /// Build a registered operator and add it as a node
    Result<NodeIndex> instance_node(const std::string& library, const std::string& op);

    /// Set up, configure and insert a node
    Result<NodeIndex> add_node(OperationPtr operation);

    /// Disconnect all edges, tear down, release textures and remove
    Result<void> delete_node(NodeIndex idx);

    Result<void> set_node_position(NodeIndex idx, glm::vec2 position);

    /// An empty label clears it
    Result<void> set_label(NodeIndex idx, const std::string& label);

    // =========================================================================
    // Edges
    // =========================================================================

    /// Connect output @p from_slot of @p from to input @p to_slot of @p to
    ///
    /// An existing edge into the same input is disconnected first.
    Result<void> connect(NodeIndex from, NodeIndex to, SlotIndex from_slot, SlotIndex to_slot);

    Result<void> disconnect(NodeIndex from, NodeIndex to, SlotIndex from_slot, SlotIndex to_slot);

    // =========================================================================
    // Editing
    // =========================================================================

    /// Edit the value of a core/input node that has no incoming edge
    Result<void> edit_graph_input(NodeIndex idx, const SlotEditor& editor);

    Result<void> edit_node_input(NodeIndex idx, SlotIndex slot, const SlotEditor& editor);
    Result<void> edit_all_node_inputs(NodeIndex idx, const SlotEditor& editor);

    /// Config edits reconfigure the node before SetConfig is emitted
    Result<void> edit_node_config(NodeIndex idx, SlotIndex slot, const SlotEditor& editor);
    Result<void> edit_all_node_configs(NodeIndex idx, const SlotEditor& editor);

    /// Re-run configure and drop edges the new signature no longer accepts
    Result<void> reconfigure_node(NodeIndex idx);

    /// Replace the texture of output @p slot with uploaded pixels
    Result<void> upload_texture(NodeIndex idx, SlotIndex slot, std::uint32_t width,
                                std::uint32_t height, std::span<const std::uint8_t> data);

    // =========================================================================
    // Execution
    // =========================================================================

    void set_timing(const TimeInfo& timing) { m_context.set_timing(timing); }

    /// Run every node once in dependency order; node failures are logged
    void execute();

    // =========================================================================
    // History
    // =========================================================================

    /// Revert the newest history entry; false when there is nothing to undo
    Result<bool> undo();
    Result<bool> redo();

    [[nodiscard]] bool can_undo() const noexcept { return m_history.can_undo(); }
    [[nodiscard]] bool can_redo() const noexcept { return m_history.can_redo(); }
    [[nodiscard]] const History& history() const noexcept { return m_history; }

    // =========================================================================
    // Documents
    // =========================================================================

    [[nodiscard]] Document save_document() const;

    /// Replace the graph with @p document; clears the history
    ///
    /// The whole document is checked first; on error the graph is untouched.
    /// The old graph is torn down through Disconnect and DeleteNode messages.
    Result<void> load_document(const Document& document);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const Node* get_node(NodeIndex idx) const { return m_nodes.get(idx); }
    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edges.size(); }
    [[nodiscard]] const std::vector<GraphEdge>& edges() const noexcept { return m_edges; }
    [[nodiscard]] std::vector<NodeIndex> node_indices() const { return m_nodes.keys(); }

    template<typename T>
    [[nodiscard]] T* operation(NodeIndex idx) {
        Node* node = m_nodes.get(idx);
        return node ? node->operation<T>() : nullptr;
    }

    /// Value reaching the i-th core/output node (ordered by NodeId)
    [[nodiscard]] std::optional<Value> result(std::size_t i) const;
    [[nodiscard]] std::vector<Value> results() const;

    /// core/input and core/output nodes ordered by NodeId
    [[nodiscard]] std::vector<NodeIndex> inputs() const;
    [[nodiscard]] std::vector<NodeIndex> outputs() const;

    [[nodiscard]] std::optional<grafiek_gpu::TextureHandle> get_texture(const TextureHandle& handle) const {
        return m_context.texture(handle);
    }

    [[nodiscard]] ExecutionContext& context() noexcept { return m_context; }

private:
    Engine(std::unique_ptr<grafiek_gpu::IGpuBackend> backend, MessageHandler on_message,
           std::size_t history_size);

    Result<void> load_system_textures();
    Result<void> register_builtin_ops();

    void emit(Message message);

    Result<OperationPtr> build_op(const OpPath& path) const;
    Result<Node> build_node(OperationPtr operation, NodeId id);
    Result<NodeIndex> insert_node(OperationPtr operation, NodeId id);
    Result<void> restore_record(NodeIndex idx, const NodeRecord& record);
    Result<void> apply_record(Node& node, const NodeRecord& record);
    Result<NodeIndex> recreate_node(const NodeRecord& record);

    void remove_edge_at(std::size_t position);
    void sync_textures(NodeIndex idx, const std::vector<Value>& before);
    [[nodiscard]] bool reaches(NodeIndex start, NodeIndex target) const;
    [[nodiscard]] std::optional<std::size_t> find_edge_into(NodeIndex to, SlotIndex slot) const;
    [[nodiscard]] std::vector<NodeIndex> topological_order() const;
    [[nodiscard]] std::vector<NodeIndex> nodes_of(const OpPath& path) const;

    Result<void> apply(const Mutation& entry);
    /// Build every node of @p document off-graph and replay its edges
    Result<void> validate_document(const Document& document);
    Result<void> clear_graph();

    [[nodiscard]] static std::string describe(NodeIndex idx);

    ExecutionContext m_context;
    grafiek_structures::SlotMap<Node> m_nodes;
    std::vector<GraphEdge> m_edges;
    std::map<std::string, std::map<std::string, OperationFactoryEntry>> m_ops;
    History m_history;
    MessageHandler m_on_message;
    std::uint64_t m_last_id = 0;
    bool m_replaying = false;
    bool m_had_errors = false;
};

} // namespace grafiek_engine
