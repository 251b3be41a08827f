/// @file engine.cpp
/// @brief Engine implementation

#include <grafiek/engine/engine.hpp>
#include <grafiek/engine/ops/arithmetic.hpp>
#include <grafiek/engine/ops/comment.hpp>
#include <grafiek/engine/ops/input.hpp>
#include <grafiek/engine/ops/output.hpp>
#include <grafiek/engine/system_textures.hpp>
#include <grafiek/core/log.hpp>

#include <algorithm>
#include <deque>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace grafiek_engine {

using grafiek_core::DocumentError;
using grafiek_core::Err;
using grafiek_core::Error;
using grafiek_core::ErrorCode;
using grafiek_core::GraphError;
using grafiek_core::Ok;
using grafiek_core::RegistryError;

namespace {

/// Marks history replay for the lifetime of the guard
class ReplayGuard {
public:
    explicit ReplayGuard(bool& flag) : m_flag(flag), m_previous(flag) { m_flag = true; }
    ~ReplayGuard() { m_flag = m_previous; }

    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;

private:
    bool& m_flag;
    bool m_previous;
};

Result<void> connection_error(ConnectionProbe probe, SlotIndex from_slot, SlotIndex to_slot) {
    switch (probe) {
        case ConnectionProbe::NoSourceSlot: return Err(GraphError::no_output_slot(from_slot));
        case ConnectionProbe::NoSinkSlot: return Err(GraphError::no_input_slot(to_slot));
        case ConnectionProbe::Incompatible: return Err(GraphError::incompatible_types(from_slot, to_slot));
        case ConnectionProbe::Ok: break;
    }
    return Ok();
}

/// Nodes built from a document before it is committed; torn down on exit
struct StagedGraph {
    struct StagedEdge {
        std::size_t from;
        std::size_t to;
        Edge edge;
    };

    explicit StagedGraph(ExecutionContext& context) : ctx(context) {}
    ~StagedGraph() {
        for (auto& node : nodes) {
            node.teardown(ctx);
        }
    }

    StagedGraph(const StagedGraph&) = delete;
    StagedGraph& operator=(const StagedGraph&) = delete;

    [[nodiscard]] bool reaches(std::size_t start, std::size_t target) const {
        std::vector<bool> visited(nodes.size(), false);
        std::deque<std::size_t> queue{start};
        visited[start] = true;
        while (!queue.empty()) {
            std::size_t current = queue.front();
            queue.pop_front();
            if (current == target) {
                return true;
            }
            for (const auto& e : edges) {
                if (e.from == current && !visited[e.to]) {
                    visited[e.to] = true;
                    queue.push_back(e.to);
                }
            }
        }
        return false;
    }

    ExecutionContext& ctx;
    std::vector<Node> nodes;
    std::unordered_map<std::uint64_t, std::size_t> by_id;
    std::vector<StagedEdge> edges;
};

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Engine::Engine(std::unique_ptr<grafiek_gpu::IGpuBackend> backend, MessageHandler on_message,
               std::size_t history_size)
    : m_context(std::move(backend))
    , m_history(history_size)
    , m_on_message(std::move(on_message)) {}

Engine::~Engine() {
    for (NodeIndex idx : m_nodes.keys()) {
        m_nodes.get(idx)->teardown(m_context);
    }
}

Result<std::unique_ptr<Engine>> Engine::init(EngineDescriptor descriptor) {
    using EnginePtr = std::unique_ptr<Engine>;

    grafiek_core::configure_logging(descriptor.config.log);

    auto backend = std::move(descriptor.backend);
    if (!backend) {
        auto kind = grafiek_gpu::parse_backend_name(descriptor.config.gpu_backend);
        if (!kind) {
            return Err<EnginePtr>(Error(ErrorCode::NotSupported,
                "Unknown GPU backend: " + descriptor.config.gpu_backend));
        }
        backend = grafiek_gpu::create_backend(*kind);
        if (!backend) {
            return Err<EnginePtr>(Error(ErrorCode::NotSupported,
                "GPU backend not available: " + descriptor.config.gpu_backend));
        }
    }

    if (!backend->is_initialized()) {
        grafiek_gpu::BackendConfig backend_config;
        auto err = backend->init(backend_config);
        if (err != grafiek_gpu::BackendError::None) {
            return Err<EnginePtr>(Error(ErrorCode::InvalidState,
                std::string("GPU backend init failed: ") + grafiek_gpu::backend_error_name(err)));
        }
    }

    const char* backend_label = grafiek_gpu::backend_name(backend->backend_type());
    EnginePtr engine(new Engine(std::move(backend), std::move(descriptor.on_message),
                                descriptor.config.history_max_size));

    if (auto result = engine->load_system_textures(); !result) {
        return Err<EnginePtr>(std::move(result.error()));
    }
    if (auto result = engine->register_builtin_ops(); !result) {
        return Err<EnginePtr>(std::move(result.error()));
    }

    GRAFIEK_LOG_INFO("Engine initialized ({} backend)", backend_label);
    return Result<EnginePtr>(std::move(engine));
}

Result<void> Engine::load_system_textures() {
    GRAFIEK_LOG_INFO("loading initial textures");

    auto& pool = m_context.textures();
    if (auto result = pool.insert_texture(SPECK, SPECK_DATA); !result) return result;
    if (auto result = pool.insert_texture(FLECK, FLECK_DATA); !result) return result;
    if (auto result = pool.insert_texture(TRANSPARENT_SPECK, TRANSPARENT_SPECK_DATA); !result) return result;
    return pool.insert_texture(CHECK, CHECK_DATA);
}

Result<void> Engine::register_builtin_ops() {
    if (auto result = register_op<ops::Input>(); !result) return result;
    if (auto result = register_op<ops::Output>(); !result) return result;
    if (auto result = register_op<ops::Comment>(); !result) return result;
    return register_op<ops::Arithmetic>();
}

// =============================================================================
// Operators
// =============================================================================

Result<void> Engine::register_op(const OpPath& path, OperationFactoryEntry entry) {
    auto& library = m_ops[path.library];
    if (library.count(path.op) != 0) {
        return Err(RegistryError::duplicate_operation_type(path.library, path.op));
    }
    library.emplace(path.op, std::move(entry));
    GRAFIEK_LOG_DEBUG("Registered operator {}", path.to_string());
    return Ok();
}

std::vector<std::string> Engine::node_categories() const {
    std::vector<std::string> out;
    out.reserve(m_ops.size());
    for (const auto& [library, entries] : m_ops) {
        out.push_back(library);
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> Engine::iter_category(const std::string& library) const {
    std::vector<std::pair<std::string, std::string>> out;
    auto it = m_ops.find(library);
    if (it == m_ops.end()) {
        return out;
    }
    for (const auto& [op, entry] : it->second) {
        out.emplace_back(op, entry.label);
    }
    return out;
}

Result<OperationPtr> Engine::build_op(const OpPath& path) const {
    auto library = m_ops.find(path.library);
    if (library == m_ops.end() || library->second.count(path.op) == 0) {
        return Err<OperationPtr>(RegistryError::unknown_operation_type(path.to_string()));
    }
    return library->second.at(path.op).build();
}

// =============================================================================
// Nodes
// =============================================================================

Result<NodeIndex> Engine::instance_node(const std::string& library, const std::string& op) {
    auto built = build_op(OpPath{library, op});
    if (!built) {
        return Err<NodeIndex>(std::move(built.error()));
    }
    return add_node(std::move(built.value()));
}

Result<NodeIndex> Engine::add_node(OperationPtr operation) {
    if (!operation) {
        return Err<NodeIndex>(Error(ErrorCode::InvalidArgument, "add_node called without an operation"));
    }

    NodeId id{m_last_id + 1};
    auto idx = insert_node(std::move(operation), id);
    if (!idx) {
        return idx;
    }
    m_last_id = id.value;

    GRAFIEK_LOG_DEBUG("Added node {} ({})", describe(*idx), m_nodes.get(*idx)->op_path().to_string());
    emit(Mutation(mutation::CreateNode{*idx, m_nodes.get(*idx)->record()}));
    return idx;
}

Result<Node> Engine::build_node(OperationPtr operation, NodeId id) {
    Node node(id, std::move(operation));
    if (auto result = node.setup(m_context); !result) {
        node.teardown(m_context);
        return Err<Node>(std::move(result.error()));
    }
    if (auto result = node.configure(m_context); !result) {
        node.teardown(m_context);
        return Err<Node>(std::move(result.error()));
    }
    return Result<Node>(std::move(node));
}

Result<NodeIndex> Engine::insert_node(OperationPtr operation, NodeId id) {
    auto node = build_node(std::move(operation), id);
    if (!node) {
        return Err<NodeIndex>(std::move(node.error()));
    }

    NodeIndex idx = m_nodes.insert(std::move(node).value());
    m_nodes.get(idx)->sync_textures(m_context, idx);
    return idx;
}

Result<void> Engine::delete_node(NodeIndex idx) {
    if (!m_nodes.contains_key(idx)) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    for (;;) {
        auto incident = std::find_if(m_edges.begin(), m_edges.end(), [idx](const GraphEdge& e) {
            return e.from == idx || e.to == idx;
        });
        if (incident == m_edges.end()) {
            break;
        }
        remove_edge_at(static_cast<std::size_t>(incident - m_edges.begin()));
    }

    Node* node = m_nodes.get(idx);
    node->teardown(m_context);
    std::size_t released = m_context.textures().release_node_textures(idx);
    NodeRecord record = node->record();
    m_nodes.remove(idx);

    GRAFIEK_LOG_DEBUG("Deleted node {} ({} textures released)", describe(idx), released);
    emit(Mutation(mutation::DeleteNode{idx, std::move(record)}));
    return Ok();
}

Result<void> Engine::set_node_position(NodeIndex idx, glm::vec2 position) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    glm::vec2 old_position = node->record().position;
    if (old_position == position) {
        return Ok();
    }
    node->record().position = position;
    emit(Mutation(mutation::MoveNode{idx, old_position, position}));
    return Ok();
}

Result<void> Engine::set_label(NodeIndex idx, const std::string& label) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    std::optional<std::string> new_label;
    if (!label.empty()) {
        new_label = label;
    }
    std::optional<std::string> old_label = node->record().label;
    if (old_label == new_label) {
        return Ok();
    }
    node->record().label = new_label;
    emit(Mutation(mutation::SetLabel{idx, std::move(old_label), std::move(new_label)}));
    return Ok();
}

// =============================================================================
// Edges
// =============================================================================

Result<void> Engine::connect(NodeIndex from, NodeIndex to, SlotIndex from_slot, SlotIndex to_slot) {
    const Node* source = m_nodes.get(from);
    if (!source) {
        return Err(GraphError::node_not_found(describe(from)));
    }
    const Node* sink = m_nodes.get(to);
    if (!sink) {
        return Err(GraphError::node_not_found(describe(to)));
    }

    if (auto checked = connection_error(source->probe_connect(*sink, from_slot, to_slot), from_slot, to_slot);
        !checked) {
        return checked;
    }

    if (from == to || reaches(to, from)) {
        return Err(GraphError::creates_loop());
    }

    if (auto existing = find_edge_into(to, to_slot)) {
        const GraphEdge& current = m_edges[*existing];
        if (current.from == from && current.edge.source_slot == from_slot) {
            return Ok();
        }
        remove_edge_at(*existing);
    }

    m_edges.push_back(GraphEdge{from, to, Edge{from_slot, to_slot}});

    ValueType type = m_nodes.get(from)->signature().output(from_slot)->value_type;
    Node* target = m_nodes.get(to);
    auto before = target->snapshot_outputs();
    if (auto result = target->on_edge_connected(to_slot, type); !result) {
        GRAFIEK_LOG_ERROR("Edge callback failed on node {}: {}", describe(to), result.error().message());
    }
    sync_textures(to, before);
    target->mark_dirty();

    emit(Mutation(mutation::Connect{from, from_slot, to, to_slot}));
    return Ok();
}

Result<void> Engine::disconnect(NodeIndex from, NodeIndex to, SlotIndex from_slot, SlotIndex to_slot) {
    auto it = std::find_if(m_edges.begin(), m_edges.end(), [&](const GraphEdge& e) {
        return e.from == from && e.to == to && e.edge.source_slot == from_slot && e.edge.sink_slot == to_slot;
    });
    if (it == m_edges.end()) {
        return Err(GraphError::edge_not_found(from_slot, to_slot));
    }
    remove_edge_at(static_cast<std::size_t>(it - m_edges.begin()));
    return Ok();
}

void Engine::remove_edge_at(std::size_t position) {
    GraphEdge removed = m_edges[position];
    m_edges.erase(m_edges.begin() + static_cast<std::ptrdiff_t>(position));

    ValueType type = ValueType::Any;
    if (const Node* source = m_nodes.get(removed.from)) {
        if (const SlotDef* def = source->signature().output(removed.edge.source_slot)) {
            type = def->value_type;
        }
    }

    if (Node* sink = m_nodes.get(removed.to)) {
        sink->clear_incoming(removed.edge.sink_slot);
        auto before = sink->snapshot_outputs();
        if (auto result = sink->on_edge_disconnected(removed.edge.sink_slot, type); !result) {
            GRAFIEK_LOG_ERROR("Edge callback failed on node {}: {}", describe(removed.to),
                result.error().message());
        }
        sync_textures(removed.to, before);
        sink->mark_dirty();
    }

    emit(Mutation(mutation::Disconnect{removed.from, removed.edge.source_slot,
                                       removed.to, removed.edge.sink_slot}));
}

bool Engine::reaches(NodeIndex start, NodeIndex target) const {
    std::unordered_set<NodeIndex> visited{start};
    std::deque<NodeIndex> queue{start};
    while (!queue.empty()) {
        NodeIndex current = queue.front();
        queue.pop_front();
        if (current == target) {
            return true;
        }
        for (const auto& e : m_edges) {
            if (e.from == current && visited.insert(e.to).second) {
                queue.push_back(e.to);
            }
        }
    }
    return false;
}

std::optional<std::size_t> Engine::find_edge_into(NodeIndex to, SlotIndex slot) const {
    for (std::size_t i = 0; i < m_edges.size(); ++i) {
        if (m_edges[i].to == to && m_edges[i].edge.sink_slot == slot) {
            return i;
        }
    }
    return std::nullopt;
}

void Engine::sync_textures(NodeIndex idx, const std::vector<Value>& before) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return;
    }
    node->sync_textures(m_context, idx);

    // Release textures the node no longer exposes
    auto& pool = m_context.textures();
    for (const auto& value : before) {
        const auto* old = value.get<TextureHandle>();
        if (!old || !old->id) {
            continue;
        }
        bool still_used = std::any_of(node->output_values().begin(), node->output_values().end(),
            [&](const Value& current) {
                const auto* handle = current.get<TextureHandle>();
                return handle && handle->id == old->id;
            });
        if (!still_used && pool.owner_of(*old->id) == TextureOwner::of_node(idx)) {
            pool.release_texture(*old->id);
        }
    }
}

// =============================================================================
// Editing
// =============================================================================

Result<void> Engine::edit_graph_input(NodeIndex idx, const SlotEditor& editor) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }
    if (node->operation<ops::Input>() == nullptr) {
        return Err(GraphError::not_input_node());
    }
    if (find_edge_into(idx, 0)) {
        return Err(GraphError::input_has_connection());
    }
    return edit_node_input(idx, 0, editor);
}

Result<void> Engine::edit_node_input(NodeIndex idx, SlotIndex slot, const SlotEditor& editor) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    auto changed = node->edit_input(slot, editor);
    if (!changed) {
        return Err(std::move(changed.error()));
    }
    if (!changed.value()) {
        return Ok();
    }

    emit(Mutation(mutation::SetInput{idx, slot, std::move(*changed.value()),
                                     node->record().input_values[slot]}));
    return Ok();
}

Result<void> Engine::edit_all_node_inputs(NodeIndex idx, const SlotEditor& editor) {
    const Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }
    std::size_t count = node->signature().input_count();
    for (SlotIndex slot = 0; slot < count; ++slot) {
        if (auto result = edit_node_input(idx, slot, editor); !result) {
            return result;
        }
    }
    return Ok();
}

Result<void> Engine::edit_node_config(NodeIndex idx, SlotIndex slot, const SlotEditor& editor) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    auto changed = node->edit_config(slot, editor);
    if (!changed) {
        return Err(std::move(changed.error()));
    }
    if (!changed.value()) {
        return Ok();
    }

    Value old_value = std::move(*changed.value());
    Value new_value = node->record().config_values[slot];
    if (auto result = reconfigure_node(idx); !result) {
        node->record().config_values[slot] = old_value;
        if (auto restored = reconfigure_node(idx); !restored) {
            GRAFIEK_LOG_ERROR("Node {} could not be restored after a failed config edit: {}",
                describe(idx), restored.error().message());
        }
        return result;
    }

    emit(Mutation(mutation::SetConfig{idx, slot, std::move(old_value), std::move(new_value)}));
    return Ok();
}

Result<void> Engine::edit_all_node_configs(NodeIndex idx, const SlotEditor& editor) {
    const Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }
    for (SlotIndex slot = 0; slot < node->signature().config_count(); ++slot) {
        if (auto result = edit_node_config(idx, slot, editor); !result) {
            return result;
        }
    }
    return Ok();
}

Result<void> Engine::reconfigure_node(NodeIndex idx) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }

    auto before = node->snapshot_outputs();
    if (auto result = node->configure(m_context); !result) {
        return result;
    }

    for (std::size_t i = 0; i < m_edges.size();) {
        const GraphEdge& e = m_edges[i];
        if (e.from != idx && e.to != idx) {
            ++i;
            continue;
        }
        const Node* source = m_nodes.get(e.from);
        const Node* sink = m_nodes.get(e.to);
        if (source && sink &&
            source->probe_connect(*sink, e.edge.source_slot, e.edge.sink_slot) == ConnectionProbe::Ok) {
            ++i;
            continue;
        }
        remove_edge_at(i);
    }

    sync_textures(idx, before);
    return Ok();
}

Result<void> Engine::upload_texture(NodeIndex idx, SlotIndex slot, std::uint32_t width,
                                    std::uint32_t height, std::span<const std::uint8_t> data) {
    Node* node = m_nodes.get(idx);
    if (!node) {
        return Err(GraphError::node_not_found(describe(idx)));
    }
    auto& outputs = node->output_values_mut();
    if (slot >= outputs.size()) {
        return Err(GraphError::no_output_slot(slot));
    }
    auto* handle = outputs[slot].get<TextureHandle>();
    if (!handle) {
        return Err(GraphError::not_a_texture(slot));
    }

    TextureHandle uploaded{std::nullopt, width, height, handle->fmt};
    if (data.size() != uploaded.byte_size()) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Texture upload of " + std::to_string(data.size()) + " bytes does not match " +
            std::to_string(width) + "x" + std::to_string(height) + " " + texture_format_name(handle->fmt)));
    }

    auto& pool = m_context.textures();
    if (handle->id && pool.owner_of(*handle->id) == TextureOwner::of_node(idx)) {
        pool.release_texture(*handle->id);
    }

    uploaded.id = pool.alloc_texture_with_data(TextureOwner::of_node(idx), uploaded, data);
    if (!uploaded.id) {
        handle->id.reset();
        return Err(Error(ErrorCode::InvalidState, "Texture upload to node " + describe(idx) + " failed"));
    }
    *handle = uploaded;
    node->mark_dirty();

    emit(Event(event::GraphDirtied{}));
    return Ok();
}

// =============================================================================
// Execution
// =============================================================================

std::vector<NodeIndex> Engine::topological_order() const {
    std::unordered_map<NodeIndex, std::size_t> indegree;
    for (NodeIndex idx : m_nodes.keys()) {
        indegree[idx] = 0;
    }
    for (const auto& e : m_edges) {
        ++indegree[e.to];
    }

    std::set<NodeIndex> ready;
    for (const auto& [idx, degree] : indegree) {
        if (degree == 0) {
            ready.insert(idx);
        }
    }

    std::vector<NodeIndex> order;
    order.reserve(indegree.size());
    while (!ready.empty()) {
        NodeIndex current = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(current);
        for (const auto& e : m_edges) {
            if (e.from == current && --indegree[e.to] == 0) {
                ready.insert(e.to);
            }
        }
    }
    return order;
}

void Engine::execute() {
    GRAFIEK_LOG_SCOPE("Engine::execute");
    emit(Event(event::ExecutionStarted{}));

    std::vector<GraphIssue> issues;
    for (NodeIndex idx : topological_order()) {
        Node* node = m_nodes.get(idx);
        if (auto result = node->execute(m_context); !result) {
            GRAFIEK_LOG_ERROR("Node {} ({}) failed: {}", describe(idx), node->op_path().to_string(),
                result.error().message());
            issues.push_back(GraphIssue{idx, result.error().message()});
        }
        emit(Event(event::NodeExecuted{idx}));

        const auto& produced = node->output_values();
        for (const auto& e : m_edges) {
            if (e.from != idx || e.edge.source_slot >= produced.size()) {
                continue;
            }
            if (Node* sink = m_nodes.get(e.to)) {
                sink->push_incoming(e.edge.sink_slot, produced[e.edge.source_slot]);
            }
        }
    }

    if (!issues.empty()) {
        m_had_errors = true;
        emit(Event(event::ErrorsChanged{std::move(issues)}));
    } else if (m_had_errors) {
        m_had_errors = false;
        emit(Event(event::ErrorsCleared{}));
    }

    emit(Event(event::ExecutionCompleted{}));
}

void Engine::emit(Message message) {
    bool dirties = false;
    if (const Mutation* change = message.mutation()) {
        dirties = change->dirties_graph();
        if (!m_replaying) {
            m_history.push(*change);
        }
    }

    GRAFIEK_LOG_TRACE("emit {}", message.describe());
    if (m_on_message) {
        m_on_message(message);
        if (dirties) {
            m_on_message(Message(Event(event::GraphDirtied{})));
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

std::vector<NodeIndex> Engine::nodes_of(const OpPath& path) const {
    std::vector<NodeIndex> out;
    for (NodeIndex idx : m_nodes.keys()) {
        if (m_nodes.get(idx)->op_path() == path) {
            out.push_back(idx);
        }
    }
    std::sort(out.begin(), out.end(), [this](NodeIndex a, NodeIndex b) {
        return m_nodes.get(a)->id() < m_nodes.get(b)->id();
    });
    return out;
}

std::vector<NodeIndex> Engine::inputs() const {
    return nodes_of(op_path_of<ops::Input>());
}

std::vector<NodeIndex> Engine::outputs() const {
    return nodes_of(op_path_of<ops::Output>());
}

std::optional<Value> Engine::result(std::size_t i) const {
    auto sinks = outputs();
    if (i >= sinks.size()) {
        return std::nullopt;
    }
    const Value* value = m_nodes.get(sinks[i])->effective_input(0);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

std::vector<Value> Engine::results() const {
    std::vector<Value> out;
    for (NodeIndex idx : outputs()) {
        const Value* value = m_nodes.get(idx)->effective_input(0);
        out.push_back(value ? *value : Value());
    }
    return out;
}

std::string Engine::describe(NodeIndex idx) {
    return std::to_string(idx.index) + "v" + std::to_string(idx.generation);
}

// =============================================================================
// History
// =============================================================================

Result<bool> Engine::undo() {
    auto entry = m_history.undo();
    if (!entry) {
        return Result<bool>(false);
    }
    GRAFIEK_LOG_DEBUG("Undo {}", entry->kind_name());
    if (auto result = apply(*entry); !result) {
        return Err<bool>(std::move(result.error()));
    }
    return Result<bool>(true);
}

Result<bool> Engine::redo() {
    auto entry = m_history.redo();
    if (!entry) {
        return Result<bool>(false);
    }
    GRAFIEK_LOG_DEBUG("Redo {}", entry->kind_name());
    if (auto result = apply(*entry); !result) {
        return Err<bool>(std::move(result.error()));
    }
    return Result<bool>(true);
}

Result<void> Engine::apply(const Mutation& entry) {
    ReplayGuard guard(m_replaying);

    if (const auto* m = entry.try_as<mutation::CreateNode>()) {
        auto idx = recreate_node(m->record);
        if (!idx) {
            return Err(std::move(idx.error()));
        }
        if (*idx != m->node) {
            m_history.retarget(m->node, *idx);
        }
        emit(Mutation(mutation::CreateNode{*idx, m_nodes.get(*idx)->record()}));
        return Ok();
    }
    if (const auto* m = entry.try_as<mutation::DeleteNode>()) {
        return delete_node(m->node);
    }
    if (const auto* m = entry.try_as<mutation::Connect>()) {
        return connect(m->from_node, m->to_node, m->from_slot, m->to_slot);
    }
    if (const auto* m = entry.try_as<mutation::Disconnect>()) {
        return disconnect(m->from_node, m->to_node, m->from_slot, m->to_slot);
    }
    if (const auto* m = entry.try_as<mutation::SetConfig>()) {
        return edit_node_config(m->node, m->slot, [m](const SlotDef&, ValueMut& value) {
            return value.set(m->new_value);
        });
    }
    if (const auto* m = entry.try_as<mutation::SetInput>()) {
        return edit_node_input(m->node, m->slot, [m](const SlotDef&, ValueMut& value) {
            return value.set(m->new_value);
        });
    }
    if (const auto* m = entry.try_as<mutation::MoveNode>()) {
        return set_node_position(m->node, m->new_position);
    }
    const auto& label = entry.as<mutation::SetLabel>();
    return set_label(label.node, label.new_label.value_or(std::string()));
}

// =============================================================================
// Documents
// =============================================================================

Result<NodeIndex> Engine::recreate_node(const NodeRecord& record) {
    auto operation = build_op(record.op_path);
    if (!operation) {
        return Err<NodeIndex>(std::move(operation.error()));
    }
    auto idx = insert_node(std::move(operation.value()), record.id);
    if (!idx) {
        return idx;
    }
    if (auto result = restore_record(*idx, record); !result) {
        return Err<NodeIndex>(std::move(result.error()));
    }
    m_last_id = std::max(m_last_id, record.id.value);
    return idx;
}

Result<void> Engine::restore_record(NodeIndex idx, const NodeRecord& record) {
    Node* node = m_nodes.get(idx);
    auto before = node->snapshot_outputs();
    if (auto result = apply_record(*node, record); !result) {
        return result;
    }
    sync_textures(idx, before);
    return Ok();
}

Result<void> Engine::apply_record(Node& node, const NodeRecord& record) {
    NodeRecord& current = node.record();
    current.label = record.label;
    current.position = record.position;

    const SignatureRegistry& signature = node.signature();
    std::size_t configs = std::min(record.config_values.size(), current.config_values.size());
    for (std::size_t i = 0; i < configs; ++i) {
        if (auto cast = record.config_values[i].cast(signature.config(i)->value_type)) {
            current.config_values[i] = std::move(*cast);
        }
    }

    if (auto result = node.configure(m_context); !result) {
        return result;
    }

    std::size_t inputs = std::min(record.input_values.size(), current.input_values.size());
    for (std::size_t i = 0; i < inputs; ++i) {
        if (auto cast = record.input_values[i].cast(signature.input(i)->value_type)) {
            current.input_values[i] = std::move(*cast);
        }
    }
    return Ok();
}

Document Engine::save_document() const {
    Document document;
    std::vector<NodeIndex> keys = m_nodes.keys();
    std::sort(keys.begin(), keys.end(), [this](NodeIndex a, NodeIndex b) {
        return m_nodes.get(a)->id() < m_nodes.get(b)->id();
    });
    for (NodeIndex idx : keys) {
        document.nodes.push_back(m_nodes.get(idx)->record());
    }
    for (const auto& e : m_edges) {
        document.edges.push_back(EdgeRecord{m_nodes.get(e.from)->id(), e.edge.source_slot,
                                            m_nodes.get(e.to)->id(), e.edge.sink_slot});
    }
    return document;
}

Result<void> Engine::validate_document(const Document& document) {
    StagedGraph staged(m_context);

    for (const auto& record : document.nodes) {
        if (staged.by_id.count(record.id.value) != 0) {
            return Err(DocumentError::schema("duplicate node id " + std::to_string(record.id.value)));
        }
        auto operation = build_op(record.op_path);
        if (!operation) {
            return Err(std::move(operation.error()));
        }
        auto node = build_node(std::move(operation.value()), record.id);
        if (!node) {
            return Err(std::move(node.error()));
        }
        staged.nodes.push_back(std::move(node).value());
        if (auto result = apply_record(staged.nodes.back(), record); !result) {
            return result;
        }
        staged.by_id.emplace(record.id.value, staged.nodes.size() - 1);
    }

    // Replays connect() against the staged nodes, callbacks included
    for (const auto& edge : document.edges) {
        auto from = staged.by_id.find(edge.from_id.value);
        if (from == staged.by_id.end()) {
            return Err(GraphError::node_not_found("id " + std::to_string(edge.from_id.value)));
        }
        auto to = staged.by_id.find(edge.to_id.value);
        if (to == staged.by_id.end()) {
            return Err(GraphError::node_not_found("id " + std::to_string(edge.to_id.value)));
        }

        Node& source = staged.nodes[from->second];
        Node& sink = staged.nodes[to->second];
        if (auto checked = connection_error(source.probe_connect(sink, edge.from_port, edge.to_port),
                                     edge.from_port, edge.to_port);
            !checked) {
            return checked;
        }
        if (from->second == to->second || staged.reaches(to->second, from->second)) {
            return Err(GraphError::creates_loop());
        }

        auto driver = std::find_if(staged.edges.begin(), staged.edges.end(), [&](const auto& e) {
            return e.to == to->second && e.edge.sink_slot == edge.to_port;
        });
        if (driver != staged.edges.end()) {
            if (driver->from == from->second && driver->edge.source_slot == edge.from_port) {
                continue;
            }
            ValueType replaced = staged.nodes[driver->from].signature().output(driver->edge.source_slot)->value_type;
            staged.edges.erase(driver);
            if (auto result = sink.on_edge_disconnected(edge.to_port, replaced); !result) {
                GRAFIEK_LOG_DEBUG("Staged edge callback failed: {}", result.error().message());
            }
        }

        staged.edges.push_back({from->second, to->second, Edge{edge.from_port, edge.to_port}});
        ValueType type = source.signature().output(edge.from_port)->value_type;
        if (auto result = sink.on_edge_connected(edge.to_port, type); !result) {
            GRAFIEK_LOG_DEBUG("Staged edge callback failed: {}", result.error().message());
        }
    }
    return Ok();
}

Result<void> Engine::load_document(const Document& document) {
    if (auto result = validate_document(document); !result) {
        GRAFIEK_LOG_WARN("Rejected document: {}", result.error().message());
        return result;
    }

    ReplayGuard guard(m_replaying);
    if (auto result = clear_graph(); !result) {
        return result;
    }

    std::unordered_map<std::uint64_t, NodeIndex> by_id;
    for (const auto& record : document.nodes) {
        auto idx = recreate_node(record);
        if (!idx) {
            return Err(std::move(idx.error()));
        }
        by_id[record.id.value] = *idx;
        emit(Mutation(mutation::CreateNode{*idx, m_nodes.get(*idx)->record()}));
    }

    for (const auto& edge : document.edges) {
        if (auto result = connect(by_id.at(edge.from_id.value), by_id.at(edge.to_id.value),
                                  edge.from_port, edge.to_port); !result) {
            return result;
        }
    }

    m_history.clear();
    GRAFIEK_LOG_INFO("Loaded document: {} nodes, {} edges", m_nodes.size(), m_edges.size());
    return Ok();
}

Result<void> Engine::clear_graph() {
    while (!m_edges.empty()) {
        remove_edge_at(m_edges.size() - 1);
    }

    std::vector<NodeIndex> keys = m_nodes.keys();
    std::sort(keys.begin(), keys.end(), [this](NodeIndex a, NodeIndex b) {
        return m_nodes.get(a)->id() < m_nodes.get(b)->id();
    });
    for (NodeIndex idx : keys) {
        if (auto result = delete_node(idx); !result) {
            return result;
        }
    }

    m_history.clear();
    m_last_id = 0;
    m_had_errors = false;
    return Ok();
}

} // namespace grafiek_engine
