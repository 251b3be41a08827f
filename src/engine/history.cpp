/// @file history.cpp
/// @brief Mutation inversion, coalescing and the undo/redo log

#include <grafiek/engine/history.hpp>
#include <grafiek/core/log.hpp>

namespace grafiek_engine {

// =============================================================================
// Names
// =============================================================================

const char* mutation_kind_name(MutationKind kind) noexcept {
    switch (kind) {
        case MutationKind::CreateNode: return "CreateNode";
        case MutationKind::DeleteNode: return "DeleteNode";
        case MutationKind::Connect: return "Connect";
        case MutationKind::Disconnect: return "Disconnect";
        case MutationKind::SetConfig: return "SetConfig";
        case MutationKind::SetInput: return "SetInput";
        case MutationKind::MoveNode: return "MoveNode";
        case MutationKind::SetLabel: return "SetLabel";
        default: return "Unknown";
    }
}

const char* event_kind_name(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::ExecutionStarted: return "ExecutionStarted";
        case EventKind::ExecutionCompleted: return "ExecutionCompleted";
        case EventKind::NodeExecuted: return "NodeExecuted";
        case EventKind::GraphDirtied: return "GraphDirtied";
        case EventKind::ErrorsChanged: return "ErrorsChanged";
        case EventKind::ErrorsCleared: return "ErrorsCleared";
        default: return "Unknown";
    }
}

// =============================================================================
// Mutation
// =============================================================================

Mutation Mutation::inverse() const {
    return std::visit([](const auto& m) -> Mutation {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, mutation::CreateNode>) {
            return mutation::DeleteNode{m.node, m.record};
        } else if constexpr (std::is_same_v<T, mutation::DeleteNode>) {
            return mutation::CreateNode{m.node, m.record};
        } else if constexpr (std::is_same_v<T, mutation::Connect>) {
            return mutation::Disconnect{m.from_node, m.from_slot, m.to_node, m.to_slot};
        } else if constexpr (std::is_same_v<T, mutation::Disconnect>) {
            return mutation::Connect{m.from_node, m.from_slot, m.to_node, m.to_slot};
        } else if constexpr (std::is_same_v<T, mutation::SetConfig>) {
            return mutation::SetConfig{m.node, m.slot, m.new_value, m.old_value};
        } else if constexpr (std::is_same_v<T, mutation::SetInput>) {
            return mutation::SetInput{m.node, m.slot, m.new_value, m.old_value};
        } else if constexpr (std::is_same_v<T, mutation::MoveNode>) {
            return mutation::MoveNode{m.node, m.new_position, m.old_position};
        } else {
            return mutation::SetLabel{m.node, m.new_label, m.old_label};
        }
    }, m_data);
}

void Mutation::retarget(NodeIndex from, NodeIndex to) noexcept {
    auto replace = [from, to](NodeIndex& node) {
        if (node == from) {
            node = to;
        }
    };
    std::visit([&replace](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, mutation::Connect> || std::is_same_v<T, mutation::Disconnect>) {
            replace(m.from_node);
            replace(m.to_node);
        } else {
            replace(m.node);
        }
    }, m_data);
}

bool Mutation::dirties_graph() const noexcept {
    switch (kind()) {
        case MutationKind::Connect:
        case MutationKind::Disconnect:
        case MutationKind::DeleteNode:
        case MutationKind::SetConfig:
        case MutationKind::SetInput:
            return true;
        case MutationKind::CreateNode:
        case MutationKind::MoveNode:
        case MutationKind::SetLabel:
            return false;
    }
    return false;
}

bool Mutation::try_coalesce(const Mutation& next) {
    if (kind() != next.kind()) {
        return false;
    }

    if (auto* mine = std::get_if<mutation::SetInput>(&m_data)) {
        const auto& other = next.as<mutation::SetInput>();
        if (mine->node != other.node || mine->slot != other.slot) return false;
        mine->new_value = other.new_value;
        return true;
    }
    if (auto* mine = std::get_if<mutation::SetConfig>(&m_data)) {
        const auto& other = next.as<mutation::SetConfig>();
        if (mine->node != other.node || mine->slot != other.slot) return false;
        mine->new_value = other.new_value;
        return true;
    }
    if (auto* mine = std::get_if<mutation::MoveNode>(&m_data)) {
        const auto& other = next.as<mutation::MoveNode>();
        if (mine->node != other.node) return false;
        mine->new_position = other.new_position;
        return true;
    }
    return false;
}

// =============================================================================
// Message
// =============================================================================

std::string Message::describe() const {
    if (const auto* m = mutation()) {
        return std::string("mutation:") + m->kind_name();
    }
    return std::string("event:") + event()->kind_name();
}

// =============================================================================
// History
// =============================================================================

History::History(std::size_t max_size)
    : m_max_size(max_size == 0 ? 1 : max_size) {}

void History::push(Mutation mutation) {
    if (!m_undo.empty() && m_undo.back().try_coalesce(mutation)) {
        m_redo.clear();
        return;
    }

    m_undo.push_back(std::move(mutation));
    m_redo.clear();

    while (m_undo.size() > m_max_size) {
        grafiek_core::history_logger()->debug("History full, dropping oldest {} entry",
            m_undo.front().kind_name());
        m_undo.pop_front();
    }
}

std::optional<Mutation> History::undo() {
    if (m_undo.empty()) {
        return std::nullopt;
    }
    Mutation entry = std::move(m_undo.back());
    m_undo.pop_back();
    Mutation inverse = entry.inverse();
    m_redo.push_back(std::move(entry));
    return inverse;
}

std::optional<Mutation> History::redo() {
    if (m_redo.empty()) {
        return std::nullopt;
    }
    Mutation entry = std::move(m_redo.back());
    m_redo.pop_back();
    m_undo.push_back(entry);
    return entry;
}

void History::clear() {
    m_undo.clear();
    m_redo.clear();
}

void History::retarget(NodeIndex from, NodeIndex to) noexcept {
    for (auto& entry : m_undo) {
        entry.retarget(from, to);
    }
    for (auto& entry : m_redo) {
        entry.retarget(from, to);
    }
}

} // namespace grafiek_engine
