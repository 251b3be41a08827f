#pragma once

/// @file history.hpp
/// @brief Graph mutations, engine events and the undo/redo log

#include "fwd.hpp"
#include "node.hpp"
#include "value.hpp"

#include <glm/vec2.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace grafiek_engine {

// =============================================================================
// MutationKind
// =============================================================================

/// Mutation type discriminator
enum class MutationKind : std::uint8_t {
    CreateNode = 0,
    DeleteNode,
    Connect,
    Disconnect,
    SetConfig,
    SetInput,
    MoveNode,
    SetLabel,
};

[[nodiscard]] const char* mutation_kind_name(MutationKind kind) noexcept;

namespace mutation {

/// A node was added; the record allows recreating it
struct CreateNode {
    NodeIndex node;
    NodeRecord record;
};

/// A node was removed; the record allows recreating it
struct DeleteNode {
    NodeIndex node;
    NodeRecord record;
};

struct Connect {
    NodeIndex from_node;
    SlotIndex from_slot = 0;
    NodeIndex to_node;
    SlotIndex to_slot = 0;
};

struct Disconnect {
    NodeIndex from_node;
    SlotIndex from_slot = 0;
    NodeIndex to_node;
    SlotIndex to_slot = 0;
};

struct SetConfig {
    NodeIndex node;
    SlotIndex slot = 0;
    Value old_value;
    Value new_value;
};

struct SetInput {
    NodeIndex node;
    SlotIndex slot = 0;
    Value old_value;
    Value new_value;
};

struct MoveNode {
    NodeIndex node;
    glm::vec2 old_position{0.0f, 0.0f};
    glm::vec2 new_position{0.0f, 0.0f};
};

struct SetLabel {
    NodeIndex node;
    std::optional<std::string> old_label;
    std::optional<std::string> new_label;
};

} // namespace mutation

// =============================================================================
// Mutation
// =============================================================================

/// An invertible change to the graph
class Mutation {
public:
    using Variant = std::variant<
        mutation::CreateNode,
        mutation::DeleteNode,
        mutation::Connect,
        mutation::Disconnect,
        mutation::SetConfig,
        mutation::SetInput,
        mutation::MoveNode,
        mutation::SetLabel
    >;

    /// Construct from any mutation type
    template<typename T>
        requires(!std::is_same_v<std::decay_t<T>, Mutation> && std::is_constructible_v<Variant, T&&>)
    Mutation(T&& mutation) : m_data(std::forward<T>(mutation)) {}

    Mutation(const Mutation&) = default;
    Mutation(Mutation&&) = default;
    Mutation& operator=(const Mutation&) = default;
    Mutation& operator=(Mutation&&) = default;

    [[nodiscard]] MutationKind kind() const noexcept {
        return static_cast<MutationKind>(m_data.index());
    }

    [[nodiscard]] const char* kind_name() const noexcept { return mutation_kind_name(kind()); }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Get as specific type (throws if wrong type)
    template<typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(m_data);
    }

    template<typename T>
    [[nodiscard]] T& as() {
        return std::get<T>(m_data);
    }

    template<typename T>
    [[nodiscard]] const T* try_as() const noexcept {
        return std::get_if<T>(&m_data);
    }

    /// The mutation that undoes this one
    [[nodiscard]] Mutation inverse() const;

    /// Replace every reference to node @p from with @p to
    void retarget(NodeIndex from, NodeIndex to) noexcept;

    /// True if applying this mutation invalidates computed results
    [[nodiscard]] bool dirties_graph() const noexcept;

    /// Merge @p next into this entry if both edit the same target
    ///
    /// Repeated SetInput/SetConfig on one slot and MoveNode on one node
    /// collapse into a single entry whose "old" side is kept.
    bool try_coalesce(const Mutation& next);

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

// =============================================================================
// Event
// =============================================================================

/// Engine-level notification kind
enum class EventKind : std::uint8_t {
    ExecutionStarted = 0,
    ExecutionCompleted,
    NodeExecuted,
    GraphDirtied,
    ErrorsChanged,
    ErrorsCleared,
};

[[nodiscard]] const char* event_kind_name(EventKind kind) noexcept;

/// A failure reported by an execution pass
struct GraphIssue {
    std::optional<NodeIndex> node;
    std::string message;
};

namespace event {

struct ExecutionStarted {};
struct ExecutionCompleted {};
struct NodeExecuted {
    NodeIndex node;
};
struct GraphDirtied {};
struct ErrorsChanged {
    std::vector<GraphIssue> errors;
};
struct ErrorsCleared {};

} // namespace event

class Event {
public:
    using Variant = std::variant<
        event::ExecutionStarted,
        event::ExecutionCompleted,
        event::NodeExecuted,
        event::GraphDirtied,
        event::ErrorsChanged,
        event::ErrorsCleared
    >;

    template<typename T>
        requires(!std::is_same_v<std::decay_t<T>, Event> && std::is_constructible_v<Variant, T&&>)
    Event(T&& event) : m_data(std::forward<T>(event)) {}

    Event(const Event&) = default;
    Event(Event&&) = default;
    Event& operator=(const Event&) = default;
    Event& operator=(Event&&) = default;

    [[nodiscard]] EventKind kind() const noexcept {
        return static_cast<EventKind>(m_data.index());
    }

    [[nodiscard]] const char* kind_name() const noexcept { return event_kind_name(kind()); }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    template<typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(m_data);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

// =============================================================================
// Message
// =============================================================================

/// What the engine reports to its message handler
class Message {
public:
    Message(Mutation mutation) : m_data(std::move(mutation)) {}
    Message(Event event) : m_data(std::move(event)) {}

    [[nodiscard]] bool is_mutation() const noexcept { return std::holds_alternative<Mutation>(m_data); }
    [[nodiscard]] bool is_event() const noexcept { return std::holds_alternative<Event>(m_data); }

    [[nodiscard]] const Mutation* mutation() const noexcept { return std::get_if<Mutation>(&m_data); }
    [[nodiscard]] const Event* event() const noexcept { return std::get_if<Event>(&m_data); }

    /// Display form used in logs ("mutation:Connect", "event:GraphDirtied")
    [[nodiscard]] std::string describe() const;

private:
    std::variant<Mutation, Event> m_data;
};

// =============================================================================
// History
// =============================================================================

/// Bounded undo/redo stacks of mutations
class History {
public:
    static constexpr std::size_t DEFAULT_MAX_SIZE = 100;

    explicit History(std::size_t max_size = DEFAULT_MAX_SIZE);

    /// Record @p mutation, coalescing with the newest entry when possible
    ///
    /// A new entry clears the redo stack; the oldest entry is dropped when
    /// the undo stack exceeds max_size.
    void push(Mutation mutation);

    /// Pop the newest entry and return the mutation that reverts it
    [[nodiscard]] std::optional<Mutation> undo();

    /// Re-apply the most recently undone entry
    [[nodiscard]] std::optional<Mutation> redo();

    [[nodiscard]] bool can_undo() const noexcept { return !m_undo.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !m_redo.empty(); }

    void clear();

    /// Point stored entries at @p to after node @p from was recreated
    void retarget(NodeIndex from, NodeIndex to) noexcept;

    [[nodiscard]] std::size_t undo_size() const noexcept { return m_undo.size(); }
    [[nodiscard]] std::size_t redo_size() const noexcept { return m_redo.size(); }
    [[nodiscard]] std::size_t max_size() const noexcept { return m_max_size; }

    /// Newest undo entry
    [[nodiscard]] const Mutation* peek_undo() const noexcept {
        return m_undo.empty() ? nullptr : &m_undo.back();
    }

private:
    std::deque<Mutation> m_undo;
    std::vector<Mutation> m_redo;
    std::size_t m_max_size;
};

} // namespace grafiek_engine
