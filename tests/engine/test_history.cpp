// grafiek_engine Mutation, Message and History tests

#include <catch2/catch_test_macros.hpp>
#include <grafiek/engine/history.hpp>

using namespace grafiek_engine;

namespace {

const NodeIndex NODE_A(0, 0);
const NodeIndex NODE_B(1, 0);

Mutation move_node(NodeIndex node, glm::vec2 from, glm::vec2 to) {
    return Mutation(mutation::MoveNode{node, from, to});
}

Mutation set_input(NodeIndex node, SlotIndex slot, float from, float to) {
    return Mutation(mutation::SetInput{node, slot, Value(from), Value(to)});
}

} // anonymous namespace

// =============================================================================
// Mutation
// =============================================================================

TEST_CASE("Mutation inverse", "[engine][history]") {
    SECTION("connect and disconnect swap") {
        Mutation connect(mutation::Connect{NODE_A, 0, NODE_B, 1});
        Mutation inverse = connect.inverse();
        REQUIRE(inverse.kind() == MutationKind::Disconnect);
        REQUIRE(inverse.as<mutation::Disconnect>().to_slot == 1);
        REQUIRE(inverse.inverse().kind() == MutationKind::Connect);
    }

    SECTION("create and delete swap and keep the record") {
        NodeRecord record;
        record.id = NodeId{4};
        record.op_path = OpPath{"core", "input"};
        Mutation create(mutation::CreateNode{NODE_A, record});

        Mutation inverse = create.inverse();
        REQUIRE(inverse.is<mutation::DeleteNode>());
        REQUIRE(inverse.as<mutation::DeleteNode>().record == record);
    }

    SECTION("value edits swap old and new") {
        Mutation inverse = set_input(NODE_A, 0, 1.0f, 2.0f).inverse();
        const auto& edit = inverse.as<mutation::SetInput>();
        REQUIRE(edit.old_value == Value(2.0f));
        REQUIRE(edit.new_value == Value(1.0f));

        Mutation config(mutation::SetConfig{NODE_A, 0, Value(std::int32_t{0}), Value(std::int32_t{3})});
        REQUIRE(config.inverse().as<mutation::SetConfig>().new_value == Value(std::int32_t{0}));
    }

    SECTION("labels swap including empty ones") {
        Mutation label(mutation::SetLabel{NODE_A, std::nullopt, std::string("blur")});
        Mutation reverted = label.inverse();
        const auto& inverse = reverted.as<mutation::SetLabel>();
        REQUIRE_FALSE(inverse.new_label.has_value());
        REQUIRE(inverse.old_label == "blur");
    }

    SECTION("move positions swap") {
        Mutation inverse = move_node(NODE_A, {0, 0}, {10, 5}).inverse();
        REQUIRE(inverse.as<mutation::MoveNode>().new_position == glm::vec2(0, 0));
    }
}

TEST_CASE("Mutation dirties_graph", "[engine][history]") {
    REQUIRE(Mutation(mutation::Connect{NODE_A, 0, NODE_B, 0}).dirties_graph());
    REQUIRE(Mutation(mutation::Disconnect{NODE_A, 0, NODE_B, 0}).dirties_graph());
    REQUIRE(Mutation(mutation::DeleteNode{NODE_A, NodeRecord{}}).dirties_graph());
    REQUIRE(set_input(NODE_A, 0, 0, 1).dirties_graph());
    REQUIRE(Mutation(mutation::SetConfig{NODE_A, 0, Value(), Value()}).dirties_graph());

    REQUIRE_FALSE(Mutation(mutation::CreateNode{NODE_A, NodeRecord{}}).dirties_graph());
    REQUIRE_FALSE(move_node(NODE_A, {0, 0}, {1, 1}).dirties_graph());
    REQUIRE_FALSE(Mutation(mutation::SetLabel{NODE_A, std::nullopt, std::nullopt}).dirties_graph());
}

TEST_CASE("Mutation coalescing", "[engine][history]") {
    SECTION("same slot edits merge keeping the first old value") {
        Mutation first = set_input(NODE_A, 0, 1.0f, 2.0f);
        REQUIRE(first.try_coalesce(set_input(NODE_A, 0, 2.0f, 3.0f)));
        REQUIRE(first.as<mutation::SetInput>().old_value == Value(1.0f));
        REQUIRE(first.as<mutation::SetInput>().new_value == Value(3.0f));
    }

    SECTION("different slot, node or kind does not merge") {
        Mutation first = set_input(NODE_A, 0, 1.0f, 2.0f);
        REQUIRE_FALSE(first.try_coalesce(set_input(NODE_A, 1, 2.0f, 3.0f)));
        REQUIRE_FALSE(first.try_coalesce(set_input(NODE_B, 0, 2.0f, 3.0f)));
        REQUIRE_FALSE(first.try_coalesce(
            Mutation(mutation::SetConfig{NODE_A, 0, Value(2.0f), Value(3.0f)})));
    }

    SECTION("connections never merge") {
        Mutation connect(mutation::Connect{NODE_A, 0, NODE_B, 0});
        REQUIRE_FALSE(connect.try_coalesce(Mutation(mutation::Connect{NODE_A, 0, NODE_B, 0})));
    }
}

// =============================================================================
// Message
// =============================================================================

TEST_CASE("Message wraps mutations and events", "[engine][history]") {
    Message change(Mutation(mutation::Connect{NODE_A, 0, NODE_B, 0}));
    REQUIRE(change.is_mutation());
    REQUIRE(change.event() == nullptr);
    REQUIRE(change.describe() == "mutation:Connect");

    Message executed(Event(event::NodeExecuted{NODE_B}));
    REQUIRE(executed.is_event());
    REQUIRE(executed.event()->as<event::NodeExecuted>().node == NODE_B);
    REQUIRE(executed.describe() == "event:NodeExecuted");

    Event errors(event::ErrorsChanged{{GraphIssue{NODE_A, "bad"}}});
    REQUIRE(errors.kind() == EventKind::ErrorsChanged);
    REQUIRE(errors.as<event::ErrorsChanged>().errors.size() == 1);
}

// =============================================================================
// History
// =============================================================================

TEST_CASE("History undo and redo", "[engine][history]") {
    History history;
    REQUIRE_FALSE(history.can_undo());
    REQUIRE_FALSE(history.undo().has_value());

    history.push(Mutation(mutation::Connect{NODE_A, 0, NODE_B, 0}));
    history.push(set_input(NODE_B, 0, 0.0f, 1.0f));

    SECTION("undo returns inverses newest first") {
        auto first = history.undo();
        REQUIRE(first->kind() == MutationKind::SetInput);
        REQUIRE(first->as<mutation::SetInput>().new_value == Value(0.0f));

        auto second = history.undo();
        REQUIRE(second->kind() == MutationKind::Disconnect);
        REQUIRE_FALSE(history.can_undo());
        REQUIRE(history.redo_size() == 2);
    }

    SECTION("redo returns the original mutation") {
        (void)history.undo();
        auto again = history.redo();
        REQUIRE(again->kind() == MutationKind::SetInput);
        REQUIRE(again->as<mutation::SetInput>().new_value == Value(1.0f));
        REQUIRE(history.undo_size() == 2);
        REQUIRE_FALSE(history.can_redo());
    }

    SECTION("a new entry clears redo") {
        (void)history.undo();
        REQUIRE(history.can_redo());
        history.push(move_node(NODE_A, {0, 0}, {1, 1}));
        REQUIRE_FALSE(history.can_redo());
    }

    SECTION("clear") {
        (void)history.undo();
        history.clear();
        REQUIRE_FALSE(history.can_undo());
        REQUIRE_FALSE(history.can_redo());
    }
}

TEST_CASE("History retargets recreated nodes", "[engine][history]") {
    const NodeIndex recreated(0, 1);
    History history;
    history.push(Mutation(mutation::Connect{NODE_A, 0, NODE_B, 0}));
    history.push(Mutation(mutation::Connect{NODE_B, 0, NODE_A, 1}));
    history.push(set_input(NODE_A, 0, 0.0f, 1.0f));
    (void)history.undo();

    history.retarget(NODE_A, recreated);

    auto redone = history.redo();
    REQUIRE(redone->as<mutation::SetInput>().node == recreated);

    auto inbound = history.undo();
    REQUIRE(inbound.has_value());
    inbound = history.undo();
    REQUIRE(inbound->as<mutation::Disconnect>().from_node == NODE_B);
    REQUIRE(inbound->as<mutation::Disconnect>().to_node == recreated);

    auto outbound = history.undo();
    REQUIRE(outbound->as<mutation::Disconnect>().from_node == recreated);
    REQUIRE(outbound->as<mutation::Disconnect>().to_node == NODE_B);
}

TEST_CASE("History coalesces consecutive moves", "[engine][history]") {
    History history;
    history.push(move_node(NODE_A, {0, 0}, {1, 0}));
    history.push(move_node(NODE_A, {1, 0}, {2, 0}));
    history.push(move_node(NODE_A, {2, 0}, {3, 0}));

    REQUIRE(history.undo_size() == 1);
    auto inverse = history.undo();
    REQUIRE(inverse->as<mutation::MoveNode>().new_position == glm::vec2(0, 0));
    REQUIRE(inverse->as<mutation::MoveNode>().old_position == glm::vec2(3, 0));
}

TEST_CASE("History drops the oldest entries", "[engine][history]") {
    History history(3);
    for (int i = 0; i < 5; ++i) {
        history.push(Mutation(mutation::Connect{NODE_A, static_cast<SlotIndex>(i), NODE_B, 0}));
    }

    REQUIRE(history.undo_size() == 3);
    REQUIRE(history.peek_undo()->as<mutation::Connect>().from_slot == 4);

    (void)history.undo();
    (void)history.undo();
    auto oldest = history.undo();
    REQUIRE(oldest->as<mutation::Disconnect>().from_slot == 2);
    REQUIRE_FALSE(history.can_undo());
}
