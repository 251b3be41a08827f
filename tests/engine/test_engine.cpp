// grafiek_engine Engine tests

#include <catch2/catch_test_macros.hpp>
#include <grafiek/engine/engine.hpp>
#include <grafiek/engine/ops/arithmetic.hpp>
#include <grafiek/engine/ops/input.hpp>
#include <grafiek/engine/system_textures.hpp>
#include "gpu/backends/null/null_backend.hpp"
#include "test_operations.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace grafiek_engine;
using namespace grafiek_test;
using grafiek_core::GraphError;
using grafiek_core::RegistryError;

namespace {

/// Collects every message the engine emits
struct Recorder {
    std::vector<Message> messages;

    MessageHandler handler() {
        return [this](const Message& message) { messages.push_back(message); };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& message : messages) {
            out.push_back(message.describe());
        }
        return out;
    }

    std::vector<MutationKind> mutation_kinds() const {
        std::vector<MutationKind> out;
        for (const auto& message : messages) {
            if (const Mutation* change = message.mutation()) {
                out.push_back(change->kind());
            }
        }
        return out;
    }

    std::size_t count(const std::string& name) const {
        auto all = names();
        return static_cast<std::size_t>(std::count(all.begin(), all.end(), name));
    }

    void clear() { messages.clear(); }
};

std::unique_ptr<Engine> make_engine(Recorder* recorder = nullptr) {
    EngineDescriptor descriptor;
    descriptor.backend = std::make_unique<grafiek_gpu::backends::NullBackend>();
    if (recorder) {
        descriptor.on_message = recorder->handler();
    }
    auto engine = Engine::init(std::move(descriptor));
    REQUIRE(engine.is_ok());
    auto ptr = std::move(engine.value());
    REQUIRE(ptr->register_op<Scale>().is_ok());
    REQUIRE(ptr->register_op<TextureSource>().is_ok());
    REQUIRE(ptr->register_op<Failing>().is_ok());
    REQUIRE(ptr->register_op<Clock>().is_ok());
    return ptr;
}

NodeIndex instance(Engine& engine, const std::string& library, const std::string& op) {
    auto idx = engine.instance_node(library, op);
    REQUIRE(idx.is_ok());
    return *idx;
}

SlotEditor set_to(Value value) {
    return [value](const SlotDef&, ValueMut& slot) { return slot.set(value); };
}

/// input -> (scale, scale) -> add -> output, all scales at factor 2
struct Diamond {
    NodeIndex input;
    NodeIndex left;
    NodeIndex right;
    NodeIndex add;
    NodeIndex output;

    explicit Diamond(Engine& engine) {
        input = instance(engine, "core", "input");
        left = instance(engine, "test", "scale");
        right = instance(engine, "test", "scale");
        add = instance(engine, "math", "add");
        output = instance(engine, "core", "output");

        REQUIRE(engine.edit_graph_input(input, set_to(Value(1.75f))).is_ok());
        REQUIRE(engine.connect(input, left, 0, 0).is_ok());
        REQUIRE(engine.connect(input, right, 0, 0).is_ok());
        REQUIRE(engine.connect(left, add, 0, 0).is_ok());
        REQUIRE(engine.connect(right, add, 0, 1).is_ok());
        REQUIRE(engine.connect(add, output, 0, 0).is_ok());
    }
};

} // anonymous namespace

// =============================================================================
// Initialization and registry
// =============================================================================

TEST_CASE("Engine init", "[engine][engine]") {
    SECTION("built-in operators and system textures") {
        auto engine = make_engine();
        REQUIRE(engine->node_count() == 0);
        REQUIRE(engine->context().textures().size() == SYSTEM_TEXTURE_COUNT);
        REQUIRE(engine->context().textures().contains(*CHECK.id));

        auto categories = engine->node_categories();
        REQUIRE(categories == std::vector<std::string>{"core", "math", "test"});

        auto core = engine->iter_category("core");
        REQUIRE(core.size() == 3);
        REQUIRE(core[0] == std::pair<std::string, std::string>{"comment", "Comment"});
        REQUIRE(core[1].first == "input");
        REQUIRE(core[2].first == "output");
        REQUIRE(engine->iter_category("missing").empty());
    }

    SECTION("backend from config name") {
        EngineDescriptor descriptor;
        descriptor.config.gpu_backend = "headless";
        REQUIRE(Engine::init(std::move(descriptor)).is_ok());
    }

    SECTION("unknown backend name") {
        EngineDescriptor descriptor;
        descriptor.config.gpu_backend = "vulkan";
        auto engine = Engine::init(std::move(descriptor));
        REQUIRE(engine.is_err());
        REQUIRE(engine.error().code() == grafiek_core::ErrorCode::NotSupported);
    }
}

TEST_CASE("Engine operator registry", "[engine][engine]") {
    auto engine = make_engine();

    SECTION("duplicate registration") {
        auto result = engine->register_op<Scale>();
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_registry(RegistryError::Kind::DuplicateOperationType));
    }

    SECTION("unknown operator") {
        auto idx = engine->instance_node("test", "missing");
        REQUIRE(idx.is_err());
        REQUIRE(idx.error().is_registry(RegistryError::Kind::UnknownOperationType));
        REQUIRE(engine->node_count() == 0);
    }

    SECTION("setup failure adds nothing") {
        REQUIRE(engine->add_node(std::make_unique<DuplicateSlots>()).is_err());
        REQUIRE(engine->node_count() == 0);
        REQUIRE_FALSE(engine->can_undo());
    }

    SECTION("node ids are sequential") {
        NodeIndex a = instance(*engine, "core", "input");
        NodeIndex b = instance(*engine, "core", "comment");
        REQUIRE(engine->get_node(a)->id() == NodeId{1});
        REQUIRE(engine->get_node(b)->id() == NodeId{2});
        REQUIRE(engine->inputs() == std::vector<NodeIndex>{a});
    }
}

// =============================================================================
// Connections
// =============================================================================

TEST_CASE("Engine connect", "[engine][engine][edges]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);

    NodeIndex a = instance(*engine, "core", "input");
    NodeIndex b = instance(*engine, "core", "input");
    NodeIndex out = instance(*engine, "core", "output");
    recorder.clear();

    SECTION("connect emits Connect and dirties") {
        REQUIRE(engine->connect(a, out, 0, 0).is_ok());
        REQUIRE(recorder.names() == std::vector<std::string>{"mutation:Connect", "event:GraphDirtied"});
        REQUIRE(engine->edge_count() == 1);
    }

    SECTION("identical edge is a no-op") {
        REQUIRE(engine->connect(a, out, 0, 0).is_ok());
        recorder.clear();
        REQUIRE(engine->connect(a, out, 0, 0).is_ok());
        REQUIRE(recorder.messages.empty());
        REQUIRE(engine->edge_count() == 1);
    }

    SECTION("new driver replaces the old edge") {
        REQUIRE(engine->connect(a, out, 0, 0).is_ok());
        recorder.clear();
        REQUIRE(engine->connect(b, out, 0, 0).is_ok());
        REQUIRE(recorder.mutation_kinds() ==
                std::vector<MutationKind>{MutationKind::Disconnect, MutationKind::Connect});
        REQUIRE(engine->edge_count() == 1);
        REQUIRE(engine->edges()[0].from == b);
    }

    SECTION("missing slots and nodes") {
        auto bad_source = engine->connect(a, out, 3, 0);
        REQUIRE(bad_source.error().is_graph(GraphError::Kind::NoOutputSlot));
        auto bad_sink = engine->connect(a, out, 0, 3);
        REQUIRE(bad_sink.error().is_graph(GraphError::Kind::NoInputSlot));

        REQUIRE(engine->delete_node(b).is_ok());
        auto stale = engine->connect(b, out, 0, 0);
        REQUIRE(stale.error().is_graph(GraphError::Kind::NodeNotFound));
    }

    SECTION("incompatible types") {
        NodeIndex textures = instance(*engine, "test", "texture_source");
        NodeIndex scale = instance(*engine, "test", "scale");
        auto result = engine->connect(textures, scale, 0, 0);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_graph(GraphError::Kind::IncompatibleTypes));
    }

    SECTION("disconnect") {
        REQUIRE(engine->connect(a, out, 0, 0).is_ok());
        recorder.clear();
        REQUIRE(engine->disconnect(a, out, 0, 0).is_ok());
        REQUIRE(recorder.mutation_kinds() == std::vector<MutationKind>{MutationKind::Disconnect});
        REQUIRE(engine->edge_count() == 0);

        auto again = engine->disconnect(a, out, 0, 0);
        REQUIRE(again.error().is_graph(GraphError::Kind::EdgeNotFound));
    }
}

TEST_CASE("Engine rejects cycles", "[engine][engine][edges]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);

    NodeIndex first = instance(*engine, "test", "scale");
    NodeIndex second = instance(*engine, "test", "scale");
    NodeIndex third = instance(*engine, "test", "scale");
    REQUIRE(engine->connect(first, second, 0, 0).is_ok());
    REQUIRE(engine->connect(second, third, 0, 0).is_ok());

    std::size_t history = engine->history().undo_size();
    recorder.clear();

    SECTION("back edge") {
        auto result = engine->connect(third, first, 0, 0);
        REQUIRE(result.error().is_graph(GraphError::Kind::CreatesLoop));
    }

    SECTION("self edge") {
        auto result = engine->connect(second, second, 0, 0);
        REQUIRE(result.error().is_graph(GraphError::Kind::CreatesLoop));
    }

    REQUIRE(engine->edge_count() == 2);
    REQUIRE(engine->history().undo_size() == history);
    REQUIRE(recorder.messages.empty());
}

// =============================================================================
// Nodes
// =============================================================================

TEST_CASE("Engine delete_node", "[engine][engine][nodes]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);

    NodeIndex input = instance(*engine, "core", "input");
    NodeIndex left = instance(*engine, "test", "scale");
    NodeIndex right = instance(*engine, "test", "scale");
    REQUIRE(engine->connect(input, left, 0, 0).is_ok());
    REQUIRE(engine->connect(input, right, 0, 0).is_ok());
    recorder.clear();

    REQUIRE(engine->delete_node(input).is_ok());
    REQUIRE(recorder.mutation_kinds() == std::vector<MutationKind>{
        MutationKind::Disconnect, MutationKind::Disconnect, MutationKind::DeleteNode});
    REQUIRE(engine->get_node(input) == nullptr);
    REQUIRE(engine->edge_count() == 0);
    REQUIRE(engine->node_count() == 2);

    auto again = engine->delete_node(input);
    REQUIRE(again.error().is_graph(GraphError::Kind::NodeNotFound));
}

TEST_CASE("Engine node textures", "[engine][engine][textures]") {
    auto engine = make_engine();
    auto& pool = engine->context().textures();

    NodeIndex source = instance(*engine, "test", "texture_source");
    REQUIRE(pool.size() == SYSTEM_TEXTURE_COUNT + 3);

    const auto* image = engine->get_node(source)->output_values()[0].get<TextureHandle>();
    REQUIRE(image != nullptr);
    REQUIRE(image->id.has_value());
    REQUIRE(image->id->value >= SYSTEM_TEXTURE_COUNT);
    REQUIRE(image->width == 4);

    SECTION("shrinking the output list releases textures") {
        REQUIRE(engine->edit_node_config(source, 0, set_to(Value(std::int32_t{1}))).is_ok());
        REQUIRE(pool.size() == SYSTEM_TEXTURE_COUNT + 1);
    }

    SECTION("delete releases every node texture") {
        REQUIRE(engine->delete_node(source).is_ok());
        REQUIRE(pool.size() == SYSTEM_TEXTURE_COUNT);
    }

    SECTION("upload replaces the output texture") {
        Recorder recorder;
        auto watched = make_engine(&recorder);
        NodeIndex node = instance(*watched, "test", "texture_source");
        recorder.clear();

        std::vector<std::uint8_t> pixels(2 * 2 * 4, 0xff);
        REQUIRE(watched->upload_texture(node, 1, 2, 2, pixels).is_ok());
        REQUIRE(recorder.names() == std::vector<std::string>{"event:GraphDirtied"});

        const auto* uploaded = watched->get_node(node)->output_values()[1].get<TextureHandle>();
        REQUIRE(uploaded->width == 2);
        REQUIRE(uploaded->height == 2);
        auto backing = watched->get_texture(*uploaded);
        REQUIRE(backing.has_value());
        REQUIRE(watched->context().textures().size() == SYSTEM_TEXTURE_COUNT + 3);
    }

    SECTION("upload size mismatch") {
        std::vector<std::uint8_t> pixels(3);
        auto result = engine->upload_texture(source, 0, 2, 2, pixels);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == grafiek_core::ErrorCode::InvalidArgument);
    }

    SECTION("upload to a non-texture slot") {
        NodeIndex scale = instance(*engine, "test", "scale");
        std::vector<std::uint8_t> pixels(4);
        auto result = engine->upload_texture(scale, 0, 1, 1, pixels);
        REQUIRE(result.error().is_graph(GraphError::Kind::NotATexture));
    }
}

TEST_CASE("Engine position and label", "[engine][engine][nodes]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);
    NodeIndex node = instance(*engine, "core", "comment");
    std::size_t history = engine->history().undo_size();
    recorder.clear();

    SECTION("moves coalesce into one undo entry") {
        REQUIRE(engine->set_node_position(node, {1.0f, 1.0f}).is_ok());
        REQUIRE(engine->set_node_position(node, {2.0f, 4.0f}).is_ok());
        REQUIRE(engine->set_node_position(node, {3.0f, 9.0f}).is_ok());
        REQUIRE(engine->history().undo_size() == history + 1);
        REQUIRE(recorder.count("event:GraphDirtied") == 0);

        REQUIRE(engine->undo().value());
        REQUIRE(engine->get_node(node)->record().position == glm::vec2(0.0f, 0.0f));
    }

    SECTION("labels") {
        REQUIRE(engine->set_label(node, "note").is_ok());
        REQUIRE(engine->get_node(node)->record().label == std::optional<std::string>("note"));
        REQUIRE(engine->set_label(node, "note").is_ok());
        REQUIRE(recorder.mutation_kinds() == std::vector<MutationKind>{MutationKind::SetLabel});

        REQUIRE(engine->set_label(node, "").is_ok());
        REQUIRE_FALSE(engine->get_node(node)->record().label.has_value());
    }
}

// =============================================================================
// Editing
// =============================================================================

TEST_CASE("Engine edits", "[engine][engine][editing]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);

    NodeIndex input = instance(*engine, "core", "input");
    NodeIndex scale = instance(*engine, "test", "scale");
    recorder.clear();

    SECTION("unchanged edit emits nothing") {
        REQUIRE(engine->edit_node_input(input, 0, set_to(Value(0.0f))).is_ok());
        REQUIRE(recorder.messages.empty());
        REQUIRE_FALSE(engine->history().peek_undo()->is<mutation::SetInput>());
    }

    SECTION("changed edit emits SetInput and one GraphDirtied") {
        REQUIRE(engine->edit_node_input(input, 0, set_to(Value(4.0f))).is_ok());
        REQUIRE(recorder.names() == std::vector<std::string>{"mutation:SetInput", "event:GraphDirtied"});
        const auto& change = recorder.messages[0].mutation()->as<mutation::SetInput>();
        REQUIRE(change.old_value == Value(0.0f));
        REQUIRE(change.new_value == Value(4.0f));
    }

    SECTION("edit errors leave the value") {
        auto result = engine->edit_node_input(input, 0, set_to(Value("text")));
        REQUIRE(result.is_err());
        REQUIRE(engine->get_node(input)->record().input_values[0] == Value(0.0f));
        REQUIRE(recorder.messages.empty());
    }

    SECTION("edit_all_node_inputs") {
        REQUIRE(engine->edit_all_node_inputs(scale, set_to(Value(std::int32_t{3}))).is_ok());
        REQUIRE(engine->get_node(scale)->record().input_values[0] == Value(3.0f));
    }

    SECTION("graph input guards") {
        auto not_input = engine->edit_graph_input(scale, set_to(Value(1.0f)));
        REQUIRE(not_input.error().is_graph(GraphError::Kind::NotInputNode));

        NodeIndex driver = instance(*engine, "core", "input");
        REQUIRE(engine->connect(driver, input, 0, 0).is_ok());
        auto connected = engine->edit_graph_input(input, set_to(Value(1.0f)));
        REQUIRE(connected.error().is_graph(GraphError::Kind::InputHasConnection));

        REQUIRE(engine->edit_graph_input(driver, set_to(Value(1.0f))).is_ok());
    }

    SECTION("config edits reconfigure the node") {
        REQUIRE(engine->edit_node_config(input, 0, set_to(Value(std::int32_t{3}))).is_ok());
        REQUIRE(engine->operation<ops::Input>(input)->value_type() == ValueType::String);
        REQUIRE(recorder.names() == std::vector<std::string>{"mutation:SetConfig", "event:GraphDirtied"});
    }

    SECTION("config edits drop edges the new signature rejects") {
        NodeIndex add = instance(*engine, "math", "add");
        NodeIndex other = instance(*engine, "core", "input");
        REQUIRE(engine->connect(input, add, 0, 0).is_ok());
        REQUIRE(engine->connect(other, add, 0, 1).is_ok());
        recorder.clear();

        auto abs = static_cast<std::int32_t>(ops::ArithOp::Abs);
        REQUIRE(engine->edit_node_config(add, 0, set_to(Value(abs))).is_ok());
        REQUIRE(recorder.mutation_kinds() ==
                std::vector<MutationKind>{MutationKind::Disconnect, MutationKind::SetConfig});
        REQUIRE(engine->edge_count() == 1);
        REQUIRE(engine->edges()[0].from == input);
    }

    SECTION("edit_all_node_configs") {
        NodeIndex source = instance(*engine, "test", "texture_source");
        REQUIRE(engine->edit_all_node_configs(source, set_to(Value(std::int32_t{2}))).is_ok());
        REQUIRE(engine->get_node(source)->record().config_values ==
                std::vector<Value>{Value(std::int32_t{2}), Value(std::int32_t{2})});
        REQUIRE(engine->get_node(source)->signature().output_count() == 2);
        REQUIRE(engine->get_node(source)->output_values()[1].get<TextureHandle>()->width == 2);
    }

    SECTION("reconfigure_node keeps valid edges") {
        REQUIRE(engine->connect(input, scale, 0, 0).is_ok());
        recorder.clear();
        REQUIRE(engine->reconfigure_node(scale).is_ok());
        REQUIRE(engine->edge_count() == 1);
        REQUIRE(recorder.messages.empty());

        NodeIndex stale = input;
        REQUIRE(engine->delete_node(input).is_ok());
        auto result = engine->reconfigure_node(stale);
        REQUIRE(result.error().is_graph(GraphError::Kind::NodeNotFound));
    }

    SECTION("failed configure restores the config") {
        NodeIndex add = instance(*engine, "math", "add");
        recorder.clear();
        REQUIRE(engine->edit_node_config(add, 0, set_to(Value(std::int32_t{42}))).is_err());
        REQUIRE(engine->get_node(add)->record().config_values[0] == Value(std::int32_t{0}));
        REQUIRE(engine->get_node(add)->signature().input_count() == 2);
        REQUIRE(recorder.messages.empty());
    }
}

// =============================================================================
// Execution
// =============================================================================

TEST_CASE("Engine execute", "[engine][engine][execution]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);
    Diamond graph(*engine);
    recorder.clear();

    engine->execute();

    SECTION("diamond result") {
        auto result = engine->result(0);
        REQUIRE(result.has_value());
        REQUIRE(*result == Value(7.0f));
        REQUIRE(engine->results() == std::vector<Value>{Value(7.0f)});
        REQUIRE_FALSE(engine->result(1).has_value());
    }

    SECTION("events bracket node execution in dependency order") {
        auto names = recorder.names();
        REQUIRE(names.front() == "event:ExecutionStarted");
        REQUIRE(names.back() == "event:ExecutionCompleted");
        REQUIRE(recorder.count("event:NodeExecuted") == 5);

        std::vector<NodeIndex> order;
        for (const auto& message : recorder.messages) {
            const Event* e = message.event();
            if (e && e->is<event::NodeExecuted>()) {
                order.push_back(e->as<event::NodeExecuted>().node);
            }
        }
        auto position = [&](NodeIndex idx) {
            return std::find(order.begin(), order.end(), idx) - order.begin();
        };
        REQUIRE(position(graph.input) < position(graph.left));
        REQUIRE(position(graph.input) < position(graph.right));
        REQUIRE(position(graph.left) < position(graph.add));
        REQUIRE(position(graph.right) < position(graph.add));
        REQUIRE(position(graph.add) < position(graph.output));
    }

    SECTION("executed nodes are clean") {
        REQUIRE_FALSE(engine->get_node(graph.add)->is_dirty());
        REQUIRE(engine->operation<Scale>(graph.left)->executions == 1);
    }

    SECTION("input edits flow through on the next run") {
        REQUIRE(engine->edit_graph_input(graph.input, set_to(Value(0.5f))).is_ok());
        engine->execute();
        REQUIRE(engine->result(0) == std::optional<Value>(Value(2.0f)));
    }

    SECTION("no errors, no error events") {
        REQUIRE(recorder.count("event:ErrorsChanged") == 0);
        REQUIRE(recorder.count("event:ErrorsCleared") == 0);
    }
}

TEST_CASE("Engine adds two graph inputs", "[engine][engine][execution]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);

    NodeIndex a = instance(*engine, "core", "input");
    NodeIndex b = instance(*engine, "core", "input");
    NodeIndex add = instance(*engine, "math", "add");
    NodeIndex out = instance(*engine, "core", "output");
    REQUIRE(engine->edit_graph_input(a, set_to(Value(3.0f))).is_ok());
    REQUIRE(engine->edit_graph_input(b, set_to(Value(4.0f))).is_ok());
    REQUIRE(engine->connect(a, add, 0, 0).is_ok());
    REQUIRE(engine->connect(b, add, 0, 1).is_ok());
    REQUIRE(engine->connect(add, out, 0, 0).is_ok());
    recorder.clear();

    engine->execute();
    REQUIRE(engine->result(0) == std::optional<Value>(Value(7.0f)));

    std::vector<NodeIndex> order;
    for (const auto& message : recorder.messages) {
        if (message.event() && message.event()->is<event::NodeExecuted>()) {
            order.push_back(message.event()->as<event::NodeExecuted>().node);
        }
    }
    REQUIRE(order.size() == 4);
    REQUIRE(order[2] == add);
    REQUIRE(order[3] == out);
}

TEST_CASE("Engine timing", "[engine][engine][execution]") {
    auto engine = make_engine();
    NodeIndex clock = instance(*engine, "test", "clock");
    REQUIRE(engine->operation<Clock>(clock)->is_stateful());
    REQUIRE_FALSE(engine->get_node(instance(*engine, "core", "comment"))->operation().is_stateful());

    engine->set_timing(TimeInfo{1.5f, 0.25f, 90});
    engine->execute();
    REQUIRE(engine->context().timing().delta == 0.25f);

    const auto& outputs = engine->get_node(clock)->output_values();
    REQUIRE(outputs[0] == Value(1.5f));
    REQUIRE(outputs[1] == Value(std::int32_t{90}));
}

TEST_CASE("Engine execution errors", "[engine][engine][execution]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);
    NodeIndex failing = instance(*engine, "test", "failing");
    recorder.clear();

    engine->execute();
    REQUIRE(recorder.count("event:ErrorsChanged") == 1);
    const Event* changed = nullptr;
    for (const auto& message : recorder.messages) {
        if (message.event() && message.event()->is<event::ErrorsChanged>()) {
            changed = message.event();
        }
    }
    REQUIRE(changed != nullptr);
    const auto& errors = changed->as<event::ErrorsChanged>().errors;
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].node == std::optional<NodeIndex>(failing));
    REQUIRE(errors[0].message == "shader missing");
    REQUIRE(engine->get_node(failing)->is_dirty());

    engine->operation<Failing>(failing)->fail = false;
    recorder.clear();
    engine->execute();
    REQUIRE(recorder.count("event:ErrorsCleared") == 1);

    recorder.clear();
    engine->execute();
    REQUIRE(recorder.count("event:ErrorsCleared") == 0);
    REQUIRE(recorder.count("event:ErrorsChanged") == 0);
}

// =============================================================================
// History
// =============================================================================

TEST_CASE("Engine undo and redo", "[engine][engine][history]") {
    auto engine = make_engine();

    SECTION("nothing to undo") {
        auto result = engine->undo();
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.value());
        REQUIRE_FALSE(engine->redo().value());
    }

    SECTION("config edit") {
        NodeIndex scale = instance(*engine, "test", "scale");
        REQUIRE(engine->edit_node_config(scale, 0, set_to(Value(std::int32_t{5}))).is_ok());
        REQUIRE(engine->operation<Scale>(scale)->factor == 5);

        REQUIRE(engine->undo().value());
        REQUIRE(engine->operation<Scale>(scale)->factor == 2);
        REQUIRE(engine->can_redo());

        REQUIRE(engine->redo().value());
        REQUIRE(engine->operation<Scale>(scale)->factor == 5);
    }

    SECTION("undoing a create removes the node") {
        instance(*engine, "core", "comment");
        REQUIRE(engine->undo().value());
        REQUIRE(engine->node_count() == 0);
        REQUIRE(engine->redo().value());
        REQUIRE(engine->node_count() == 1);
    }

    SECTION("undoing a delete restores the node and its edges") {
        NodeIndex input = instance(*engine, "core", "input");
        NodeIndex scale = instance(*engine, "test", "scale");
        REQUIRE(engine->edit_node_config(scale, 0, set_to(Value(std::int32_t{4}))).is_ok());
        REQUIRE(engine->connect(input, scale, 0, 0).is_ok());
        REQUIRE(engine->delete_node(scale).is_ok());

        REQUIRE(engine->undo().value());
        REQUIRE(engine->node_count() == 2);
        REQUIRE(engine->edge_count() == 0);

        REQUIRE(engine->undo().value());
        REQUIRE(engine->edge_count() == 1);

        NodeIndex restored = engine->edges()[0].to;
        REQUIRE(engine->get_node(restored)->id() == NodeId{2});
        REQUIRE(engine->operation<Scale>(restored)->factor == 4);

        REQUIRE(engine->redo().value());
        REQUIRE(engine->redo().value());
        REQUIRE(engine->node_count() == 1);
        REQUIRE(engine->edge_count() == 0);
    }

    SECTION("recreated nodes stay reachable across repeated cycles") {
        NodeIndex scale = instance(*engine, "test", "scale");
        REQUIRE(engine->delete_node(scale).is_ok());
        REQUIRE(engine->undo().value());
        NodeIndex first = engine->node_indices()[0];

        REQUIRE(engine->edit_node_config(first, 0, set_to(Value(std::int32_t{7}))).is_ok());
        REQUIRE(engine->delete_node(first).is_ok());
        REQUIRE(engine->undo().value());
        NodeIndex second = engine->node_indices()[0];
        REQUIRE(engine->operation<Scale>(second)->factor == 7);

        REQUIRE(engine->undo().value());
        REQUIRE(engine->operation<Scale>(second)->factor == 2);

        // Undo the original create through the rewritten entries
        REQUIRE(engine->undo().value());
        REQUIRE(engine->node_count() == 0);
        REQUIRE_FALSE(engine->can_undo());

        for (int cycle = 0; cycle < 3; ++cycle) {
            REQUIRE(engine->redo().value());
            REQUIRE(engine->node_count() == 1);
            REQUIRE(engine->undo().value());
            REQUIRE(engine->node_count() == 0);
        }
    }

    SECTION("a new edit clears redo") {
        NodeIndex input = instance(*engine, "core", "input");
        REQUIRE(engine->edit_node_input(input, 0, set_to(Value(1.0f))).is_ok());
        REQUIRE(engine->undo().value());
        REQUIRE(engine->edit_node_input(input, 0, set_to(Value(2.0f))).is_ok());
        REQUIRE_FALSE(engine->can_redo());
    }
}

// =============================================================================
// Documents
// =============================================================================

TEST_CASE("Engine documents", "[engine][engine][document]") {
    Recorder recorder;
    auto engine = make_engine(&recorder);
    Diamond graph(*engine);
    REQUIRE(engine->set_label(graph.add, "sum").is_ok());
    REQUIRE(engine->set_node_position(graph.output, {120.0f, 40.0f}).is_ok());

    Document saved = engine->save_document();
    REQUIRE(saved.nodes.size() == 5);
    REQUIRE(saved.edges.size() == 5);
    REQUIRE(saved.nodes[0].id == NodeId{1});
    recorder.clear();

    // Any rejected document must leave the diamond exactly as it was
    auto require_untouched = [&] {
        REQUIRE(engine->node_count() == 5);
        REQUIRE(engine->edge_count() == 5);
        REQUIRE(engine->get_node(graph.add) != nullptr);
        REQUIRE(engine->save_document() == saved);
        REQUIRE(engine->can_undo());
        REQUIRE(recorder.messages.empty());
    };

    SECTION("round trip into a fresh engine") {
        auto other = make_engine();
        REQUIRE(other->load_document(saved).is_ok());
        REQUIRE(other->save_document() == saved);
        REQUIRE_FALSE(other->can_undo());

        other->execute();
        REQUIRE(other->result(0) == std::optional<Value>(Value(7.0f)));

        // Ids continue after the loaded ones
        NodeIndex extra = instance(*other, "core", "comment");
        REQUIRE(other->get_node(extra)->id() == NodeId{6});
    }

    SECTION("unknown operator leaves the graph alone") {
        Document broken = saved;
        broken.nodes[2].op_path = OpPath{"test", "missing"};
        auto result = engine->load_document(broken);
        REQUIRE(result.error().is_registry(RegistryError::Kind::UnknownOperationType));
        REQUIRE(engine->node_count() == 5);
        REQUIRE(engine->can_undo());
    }

    SECTION("edges must reference loaded nodes") {
        Document broken = saved;
        broken.edges.push_back(EdgeRecord{NodeId{1}, 0, NodeId{99}, 0});
        auto result = engine->load_document(broken);
        REQUIRE(result.error().is_graph(GraphError::Kind::NodeNotFound));
        require_untouched();
    }

    SECTION("out of range ports leave the graph alone") {
        Document broken = saved;
        broken.edges[4].to_port = 3;
        auto result = engine->load_document(broken);
        REQUIRE(result.error().is_graph(GraphError::Kind::NoInputSlot));
        require_untouched();

        broken = saved;
        broken.edges[0].from_port = 2;
        result = engine->load_document(broken);
        REQUIRE(result.error().is_graph(GraphError::Kind::NoOutputSlot));
        require_untouched();
    }

    SECTION("edges are checked against the loaded signatures") {
        Document broken = saved;
        broken.nodes[0].config_values[0] = Value(std::int32_t{3});
        broken.nodes[0].input_values[0] = Value("text");
        auto result = engine->load_document(broken);
        REQUIRE(result.error().is_graph(GraphError::Kind::IncompatibleTypes));
        require_untouched();
    }

    SECTION("cycles in the document are rejected") {
        Document broken = saved;
        broken.edges.push_back(EdgeRecord{NodeId{4}, 0, NodeId{2}, 0});
        auto result = engine->load_document(broken);
        REQUIRE(result.error().is_graph(GraphError::Kind::CreatesLoop));
        require_untouched();
    }

    SECTION("a node that fails to configure leaves the graph alone") {
        Document broken = saved;
        broken.nodes[3].config_values[0] = Value(std::int32_t{42});
        REQUIRE(engine->load_document(broken).is_err());
        require_untouched();
    }

    SECTION("duplicate node ids are rejected") {
        Document broken = saved;
        broken.nodes[1].id = NodeId{1};
        auto result = engine->load_document(broken);
        const auto* error = result.error().as<grafiek_core::DocumentError>();
        REQUIRE(error != nullptr);
        REQUIRE(error->kind == grafiek_core::DocumentError::Kind::Schema);
        require_untouched();
    }

    SECTION("loading tears the old graph down through messages") {
        Document single;
        single.nodes = {saved.nodes[0]};
        REQUIRE(engine->load_document(single).is_ok());

        std::vector<MutationKind> expected(5, MutationKind::Disconnect);
        expected.insert(expected.end(), 5, MutationKind::DeleteNode);
        expected.push_back(MutationKind::CreateNode);
        REQUIRE(recorder.mutation_kinds() == expected);
        REQUIRE(recorder.count("event:GraphDirtied") == 10);

        std::vector<NodeIndex> deleted;
        for (const auto& message : recorder.messages) {
            if (const Mutation* change = message.mutation(); change && change->is<mutation::DeleteNode>()) {
                deleted.push_back(change->as<mutation::DeleteNode>().node);
            }
        }
        REQUIRE(deleted == std::vector<NodeIndex>{graph.input, graph.left, graph.right, graph.add, graph.output});

        REQUIRE(engine->node_count() == 1);
        REQUIRE(engine->edge_count() == 0);
        REQUIRE_FALSE(engine->can_undo());
    }
}
