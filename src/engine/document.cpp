/// @file document.cpp
/// @brief Graph document JSON encoding

#include <grafiek/engine/document.hpp>
#include <grafiek/core/log.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace grafiek_engine {

using grafiek_core::DocumentError;
using grafiek_core::Err;
using grafiek_core::Error;

namespace {

template<typename T>
Result<T> schema_error(const std::string& reason) {
    return Err<T>(Error(DocumentError::schema(reason)));
}

bool is_index(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return false;
    }
    const auto& v = j[key];
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<std::int64_t>() >= 0);
}

/// Non-negative integer field no larger than T's maximum
template<typename T>
bool is_index_within(const nlohmann::json& j, const char* key) {
    return is_index(j, key) && j[key].get<std::uint64_t>() <= std::numeric_limits<T>::max();
}

bool fits_i32(const nlohmann::json& v) {
    using Limits = std::numeric_limits<std::int32_t>;
    if (v.is_number_unsigned()) {
        return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(Limits::max());
    }
    auto n = v.get<std::int64_t>();
    return n >= Limits::min() && n <= Limits::max();
}

} // anonymous namespace

// =============================================================================
// Value
// =============================================================================

nlohmann::json value_to_json(const Value& value) {
    nlohmann::json j;
    j["type"] = value_type_name(value.type());

    if (const auto* v = value.get<std::int32_t>()) {
        j["value"] = *v;
    } else if (const auto* v = value.get<float>()) {
        j["value"] = *v;
    } else if (const auto* v = value.get<bool>()) {
        j["value"] = *v;
    } else if (const auto* v = value.get<std::string>()) {
        j["value"] = *v;
    } else if (const auto* v = value.get<TextureHandle>()) {
        nlohmann::json texture;
        texture["id"] = v->id ? nlohmann::json(v->id->value) : nlohmann::json(nullptr);
        texture["width"] = v->width;
        texture["height"] = v->height;
        texture["format"] = texture_format_name(v->fmt);
        j["value"] = std::move(texture);
    }
    return j;
}

Result<Value> value_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return schema_error<Value>("value: missing or invalid 'type' field");
    }

    const std::string type_name = j["type"].get<std::string>();
    auto type = parse_value_type(type_name);
    if (!type) {
        return schema_error<Value>("value: unknown type '" + type_name + "'");
    }
    if (*type == ValueType::Any) {
        return Result<Value>(Value());
    }
    if (!j.contains("value")) {
        return schema_error<Value>("value of type " + type_name + ": missing 'value' field");
    }

    const auto& v = j["value"];
    switch (*type) {
        case ValueType::I32:
            if (!v.is_number_integer()) break;
            if (!fits_i32(v)) {
                return schema_error<Value>("value of type i32: " + v.dump() + " is out of range");
            }
            return Result<Value>(Value(v.get<std::int32_t>()));
        case ValueType::F32:
            if (v.is_number()) return Result<Value>(Value(v.get<float>()));
            break;
        case ValueType::Bool:
            if (v.is_boolean()) return Result<Value>(Value(v.get<bool>()));
            break;
        case ValueType::String:
            if (v.is_string()) return Result<Value>(Value(v.get<std::string>()));
            break;
        case ValueType::Texture: {
            if (!v.is_object() || !is_index(v, "width") || !is_index(v, "height") ||
                !v.contains("format") || !v["format"].is_string()) {
                break;
            }
            if (!is_index_within<std::uint32_t>(v, "width") || !is_index_within<std::uint32_t>(v, "height")) {
                return schema_error<Value>("texture: width or height is out of range");
            }
            auto format = parse_texture_format(v["format"].get<std::string>());
            if (!format) {
                return schema_error<Value>("texture: unknown format '" + v["format"].get<std::string>() + "'");
            }
            TextureHandle handle;
            handle.width = v["width"].get<std::uint32_t>();
            handle.height = v["height"].get<std::uint32_t>();
            handle.fmt = *format;
            if (is_index(v, "id")) {
                handle.id = TextureId{v["id"].get<std::uint64_t>()};
            }
            return Result<Value>(Value(handle));
        }
        case ValueType::Any:
            break;
    }
    return schema_error<Value>("value of type " + type_name + ": 'value' has the wrong JSON type");
}

// =============================================================================
// NodeRecord
// =============================================================================

nlohmann::json record_to_json(const NodeRecord& record) {
    nlohmann::json j;
    j["id"] = record.id.value;
    j["library"] = record.op_path.library;
    j["operator"] = record.op_path.op;
    j["label"] = record.label ? nlohmann::json(*record.label) : nlohmann::json(nullptr);
    j["position"] = {record.position.x, record.position.y};

    j["inputs"] = nlohmann::json::array();
    for (const auto& value : record.input_values) {
        j["inputs"].push_back(value_to_json(value));
    }
    j["config"] = nlohmann::json::array();
    for (const auto& value : record.config_values) {
        j["config"].push_back(value_to_json(value));
    }
    return j;
}

Result<NodeRecord> record_from_json(const nlohmann::json& j) {
    NodeRecord record;

    if (!j.is_object() || !is_index(j, "id")) {
        return schema_error<NodeRecord>("node: missing or invalid 'id' field");
    }
    record.id = NodeId{j["id"].get<std::uint64_t>()};
    const std::string where = "node " + std::to_string(record.id.value);

    if (!j.contains("library") || !j["library"].is_string() ||
        !j.contains("operator") || !j["operator"].is_string()) {
        return schema_error<NodeRecord>(where + ": missing 'library' or 'operator' field");
    }
    record.op_path = OpPath{j["library"].get<std::string>(), j["operator"].get<std::string>()};

    if (j.contains("label") && j["label"].is_string()) {
        record.label = j["label"].get<std::string>();
    }

    if (j.contains("position")) {
        const auto& position = j["position"];
        if (!position.is_array() || position.size() != 2 || !position[0].is_number() ||
            !position[1].is_number()) {
            return schema_error<NodeRecord>(where + ": 'position' must be [x, y]");
        }
        record.position = glm::vec2(position[0].get<float>(), position[1].get<float>());
    }

    for (const char* key : {"inputs", "config"}) {
        if (!j.contains(key)) {
            continue;
        }
        if (!j[key].is_array()) {
            return schema_error<NodeRecord>(where + ": '" + key + "' must be an array");
        }
        auto& values = std::string(key) == "inputs" ? record.input_values : record.config_values;
        for (const auto& item : j[key]) {
            auto value = value_from_json(item);
            if (!value) {
                return Err<NodeRecord>(std::move(value.error()));
            }
            values.push_back(std::move(value.value()));
        }
    }

    return Result<NodeRecord>(std::move(record));
}

// =============================================================================
// EdgeRecord
// =============================================================================

nlohmann::json edge_to_json(const EdgeRecord& edge) {
    return nlohmann::json{
        {"from", edge.from_id.value},
        {"from_port", edge.from_port},
        {"to", edge.to_id.value},
        {"to_port", edge.to_port},
    };
}

Result<EdgeRecord> edge_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !is_index(j, "from") || !is_index(j, "from_port") ||
        !is_index(j, "to") || !is_index(j, "to_port")) {
        return schema_error<EdgeRecord>("edge: 'from', 'from_port', 'to' and 'to_port' are required");
    }
    EdgeRecord edge;
    edge.from_id = NodeId{j["from"].get<std::uint64_t>()};
    edge.from_port = j["from_port"].get<SlotIndex>();
    edge.to_id = NodeId{j["to"].get<std::uint64_t>()};
    edge.to_port = j["to_port"].get<SlotIndex>();
    return Result<EdgeRecord>(edge);
}

// =============================================================================
// Document
// =============================================================================

nlohmann::json document_to_json(const Document& document) {
    nlohmann::json j;
    j["version"] = DOCUMENT_VERSION;
    j["nodes"] = nlohmann::json::array();
    for (const auto& record : document.nodes) {
        j["nodes"].push_back(record_to_json(record));
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& edge : document.edges) {
        j["edges"].push_back(edge_to_json(edge));
    }
    return j;
}

Result<Document> document_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return schema_error<Document>("document root must be an object");
    }
    if (j.contains("version") && (!j["version"].is_number_integer() ||
                                  j["version"].get<int>() != DOCUMENT_VERSION)) {
        return schema_error<Document>("unsupported document version");
    }
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        return schema_error<Document>("missing 'nodes' array");
    }

    Document document;
    for (const auto& item : j["nodes"]) {
        auto record = record_from_json(item);
        if (!record) {
            return Err<Document>(std::move(record.error()));
        }
        document.nodes.push_back(std::move(record.value()));
    }

    if (j.contains("edges")) {
        if (!j["edges"].is_array()) {
            return schema_error<Document>("'edges' must be an array");
        }
        for (const auto& item : j["edges"]) {
            auto edge = edge_from_json(item);
            if (!edge) {
                return Err<Document>(std::move(edge.error()));
            }
            document.edges.push_back(edge.value());
        }
    }

    return Result<Document>(std::move(document));
}

Result<Document> parse_document(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<Document>(Error(DocumentError::parse(e.what())));
    }
    return document_from_json(j);
}

std::string serialize_document(const Document& document, int indent) {
    return document_to_json(document).dump(indent);
}

// =============================================================================
// Files
// =============================================================================

Result<void> save_document_file(const Document& document, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        return Err(Error(DocumentError::io("cannot open " + path.string() + " for writing")));
    }
    file << serialize_document(document);
    if (!file) {
        return Err(Error(DocumentError::io("failed writing " + path.string())));
    }
    GRAFIEK_LOG_DEBUG("Saved document to {}", path.string());
    return grafiek_core::Ok();
}

Result<Document> load_document_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<Document>(Error(DocumentError::io("cannot open " + path.string())));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_document(buffer.str());
}

} // namespace grafiek_engine
