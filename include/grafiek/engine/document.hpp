#pragma once

/// @file document.hpp
/// @brief JSON encoding of graph documents
///
/// Layout:
/// @code
/// {
///   "version": 1,
///   "nodes": [{"id": 1, "library": "core", "operator": "input", "label": null,
///              "position": [0, 0], "inputs": [...], "config": [...]}],
///   "edges": [{"from": 1, "from_port": 0, "to": 2, "to_port": 0}]
/// }
/// @endcode
/// Values are {"type": "<value type>", "value": ...}; Null is {"type": "any"}.

#include "engine.hpp"
#include "node.hpp"
#include "value.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace grafiek_engine {

inline constexpr int DOCUMENT_VERSION = 1;

[[nodiscard]] nlohmann::json value_to_json(const Value& value);
[[nodiscard]] Result<Value> value_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json record_to_json(const NodeRecord& record);
[[nodiscard]] Result<NodeRecord> record_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json edge_to_json(const EdgeRecord& edge);
[[nodiscard]] Result<EdgeRecord> edge_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json document_to_json(const Document& document);
[[nodiscard]] Result<Document> document_from_json(const nlohmann::json& j);

/// Parse document text; malformed JSON is a Parse error, bad fields a Schema error
[[nodiscard]] Result<Document> parse_document(const std::string& text);
[[nodiscard]] std::string serialize_document(const Document& document, int indent = 2);

Result<void> save_document_file(const Document& document, const std::filesystem::path& path);
[[nodiscard]] Result<Document> load_document_file(const std::filesystem::path& path);

} // namespace grafiek_engine
