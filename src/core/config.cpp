/// @file config.cpp
/// @brief Layered configuration implementation for grafiek_core

#include <grafiek/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace grafiek_core {

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return std::nullopt;
    return it->second;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> out;
    out.reserve(m_values.size());
    for (const auto& [key, value] : m_values) {
        out.push_back(key);
    }
    return out;
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Flatten nested JSON objects into dotted keys
void flatten_json(const nlohmann::json& node, const std::string& prefix, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            flatten_json(value, key, layer);
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else {
            GRAFIEK_LOG_WARN("config: ignoring unsupported value at '{}'", key);
        }
    }
}

/// Interpret an environment string as the most specific value type
ConfigValue parse_env_value(const std::string& text) {
    if (text == "true") return ConfigValue{true};
    if (text == "false") return ConfigValue{false};

    std::int64_t as_int = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), as_int);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return ConfigValue{as_int};
    }

    return ConfigValue{text};
}

} // anonymous namespace

// =============================================================================
// ConfigManager
// =============================================================================

ConfigManager::ConfigManager() {
    setup_defaults();
}

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    auto it = std::find_if(m_layers.begin(), m_layers.end(),
        [&](const auto& existing) { return existing->name() == layer->name(); });
    if (it != m_layers.end()) {
        *it = std::move(layer);
    } else {
        m_layers.push_back(std::move(layer));
    }
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) return layer.get();
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    for (const auto& layer : m_layers) {
        if (layer->name() == name) return layer.get();
    }
    return nullptr;
}

bool ConfigManager::contains(const std::string& key) const {
    return get(key).has_value();
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    for (const ConfigLayer* layer : sorted_layers()) {
        if (auto value = layer->get(key)) {
            return value;
        }
    }
    return std::nullopt;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ConfigLayer* layer = get_layer(layer_name);
    if (!layer) {
        auto new_layer = std::make_unique<ConfigLayer>(layer_name, ConfigLayerPriority::User);
        layer = new_layer.get();
        add_layer(std::move(new_layer));
    }
    layer->set(key, std::move(value));
}

Result<void> ConfigManager::load_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json_text(buffer.str());
}

Result<void> ConfigManager::load_json_text(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return Err(Error(ErrorCode::ParseError, std::string("Invalid config JSON: ") + ex.what()));
    }

    if (!root.is_object()) {
        return Err(Error(ErrorCode::ParseError, "Config root must be a JSON object"));
    }

    auto layer = std::make_unique<ConfigLayer>("file", ConfigLayerPriority::File);
    flatten_json(root, "", *layer);
    GRAFIEK_LOG_DEBUG("config: loaded {} keys from file", layer->size());
    add_layer(std::move(layer));
    return Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    auto layer = std::make_unique<ConfigLayer>("environment", ConfigLayerPriority::Environment);

    const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"HISTORY_MAX_SIZE", config_keys::HISTORY_MAX_SIZE},
        {"LOG_LEVEL", config_keys::LOG_LEVEL},
        {"LOG_CONSOLE", config_keys::LOG_CONSOLE},
        {"LOG_FILE", config_keys::LOG_FILE},
        {"LOG_DIRECTORY", config_keys::LOG_DIRECTORY},
        {"GPU_BACKEND", config_keys::GPU_BACKEND},
    };

    for (const auto& [suffix, config_key] : env_mappings) {
        const std::string env_name = prefix + suffix;
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            layer->set(config_key, parse_env_value(value));
        }
    }

    add_layer(std::move(layer));
}

EngineConfig ConfigManager::build_engine_config() const {
    EngineConfig config;

    auto history = get_or<std::int64_t>(config_keys::HISTORY_MAX_SIZE, 100);
    config.history_max_size = history > 0 ? static_cast<std::size_t>(history) : 1;

    std::string level = get_or<std::string>(config_keys::LOG_LEVEL, "info");
    if (auto parsed = parse_log_level(level)) {
        config.log.level = *parsed;
    } else {
        GRAFIEK_LOG_WARN("config: unknown log level '{}', keeping info", level);
    }
    config.log.console_enabled = get_or<bool>(config_keys::LOG_CONSOLE, true);
    config.log.file_enabled = get_or<bool>(config_keys::LOG_FILE, false);
    config.log.log_directory = get_or<std::string>(config_keys::LOG_DIRECTORY, "");

    config.gpu_backend = get_or<std::string>(config_keys::GPU_BACKEND, "null");
    return config;
}

void ConfigManager::setup_defaults() {
    auto defaults = std::make_unique<ConfigLayer>("defaults", ConfigLayerPriority::Default);
    defaults->set(config_keys::HISTORY_MAX_SIZE, ConfigValue{std::int64_t(100)});
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_CONSOLE, ConfigValue{true});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("")});
    defaults->set(config_keys::GPU_BACKEND, ConfigValue{std::string("null")});
    add_layer(std::move(defaults));
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<const ConfigLayer*> out;
    out.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        out.push_back(layer.get());
    }
    std::stable_sort(out.begin(), out.end(), [](const ConfigLayer* a, const ConfigLayer* b) {
        return static_cast<std::int32_t>(a->priority()) < static_cast<std::int32_t>(b->priority());
    });
    return out;
}

} // namespace grafiek_core
