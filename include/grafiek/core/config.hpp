#pragma once

/// @file config.hpp
/// @brief Layered configuration for grafiek
///
/// Provides layered configuration with:
/// - Built-in defaults
/// - Configuration file loading (JSON)
/// - Environment variable overrides
/// - Runtime modification

#include "error.hpp"
#include "log.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grafiek_core {

// =============================================================================
// Config Values
// =============================================================================

/// A single configuration value
using ConfigValue = std::variant<bool, std::int64_t, double, std::string>;

/// Well-known configuration keys
namespace config_keys {
    inline constexpr const char* HISTORY_MAX_SIZE = "history.max_size";
    inline constexpr const char* LOG_LEVEL = "log.level";
    inline constexpr const char* LOG_CONSOLE = "log.console";
    inline constexpr const char* LOG_FILE = "log.file";
    inline constexpr const char* LOG_DIRECTORY = "log.directory";
    inline constexpr const char* GPU_BACKEND = "gpu.backend";
} // namespace config_keys

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    Environment = -500,  ///< Environment variables (highest)
    User = 0,            ///< Runtime overrides
    File = 100,          ///< Configuration file
    Default = 1000,      ///< Built-in defaults (lowest)
};

/// A named set of key/value pairs at one priority
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear() { m_values.clear(); }

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return m_values.size(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Engine Config
// =============================================================================

/// Resolved settings consumed by grafiek_engine::Engine::init
struct EngineConfig {
    std::size_t history_max_size = 100;
    LogConfig log;
    std::string gpu_backend = "null";
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    /// Add a configuration layer (replaces a layer of the same name)
    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    [[nodiscard]] std::size_t layer_count() const { return m_layers.size(); }

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value from the highest priority layer that contains it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Get value with default
    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        auto value = get(key);
        if (!value) return default_value;

        if constexpr (std::is_same_v<T, bool>) {
            if (auto* v = std::get_if<bool>(&*value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* v = std::get_if<double>(&*value)) return static_cast<T>(*v);
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto* v = std::get_if<std::string>(&*value)) return *v;
        }

        return default_value;
    }

    /// Set value in a layer ("user" by default)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a flat or nested JSON object into the "file" layer
    Result<void> load_json(const std::filesystem::path& path);

    /// Load a JSON document from text into the "file" layer
    Result<void> load_json_text(const std::string& text);

    /// Read GRAFIEK_* environment variables into the "environment" layer
    void load_environment(const std::string& prefix = "GRAFIEK_");

    // =========================================================================
    // Engine Config Conversion
    // =========================================================================

    /// Build EngineConfig from the merged view
    [[nodiscard]] EngineConfig build_engine_config() const;

private:
    void setup_defaults();
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
};

} // namespace grafiek_core
