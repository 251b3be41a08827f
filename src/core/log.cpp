/// @file log.cpp
/// @brief Logging system implementation for grafiek_core
///
/// Every grafiek logger writes to one shared sink list: an optional colour
/// console sink, an optional rotating "grafiek.log" file and any sinks the
/// host added with add_log_sink. Reconfiguring swaps the list on all loggers.

#include <grafiek/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace grafiek_core {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr const char* LOG_FILE_NAME = "grafiek.log";

/// Accepted level spellings; the first entry per level is its canonical name
constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 10> LEVEL_NAMES{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
}};

// =============================================================================
// LogRegistry
// =============================================================================

class LogRegistry {
public:
    static LogRegistry& instance() {
        static LogRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        rebuild_sinks();
        apply_level(config.level);
    }

    std::shared_ptr<spdlog::logger> logger(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        auto created = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
        created->set_level(m_config.level);
        m_loggers.emplace(name, created);
        if (!spdlog::get(name)) {
            spdlog::register_logger(created);
        }
        return created;
    }

    void add_sink(spdlog::sink_ptr sink) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_extra_sinks.push_back(sink);
        m_sinks.push_back(sink);
        for (auto& [name, logger] : m_loggers) {
            logger->sinks().push_back(sink);
        }
    }

    void remove_sink(const spdlog::sink_ptr& sink) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::erase(m_extra_sinks, sink);
        std::erase(m_sinks, sink);
        for (auto& [name, logger] : m_loggers) {
            std::erase(logger->sinks(), sink);
        }
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        apply_level(level);
    }

    void set_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    spdlog::level::level_enum level() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

    void shutdown() {
        flush();
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            spdlog::drop(name);
        }
        m_loggers.clear();
        m_extra_sinks.clear();
        m_sinks.clear();
    }

private:
    LogRegistry() { rebuild_sinks(); }

    void rebuild_sinks() {
        m_sinks.clear();

        if (m_config.console_enabled) {
            if (!m_console) {
                m_console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                m_console->set_pattern(CONSOLE_PATTERN);
            }
            m_sinks.push_back(m_console);
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            auto path = std::filesystem::path(m_config.log_directory) / LOG_FILE_NAME;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.max_file_size, m_config.max_files);
                file->set_pattern(FILE_PATTERN);
                m_sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("grafiek: cannot open log file {}: {}", path.string(), ex.what());
            }
        }

        m_sinks.insert(m_sinks.end(), m_extra_sinks.begin(), m_extra_sinks.end());
        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = m_sinks;
        }
    }

    void apply_level(spdlog::level::level_enum level) {
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_console;
    std::vector<spdlog::sink_ptr> m_extra_sinks;
    std::vector<spdlog::sink_ptr> m_sinks;
};

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    LogRegistry::instance().configure(config);
}

void add_log_sink(spdlog::sink_ptr sink) {
    LogRegistry::instance().add_sink(std::move(sink));
}

void remove_log_sink(const spdlog::sink_ptr& sink) {
    LogRegistry::instance().remove_sink(sink);
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LogRegistry::instance().logger(name);
}

std::shared_ptr<spdlog::logger> engine_logger() {
    static const auto logger = get_logger("grafiek");
    return logger;
}

std::shared_ptr<spdlog::logger> gpu_logger() {
    static const auto logger = get_logger("gpu");
    return logger;
}

std::shared_ptr<spdlog::logger> history_logger() {
    static const auto logger = get_logger("history");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LogRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    LogRegistry::instance().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LogRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : LEVEL_NAMES) {
        if (str == name) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const auto& [name, value] : LEVEL_NAMES) {
        if (value == level) {
            return name;
        }
    }
    return "unknown";
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("{}: begin", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("{}: done in {}us", m_name, elapsed.count());
}

// =============================================================================
// Shutdown
// =============================================================================

void flush_all_loggers() {
    LogRegistry::instance().flush();
}

void shutdown_logging() {
    LogRegistry::instance().shutdown();
}

} // namespace grafiek_core
