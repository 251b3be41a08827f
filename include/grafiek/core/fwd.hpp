#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for grafiek_core module

#include <cstdint>

namespace grafiek_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct GraphError;
struct RegistryError;
struct ValueError;
struct LocatedError;
struct ScriptError;
struct DocumentError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

// =============================================================================
// Configuration
// =============================================================================

class ConfigLayer;
class ConfigManager;
struct EngineConfig;

} // namespace grafiek_core
