#pragma once

/// @file error.hpp
/// @brief Error handling types for grafiek_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace grafiek_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    CompileError,
    TypeMismatch,
    Rejected,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Errors raised while editing or querying the node graph
struct GraphError {
    enum class Kind : std::uint8_t {
        NodeNotFound,        // Stale or unknown node index
        NoInputSlot,         // Input slot index out of range
        NoOutputSlot,        // Output slot index out of range
        NoConfigSlot,        // Config slot index out of range
        EdgeNotFound,        // No edge between the given slots
        IncompatibleTypes,   // Source type cannot cast to sink type
        CreatesLoop,         // Connection would close a cycle
        NotInputNode,        // Node is not a core/input instance
        InputHasConnection,  // Graph input is driven by an edge
        NotATexture,         // Slot does not hold a texture
    };

    Kind kind = Kind::NodeNotFound;
    std::string message;
    std::size_t from_slot = 0;
    std::size_t to_slot = 0;

    [[nodiscard]] static GraphError node_not_found(const std::string& node) {
        return GraphError{Kind::NodeNotFound, "Node not found: " + node, 0, 0};
    }

    [[nodiscard]] static GraphError no_input_slot(std::size_t slot) {
        return GraphError{Kind::NoInputSlot, "No input slot at index " + std::to_string(slot), 0, slot};
    }

    [[nodiscard]] static GraphError no_output_slot(std::size_t slot) {
        return GraphError{Kind::NoOutputSlot, "No output slot at index " + std::to_string(slot), slot, 0};
    }

    [[nodiscard]] static GraphError no_config_slot(std::size_t slot) {
        return GraphError{Kind::NoConfigSlot, "No config slot at index " + std::to_string(slot), 0, slot};
    }

    [[nodiscard]] static GraphError edge_not_found(std::size_t from, std::size_t to) {
        return GraphError{Kind::EdgeNotFound,
            "Edge not found: from slot " + std::to_string(from) + " to slot " + std::to_string(to),
            from, to};
    }

    [[nodiscard]] static GraphError incompatible_types(std::size_t from, std::size_t to) {
        return GraphError{Kind::IncompatibleTypes,
            "Incompatible types: output slot " + std::to_string(from) +
            " cannot connect to input slot " + std::to_string(to),
            from, to};
    }

    [[nodiscard]] static GraphError creates_loop() {
        return GraphError{Kind::CreatesLoop, "Connection would create a cycle in the graph", 0, 0};
    }

    [[nodiscard]] static GraphError not_input_node() {
        return GraphError{Kind::NotInputNode,
            "Node accessed while modifying graph input was not an instance of core/input", 0, 0};
    }

    [[nodiscard]] static GraphError input_has_connection() {
        return GraphError{Kind::InputHasConnection,
            "Input node has incoming connection and cannot be edited", 0, 0};
    }

    [[nodiscard]] static GraphError not_a_texture(std::size_t slot) {
        return GraphError{Kind::NotATexture,
            "Output slot " + std::to_string(slot) + " is not a texture", slot, 0};
    }
};

/// Operator registration and signature errors
struct RegistryError {
    enum class Kind : std::uint8_t {
        UnknownOperationType,    // No factory under library/operator
        DuplicateOperationType,  // Factory path registered twice
        DuplicateSlotName,       // Two slots share a name in one list
    };

    Kind kind = Kind::UnknownOperationType;
    std::string message;
    std::string name;
    std::string list;  // For DuplicateSlotName

    [[nodiscard]] static RegistryError unknown_operation_type(const std::string& path) {
        return RegistryError{Kind::UnknownOperationType, "Unknown operation type: " + path, path, {}};
    }

    [[nodiscard]] static RegistryError duplicate_operation_type(const std::string& library,
                                                                const std::string& op) {
        return RegistryError{Kind::DuplicateOperationType,
            "Duplicate operation type: " + library + "/" + op, library + "/" + op, {}};
    }

    [[nodiscard]] static RegistryError duplicate_slot_name(const std::string& slot,
                                                           const std::string& list_name) {
        return RegistryError{Kind::DuplicateSlotName,
            "Node was configured with two slots named " + slot + " on its " + list_name,
            slot, list_name};
    }
};

/// Value extraction errors
struct ValueError {
    enum class Kind : std::uint8_t {
        Index,         // Slot index does not exist
        TypeMismatch,  // Stored value has another type
    };

    Kind kind = Kind::Index;
    std::string message;
    std::size_t index = 0;
    std::string wanted;
    std::string found;

    [[nodiscard]] static ValueError bad_index(std::size_t idx) {
        return ValueError{Kind::Index, "Slot index " + std::to_string(idx) + " does not exist", idx, {}, {}};
    }

    [[nodiscard]] static ValueError type_mismatch(const std::string& wanted_t, const std::string& found_t) {
        return ValueError{Kind::TypeMismatch,
            "Type mismatch: wanted " + wanted_t + ", found " + found_t, 0, wanted_t, found_t};
    }
};

/// A diagnostic pinned to a source location
struct LocatedError {
    std::string message;
    std::uint32_t line = 0;
    std::uint32_t column = 0;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(line) + ":" + std::to_string(column) + ": " + message;
    }
};

/// Diagnostics produced by an embedded sub-language (shader, script)
struct ScriptError {
    std::vector<LocatedError> errors;
    std::string message;

    [[nodiscard]] static ScriptError single(const std::string& msg) {
        return from_diagnostics({LocatedError{msg, 0, 0}});
    }

    [[nodiscard]] static ScriptError from_diagnostics(std::vector<LocatedError> diagnostics) {
        std::string joined;
        for (std::size_t i = 0; i < diagnostics.size(); ++i) {
            if (i > 0) joined += '\n';
            joined += diagnostics[i].to_string();
        }
        return ScriptError{std::move(diagnostics), std::move(joined)};
    }
};

/// Graph document encoding errors
struct DocumentError {
    enum class Kind : std::uint8_t {
        Parse,   // Malformed JSON
        Schema,  // Well-formed but missing/mistyped fields
        Io,      // File could not be read or written
    };

    Kind kind = Kind::Parse;
    std::string message;

    [[nodiscard]] static DocumentError parse(const std::string& reason) {
        return DocumentError{Kind::Parse, "Document parse error: " + reason};
    }

    [[nodiscard]] static DocumentError schema(const std::string& reason) {
        return DocumentError{Kind::Schema, "Document schema error: " + reason};
    }

    [[nodiscard]] static DocumentError io(const std::string& reason) {
        return DocumentError{Kind::Io, "Document IO error: " + reason};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GraphError,
        RegistryError,
        ValueError,
        ScriptError,
        DocumentError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(GraphError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(RegistryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ValueError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ScriptError err) : m_code(ErrorCode::CompileError), m_error(std::move(err)) {}
    Error(DocumentError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True if this is a graph error of the given kind
    [[nodiscard]] bool is_graph(GraphError::Kind kind) const {
        const auto* err = as<GraphError>();
        return err && err->kind == kind;
    }

    /// True if this is a registry error of the given kind
    [[nodiscard]] bool is_registry(RegistryError::Kind kind) const {
        const auto* err = as<RegistryError>();
        return err && err->kind == kind;
    }

    /// Script diagnostics, if this is a script error
    [[nodiscard]] const ScriptError* as_script_error() const {
        return as<ScriptError>();
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(GraphError::Kind kind) {
        switch (kind) {
            case GraphError::Kind::NodeNotFound: return ErrorCode::NotFound;
            case GraphError::Kind::NoInputSlot: return ErrorCode::NotFound;
            case GraphError::Kind::NoOutputSlot: return ErrorCode::NotFound;
            case GraphError::Kind::NoConfigSlot: return ErrorCode::NotFound;
            case GraphError::Kind::EdgeNotFound: return ErrorCode::NotFound;
            case GraphError::Kind::IncompatibleTypes: return ErrorCode::Rejected;
            case GraphError::Kind::CreatesLoop: return ErrorCode::Rejected;
            case GraphError::Kind::NotInputNode: return ErrorCode::InvalidArgument;
            case GraphError::Kind::InputHasConnection: return ErrorCode::InvalidState;
            case GraphError::Kind::NotATexture: return ErrorCode::TypeMismatch;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(RegistryError::Kind kind) {
        switch (kind) {
            case RegistryError::Kind::UnknownOperationType: return ErrorCode::NotFound;
            case RegistryError::Kind::DuplicateOperationType: return ErrorCode::AlreadyExists;
            case RegistryError::Kind::DuplicateSlotName: return ErrorCode::AlreadyExists;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ValueError::Kind kind) {
        switch (kind) {
            case ValueError::Kind::Index: return ErrorCode::InvalidArgument;
            case ValueError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(DocumentError::Kind kind) {
        switch (kind) {
            case DocumentError::Kind::Parse: return ErrorCode::ParseError;
            case DocumentError::Kind::Schema: return ErrorCode::ParseError;
            case DocumentError::Kind::Io: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including kind details and context
std::string build_error_chain(const Error& error);

} // namespace grafiek_core
