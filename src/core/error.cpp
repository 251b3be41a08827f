/// @file error.cpp
/// @brief Error formatting for grafiek_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error chain formatting and explicit instantiations
/// for the Result types the engine returns most often.

#include <grafiek/core/error.hpp>
#include <sstream>

namespace grafiek_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_graph_error(const GraphError& err) {
    std::ostringstream oss;
    oss << "[GraphError] " << err.message;
    return oss.str();
}

std::string format_registry_error(const RegistryError& err) {
    std::ostringstream oss;
    oss << "[RegistryError] " << err.message;
    if (!err.list.empty()) {
        oss << " (list: " << err.list << ")";
    }
    return oss.str();
}

std::string format_value_error(const ValueError& err) {
    std::ostringstream oss;
    oss << "[ValueError] " << err.message;
    return oss.str();
}

std::string format_script_error(const ScriptError& err) {
    std::ostringstream oss;
    oss << "[ScriptError] " << err.errors.size() << " diagnostic(s)";
    for (const auto& located : err.errors) {
        oss << "\n  " << located.to_string();
    }
    return oss.str();
}

std::string format_document_error(const DocumentError& err) {
    std::ostringstream oss;
    oss << "[DocumentError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GraphError>) {
            oss << detail::format_graph_error(err);
        } else if constexpr (std::is_same_v<T, RegistryError>) {
            oss << detail::format_registry_error(err);
        } else if constexpr (std::is_same_v<T, ValueError>) {
            oss << detail::format_value_error(err);
        } else if constexpr (std::is_same_v<T, ScriptError>) {
            oss << detail::format_script_error(err);
        } else if constexpr (std::is_same_v<T, DocumentError>) {
            oss << detail::format_document_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int32_t, Error>;
template class Result<float, Error>;
template class Result<std::size_t, Error>;

} // namespace grafiek_core
