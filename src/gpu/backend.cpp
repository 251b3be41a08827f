/// @file backend.cpp
/// @brief Backend selection for grafiek_gpu

#include <grafiek/gpu/backend.hpp>

#include "backends/null/null_backend.hpp"
#include "backends/opengl/opengl_backend.hpp"

namespace grafiek_gpu {

const char* backend_name(GpuBackend backend) {
    switch (backend) {
        case GpuBackend::Null: return "null";
        case GpuBackend::OpenGL: return "opengl";
    }
    return "unknown";
}

std::optional<GpuBackend> parse_backend_name(const std::string& name) {
    if (name == "null" || name == "headless") return GpuBackend::Null;
    if (name == "opengl" || name == "gl") return GpuBackend::OpenGL;
    return std::nullopt;
}

const char* backend_error_name(BackendError error) {
    switch (error) {
        case BackendError::None: return "None";
        case BackendError::NotInitialized: return "NotInitialized";
        case BackendError::AlreadyInitialized: return "AlreadyInitialized";
        case BackendError::UnsupportedBackend: return "UnsupportedBackend";
        case BackendError::NoContext: return "NoContext";
        case BackendError::OutOfMemory: return "OutOfMemory";
        case BackendError::InvalidHandle: return "InvalidHandle";
        case BackendError::InvalidParameter: return "InvalidParameter";
        case BackendError::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::unique_ptr<IGpuBackend> create_backend(GpuBackend backend) {
    switch (backend) {
        case GpuBackend::Null: return backends::create_null_backend();
        case GpuBackend::OpenGL: return backends::create_opengl_backend();
    }
    return nullptr;
}

} // namespace grafiek_gpu
