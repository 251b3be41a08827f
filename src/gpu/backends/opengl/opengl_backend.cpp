/// @file opengl_backend.cpp
/// @brief OpenGL texture backend implementation

#include "opengl_backend.hpp"

#include <grafiek/core/log.hpp>

namespace grafiek_gpu {
namespace backends {

std::unique_ptr<IGpuBackend> create_opengl_backend() {
    return std::make_unique<OpenGLBackend>();
}

// =============================================================================
// OpenGLBackend Implementation
// =============================================================================

BackendError OpenGLBackend::init(const BackendConfig& config) {
    if (m_initialized) return BackendError::AlreadyInitialized;

    const auto* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    if (!version) {
        return BackendError::NoContext;
    }

    const auto* renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
    grafiek_core::gpu_logger()->info("OpenGL {} on {}", version, renderer ? renderer : "unknown renderer");

    m_config = config;
    m_initialized = true;
    return BackendError::None;
}

void OpenGLBackend::shutdown() {
    if (!m_initialized) return;

    for (auto& [id, tex] : m_textures) {
        glDeleteTextures(1, &tex.name);
    }
    m_textures.clear();
    m_initialized = false;
}

TextureHandle OpenGLBackend::create_texture(const TextureDesc& desc) {
    if (!m_initialized) return TextureHandle::invalid();
    if (desc.width == 0 || desc.height == 0) return TextureHandle::invalid();

    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);

    glTexImage2D(GL_TEXTURE_2D, 0, texture_format_to_gl_internal(desc.format),
                 static_cast<GLsizei>(desc.width), static_cast<GLsizei>(desc.height), 0,
                 texture_format_to_gl_format(desc.format), texture_format_to_gl_type(desc.format),
                 nullptr);

    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    glBindTexture(GL_TEXTURE_2D, 0);

    if (!check_gl_error("glTexImage2D")) {
        glDeleteTextures(1, &texture);
        return TextureHandle::invalid();
    }

    TextureHandle handle{++m_next_handle};
    m_textures[handle.id] = Texture{texture, desc};
    return handle;
}

void OpenGLBackend::destroy_texture(TextureHandle handle) {
    auto it = m_textures.find(handle.id);
    if (it != m_textures.end()) {
        glDeleteTextures(1, &it->second.name);
        m_textures.erase(it);
    }
}

BackendError OpenGLBackend::write_texture(TextureHandle handle, const void* data, std::size_t size) {
    if (!m_initialized) return BackendError::NotInitialized;

    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) return BackendError::InvalidHandle;

    const TextureDesc& desc = it->second.desc;
    if (size != desc.byte_size()) return BackendError::InvalidParameter;

    glBindTexture(GL_TEXTURE_2D, it->second.name);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0,
                    static_cast<GLsizei>(desc.width), static_cast<GLsizei>(desc.height),
                    texture_format_to_gl_format(desc.format), texture_format_to_gl_type(desc.format),
                    data);
    glBindTexture(GL_TEXTURE_2D, 0);

    return check_gl_error("glTexSubImage2D") ? BackendError::None : BackendError::InvalidParameter;
}

std::optional<TextureDesc> OpenGLBackend::texture_desc(TextureHandle handle) const {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) return std::nullopt;
    return it->second.desc;
}

std::uint64_t OpenGLBackend::get_allocated_memory() const {
    std::uint64_t total = 0;
    for (const auto& [id, tex] : m_textures) {
        total += tex.desc.byte_size();
    }
    return total;
}

GLuint OpenGLBackend::gl_texture(TextureHandle handle) const {
    auto it = m_textures.find(handle.id);
    return it != m_textures.end() ? it->second.name : 0;
}

bool OpenGLBackend::check_gl_error(const char* what) const {
    if (!m_config.enable_validation) return true;

    GLenum err = glGetError();
    if (err == GL_NO_ERROR) return true;

    grafiek_core::gpu_logger()->error("{} failed with GL error 0x{:04X}", what, static_cast<unsigned>(err));
    return false;
}

GLint OpenGLBackend::texture_format_to_gl_internal(TextureFormat format) {
    switch (format) {
        case TextureFormat::Rgba8Unorm: return GL_RGBA8;
        case TextureFormat::Rgba16Unorm: return GL_RGBA16;
        case TextureFormat::Rgba32Float: return GL_RGBA32F;
        case TextureFormat::Bgra8Unorm: return GL_RGBA8;
    }
    return GL_RGBA8;
}

GLenum OpenGLBackend::texture_format_to_gl_format(TextureFormat format) {
    switch (format) {
        case TextureFormat::Bgra8Unorm: return GL_BGRA;
        default: return GL_RGBA;
    }
}

GLenum OpenGLBackend::texture_format_to_gl_type(TextureFormat format) {
    switch (format) {
        case TextureFormat::Rgba16Unorm: return GL_UNSIGNED_SHORT;
        case TextureFormat::Rgba32Float: return GL_FLOAT;
        default: return GL_UNSIGNED_BYTE;
    }
}

} // namespace backends
} // namespace grafiek_gpu
