/// @file opengl_backend.hpp
/// @brief OpenGL texture backend
///
/// Uses only GL 1.1 texture entry points, so no function pointer loading is
/// needed. A GL context must be current on the engine thread before init().
#pragma once

#include "grafiek/gpu/backend.hpp"

#include <unordered_map>

#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
    #include <GL/gl.h>
#elif defined(__APPLE__)
    #include <OpenGL/gl.h>
#else
    #include <GL/gl.h>
#endif

#ifndef GL_BGRA
#define GL_BGRA 0x80E1
#endif
#ifndef GL_RGBA16
#define GL_RGBA16 0x805B
#endif
#ifndef GL_RGBA32F
#define GL_RGBA32F 0x8814
#endif
#ifndef GL_CLAMP_TO_EDGE
#define GL_CLAMP_TO_EDGE 0x812F
#endif

namespace grafiek_gpu {
namespace backends {

/// OpenGL backend - one GL texture object per handle
class OpenGLBackend : public IGpuBackend {
public:
    OpenGLBackend() = default;
    ~OpenGLBackend() override { shutdown(); }

    BackendError init(const BackendConfig& config) override;
    void shutdown() override;

    [[nodiscard]] bool is_initialized() const override { return m_initialized; }
    [[nodiscard]] GpuBackend backend_type() const override { return GpuBackend::OpenGL; }

    TextureHandle create_texture(const TextureDesc& desc) override;
    void destroy_texture(TextureHandle handle) override;
    BackendError write_texture(TextureHandle handle, const void* data, std::size_t size) override;
    [[nodiscard]] std::optional<TextureDesc> texture_desc(TextureHandle handle) const override;

    [[nodiscard]] std::size_t texture_count() const override { return m_textures.size(); }
    [[nodiscard]] std::uint64_t get_allocated_memory() const override;

    /// GL name behind @p handle, 0 if unknown (for UI display)
    [[nodiscard]] GLuint gl_texture(TextureHandle handle) const;

private:
    struct Texture {
        GLuint name = 0;
        TextureDesc desc;
    };

    [[nodiscard]] bool check_gl_error(const char* what) const;

    static GLint texture_format_to_gl_internal(TextureFormat format);
    static GLenum texture_format_to_gl_format(TextureFormat format);
    static GLenum texture_format_to_gl_type(TextureFormat format);

    bool m_initialized = false;
    BackendConfig m_config;
    std::uint64_t m_next_handle = 0;
    std::unordered_map<std::uint64_t, Texture> m_textures;
};

/// Factory function to create OpenGL backend
[[nodiscard]] std::unique_ptr<IGpuBackend> create_opengl_backend();

} // namespace backends
} // namespace grafiek_gpu
