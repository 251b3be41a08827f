/// @file context.cpp
/// @brief ExecutionContext implementation

#include <grafiek/engine/context.hpp>
#include <grafiek/engine/system_textures.hpp>
#include <grafiek/core/log.hpp>

namespace grafiek_engine {

ExecutionContext::ExecutionContext(std::unique_ptr<grafiek_gpu::IGpuBackend> backend)
    : m_backend(std::move(backend)), m_textures(*m_backend) {}

std::optional<grafiek_gpu::TextureHandle> ExecutionContext::texture(const TextureHandle& handle) const {
    if (!handle.id) {
        return std::nullopt;
    }
    return m_textures.get_texture(*handle.id);
}

bool ExecutionContext::ensure_texture(TextureHandle& handle, TextureOwner owner) {
    // System textures are shared and never resized
    bool shared = handle.id && handle.id->value < SYSTEM_TEXTURE_COUNT;
    if (!handle.id || !m_textures.contains(*handle.id) || shared) {
        if (shared) {
            auto desc = m_textures.texture_desc(*handle.id);
            if (desc && desc->width == handle.width && desc->height == handle.height &&
                desc->format == to_gpu_format(handle.fmt)) {
                return true;
            }
        }
        handle.id = m_textures.alloc_texture(handle, owner);
        return handle.id.has_value();
    }

    auto desc = m_textures.texture_desc(*handle.id);
    if (desc && desc->width == handle.width && desc->height == handle.height &&
        desc->format == to_gpu_format(handle.fmt)) {
        return true;
    }

    grafiek_gpu::TextureDesc resized;
    resized.width = handle.width;
    resized.height = handle.height;
    resized.format = to_gpu_format(handle.fmt);
    auto texture = m_backend->create_texture(resized);
    if (!texture.is_valid()) {
        grafiek_core::gpu_logger()->error("Failed to resize texture {} to {}x{}",
            handle.id->value, handle.width, handle.height);
        return false;
    }
    m_textures.replace_texture(*handle.id, texture);
    return true;
}

} // namespace grafiek_engine
