/// @file null_backend.cpp
/// @brief Null GPU backend implementation

#include "null_backend.hpp"

#include <cstring>

namespace grafiek_gpu {
namespace backends {

std::unique_ptr<IGpuBackend> create_null_backend() {
    return std::make_unique<NullBackend>();
}

BackendError NullBackend::init(const BackendConfig& config) {
    if (m_initialized) return BackendError::AlreadyInitialized;

    m_config = config;
    m_initialized = true;
    return BackendError::None;
}

void NullBackend::shutdown() {
    if (!m_initialized) return;

    m_initialized = false;
    m_textures.clear();
}

TextureHandle NullBackend::create_texture(const TextureDesc& desc) {
    if (!m_initialized) return TextureHandle::invalid();
    if (desc.width == 0 || desc.height == 0) return TextureHandle::invalid();

    TextureHandle handle{++m_next_handle};
    m_textures[handle.id] = Texture{desc, std::vector<std::uint8_t>(desc.byte_size(), 0)};
    return handle;
}

void NullBackend::destroy_texture(TextureHandle handle) {
    m_textures.erase(handle.id);
}

BackendError NullBackend::write_texture(TextureHandle handle, const void* data, std::size_t size) {
    if (!m_initialized) return BackendError::NotInitialized;

    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) return BackendError::InvalidHandle;
    if (size != it->second.pixels.size()) return BackendError::InvalidParameter;

    std::memcpy(it->second.pixels.data(), data, size);
    return BackendError::None;
}

std::optional<TextureDesc> NullBackend::texture_desc(TextureHandle handle) const {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) return std::nullopt;
    return it->second.desc;
}

std::uint64_t NullBackend::get_allocated_memory() const {
    std::uint64_t total = 0;
    for (const auto& [id, tex] : m_textures) {
        total += tex.pixels.size();
    }
    return total;
}

std::span<const std::uint8_t> NullBackend::texture_data(TextureHandle handle) const {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) return {};
    return it->second.pixels;
}

} // namespace backends
} // namespace grafiek_gpu
