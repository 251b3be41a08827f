/// @file texture_pool.cpp
/// @brief TexturePool implementation

#include <grafiek/engine/texture_pool.hpp>
#include <grafiek/engine/system_textures.hpp>
#include <grafiek/core/log.hpp>

#include <vector>

namespace grafiek_engine {

TexturePool::TexturePool(grafiek_gpu::IGpuBackend& backend)
    : m_backend(backend), m_next_id(SYSTEM_TEXTURE_COUNT) {}

TexturePool::~TexturePool() {
    for (auto& [id, entry] : m_entries) {
        m_backend.destroy_texture(entry.texture);
    }
}

grafiek_gpu::TextureHandle TexturePool::create_backing(const TextureHandle& handle) {
    grafiek_gpu::TextureDesc desc;
    desc.width = handle.width;
    desc.height = handle.height;
    desc.format = to_gpu_format(handle.fmt);
    return m_backend.create_texture(desc);
}

Result<void> TexturePool::insert_texture(const TextureHandle& handle,
                                         std::span<const std::uint8_t> data) {
    if (!handle.id) {
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::InvalidArgument,
            "System texture inserted without an id"));
    }
    if (m_entries.count(*handle.id) != 0) {
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::AlreadyExists,
            "Texture id " + std::to_string(handle.id->value) + " already in use"));
    }

    auto texture = create_backing(handle);
    if (!texture.is_valid()) {
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::InvalidState,
            "Backend failed to create system texture " + std::to_string(handle.id->value)));
    }

    auto err = m_backend.write_texture(texture, data.data(), data.size());
    if (err != grafiek_gpu::BackendError::None) {
        m_backend.destroy_texture(texture);
        return grafiek_core::Err(grafiek_core::Error(grafiek_core::ErrorCode::InvalidArgument,
            std::string("Upload of system texture failed: ") + grafiek_gpu::backend_error_name(err)));
    }

    m_entries.emplace(*handle.id, Entry{texture, TextureOwner::engine()});
    return grafiek_core::Ok();
}

std::optional<TextureId> TexturePool::alloc_texture(const TextureHandle& handle, TextureOwner owner) {
    auto texture = create_backing(handle);
    if (!texture.is_valid()) {
        grafiek_core::gpu_logger()->error("Failed to allocate {}x{} {} texture",
            handle.width, handle.height, texture_format_name(handle.fmt));
        return std::nullopt;
    }

    TextureId id{m_next_id++};
    m_entries.emplace(id, Entry{texture, owner});
    grafiek_core::gpu_logger()->trace("Allocated texture {} ({}x{})", id.value, handle.width, handle.height);
    return id;
}

std::optional<TextureId> TexturePool::alloc_texture_with_data(TextureOwner owner,
                                                              const TextureHandle& handle,
                                                              std::span<const std::uint8_t> data) {
    auto id = alloc_texture(handle, owner);
    if (!id) {
        return std::nullopt;
    }

    auto err = m_backend.write_texture(m_entries.at(*id).texture, data.data(), data.size());
    if (err != grafiek_gpu::BackendError::None) {
        grafiek_core::gpu_logger()->error("Upload to texture {} failed: {}",
            id->value, grafiek_gpu::backend_error_name(err));
        release_texture(*id);
        return std::nullopt;
    }
    return id;
}

std::optional<grafiek_gpu::TextureHandle> TexturePool::get_texture(TextureId id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.texture;
}

std::optional<grafiek_gpu::TextureDesc> TexturePool::texture_desc(TextureId id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return m_backend.texture_desc(it->second.texture);
}

bool TexturePool::replace_texture(TextureId id, grafiek_gpu::TextureHandle texture) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    m_backend.destroy_texture(it->second.texture);
    it->second.texture = texture;
    return true;
}

bool TexturePool::release_texture(TextureId id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    m_backend.destroy_texture(it->second.texture);
    m_entries.erase(it);
    grafiek_core::gpu_logger()->trace("Released texture {}", id.value);
    return true;
}

std::size_t TexturePool::release_node_textures(NodeIndex node) {
    std::vector<TextureId> owned;
    for (const auto& [id, entry] : m_entries) {
        if (entry.owner.kind == TextureOwner::Kind::Node && entry.owner.node == node) {
            owned.push_back(id);
        }
    }
    for (auto id : owned) {
        release_texture(id);
    }
    return owned.size();
}

std::optional<TextureOwner> TexturePool::owner_of(TextureId id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.owner;
}

} // namespace grafiek_engine
