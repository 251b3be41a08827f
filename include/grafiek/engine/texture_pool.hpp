#pragma once

/// @file texture_pool.hpp
/// @brief Ownership table of GPU textures keyed by stable TextureId

#include "fwd.hpp"
#include "value.hpp"

#include <grafiek/gpu/backend.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>

namespace grafiek_engine {

/// Who releases a pooled texture
struct TextureOwner {
    enum class Kind : std::uint8_t {
        Engine,  // System textures and explicit uploads without a node
        Node,    // Released together with the node
    };

    Kind kind = Kind::Engine;
    NodeIndex node;

    [[nodiscard]] static TextureOwner engine() noexcept { return TextureOwner{}; }
    [[nodiscard]] static TextureOwner of_node(NodeIndex idx) noexcept {
        return TextureOwner{Kind::Node, idx};
    }

    bool operator==(const TextureOwner&) const noexcept = default;
};

/// Maps TextureId to a backend texture and its owner
///
/// Ids below SYSTEM_TEXTURE_COUNT are reserved for insert_texture; all other
/// ids are issued monotonically and never reused.
class TexturePool {
public:
    explicit TexturePool(grafiek_gpu::IGpuBackend& backend);
    ~TexturePool();

    TexturePool(const TexturePool&) = delete;
    TexturePool& operator=(const TexturePool&) = delete;

    /// Create a texture at the reserved id carried by @p handle and upload @p data
    Result<void> insert_texture(const TextureHandle& handle, std::span<const std::uint8_t> data);

    /// Create an empty texture sized by @p handle
    [[nodiscard]] std::optional<TextureId> alloc_texture(const TextureHandle& handle,
                                                         TextureOwner owner = TextureOwner::engine());

    /// Create a texture sized by @p handle and upload @p data
    [[nodiscard]] std::optional<TextureId> alloc_texture_with_data(TextureOwner owner,
                                                                   const TextureHandle& handle,
                                                                   std::span<const std::uint8_t> data);

    [[nodiscard]] std::optional<grafiek_gpu::TextureHandle> get_texture(TextureId id) const;
    [[nodiscard]] std::optional<grafiek_gpu::TextureDesc> texture_desc(TextureId id) const;

    /// Swap the backing texture of @p id, destroying the previous one
    bool replace_texture(TextureId id, grafiek_gpu::TextureHandle texture);

    /// Destroy and forget @p id
    bool release_texture(TextureId id);

    /// Release every texture owned by @p node; returns how many were released
    std::size_t release_node_textures(NodeIndex node);

    [[nodiscard]] bool contains(TextureId id) const { return m_entries.count(id) != 0; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] std::optional<TextureOwner> owner_of(TextureId id) const;

    [[nodiscard]] grafiek_gpu::IGpuBackend& backend() noexcept { return m_backend; }

private:
    struct Entry {
        grafiek_gpu::TextureHandle texture;
        TextureOwner owner;
    };

    [[nodiscard]] grafiek_gpu::TextureHandle create_backing(const TextureHandle& handle);

    grafiek_gpu::IGpuBackend& m_backend;
    std::unordered_map<TextureId, Entry> m_entries;
    std::uint64_t m_next_id;
};

} // namespace grafiek_engine
