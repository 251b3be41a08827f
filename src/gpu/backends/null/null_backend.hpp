/// @file null_backend.hpp
/// @brief Null GPU backend for headless operation and tests
///
/// Textures live in CPU memory so uploads can be inspected without a GPU.
#pragma once

#include "grafiek/gpu/backend.hpp"

#include <span>
#include <unordered_map>
#include <vector>

namespace grafiek_gpu {
namespace backends {

/// Null backend - IGpuBackend with CPU-side texture storage
class NullBackend : public IGpuBackend {
public:
    NullBackend() = default;
    ~NullBackend() override { shutdown(); }

    BackendError init(const BackendConfig& config) override;
    void shutdown() override;

    [[nodiscard]] bool is_initialized() const override { return m_initialized; }
    [[nodiscard]] GpuBackend backend_type() const override { return GpuBackend::Null; }

    TextureHandle create_texture(const TextureDesc& desc) override;
    void destroy_texture(TextureHandle handle) override;
    BackendError write_texture(TextureHandle handle, const void* data, std::size_t size) override;
    [[nodiscard]] std::optional<TextureDesc> texture_desc(TextureHandle handle) const override;

    [[nodiscard]] std::size_t texture_count() const override { return m_textures.size(); }
    [[nodiscard]] std::uint64_t get_allocated_memory() const override;

    /// Pixels last written to @p handle (empty span for an unknown handle)
    [[nodiscard]] std::span<const std::uint8_t> texture_data(TextureHandle handle) const;

private:
    struct Texture {
        TextureDesc desc;
        std::vector<std::uint8_t> pixels;
    };

    bool m_initialized = false;
    BackendConfig m_config;
    std::uint64_t m_next_handle = 0;
    std::unordered_map<std::uint64_t, Texture> m_textures;
};

/// Factory function to create Null backend
[[nodiscard]] std::unique_ptr<IGpuBackend> create_null_backend();

} // namespace backends
} // namespace grafiek_gpu
