#pragma once

/// @file context.hpp
/// @brief Execution context handed to every Operation call

#include "fwd.hpp"
#include "texture_pool.hpp"
#include "value.hpp"

#include <grafiek/gpu/backend.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace grafiek_engine {

/// Frame timing supplied by the host before execute()
struct TimeInfo {
    float time = 0.0f;
    float delta = 0.0f;
    std::uint64_t frame = 0;
};

/// GPU backend, texture pool and timing shared by all operations
class ExecutionContext {
public:
    explicit ExecutionContext(std::unique_ptr<grafiek_gpu::IGpuBackend> backend);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    [[nodiscard]] grafiek_gpu::IGpuBackend& backend() noexcept { return *m_backend; }
    [[nodiscard]] TexturePool& textures() noexcept { return m_textures; }
    [[nodiscard]] const TexturePool& textures() const noexcept { return m_textures; }

    /// Backend texture behind @p handle, if allocated
    [[nodiscard]] std::optional<grafiek_gpu::TextureHandle> texture(const TextureHandle& handle) const;

    [[nodiscard]] float time() const noexcept { return m_timing.time; }
    [[nodiscard]] const TimeInfo& timing() const noexcept { return m_timing; }
    void set_timing(const TimeInfo& timing) noexcept { m_timing = timing; }

    /// Make @p handle refer to a live texture matching its size and format
    ///
    /// Allocates one owned by @p owner when the handle has no id; recreates the
    /// backing in place (same id) when size or format changed.
    bool ensure_texture(TextureHandle& handle, TextureOwner owner);

private:
    std::unique_ptr<grafiek_gpu::IGpuBackend> m_backend;
    TexturePool m_textures;
    TimeInfo m_timing;
};

} // namespace grafiek_engine
