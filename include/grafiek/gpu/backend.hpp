#pragma once

/// @file backend.hpp
/// @brief Texture-level GPU abstraction for grafiek_gpu
///
/// The engine only ever owns 2D textures, so the backend interface is reduced
/// to texture creation, upload and destruction:
/// - OpenGL (needs a context current on the engine thread)
/// - Null (CPU-side storage, headless and tests)

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace grafiek_gpu {

// =============================================================================
// Backend Selection
// =============================================================================

/// Graphics API backend type
enum class GpuBackend : std::uint8_t {
    Null = 0,   // CPU-side storage (headless/testing)
    OpenGL,     // OpenGL 2.1+ texture objects
};

/// Backend name ("null", "opengl")
[[nodiscard]] const char* backend_name(GpuBackend backend);

/// Parse a backend name as written in configuration
[[nodiscard]] std::optional<GpuBackend> parse_backend_name(const std::string& name);

/// Backend initialization configuration
struct BackendConfig {
    bool enable_validation = false;   // Check GL errors after every call
    std::string label = "grafiek";
};

// =============================================================================
// GPU Resource Handles
// =============================================================================

/// Opaque handle for GPU resources
template<typename Tag>
struct GpuHandle {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const noexcept { return id != 0; }
    [[nodiscard]] static GpuHandle invalid() noexcept { return GpuHandle{0}; }

    bool operator==(const GpuHandle& other) const noexcept = default;
};

struct TextureTag {};

using TextureHandle = GpuHandle<TextureTag>;

// =============================================================================
// Texture Description
// =============================================================================

/// Pixel formats the engine can store
enum class TextureFormat : std::uint8_t {
    Rgba8Unorm,
    Rgba16Unorm,
    Rgba32Float,
    Bgra8Unorm,
};

/// Bytes per pixel for @p format
[[nodiscard]] constexpr std::size_t bytes_per_pixel(TextureFormat format) {
    switch (format) {
        case TextureFormat::Rgba8Unorm: return 4;
        case TextureFormat::Rgba16Unorm: return 8;
        case TextureFormat::Rgba32Float: return 16;
        case TextureFormat::Bgra8Unorm: return 4;
    }
    return 4;
}

/// Texture description
struct TextureDesc {
    std::uint32_t width = 1;
    std::uint32_t height = 1;
    TextureFormat format = TextureFormat::Rgba8Unorm;
    std::string label;

    [[nodiscard]] std::size_t byte_size() const {
        return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
    }
};

// =============================================================================
// Backend Interface
// =============================================================================

/// Backend error codes
enum class BackendError {
    None = 0,
    NotInitialized,
    AlreadyInitialized,
    UnsupportedBackend,
    NoContext,
    OutOfMemory,
    InvalidHandle,
    InvalidParameter,
    Unknown
};

/// Backend error name
[[nodiscard]] const char* backend_error_name(BackendError error);

/// GPU backend interface, one implementation per graphics API
class IGpuBackend {
public:
    virtual ~IGpuBackend() = default;

    // Lifecycle
    virtual BackendError init(const BackendConfig& config) = 0;
    virtual void shutdown() = 0;
    [[nodiscard]] virtual bool is_initialized() const = 0;
    [[nodiscard]] virtual GpuBackend backend_type() const = 0;

    // Textures
    [[nodiscard]] virtual TextureHandle create_texture(const TextureDesc& desc) = 0;
    virtual void destroy_texture(TextureHandle handle) = 0;

    /// Upload a full image; @p size must equal desc.byte_size()
    virtual BackendError write_texture(TextureHandle handle, const void* data, std::size_t size) = 0;

    /// Description the texture was created with
    [[nodiscard]] virtual std::optional<TextureDesc> texture_desc(TextureHandle handle) const = 0;

    // Statistics
    [[nodiscard]] virtual std::size_t texture_count() const = 0;
    [[nodiscard]] virtual std::uint64_t get_allocated_memory() const = 0;
};

/// Create backend instance (uninitialized)
[[nodiscard]] std::unique_ptr<IGpuBackend> create_backend(GpuBackend backend);

} // namespace grafiek_gpu

template<typename Tag>
struct std::hash<grafiek_gpu::GpuHandle<Tag>> {
    std::size_t operator()(const grafiek_gpu::GpuHandle<Tag>& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.id);
    }
};
