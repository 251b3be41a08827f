#pragma once

/// @file system_textures.hpp
/// @brief Reserved engine-owned textures

#include "value.hpp"

#include <array>
#include <cstdint>

namespace grafiek_engine {

/// 1x1 black
inline const TextureHandle SPECK{TextureId{0}, 1, 1, TextureFormat::RGBAu8};

/// 1x1 white
inline const TextureHandle FLECK{TextureId{1}, 1, 1, TextureFormat::RGBAu8};

/// 1x1 transparent
inline const TextureHandle TRANSPARENT_SPECK{TextureId{2}, 1, 1, TextureFormat::RGBAu8};

/// 2x2 black/magenta check, the "missing texture" pattern
inline const TextureHandle CHECK{TextureId{3}, 2, 2, TextureFormat::RGBAu8};

inline constexpr std::array<std::uint8_t, 4> SPECK_DATA{0, 0, 0, 255};
inline constexpr std::array<std::uint8_t, 4> FLECK_DATA{255, 255, 255, 255};
inline constexpr std::array<std::uint8_t, 4> TRANSPARENT_SPECK_DATA{0, 0, 0, 0};

inline constexpr std::array<std::uint8_t, 16> CHECK_DATA{
    0, 0, 0, 255,
    255, 0, 255, 255,
    255, 0, 255, 255,
    0, 0, 0, 255,
};

/// Ids below this are reserved for the textures above
inline constexpr std::uint64_t SYSTEM_TEXTURE_COUNT = 4;

} // namespace grafiek_engine
