#pragma once

/// @file slot.hpp
/// @brief Slot definitions and their metadata for grafiek_engine

#include "value.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace grafiek_engine {

// =============================================================================
// Extended Metadata
// =============================================================================

enum class AngleUnit : std::uint8_t { Radians = 0, Degrees };

enum class StringKind : std::uint8_t { Line = 0, Multiline, Code, Path };

namespace meta {

struct None {
    bool operator==(const None&) const = default;
};

/// Slider range for f32 slots
struct FloatRange {
    float min = 0.0f;
    float max = 1.0f;
    float step = 0.01f;
    float default_value = 0.0f;

    bool operator==(const FloatRange&) const = default;
};

/// Angle dial for f32 slots
struct Angle {
    float min = 0.0f;
    float max = 6.2831853f;
    float default_value = 0.0f;
    AngleUnit unit = AngleUnit::Radians;

    bool operator==(const Angle&) const = default;
};

/// Slider range for i32 slots
struct IntRange {
    std::int32_t min = 0;
    std::int32_t max = 100;
    std::int32_t step = 1;
    std::int32_t default_value = 0;

    bool operator==(const IntRange&) const = default;
};

/// Named choices for i32 slots
struct IntEnum {
    std::vector<std::pair<std::string, std::int32_t>> options;
    std::int32_t default_value = 0;

    bool operator==(const IntEnum&) const = default;
};

/// Checkbox default for bool slots
struct Boolean {
    bool default_value = false;

    bool operator==(const Boolean&) const = default;
};

/// Editor style for string slots
struct StringHint {
    StringKind kind = StringKind::Line;

    bool operator==(const StringHint&) const = default;
};

/// Size and format of a texture output
struct TextureHints {
    std::uint32_t width = 1;
    std::uint32_t height = 1;
    TextureFormat format = TextureFormat::RGBAu8;

    bool operator==(const TextureHints&) const = default;
};

/// Opaque client data, valid on any slot type
struct Custom {
    std::vector<std::uint8_t> bytes;

    bool operator==(const Custom&) const = default;
};

} // namespace meta

using ExtendedMetadata = std::variant<
    meta::None,
    meta::FloatRange,
    meta::Angle,
    meta::IntRange,
    meta::IntEnum,
    meta::Boolean,
    meta::StringHint,
    meta::TextureHints,
    meta::Custom
>;

/// Which metadata kinds may decorate a slot of type T
template<typename M, typename T>
struct MetadataFor : std::false_type {};

template<typename T> struct MetadataFor<meta::None, T> : std::true_type {};
template<typename T> struct MetadataFor<meta::Custom, T> : std::true_type {};
template<> struct MetadataFor<meta::FloatRange, float> : std::true_type {};
template<> struct MetadataFor<meta::Angle, float> : std::true_type {};
template<> struct MetadataFor<meta::IntRange, std::int32_t> : std::true_type {};
template<> struct MetadataFor<meta::IntEnum, std::int32_t> : std::true_type {};
template<> struct MetadataFor<meta::Boolean, bool> : std::true_type {};
template<> struct MetadataFor<meta::StringHint, std::string> : std::true_type {};
template<> struct MetadataFor<meta::TextureHints, TextureHandle> : std::true_type {};

// =============================================================================
// Common Metadata
// =============================================================================

/// Presentation flags shared by every slot
struct CommonMetadata {
    std::string tooltip;
    bool interactive = false;   // Safe to update every frame
    bool enabled = true;        // Editable from the UI
    bool visible = true;
    bool on_node_body = false;  // Drawn on the node body instead of the inspector

    bool operator==(const CommonMetadata&) const = default;
};

// =============================================================================
// SlotDef
// =============================================================================

/// Which list of a signature a slot belongs to
enum class SlotRole : std::uint8_t { Input = 0, Output, Config };

[[nodiscard]] const char* slot_role_name(SlotRole role) noexcept;

/// Declaration of one named, typed attachment point
struct SlotDef {
    ValueType value_type = ValueType::Any;
    std::string name;
    ExtendedMetadata extended = meta::None{};
    CommonMetadata common;
    std::optional<Value> default_override;
    SlotRole role = SlotRole::Input;

    /// Value a freshly declared slot starts with
    [[nodiscard]] Value default_value() const;
};

} // namespace grafiek_engine
