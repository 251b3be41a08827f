/// @file value.cpp
/// @brief Value casting and display for grafiek_engine

#include <grafiek/engine/value.hpp>

#include <cmath>
#include <cstdio>
#include <limits>

namespace grafiek_engine {

namespace {

/// Truncating f32 -> i32 conversion; NaN maps to 0, out-of-range values clamp
std::int32_t saturate_to_i32(float value) noexcept {
    using Limits = std::numeric_limits<std::int32_t>;
    if (std::isnan(value)) {
        return 0;
    }
    // 2^31 is exactly representable as a float; INT32_MAX is not
    constexpr float upper = 2147483648.0f;
    if (value >= upper) {
        return Limits::max();
    }
    if (value <= static_cast<float>(Limits::min())) {
        return Limits::min();
    }
    return static_cast<std::int32_t>(std::trunc(value));
}

} // anonymous namespace

// =============================================================================
// ValueType
// =============================================================================

const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::I32: return "i32";
        case ValueType::F32: return "f32";
        case ValueType::Texture: return "texture";
        case ValueType::String: return "string";
        case ValueType::Bool: return "bool";
        case ValueType::Any: return "any";
    }
    return "any";
}

std::optional<ValueType> parse_value_type(const std::string& name) {
    if (name == "i32") return ValueType::I32;
    if (name == "f32") return ValueType::F32;
    if (name == "texture") return ValueType::Texture;
    if (name == "string") return ValueType::String;
    if (name == "bool") return ValueType::Bool;
    if (name == "any") return ValueType::Any;
    return std::nullopt;
}

bool can_cast_to(ValueType from, ValueType to) noexcept {
    if (from == to) return true;
    if (from == ValueType::Any || to == ValueType::Any) return true;

    const bool from_numeric = from == ValueType::I32 || from == ValueType::F32;
    const bool to_numeric = to == ValueType::I32 || to == ValueType::F32;
    return from_numeric && to_numeric;
}

bool matches(ValueType a, ValueType b) noexcept {
    return a == ValueType::Any || b == ValueType::Any || a == b;
}

// =============================================================================
// Textures
// =============================================================================

const char* texture_format_name(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::RGBAu8: return "rgba_u8";
        case TextureFormat::RGBAu16: return "rgba_u16";
        case TextureFormat::RGBAF32: return "rgba_f32";
        case TextureFormat::BGRA8: return "bgra8";
    }
    return "rgba_u8";
}

std::optional<TextureFormat> parse_texture_format(const std::string& name) {
    if (name == "rgba_u8") return TextureFormat::RGBAu8;
    if (name == "rgba_u16") return TextureFormat::RGBAu16;
    if (name == "rgba_f32") return TextureFormat::RGBAF32;
    if (name == "bgra8") return TextureFormat::BGRA8;
    return std::nullopt;
}

grafiek_gpu::TextureFormat to_gpu_format(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::RGBAu8: return grafiek_gpu::TextureFormat::Rgba8Unorm;
        case TextureFormat::RGBAu16: return grafiek_gpu::TextureFormat::Rgba16Unorm;
        case TextureFormat::RGBAF32: return grafiek_gpu::TextureFormat::Rgba32Float;
        case TextureFormat::BGRA8: return grafiek_gpu::TextureFormat::Bgra8Unorm;
    }
    return grafiek_gpu::TextureFormat::Rgba8Unorm;
}

// =============================================================================
// Value
// =============================================================================

ValueType Value::type() const noexcept {
    switch (m_data.index()) {
        case 1: return ValueType::I32;
        case 2: return ValueType::F32;
        case 3: return ValueType::Texture;
        case 4: return ValueType::String;
        case 5: return ValueType::Bool;
        default: return ValueType::Any;
    }
}

std::optional<Value> Value::cast(ValueType target) const {
    if (is_null()) return std::nullopt;
    if (target == ValueType::Any || target == type()) return *this;

    if (const auto* i = get<std::int32_t>(); i && target == ValueType::F32) {
        return Value(static_cast<float>(*i));
    }
    if (const auto* f = get<float>(); f && target == ValueType::I32) {
        return Value(saturate_to_i32(*f));
    }
    return std::nullopt;
}

std::string Value::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, float>) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(v));
            return buf;
        } else if constexpr (std::is_same_v<T, TextureHandle>) {
            return v.id ? "texture(" + std::to_string(v.id->value) + ")" : std::string("texture(none)");
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else {
            return v ? "true" : "false";
        }
    }, m_data);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

Value type_default(ValueType type) {
    switch (type) {
        case ValueType::I32: return Value(std::int32_t{0});
        case ValueType::F32: return Value(0.0f);
        case ValueType::Texture: return Value(TextureHandle{});
        case ValueType::String: return Value(std::string{});
        case ValueType::Bool: return Value(false);
        case ValueType::Any: return Value();
    }
    return Value();
}

// =============================================================================
// ValueMut
// =============================================================================

Result<void> ValueMut::set(const Value& value) {
    if (m_value.is_null()) {
        touch();
        m_value = value;
        return grafiek_core::Ok();
    }

    auto cast = value.cast(m_value.type());
    if (!cast) {
        return grafiek_core::Err(grafiek_core::ValueError::type_mismatch(
            value_type_name(m_value.type()), value.to_string()));
    }

    touch();
    m_value = std::move(*cast);
    return grafiek_core::Ok();
}

} // namespace grafiek_engine
