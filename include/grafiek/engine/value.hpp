#pragma once

/// @file value.hpp
/// @brief Slot values and their type system for grafiek_engine
///
/// A Value is a closed tagged union over the types a slot can carry. The
/// ValueType discriminant adds Any, which is what a Null value reports and
/// what type-agnostic slots declare.

#include <grafiek/core/error.hpp>
#include <grafiek/gpu/backend.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace grafiek_engine {

using grafiek_core::Result;

// =============================================================================
// ValueType
// =============================================================================

/// Declared type of a slot
enum class ValueType : std::uint8_t {
    I32 = 0,
    F32,
    Texture,
    String,
    Bool,
    Any,
};

/// Get type name ("i32", "f32", "texture", "string", "bool", "any")
[[nodiscard]] const char* value_type_name(ValueType type) noexcept;

/// Parse a type name written by value_type_name
[[nodiscard]] std::optional<ValueType> parse_value_type(const std::string& name);

/// True if a value of @p from may flow into a slot of type @p to
[[nodiscard]] bool can_cast_to(ValueType from, ValueType to) noexcept;

/// Equality with Any as a wildcard on either side
[[nodiscard]] bool matches(ValueType a, ValueType b) noexcept;

// =============================================================================
// Textures
// =============================================================================

/// Pixel format of a texture value
enum class TextureFormat : std::uint8_t {
    RGBAu8 = 0,
    RGBAu16,
    RGBAF32,
    BGRA8,
};

[[nodiscard]] const char* texture_format_name(TextureFormat format) noexcept;
[[nodiscard]] std::optional<TextureFormat> parse_texture_format(const std::string& name);
[[nodiscard]] grafiek_gpu::TextureFormat to_gpu_format(TextureFormat format) noexcept;

[[nodiscard]] constexpr std::size_t bytes_per_pixel(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::RGBAu8: return 4;
        case TextureFormat::RGBAu16: return 8;
        case TextureFormat::RGBAF32: return 16;
        case TextureFormat::BGRA8: return 4;
    }
    return 4;
}

/// Stable pool identifier of a GPU texture
struct TextureId {
    std::uint64_t value = 0;

    constexpr bool operator==(const TextureId&) const noexcept = default;
};

/// Value-level reference to a texture resolved through the texture pool
struct TextureHandle {
    std::optional<TextureId> id;
    std::uint32_t width = 1;
    std::uint32_t height = 1;
    TextureFormat fmt = TextureFormat::RGBAu8;

    [[nodiscard]] bool is_allocated() const noexcept { return id.has_value(); }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return static_cast<std::size_t>(width) * height * bytes_per_pixel(fmt);
    }

    bool operator==(const TextureHandle&) const noexcept = default;
};

// =============================================================================
// Value
// =============================================================================

/// Unit value carried by unconnected Any slots
struct Null {
    constexpr bool operator==(const Null&) const noexcept = default;
};

/// Compile-time binding of C++ types to slot types
template<typename T>
struct ValueTraits;

template<> struct ValueTraits<std::int32_t> { static constexpr ValueType type = ValueType::I32; };
template<> struct ValueTraits<float> { static constexpr ValueType type = ValueType::F32; };
template<> struct ValueTraits<TextureHandle> { static constexpr ValueType type = ValueType::Texture; };
template<> struct ValueTraits<std::string> { static constexpr ValueType type = ValueType::String; };
template<> struct ValueTraits<bool> { static constexpr ValueType type = ValueType::Bool; };

/// A type that can be stored in a slot
template<typename T>
concept SlotValue = requires { { ValueTraits<T>::type } -> std::convertible_to<ValueType>; };

/// Tagged slot value
class Value {
public:
    using Variant = std::variant<Null, std::int32_t, float, TextureHandle, std::string, bool>;

    Value() = default;
    Value(Null) {}
    Value(std::int32_t v) : m_data(v) {}
    Value(float v) : m_data(v) {}
    Value(TextureHandle v) : m_data(std::move(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(const char* v) : m_data(std::string(v)) {}
    Value(bool v) : m_data(v) {}

    /// Discriminant (Null reports Any)
    [[nodiscard]] ValueType type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(m_data); }

    template<SlotValue T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Typed pointer, nullptr on mismatch
    template<SlotValue T>
    [[nodiscard]] T* get() noexcept {
        return std::get_if<T>(&m_data);
    }

    template<SlotValue T>
    [[nodiscard]] const T* get() const noexcept {
        return std::get_if<T>(&m_data);
    }

    /// Convert to @p target; Null never converts, not even to Any
    [[nodiscard]] std::optional<Value> cast(ValueType target) const;

    [[nodiscard]] bool can_cast_to(ValueType target) const { return cast(target).has_value(); }

    /// Display form: 3, 1.500, texture(7), "text", true, null
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    bool operator==(const Value& other) const = default;

private:
    Variant m_data;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

/// Default value of a bare slot type (0, 0.0, "", false, unallocated 1x1 texture, Null)
[[nodiscard]] Value type_default(ValueType type);

// =============================================================================
// Slot Views
// =============================================================================

/// Write view over one stored slot value with change tracking
///
/// The owner passes a checkpoint slot: scalars are copied into it before the
/// view is handed out, strings are copied on first mutable access only. A
/// slot changed if a checkpoint exists and differs from the final value.
class ValueMut {
public:
    ValueMut(Value& value, std::optional<Value>& checkpoint)
        : m_value(value), m_checkpoint(checkpoint) {}

    [[nodiscard]] ValueType type() const noexcept { return m_value.type(); }
    [[nodiscard]] const Value& get() const noexcept { return m_value; }

    /// Mutable typed access, nullptr on mismatch
    template<SlotValue T>
    [[nodiscard]] T* as() {
        T* ptr = m_value.get<T>();
        if (ptr) touch();
        return ptr;
    }

    /// Replace the value, casting to the stored type unless the slot is Null
    Result<void> set(const Value& value);

    template<SlotValue T>
    Result<void> set(T value) {
        return set(Value(std::move(value)));
    }

private:
    void touch() {
        if (!m_checkpoint) m_checkpoint = m_value;
    }

    Value& m_value;
    std::optional<Value>& m_checkpoint;
};

/// Read view over the effective input values of a node
class Inputs {
public:
    Inputs() = default;
    explicit Inputs(std::vector<const Value*> values) : m_values(std::move(values)) {}

    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_values.empty(); }

    [[nodiscard]] const Value& operator[](std::size_t i) const { return *m_values[i]; }

    /// Value at @p i, nullptr when out of range
    [[nodiscard]] const Value* get(std::size_t i) const noexcept {
        return i < m_values.size() ? m_values[i] : nullptr;
    }

    /// Read slot @p i as T, applying the value cast rules
    template<SlotValue T>
    [[nodiscard]] Result<T> extract(std::size_t i) const {
        if (i >= m_values.size()) {
            return Result<T>(grafiek_core::Error(grafiek_core::ValueError::bad_index(i)));
        }
        auto cast = m_values[i]->cast(ValueTraits<T>::type);
        if (!cast) {
            return Result<T>(grafiek_core::Error(grafiek_core::ValueError::type_mismatch(
                value_type_name(ValueTraits<T>::type), m_values[i]->to_string())));
        }
        return Result<T>(std::move(*cast->template get<T>()));
    }

private:
    std::vector<const Value*> m_values;
};

/// Write view over a node's output values
class Outputs {
public:
    explicit Outputs(std::span<Value> values) : m_values(values) {}

    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }

    [[nodiscard]] Value& operator[](std::size_t i) { return m_values[i]; }
    [[nodiscard]] const Value& operator[](std::size_t i) const { return m_values[i]; }

    /// Typed pointer into slot @p i, nullptr if out of range or mismatched
    template<SlotValue T>
    [[nodiscard]] T* get(std::size_t i) noexcept {
        return i < m_values.size() ? m_values[i].template get<T>() : nullptr;
    }

    /// Store @p value into slot @p i; the slot keeps its declared type
    template<SlotValue T>
    Result<void> write(std::size_t i, T value) {
        if (i >= m_values.size()) {
            return grafiek_core::Err(grafiek_core::ValueError::bad_index(i));
        }
        Value& slot = m_values[i];
        if (!slot.is_null() && !slot.is<T>()) {
            return grafiek_core::Err(grafiek_core::ValueError::type_mismatch(
                value_type_name(slot.type()), value_type_name(ValueTraits<T>::type)));
        }
        slot = Value(std::move(value));
        return grafiek_core::Ok();
    }

private:
    std::span<Value> m_values;
};

} // namespace grafiek_engine

template<>
struct std::hash<grafiek_engine::TextureId> {
    std::size_t operator()(const grafiek_engine::TextureId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
