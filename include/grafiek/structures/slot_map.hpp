#pragma once

/// @file slot_map.hpp
/// @brief Generational arena for grafiek_structures
///
/// SlotMap hands out keys that stay valid until their own element is removed.
/// Removing an element never renumbers the others, and a key to a removed
/// element is detected through its generation instead of aliasing whatever
/// reuses the slot. The engine stores its graph nodes here.

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace grafiek_structures {

// =============================================================================
// SlotKey
// =============================================================================

/// Generational key
/// @tparam T Element type (compile-time tag only)
template<typename T>
struct SlotKey {
    std::uint32_t index = std::numeric_limits<std::uint32_t>::max();
    std::uint32_t generation = 0;

    constexpr SlotKey() noexcept = default;
    constexpr SlotKey(std::uint32_t idx, std::uint32_t gen) noexcept
        : index(idx), generation(gen) {}

    [[nodiscard]] static constexpr SlotKey null() noexcept { return SlotKey{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return index == std::numeric_limits<std::uint32_t>::max();
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return !is_null(); }

    constexpr bool operator==(const SlotKey& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    constexpr bool operator!=(const SlotKey& other) const noexcept {
        return !(*this == other);
    }

    /// Orders by slot, then generation (used for deterministic traversal)
    constexpr bool operator<(const SlotKey& other) const noexcept {
        return index != other.index ? index < other.index : generation < other.generation;
    }

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

} // namespace grafiek_structures

namespace std {

template<typename T>
struct hash<grafiek_structures::SlotKey<T>> {
    std::size_t operator()(const grafiek_structures::SlotKey<T>& key) const noexcept {
        return (static_cast<std::size_t>(key.generation) << 32) ^ static_cast<std::size_t>(key.index);
    }
};

} // namespace std

namespace grafiek_structures {

// =============================================================================
// SlotMap
// =============================================================================

/// Arena with O(1) insert, remove and lookup
/// @tparam T Stored element type (move-constructible)
template<typename T>
class SlotMap {
public:
    using key_type = SlotKey<T>;
    using value_type = T;
    using size_type = std::size_t;

    SlotMap() = default;

    SlotMap(SlotMap&&) noexcept = default;
    SlotMap& operator=(SlotMap&&) noexcept = default;
    SlotMap(const SlotMap&) = delete;
    SlotMap& operator=(const SlotMap&) = delete;

    // =========================================================================
    // Capacity
    // =========================================================================

    [[nodiscard]] size_type size() const noexcept { return m_len; }
    [[nodiscard]] bool empty() const noexcept { return m_len == 0; }

    /// Number of slots ever allocated (occupied or free)
    [[nodiscard]] size_type slot_count() const noexcept { return m_slots.size(); }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert a value, reusing a freed slot when one exists
    key_type insert(T value) {
        std::uint32_t idx;
        if (!m_free.empty()) {
            idx = m_free.back();
            m_free.pop_back();
        } else {
            idx = static_cast<std::uint32_t>(m_slots.size());
            m_slots.emplace_back();
        }

        Slot& slot = m_slots[idx];
        slot.value.emplace(std::move(value));
        ++m_len;
        return key_type(idx, slot.generation);
    }

    /// Remove and return the value behind @p key
    std::optional<T> remove(key_type key) {
        if (!contains_key(key)) {
            return std::nullopt;
        }

        Slot& slot = m_slots[key.index];
        std::optional<T> out(std::move(*slot.value));
        slot.value.reset();
        ++slot.generation;
        m_free.push_back(key.index);
        --m_len;
        return out;
    }

    /// Remove every element; all outstanding keys become stale
    void clear() {
        m_free.clear();
        for (std::uint32_t i = 0; i < m_slots.size(); ++i) {
            Slot& slot = m_slots[i];
            if (slot.value) {
                slot.value.reset();
                ++slot.generation;
            }
            m_free.push_back(i);
        }
        m_len = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains_key(key_type key) const noexcept {
        if (key.is_null() || key.index >= m_slots.size()) {
            return false;
        }
        const Slot& slot = m_slots[key.index];
        return slot.value.has_value() && slot.generation == key.generation;
    }

    [[nodiscard]] T* get(key_type key) noexcept {
        return contains_key(key) ? &*m_slots[key.index].value : nullptr;
    }

    [[nodiscard]] const T* get(key_type key) const noexcept {
        return contains_key(key) ? &*m_slots[key.index].value : nullptr;
    }

    /// Checked access (throws std::out_of_range on a stale key)
    [[nodiscard]] T& at(key_type key) {
        T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: stale key");
        }
        return *ptr;
    }

    [[nodiscard]] const T& at(key_type key) const {
        const T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: stale key");
        }
        return *ptr;
    }

    // =========================================================================
    // Traversal
    // =========================================================================

    /// Live keys in slot order
    [[nodiscard]] std::vector<key_type> keys() const {
        std::vector<key_type> out;
        out.reserve(m_len);
        for (std::uint32_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].value) {
                out.emplace_back(i, m_slots[i].generation);
            }
        }
        return out;
    }

    /// Visit every live element with its key
    template<typename F>
    void for_each(F&& func) {
        for (std::uint32_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].value) {
                func(key_type(i, m_slots[i].generation), *m_slots[i].value);
            }
        }
    }

    template<typename F>
    void for_each(F&& func) const {
        for (std::uint32_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].value) {
                func(key_type(i, m_slots[i].generation), *m_slots[i].value);
            }
        }
    }

private:
    struct Slot {
        std::uint32_t generation = 0;
        std::optional<T> value;
    };

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free;
    size_type m_len = 0;
};

} // namespace grafiek_structures
