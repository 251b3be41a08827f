#pragma once

/// @file signature.hpp
/// @brief Per-node slot registry (inputs, outputs, config)

#include "slot.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grafiek_engine {

// =============================================================================
// SlotBuilder
// =============================================================================

/// Fluent builder returned by SignatureRegistry::add_*
template<SlotValue T>
class SlotBuilder {
public:
    SlotBuilder(std::vector<SlotDef>& list, std::string name, SlotRole role)
        : m_list(list) {
        m_def.value_type = ValueTraits<T>::type;
        m_def.name = std::move(name);
        m_def.role = role;
    }

    /// Attach extended metadata; the kind must fit the slot type
    template<typename M>
    SlotBuilder& meta(M metadata) {
        static_assert(MetadataFor<M, T>::value, "metadata kind does not apply to this slot type");
        m_def.extended = std::move(metadata);
        return *this;
    }

    SlotBuilder& tooltip(std::string text) {
        m_def.common.tooltip = std::move(text);
        return *this;
    }

    SlotBuilder& visible(bool value = true) {
        m_def.common.visible = value;
        return *this;
    }

    SlotBuilder& interactive(bool value = true) {
        m_def.common.interactive = value;
        return *this;
    }

    SlotBuilder& enabled(bool value = true) {
        m_def.common.enabled = value;
        return *this;
    }

    SlotBuilder& on_node_body(bool value = true) {
        m_def.common.on_node_body = value;
        return *this;
    }

    SlotBuilder& default_value(T value) {
        m_def.default_override = Value(std::move(value));
        return *this;
    }

    /// Push the slot into its list and return its index
    std::size_t build() {
        m_list.push_back(std::move(m_def));
        return m_list.size() - 1;
    }

private:
    std::vector<SlotDef>& m_list;
    SlotDef m_def;
};

// =============================================================================
// SignatureRegistry
// =============================================================================

/// Index and definition of a slot found by name
struct SlotLookup {
    std::size_t index = 0;
    const SlotDef* def = nullptr;
};

/// Ordered input, output and config slot lists of one node
class SignatureRegistry {
public:
    template<SlotValue T>
    [[nodiscard]] SlotBuilder<T> add_input(std::string name) {
        return SlotBuilder<T>(m_inputs, std::move(name), SlotRole::Input);
    }

    template<SlotValue T>
    [[nodiscard]] SlotBuilder<T> add_output(std::string name) {
        return SlotBuilder<T>(m_outputs, std::move(name), SlotRole::Output);
    }

    template<SlotValue T>
    [[nodiscard]] SlotBuilder<T> add_config(std::string name) {
        return SlotBuilder<T>(m_config, std::move(name), SlotRole::Config);
    }

    /// Push a prebuilt definition (for types only known at runtime)
    std::size_t push_input_raw(SlotDef def);
    std::size_t push_output_raw(SlotDef def);
    std::size_t push_config_raw(SlotDef def);

    [[nodiscard]] const SlotDef* input(std::size_t i) const noexcept;
    [[nodiscard]] const SlotDef* output(std::size_t i) const noexcept;
    [[nodiscard]] const SlotDef* config(std::size_t i) const noexcept;

    [[nodiscard]] std::size_t input_count() const noexcept { return m_inputs.size(); }
    [[nodiscard]] std::size_t output_count() const noexcept { return m_outputs.size(); }
    [[nodiscard]] std::size_t config_count() const noexcept { return m_config.size(); }

    [[nodiscard]] const std::vector<SlotDef>& inputs() const noexcept { return m_inputs; }
    [[nodiscard]] const std::vector<SlotDef>& outputs() const noexcept { return m_outputs; }
    [[nodiscard]] const std::vector<SlotDef>& configs() const noexcept { return m_config; }

    /// Typed lookup of a declared input; empty if the name is unknown or the type differs
    template<SlotValue T>
    [[nodiscard]] std::optional<SlotLookup> input_by_name(const std::string& name) const {
        return find(m_inputs, name, ValueTraits<T>::type);
    }

    template<SlotValue T>
    [[nodiscard]] std::optional<SlotLookup> output_by_name(const std::string& name) const {
        return find(m_outputs, name, ValueTraits<T>::type);
    }

    template<SlotValue T>
    [[nodiscard]] std::optional<SlotLookup> config_by_name(const std::string& name) const {
        return find(m_config, name, ValueTraits<T>::type);
    }

    /// Drop inputs and outputs; config slots survive reconfiguration
    void clear();

    /// Drop config slots
    void clear_config();

    /// Fails with DuplicateSlotName naming the slot and its list
    [[nodiscard]] Result<void> validate_unique_names() const;

private:
    [[nodiscard]] static std::optional<SlotLookup> find(const std::vector<SlotDef>& list,
                                                        const std::string& name, ValueType type);

    std::vector<SlotDef> m_inputs;
    std::vector<SlotDef> m_outputs;
    std::vector<SlotDef> m_config;
};

} // namespace grafiek_engine
