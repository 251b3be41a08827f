/// @file signature.cpp
/// @brief Slot defaults and signature registry for grafiek_engine

#include <grafiek/engine/signature.hpp>
#include <grafiek/engine/system_textures.hpp>

#include <unordered_set>

namespace grafiek_engine {

// =============================================================================
// SlotDef
// =============================================================================

const char* slot_role_name(SlotRole role) noexcept {
    switch (role) {
        case SlotRole::Input: return "inputs";
        case SlotRole::Output: return "outputs";
        case SlotRole::Config: return "config";
    }
    return "inputs";
}

Value SlotDef::default_value() const {
    if (default_override) {
        return *default_override;
    }

    if (const auto* range = std::get_if<meta::FloatRange>(&extended)) return Value(range->default_value);
    if (const auto* angle = std::get_if<meta::Angle>(&extended)) return Value(angle->default_value);
    if (const auto* range = std::get_if<meta::IntRange>(&extended)) return Value(range->default_value);
    if (const auto* choice = std::get_if<meta::IntEnum>(&extended)) return Value(choice->default_value);
    if (const auto* flag = std::get_if<meta::Boolean>(&extended)) return Value(flag->default_value);

    if (value_type == ValueType::Texture) {
        if (role != SlotRole::Output) {
            return Value(CHECK);
        }
        TextureHandle handle;
        if (const auto* hints = std::get_if<meta::TextureHints>(&extended)) {
            handle.width = hints->width;
            handle.height = hints->height;
            handle.fmt = hints->format;
        }
        return Value(handle);
    }

    return type_default(value_type);
}

// =============================================================================
// SignatureRegistry
// =============================================================================

std::size_t SignatureRegistry::push_input_raw(SlotDef def) {
    def.role = SlotRole::Input;
    m_inputs.push_back(std::move(def));
    return m_inputs.size() - 1;
}

std::size_t SignatureRegistry::push_output_raw(SlotDef def) {
    def.role = SlotRole::Output;
    m_outputs.push_back(std::move(def));
    return m_outputs.size() - 1;
}

std::size_t SignatureRegistry::push_config_raw(SlotDef def) {
    def.role = SlotRole::Config;
    m_config.push_back(std::move(def));
    return m_config.size() - 1;
}

const SlotDef* SignatureRegistry::input(std::size_t i) const noexcept {
    return i < m_inputs.size() ? &m_inputs[i] : nullptr;
}

const SlotDef* SignatureRegistry::output(std::size_t i) const noexcept {
    return i < m_outputs.size() ? &m_outputs[i] : nullptr;
}

const SlotDef* SignatureRegistry::config(std::size_t i) const noexcept {
    return i < m_config.size() ? &m_config[i] : nullptr;
}

void SignatureRegistry::clear() {
    m_inputs.clear();
    m_outputs.clear();
}

void SignatureRegistry::clear_config() {
    m_config.clear();
}

Result<void> SignatureRegistry::validate_unique_names() const {
    for (const auto* list : {&m_inputs, &m_outputs, &m_config}) {
        std::unordered_set<std::string> seen;
        for (const auto& def : *list) {
            if (!seen.insert(def.name).second) {
                return grafiek_core::Err(
                    grafiek_core::RegistryError::duplicate_slot_name(def.name, slot_role_name(def.role)));
            }
        }
    }
    return grafiek_core::Ok();
}

std::optional<SlotLookup> SignatureRegistry::find(const std::vector<SlotDef>& list,
                                                  const std::string& name, ValueType type) {
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (list[i].name == name && list[i].value_type == type) {
            return SlotLookup{i, &list[i]};
        }
    }
    return std::nullopt;
}

} // namespace grafiek_engine
