// EN: Preset resolution - merges built-in defaults, a named preset and caller overrides into an EffectiveConfig
// FR: Résolution de preset - fusionne défauts intégrés, preset nommé et surcharges appelant en EffectiveConfig

#pragma once

#include "tnorm/preset/preset.hpp"
#include "tnorm/preset/preset_store.hpp"
#include "tnorm/text/encoding_detector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace TNORM::Preset {

// EN: Tier a resolved field came from
// FR: Niveau d'origine d'un champ résolu
enum class ValueSource {
    DEFAULT,  // EN: Built-in default / FR: Défaut intégré
    PRESET,   // EN: Named preset / FR: Preset nommé
    CALLER    // EN: Explicit caller value / FR: Valeur explicite de l'appelant
};

std::string valueSourceToString(ValueSource source);

// EN: Three-tier setting: a resolved value and the tier it came from
// FR: Paramètre à trois niveaux : une valeur résolue et le niveau dont elle provient
template<typename T>
struct Setting {
    T value{};
    ValueSource source{ValueSource::DEFAULT};

    // EN: Caller value beats preset value beats the current (default) value.
    // FR: La valeur appelant l'emporte sur le preset, qui l'emporte sur la valeur courante (défaut).
    void apply(const std::optional<T>& preset_value, const std::optional<T>& caller_value) {
        if (caller_value) {
            value = *caller_value;
            source = ValueSource::CALLER;
        } else if (preset_value) {
            value = *preset_value;
            source = ValueSource::PRESET;
        }
    }

    bool operator==(const Setting& other) const { return value == other.value && source == other.source; }
};

struct EffectiveConfig {
    std::optional<std::string> preset_name;
    Setting<CSV::HeaderMap> header_map;
    Setting<std::vector<std::string>> required_headers;
    Setting<std::vector<std::string>> order;
    Setting<bool> trim_whitespace{true, ValueSource::DEFAULT};
    Setting<bool> drop_empty_rows{true, ValueSource::DEFAULT};
    Setting<std::string> encoding_in{"auto", ValueSource::DEFAULT};
    Setting<std::string> encoding_out{"utf-8-sig", ValueSource::DEFAULT};
    Setting<Text::NewlineStyle> newline_out{Text::NewlineStyle::CRLF, ValueSource::DEFAULT};
    Setting<CSV::ValidationRules> validate;
    Setting<MissingColumnPolicy> on_missing_order_column{MissingColumnPolicy::FILL, ValueSource::DEFAULT};

    bool operator==(const EffectiveConfig& other) const;
};

class PresetResolver {
public:
    explicit PresetResolver(const PresetStore& store);

    // EN: Resolve preset (optional) and overrides. Deterministic, no side effects besides reading the preset file.
    //     Throws PresetNotFoundError, PresetLoadError, InvalidArgumentError (bad newline, encoding).
    // FR: Résout le preset (optionnel) et les surcharges. Déterministe, sans effet de bord hors lecture du preset.
    //     Lance PresetNotFoundError, PresetLoadError, InvalidArgumentError (fin de ligne, encodage invalides).
    EffectiveConfig resolve(const std::optional<std::string>& preset_name, const PresetFields& overrides) const;

    // EN: Merge an already loaded preset with overrides.
    // FR: Fusionne un preset déjà chargé avec les surcharges.
    static EffectiveConfig merge(const std::optional<Preset>& preset, const PresetFields& overrides);

private:
    const PresetStore& store_;
};

} // namespace TNORM::Preset
