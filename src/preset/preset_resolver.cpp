// EN: Three-tier merge of defaults, preset and caller overrides
// FR: Fusion à trois niveaux des défauts, du preset et des surcharges appelant

#include "tnorm/preset/preset_resolver.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/transcoder.hpp"

namespace TNORM::Preset {

std::string valueSourceToString(ValueSource source) {
    switch (source) {
        case ValueSource::DEFAULT: return "default";
        case ValueSource::PRESET:  return "preset";
        case ValueSource::CALLER:  return "caller";
        default:                   return "unknown";
    }
}

bool EffectiveConfig::operator==(const EffectiveConfig& other) const {
    return preset_name == other.preset_name && header_map == other.header_map &&
           required_headers == other.required_headers && order == other.order &&
           trim_whitespace == other.trim_whitespace && drop_empty_rows == other.drop_empty_rows &&
           encoding_in == other.encoding_in && encoding_out == other.encoding_out &&
           newline_out == other.newline_out && validate == other.validate &&
           on_missing_order_column == other.on_missing_order_column;
}

namespace {

std::optional<Text::NewlineStyle> newlineOf(const std::optional<std::string>& text) {
    if (!text) {
        return std::nullopt;
    }
    auto style = Text::parseNewline(*text);
    if (!style) {
        throw InvalidArgumentError("Invalid newline_out: " + *text + " (expected CRLF or LF)");
    }
    return style;
}

std::optional<std::string> encodingOf(const std::optional<std::string>& text, bool allow_auto) {
    if (!text) {
        return std::nullopt;
    }
    if (allow_auto && *text == "auto") {
        return text;
    }
    return Text::Transcoder::canonicalName(*text);
}

} // namespace

PresetResolver::PresetResolver(const PresetStore& store) : store_(store) {}

EffectiveConfig PresetResolver::resolve(const std::optional<std::string>& preset_name,
                                        const PresetFields& overrides) const {
    std::optional<Preset> preset;
    if (preset_name && !preset_name->empty()) {
        preset = store_.load(*preset_name);
    }
    return merge(preset, overrides);
}

// EN: Pure function of its inputs, so resolving twice yields equal configs.
// FR: Fonction pure de ses entrées : deux résolutions donnent des configurations égales.
EffectiveConfig PresetResolver::merge(const std::optional<Preset>& preset, const PresetFields& overrides) {
    static const PresetFields kNoPreset;
    const PresetFields& from_preset = preset ? preset->fields : kNoPreset;

    EffectiveConfig config;
    if (preset) {
        config.preset_name = preset->name;
    }

    // EN: header_map is a union; caller entries win on collision.
    // FR: header_map est une union; les entrées appelant l'emportent en cas de collision.
    if (from_preset.header_map && !from_preset.header_map->empty()) {
        config.header_map.value = *from_preset.header_map;
        config.header_map.source = ValueSource::PRESET;
    }
    if (overrides.header_map && !overrides.header_map->empty()) {
        for (const auto& [key, value] : *overrides.header_map) {
            config.header_map.value[key] = value;
        }
        config.header_map.source = ValueSource::CALLER;
    }

    config.required_headers.apply(from_preset.required_headers, overrides.required_headers);
    config.order.apply(from_preset.order, overrides.order);
    config.trim_whitespace.apply(from_preset.trim_whitespace, overrides.trim_whitespace);
    config.drop_empty_rows.apply(from_preset.drop_empty_rows, overrides.drop_empty_rows);
    config.encoding_in.apply(encodingOf(from_preset.encoding_in, true), encodingOf(overrides.encoding_in, true));
    config.encoding_out.apply(encodingOf(from_preset.encoding_out, false), encodingOf(overrides.encoding_out, false));
    config.newline_out.apply(newlineOf(from_preset.newline_out), newlineOf(overrides.newline_out));
    config.validate.apply(from_preset.validate, overrides.validate);
    config.on_missing_order_column.apply(from_preset.on_missing_order_column, overrides.on_missing_order_column);

    if (config.validate.value.empty_forbidden_columns.empty()) {
        config.validate.value.empty_forbidden_columns = config.required_headers.value;
    }

    LOG_DEBUG_META("preset", "Effective configuration resolved",
                   {{"preset", config.preset_name.value_or("")},
                    {"encoding_out", config.encoding_out.value},
                    {"newline_out", Text::newlineToString(config.newline_out.value)}});
    return config;
}

} // namespace TNORM::Preset
