// EN: Preset files are parsed with yaml-cpp; JSON presets load through the same parser.
// FR: Les fichiers preset sont analysés avec yaml-cpp; les presets JSON passent par le même analyseur.

#include "tnorm/preset/preset_store.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace TNORM::Preset {

std::string missingColumnPolicyToString(MissingColumnPolicy policy) {
    return policy == MissingColumnPolicy::ERROR ? "error" : "fill";
}

std::optional<MissingColumnPolicy> parseMissingColumnPolicy(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "fill") return MissingColumnPolicy::FILL;
    if (lower == "error") return MissingColumnPolicy::ERROR;
    return std::nullopt;
}

namespace {

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key) {
    if (node.IsNull()) {
        return {};
    }
    if (node.IsScalar()) {
        return {node.as<std::string>()};
    }
    if (!node.IsSequence()) {
        throw YAML::RepresentationException(node.Mark(), key + " must be a list of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::map<std::string, std::string> readStringMap(const YAML::Node& node, const std::string& key) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        throw YAML::RepresentationException(node.Mark(), key + " must be a map of strings");
    }
    std::map<std::string, std::string> values;
    for (const auto& item : node) {
        values[item.first.as<std::string>()] = item.second.as<std::string>();
    }
    return values;
}

CSV::ValidationRules readRules(const YAML::Node& node) {
    CSV::ValidationRules rules;
    if (node.IsNull()) {
        return rules;
    }
    if (!node.IsMap()) {
        throw YAML::RepresentationException(node.Mark(), "validate must be a map");
    }
    if (node["numeric_columns"]) rules.numeric_columns = readStringList(node["numeric_columns"], "numeric_columns");
    if (node["integer_columns"]) rules.integer_columns = readStringList(node["integer_columns"], "integer_columns");
    if (node["nonnegative_columns"]) {
        rules.nonnegative_columns = readStringList(node["nonnegative_columns"], "nonnegative_columns");
    }
    if (node["unique_columns"]) rules.unique_columns = readStringList(node["unique_columns"], "unique_columns");
    if (node["empty_forbidden_columns"]) {
        rules.empty_forbidden_columns = readStringList(node["empty_forbidden_columns"], "empty_forbidden_columns");
    }
    // EN: "patterns" is the historical key, "pattern_columns" the current one.
    // FR: "patterns" est la clé historique, "pattern_columns" la clé actuelle.
    if (node["patterns"]) rules.pattern_columns = readStringMap(node["patterns"], "patterns");
    if (node["pattern_columns"]) rules.pattern_columns = readStringMap(node["pattern_columns"], "pattern_columns");
    return rules;
}

bool isValidName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\:") == std::string::npos && name.find("..") == std::string::npos;
}

} // namespace

PresetStore::PresetStore(fs::path directory) : directory_(std::move(directory)) {}

const std::vector<std::string>& PresetStore::extensions() {
    static const std::vector<std::string> kExtensions = {".yaml", ".yml", ".json"};
    return kExtensions;
}

Preset PresetStore::load(const std::string& name) const {
    if (!isValidName(name)) {
        throw InvalidArgumentError("Invalid preset name: " + name);
    }

    for (const auto& extension : extensions()) {
        const fs::path candidate = directory_ / (name + extension);
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }

        try {
            Preset preset = fromNode(name, YAML::LoadFile(candidate.string()));
            preset.source = candidate;
            LOG_DEBUG_META("preset", "Preset loaded", {{"preset", name}, {"path", candidate.string()}});
            return preset;
        } catch (const YAML::Exception& e) {
            LOG_ERROR_META("preset", "Preset load failed", {{"preset", name}, {"error", e.what()}});
            throw PresetLoadError(name, e.what());
        }
    }

    throw PresetNotFoundError(name);
}

Preset PresetStore::parse(const std::string& name, const std::string& document) {
    try {
        return fromNode(name, YAML::Load(document));
    } catch (const YAML::Exception& e) {
        throw PresetLoadError(name, e.what());
    }
}

Preset PresetStore::fromNode(const std::string& name, const YAML::Node& root) {
    Preset preset;
    preset.name = name;

    if (root.IsNull()) {
        return preset;
    }
    if (!root.IsMap()) {
        throw YAML::RepresentationException(root.Mark(), "preset document must be a map");
    }

    PresetFields& fields = preset.fields;
    if (root["header_map"]) fields.header_map = readStringMap(root["header_map"], "header_map");
    if (root["required_headers"]) fields.required_headers = readStringList(root["required_headers"], "required_headers");
    if (root["order"]) fields.order = readStringList(root["order"], "order");
    if (root["trim_whitespace"]) fields.trim_whitespace = root["trim_whitespace"].as<bool>();
    if (root["drop_empty_rows"]) fields.drop_empty_rows = root["drop_empty_rows"].as<bool>();
    if (root["encoding_in"]) fields.encoding_in = root["encoding_in"].as<std::string>();
    if (root["encoding_out"]) fields.encoding_out = root["encoding_out"].as<std::string>();
    if (root["newline_out"]) fields.newline_out = root["newline_out"].as<std::string>();
    if (root["validate"]) fields.validate = readRules(root["validate"]);
    if (root["on_missing_order_column"]) {
        const std::string policy = root["on_missing_order_column"].as<std::string>();
        fields.on_missing_order_column = parseMissingColumnPolicy(policy);
        if (!fields.on_missing_order_column) {
            throw YAML::RepresentationException(root["on_missing_order_column"].Mark(),
                                                "on_missing_order_column must be fill or error, got " + policy);
        }
    }
    return preset;
}

std::vector<std::string> PresetStore::list() const {
    std::set<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return {};
    }

    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string extension = it->path().extension().string();
        if (std::find(extensions().begin(), extensions().end(), extension) != extensions().end()) {
            names.insert(it->path().stem().string());
        }
    }
    if (ec) {
        LOG_WARN_META("preset", "Preset directory listing incomplete", {{"error", ec.message()}});
    }
    return {names.begin(), names.end()};
}

} // namespace TNORM::Preset
