// EN: Read-only store of preset files (<name>.yaml, <name>.yml or <name>.json) under one directory
// FR: Magasin en lecture seule de fichiers preset (<nom>.yaml, <nom>.yml ou <nom>.json) dans un répertoire

#pragma once

#include "tnorm/preset/preset.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace TNORM::Preset {

class PresetStore {
public:
    explicit PresetStore(std::filesystem::path directory);

    // EN: Load a preset by name. Throws PresetNotFoundError, PresetLoadError or InvalidArgumentError (bad name).
    // FR: Charge un preset par nom. Lance PresetNotFoundError, PresetLoadError ou InvalidArgumentError (nom invalide).
    Preset load(const std::string& name) const;

    // EN: Parse a preset document from text (YAML or JSON).
    // FR: Analyse un document preset depuis du texte (YAML ou JSON).
    static Preset parse(const std::string& name, const std::string& document);

    // EN: Sorted preset names available in the directory.
    // FR: Noms de presets disponibles dans le répertoire, triés.
    std::vector<std::string> list() const;

    const std::filesystem::path& directory() const { return directory_; }

    static const std::vector<std::string>& extensions();

private:
    std::filesystem::path directory_;

    static Preset fromNode(const std::string& name, const YAML::Node& root);
};

} // namespace TNORM::Preset
