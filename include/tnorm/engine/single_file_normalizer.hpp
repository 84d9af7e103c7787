// EN: Single-file normalization pipeline driven by an explicit state machine
// FR: Pipeline de normalisation d'un fichier piloté par une machine à états explicite

#pragma once

#include "tnorm/core/engine_settings.hpp"
#include "tnorm/engine/normalize_report.hpp"
#include "tnorm/fs/atomic_file_writer.hpp"
#include "tnorm/fs/path_guard.hpp"
#include "tnorm/preset/preset_resolver.hpp"
#include "tnorm/preset/preset_store.hpp"

#include <functional>
#include <string>

namespace TNORM::Engine {

// EN: Pipeline states. FAILED is reachable from every non-terminal state.
// FR: États du pipeline. FAILED est atteignable depuis tout état non terminal.
enum class NormalizeState {
    START,
    DETECTED,                  // EN: Encoding and newline known / FR: Encodage et fin de ligne connus
    SNIFFED,                   // EN: Dialect known / FR: Dialecte connu
    HEADER_RESOLVED,           // EN: Headers normalized and mapped / FR: En-têtes normalisés et renommés
    REQUIRED_HEADERS_CHECKED,  // EN: Required headers present / FR: En-têtes requis présents
    STREAMING,                 // EN: Rows flowing to the output buffer / FR: Lignes envoyées au tampon de sortie
    WRITTEN,                   // EN: Output committed / FR: Sortie validée
    REPORT_WRITTEN,            // EN: Issue report committed / FR: Rapport d'anomalies validé
    DONE,
    FAILED
};

std::string normalizeStateToString(NormalizeState state);

class SingleFileNormalizer {
public:
    using StateObserver = std::function<void(NormalizeState)>;

    SingleFileNormalizer(const EngineSettings& settings, const FS::PathGuard& guard,
                         const Preset::PresetStore& presets, const FS::AtomicFileWriter& writer);

    // EN: Run the pipeline for one input/output pair. Throws EngineError subclasses; validation issues are never thrown.
    // FR: Exécute le pipeline pour une paire entrée/sortie. Lance des sous-classes d'EngineError; les anomalies ne sont jamais lancées.
    NormalizeReport run(const NormalizeRequest& request) const;

    // EN: Run with an already resolved configuration (used by the bulk orchestrator).
    // FR: Exécute avec une configuration déjà résolue (utilisé par l'orchestrateur de masse).
    NormalizeReport run(const NormalizeRequest& request, const Preset::EffectiveConfig& config) const;

    void setStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    // EN: Render issues as the row,column,rule,value,message CSV (UTF-8 text, no BOM).
    // FR: Produit les anomalies au format CSV row,column,rule,value,message (texte UTF-8, sans BOM).
    static std::string renderIssueReport(const std::vector<CSV::Issue>& issues, Text::NewlineStyle newline);

private:
    const EngineSettings& settings_;
    const FS::PathGuard& guard_;
    const Preset::PresetStore& presets_;
    const FS::AtomicFileWriter& writer_;
    StateObserver observer_;

    void transition(NormalizeState& current, NormalizeState next) const;
};

} // namespace TNORM::Engine
