// EN: Header canonicalization and rename mapping
// FR: Canonicalisation des en-têtes et renommage

#include "tnorm/csv/header_normalizer.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/unicode_text.hpp"

#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <set>

namespace TNORM::CSV {

HeaderNormalizer::HeaderNormalizer(HeaderMap header_map) : header_map_(std::move(header_map)) {
    // EN: First key wins when two keys share a canonical form.
    // FR: La première clé l'emporte quand deux clés partagent une forme canonique.
    for (const auto& [key, value] : header_map_) {
        canonical_keys_.emplace(canonicalize(key), key);
    }
}

// EN: BOM markers go first so that NFKC never sees them, then whitespace runs collapse to one ASCII space.
// FR: Les marqueurs BOM partent d'abord pour que NFKC ne les voie jamais, puis les suites d'espaces deviennent un espace ASCII.
std::string HeaderNormalizer::canonicalize(const std::string& raw) {
    icu::UnicodeString stripped = icu::UnicodeString::fromUTF8(raw);
    stripped.findAndReplace(icu::UnicodeString(static_cast<UChar32>(0xFEFF)), icu::UnicodeString());
    std::string without_bom;
    stripped.toUTF8String(without_bom);

    const icu::UnicodeString text = icu::UnicodeString::fromUTF8(Text::nfkc(without_bom));

    icu::UnicodeString collapsed;
    bool pending_space = false;
    for (int32_t i = 0; i < text.length();) {
        const UChar32 c = text.char32At(i);
        i += U16_LENGTH(c);
        if (u_isUWhiteSpace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !collapsed.isEmpty()) {
            collapsed.append(static_cast<UChar>(0x20));
        }
        pending_space = false;
        collapsed.append(c);
    }

    std::string out;
    collapsed.toUTF8String(out);
    return out;
}

// EN: Lookup order: normalized name, raw name, then keys whose own canonical form matches.
// FR: Ordre de recherche : nom normalisé, nom brut, puis clés dont la forme canonique correspond.
std::string HeaderNormalizer::map(const std::string& raw, const std::string& normalized) const {
    auto exact = header_map_.find(normalized);
    if (exact != header_map_.end()) {
        return canonicalize(exact->second);
    }

    auto by_raw = header_map_.find(raw);
    if (by_raw != header_map_.end()) {
        return canonicalize(by_raw->second);
    }

    auto by_canonical = canonical_keys_.find(normalized);
    if (by_canonical != canonical_keys_.end()) {
        return canonicalize(header_map_.at(by_canonical->second));
    }

    return normalized;
}

HeaderNormalizer::Result HeaderNormalizer::normalize(const std::vector<std::string>& raw_cells) const {
    Result result;
    result.normalized.reserve(raw_cells.size());
    result.mapped.reserve(raw_cells.size());

    std::set<std::string> seen;
    std::set<std::string> reported;
    for (const auto& raw : raw_cells) {
        std::string normalized = canonicalize(raw);
        std::string mapped = map(raw, normalized);

        if (!seen.insert(mapped).second && reported.insert(mapped).second) {
            result.warnings.push_back("duplicate header after normalization: " + mapped);
            LOG_WARN_META("header", "Duplicate header after normalization", {{"header", mapped}});
        }

        result.normalized.push_back(std::move(normalized));
        result.mapped.push_back(std::move(mapped));
    }
    return result;
}

} // namespace TNORM::CSV
