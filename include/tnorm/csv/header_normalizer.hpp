// EN: Header canonicalization (BOM strip, NFKC, trim, whitespace collapse) and rename mapping
// FR: Canonicalisation des en-têtes (retrait BOM, NFKC, trim, réduction des espaces) et renommage

#pragma once

#include <map>
#include <string>
#include <vector>

namespace TNORM::CSV {

using HeaderMap = std::map<std::string, std::string>;

class HeaderNormalizer {
public:
    struct Result {
        std::vector<std::string> normalized;  // EN: Canonical form of each raw cell / FR: Forme canonique de chaque cellule brute
        std::vector<std::string> mapped;      // EN: Names after mapping / FR: Noms après renommage
        std::vector<std::string> warnings;    // EN: Duplicate names, never fatal / FR: Noms dupliqués, jamais fatal
    };

    explicit HeaderNormalizer(HeaderMap header_map = {});

    // EN: Canonical form of one header cell: U+FEFF removed, NFKC, trimmed, whitespace runs collapsed to one space.
    // FR: Forme canonique d'une cellule : U+FEFF retiré, NFKC, trim, suites d'espaces réduites à un espace.
    static std::string canonicalize(const std::string& raw);

    // EN: Lookup order: normalized name, raw name, then a key whose canonical form equals the normalized name.
    // FR: Ordre de recherche : nom normalisé, nom brut, puis une clé dont la forme canonique égale le nom normalisé.
    std::string map(const std::string& raw, const std::string& normalized) const;

    Result normalize(const std::vector<std::string>& raw_cells) const;

    const HeaderMap& headerMap() const { return header_map_; }

private:
    HeaderMap header_map_;
    std::map<std::string, std::string> canonical_keys_;
};

} // namespace TNORM::CSV
