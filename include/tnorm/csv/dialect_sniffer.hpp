// EN: Delimiter, quote character and header presence inference from a bounded text prefix
// FR: Inférence du délimiteur, du guillemet et de la présence d'en-tête depuis un préfixe borné du texte

#pragma once

#include "tnorm/csv/csv_codec.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace TNORM::CSV {

// EN: Outcome of a sniff. inferred is false when the default dialect was returned.
// FR: Résultat d'une détection. inferred vaut false quand le dialecte par défaut a été retourné.
struct SniffResult {
    Dialect dialect;
    bool inferred = false;
    double consistency = 0.0;  // EN: Fraction of sample records with the modal field count / FR: Fraction d'enregistrements au nombre de champs modal
};

class DialectSniffer {
public:
    explicit DialectSniffer(std::size_t sample_bytes = 4096);

    // EN: Candidates tried in order: comma, tab, semicolon. Falls back to comma, double quote, header present.
    // FR: Candidats essayés dans l'ordre : virgule, tabulation, point-virgule. Repli : virgule, guillemet double, en-tête.
    SniffResult sniff(std::string_view text) const;

    // EN: Per-column vote between the first record and up to 20 following records of the same width.
    //     A negative total means no header.
    // FR: Vote par colonne entre le premier enregistrement et jusqu'à 20 suivants de même largeur.
    //     Un total négatif signifie pas d'en-tête.
    static bool detectHeader(std::string_view sample, char delimiter, char quote_char);

    // EN: First sample_bytes of the text, cut on a UTF-8 boundary and, when truncated, after the last line break.
    // FR: Premiers sample_bytes du texte, coupés sur une frontière UTF-8 et, si tronqué, après le dernier saut de ligne.
    static std::string_view samplePrefix(std::string_view text, std::size_t sample_bytes);

    static const std::vector<char>& candidateDelimiters();

private:
    std::size_t sample_bytes_;

    static char detectQuoteChar(std::string_view sample, char delimiter);
};

} // namespace TNORM::CSV
