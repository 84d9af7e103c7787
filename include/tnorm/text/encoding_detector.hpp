// EN: Encoding and newline detection through an explicit ordered chain of candidate encodings
// FR: Détection d'encodage et de fin de ligne via une chaîne ordonnée explicite d'encodages candidats

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TNORM::Text {

enum class NewlineStyle {
    CRLF,
    LF
};

std::string newlineToString(NewlineStyle style);

// EN: Accepts "CRLF", "LF", "\r\n" and "\n" (case-insensitive names).
// FR: Accepte "CRLF", "LF", "\r\n" et "\n" (noms insensibles à la casse).
std::optional<NewlineStyle> parseNewline(const std::string& text);

std::string_view newlineSequence(NewlineStyle style);

class EncodingDetector {
public:
    // EN: One link of the fallback chain. A strict candidate must decode the whole buffer without error.
    // FR: Un maillon de la chaîne de repli. Un candidat strict doit décoder tout le tampon sans erreur.
    struct Candidate {
        std::string encoding;
        bool strict;
    };

    // EN: Chain: utf-8-sig (BOM), utf-8 (strict), legacy code page (strict), latin-1 (permissive).
    // FR: Chaîne : utf-8-sig (BOM), utf-8 (strict), page de code héritée (stricte), latin-1 (permissif).
    explicit EncodingDetector(const std::string& legacy_encoding = "cp932");

    std::string detect(std::string_view raw) const;

    const std::vector<Candidate>& candidates() const { return candidates_; }

    // EN: CRLF when CR-LF pairs are at least as many as bare LF characters.
    // FR: CRLF quand les paires CR-LF sont au moins aussi nombreuses que les LF isolés.
    static NewlineStyle detectNewline(std::string_view raw);

    static bool hasUtf8Bom(std::string_view raw);

private:
    std::vector<Candidate> candidates_;
};

} // namespace TNORM::Text
