// EN: UTF-8 helpers backed by ICU character properties
// FR: Utilitaires UTF-8 s'appuyant sur les propriétés de caractères ICU

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace TNORM::Text {

// EN: Strip leading and trailing Unicode white space (U+3000 included).
// FR: Retire les espaces Unicode en tête et en fin (U+3000 compris).
std::string trimWhitespace(std::string_view utf8);

// EN: True when the text is empty or only Unicode white space.
// FR: Vrai quand le texte est vide ou uniquement composé d'espaces Unicode.
bool isBlank(std::string_view utf8);

// EN: Unicode compatibility normalization (full-width digits and letters fold to ASCII). The input is
//     returned unchanged if ICU reports an error.
// FR: Normalisation de compatibilité Unicode (chiffres et lettres pleine chasse ramenés en ASCII). L'entrée
//     est renvoyée inchangée si ICU signale une erreur.
std::string nfkc(std::string_view utf8);

std::size_t codePointCount(std::string_view utf8);

} // namespace TNORM::Text
