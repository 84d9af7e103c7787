// EN: iconv based conversion between raw bytes and UTF-8 with strict and replacing modes
// FR: Conversion iconv entre octets bruts et UTF-8 avec modes strict et remplacement

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace TNORM::Text {

// EN: UTF-8 byte order mark.
// FR: Marque d'ordre d'octets UTF-8.
inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

struct DecodeResult {
    std::string text;          // EN: UTF-8 text / FR: Texte UTF-8
    std::size_t replacements = 0;  // EN: Undecodable bytes turned into U+FFFD / FR: Octets non décodables remplacés par U+FFFD
};

struct EncodeResult {
    std::string bytes;         // EN: Encoded bytes (BOM included for utf-8-sig) / FR: Octets encodés (BOM inclus pour utf-8-sig)
    std::size_t replacements = 0;  // EN: Unrepresentable characters turned into '?' / FR: Caractères non représentables remplacés par '?'
};

class Transcoder {
public:
    // EN: Canonical lowercase name ("utf-8-sig", "utf-8", "cp932", "latin-1", ...). Throws EngineError(INVALID_ARGUMENT)
    //     when iconv does not know the encoding.
    // FR: Nom canonique en minuscules. Lance EngineError(INVALID_ARGUMENT) si iconv ne connaît pas l'encodage.
    static std::string canonicalName(const std::string& encoding);

    static bool isSupported(const std::string& encoding);

    // EN: Decode the whole buffer or return nullopt at the first invalid sequence. "utf-8-sig" skips a leading BOM.
    // FR: Décode tout le tampon ou retourne nullopt à la première séquence invalide. "utf-8-sig" ignore un BOM initial.
    static std::optional<std::string> decodeStrict(std::string_view bytes, const std::string& encoding);

    // EN: Decode, replacing each undecodable byte with U+FFFD.
    // FR: Décode en remplaçant chaque octet non décodable par U+FFFD.
    static DecodeResult decodePermissive(std::string_view bytes, const std::string& encoding);

    // EN: Encode UTF-8 text, replacing each unrepresentable character with '?'. "utf-8-sig" prepends the BOM.
    // FR: Encode un texte UTF-8 en remplaçant chaque caractère non représentable par '?'. "utf-8-sig" ajoute le BOM.
    static EncodeResult encode(std::string_view utf8, const std::string& encoding);

private:
    static std::string iconvName(const std::string& canonical);
};

} // namespace TNORM::Text
