// EN: Ordered encoding detection chain and newline convention counting
// FR: Chaîne ordonnée de détection d'encodage et comptage de la convention de fin de ligne

#include "tnorm/text/encoding_detector.hpp"
#include "tnorm/text/transcoder.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>

namespace TNORM::Text {

std::string newlineToString(NewlineStyle style) {
    return style == NewlineStyle::CRLF ? "CRLF" : "LF";
}

std::optional<NewlineStyle> parseNewline(const std::string& text) {
    if (text == "\r\n") return NewlineStyle::CRLF;
    if (text == "\n") return NewlineStyle::LF;

    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "CRLF") return NewlineStyle::CRLF;
    if (upper == "LF") return NewlineStyle::LF;
    return std::nullopt;
}

std::string_view newlineSequence(NewlineStyle style) {
    return style == NewlineStyle::CRLF ? std::string_view("\r\n") : std::string_view("\n");
}

EncodingDetector::EncodingDetector(const std::string& legacy_encoding) {
    candidates_.push_back({"utf-8-sig", true});
    candidates_.push_back({"utf-8", true});

    const std::string legacy = Transcoder::canonicalName(legacy_encoding);
    if (legacy != "utf-8" && legacy != "utf-8-sig" && legacy != "latin-1") {
        candidates_.push_back({legacy, true});
    }
    candidates_.push_back({"latin-1", false});
}

bool EncodingDetector::hasUtf8Bom(std::string_view raw) {
    return raw.substr(0, kUtf8Bom.size()) == kUtf8Bom;
}

// EN: First candidate that decodes strictly wins; the permissive latin-1 entry always ends the chain.
// FR: Le premier candidat qui décode strictement l'emporte; l'entrée permissive latin-1 termine toujours la chaîne.
std::string EncodingDetector::detect(std::string_view raw) const {
    for (const auto& candidate : candidates_) {
        if (candidate.encoding == "utf-8-sig") {
            if (hasUtf8Bom(raw)) {
                return candidate.encoding;
            }
            continue;
        }
        if (!candidate.strict || Transcoder::decodeStrict(raw, candidate.encoding)) {
            LOG_DEBUG("encoding", "Detected encoding " + candidate.encoding);
            return candidate.encoding;
        }
    }
    return "latin-1";
}

// EN: CRLF against bare LF; a tie (including no newline at all) gives CRLF.
// FR: CRLF contre LF seul; une égalité (y compris aucune fin de ligne) donne CRLF.
NewlineStyle EncodingDetector::detectNewline(std::string_view raw) {
    std::size_t crlf = 0;
    std::size_t lf = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\n') {
            ++lf;
            if (i > 0 && raw[i - 1] == '\r') {
                ++crlf;
            }
        }
    }
    return crlf >= lf - crlf ? NewlineStyle::CRLF : NewlineStyle::LF;
}

} // namespace TNORM::Text
