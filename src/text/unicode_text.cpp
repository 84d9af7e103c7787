// EN: ICU-backed Unicode helpers shared by header canonicalization and value checks
// FR: Utilitaires Unicode s'appuyant sur ICU, partagés par la canonicalisation des en-têtes et les contrôles de valeurs

#include "tnorm/text/unicode_text.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace TNORM::Text {

namespace {

bool isSpace(UChar32 c) {
    return c >= 0 && u_isUWhiteSpace(c);
}

} // namespace

// EN: Walk code points from both ends; malformed bytes decode as negative values and stop the trim.
// FR: Parcourt les points de code depuis les deux bouts; les octets malformés donnent des valeurs négatives et arrêtent le trim.
std::string trimWhitespace(std::string_view utf8) {
    const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
    const int32_t length = static_cast<int32_t>(utf8.size());

    int32_t begin = 0;
    while (begin < length) {
        int32_t next = begin;
        UChar32 c;
        U8_NEXT(data, next, length, c);
        if (!isSpace(c)) {
            break;
        }
        begin = next;
    }

    int32_t end = length;
    while (end > begin) {
        int32_t previous = end;
        UChar32 c;
        U8_PREV(data, begin, previous, c);
        if (!isSpace(c)) {
            break;
        }
        end = previous;
    }

    return std::string(utf8.substr(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin)));
}

bool isBlank(std::string_view utf8) {
    const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
    const int32_t length = static_cast<int32_t>(utf8.size());
    for (int32_t i = 0; i < length;) {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (!isSpace(c)) {
            return false;
        }
    }
    return true;
}

std::string nfkc(std::string_view utf8) {
    const icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status)) {
        LOG_WARN("text", std::string("NFKC normalizer unavailable: ") + u_errorName(status));
        return std::string(utf8);
    }
    const icu::UnicodeString normalized = normalizer->normalize(text, status);
    if (U_FAILURE(status)) {
        LOG_WARN("text", std::string("NFKC normalization failed: ") + u_errorName(status));
        return std::string(utf8);
    }

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

// EN: Counts lead bytes only; continuation bytes (10xxxxxx) belong to the previous code point.
// FR: Compte uniquement les octets de tête; les octets de continuation (10xxxxxx) appartiennent au point de code précédent.
std::size_t codePointCount(std::string_view utf8) {
    std::size_t count = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace TNORM::Text
