// EN: Transcoder implementation over POSIX iconv, adapted from the GNU libc iconv conversion loop.
// FR: Implémentation du Transcoder sur iconv POSIX, adaptée de la boucle de conversion iconv de la GNU libc.

#include "tnorm/text/transcoder.hpp"
#include "tnorm/core/errors.hpp"

#include <iconv.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <unordered_map>

namespace TNORM::Text {

namespace {

constexpr std::size_t kChunkSize = 4096;
constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

enum class InvalidPolicy {
    FAIL,            // EN: Abort on the first invalid sequence / FR: Abandonne à la première séquence invalide
    REPLACE_BYTE,    // EN: Emit U+FFFD and skip one input byte / FR: Émet U+FFFD et saute un octet
    REPLACE_CHAR     // EN: Emit '?' and skip one UTF-8 character / FR: Émet '?' et saute un caractère UTF-8
};

// EN: RAII owner of an iconv conversion descriptor.
// FR: Propriétaire RAII d'un descripteur de conversion iconv.
class IconvHandle {
public:
    IconvHandle(const std::string& to, const std::string& from)
        : cd_(iconv_open(to.c_str(), from.c_str())) {
        if (cd_ == reinterpret_cast<iconv_t>(-1)) {
            throw EngineError(ErrorCode::INVALID_ARGUMENT, "Can't convert from " + from + " to " + to);
        }
    }
    ~IconvHandle() { iconv_close(cd_); }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

std::size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// EN: Run the whole input through iconv. Returns false only under InvalidPolicy::FAIL.
// FR: Passe toute l'entrée dans iconv. Retourne false uniquement avec InvalidPolicy::FAIL.
bool convert(const IconvHandle& handle, std::string_view input, InvalidPolicy policy,
             std::string& out, std::size_t& replacements) {
    char* in_ptr = const_cast<char*>(input.data());
    std::size_t in_left = input.size();
    char buffer[kChunkSize];

    while (in_left > 0) {
        char* out_ptr = buffer;
        std::size_t out_left = sizeof(buffer);
        const std::size_t rc = iconv(handle.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buffer, static_cast<std::size_t>(out_ptr - buffer));

        if (rc != static_cast<std::size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            continue;
        }
        if (errno != EILSEQ && errno != EINVAL) {
            throw EngineError(ErrorCode::READ_FAILURE, std::string("iconv failed: ") + std::strerror(errno));
        }

        // EN: EILSEQ is an invalid sequence, EINVAL a truncated one at the end of input.
        // FR: EILSEQ est une séquence invalide, EINVAL une séquence tronquée en fin d'entrée.
        if (policy == InvalidPolicy::FAIL) {
            return false;
        }

        std::size_t skip = 1;
        if (policy == InvalidPolicy::REPLACE_BYTE) {
            out.append(kReplacementChar);
        } else {
            out.push_back('?');
            skip = std::min(utf8SequenceLength(static_cast<unsigned char>(*in_ptr)), in_left);
        }
        ++replacements;
        in_ptr += skip;
        in_left -= skip;
        iconv(handle.get(), nullptr, nullptr, nullptr, nullptr);
    }

    // EN: Emit the shift sequence back to the initial state for stateful encodings.
    // FR: Émet la séquence de retour à l'état initial pour les encodages à état.
    char* out_ptr = buffer;
    std::size_t out_left = sizeof(buffer);
    iconv(handle.get(), nullptr, nullptr, &out_ptr, &out_left);
    out.append(buffer, static_cast<std::size_t>(out_ptr - buffer));
    return true;
}

std::string lowerDashed(const std::string& encoding) {
    std::string name;
    name.reserve(encoding.size());
    for (unsigned char c : encoding) {
        if (std::isspace(c)) {
            continue;
        }
        name.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(c)));
    }
    return name;
}

bool isUtf8Sig(const std::string& canonical) {
    return canonical == "utf-8-sig";
}

} // namespace

std::string Transcoder::canonicalName(const std::string& encoding) {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"utf8", "utf-8"},
        {"utf-8", "utf-8"},
        {"utf8-sig", "utf-8-sig"},
        {"utf-8-sig", "utf-8-sig"},
        {"cp932", "cp932"},
        {"ms932", "cp932"},
        {"windows-31j", "cp932"},
        {"shift-jis", "cp932"},
        {"shiftjis", "cp932"},
        {"sjis", "cp932"},
        {"latin-1", "latin-1"},
        {"latin1", "latin-1"},
        {"iso-8859-1", "latin-1"},
        {"iso8859-1", "latin-1"},
        {"cp1252", "cp1252"},
        {"windows-1252", "cp1252"},
    };

    const std::string key = lowerDashed(encoding);
    if (key.empty()) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "Empty encoding name");
    }
    auto it = kAliases.find(key);
    if (it != kAliases.end()) {
        return it->second;
    }

    // EN: Anything else must be an encoding iconv knows.
    // FR: Tout autre nom doit être un encodage connu d'iconv.
    IconvHandle probe("UTF-8", iconvName(key));
    return key;
}

bool Transcoder::isSupported(const std::string& encoding) {
    try {
        const std::string canonical = canonicalName(encoding);
        IconvHandle probe("UTF-8", iconvName(canonical));
        return true;
    } catch (const EngineError&) {
        return false;
    }
}

std::string Transcoder::iconvName(const std::string& canonical) {
    if (canonical == "utf-8" || canonical == "utf-8-sig") return "UTF-8";
    if (canonical == "cp932") return "CP932";
    if (canonical == "latin-1") return "ISO-8859-1";
    if (canonical == "cp1252") return "CP1252";
    std::string upper = canonical;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::optional<std::string> Transcoder::decodeStrict(std::string_view bytes, const std::string& encoding) {
    const std::string canonical = canonicalName(encoding);
    if (isUtf8Sig(canonical) && bytes.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        bytes.remove_prefix(kUtf8Bom.size());
    }

    IconvHandle handle("UTF-8", iconvName(canonical));
    std::string out;
    out.reserve(bytes.size());
    std::size_t replacements = 0;
    if (!convert(handle, bytes, InvalidPolicy::FAIL, out, replacements)) {
        return std::nullopt;
    }
    return out;
}

DecodeResult Transcoder::decodePermissive(std::string_view bytes, const std::string& encoding) {
    const std::string canonical = canonicalName(encoding);
    if (isUtf8Sig(canonical) && bytes.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        bytes.remove_prefix(kUtf8Bom.size());
    }

    IconvHandle handle("UTF-8", iconvName(canonical));
    DecodeResult result;
    result.text.reserve(bytes.size());
    convert(handle, bytes, InvalidPolicy::REPLACE_BYTE, result.text, result.replacements);
    return result;
}

EncodeResult Transcoder::encode(std::string_view utf8, const std::string& encoding) {
    const std::string canonical = canonicalName(encoding);

    EncodeResult result;
    result.bytes.reserve(utf8.size() + kUtf8Bom.size());
    if (isUtf8Sig(canonical)) {
        result.bytes.append(kUtf8Bom);
    }

    IconvHandle handle(iconvName(canonical), "UTF-8");
    convert(handle, utf8, InvalidPolicy::REPLACE_CHAR, result.bytes, result.replacements);
    return result;
}

} // namespace TNORM::Text
