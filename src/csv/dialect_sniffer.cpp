// EN: Dialect sniffer. Delimiter choice scores each candidate by the share of records matching the modal field count.
// FR: Détecteur de dialecte. Le choix du délimiteur note chaque candidat par la part d'enregistrements au nombre de champs modal.

#include "tnorm/csv/dialect_sniffer.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/unicode_text.hpp"

#include <charconv>
#include <map>
#include <optional>
#include <string>

namespace TNORM::CSV {

namespace {

constexpr std::size_t kHeaderProbeRows = 20;

// EN: Shape of a cell for the header vote: an integer, a real number or text of a given length.
// FR: Forme d'une cellule pour le vote d'en-tête : entier, réel ou texte d'une longueur donnée.
struct CellShape {
    enum class Kind { INTEGER, REAL, TEXT } kind;
    std::size_t length = 0;

    bool operator==(const CellShape& other) const {
        return kind == other.kind && (kind != Kind::TEXT || length == other.length);
    }
    bool operator!=(const CellShape& other) const { return !(*this == other); }
};

std::string_view trimSpaces(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

bool parsesAsInteger(std::string_view value) {
    value = trimSpaces(value);
    if (!value.empty() && value.front() == '+') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return false;
    }
    long long parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    return ec == std::errc() && ptr == value.data() + value.size();
}

bool parsesAsReal(std::string_view value) {
    value = trimSpaces(value);
    if (!value.empty() && value.front() == '+') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return false;
    }
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    return ec == std::errc() && ptr == value.data() + value.size();
}

CellShape shapeOf(const std::string& value) {
    if (parsesAsInteger(value)) {
        return {CellShape::Kind::INTEGER, 0};
    }
    if (parsesAsReal(value)) {
        return {CellShape::Kind::REAL, 0};
    }
    return {CellShape::Kind::TEXT, Text::codePointCount(value)};
}

} // namespace

DialectSniffer::DialectSniffer(std::size_t sample_bytes) : sample_bytes_(sample_bytes == 0 ? 4096 : sample_bytes) {}

const std::vector<char>& DialectSniffer::candidateDelimiters() {
    static const std::vector<char> kCandidates = {',', '\t', ';'};
    return kCandidates;
}

std::string_view DialectSniffer::samplePrefix(std::string_view text, std::size_t sample_bytes) {
    if (text.size() <= sample_bytes) {
        return text;
    }

    std::size_t cut = sample_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string_view prefix = text.substr(0, cut);

    const auto last_break = prefix.find_last_of("\r\n");
    if (last_break != std::string_view::npos && last_break > 0) {
        prefix = prefix.substr(0, last_break + 1);
    }
    return prefix;
}

SniffResult DialectSniffer::sniff(std::string_view text) const {
    SniffResult result;
    const std::string_view sample = samplePrefix(text, sample_bytes_);

    char best_delimiter = 0;
    double best_score = 0.0;

    for (char delimiter : candidateDelimiters()) {
        std::map<std::size_t, std::size_t> width_frequency;
        std::size_t records = 0;

        CsvReader reader(sample, delimiter, '"');
        Record record;
        while (reader.next(record)) {
            if (record.empty()) {
                continue;
            }
            ++width_frequency[record.size()];
            ++records;
        }
        if (records < 2) {
            continue;
        }

        std::size_t modal_width = 0;
        std::size_t modal_count = 0;
        for (const auto& [width, count] : width_frequency) {
            if (count > modal_count) {
                modal_width = width;
                modal_count = count;
            }
        }
        if (modal_width < 2) {
            continue;
        }

        const double score = static_cast<double>(modal_count) / static_cast<double>(records);
        if (score > best_score) {
            best_score = score;
            best_delimiter = delimiter;
        }
    }

    if (best_delimiter == 0) {
        LOG_DEBUG("dialect", "No consistent delimiter found, using default dialect");
        return result;
    }

    result.inferred = true;
    result.consistency = best_score;
    result.dialect.delimiter = best_delimiter;
    result.dialect.quote_char = detectQuoteChar(sample, best_delimiter);
    result.dialect.has_header = detectHeader(sample, result.dialect.delimiter, result.dialect.quote_char);
    return result;
}

// EN: Single quotes win only when they wrap more fields than double quotes do.
// FR: Les apostrophes ne l'emportent que si elles entourent plus de champs que les guillemets doubles.
char DialectSniffer::detectQuoteChar(std::string_view sample, char delimiter) {
    std::size_t double_wrapped = 0;
    std::size_t single_wrapped = 0;

    std::size_t line_start = 0;
    while (line_start < sample.size()) {
        std::size_t line_end = sample.find_first_of("\r\n", line_start);
        if (line_end == std::string_view::npos) {
            line_end = sample.size();
        }
        std::string_view line = sample.substr(line_start, line_end - line_start);

        std::size_t field_start = 0;
        while (field_start <= line.size()) {
            std::size_t field_end = line.find(delimiter, field_start);
            if (field_end == std::string_view::npos) {
                field_end = line.size();
            }
            std::string_view field = trimSpaces(line.substr(field_start, field_end - field_start));
            if (field.size() >= 2 && field.front() == field.back()) {
                if (field.front() == '"') ++double_wrapped;
                if (field.front() == '\'') ++single_wrapped;
            }
            field_start = field_end + 1;
        }
        line_start = line_end + 1;
    }

    return single_wrapped > double_wrapped ? '\'' : '"';
}

bool DialectSniffer::detectHeader(std::string_view sample, char delimiter, char quote_char) {
    CsvReader reader(sample, delimiter, quote_char);
    Record header;
    do {
        if (!reader.next(header)) {
            return true;
        }
    } while (header.empty());

    const std::size_t columns = header.size();
    std::vector<std::optional<CellShape>> column_shapes(columns);
    std::vector<bool> consistent(columns, true);

    Record row;
    std::size_t probed = 0;
    while (probed < kHeaderProbeRows && reader.next(row)) {
        if (row.size() != columns) {
            continue;
        }
        ++probed;
        for (std::size_t col = 0; col < columns; ++col) {
            if (!consistent[col]) {
                continue;
            }
            const CellShape shape = shapeOf(row[col]);
            if (!column_shapes[col]) {
                column_shapes[col] = shape;
            } else if (*column_shapes[col] != shape) {
                consistent[col] = false;
            }
        }
    }

    int votes = 0;
    for (std::size_t col = 0; col < columns; ++col) {
        if (!consistent[col] || !column_shapes[col]) {
            continue;
        }
        const CellShape& shape = *column_shapes[col];
        switch (shape.kind) {
            case CellShape::Kind::TEXT:
                votes += Text::codePointCount(header[col]) != shape.length ? 1 : -1;
                break;
            case CellShape::Kind::INTEGER:
                votes += parsesAsInteger(header[col]) ? -1 : 1;
                break;
            case CellShape::Kind::REAL:
                votes += parsesAsReal(header[col]) ? -1 : 1;
                break;
        }
    }

    return votes >= 0;
}

} // namespace TNORM::CSV
