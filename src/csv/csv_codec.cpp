// EN: CSV codec implementation. Field parsing follows the quote state machine of a classic CSV reader.
// FR: Implémentation du codec CSV. L'analyse des champs suit la machine à états de citation d'un lecteur CSV classique.

#include "tnorm/csv/csv_codec.hpp"

namespace TNORM::CSV {

namespace {

enum class FieldState {
    START_FIELD,       // EN: Nothing read for the current field / FR: Rien lu pour le champ courant
    IN_FIELD,          // EN: Inside an unquoted field / FR: Dans un champ non cité
    IN_QUOTED_FIELD,   // EN: Inside a quoted field / FR: Dans un champ cité
    QUOTE_IN_QUOTED    // EN: Quote seen inside a quoted field / FR: Guillemet vu dans un champ cité
};

} // namespace

CsvReader::CsvReader(std::string_view text, char delimiter, char quote_char)
    : text_(text), delimiter_(delimiter), quote_char_(quote_char) {}

bool CsvReader::next(Record& record) {
    record.clear();
    if (pos_ >= text_.size()) {
        return false;
    }

    std::string field;
    FieldState state = FieldState::START_FIELD;
    bool saw_content = false;

    while (pos_ < text_.size()) {
        const char c = text_[pos_];

        if (state == FieldState::IN_QUOTED_FIELD) {
            if (c == quote_char_) {
                state = FieldState::QUOTE_IN_QUOTED;
            } else {
                field += c;
            }
            ++pos_;
            continue;
        }

        if (state == FieldState::QUOTE_IN_QUOTED && c == quote_char_) {
            // EN: Doubled quote inside a quoted field
            // FR: Guillemet doublé dans un champ cité
            field += c;
            state = FieldState::IN_QUOTED_FIELD;
            ++pos_;
            continue;
        }

        if (c == '\r' || c == '\n') {
            ++pos_;
            if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') {
                ++pos_;
            }
            if (saw_content) {
                record.push_back(std::move(field));
            }
            ++record_number_;
            return true;
        }

        saw_content = true;

        if (c == delimiter_) {
            record.push_back(std::move(field));
            field.clear();
            state = FieldState::START_FIELD;
        } else if (c == quote_char_ && state == FieldState::START_FIELD) {
            state = FieldState::IN_QUOTED_FIELD;
        } else {
            // EN: Characters after a closing quote are kept, as are quotes in the middle of an unquoted field.
            // FR: Les caractères après un guillemet fermant sont conservés, comme les guillemets au milieu d'un champ non cité.
            field += c;
            state = FieldState::IN_FIELD;
        }
        ++pos_;
    }

    if (state == FieldState::IN_QUOTED_FIELD) {
        unterminated_quote_ = true;
    }
    if (saw_content) {
        record.push_back(std::move(field));
    }
    ++record_number_;
    return true;
}

std::vector<Record> CsvReader::readAll(std::string_view text, char delimiter, char quote_char) {
    std::vector<Record> records;
    CsvReader reader(text, delimiter, quote_char);
    Record record;
    while (reader.next(record)) {
        records.push_back(record);
    }
    return records;
}

std::string CsvWriter::escapeField(const std::string& field, const WriteOptions& options) {
    const bool needs_quoting = options.quote_all ||
                               field.find(options.delimiter) != std::string::npos ||
                               field.find(options.quote_char) != std::string::npos ||
                               field.find('\n') != std::string::npos ||
                               field.find('\r') != std::string::npos;

    if (!needs_quoting) {
        return field;
    }

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped += options.quote_char;
    for (char c : field) {
        if (c == options.quote_char) {
            escaped += options.quote_char;
        }
        escaped += c;
    }
    escaped += options.quote_char;
    return escaped;
}

std::string CsvWriter::formatRow(const Record& record, const WriteOptions& options) {
    if (record.size() == 1 && record.front().empty()) {
        return std::string(2, options.quote_char);
    }

    std::string line;
    for (std::size_t i = 0; i < record.size(); ++i) {
        if (i > 0) {
            line += options.delimiter;
        }
        line += escapeField(record[i], options);
    }
    return line;
}

std::string CsvWriter::formatRows(const std::vector<Record>& records, std::string_view newline,
                                  const WriteOptions& options) {
    std::string out;
    for (const auto& record : records) {
        out += formatRow(record, options);
        out += newline;
    }
    return out;
}

} // namespace TNORM::CSV
