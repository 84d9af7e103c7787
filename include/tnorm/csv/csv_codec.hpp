// EN: Quote-aware CSV record reader and minimal-quoting record formatter over decoded UTF-8 text
// FR: Lecteur d'enregistrements CSV gérant les guillemets et formateur à guillemets minimaux sur du texte UTF-8

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace TNORM::CSV {

using Record = std::vector<std::string>;

// EN: Delimiter, quote character and header presence of a delimited text file.
// FR: Délimiteur, caractère de citation et présence d'en-tête d'un fichier texte délimité.
struct Dialect {
    char delimiter = ',';
    char quote_char = '"';
    bool has_header = true;

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter && quote_char == other.quote_char && has_header == other.has_header;
    }
};

// EN: Pull reader over an in-memory text. A quote opens a quoted field only at the start of a field;
//     doubled quotes inside a quoted field are one literal quote; CR, LF and CRLF end a record outside quotes;
//     a blank line yields an empty record.
// FR: Lecteur à la demande sur un texte en mémoire. Un guillemet n'ouvre un champ cité qu'en début de champ;
//     un guillemet doublé dans un champ cité est un guillemet littéral; CR, LF et CRLF terminent un enregistrement
//     hors guillemets; une ligne vide donne un enregistrement vide.
class CsvReader {
public:
    CsvReader(std::string_view text, char delimiter = ',', char quote_char = '"');

    // EN: Read the next record. Returns false when the text is exhausted.
    // FR: Lit l'enregistrement suivant. Retourne false quand le texte est épuisé.
    bool next(Record& record);

    // EN: 1-based number of the last record returned by next().
    // FR: Numéro (base 1) du dernier enregistrement retourné par next().
    std::size_t recordNumber() const { return record_number_; }

    // EN: True when the text ended inside an open quoted field.
    // FR: Vrai quand le texte s'est terminé dans un champ cité ouvert.
    bool endedInsideQuotes() const { return unterminated_quote_; }

    static std::vector<Record> readAll(std::string_view text, char delimiter = ',', char quote_char = '"');

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    char delimiter_;
    char quote_char_;
    std::size_t record_number_ = 0;
    bool unterminated_quote_ = false;
};

struct WriteOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool quote_all = false;  // EN: Quote every field / FR: Cite chaque champ
};

class CsvWriter {
public:
    // EN: Quote a field when it contains the delimiter, the quote character, CR or LF (or always with quote_all).
    // FR: Cite un champ quand il contient le délimiteur, le guillemet, CR ou LF (ou toujours avec quote_all).
    static std::string escapeField(const std::string& field, const WriteOptions& options = WriteOptions{});

    // EN: Format one record without line terminator. A record made of one empty field is written as "".
    // FR: Formate un enregistrement sans terminaison de ligne. Un enregistrement d'un seul champ vide s'écrit "".
    static std::string formatRow(const Record& record, const WriteOptions& options = WriteOptions{});

    // EN: Format records, each followed by the newline sequence.
    // FR: Formate des enregistrements, chacun suivi de la séquence de fin de ligne.
    static std::string formatRows(const std::vector<Record>& records, std::string_view newline,
                                  const WriteOptions& options = WriteOptions{});
};

} // namespace TNORM::CSV
