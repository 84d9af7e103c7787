// EN: Streaming row validator - declarative per-column rules, unique tracking and (row, column) ordered issues
// FR: Validateur de lignes en flux - règles déclaratives par colonne, suivi d'unicité et anomalies triées par (ligne, colonne)

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace TNORM::CSV {

// EN: Declarative validation rule set, keyed by output column name
// FR: Jeu de règles de validation déclaratif, indexé par nom de colonne de sortie
struct ValidationRules {
    std::vector<std::string> numeric_columns;          // EN: Must parse as a number (',' removed) / FR: Doit être un nombre (',' retirée)
    std::vector<std::string> integer_columns;          // EN: Number with no fractional part / FR: Nombre sans partie fractionnaire
    std::vector<std::string> nonnegative_columns;      // EN: Parsed number >= 0 / FR: Nombre analysé >= 0
    std::vector<std::string> unique_columns;           // EN: Non-empty values unique across rows / FR: Valeurs non vides uniques
    std::map<std::string, std::string> pattern_columns;  // EN: Column -> full-match regex / FR: Colonne -> regex de correspondance totale
    std::vector<std::string> empty_forbidden_columns;  // EN: Value must be non-empty / FR: La valeur doit être non vide

    bool empty() const {
        return numeric_columns.empty() && integer_columns.empty() && nonnegative_columns.empty() &&
               unique_columns.empty() && pattern_columns.empty() && empty_forbidden_columns.empty();
    }

    bool operator==(const ValidationRules& other) const {
        return numeric_columns == other.numeric_columns && integer_columns == other.integer_columns &&
               nonnegative_columns == other.nonnegative_columns && unique_columns == other.unique_columns &&
               pattern_columns == other.pattern_columns && empty_forbidden_columns == other.empty_forbidden_columns;
    }
};

// EN: One validation finding. value is absent for the empty rule.
// FR: Une anomalie de validation. value est absente pour la règle empty.
struct Issue {
    std::size_t row{0};                  // EN: Physical record number, header is row 1 / FR: Numéro d'enregistrement physique, en-tête = 1
    std::string column;                  // EN: Output column name / FR: Nom de colonne de sortie
    std::string rule;                    // EN: empty|numeric|integer|nonnegative|pattern|unique / FR: Nom de règle
    std::optional<std::string> value;    // EN: Offending value / FR: Valeur fautive
    std::string message;                 // EN: Human-readable message / FR: Message lisible

    bool operator==(const Issue& other) const {
        return row == other.row && column == other.column && rule == other.rule && value == other.value &&
               message == other.message;
    }
};

struct EmptyForbiddenRule {};
struct NumericRule {};
struct IntegerRule {};
struct NonnegativeRule {};
struct PatternRule {
    std::string source;
    std::regex regex;
};
struct UniqueRule {};

// EN: Tagged rule variant dispatched in a single loop per column
// FR: Variante de règle étiquetée traitée dans une seule boucle par colonne
using Rule = std::variant<EmptyForbiddenRule, NumericRule, IntegerRule, NonnegativeRule, PatternRule, UniqueRule>;

class RowValidator {
public:
    // EN: Rules naming columns absent from columns are ignored with a warning; invalid regexes are skipped with a warning.
    // FR: Les règles sur des colonnes absentes sont ignorées avec avertissement; les regex invalides aussi.
    RowValidator(const std::vector<std::string>& columns, const ValidationRules& rules);

    // EN: Check one output row (values aligned with the constructor columns).
    // FR: Vérifie une ligne de sortie (valeurs alignées sur les colonnes du constructeur).
    void feed(const std::vector<std::string>& values, std::size_t row_number);

    // EN: Emit unique-rule issues and return every issue sorted by (row, column), stable for equal keys.
    // FR: Émet les anomalies d'unicité et retourne toutes les anomalies triées par (ligne, colonne), tri stable.
    std::vector<Issue> finalize();

    const std::vector<std::string>& warnings() const { return warnings_; }

    bool hasRules() const { return !rules_by_column_.empty(); }

    static std::map<std::string, std::size_t> countsByRule(const std::vector<Issue>& issues);

    // EN: Parse a value with ',' separators removed and surrounding spaces stripped.
    // FR: Analyse une valeur après retrait des ',' et des espaces autour.
    static std::optional<double> parseNumber(const std::string& value);

    static bool isBlank(const std::string& value);

private:
    struct ColumnRules {
        std::size_t index;
        std::string name;
        std::vector<Rule> rules;
    };

    void checkValue(const ColumnRules& column, const std::string& value, std::size_t row_number);

    std::vector<ColumnRules> rules_by_column_;
    std::unordered_map<std::string, std::map<std::string, std::vector<std::size_t>>> unique_seen_;
    std::vector<std::string> unique_order_;
    std::vector<Issue> issues_;
    std::vector<std::string> warnings_;
    bool finalized_ = false;
};

} // namespace TNORM::CSV
