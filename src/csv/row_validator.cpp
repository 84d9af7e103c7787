// EN: Implementation of the streaming row validator
// FR: Implémentation du validateur de lignes en flux

#include "tnorm/csv/row_validator.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/unicode_text.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <set>

namespace TNORM::CSV {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

// EN: Rules are grouped per column index; rules naming absent columns are dropped with a warning.
// FR: Les règles sont groupées par index de colonne; celles visant des colonnes absentes sont ignorées avec un avertissement.
RowValidator::RowValidator(const std::vector<std::string>& columns, const ValidationRules& rules) {
    std::unordered_map<std::string, std::size_t> index_of;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        index_of.emplace(columns[i], i);
    }

    std::map<std::size_t, ColumnRules> by_index;
    std::set<std::string> reported_unknown;

    auto addRule = [&](const std::string& column, Rule rule) {
        auto it = index_of.find(column);
        if (it == index_of.end()) {
            if (reported_unknown.insert(column).second) {
                warnings_.push_back("validation rule for unknown column ignored: " + column);
            }
            return;
        }
        auto& entry = by_index[it->second];
        entry.index = it->second;
        entry.name = column;
        entry.rules.push_back(std::move(rule));
    };

    // EN: Per-column rule order fixes the issue order for equal (row, column) keys.
    // FR: L'ordre des règles par colonne fixe l'ordre des anomalies à clé (ligne, colonne) égale.
    for (const auto& column : rules.empty_forbidden_columns) addRule(column, EmptyForbiddenRule{});
    for (const auto& column : rules.numeric_columns) addRule(column, NumericRule{});
    for (const auto& column : rules.integer_columns) addRule(column, IntegerRule{});
    for (const auto& column : rules.nonnegative_columns) addRule(column, NonnegativeRule{});
    for (const auto& [column, pattern] : rules.pattern_columns) {
        try {
            addRule(column, PatternRule{pattern, std::regex(pattern, std::regex::ECMAScript)});
        } catch (const std::regex_error&) {
            warnings_.push_back("invalid pattern for column " + column + " skipped: " + pattern);
            LOG_WARN_META("validator", "Invalid pattern skipped", {{"column", column}, {"pattern", pattern}});
        }
    }
    for (const auto& column : rules.unique_columns) {
        if (index_of.count(column) && !unique_seen_.count(column)) {
            unique_seen_[column];
            unique_order_.push_back(column);
        }
        addRule(column, UniqueRule{});
    }

    for (auto& [index, column_rules] : by_index) {
        rules_by_column_.push_back(std::move(column_rules));
    }

    for (const auto& warning : warnings_) {
        LOG_DEBUG("validator", warning);
    }
}

bool RowValidator::isBlank(const std::string& value) {
    return Text::isBlank(value);
}

// EN: Accepted grammar: NFKC-folded text (full-width digits, ideographic space), ',' thousands separators
//     removed, Unicode whitespace trimmed, optional single sign, then a decimal or exponent literal.
//     Magnitudes beyond double range are still numbers (they become +/-inf or 0).
// FR: Grammaire acceptée : texte replié NFKC (chiffres pleine chasse, espace idéographique), séparateurs de
//     milliers ',' retirés, espaces Unicode rognés, signe unique facultatif, puis un littéral décimal ou à exposant.
//     Les grandeurs hors de la plage des double restent des nombres (elles deviennent +/-inf ou 0).
std::optional<double> RowValidator::parseNumber(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : Text::nfkc(value)) {
        if (c != ',') {
            cleaned += c;
        }
    }

    const std::string trimmed = Text::trimWhitespace(cleaned);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    std::string_view number(trimmed);
    if (number.front() == '+') {
        number.remove_prefix(1);
        if (number.empty() || number.front() == '-' || number.front() == '+') {
            return std::nullopt;
        }
    }

    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), parsed);
    if (ptr != number.data() + number.size()) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // EN: from_chars leaves the value untouched here; strtod yields HUGE_VAL or the underflowed value.
        // FR: from_chars laisse la valeur intacte ici; strtod renvoie HUGE_VAL ou la valeur sous-dépassée.
        return std::strtod(std::string(number).c_str(), nullptr);
    }
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return parsed;
}

// EN: A short row reads its missing cells as empty strings.
// FR: Une ligne courte lit ses cellules manquantes comme des chaînes vides.
void RowValidator::feed(const std::vector<std::string>& values, std::size_t row_number) {
    static const std::string kMissing;
    for (const auto& column : rules_by_column_) {
        const std::string& value = column.index < values.size() ? values[column.index] : kMissing;
        checkValue(column, value, row_number);
    }
}

void RowValidator::checkValue(const ColumnRules& column, const std::string& value, std::size_t row_number) {
    const bool blank = isBlank(value);

    for (const auto& rule : column.rules) {
        std::visit(overloaded{
            [&](const EmptyForbiddenRule&) {
                if (blank) {
                    issues_.push_back({row_number, column.name, "empty", std::nullopt, "empty value"});
                }
            },
            [&](const NumericRule&) {
                if (!blank && !parseNumber(value)) {
                    issues_.push_back({row_number, column.name, "numeric", value, "not numeric"});
                }
            },
            [&](const IntegerRule&) {
                if (blank) {
                    return;
                }
                auto number = parseNumber(value);
                if (!number || !std::isfinite(*number) || std::fmod(*number, 1.0) != 0.0) {
                    issues_.push_back({row_number, column.name, "integer", value, "not integer"});
                }
            },
            [&](const NonnegativeRule&) {
                if (blank) {
                    return;
                }
                auto number = parseNumber(value);
                if (number && *number < 0) {
                    issues_.push_back({row_number, column.name, "nonnegative", value, "negative value"});
                }
            },
            [&](const PatternRule& pattern) {
                if (!blank && !std::regex_match(value, pattern.regex)) {
                    issues_.push_back({row_number, column.name, "pattern", value, "not match: " + pattern.source});
                }
            },
            [&](const UniqueRule&) {
                // EN: Only the value-to-rows index is retained, never the row itself.
                // FR: Seul l'index valeur vers lignes est conservé, jamais la ligne elle-même.
                if (!blank) {
                    unique_seen_[column.name][value].push_back(row_number);
                }
            }
        }, rule);
    }
}

// EN: Unique issues are added once, then all issues are stably sorted by (row, column). Repeated calls
//     return the same list.
// FR: Les anomalies d'unicité sont ajoutées une fois, puis toutes les anomalies sont triées de façon
//     stable par (ligne, colonne). Les appels répétés renvoient la même liste.
std::vector<Issue> RowValidator::finalize() {
    if (!finalized_) {
        for (const auto& column : unique_order_) {
            for (const auto& [value, rows] : unique_seen_[column]) {
                if (rows.size() < 2) {
                    continue;
                }
                for (std::size_t row : rows) {
                    issues_.push_back({row, column, "unique", value, "duplicate"});
                }
            }
        }
        unique_seen_.clear();

        std::stable_sort(issues_.begin(), issues_.end(), [](const Issue& a, const Issue& b) {
            if (a.row != b.row) return a.row < b.row;
            return a.column < b.column;
        });
        finalized_ = true;
    }
    return issues_;
}

std::map<std::string, std::size_t> RowValidator::countsByRule(const std::vector<Issue>& issues) {
    std::map<std::string, std::size_t> counts;
    for (const auto& issue : issues) {
        ++counts[issue.rule];
    }
    return counts;
}

} // namespace TNORM::CSV
