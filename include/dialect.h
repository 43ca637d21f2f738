/**
 * @file dialect.h
 * @brief Dialect parameters shared by the tokenizer, the writer and the sniffer.
 *
 * A dialect is the {separator, quote, escape, comment prefix} tuple that
 * describes a delimited text format. Dialects are either built directly by the
 * caller or produced by Sniffer::guess_parameters().
 *
 * @see Tokenizer for reading with a dialect
 * @see Sniffer for guessing a dialect from a sample
 */

#ifndef DSVKIT_DIALECT_H
#define DSVKIT_DIALECT_H

#include <string>

namespace dsvkit {

/**
 * @brief How strictly quoted fields are recognized.
 *
 * - STRICT: the opening quote must be the first byte of the field and the
 *   closing quote the last byte before the terminator.
 * - FUZZY: spaces and tabs are allowed (and dropped) before the opening
 *   quote and after the closing quote.
 */
enum class QuoteMode { STRICT, FUZZY };

/**
 * @brief Delimited text dialect.
 *
 * - separator: field separator ('\\n' or 0 means a single column)
 * - quote: quote character, 0 disables quoting
 * - escape: byte that escapes a quote inside a quoted field, usually the
 *   quote itself (doubled quotes); 0 disables unescaping
 * - comment: prefix that marks a comment line, empty disables comments
 */
struct DialectParameters {
    char separator = ',';
    char quote = '"';
    char escape = '"';
    std::string comment = "#";
    QuoteMode quote_mode = QuoteMode::FUZZY;

    /// Comma separated, double quotes, '#' comments
    static DialectParameters csv() { return DialectParameters(); }

    /// Tab separated, double quotes, '#' comments
    static DialectParameters tsv() {
        DialectParameters p;
        p.separator = '\t';
        return p;
    }

    /// Semicolon separated (European style)
    static DialectParameters semicolon() {
        DialectParameters p;
        p.separator = ';';
        return p;
    }

    /// Sets the quote character and makes it its own escape.
    DialectParameters& set_quote(char q) {
        quote = q;
        escape = q;
        return *this;
    }

    /// Returns an empty string when the dialect is consistent, otherwise a
    /// description of the first conflict found.
    std::string validation_error() const;

    /// @throws ParseException with ErrorCode::INVALID_DIALECT on conflict
    void validate() const;

    bool operator==(const DialectParameters& other) const {
        return separator == other.separator && quote == other.quote &&
               escape == other.escape && comment == other.comment &&
               quote_mode == other.quote_mode;
    }

    bool operator!=(const DialectParameters& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

/// Printable name of a dialect byte ("comma", "tab", "none", ...)
std::string describe_char(char c);

} // namespace dsvkit

#endif // DSVKIT_DIALECT_H
