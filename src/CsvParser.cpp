/**
 * @file CsvParser.cpp
 * @brief CSV parser (RFC 4180)
 *
 * - Comma separator, LF or CRLF record terminators
 * - Double-quoted fields may contain separators, newlines and "" escapes
 * - The first record is the header; every other non-blank record becomes
 *   an object keyed by header name, in header order
 * - A record with a different field count than the header is an error
 */

#include "diffx/Parsers.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Parse.hpp"

#include <string>
#include <utility>
#include <vector>

namespace diffx {

namespace {

struct CsvRecord {
    std::vector<std::string> fields;
    std::size_t line = 0;
};

/**
 * @brief Split text into records, honoring quoted fields
 */
std::vector<CsvRecord> read_records(std::string_view text) {
    std::vector<CsvRecord> records;

    CsvRecord current;
    std::string field;
    bool in_quotes = false;
    bool field_was_quoted = false;
    std::size_t line = 1;
    std::size_t quote_line = 0;
    current.line = line;

    auto end_field = [&]() {
        current.fields.push_back(std::move(field));
        field.clear();
        field_was_quoted = false;
    };
    auto end_record = [&]() {
        // A blank line has no separator, no text and no quotes: skip it
        const bool blank = current.fields.empty() && field.empty() && !field_was_quoted;
        end_field();
        if (!blank) {
            records.push_back(std::move(current));
        }
        current = CsvRecord{};
        current.line = line;
    };

    std::size_t i = 0;
    if (text.substr(0, 3) == "\xEF\xBB\xBF") {
        i = 3;
    }

    for (; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field.empty() || field_was_quoted) {
                    throw ParseError("csv", "unexpected quote inside unquoted field", line);
                }
                in_quotes = true;
                field_was_quoted = true;
                quote_line = line;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    break;
                }
                ++line;
                end_record();
                break;
            case '\n':
                ++line;
                end_record();
                break;
            default:
                if (field_was_quoted) {
                    throw ParseError("csv", "unexpected character after closing quote", line);
                }
                field += c;
                break;
        }
    }

    if (in_quotes) {
        throw ParseError("csv", "unterminated quoted field", quote_line);
    }
    if (!field.empty() || field_was_quoted || !current.fields.empty()) {
        end_record();
    }
    return records;
}

} // anonymous namespace

Value parse_csv(std::string_view text, const CsvOptions& options) {
    Value rows = Value::array();

    const std::vector<CsvRecord> records = read_records(text);
    if (records.empty()) {
        return rows;
    }

    const std::vector<std::string>& header = records.front().fields;
    for (std::size_t r = 1; r < records.size(); ++r) {
        const CsvRecord& record = records[r];
        if (record.fields.size() != header.size()) {
            throw ParseError(
                "csv",
                "record has " + std::to_string(record.fields.size()) +
                    " fields, but the header has " + std::to_string(header.size()),
                record.line
            );
        }

        Value row = Value::object();
        for (std::size_t c = 0; c < header.size(); ++c) {
            const std::string& cell = record.fields[c];
            row[header[c]] = options.infer_types ? parse_scalar(cell) : Value(cell);
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace diffx
