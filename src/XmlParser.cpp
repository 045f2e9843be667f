/**
 * @file XmlParser.cpp
 * @brief Non-validating XML parser
 *
 * Mapping convention:
 * - The document becomes {root_tag: element}
 * - Attributes become "@name" keys holding strings
 * - Each distinct child tag becomes one key, in order of first appearance;
 *   a tag that appears more than once holds an Array in document order
 * - Non-blank text (including CDATA) is concatenated, trimmed and stored
 *   under "#text"
 * - An element with neither attributes nor children collapses to its
 *   text string, or null when it has no text
 *
 * The XML declaration, processing instructions, comments and DOCTYPE
 * are skipped. Namespaces are not interpreted: prefixed names are kept
 * verbatim.
 */

#include "diffx/Parsers.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Util.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace diffx {

namespace {

constexpr std::size_t kMaxElementDepth = 1024;

const std::string kAttributePrefix = "@";
const std::string kTextKey = "#text";

bool is_name_start(char c) {
    const auto u = static_cast<unsigned char>(c);
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' || c == ':' || u >= 0x80;
}

bool is_name_char(char c) {
    return is_name_start(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Char production of XML 1.0: tab, LF, CR and the Unicode scalar values
// outside the C0 controls, surrogates and U+FFFE/U+FFFF.
bool is_xml_char(std::uint32_t cp) {
    return cp == 0x9 || cp == 0xA || cp == 0xD ||
           (cp >= 0x20 && cp <= 0xD7FF) ||
           (cp >= 0xE000 && cp <= 0xFFFD) ||
           (cp >= 0x10000 && cp <= 0x10FFFF);
}

/**
 * @brief Cursor over the document text
 */
class XmlReader {
public:
    explicit XmlReader(std::string_view text) : text_(text) {}

    Value parse_document() {
        if (text_.substr(0, 3) == "\xEF\xBB\xBF") {
            pos_ = 3;
        }

        skip_misc();
        if (eof() || peek() != '<') {
            fail("missing root element");
        }

        Value root = Value::object();
        ++pos_;
        const std::string name = read_name();
        root[name] = parse_element(name, 1);

        skip_misc();
        if (!eof()) {
            fail("unexpected content after root element");
        }
        return root;
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& message) const {
        const auto [line, column] = line_column_at(text_, pos_);
        throw ParseError("xml", message, line, column);
    }

    bool eof() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    bool starts_with(std::string_view token) const {
        return text_.compare(pos_, token.size(), token) == 0;
    }

    void skip_spaces() {
        while (!eof() && is_space(peek())) ++pos_;
    }

    void expect(char c) {
        if (eof() || peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    /**
     * @brief Skip past the next occurrence of terminator
     */
    void skip_past(std::string_view terminator, const char* what) {
        const std::size_t end = text_.find(terminator, pos_);
        if (end == std::string_view::npos) {
            fail(std::string("unterminated ") + what);
        }
        pos_ = end + terminator.size();
    }

    /**
     * @brief Skip whitespace, comments, processing instructions and DOCTYPE
     */
    void skip_misc() {
        for (;;) {
            skip_spaces();
            if (starts_with("<?")) {
                skip_past("?>", "processing instruction");
            } else if (starts_with("<!--")) {
                skip_past("-->", "comment");
            } else if (starts_with("<!DOCTYPE")) {
                skip_doctype();
            } else {
                return;
            }
        }
    }

    void skip_doctype() {
        int bracket_depth = 0;
        while (!eof()) {
            const char c = peek();
            ++pos_;
            if (c == '[') {
                ++bracket_depth;
            } else if (c == ']') {
                --bracket_depth;
            } else if (c == '>' && bracket_depth <= 0) {
                return;
            }
        }
        fail("unterminated DOCTYPE");
    }

    std::string read_name() {
        if (eof() || !is_name_start(peek())) {
            fail("expected a name");
        }
        const std::size_t start = pos_;
        while (!eof() && is_name_char(peek())) ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    /**
     * @brief Decode the entity reference at pos_ ('&' already current)
     */
    void read_entity(std::string& out) {
        const std::size_t semi = text_.find(';', pos_);
        if (semi == std::string_view::npos || semi - pos_ > 12) {
            fail("unterminated entity reference");
        }
        const std::string_view ref = text_.substr(pos_ + 1, semi - pos_ - 1);

        if (ref == "lt") out += '<';
        else if (ref == "gt") out += '>';
        else if (ref == "amp") out += '&';
        else if (ref == "quot") out += '"';
        else if (ref == "apos") out += '\'';
        else if (ref.size() > 1 && ref[0] == '#') {
            const bool hex = ref[1] == 'x' || ref[1] == 'X';
            const std::string digits(ref.substr(hex ? 2 : 1));
            if (digits.empty()) {
                fail("empty character reference");
            }
            std::uint32_t cp = 0;
            for (char d : digits) {
                int v;
                if (d >= '0' && d <= '9') v = d - '0';
                else if (hex && d >= 'a' && d <= 'f') v = d - 'a' + 10;
                else if (hex && d >= 'A' && d <= 'F') v = d - 'A' + 10;
                else fail("invalid character reference '&" + std::string(ref) + ";'");
                cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(v);
                if (cp > 0x10FFFF) {
                    fail("character reference out of range");
                }
            }
            if (!is_xml_char(cp)) {
                fail("character reference '&" + std::string(ref) + ";' is not a valid XML character");
            }
            append_utf8(out, cp);
        } else {
            fail("unknown entity '&" + std::string(ref) + ";'");
        }
        pos_ = semi + 1;
    }

    std::string read_attribute_value() {
        if (eof() || (peek() != '"' && peek() != '\'')) {
            fail("attribute value must be quoted");
        }
        const char quote = peek();
        ++pos_;

        std::string out;
        while (!eof() && peek() != quote) {
            if (peek() == '<') {
                fail("'<' not allowed in attribute value");
            }
            if (peek() == '&') {
                read_entity(out);
            } else {
                out += peek();
                ++pos_;
            }
        }
        if (eof()) {
            fail("unterminated attribute value");
        }
        ++pos_;
        return out;
    }

    static void add_child(Value& obj, const std::string& name, Value child) {
        auto it = obj.find(name);
        if (it == obj.end()) {
            obj[name] = std::move(child);
        } else if (it->is_array()) {
            it->push_back(std::move(child));
        } else {
            // Second occurrence: the tag is repeated, switch to an array
            Value arr = Value::array();
            arr.push_back(std::move(*it));
            arr.push_back(std::move(child));
            *it = std::move(arr);
        }
    }

    /**
     * @brief Parse an element whose name has just been read
     */
    Value parse_element(const std::string& name, std::size_t depth) {
        if (depth > kMaxElementDepth) {
            fail("elements nested deeper than " + std::to_string(kMaxElementDepth));
        }

        Value obj = Value::object();
        bool has_markup = false;

        // Attributes
        for (;;) {
            const bool had_space = !eof() && is_space(peek());
            skip_spaces();
            if (eof()) {
                fail("unterminated start tag <" + name + ">");
            }
            if (starts_with("/>")) {
                pos_ += 2;
                return obj.empty() ? Value(nullptr) : obj;
            }
            if (peek() == '>') {
                ++pos_;
                break;
            }
            if (!had_space) {
                fail("expected whitespace before attribute");
            }

            const std::string attr = read_name();
            skip_spaces();
            expect('=');
            skip_spaces();
            const std::string key = kAttributePrefix + attr;
            if (obj.contains(key)) {
                fail("duplicate attribute '" + attr + "'");
            }
            obj[key] = read_attribute_value();
            has_markup = true;
        }

        // Content
        std::string text;
        for (;;) {
            if (eof()) {
                fail("unclosed element <" + name + ">");
            }
            if (starts_with("</")) {
                pos_ += 2;
                const std::string closing = read_name();
                if (closing != name) {
                    fail("mismatched closing tag </" + closing + ">, expected </" + name + ">");
                }
                skip_spaces();
                expect('>');
                break;
            }
            if (starts_with("<!--")) {
                skip_past("-->", "comment");
            } else if (starts_with("<![CDATA[")) {
                pos_ += 9;
                const std::size_t end = text_.find("]]>", pos_);
                if (end == std::string_view::npos) {
                    fail("unterminated CDATA section");
                }
                text.append(text_.substr(pos_, end - pos_));
                pos_ = end + 3;
            } else if (starts_with("<?")) {
                skip_past("?>", "processing instruction");
            } else if (peek() == '<') {
                ++pos_;
                const std::string child = read_name();
                add_child(obj, child, parse_element(child, depth + 1));
                has_markup = true;
            } else if (peek() == '&') {
                read_entity(text);
            } else {
                text += peek();
                ++pos_;
            }
        }

        std::string content = trim(text);
        if (!has_markup) {
            return content.empty() ? Value(nullptr) : Value(std::move(content));
        }
        if (!content.empty()) {
            obj[kTextKey] = std::move(content);
        }
        return obj;
    }
};

} // anonymous namespace

Value parse_xml(std::string_view text) {
    XmlReader reader(text);
    return reader.parse_document();
}

} // namespace diffx
