#include "sthe/util/Toml.hpp"
#include "sthe/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <vector>

namespace sthe::util {

TomlError::TomlError(std::size_t line, const std::string& message)
    : std::runtime_error("TOML line " + std::to_string(line) + ": " + message)
    , line_(line) {}

namespace {

using Key = std::vector<std::string>;

constexpr char kPathSeparator = '\x1f';

// Same bound Boost.JSON applies to JSON documents by default.
constexpr std::size_t kMaxDepth = 32;

bool isBareKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string describeKey(const Key& key) {
    std::string joined;
    for (const auto& part : key) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined += part;
    }
    return joined;
}

class TomlParser {
public:
    explicit TomlParser(std::string_view text)
        : text_(text) {}

    boost::json::object parse() {
        if (text_.substr(0, 3) == "\xEF\xBB\xBF") {
            pos_ = 3;
        }
        while (true) {
            skipSpaces();
            if (eof()) {
                break;
            }
            char c = peek();
            if (c == '#') {
                skipComment();
            } else if (c == '\n' || c == '\r') {
                consumeNewline();
            } else if (c == '[') {
                if (peekAt(1) == '[') {
                    parseTableArrayHeader();
                } else {
                    parseTableHeader();
                }
                expectLineEnd();
            } else {
                parseKeyValue();
                expectLineEnd();
            }
        }
        return std::move(root_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw TomlError(line_, message);
    }

    bool eof() const { return pos_ >= text_.size(); }

    char peek() const { return eof() ? '\0' : text_[pos_]; }

    char peekAt(std::size_t offset) const {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    bool startsWith(std::string_view token) const {
        return text_.substr(pos_, token.size()) == token;
    }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string{"expected '"} + c + "'");
        }
        ++pos_;
    }

    void skipSpaces() {
        while (!eof() && (peek() == ' ' || peek() == '\t')) {
            ++pos_;
        }
    }

    void skipComment() {
        while (!eof() && peek() != '\n') {
            char c = peek();
            if (c == '\r' && peekAt(1) == '\n') {
                break;
            }
            if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
                fail("control character in comment");
            }
            ++pos_;
        }
    }

    void consumeNewline() {
        if (peek() == '\r') {
            if (peekAt(1) != '\n') {
                fail("bare carriage return");
            }
            ++pos_;
        }
        expect('\n');
        ++line_;
    }

    bool atNewline() const {
        return peek() == '\n' || (peek() == '\r' && peekAt(1) == '\n');
    }

    void expectLineEnd() {
        skipSpaces();
        if (peek() == '#') {
            skipComment();
        }
        if (eof()) {
            return;
        }
        if (!atNewline()) {
            fail("unexpected content after value");
        }
        consumeNewline();
    }

    // Whitespace, newlines and comments, as allowed between array elements.
    void skipLayout() {
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t') {
                ++pos_;
            } else if (c == '#') {
                skipComment();
            } else if (atNewline()) {
                consumeNewline();
            } else {
                break;
            }
        }
    }

    Key parseKey() {
        Key key;
        while (true) {
            skipSpaces();
            char c = peek();
            if (c == '"') {
                if (startsWith("\"\"\"")) {
                    fail("multi-line strings cannot be keys");
                }
                key.push_back(parseBasicString());
            } else if (c == '\'') {
                if (startsWith("'''")) {
                    fail("multi-line strings cannot be keys");
                }
                key.push_back(parseLiteralString());
            } else {
                std::size_t start = pos_;
                while (!eof() && isBareKeyChar(peek())) {
                    ++pos_;
                }
                if (start == pos_) {
                    fail("expected a key");
                }
                key.emplace_back(text_.substr(start, pos_ - start));
            }
            skipSpaces();
            if (peek() != '.') {
                break;
            }
            ++pos_;
            if (key.size() >= kMaxDepth) {
                fail("key nested too deeply");
            }
        }
        return key;
    }

    boost::json::object& descend(boost::json::object& start,
                                 std::string& canonical,
                                 const Key& key,
                                 std::size_t count,
                                 bool defineIntermediate) {
        boost::json::object* table = &start;
        for (std::size_t i = 0; i < count; ++i) {
            const auto& part = key[i];
            canonical.push_back(kPathSeparator);
            canonical += part;
            boost::json::value* slot = table->if_contains(part);
            if (!slot) {
                slot = &(*table)[part];
                slot->emplace_object();
            }
            if (slot->is_object()) {
                if (inline_.count(canonical) != 0) {
                    fail("inline table `" + describeKey(key) + "` cannot be extended");
                }
                if (defineIntermediate) {
                    explicit_.insert(canonical);
                }
                table = &slot->get_object();
            } else if (slot->is_array() && tableArrays_.count(canonical) != 0) {
                auto& arr = slot->get_array();
                canonical += "#" + std::to_string(arr.size() - 1);
                table = &arr.back().get_object();
            } else {
                fail("key `" + part + "` is not a table");
            }
        }
        return *table;
    }

    boost::json::object& currentTable(std::string& canonical) {
        return descend(root_, canonical, currentPath_, currentPath_.size(), false);
    }

    void parseTableHeader() {
        expect('[');
        Key key = parseKey();
        expect(']');

        std::string canonical;
        auto& parent = descend(root_, canonical, key, key.size() - 1, false);
        const auto& last = key.back();
        canonical.push_back(kPathSeparator);
        canonical += last;

        if (auto* slot = parent.if_contains(last)) {
            if (!slot->is_object()) {
                fail("table `" + describeKey(key) + "` conflicts with an existing key");
            }
            if (explicit_.count(canonical) != 0 || inline_.count(canonical) != 0) {
                fail("table `" + describeKey(key) + "` defined twice");
            }
        } else {
            parent[last].emplace_object();
        }
        explicit_.insert(canonical);
        currentPath_ = std::move(key);
    }

    void parseTableArrayHeader() {
        expect('[');
        expect('[');
        Key key = parseKey();
        expect(']');
        if (peek() != ']') {
            fail("expected ']]'");
        }
        ++pos_;

        std::string canonical;
        auto& parent = descend(root_, canonical, key, key.size() - 1, false);
        const auto& last = key.back();
        canonical.push_back(kPathSeparator);
        canonical += last;

        if (auto* slot = parent.if_contains(last)) {
            if (!slot->is_array() || tableArrays_.count(canonical) == 0) {
                fail("array of tables `" + describeKey(key) + "` conflicts with an existing key");
            }
            slot->get_array().emplace_back(boost::json::object{});
        } else {
            auto& arr = parent[last].emplace_array();
            arr.emplace_back(boost::json::object{});
            tableArrays_.insert(canonical);
        }
        currentPath_ = std::move(key);
    }

    void parseKeyValue() {
        Key key = parseKey();
        depth_ = currentPath_.size() + key.size();
        if (depth_ > kMaxDepth) {
            fail("key nested too deeply");
        }
        expect('=');
        skipSpaces();
        std::size_t valueLine = line_;
        boost::json::value value = parseValue();

        std::string canonical;
        auto& current = currentTable(canonical);
        auto& table = descend(current, canonical, key, key.size() - 1, true);
        const auto& last = key.back();
        if (table.contains(last)) {
            throw TomlError(valueLine, "duplicate key `" + describeKey(key) + "`");
        }
        canonical.push_back(kPathSeparator);
        canonical += last;
        if (value.is_object()) {
            inline_.insert(canonical);
        }
        table[last] = std::move(value);
    }

    boost::json::value parseValue() {
        char c = peek();
        if (c == '"') {
            if (startsWith("\"\"\"")) {
                return boost::json::value(parseMultilineBasicString());
            }
            return boost::json::value(parseBasicString());
        }
        if (c == '\'') {
            if (startsWith("'''")) {
                return boost::json::value(parseMultilineLiteralString());
            }
            return boost::json::value(parseLiteralString());
        }
        if (c == '[') {
            return parseArray();
        }
        if (c == '{') {
            return parseInlineTable();
        }
        if (startsWith("true") && !isBareKeyChar(peekAt(4))) {
            pos_ += 4;
            return boost::json::value(true);
        }
        if (startsWith("false") && !isBareKeyChar(peekAt(5))) {
            pos_ += 5;
            return boost::json::value(false);
        }
        if (isDigit(c) || c == '+' || c == '-' || c == 'i' || c == 'n') {
            return parseNumber();
        }
        if (eof() || atNewline()) {
            fail("missing value");
        }
        fail(std::string{"unexpected character '"} + c + "'");
    }

    void enterNested() {
        if (++depth_ > kMaxDepth) {
            fail("value nested too deeply");
        }
    }

    boost::json::value parseArray() {
        expect('[');
        enterNested();
        boost::json::array arr;
        while (true) {
            skipLayout();
            if (peek() == ']') {
                ++pos_;
                break;
            }
            if (eof()) {
                fail("unterminated array");
            }
            arr.push_back(parseValue());
            skipLayout();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                break;
            }
            fail("expected ',' or ']' in array");
        }
        --depth_;
        return boost::json::value(std::move(arr));
    }

    boost::json::value parseInlineTable() {
        expect('{');
        enterNested();
        boost::json::object obj;
        skipSpaces();
        if (peek() == '}') {
            ++pos_;
            --depth_;
            return boost::json::value(std::move(obj));
        }
        while (true) {
            Key key = parseKey();
            if (depth_ + key.size() > kMaxDepth) {
                fail("key nested too deeply");
            }
            expect('=');
            skipSpaces();
            boost::json::value value = parseValue();

            boost::json::object* table = &obj;
            for (std::size_t i = 0; i + 1 < key.size(); ++i) {
                boost::json::value& slot = (*table)[key[i]];
                if (slot.is_null()) {
                    slot.emplace_object();
                } else if (!slot.is_object()) {
                    fail("key `" + key[i] + "` is not a table");
                }
                table = &slot.get_object();
            }
            if (table->contains(key.back())) {
                fail("duplicate key `" + describeKey(key) + "`");
            }
            (*table)[key.back()] = std::move(value);

            skipSpaces();
            if (peek() == ',') {
                ++pos_;
                skipSpaces();
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                break;
            }
            fail("expected ',' or '}' in inline table");
        }
        --depth_;
        return boost::json::value(std::move(obj));
    }

    std::uint32_t parseHexDigits(std::size_t count) {
        if (pos_ + count > text_.size()) {
            fail("truncated unicode escape");
        }
        std::uint32_t cp = 0;
        auto begin = text_.data() + pos_;
        auto [ptr, ec] = std::from_chars(begin, begin + count, cp, 16);
        if (ec != std::errc{} || ptr != begin + count) {
            fail("invalid unicode escape");
        }
        pos_ += count;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            fail("escape is not a unicode scalar value");
        }
        return cp;
    }

    void parseEscape(std::string& out) {
        expect('\\');
        if (eof()) {
            fail("unterminated escape");
        }
        char c = text_[pos_++];
        switch (c) {
        case 'b': out.push_back('\b'); break;
        case 't': out.push_back('\t'); break;
        case 'n': out.push_back('\n'); break;
        case 'f': out.push_back('\f'); break;
        case 'r': out.push_back('\r'); break;
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case 'u': appendUtf8(out, parseHexDigits(4)); break;
        case 'U': appendUtf8(out, parseHexDigits(8)); break;
        default:
            fail(std::string{"invalid escape '\\"} + c + "'");
        }
    }

    void checkStringChar(char c) const {
        auto u = static_cast<unsigned char>(c);
        if ((u < 0x20 && c != '\t') || u == 0x7F) {
            fail("control character in string");
        }
    }

    std::string parseBasicString() {
        expect('"');
        std::string out;
        while (true) {
            if (eof() || atNewline()) {
                fail("unterminated string");
            }
            char c = peek();
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (c == '\\') {
                parseEscape(out);
                continue;
            }
            checkStringChar(c);
            out.push_back(c);
            ++pos_;
        }
    }

    std::string parseLiteralString() {
        expect('\'');
        std::string out;
        while (true) {
            if (eof() || atNewline()) {
                fail("unterminated string");
            }
            char c = peek();
            if (c == '\'') {
                ++pos_;
                return out;
            }
            checkStringChar(c);
            out.push_back(c);
            ++pos_;
        }
    }

    // Closing delimiter of a multi-line string may be preceded by up to two
    // quote characters that belong to the content.
    bool closeMultiline(char quote, std::string& out) {
        std::size_t run = 0;
        while (peekAt(run) == quote) {
            ++run;
        }
        if (run < 3) {
            return false;
        }
        if (run > 5) {
            fail("too many quotes at the end of a multi-line string");
        }
        out.append(run - 3, quote);
        pos_ += run;
        return true;
    }

    std::string parseMultilineBasicString() {
        pos_ += 3;
        if (atNewline()) {
            consumeNewline();
        }
        std::string out;
        while (true) {
            if (eof()) {
                fail("unterminated multi-line string");
            }
            char c = peek();
            if (c == '"' && closeMultiline('"', out)) {
                return out;
            }
            if (c == '\\') {
                std::size_t look = pos_ + 1;
                while (look < text_.size() && (text_[look] == ' ' || text_[look] == '\t')) {
                    ++look;
                }
                if (look < text_.size() && (text_[look] == '\n' || text_[look] == '\r')) {
                    pos_ = look;
                    while (!eof() && (peek() == ' ' || peek() == '\t' || atNewline())) {
                        if (atNewline()) {
                            consumeNewline();
                        } else {
                            ++pos_;
                        }
                    }
                    continue;
                }
                parseEscape(out);
                continue;
            }
            if (atNewline()) {
                consumeNewline();
                out.push_back('\n');
                continue;
            }
            checkStringChar(c);
            out.push_back(c);
            ++pos_;
        }
    }

    std::string parseMultilineLiteralString() {
        pos_ += 3;
        if (atNewline()) {
            consumeNewline();
        }
        std::string out;
        while (true) {
            if (eof()) {
                fail("unterminated multi-line string");
            }
            char c = peek();
            if (c == '\'' && closeMultiline('\'', out)) {
                return out;
            }
            if (atNewline()) {
                consumeNewline();
                out.push_back('\n');
                continue;
            }
            checkStringChar(c);
            out.push_back(c);
            ++pos_;
        }
    }

    std::string stripUnderscores(std::string_view digits, bool hex) {
        std::string out;
        out.reserve(digits.size());
        auto isDigitChar = [hex](char c) {
            return hex ? std::isxdigit(static_cast<unsigned char>(c)) != 0 : isDigit(c);
        };
        for (std::size_t i = 0; i < digits.size(); ++i) {
            char c = digits[i];
            if (c == '_') {
                if (i == 0 || i + 1 == digits.size() || !isDigitChar(digits[i - 1]) || !isDigitChar(digits[i + 1])) {
                    fail("underscore must sit between digits");
                }
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    boost::json::value parseNumber() {
        std::size_t start = pos_;
        while (!eof()) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '+' || c == '-' || c == '.' ||
                c == ':') {
                ++pos_;
            } else {
                break;
            }
        }
        std::string_view token = text_.substr(start, pos_ - start);

        if (token.find(':') != std::string_view::npos ||
            (token.size() >= 10 && isDigit(token[0]) && token[4] == '-' && token[7] == '-')) {
            fail("date-time values are not supported");
        }

        std::string_view body = token;
        bool negative = false;
        if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
            negative = body.front() == '-';
            body.remove_prefix(1);
        }
        if (body == "inf") {
            return boost::json::value(negative ? -std::numeric_limits<double>::infinity()
                                               : std::numeric_limits<double>::infinity());
        }
        if (body == "nan") {
            return boost::json::value(std::numeric_limits<double>::quiet_NaN());
        }
        if (body.empty()) {
            fail("invalid number");
        }

        if (body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'o' || body[1] == 'b')) {
            if (token.front() == '+' || token.front() == '-') {
                fail("prefixed integers cannot carry a sign");
            }
            int base = body[1] == 'x' ? 16 : (body[1] == 'o' ? 8 : 2);
            std::string digits = stripUnderscores(body.substr(2), base == 16);
            std::uint64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed, base);
            if (ec != std::errc{} || ptr != digits.data() + digits.size() ||
                parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                fail("invalid integer `" + std::string(token) + "`");
            }
            return boost::json::value(static_cast<std::int64_t>(parsed));
        }

        bool isFloat = body.find_first_of(".eE") != std::string_view::npos;
        std::string digits = stripUnderscores(body, false);
        if (!isDigit(digits.front())) {
            fail("invalid number `" + std::string(token) + "`");
        }
        if (digits.size() > 1 && digits[0] == '0' && isDigit(digits[1])) {
            fail("leading zeros are not allowed");
        }

        if (isFloat) {
            auto dot = digits.find('.');
            if (dot != std::string::npos && (dot + 1 >= digits.size() || !isDigit(digits[dot + 1]))) {
                fail("invalid float `" + std::string(token) + "`");
            }
            std::string signedDigits = negative ? "-" + digits : digits;
            char* end = nullptr;
            double parsed = std::strtod(signedDigits.c_str(), &end);
            if (end != signedDigits.c_str() + signedDigits.size()) {
                fail("invalid float `" + std::string(token) + "`");
            }
            return boost::json::value(parsed);
        }

        std::string signedDigits = negative ? "-" + digits : digits;
        std::int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(signedDigits.data(), signedDigits.data() + signedDigits.size(), parsed);
        if (ec != std::errc{} || ptr != signedDigits.data() + signedDigits.size()) {
            fail("invalid integer `" + std::string(token) + "`");
        }
        return boost::json::value(parsed);
    }

    std::string_view text_;
    std::size_t pos_{0};
    std::size_t line_{1};
    boost::json::object root_;
    Key currentPath_;
    std::size_t depth_{0};
    std::set<std::string> explicit_;
    std::set<std::string> inline_;
    std::set<std::string> tableArrays_;
};

// --- writer ---------------------------------------------------------------

std::string quoteString(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\f': out += "\\f"; break;
        case '\r': out += "\\r"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                std::ostringstream esc;
                esc << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += esc.str();
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
    return out;
}

std::string formatKey(std::string_view key) {
    if (!key.empty() && std::all_of(key.begin(), key.end(), isBareKeyChar)) {
        return std::string(key);
    }
    return quoteString(key);
}

std::string formatDouble(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::setprecision(17) << value;
    std::string text = os.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool isTableArray(const boost::json::value& value) {
    if (!value.is_array() || value.get_array().empty()) {
        return false;
    }
    const auto& arr = value.get_array();
    return std::all_of(arr.begin(), arr.end(), [](const boost::json::value& v) { return v.is_object(); });
}

std::string formatInline(const boost::json::value& value);

std::string formatInlineTable(const boost::json::object& obj) {
    std::string out = "{";
    bool first = true;
    for (const auto& member : obj) {
        if (member.value().is_null()) {
            continue;
        }
        out += first ? " " : ", ";
        first = false;
        out += formatKey(asStringView(member.key())) + " = " + formatInline(member.value());
    }
    out += first ? "}" : " }";
    return out;
}

std::string formatInline(const boost::json::value& value) {
    switch (value.kind()) {
    case boost::json::kind::string:
        return quoteString(asStringView(value.get_string()));
    case boost::json::kind::bool_:
        return value.get_bool() ? "true" : "false";
    case boost::json::kind::int64:
        return std::to_string(value.get_int64());
    case boost::json::kind::uint64:
        return std::to_string(value.get_uint64());
    case boost::json::kind::double_:
        return formatDouble(value.get_double());
    case boost::json::kind::array: {
        std::string out = "[";
        bool first = true;
        for (const auto& element : value.get_array()) {
            if (element.is_null()) {
                continue;
            }
            if (!first) {
                out += ", ";
            }
            first = false;
            out += formatInline(element);
        }
        out += "]";
        return out;
    }
    case boost::json::kind::object:
        return formatInlineTable(value.get_object());
    case boost::json::kind::null:
        break;
    }
    return {};
}

std::string headerPath(const Key& path) {
    std::string out;
    for (const auto& part : path) {
        if (!out.empty()) {
            out.push_back('.');
        }
        out += formatKey(part);
    }
    return out;
}

void writeTable(std::ostringstream& os, const boost::json::object& table, Key& path) {
    for (const auto& member : table) {
        const auto& value = member.value();
        if (value.is_null() || value.is_object() || isTableArray(value)) {
            continue;
        }
        os << formatKey(asStringView(member.key())) << " = " << formatInline(value) << '\n';
    }

    for (const auto& member : table) {
        const auto& value = member.value();
        if (value.is_object()) {
            path.emplace_back(asStringView(member.key()));
            os << '\n' << '[' << headerPath(path) << "]\n";
            writeTable(os, value.get_object(), path);
            path.pop_back();
        } else if (isTableArray(value)) {
            path.emplace_back(asStringView(member.key()));
            for (const auto& element : value.get_array()) {
                os << '\n' << "[[" << headerPath(path) << "]]\n";
                writeTable(os, element.get_object(), path);
            }
            path.pop_back();
        }
    }
}

} // namespace

boost::json::object parseToml(std::string_view text) {
    return TomlParser(text).parse();
}

std::string writeToml(const boost::json::object& table) {
    std::ostringstream os;
    Key path;
    writeTable(os, table, path);
    std::string out = os.str();
    if (!out.empty() && out.front() == '\n') {
        out.erase(0, 1);
    }
    return out;
}

} // namespace sthe::util
