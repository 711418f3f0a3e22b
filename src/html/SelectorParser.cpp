#include "sthe/html/Selector.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <utility>

namespace sthe::html {

SelectorError::SelectorError(std::size_t position, const std::string& message)
    : std::runtime_error(message + " at offset " + std::to_string(position))
    , position_(position) {}

namespace {

constexpr std::size_t kMaxNesting = 32;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool isNameStart(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) != 0 || c == '_' || u >= 0x80;
}

bool isNameChar(char c) {
    return isNameStart(c) || std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-';
}

std::string lowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
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

class SelectorParser {
public:
    explicit SelectorParser(std::string_view source)
        : source_(source) {}

    std::vector<Selector::Complex> parseTopLevel() {
        auto list = parseList();
        if (!eof()) {
            fail("unexpected character '" + std::string(1, peek()) + "'");
        }
        return list;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw SelectorError(pos_, message);
    }

    bool eof() const { return pos_ >= source_.size(); }

    char peek(std::size_t offset = 0) const {
        return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
    }

    bool skipSpaces() {
        std::size_t start = pos_;
        while (!eof() && isSpace(peek())) {
            ++pos_;
        }
        return pos_ != start;
    }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string{"expected '"} + c + "'");
        }
        ++pos_;
    }

    bool startsIdentifier() const {
        char c = peek();
        if (c == '-') {
            char next = peek(1);
            return isNameStart(next) || next == '-' || next == '\\';
        }
        return isNameStart(c) || c == '\\';
    }

    void parseEscape(std::string& out) {
        ++pos_;
        if (eof()) {
            fail("unterminated escape");
        }
        if (std::isxdigit(static_cast<unsigned char>(peek())) != 0) {
            std::size_t start = pos_;
            while (!eof() && pos_ - start < 6 && std::isxdigit(static_cast<unsigned char>(peek())) != 0) {
                ++pos_;
            }
            std::uint32_t cp = 0;
            std::from_chars(source_.data() + start, source_.data() + pos_, cp, 16);
            appendUtf8(out, cp);
            if (!eof() && isSpace(peek())) {
                ++pos_;
            }
            return;
        }
        if (peek() == '\n') {
            fail("escaped newline in identifier");
        }
        out.push_back(peek());
        ++pos_;
    }

    // Name characters without the identifier start restriction (used after '#').
    std::string parseName() {
        std::string out;
        while (!eof()) {
            char c = peek();
            if (c == '\\') {
                parseEscape(out);
            } else if (isNameChar(c)) {
                out.push_back(c);
                ++pos_;
            } else {
                break;
            }
        }
        if (out.empty()) {
            fail("expected a name");
        }
        return out;
    }

    std::string parseIdentifier() {
        if (!startsIdentifier()) {
            fail("expected an identifier");
        }
        return parseName();
    }

    std::string parseString() {
        char quote = peek();
        ++pos_;
        std::string out;
        while (true) {
            if (eof()) {
                fail("unterminated string");
            }
            char c = peek();
            if (c == quote) {
                ++pos_;
                return out;
            }
            if (c == '\n') {
                fail("newline in string");
            }
            if (c == '\\') {
                if (peek(1) == '\n') {
                    pos_ += 2;
                    continue;
                }
                parseEscape(out);
                continue;
            }
            out.push_back(c);
            ++pos_;
        }
    }

    std::vector<Selector::Complex> parseList() {
        std::vector<Selector::Complex> list;
        while (true) {
            skipSpaces();
            list.push_back(parseComplex());
            skipSpaces();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            break;
        }
        return list;
    }

    Selector::Complex parseComplex() {
        Selector::Complex complex;
        complex.compounds.push_back(parseCompound());
        while (true) {
            bool sawSpace = skipSpaces();
            char c = peek();
            if (eof() || c == ',' || c == ')') {
                break;
            }
            Selector::Combinator combinator = Selector::Combinator::descendant;
            if (c == '>' || c == '+' || c == '~') {
                combinator = c == '>' ? Selector::Combinator::child
                           : c == '+' ? Selector::Combinator::adjacentSibling
                                      : Selector::Combinator::generalSibling;
                ++pos_;
                skipSpaces();
            } else if (!sawSpace) {
                fail("unexpected character '" + std::string(1, c) + "'");
            }
            complex.combinators.push_back(combinator);
            complex.compounds.push_back(parseCompound());
        }
        return complex;
    }

    Selector::Compound parseCompound() {
        Selector::Compound compound;
        std::size_t start = pos_;

        if (peek() == '*') {
            ++pos_;
        } else if (startsIdentifier()) {
            compound.tag = lowerAscii(parseIdentifier());
        }
        if (peek() == '|') {
            fail("namespace prefixes are not supported");
        }

        while (!eof()) {
            char c = peek();
            if (c == '#') {
                ++pos_;
                compound.ids.push_back(parseName());
            } else if (c == '.') {
                ++pos_;
                compound.classes.push_back(parseIdentifier());
            } else if (c == '[') {
                compound.attributes.push_back(parseAttribute());
            } else if (c == ':') {
                if (peek(1) == ':') {
                    fail("pseudo-elements are not supported");
                }
                compound.pseudos.push_back(parsePseudo());
            } else {
                break;
            }
        }

        if (pos_ == start) {
            fail(eof() ? "expected a selector" : "unexpected character '" + std::string(1, peek()) + "'");
        }
        return compound;
    }

    Selector::AttributeCondition parseAttribute() {
        expect('[');
        skipSpaces();
        if (peek() == '|' || peek() == '*') {
            fail("namespace prefixes are not supported");
        }
        Selector::AttributeCondition condition;
        condition.name = lowerAscii(parseIdentifier());
        skipSpaces();
        if (peek() == ']') {
            ++pos_;
            return condition;
        }

        char c = peek();
        if (c == '=') {
            condition.op = Selector::AttributeOperator::equals;
            ++pos_;
        } else {
            switch (c) {
            case '~': condition.op = Selector::AttributeOperator::includes; break;
            case '|': condition.op = Selector::AttributeOperator::dashMatch; break;
            case '^': condition.op = Selector::AttributeOperator::prefix; break;
            case '$': condition.op = Selector::AttributeOperator::suffix; break;
            case '*': condition.op = Selector::AttributeOperator::substring; break;
            default: fail("invalid attribute operator");
            }
            ++pos_;
            expect('=');
        }

        skipSpaces();
        if (peek() == '"' || peek() == '\'') {
            condition.value = parseString();
        } else {
            condition.value = parseIdentifier();
        }
        skipSpaces();
        if (peek() == 'i' || peek() == 'I' || peek() == 's' || peek() == 'S') {
            condition.ignoreCase = peek() == 'i' || peek() == 'I';
            ++pos_;
            skipSpaces();
        }
        expect(']');
        return condition;
    }

    std::string parseArgumentText() {
        std::size_t start = pos_;
        while (!eof() && peek() != ')') {
            ++pos_;
        }
        if (eof()) {
            fail("unterminated argument");
        }
        std::string text(source_.substr(start, pos_ - start));
        ++pos_;
        return text;
    }

    int parseInteger(std::string_view digits, std::size_t position) const {
        bool negative = false;
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
            negative = digits.front() == '-';
            digits.remove_prefix(1);
        }
        int value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
            throw SelectorError(position, "invalid An+B expression");
        }
        return negative ? -value : value;
    }

    Selector::NthPattern parseNth() {
        std::size_t position = pos_;
        std::string raw = parseArgumentText();
        std::string text;
        for (char c : raw) {
            if (!isSpace(c)) {
                text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }

        if (text == "odd") {
            return {2, 1};
        }
        if (text == "even") {
            return {2, 0};
        }

        auto n = text.find('n');
        if (n == std::string::npos) {
            return {0, parseInteger(text, position)};
        }

        Selector::NthPattern pattern;
        std::string_view step = std::string_view(text).substr(0, n);
        if (step.empty() || step == "+") {
            pattern.step = 1;
        } else if (step == "-") {
            pattern.step = -1;
        } else {
            pattern.step = parseInteger(step, position);
        }

        std::string_view offset = std::string_view(text).substr(n + 1);
        if (!offset.empty()) {
            if (offset.front() != '+' && offset.front() != '-') {
                throw SelectorError(position, "invalid An+B expression");
            }
            pattern.offset = parseInteger(offset, position);
        }
        return pattern;
    }

    Selector::PseudoCondition parsePseudo() {
        expect(':');
        std::size_t position = pos_;
        std::string name = lowerAscii(parseIdentifier());

        Selector::PseudoCondition condition;
        if (name == "first-child") {
            condition.kind = Selector::PseudoClass::firstChild;
        } else if (name == "last-child") {
            condition.kind = Selector::PseudoClass::lastChild;
        } else if (name == "only-child") {
            condition.kind = Selector::PseudoClass::onlyChild;
        } else if (name == "first-of-type") {
            condition.kind = Selector::PseudoClass::firstOfType;
        } else if (name == "last-of-type") {
            condition.kind = Selector::PseudoClass::lastOfType;
        } else if (name == "only-of-type") {
            condition.kind = Selector::PseudoClass::onlyOfType;
        } else if (name == "empty") {
            condition.kind = Selector::PseudoClass::empty;
        } else if (name == "root") {
            condition.kind = Selector::PseudoClass::root;
        } else if (peek() != '(') {
            throw SelectorError(position, "unknown pseudo-class '" + name + "'");
        } else {
            ++pos_;
            skipSpaces();
            if (name == "nth-child" || name == "nth-last-child" || name == "nth-of-type" ||
                name == "nth-last-of-type") {
                condition.kind = name == "nth-child"        ? Selector::PseudoClass::nthChild
                               : name == "nth-last-child"   ? Selector::PseudoClass::nthLastChild
                               : name == "nth-of-type"      ? Selector::PseudoClass::nthOfType
                                                            : Selector::PseudoClass::nthLastOfType;
                condition.nth = parseNth();
            } else if (name == "not" || name == "is" || name == "where" || name == "matches") {
                condition.kind = name == "not" ? Selector::PseudoClass::negation : Selector::PseudoClass::matchesAny;
                if (++depth_ > kMaxNesting) {
                    throw SelectorError(position, "selector nested too deeply");
                }
                condition.arguments = parseList();
                skipSpaces();
                expect(')');
                --depth_;
            } else {
                throw SelectorError(position, "unknown pseudo-class '" + name + "'");
            }
        }
        return condition;
    }

    std::string_view source_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

} // namespace

Selector::Selector(std::string source, std::vector<Complex> alternatives)
    : source_(std::move(source))
    , alternatives_(std::move(alternatives)) {}

Selector Selector::parse(std::string_view source) {
    SelectorParser parser(source);
    auto alternatives = parser.parseTopLevel();
    return Selector{std::string(source), std::move(alternatives)};
}

} // namespace sthe::html
