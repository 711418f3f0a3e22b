#pragma once

#include "sthe/html/Node.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sthe::html {

class SelectorError : public std::runtime_error {
public:
    SelectorError(std::size_t position, const std::string& message);

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// A parsed CSS selector list. Parsing happens once; matching is read-only, so
// one Selector can be shared between threads.
class Selector {
public:
    enum class Combinator {
        descendant,
        child,
        adjacentSibling,
        generalSibling
    };

    enum class AttributeOperator {
        exists,
        equals,
        includes,
        dashMatch,
        prefix,
        suffix,
        substring
    };

    enum class PseudoClass {
        firstChild,
        lastChild,
        onlyChild,
        firstOfType,
        lastOfType,
        onlyOfType,
        nthChild,
        nthLastChild,
        nthOfType,
        nthLastOfType,
        empty,
        root,
        negation,
        matchesAny
    };

    // An+B, positions are 1-based.
    struct NthPattern {
        int step{0};
        int offset{0};

        bool matches(int position) const noexcept;
    };

    struct Complex;

    struct AttributeCondition {
        std::string name;
        AttributeOperator op{AttributeOperator::exists};
        std::string value;
        bool ignoreCase{false};
    };

    struct PseudoCondition {
        PseudoClass kind{PseudoClass::root};
        NthPattern nth;
        std::vector<Complex> arguments;
    };

    struct Compound {
        std::string tag;
        std::vector<std::string> ids;
        std::vector<std::string> classes;
        std::vector<AttributeCondition> attributes;
        std::vector<PseudoCondition> pseudos;
    };

    // compounds.size() == combinators.size() + 1; combinators[i] joins
    // compounds[i] and compounds[i + 1].
    struct Complex {
        std::vector<Compound> compounds;
        std::vector<Combinator> combinators;
    };

    static Selector parse(std::string_view source);

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] const std::vector<Complex>& alternatives() const noexcept { return alternatives_; }

    bool matches(const Node& element) const;

    // Matching descendants of `scope` in document order. `scope` itself is
    // never part of the result; its ancestors may satisfy combinators.
    std::vector<Node> select(const Node& scope) const;
    Node selectFirst(const Node& scope) const;

private:
    Selector(std::string source, std::vector<Complex> alternatives);

    std::string source_;
    std::vector<Complex> alternatives_;
};

} // namespace sthe::html
