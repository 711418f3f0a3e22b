#include "sthe/html/Selector.hpp"

#include <algorithm>
#include <cctype>

namespace sthe::html {
namespace {

using Complex = Selector::Complex;
using Compound = Selector::Compound;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string lowerAscii(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

bool containsToken(std::string_view list, std::string_view token) {
    std::size_t pos = 0;
    while (pos < list.size()) {
        while (pos < list.size() && isSpace(list[pos])) {
            ++pos;
        }
        std::size_t end = pos;
        while (end < list.size() && !isSpace(list[end])) {
            ++end;
        }
        if (end > pos && list.substr(pos, end - pos) == token) {
            return true;
        }
        pos = end;
    }
    return false;
}

bool matchesAttribute(const Selector::AttributeCondition& condition, const Node& element) {
    auto actual = element.attribute(condition.name);
    if (!actual) {
        return false;
    }
    if (condition.op == Selector::AttributeOperator::exists) {
        return true;
    }

    std::string value = *actual;
    std::string expected = condition.value;
    if (condition.ignoreCase) {
        value = lowerAscii(value);
        expected = lowerAscii(expected);
    }
    std::string_view v{value};

    switch (condition.op) {
    case Selector::AttributeOperator::equals:
        return v == expected;
    case Selector::AttributeOperator::includes:
        if (expected.empty() || std::any_of(expected.begin(), expected.end(), isSpace)) {
            return false;
        }
        return containsToken(v, expected);
    case Selector::AttributeOperator::dashMatch:
        return v == expected || (v.size() > expected.size() && v.substr(0, expected.size()) == expected &&
                                 v[expected.size()] == '-');
    case Selector::AttributeOperator::prefix:
        return !expected.empty() && v.substr(0, expected.size()) == expected;
    case Selector::AttributeOperator::suffix:
        return !expected.empty() && v.size() >= expected.size() &&
               v.substr(v.size() - expected.size()) == expected;
    case Selector::AttributeOperator::substring:
        return !expected.empty() && v.find(expected) != std::string_view::npos;
    case Selector::AttributeOperator::exists:
        return true;
    }
    return false;
}

// 1-based position among element siblings, optionally counting only
// siblings with the same name, from the front or the back.
int siblingPosition(const Node& element, bool sameType, bool fromEnd) {
    int position = 1;
    for (Node sibling = fromEnd ? element.nextElementSibling() : element.previousElementSibling(); sibling;
         sibling = fromEnd ? sibling.nextElementSibling() : sibling.previousElementSibling()) {
        if (!sameType || sibling.name() == element.name()) {
            ++position;
        }
    }
    return position;
}

// Outcome of matching a compound chain. The failure kinds tell the caller how
// far up the combinator chain it may stop retrying other candidates.
enum class MatchResult {
    matched,
    restartFromClosestLaterSibling,
    restartFromClosestDescendant,
    notMatchedGlobally
};

MatchResult matchComplex(const Complex& complex, std::size_t index, const Node& element);

bool matchesAnyOf(const std::vector<Complex>& list, const Node& element) {
    return std::any_of(list.begin(), list.end(), [&element](const Complex& complex) {
        return matchComplex(complex, complex.compounds.size() - 1, element) == MatchResult::matched;
    });
}

bool matchesPseudo(const Selector::PseudoCondition& pseudo, const Node& element) {
    switch (pseudo.kind) {
    case Selector::PseudoClass::firstChild:
        return siblingPosition(element, false, false) == 1;
    case Selector::PseudoClass::lastChild:
        return siblingPosition(element, false, true) == 1;
    case Selector::PseudoClass::onlyChild:
        return siblingPosition(element, false, false) == 1 && siblingPosition(element, false, true) == 1;
    case Selector::PseudoClass::firstOfType:
        return siblingPosition(element, true, false) == 1;
    case Selector::PseudoClass::lastOfType:
        return siblingPosition(element, true, true) == 1;
    case Selector::PseudoClass::onlyOfType:
        return siblingPosition(element, true, false) == 1 && siblingPosition(element, true, true) == 1;
    case Selector::PseudoClass::nthChild:
        return pseudo.nth.matches(siblingPosition(element, false, false));
    case Selector::PseudoClass::nthLastChild:
        return pseudo.nth.matches(siblingPosition(element, false, true));
    case Selector::PseudoClass::nthOfType:
        return pseudo.nth.matches(siblingPosition(element, true, false));
    case Selector::PseudoClass::nthLastOfType:
        return pseudo.nth.matches(siblingPosition(element, true, true));
    case Selector::PseudoClass::empty:
        return !element.hasContentChildren();
    case Selector::PseudoClass::root:
        return element.parent().isDocument();
    case Selector::PseudoClass::negation:
        return !matchesAnyOf(pseudo.arguments, element);
    case Selector::PseudoClass::matchesAny:
        return matchesAnyOf(pseudo.arguments, element);
    }
    return false;
}

bool matchesCompound(const Compound& compound, const Node& element) {
    if (!element.isElement()) {
        return false;
    }
    if (!compound.tag.empty() && element.name() != compound.tag) {
        return false;
    }
    if (!compound.ids.empty()) {
        auto id = element.attribute("id");
        if (!id) {
            return false;
        }
        for (const auto& expected : compound.ids) {
            if (*id != expected) {
                return false;
            }
        }
    }
    if (!compound.classes.empty()) {
        auto classes = element.attribute("class");
        if (!classes) {
            return false;
        }
        for (const auto& expected : compound.classes) {
            if (!containsToken(*classes, expected)) {
                return false;
            }
        }
    }
    for (const auto& attribute : compound.attributes) {
        if (!matchesAttribute(attribute, element)) {
            return false;
        }
    }
    for (const auto& pseudo : compound.pseudos) {
        if (!matchesPseudo(pseudo, element)) {
            return false;
        }
    }
    return true;
}

// Right-to-left: compounds[index] must match `element`, then the combinator
// to its left decides where compounds[index - 1] is searched. A failed
// descendant or sibling search is reported upwards so outer combinators do
// not retry candidates that cannot succeed.
MatchResult matchComplex(const Complex& complex, std::size_t index, const Node& element) {
    if (!matchesCompound(complex.compounds[index], element)) {
        return MatchResult::restartFromClosestLaterSibling;
    }
    if (index == 0) {
        return MatchResult::matched;
    }

    auto combinator = complex.combinators[index - 1];
    bool siblingCombinator = combinator == Selector::Combinator::adjacentSibling ||
                             combinator == Selector::Combinator::generalSibling;
    MatchResult exhausted = siblingCombinator ? MatchResult::restartFromClosestDescendant
                                              : MatchResult::notMatchedGlobally;

    Node candidate = element;
    while (true) {
        candidate = siblingCombinator ? candidate.previousElementSibling() : candidate.parentElement();
        if (!candidate) {
            return exhausted;
        }

        MatchResult result = matchComplex(complex, index - 1, candidate);
        if (result == MatchResult::matched || result == MatchResult::notMatchedGlobally ||
            combinator == Selector::Combinator::adjacentSibling) {
            return result;
        }
        if (combinator == Selector::Combinator::child) {
            return MatchResult::restartFromClosestDescendant;
        }
        if (combinator == Selector::Combinator::generalSibling &&
            result == MatchResult::restartFromClosestDescendant) {
            return result;
        }
    }
}

} // namespace

bool Selector::NthPattern::matches(int position) const noexcept {
    long long diff = static_cast<long long>(position) - offset;
    if (step == 0) {
        return diff == 0;
    }
    return diff % step == 0 && diff / step >= 0;
}

bool Selector::matches(const Node& element) const {
    return element.isElement() && matchesAnyOf(alternatives_, element);
}

std::vector<Node> Selector::select(const Node& scope) const {
    std::vector<Node> matched;
    for (Node current = scope.firstElementChild(); current; current = current.nextElementWithin(scope)) {
        if (matches(current)) {
            matched.push_back(current);
        }
    }
    return matched;
}

Node Selector::selectFirst(const Node& scope) const {
    for (Node current = scope.firstElementChild(); current; current = current.nextElementWithin(scope)) {
        if (matches(current)) {
            return current;
        }
    }
    return {};
}

} // namespace sthe::html
