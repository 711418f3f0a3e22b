#include "sthe/model/Target.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sthe::model {
namespace {
std::string lowerAscii(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}
}

Target::Target(Kind kind, std::string attribute)
    : kind_(kind)
    , attribute_(std::move(attribute)) {}

Target Target::text() {
    return Target{Kind::text, {}};
}

Target Target::html() {
    return Target{Kind::html, {}};
}

Target Target::outerHtml() {
    return Target{Kind::outerHtml, {}};
}

Target Target::attr(std::string name) {
    return Target{Kind::attr, lowerAscii(name)};
}

std::optional<Target> Target::parse(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name == "text") return text();
    if (name == "html" || name == "inner_html") return html();
    if (name == "outer_html") return outerHtml();

    std::string_view attribute = name;
    if (attribute.rfind("attr:", 0) == 0) {
        attribute.remove_prefix(5);
    } else if (attribute.front() == '@') {
        attribute.remove_prefix(1);
    }
    if (attribute.empty()) {
        return std::nullopt;
    }
    return attr(std::string(attribute));
}

std::string Target::describe() const {
    switch (kind_) {
    case Kind::text: return "text";
    case Kind::html: return "html";
    case Kind::outerHtml: return "outer_html";
    case Kind::attr: return "attr:" + attribute_;
    }
    return "text";
}

} // namespace sthe::model
