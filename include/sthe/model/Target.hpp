#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sthe::model {

// What to pull out of a matched element.
class Target {
public:
    enum class Kind {
        text,
        html,
        outerHtml,
        attr
    };

    static Target text();
    static Target html();
    static Target outerHtml();
    static Target attr(std::string name);

    // Accepts "text", "html", "inner_html", "outer_html", "attr:<name>" and
    // "@<name>"; any other non-empty word names an attribute.
    static std::optional<Target> parse(std::string_view name);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& attribute() const noexcept { return attribute_; }

    std::string describe() const;

    bool operator==(const Target& other) const = default;

private:
    Target(Kind kind, std::string attribute);

    Kind kind_;
    std::string attribute_;
};

} // namespace sthe::model
