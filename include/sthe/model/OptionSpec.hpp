#pragma once

#include "sthe/model/Target.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sthe::model {

// Declarative description of one extraction. Children are kept in the order
// they were declared; when present they replace target, regex and trim.
struct OptionSpec {
    using Children = std::vector<std::pair<std::string, OptionSpec>>;

    std::string selector;
    Target target{Target::text()};
    bool many{false};
    std::optional<std::string> regex;
    bool trim{true};
    Children children;
};

} // namespace sthe::model
