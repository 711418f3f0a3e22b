#pragma once

#include "sthe/html/Selector.hpp"
#include "sthe/model/OptionSpec.hpp"
#include "sthe/model/Target.hpp"

#include <boost/regex.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sthe::extract {

// Raised when an OptionSpec cannot be compiled. Never raised by evaluation.
class CompileError : public std::runtime_error {
public:
    enum class Type {
        empty_selector,
        invalid_selector,
        invalid_target,
        invalid_regex,
        duplicate_child,
    };

    CompileError(Type type, std::string path, const std::string& message);

    [[nodiscard]] Type type() const noexcept { return type_; }

    // Dotted child names leading to the failing option; empty for the root.
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    Type type_;
    std::string path_;
};

// Validated, ready-to-evaluate form of an OptionSpec. Immutable once built, so
// a single instance may be evaluated from several threads at the same time.
class CompiledOption {
public:
    using Children = std::vector<std::pair<std::string, CompiledOption>>;

    [[nodiscard]] const html::Selector& selector() const noexcept { return selector_; }
    [[nodiscard]] const model::Target& target() const noexcept { return target_; }
    [[nodiscard]] bool many() const noexcept { return many_; }
    [[nodiscard]] bool trim() const noexcept { return trim_; }
    [[nodiscard]] const std::optional<boost::regex>& pattern() const noexcept { return pattern_; }
    [[nodiscard]] const Children& children() const noexcept { return children_; }
    [[nodiscard]] bool hasChildren() const noexcept { return !children_.empty(); }

    const CompiledOption* child(std::string_view name) const;

    // One-line summary for logs, e.g. `li [many] -> text`.
    std::string describe() const;

private:
    friend class Compiler;

    CompiledOption(html::Selector selector, model::Target target, bool many);

    html::Selector selector_;
    model::Target target_;
    bool many_;
    bool trim_{true};
    std::optional<boost::regex> pattern_;
    Children children_;
};

// Compiles `spec` and all of its children, depth-first in declaration order.
// The first failure aborts the whole compilation.
CompiledOption compile(const model::OptionSpec& spec);

} // namespace sthe::extract
