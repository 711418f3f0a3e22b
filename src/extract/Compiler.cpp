#include "sthe/extract/Compiler.hpp"
#include "sthe/util/Logging.hpp"

#include <set>

namespace sthe::extract {

CompileError::CompileError(Type type, std::string path, const std::string& message)
    : std::runtime_error(path.empty() ? message : path + ": " + message)
    , type_(type)
    , path_(std::move(path)) {}

CompiledOption::CompiledOption(html::Selector selector, model::Target target, bool many)
    : selector_(std::move(selector))
    , target_(std::move(target))
    , many_(many) {}

const CompiledOption* CompiledOption::child(std::string_view name) const {
    for (const auto& [key, option] : children_) {
        if (key == name) {
            return &option;
        }
    }
    return nullptr;
}

std::string CompiledOption::describe() const {
    std::string out = selector_.source();
    if (many_) {
        out += " [many]";
    }
    if (hasChildren()) {
        out += " -> {";
        bool first = true;
        for (const auto& [name, option] : children_) {
            out += first ? "" : ", ";
            first = false;
            out += name;
        }
        out += "}";
    } else {
        out += " -> " + target_.describe();
        if (pattern_) {
            out += " ~ regex";
        }
    }
    return out;
}

class Compiler {
public:
    CompiledOption compile(const model::OptionSpec& spec, const std::string& path) {
        if (spec.selector.empty()) {
            throw CompileError(CompileError::Type::empty_selector, path, "selector is empty");
        }

        std::optional<html::Selector> selector;
        try {
            selector = html::Selector::parse(spec.selector);
        } catch (const html::SelectorError& ex) {
            throw CompileError(CompileError::Type::invalid_selector,
                               path,
                               "invalid selector `" + spec.selector + "`: " + ex.what());
        }

        CompiledOption option{std::move(*selector), spec.target, spec.many};
        option.trim_ = spec.trim;

        // Target and regex only apply to leaves; options with children ignore them.
        if (spec.children.empty()) {
            if (spec.target.kind() == model::Target::Kind::attr && spec.target.attribute().empty()) {
                throw CompileError(CompileError::Type::invalid_target, path, "attribute target needs a name");
            }
            if (spec.regex) {
                try {
                    option.pattern_.emplace(*spec.regex, boost::regex::ECMAScript);
                } catch (const boost::regex_error& ex) {
                    throw CompileError(CompileError::Type::invalid_regex,
                                       path,
                                       "invalid regex `" + *spec.regex + "`: " + ex.what());
                }
            }
        }

        std::set<std::string> seen;
        option.children_.reserve(spec.children.size());
        for (const auto& [name, childSpec] : spec.children) {
            std::string childPath = path.empty() ? name : path + "." + name;
            if (!seen.insert(name).second) {
                throw CompileError(CompileError::Type::duplicate_child, childPath, "child declared twice");
            }
            option.children_.emplace_back(name, compile(childSpec, childPath));
        }
        return option;
    }
};

CompiledOption compile(const model::OptionSpec& spec) {
    Compiler compiler;
    auto option = compiler.compile(spec, {});
    if (util::shouldLog(util::LogLevel::debug)) {
        util::log(util::LogLevel::debug, "compiled extraction option: " + option.describe());
    }
    return option;
}

} // namespace sthe::extract
