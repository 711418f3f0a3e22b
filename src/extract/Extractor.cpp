#include "sthe/extract/Extractor.hpp"
#include "sthe/util/Logging.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace sthe::extract {
namespace {

bool isHtmlSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trimCopy(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size() && isHtmlSpace(value[begin])) {
        ++begin;
    }
    std::size_t end = value.size();
    while (end > begin && isHtmlSpace(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::optional<std::string> applyTarget(const html::Node& node, const model::Target& target) {
    switch (target.kind()) {
    case model::Target::Kind::text: return node.text();
    case model::Target::Kind::html: return node.innerHtml();
    case model::Target::Kind::outerHtml: return node.outerHtml();
    case model::Target::Kind::attr: return node.attribute(target.attribute());
    }
    return std::nullopt;
}

std::optional<std::string> applyPattern(const boost::regex& pattern, const std::string& text) {
    boost::smatch match;
    if (!boost::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    if (match.size() == 1) {
        return match.str(0);
    }
    if (!match[1].matched) {
        return std::nullopt;
    }
    return match.str(1);
}

model::Value leafFor(const html::Node& node, const CompiledOption& option) {
    auto text = applyTarget(node, option.target());
    if (!text) {
        return model::Value::leaf(std::nullopt);
    }
    if (option.trim()) {
        *text = trimCopy(*text);
    }
    if (const auto& pattern = option.pattern()) {
        // Boost.Regex gives up on pathological matches instead of exhausting
        // the stack; such a leaf is absent.
        try {
            return model::Value::leaf(applyPattern(*pattern, *text));
        } catch (const std::runtime_error& ex) {
            util::log(util::LogLevel::debug, std::string{"regex abandoned: "} + ex.what());
            return model::Value::leaf(std::nullopt);
        }
    }
    return model::Value::leaf(std::move(text));
}

model::Value singleNode(const html::Node& node, const CompiledOption& option) {
    if (!option.hasChildren()) {
        return leafFor(node, option);
    }
    model::Value::Map entries;
    entries.reserve(option.children().size());
    for (const auto& [name, child] : option.children()) {
        entries.emplace_back(name, evaluate(node, child));
    }
    return model::Value::map(std::move(entries));
}

} // namespace

model::Value absentValue(const CompiledOption& option) {
    if (option.many()) {
        return model::Value::list({});
    }
    if (!option.hasChildren()) {
        return model::Value::leaf(std::nullopt);
    }
    model::Value::Map entries;
    entries.reserve(option.children().size());
    for (const auto& [name, child] : option.children()) {
        entries.emplace_back(name, absentValue(child));
    }
    return model::Value::map(std::move(entries));
}

model::Value evaluate(const html::Node& root, const CompiledOption& option) {
    if (option.many()) {
        model::Value::List items;
        for (const auto& node : option.selector().select(root)) {
            items.push_back(singleNode(node, option));
        }
        return model::Value::list(std::move(items));
    }

    html::Node first = option.selector().selectFirst(root);
    if (!first) {
        return absentValue(option);
    }
    return singleNode(first, option);
}

model::Value extractDocument(std::string_view document, const CompiledOption& option) {
    auto parsed = html::Document::parse(document);
    return evaluate(parsed.root(), option);
}

model::Value extractFragment(std::string_view fragment, const CompiledOption& option) {
    auto parsed = html::Document::parseFragment(fragment);
    return evaluate(parsed.root(), option);
}

} // namespace sthe::extract
