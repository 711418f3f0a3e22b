#pragma once

#include <optional>
#include <string>
#include <string_view>

struct _xmlNode;

namespace sthe::html {

// Non-owning view of a node in a parsed Document. Valid while the Document
// that produced it is alive. A default-constructed Node is null.
class Node {
public:
    Node() = default;
    explicit Node(_xmlNode* native) noexcept
        : node_(native) {}

    explicit operator bool() const noexcept { return node_ != nullptr; }
    bool operator==(const Node& other) const noexcept = default;

    [[nodiscard]] _xmlNode* native() const noexcept { return node_; }

    bool isElement() const noexcept;
    bool isDocument() const noexcept;

    // Lower-case local name for elements, empty otherwise.
    std::string_view name() const noexcept;

    // Attribute names are matched ASCII case-insensitively. A present attribute
    // without a value reads as an empty string.
    std::optional<std::string> attribute(std::string_view name) const;
    bool hasAttribute(std::string_view name) const;

    Node parent() const noexcept;
    Node parentElement() const noexcept;
    Node firstChild() const noexcept;
    Node nextSibling() const noexcept;
    Node firstElementChild() const noexcept;
    Node previousElementSibling() const noexcept;
    Node nextElementSibling() const noexcept;

    // Next element after this one in document order, not leaving `scope`.
    Node nextElementWithin(const Node& scope) const noexcept;

    // True when the node has element, text or CDATA children.
    bool hasContentChildren() const noexcept;

    // Concatenated text and CDATA content of all descendants, document order.
    std::string text() const;
    std::string innerHtml() const;
    std::string outerHtml() const;

private:
    _xmlNode* node_{nullptr};
};

} // namespace sthe::html
