#pragma once

#include "sthe/html/Node.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

struct _xmlDoc;

namespace sthe::html {

class MalformedInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns a libxml2 HTML tree. Parsing is lenient: broken markup is repaired,
// never rejected. Only input the parser cannot be handed at all throws.
class Document {
public:
    enum class Kind {
        document,
        fragment
    };

    static Document parse(std::string_view html);
    // No implied html/head/body wrapper; top-level elements hang off the root.
    static Document parseFragment(std::string_view html);

    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    ~Document() = default;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // The document node; its descendants are the parsed content.
    Node root() const noexcept;

private:
    struct DocDeleter {
        void operator()(_xmlDoc* doc) const noexcept;
    };

    Document(Kind kind, _xmlDoc* doc) noexcept;

    static Document read(std::string_view html, Kind kind);

    Kind kind_;
    std::unique_ptr<_xmlDoc, DocDeleter> doc_;
};

} // namespace sthe::html
