#include "sthe/html/Node.hpp"

#include <libxml/HTMLtree.h>
#include <libxml/tree.h>
#include <libxml/xmlIO.h>

#include <memory>
#include <new>

namespace sthe::html {
namespace {

const char* asChars(const xmlChar* value) {
    return reinterpret_cast<const char*>(value);
}

bool isContentNode(const xmlNode* node) {
    return node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE;
}

bool equalsIgnoreCase(std::string_view lhs, const xmlChar* rhs) {
    std::string_view other{asChars(rhs)};
    if (lhs.size() != other.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        auto a = static_cast<unsigned char>(lhs[i]);
        auto b = static_cast<unsigned char>(other[i]);
        if (a >= 'A' && a <= 'Z') a = static_cast<unsigned char>(a + 32);
        if (b >= 'A' && b <= 'Z') b = static_cast<unsigned char>(b + 32);
        if (a != b) {
            return false;
        }
    }
    return true;
}

xmlAttr* findAttribute(xmlNode* node, std::string_view name) {
    if (!node || node->type != XML_ELEMENT_NODE) {
        return nullptr;
    }
    for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        if (equalsIgnoreCase(name, attr->name)) {
            return attr;
        }
    }
    return nullptr;
}

void appendText(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (isContentNode(child)) {
            if (child->content) {
                out += asChars(child->content);
            }
        } else if (child->type == XML_ELEMENT_NODE || child->type == XML_ENTITY_REF_NODE) {
            appendText(child, out);
        }
    }
}

struct OutputBufferCloser {
    void operator()(xmlOutputBuffer* buffer) const noexcept {
        xmlOutputBufferClose(buffer);
    }
};

void dumpNode(xmlNode* node, std::string& out) {
    std::unique_ptr<xmlOutputBuffer, OutputBufferCloser> buffer{xmlAllocOutputBuffer(nullptr)};
    if (!buffer) {
        throw std::bad_alloc();
    }
    htmlNodeDumpFormatOutput(buffer.get(), node->doc, node, nullptr, 0);
    xmlOutputBufferFlush(buffer.get());
    const xmlChar* content = xmlOutputBufferGetContent(buffer.get());
    std::size_t size = xmlOutputBufferGetSize(buffer.get());
    if (content && size > 0) {
        out.append(asChars(content), size);
    }
}

} // namespace

bool Node::isElement() const noexcept {
    return node_ && node_->type == XML_ELEMENT_NODE;
}

bool Node::isDocument() const noexcept {
    return node_ && (node_->type == XML_HTML_DOCUMENT_NODE || node_->type == XML_DOCUMENT_NODE);
}

std::string_view Node::name() const noexcept {
    if (!isElement() || !node_->name) {
        return {};
    }
    return asChars(node_->name);
}

std::optional<std::string> Node::attribute(std::string_view name) const {
    xmlAttr* attr = findAttribute(node_, name);
    if (!attr) {
        return std::nullopt;
    }
    std::string value;
    if (attr->children) {
        xmlChar* raw = xmlNodeListGetString(node_->doc, attr->children, 1);
        if (raw) {
            value = asChars(raw);
            xmlFree(raw);
        }
    }
    return value;
}

bool Node::hasAttribute(std::string_view name) const {
    return findAttribute(node_, name) != nullptr;
}

Node Node::parent() const noexcept {
    return node_ ? Node{node_->parent} : Node{};
}

Node Node::parentElement() const noexcept {
    if (!node_ || !node_->parent || node_->parent->type != XML_ELEMENT_NODE) {
        return {};
    }
    return Node{node_->parent};
}

Node Node::firstChild() const noexcept {
    return node_ ? Node{node_->children} : Node{};
}

Node Node::nextSibling() const noexcept {
    return node_ ? Node{node_->next} : Node{};
}

Node Node::firstElementChild() const noexcept {
    if (!node_) {
        return {};
    }
    for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            return Node{child};
        }
    }
    return {};
}

Node Node::previousElementSibling() const noexcept {
    if (!node_) {
        return {};
    }
    for (xmlNode* sibling = node_->prev; sibling != nullptr; sibling = sibling->prev) {
        if (sibling->type == XML_ELEMENT_NODE) {
            return Node{sibling};
        }
    }
    return {};
}

Node Node::nextElementSibling() const noexcept {
    if (!node_) {
        return {};
    }
    for (xmlNode* sibling = node_->next; sibling != nullptr; sibling = sibling->next) {
        if (sibling->type == XML_ELEMENT_NODE) {
            return Node{sibling};
        }
    }
    return {};
}

Node Node::nextElementWithin(const Node& scope) const noexcept {
    if (!node_) {
        return {};
    }
    if (Node child = firstElementChild()) {
        return child;
    }
    for (Node current = *this; current && current != scope; current = current.parent()) {
        if (Node sibling = current.nextElementSibling()) {
            return sibling;
        }
    }
    return {};
}

bool Node::hasContentChildren() const noexcept {
    if (!node_) {
        return false;
    }
    for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE || isContentNode(child)) {
            return true;
        }
    }
    return false;
}

std::string Node::text() const {
    std::string out;
    if (node_) {
        appendText(node_, out);
    }
    return out;
}

std::string Node::innerHtml() const {
    std::string out;
    if (!node_) {
        return out;
    }
    for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
        dumpNode(child, out);
    }
    return out;
}

std::string Node::outerHtml() const {
    std::string out;
    if (node_) {
        dumpNode(node_, out);
    }
    return out;
}

} // namespace sthe::html
