#include "sthe/html/Document.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <mutex>
#include <new>
#include <string>

namespace sthe::html {
namespace {

constexpr int kBaseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

// Fragments are parsed inside an open body so that top-level character data
// is not wrapped in an implied paragraph.
constexpr std::string_view kFragmentPrefix = "<html><body>";

void ensureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

xmlNode* firstElementNamed(xmlNode* node, const char* name) {
    for (; node != nullptr; node = node->next) {
        if (node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, BAD_CAST name)) {
            return node;
        }
    }
    return nullptr;
}

// Moves the body's children up to the document node and drops the wrapper,
// leaving only what the fragment itself contained.
void unwrapFragment(htmlDocPtr doc) {
    xmlNode* html = xmlDocGetRootElement(doc);
    if (!html) {
        return;
    }
    xmlNode* body = firstElementNamed(html->children, "body");
    if (!body) {
        throw MalformedInputError("HTML parser lost the fragment body");
    }
    xmlNode* child = body->children;
    while (child != nullptr) {
        xmlNode* next = child->next;
        xmlUnlinkNode(child);
        xmlAddChild(reinterpret_cast<xmlNode*>(doc), child);
        child = next;
    }
    xmlUnlinkNode(html);
    xmlFreeNode(html);
}

} // namespace

void Document::DocDeleter::operator()(_xmlDoc* doc) const noexcept {
    xmlFreeDoc(doc);
}

Document::Document(Kind kind, _xmlDoc* doc) noexcept
    : kind_(kind)
    , doc_(doc) {}

Document Document::parse(std::string_view html) {
    return read(html, Kind::document);
}

Document Document::parseFragment(std::string_view html) {
    return read(html, Kind::fragment);
}

Document Document::read(std::string_view html, Kind kind) {
    ensureParserInitialized();

    if (html.size() > static_cast<std::size_t>(INT_MAX) - kFragmentPrefix.size()) {
        throw MalformedInputError("HTML input exceeds the parser size limit");
    }

    if (html.empty()) {
        htmlDocPtr empty = htmlNewDocNoDtD(nullptr, nullptr);
        if (!empty) {
            throw std::bad_alloc();
        }
        return Document{kind, empty};
    }

    if (kind == Kind::document) {
        htmlDocPtr doc = htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8", kBaseOptions);
        if (!doc) {
            throw MalformedInputError("HTML parser rejected the input");
        }
        return Document{kind, doc};
    }

    std::string wrapped;
    wrapped.reserve(kFragmentPrefix.size() + html.size());
    wrapped.append(kFragmentPrefix);
    wrapped.append(html);
    htmlDocPtr doc = htmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()), nullptr, "UTF-8",
                                    kBaseOptions | HTML_PARSE_NODEFDTD);
    if (!doc) {
        throw MalformedInputError("HTML parser rejected the input");
    }
    Document document{kind, doc};
    unwrapFragment(doc);
    return document;
}

Node Document::root() const noexcept {
    return Node{reinterpret_cast<xmlNode*>(doc_.get())};
}

} // namespace sthe::html
