#include "html_fragment.hpp"
#include "config.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/tree.h>
#include <strings.h>

namespace x5 {

namespace {
    constexpr int PARSE_OPTIONS =
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

    htmlDocPtr parse_html(const std::string& html) {
        return htmlReadMemory(html.data(), static_cast<int>(html.size()),
                              nullptr, "UTF-8", PARSE_OPTIONS);
    }

    bool has_name(xmlNodePtr node, const char* name) {
        return node->type == XML_ELEMENT_NODE && node->name &&
               strcasecmp(reinterpret_cast<const char*>(node->name), name) == 0;
    }

    xmlNodePtr find_child(xmlNodePtr parent, const char* name) {
        if (!parent) return nullptr;
        for (xmlNodePtr child = parent->children; child; child = child->next) {
            if (has_name(child, name)) {
                return child;
            }
        }
        return nullptr;
    }

    std::string dump_node(htmlDocPtr doc, xmlNodePtr node) {
        xmlBufferPtr buffer = xmlBufferCreate();
        if (!buffer) return "";
        htmlNodeDump(buffer, doc, node);
        std::string result(reinterpret_cast<const char*>(xmlBufferContent(buffer)),
                           static_cast<size_t>(xmlBufferLength(buffer)));
        xmlBufferFree(buffer);
        return result;
    }

    bool is_text(xmlNodePtr node) {
        return node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE;
    }
}

std::string snippet_fragment(const std::string& html) {
    htmlDocPtr doc = parse_html(html);
    if (!doc) {
        return html;
    }

    xmlNodePtr root = xmlDocGetRootElement(doc);
    xmlNodePtr body = find_child(root, "body");
    if (!body) {
        xmlFreeDoc(doc);
        return html;
    }

    std::string result = SNIPPET_REVIEW_COMMENT;

    // Head elements keep the text that follows them; skipped ones drop it.
    xmlNodePtr head = find_child(root, "head");
    if (head) {
        bool keep_text = false;
        for (xmlNodePtr child = head->children; child; child = child->next) {
            if (is_text(child)) {
                if (keep_text) result += dump_node(doc, child);
                continue;
            }
            keep_text = false;
            if (child->type != XML_ELEMENT_NODE ||
                has_name(child, "meta") || has_name(child, "title")) {
                continue;
            }
            result += dump_node(doc, child);
            keep_text = true;
        }
    }

    for (xmlNodePtr child = body->children; child; child = child->next) {
        result += dump_node(doc, child);
    }

    xmlFreeDoc(doc);
    return result;
}

std::string strip_tags(const std::string& html) {
    htmlDocPtr doc = parse_html(html);
    if (!doc) {
        return html;
    }

    std::string result;
    xmlNodePtr root = xmlDocGetRootElement(doc);
    if (root) {
        xmlChar* text = xmlNodeGetContent(root);
        if (text) {
            result = reinterpret_cast<const char*>(text);
            xmlFree(text);
        }
    }
    xmlFreeDoc(doc);
    return result;
}

} // namespace x5
