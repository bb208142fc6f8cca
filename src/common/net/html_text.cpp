// common/net/html_text.cpp
#include "common/net/html_text.h"
#include "common/utils/text_utils.h"
#include <gumbo.h>
#include <memory>

namespace agentgraph {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};
using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

GumboDocument parse(const std::string& html) {
    return GumboDocument(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

bool is_skipped(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_TEMPLATE:
            return true;
        default:
            return false;
    }
}

bool is_block(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P: case GUMBO_TAG_DIV: case GUMBO_TAG_BR: case GUMBO_TAG_LI:
        case GUMBO_TAG_H1: case GUMBO_TAG_H2: case GUMBO_TAG_H3: case GUMBO_TAG_H4:
        case GUMBO_TAG_H5: case GUMBO_TAG_H6: case GUMBO_TAG_TR: case GUMBO_TAG_SECTION:
        case GUMBO_TAG_ARTICLE: case GUMBO_TAG_PRE: case GUMBO_TAG_BLOCKQUOTE: case GUMBO_TAG_TABLE:
            return true;
        default:
            return false;
    }
}

void extract_text(const GumboNode* node, std::string& out) {
    if (!node) return;
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
        out.append(node->v.text.text);
        out.push_back(' ');
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return;

    if (node->type == GUMBO_NODE_ELEMENT && is_skipped(node->v.element.tag)) return;

    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
        ? &node->v.document.children
        : &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        extract_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
    if (node->type == GUMBO_NODE_ELEMENT && is_block(node->v.element.tag)) {
        out.push_back('\n');
    }
}

std::string attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? std::string(attr->value) : std::string();
}

template <typename Visitor>
void walk_elements(const GumboNode* node, Visitor& visit) {
    if (!node || (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT)) return;
    if (node->type == GUMBO_NODE_ELEMENT && !visit(node)) return; // false: 不再深入
    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
        ? &node->v.document.children
        : &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        walk_elements(static_cast<const GumboNode*>(children->data[i]), visit);
    }
}

bool has_class(const GumboNode* node, const std::string& css_class) {
    std::string classes = " " + attribute(node, "class") + " ";
    return classes.find(" " + css_class + " ") != std::string::npos;
}

} // namespace

std::string html_to_text(const std::string& html, size_t max_chars) {
    GumboDocument doc = parse(html);
    std::string raw;
    extract_text(doc->document, raw);
    std::string text = collapse_whitespace(raw);
    return max_chars > 0 ? truncate(text, max_chars) : text;
}

std::vector<HtmlLink> html_links(const std::string& html) {
    GumboDocument doc = parse(html);
    std::vector<HtmlLink> links;
    auto visit = [&links](const GumboNode* node) {
        if (node->v.element.tag == GUMBO_TAG_A) {
            HtmlLink link;
            link.href = attribute(node, "href");
            link.css_class = attribute(node, "class");
            std::string raw;
            extract_text(node, raw);
            link.text = collapse_whitespace(raw);
            if (!link.href.empty()) links.push_back(std::move(link));
            return false;
        }
        return true;
    };
    walk_elements(doc->document, visit);
    return links;
}

std::vector<std::string> html_texts_by_class(const std::string& html, const std::string& css_class) {
    GumboDocument doc = parse(html);
    std::vector<std::string> texts;
    auto visit = [&](const GumboNode* node) {
        if (has_class(node, css_class)) {
            std::string raw;
            extract_text(node, raw);
            texts.push_back(collapse_whitespace(raw));
            return false;
        }
        return true;
    };
    walk_elements(doc->document, visit);
    return texts;
}

} // namespace agentgraph
