#ifndef AGENTGRAPH_COMMON_NET_HTML_TEXT_H
#define AGENTGRAPH_COMMON_NET_HTML_TEXT_H

#include <string>
#include <vector>

namespace agentgraph {

struct HtmlLink {
    std::string href;
    std::string text;
    std::string css_class;
};

// Visible text of an HTML document. script/style/noscript/nav/footer/header/aside/iframe
// subtrees are skipped; whitespace is collapsed; result capped at max_chars (0 = no cap).
std::string html_to_text(const std::string& html, size_t max_chars = 0);

// Every <a href> in document order.
std::vector<HtmlLink> html_links(const std::string& html);

// Text of elements whose class attribute contains `css_class`, in document order.
std::vector<std::string> html_texts_by_class(const std::string& html, const std::string& css_class);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_NET_HTML_TEXT_H
