#include "html_link_extractor.hpp"
#include <gumbo.h>
#include <vector>

namespace Spindle {
namespace Utils {
namespace Text {

namespace {

bool carries_link(const GumboElement& element) {
    return element.tag == GUMBO_TAG_A || element.tag == GUMBO_TAG_AREA;
}

// Iterative walk; hostile pages can nest deeper than the call stack allows.
void collect_links(GumboNode* root, std::vector<std::string>& links) {
    std::vector<GumboNode*> pending{root};
    while (!pending.empty()) {
        GumboNode* node = pending.back();
        pending.pop_back();

        if (node == nullptr
            || (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE))
            continue;

        const GumboElement& element = node->v.element;
        if (carries_link(element)) {
            GumboAttribute* href = gumbo_get_attribute(&element.attributes, "href");
            if (href) {
                links.emplace_back(href->value);
            }
        }

        const GumboVector* children = &element.children;
        for (unsigned int i = children->length; i > 0; --i) {
            pending.push_back(static_cast<GumboNode*>(children->data[i - 1]));
        }
    }
}

}  // namespace

std::vector<std::string> HtmlLinkExtractor::extract_links(const std::string& body) const {
    std::vector<std::string> links;
    if (body.empty())
        return links;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, body.data(), body.size());
    if (output == nullptr)
        return links;

    collect_links(output->root, links);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return links;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Spindle
