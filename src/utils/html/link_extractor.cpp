#include "link_extractor.hpp"
#include <unordered_set>
#include "../url/url.hpp"
#include "gumbo_document.hpp"

namespace Spinner {
namespace Utils {
namespace Html {

namespace {

void collect_hrefs(const GumboNode* node, std::vector<std::string>& hrefs) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    if (is_html_element(node, GUMBO_TAG_A)) {
        if (const char* href = attribute_value(node, "href"))
            hrefs.emplace_back(href);
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_hrefs(static_cast<const GumboNode*>(children->data[i]), hrefs);
    }
}

}  // namespace

std::vector<std::string> LinkExtractor::extract_hrefs(const std::string& html) {
    std::vector<std::string> hrefs;
    if (html.empty())
        return hrefs;

    GumboDocument document = parse_document(html);
    collect_hrefs(document->root, hrefs);
    return hrefs;
}

std::vector<std::string> LinkExtractor::extract(const std::string& html, const std::string& base) {
    std::vector<std::string>        links;
    std::unordered_set<std::string> unique;

    for (const auto& href : extract_hrefs(html)) {
        if (!Url::is_crawlable(href))
            continue;

        auto absolute = Url::resolve(href, base);
        if (!absolute)
            continue;

        if (unique.insert(*absolute).second)
            links.push_back(std::move(*absolute));
    }
    return links;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Spinner
