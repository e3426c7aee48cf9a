#include "metadata.hpp"
#include "../text/string_utils.hpp"
#include "gumbo_document.hpp"

namespace Spinner {
namespace Utils {
namespace Html {

using namespace Spinner::Utils::Text;

namespace {

std::string text_of(const GumboNode* node) {
    std::string         text;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        const auto* child = static_cast<const GumboNode*>(children->data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE
            || child->type == GUMBO_NODE_CDATA) {
            text += child->v.text.text;
        }
    }
    return text;
}

void read_meta(const GumboNode* node, PageMetadata& metadata) {
    const char* name    = attribute_value(node, "name");
    const char* content = attribute_value(node, "content");
    if (!name)
        name = attribute_value(node, "property");
    if (!name || !content)
        return;

    std::string key = name;
    std::string lowered = to_lower(key);
    if (lowered == "description")
        metadata.description = content;
    else if (lowered == "keywords")
        metadata.keywords = content;
    else if (lowered == "author")
        metadata.author = content;
    else
        metadata.other[key] = content;
}

void walk(const GumboNode* node, PageMetadata& metadata) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (is_html_element(node, GUMBO_TAG_TITLE)) {
        if (!metadata.title)
            metadata.title = trim(text_of(node));
        return;
    }
    if (is_html_element(node, GUMBO_TAG_META)) {
        read_meta(node, metadata);
        return;
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        walk(static_cast<const GumboNode*>(children->data[i]), metadata);
    }
}

}  // namespace

PageMetadata extract_metadata(const std::string& html) {
    PageMetadata metadata;
    if (html.empty())
        return metadata;

    GumboDocument document = parse_document(html);
    walk(document->root, metadata);
    return metadata;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Spinner
