#pragma once
#include <gumbo.h>
#include <memory>
#include <string>

namespace Spinner {
namespace Utils {
namespace Html {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

inline GumboDocument parse_document(const std::string& html) {
    return GumboDocument(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

inline bool is_html_element(const GumboNode* node, GumboTag tag) {
    return node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag
           && node->v.element.tag_namespace == GUMBO_NAMESPACE_HTML;
}

inline const char* attribute_value(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Spinner
