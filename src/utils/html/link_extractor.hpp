#pragma once
#include <string>
#include <vector>

namespace Spinner {
namespace Utils {
namespace Html {

class LinkExtractor {
public:
    // Raw href values of every <a> element, in document order.
    static std::vector<std::string> extract_hrefs(const std::string& html);

    // Crawlable hrefs resolved against `base`, deduplicated, first occurrence first.
    static std::vector<std::string> extract(const std::string& html, const std::string& base);
};

}  // namespace Html
}  // namespace Utils
}  // namespace Spinner
