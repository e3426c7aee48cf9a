#include "converter.hpp"
#include <string>
#include "html2md.h"
#include "string_utils.hpp"

namespace Spinner {
namespace Utils {
namespace Text {

namespace {
constexpr int MAX_BLANK_LINES = 2;
}  // namespace

std::string Converter::to_markdown(const std::string& html) {
    if (trim(html).empty())
        return "";
    return clean_markdown(html2md::Convert(html));
}

std::string Converter::clean_markdown(const std::string& markdown) {
    std::string result;
    int         blank_count = 0;

    for (auto& line : split(markdown, '\n')) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (trim(line).empty()) {
            if (++blank_count <= MAX_BLANK_LINES)
                result += '\n';
            continue;
        }

        blank_count = 0;
        result += line;
        result += '\n';
    }

    return trim(result);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Spinner
