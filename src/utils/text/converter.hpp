#pragma once
#include <string>

namespace Spinner {
namespace Utils {
namespace Text {

class Converter {
public:
    static std::string to_markdown(const std::string& html);

    // Keeps at most two consecutive blank lines and trims the result.
    static std::string clean_markdown(const std::string& markdown);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Spinner
