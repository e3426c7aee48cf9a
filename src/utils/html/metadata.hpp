#pragma once
#include <map>
#include <optional>
#include <string>

namespace Spinner {
namespace Utils {
namespace Html {

struct PageMetadata {
    std::optional<std::string>         title;
    std::optional<std::string>         description;
    std::optional<std::string>         keywords;
    std::optional<std::string>         author;
    std::map<std::string, std::string> other;
};

// Reads <title> and <meta name|property=... content=...> tags. Missing tags leave fields empty.
PageMetadata extract_metadata(const std::string& html);

}  // namespace Html
}  // namespace Utils
}  // namespace Spinner
