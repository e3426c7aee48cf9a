#pragma once
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Spinner {
namespace Core {

// One crawled page. Built once by the crawler and never modified after export.
struct Document {
    std::string                           url;
    std::string                           title;
    std::optional<std::string>            description;
    std::string                           content;
    std::optional<std::string>            raw_html;
    std::vector<std::string>              links;
    std::chrono::system_clock::time_point crawled_at = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    std::map<std::string, std::string> metadata;

    size_t                     link_count() const;
    size_t                     content_length() const;
    std::optional<std::string> get_metadata(const std::string& key) const;

    std::string     to_json() const;
    std::string     to_json_pretty() const;
    static Document from_json(const std::string& json);
};

void to_json(nlohmann::json& j, const Document& doc);
void from_json(const nlohmann::json& j, Document& doc);

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T10:20:30.123Z
std::string                           format_timestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point parse_timestamp(const std::string& text);

}  // namespace Core
}  // namespace Spinner
