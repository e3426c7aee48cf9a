#include "document.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Spinner {
namespace Core {

using json = nlohmann::json;

size_t Document::link_count() const {
    return links.size();
}

size_t Document::content_length() const {
    return content.size();
}

std::optional<std::string> Document::get_metadata(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end())
        return std::nullopt;
    return it->second;
}

// Invalid UTF-8 in scraped pages is replaced rather than failing the dump.
std::string Document::to_json() const {
    return json(*this).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string Document::to_json_pretty() const {
    return json(*this).dump(2, ' ', false, json::error_handler_t::replace);
}

Document Document::from_json(const std::string& text) {
    try {
        return json::parse(text).get<Document>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid document JSON: " + std::string(e.what()));
    }
}

void to_json(json& j, const Document& doc) {
    j = json{{"url", doc.url},
             {"title", doc.title},
             {"content", doc.content},
             {"links", doc.links},
             {"crawled_at", format_timestamp(doc.crawled_at)}};
    if (doc.description)
        j["description"] = *doc.description;
    if (doc.raw_html)
        j["raw_html"] = *doc.raw_html;
    if (!doc.metadata.empty())
        j["metadata"] = doc.metadata;
}

void from_json(const json& j, Document& doc) {
    j.at("url").get_to(doc.url);
    j.at("title").get_to(doc.title);
    j.at("content").get_to(doc.content);
    j.at("links").get_to(doc.links);
    doc.crawled_at = parse_timestamp(j.at("crawled_at").get<std::string>());

    doc.description.reset();
    if (j.contains("description") && !j["description"].is_null())
        doc.description = j["description"].get<std::string>();

    doc.raw_html.reset();
    if (j.contains("raw_html") && !j["raw_html"].is_null())
        doc.raw_html = j["raw_html"].get<std::string>();

    doc.metadata.clear();
    if (j.contains("metadata"))
        j["metadata"].get_to(doc.metadata);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    auto        seconds = time_point_cast<std::chrono::seconds>(tp);
    if (seconds > tp)
        seconds -= std::chrono::seconds(1);
    auto        millis  = duration_cast<milliseconds>(tp - seconds).count();
    std::time_t t       = system_clock::to_time_t(seconds);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);

    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>(millis));
    return std::string(buffer) + fraction;
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& text) {
    std::tm            tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        throw std::runtime_error("Invalid timestamp: " + text);

    // Fractional seconds are optional and may carry more than millisecond precision.
    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            int d = in.get() - '0';
            if (digits < 3)
                millis = millis * 10 + d;
            ++digits;
        }
        for (; digits < 3; ++digits)
            millis *= 10;
    }

    // Only UTC ("Z") is accepted; offsets are rejected rather than misread.
    if (in.get() != 'Z' || in.peek() != std::char_traits<char>::eof())
        throw std::runtime_error("Invalid timestamp (expected UTC 'Z'): " + text);

    std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

}  // namespace Core
}  // namespace Spinner
