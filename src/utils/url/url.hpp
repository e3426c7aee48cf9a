#pragma once
#include <optional>
#include <string>

namespace Spinner {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;  // includes ":port" when present
    std::string path;
};

class Url {
public:
    // Canonical form used as the dedup key: lowercased, fragment stripped, default port
    // stripped, trailing slashes stripped from non-root paths, empty path rendered as "/".
    // normalize(normalize(x)) == normalize(x).
    static std::string normalize(const std::string& url);

    // Host without scheme, userinfo or port; nullopt when there is none.
    static std::optional<std::string> host_of(const std::string& url);

    static std::optional<UrlParsed> parse_base(const std::string& base);

    // Turns an href found on `base` into an absolute, fragment-free URL.
    static std::optional<std::string> resolve(const std::string& reference, const std::string& base);

    // Collapses "." and ".." segments; never climbs above the path root.
    static std::string resolve_path(const std::string& url);
    static std::string clean(const std::string& url);

    // False for empty, fragment-only and javascript:/mailto:/tel:/data: references.
    static bool is_crawlable(const std::string& reference);
};

}  // namespace Utils
}  // namespace Spinner
