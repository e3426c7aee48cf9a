#include "url.hpp"
#include <cctype>
#include <cstring>
#include <vector>
#include "../text/string_utils.hpp"

namespace Spinner {
namespace Utils {

using namespace Spinner::Utils::Text;

namespace {

constexpr const char* SCHEME_SEPARATOR = "://";

const char* const NON_NAVIGABLE_SCHEMES[] = {"javascript:", "mailto:", "tel:", "data:"};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void strip_default_port(const std::string& scheme, std::string& authority) {
    const char* port = nullptr;
    if (scheme == "http")
        port = ":80";
    else if (scheme == "https")
        port = ":443";
    if (!port)
        return;

    size_t len = std::strlen(port);
    while (ends_with(authority, port))
        authority.resize(authority.size() - len);
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":" before any "/?#".
bool has_scheme(const std::string& reference) {
    size_t colon = reference.find(':');
    if (colon == std::string::npos || colon == 0)
        return false;

    size_t delimiter = reference.find_first_of("/?#");
    if (delimiter != std::string::npos && delimiter < colon)
        return false;

    if (!std::isalpha(static_cast<unsigned char>(reference[0])))
        return false;
    for (size_t i = 1; i < colon; ++i) {
        char c = reference[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return true;
}

}  // namespace

std::string Url::normalize(const std::string& url) {
    std::string s = to_lower(trim(url));

    size_t fragment = s.find('#');
    if (fragment != std::string::npos)
        s.resize(fragment);
    s = trim(s);
    if (s.empty())
        return s;

    size_t scheme_end = s.find(SCHEME_SEPARATOR);
    if (scheme_end == std::string::npos) {
        while (s.size() > 1 && (s.back() == '/' || is_space(s.back())))
            s.pop_back();
        return s;
    }

    std::string scheme     = s.substr(0, scheme_end);
    size_t      auth_start = scheme_end + 3;
    size_t      auth_end   = s.find_first_of("/?", auth_start);

    std::string authority = auth_end == std::string::npos
                                ? s.substr(auth_start)
                                : s.substr(auth_start, auth_end - auth_start);
    std::string rest = auth_end == std::string::npos ? "" : s.substr(auth_end);

    strip_default_port(scheme, authority);

    if (rest.empty() || rest[0] == '?')
        rest.insert(0, "/");

    if (rest.find('?') == std::string::npos) {
        while (rest.size() > 1 && (rest.back() == '/' || is_space(rest.back())))
            rest.pop_back();
    }

    return scheme + SCHEME_SEPARATOR + authority + rest;
}

std::optional<std::string> Url::host_of(const std::string& url) {
    size_t      scheme_end = url.find(SCHEME_SEPARATOR);
    std::string rest       = scheme_end == std::string::npos ? url : url.substr(scheme_end + 3);

    std::string host = rest.substr(0, rest.find_first_of("/?#"));

    size_t at = host.find_last_of('@');
    if (at != std::string::npos)
        host = host.substr(at + 1);

    if (!host.empty() && host[0] == '[') {
        size_t end_bracket = host.find(']');
        if (end_bracket != std::string::npos)
            host = host.substr(0, end_bracket + 1);
    }
    else {
        size_t colon = host.find(':');
        if (colon != std::string::npos)
            host = host.substr(0, colon);
    }

    if (host.empty())
        return std::nullopt;
    return host;
}

std::optional<UrlParsed> Url::parse_base(const std::string& base) {
    std::string b          = trim(base);
    size_t      scheme_end = b.find(SCHEME_SEPARATOR);
    if (scheme_end == std::string::npos || scheme_end == 0)
        return std::nullopt;

    UrlParsed parsed;
    parsed.scheme = b.substr(0, scheme_end);

    std::string rest     = b.substr(scheme_end + 3);
    size_t      host_end = rest.find_first_of("/?#");
    parsed.host          = rest.substr(0, host_end);
    if (parsed.host.empty())
        return std::nullopt;

    std::string path = host_end == std::string::npos ? "" : rest.substr(host_end);
    size_t      qf   = path.find_first_of("?#");
    if (qf != std::string::npos)
        path.resize(qf);

    parsed.path = path.empty() ? "/" : path;
    return parsed;
}

std::optional<std::string> Url::resolve(const std::string& reference, const std::string& base) {
    std::string ref = clean(reference);
    if (ref.empty())
        return std::nullopt;

    if (istarts_with(ref, "http://") || istarts_with(ref, "https://"))
        return ref;

    std::string b = trim(base);
    if (starts_with(ref, "//")) {
        std::string scheme = istarts_with(b, "https://") ? "https:" : "http:";
        return scheme + ref;
    }

    if (has_scheme(ref))
        return std::nullopt;

    auto parsed = parse_base(b);
    if (!parsed)
        return std::nullopt;

    std::string origin = parsed->scheme + SCHEME_SEPARATOR + parsed->host;

    if (ref[0] == '/')
        return origin + ref;

    if (ref[0] == '?')
        return origin + parsed->path + ref;

    std::string dir = parsed->path;
    if (!ends_with(dir, "/")) {
        size_t last_slash = dir.find_last_of('/');
        dir = last_slash == std::string::npos ? "/" : dir.substr(0, last_slash + 1);
    }

    return clean(resolve_path(origin + dir + ref));
}

std::string Url::resolve_path(const std::string& url) {
    size_t scheme_end = url.find(SCHEME_SEPARATOR);
    if (scheme_end == std::string::npos)
        return url;

    size_t path_start = url.find_first_of("/?#", scheme_end + 3);
    if (path_start == std::string::npos || url[path_start] != '/')
        return url;

    std::string origin = url.substr(0, path_start);
    std::string path   = url.substr(path_start);
    std::string query;
    size_t      q = path.find('?');
    if (q != std::string::npos) {
        query = path.substr(q);
        path.resize(q);
    }

    std::vector<std::string> resolved;
    for (const auto& part : split(path, '/')) {
        if (part == "." || part.empty()) {
            if (resolved.empty())
                resolved.emplace_back();
        }
        else if (part == "..") {
            if (resolved.size() > 1)
                resolved.pop_back();
        }
        else {
            resolved.push_back(part);
        }
    }

    std::string joined;
    for (size_t i = 0; i < resolved.size(); ++i) {
        if (i > 0)
            joined += '/';
        joined += resolved[i];
    }
    if (joined.empty())
        joined = "/";

    return origin + joined + query;
}

std::string Url::clean(const std::string& url) {
    size_t fragment = url.find('#');
    return trim(fragment == std::string::npos ? url : url.substr(0, fragment));
}

bool Url::is_crawlable(const std::string& reference) {
    std::string ref = trim(reference);
    if (ref.empty() || ref[0] == '#')
        return false;

    for (const char* scheme : NON_NAVIGABLE_SCHEMES) {
        if (istarts_with(ref, scheme))
            return false;
    }
    return true;
}

}  // namespace Utils
}  // namespace Spinner
