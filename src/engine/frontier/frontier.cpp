#include "frontier.hpp"
#include <algorithm>
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Spinner {
namespace Engine {

using Spinner::Utils::Url;

Frontier::Frontier(const std::string& seed, FrontierLimits limits) : limits_(std::move(limits)) {
    if (limits_.allowed_domains) {
        for (auto& domain : *limits_.allowed_domains)
            domain = Url::host_of(Utils::Text::to_lower(Utils::Text::trim(domain))).value_or("");
    }
    admit(Url::normalize(seed));
}

bool Frontier::add(const std::string& url) {
    std::string canonical = Url::normalize(url);
    if (canonical.empty())
        return false;

    if (seen_.count(canonical))
        return false;

    if (limits_.allowed_domains && !is_allowed_host(canonical))
        return false;

    if (limits_.max_pages && seen_.size() >= *limits_.max_pages)
        return false;

    admit(std::move(canonical));
    return true;
}

std::optional<std::string> Frontier::next() {
    if (limits_.max_pages) {
        std::size_t processed = seen_.size() - queue_.size();
        if (processed >= *limits_.max_pages)
            return std::nullopt;
    }

    if (queue_.empty())
        return std::nullopt;

    std::string url = std::move(queue_.front());
    queue_.pop_front();
    return url;
}

bool Frontier::has_pending() const {
    return !queue_.empty();
}

bool Frontier::is_seen(const std::string& url) const {
    return seen_.count(Url::normalize(url)) > 0;
}

std::size_t Frontier::seen_count() const {
    return seen_.size();
}

std::size_t Frontier::queue_size() const {
    return queue_.size();
}

FrontierStats Frontier::stats() const {
    FrontierStats stats;
    stats.total_seen = seen_.size();
    stats.queued     = queue_.size();
    stats.processed  = stats.total_seen - stats.queued;
    return stats;
}

bool Frontier::is_allowed_host(const std::string& canonical) const {
    auto host = Url::host_of(canonical);
    if (!host)
        return false;

    const auto& domains = *limits_.allowed_domains;
    return std::find(domains.begin(), domains.end(), *host) != domains.end();
}

void Frontier::admit(std::string canonical) {
    seen_.insert(canonical);
    queue_.push_back(std::move(canonical));
}

}  // namespace Engine
}  // namespace Spinner
