#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Spinner {
namespace Engine {

struct FrontierLimits {
    std::optional<std::size_t>              max_pages;
    std::optional<std::vector<std::string>> allowed_domains;
};

struct FrontierStats {
    std::size_t total_seen = 0;
    std::size_t queued     = 0;
    std::size_t processed  = 0;
};

// FIFO work queue plus the set of every canonical URL ever admitted. Owned by a single
// crawler for the duration of one crawl; not thread-safe.
//
// The page cap bounds the number of admitted URLs (checked in add()). next() re-checks
// the processed count against the same cap, which can only trigger if the cap and the
// admitted set ever diverge.
class Frontier {
public:
    // The seed is admitted unconditionally, before any limit applies.
    explicit Frontier(const std::string& seed, FrontierLimits limits = {});

    // Checks, in order: empty, already seen, host not on the allow-list, cap reached.
    bool                       add(const std::string& url);
    std::optional<std::string> next();

    bool          has_pending() const;
    bool          is_seen(const std::string& url) const;
    std::size_t   seen_count() const;
    std::size_t   queue_size() const;
    FrontierStats stats() const;

private:
    std::deque<std::string>         queue_;
    std::unordered_set<std::string> seen_;
    FrontierLimits                  limits_;

    bool is_allowed_host(const std::string& canonical) const;
    void admit(std::string canonical);
};

}  // namespace Engine
}  // namespace Spinner
