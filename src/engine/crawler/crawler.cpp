#include "crawler.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../utils/html/link_extractor.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Spinner {
namespace Engine {

using namespace Spinner::Core;
using Spinner::Utils::Html::LinkExtractor;

const char* crawl_state_name(CrawlState state) {
    switch (state) {
        case CrawlState::Idle: return "idle";
        case CrawlState::Fetching: return "fetching";
        case CrawlState::Linking: return "linking";
        case CrawlState::Recording: return "recording";
        case CrawlState::Done: return "done";
    }
    return "unknown";
}

Crawler::Crawler(const CrawlConfig&                 config,
                 HttpClient&                        client,
                 std::unique_ptr<Storage::Exporter> exporter)
    : config_(config), client_(client), exporter_(std::move(exporter)) {
}

CrawlResult Crawler::run(const std::string& seed) {
    begin(seed);
    while (step()) {
    }
    return finish();
}

void Crawler::begin(const std::string& seed) {
    std::string start_url = Utils::Text::trim(seed);
    if (start_url.empty())
        throw std::invalid_argument("Seed URL must not be empty");

    frontier_ = std::make_unique<Frontier>(
        start_url, FrontierLimits{config_.max_pages, config_.allowed_domains});
    state_                 = CrawlState::Idle;
    stats_                 = CrawlStats{};
    stats_.urls_discovered = frontier_->seen_count();
    documents_.clear();
    stop_requested_ = false;

    std::string limits = config_.max_pages ? std::to_string(*config_.max_pages) : "unlimited";
    Logger::info("Crawler: Starting for " + start_url + " (max pages: " + limits + ")");
    if (config_.allowed_domains) {
        std::string domains;
        for (const auto& domain : *config_.allowed_domains)
            domains += (domains.empty() ? "" : ", ") + domain;
        Logger::info("Crawler: Allowed domains: " + domains);
    }

    init_signals();
}

bool Crawler::step() {
    if (!frontier_)
        throw std::logic_error("Crawler::step called before begin");

    while (true) {
        switch (state_) {
            case CrawlState::Idle: {
                if (stop_requested_) {
                    Logger::info("Crawler: Stop requested, ending crawl.");
                    state_ = CrawlState::Done;
                    return false;
                }
                auto next = frontier_->next();
                if (!next) {
                    state_ = CrawlState::Done;
                    return false;
                }
                current_url_ = std::move(*next);
                state_       = CrawlState::Fetching;
                break;
            }
            case CrawlState::Fetching:
                if (!fetch_page()) {
                    state_ = CrawlState::Idle;
                    return true;
                }
                state_ = CrawlState::Linking;
                break;
            case CrawlState::Linking:
                harvest_links();
                state_ = CrawlState::Recording;
                break;
            case CrawlState::Recording:
                record_page();
                state_ = CrawlState::Idle;
                return true;
            case CrawlState::Done: return false;
        }
    }
}

CrawlResult Crawler::finish() {
    shutdown();

    if (frontier_)
        stats_.urls_discovered = frontier_->seen_count();
    state_ = CrawlState::Done;

    CrawlResult result;
    result.stats     = stats_;
    result.documents = std::move(documents_);
    documents_.clear();

    Logger::info("Crawler: Finished. Crawled " + std::to_string(stats_.pages_crawled) + ", failed "
                 + std::to_string(stats_.pages_failed) + ", discovered "
                 + std::to_string(stats_.urls_discovered) + " URLs.");
    return result;
}

bool Crawler::fetch_page() {
    Logger::debug("Fetching: " + current_url_);
    current_response_ = client_.get(current_url_);
    if (current_response_.success)
        return true;

    stats_.pages_failed++;
    Logger::warn("Failed: " + current_url_ + " (" + current_response_.error + ") ["
                 + error_type_name(current_response_.error_type) + "]");
    current_response_ = Response{};
    return false;
}

void Crawler::harvest_links() {
    current_links_ = LinkExtractor::extract(current_response_.body, current_url_);

    std::size_t admitted = 0;
    for (const auto& link : current_links_) {
        if (frontier_->add(link))
            ++admitted;
    }
    stats_.urls_discovered = frontier_->seen_count();

    Logger::debug("Links on " + current_url_ + ": " + std::to_string(current_links_.size()) + " found, "
                  + std::to_string(admitted) + " new");
}

CrawlState Crawler::state() const {
    return state_;
}

const CrawlStats& Crawler::stats() const {
    return stats_;
}

const Frontier* Crawler::frontier() const {
    return frontier_.get();
}

bool Crawler::stop_requested() const {
    return stop_requested_;
}

}  // namespace Engine
}  // namespace Spinner
