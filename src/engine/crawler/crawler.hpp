#pragma once
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/document.hpp"
#include "../../network/http/http_client.hpp"
#include "../../storage/exporter.hpp"
#include "../frontier/frontier.hpp"

namespace Spinner {
namespace Engine {

using namespace Spinner::Network::Http;

// Fixed for the duration of a crawl.
struct CrawlConfig {
    std::optional<std::size_t>              max_pages;
    std::optional<std::vector<std::string>> allowed_domains;
    bool                                    include_raw_html = false;
    bool                                    handle_signals   = false;  // SIGINT/SIGTERM stop the crawl
};

enum class CrawlState { Idle, Fetching, Linking, Recording, Done };

const char* crawl_state_name(CrawlState state);

struct CrawlStats {
    std::size_t pages_crawled   = 0;
    std::size_t pages_failed    = 0;
    std::size_t urls_discovered = 0;
};

struct CrawlResult {
    CrawlStats                  stats;
    std::vector<Core::Document> documents;
};

class Crawler {
public:
    Crawler(const CrawlConfig&                 config,
            HttpClient&                        client,
            std::unique_ptr<Storage::Exporter> exporter = nullptr);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // begin(), step() until it returns false, finish().
    CrawlResult run(const std::string& seed);

    // Throws std::invalid_argument for an empty seed; nothing is fetched in that case.
    void begin(const std::string& seed);

    // Processes one frontier URL (Idle -> Fetching -> Linking -> Recording -> Idle).
    // Returns false once the crawl is Done.
    bool        step();
    CrawlResult finish();

    // Safe to call from any thread; takes effect before the next URL is dequeued.
    void request_stop();

    CrawlState        state() const;
    const CrawlStats& stats() const;
    const Frontier*   frontier() const;
    bool              stop_requested() const;

private:
    const CrawlConfig                  config_;
    HttpClient&                        client_;
    std::unique_ptr<Storage::Exporter> exporter_;
    std::unique_ptr<Frontier>          frontier_;

    CrawlState                  state_ = CrawlState::Idle;
    CrawlStats                  stats_;
    std::vector<Core::Document> documents_;
    std::atomic<bool>           stop_requested_{false};

    std::string              current_url_;
    Response                 current_response_;
    std::vector<std::string> current_links_;

    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_{ioc_};
    std::thread             signal_thread_;

    void init_signals();
    void shutdown();

    bool fetch_page();
    void harvest_links();
    void record_page();

    Core::Document build_document() const;
    void           export_document(const Core::Document& document);
};

}  // namespace Engine
}  // namespace Spinner
