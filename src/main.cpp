#include <curl/curl.h>
#include <exception>
#include <memory>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "network/http/curl_client.hpp"
#include "storage/jsonl_exporter.hpp"
#include "utils/url/url.hpp"

namespace {

using namespace Spinner;

Engine::CrawlConfig make_crawl_config(const Core::Config& config, const std::string& seed) {
    Engine::CrawlConfig crawl_config;
    if (config.max_pages > 0)
        crawl_config.max_pages = static_cast<std::size_t>(config.max_pages);

    std::vector<std::string> domains = config.allowed_domains;
    if (config.same_domain) {
        if (auto host = Utils::Url::host_of(Utils::Url::normalize(seed)))
            domains.push_back(*host);
    }
    if (!domains.empty())
        crawl_config.allowed_domains = std::move(domains);

    crawl_config.include_raw_html = config.include_html;
    crawl_config.handle_signals   = true;
    return crawl_config;
}

// Non-owning view so every seed appends to the same file.
class SharedExporter : public Storage::Exporter {
public:
    explicit SharedExporter(Storage::Exporter& target) : target_(target) {
    }

    void append(const Core::Document& document) override {
        target_.append(document);
    }

private:
    Storage::Exporter& target_;
};

int run_crawler(const Core::Config& config) {
    Storage::JsonlExporter exporter(config.output_dir, config.output_file);
    if (config.clear_output)
        exporter.clear_output_dir();

    Network::Http::CurlClient client(config.timeout, config.user_agent);

    bool                        as_array = config.format == "json";
    Engine::CrawlStats          totals;
    std::vector<Core::Document> documents;

    for (const auto& seed : config.urls) {
        std::unique_ptr<Storage::Exporter> sink;
        if (!as_array)
            sink = std::make_unique<SharedExporter>(exporter);

        Engine::Crawler crawler(make_crawl_config(config, seed), client, std::move(sink));
        Engine::CrawlResult result = crawler.run(seed);

        totals.pages_crawled += result.stats.pages_crawled;
        totals.pages_failed += result.stats.pages_failed;
        totals.urls_discovered += result.stats.urls_discovered;

        if (as_array) {
            documents.insert(documents.end(),
                             std::make_move_iterator(result.documents.begin()),
                             std::make_move_iterator(result.documents.end()));
        }

        if (crawler.stop_requested())
            break;
    }

    if (as_array)
        exporter.write_json_array(documents, config.output_file);

    Core::Logger::success("Done: " + std::to_string(totals.pages_crawled) + " pages crawled, "
                          + std::to_string(totals.pages_failed) + " failed, "
                          + std::to_string(totals.urls_discovered) + " URLs discovered. Output: "
                          + exporter.file_path().string());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace Spinner;

    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        return 1;
    }
    Core::Logger::set_level(config.log_level());

    if (config.urls.empty()) {
        Core::Logger::error("No URLs provided. Run with --help for usage.");
        return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int status = 0;
    try {
        status = run_crawler(config);
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        status = 1;
    }
    curl_global_cleanup();
    return status;
}
