#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"
#include "../logger/logger.hpp"

namespace Spinner {
namespace Core {

using namespace Spinner::Utils::Text;

namespace {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["max_pages"])
            config.max_pages = yaml["max_pages"].as<int>();
        if (yaml["same_domain"])
            config.same_domain = yaml["same_domain"].as<bool>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["output_file"])
            config.output_file = yaml["output_file"].as<std::string>();
        if (yaml["format"])
            config.format = yaml["format"].as<std::string>();
        if (yaml["include_html"])
            config.include_html = yaml["include_html"].as<bool>();
        if (yaml["clear"])
            config.clear_output = yaml["clear"].as<bool>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }

        if (yaml["allowed_domains"] && yaml["allowed_domains"].IsSequence()) {
            for (const auto& node : yaml["allowed_domains"])
                config.allowed_domains.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

// Seeds without a scheme are crawled over plain HTTP.
std::string prepare_seed(const std::string& url) {
    std::string seed = trim(url);
    if (!seed.empty() && seed.find("://") == std::string::npos)
        seed = Constants::DEFAULT_SCHEME + seed;
    return seed;
}

}  // namespace

int Config::log_level() const {
    if (quiet)
        return LOG_WARN | LOG_ERROR;
    if (verbose)
        return LOG_ALL;
    return LOG_DEFAULT;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Spinner - Breadth-first web crawler emitting one JSON record per page"};

    std::vector<std::string> cli_urls;
    std::vector<std::string> cli_domains;

    app.add_option("-m,--max-pages", config.max_pages, "Maximum pages to crawl (0 = unlimited)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-a,--allow-domain", cli_domains, "Restrict crawling to this host (repeatable)");
    app.add_flag("--same-domain", config.same_domain, "Restrict crawling to each seed's host");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("-f,--output-file", config.output_file, "Output file name");
    app.add_option("--format", config.format, "Output format")
        ->check(CLI::IsMember({"jsonl", "json"}));
    app.add_flag("--include-html", config.include_html, "Store raw HTML in each record");
    app.add_flag("--clear", config.clear_output, "Empty the output directory before crawling");
    app.add_option("-t,--timeout", config.timeout, "Per-request timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--user-agent", config.user_agent, "HTTP User-Agent");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", config.quiet, "Only log warnings and errors");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.set_version_flag("--version", Constants::VERSION);

    app.add_option("urls", cli_urls, "Seed URLs to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.urls.insert(config.urls.end(), cli_urls.begin(), cli_urls.end());
    config.allowed_domains.insert(config.allowed_domains.end(), cli_domains.begin(), cli_domains.end());

    std::vector<std::string> seeds;
    for (const auto& url : config.urls) {
        std::string seed = prepare_seed(url);
        if (seed.empty())
            throw std::runtime_error("Seed URL must not be empty");
        seeds.push_back(std::move(seed));
    }
    config.urls = std::move(seeds);

    if (config.format != "jsonl" && config.format != "json")
        throw std::runtime_error("Unknown output format: " + config.format);
    if (config.format == "json" && config.output_file == Constants::DEFAULT_OUTPUT_FILE)
        config.output_file = Constants::DEFAULT_JSON_FILE;
    if (config.max_pages < 0)
        throw std::runtime_error("max_pages must not be negative");
    if (config.timeout <= 0)
        throw std::runtime_error("timeout must be positive");

    return config;
}

}  // namespace Core
}  // namespace Spinner
