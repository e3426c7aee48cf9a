#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Spinner {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    int                      max_pages = Constants::DEFAULT_MAX_PAGES;  // 0 = unlimited
    std::vector<std::string> allowed_domains;
    bool                     same_domain = false;
    std::string              output_dir  = Constants::DEFAULT_OUTPUT_DIR;
    std::string              output_file = Constants::DEFAULT_OUTPUT_FILE;
    std::string              format      = Constants::DEFAULT_FORMAT;  // "jsonl" or "json"
    bool                     include_html = false;
    bool                     clear_output = false;
    int                      timeout      = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    std::string              user_agent   = Constants::USER_AGENT;
    bool                     verbose      = false;
    bool                     quiet        = false;
    std::string              config_path;

    int log_level() const;

    static Config parse(int argc, char* argv[]);
};

}  // namespace Core
}  // namespace Spinner
