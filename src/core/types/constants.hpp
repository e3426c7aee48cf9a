#pragma once
#include <cstddef>

namespace Spinner {
namespace Core {

struct Constants {
    static constexpr const char* VERSION             = "0.1.0";
    static constexpr const char* USER_AGENT          = "Spinner/0.1.0";
    static constexpr const char* DEFAULT_OUTPUT_DIR  = "crawl_output";
    static constexpr const char* DEFAULT_OUTPUT_FILE = "crawl.jsonl";
    static constexpr const char* DEFAULT_JSON_FILE   = "crawl.json";
    static constexpr const char* DEFAULT_FORMAT      = "jsonl";

    static constexpr int         DEFAULT_MAX_PAGES       = 100;  // 0 = unlimited
    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr const char* DEFAULT_SCHEME          = "http://";
};

}  // namespace Core
}  // namespace Spinner
