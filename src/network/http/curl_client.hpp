#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Spinner {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    explicit CurlClient(long               timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS,
                        const std::string& user_agent      = Core::Constants::USER_AGENT);
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    Response get(const std::string& url) override;

    void set_timeout(long seconds);
    void set_user_agent(const std::string& user_agent);

    long               timeout() const;
    const std::string& user_agent() const;

private:
    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    long                               timeout_seconds_;
    std::string                        user_agent_;

    Response create_error_response(const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const std::string& url, RequestContext& ctx) const;
    Response handle_response(CURLcode           res,
                             long               response_code,
                             const std::string& effective_url,
                             std::string&       body,
                             std::string&       content_type) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Spinner
