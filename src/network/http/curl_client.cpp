#include "curl_client.hpp"
#include <algorithm>
#include <string_view>
#include "../../utils/text/string_utils.hpp"

namespace Spinner {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Dns;
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_GOT_NOTHING:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_RECV_ERROR:
        case CURLE_BAD_CONTENT_ENCODING: return ErrorType::Malformed;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL: return ErrorType::Other;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string header(buffer, size * nitems);
    if (!Utils::Text::istarts_with(header, std::string(CONTENT_TYPE_HEADER)))
        return size * nitems;

    *ctx->content_type = Utils::Text::trim(header.substr(CONTENT_TYPE_HEADER.size()));
    return size * nitems;
}

CurlClient::CurlClient(long timeout_seconds, const std::string& user_agent)
    : curl_(curl_easy_init()), timeout_seconds_(timeout_seconds), user_agent_(user_agent) {
}

void CurlClient::set_timeout(long seconds) {
    timeout_seconds_ = seconds;
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

long CurlClient::timeout() const {
    return timeout_seconds_;
}

const std::string& CurlClient::user_agent() const {
    return user_agent_;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Other;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL*              curl,
                                    const std::string& url,
                                    RequestContext&    ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = response.status_code >= static_cast<long>(HTTPCode::Ok)
                       && response.status_code < static_cast<long>(MaxCode::Success);
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Http;
    }
    return response;
}

Response CurlClient::get(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type};

    setup_curl_options(curl_.get(), url, ctx);
    CURLcode res = curl_easy_perform(curl_.get());

    long response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* effective_url = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &effective_url);

    return handle_response(
        res, response_code, effective_url ? std::string(effective_url) : url, body, content_type);
}

}  // namespace Http
}  // namespace Network
}  // namespace Spinner
