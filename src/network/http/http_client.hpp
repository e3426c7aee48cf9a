#pragma once
#include <string>

namespace Spinner {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Dns, Timeout, Malformed, Http, Other };

enum class HTTPCode { NetworkError = 0, Ok = 200 };

enum class MaxCode { Success = 300 };

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

const char* error_type_name(ErrorType type);

// Turns a URL into page content or a failed Response. Implementations never throw for
// network-level failures.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Response get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Spinner
