#include "http_client.hpp"

namespace Spinner {
namespace Network {
namespace Http {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Dns: return "dns";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Malformed: return "malformed response";
        case ErrorType::Http: return "http";
        case ErrorType::Other: return "other";
    }
    return "unknown";
}

}  // namespace Http
}  // namespace Network
}  // namespace Spinner
