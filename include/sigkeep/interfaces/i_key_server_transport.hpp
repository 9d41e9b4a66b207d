#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>
namespace sigkeep::interfaces {
enum class HttpMethod : uint8_t {
    Get,
    Post,
    Delete
};
inline std::string_view ToString(const HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}
struct TransportRequest {
    HttpMethod method;
    std::string path;
    // Serialized protobuf payload, empty for GET and DELETE.
    std::string body;
};
struct TransportResponse {
    int status_code = 0;
    std::string body;
};
/**
 * @brief Server-scoped HTTP client. Err means the request never completed.
 */
class IKeyServerTransport {
public:
    virtual ~IKeyServerTransport() = default;
    virtual Result<TransportResponse, KeyStoreFailure> Send(const TransportRequest& request) = 0;
};
}
