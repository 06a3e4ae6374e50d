#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Conduit {
namespace Network {
namespace Http {

enum class ErrorType { None, Connection, Timeout, Auth, Http, Other };

enum class HTTPCode { NetworkError = 0, ProxyAuthRequired = 407 };

struct Response {
    std::string               effective_url;
    long                      status_code = 0;
    std::string               body;
    std::string               error;
    bool                      success    = false;
    ErrorType                 error_type = ErrorType::None;
    uint64_t                  bytes_sent     = 0;
    uint64_t                  bytes_received = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_proxy(const std::string& proxy)                 = 0;
    virtual void     set_timeout(std::chrono::milliseconds timeout)      = 0;
    virtual void     set_connect_timeout(std::chrono::milliseconds /*timeout*/) {}
    virtual Response get(const std::string& url)                         = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Conduit
