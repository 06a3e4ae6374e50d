#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Conduit {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_proxy(const std::string& proxy) override;
    void     set_timeout(std::chrono::milliseconds timeout) override;
    void     set_connect_timeout(std::chrono::milliseconds timeout) override;
    Response get(const std::string& url) override;

    // RFC 3986 percent-encoding of everything but unreserved characters.
    static std::string escape(const std::string& text);

private:
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    std::chrono::milliseconds          timeout_;
    std::chrono::milliseconds          connect_timeout_{0};
    std::string                        user_agent_;

    Response create_error_response(const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const std::string& url, std::string& body) const;
    Response handle_response(CURL* curl, CURLcode res, std::string& body) const;

    // userp is the std::string body buffer.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Conduit
