#include "curl_client.hpp"
#include <mutex>
#include "../../core/errors/errors.hpp"
#include "../../core/types/constants.hpp"

namespace Conduit {
namespace Network {
namespace Http {

using Core::Constants;

namespace {

std::once_flag curl_init_flag;

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR: return ErrorType::Connection;
        case CURLE_LOGIN_DENIED: return ErrorType::Auth;
        default: return ErrorType::Other;
    }
}

}  // namespace

CurlClient::CurlClient()
    : timeout_(std::chrono::seconds(Constants::DEFAULT_TEST_TIMEOUT_SECONDS)),
      user_agent_(Constants::USER_AGENT) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    curl_.reset(curl_easy_init());
}

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    if (!body)
        return 0;
    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void CurlClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

std::string CurlClient::escape(const std::string& text) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    char* escaped = curl_easy_escape(nullptr, text.c_str(), static_cast<int>(text.size()));
    if (!escaped)
        throw Core::ProxyError("Could not percent-encode proxy credentials");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Other;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL* curl, const std::string& url, std::string& body) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    if (connect_timeout_.count() > 0)
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));

    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());
}

Response CurlClient::handle_response(CURL* curl, CURLcode res, std::string& body) const {
    Response response;

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    long connect_code = 0;
    curl_easy_getinfo(curl, CURLINFO_HTTP_CONNECTCODE, &connect_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    long request_size = 0;
    curl_easy_getinfo(curl, CURLINFO_REQUEST_SIZE, &request_size);
    long header_size = 0;
    curl_easy_getinfo(curl, CURLINFO_HEADER_SIZE, &header_size);
    curl_off_t downloaded = 0;
    curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &downloaded);

    response.effective_url  = eff_url_ptr ? std::string(eff_url_ptr) : "";
    response.status_code    = status;
    response.bytes_sent     = static_cast<uint64_t>(request_size > 0 ? request_size : 0);
    response.bytes_received = static_cast<uint64_t>(header_size > 0 ? header_size : 0)
                              + static_cast<uint64_t>(downloaded > 0 ? downloaded : 0);

    if (connect_code == static_cast<long>(HTTPCode::ProxyAuthRequired)
        || status == static_cast<long>(HTTPCode::ProxyAuthRequired)) {
        response.success    = false;
        response.error_type = ErrorType::Auth;
        response.error      = "Proxy authentication required (407)";
        return response;
    }

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code >= 200 && response.status_code < 300);
    if (!response.success) {
        response.error_type = ErrorType::Http;
        response.error      = "HTTP " + std::to_string(response.status_code);
    }
    return response;
}

Response CurlClient::get(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string body;
    setup_curl_options(curl_.get(), url, body);
    CURLcode res = curl_easy_perform(curl_.get());
    return handle_response(curl_.get(), res, body);
}

}  // namespace Http
}  // namespace Network
}  // namespace Conduit
