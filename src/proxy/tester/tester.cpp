#include "tester.hpp"
#include <algorithm>
#include <exception>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <mutex>
#include <nlohmann/json.hpp>
#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Proxy {
namespace Testing {

using namespace Conduit::Core;
using Network::Http::ErrorType;
using Network::Http::Response;

namespace {

TestErrorKind classify(ErrorType type) {
    switch (type) {
        case ErrorType::None: return TestErrorKind::None;
        case ErrorType::Timeout: return TestErrorKind::Timeout;
        case ErrorType::Auth: return TestErrorKind::Auth;
        case ErrorType::Connection: return TestErrorKind::Connection;
        case ErrorType::Http:
        case ErrorType::Other: return TestErrorKind::Unknown;
    }
    return TestErrorKind::Unknown;
}

// httpbin lists the whole forwarding chain as "a.b.c.d, e.f.g.h".
bool looks_like_ip(const std::string& text) {
    auto parts = Utils::Text::split_any(text, ",");
    if (parts.empty())
        return false;
    for (const auto& part : parts) {
        boost::system::error_code ec;
        boost::asio::ip::make_address(part, ec);
        if (ec)
            return false;
    }
    return true;
}

}  // namespace

std::string to_string(TestErrorKind kind) {
    switch (kind) {
        case TestErrorKind::None: return "none";
        case TestErrorKind::Timeout: return "timeout";
        case TestErrorKind::Auth: return "auth";
        case TestErrorKind::Connection: return "connection";
        case TestErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

ClientFactory Tester::default_client_factory() {
    return [] { return std::make_unique<Network::Http::CurlClient>(); };
}

Tester::Tester(ClientFactory factory, Metering::Meter* meter)
    : factory_(std::move(factory)), meter_(meter) {}

// httpbin answers {"origin": "..."}, ipify-style services {"ip": "..."}, others plain text.
std::optional<std::string> Tester::extract_egress_ip(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object()) {
        for (const char* key : {"origin", "ip"}) {
            auto it = json.find(key);
            if (it != json.end() && it->is_string())
                return it->get<std::string>();
        }
        return std::nullopt;
    }

    std::string text = Utils::Text::trim(body);
    if (looks_like_ip(text))
        return text;
    return std::nullopt;
}

TestResult Tester::test_single_proxy(const Endpoint&           endpoint,
                                     const std::string&        test_url,
                                     std::chrono::milliseconds timeout) const {
    // curl treats 0 as "wait forever"
    if (timeout.count() <= 0)
        timeout = std::chrono::seconds(Constants::DEFAULT_TEST_TIMEOUT_SECONDS);

    TestResult result;
    result.endpoint  = endpoint;
    result.test_url  = test_url;
    result.timestamp = std::chrono::system_clock::now();

    Response response;
    auto     start = std::chrono::steady_clock::now();
    try {
        std::unique_ptr<HttpClient> client = factory_ ? factory_() : nullptr;
        if (!client) {
            result.error_kind = TestErrorKind::Unknown;
            result.error      = "No HTTP client available";
            return result;
        }
        client->set_proxy(endpoint.url());
        client->set_timeout(timeout);
        client->set_connect_timeout(timeout);
        response = client->get(test_url);
    } catch (const std::exception& e) {
        Logger::error("Unexpected error testing " + endpoint.redacted_url() + ": " + e.what());
        result.error_kind = TestErrorKind::Unknown;
        result.error      = std::string("Error: ") + e.what();
        return result;
    }
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now()
                                                             - start);

    result.status_code = response.status_code;
    result.success     = response.success;
    if (response.success) {
        result.response_time_ms = elapsed.count();
        result.egress_ip        = extract_egress_ip(response.body);
        Logger::success("Proxy working: " + endpoint.redacted_url() + " ("
                        + std::to_string(static_cast<long>(elapsed.count()))
                        + "ms) IP: " + result.egress_ip.value_or("unknown"));
    }
    else {
        result.error_kind = classify(response.error_type);
        if (result.error_kind == TestErrorKind::None)
            result.error_kind = TestErrorKind::Unknown;
        result.error = response.error;
        Logger::warn("Proxy failed (" + to_string(result.error_kind)
                     + "): " + endpoint.redacted_url() + " - " + response.error);
    }

    if (meter_)
        meter_->record_request(
            endpoint, response.bytes_sent, response.bytes_received, response.success);
    return result;
}

std::vector<TestResult> Tester::test_batch(const std::vector<Endpoint>& endpoints,
                                           const std::string&           test_url,
                                           std::chrono::milliseconds    timeout,
                                           int                          max_workers,
                                           ProgressCallback             progress_callback) const {
    std::vector<TestResult> results(endpoints.size());
    if (endpoints.empty())
        return results;

    size_t workers = static_cast<size_t>(std::max(1, max_workers));
    workers        = std::min(workers, endpoints.size());
    Logger::info("Starting batch test of " + std::to_string(endpoints.size())
                 + " proxies (max_workers=" + std::to_string(workers) + ")");

    std::mutex         progress_mutex;
    size_t             completed = 0;
    std::exception_ptr callback_error;
    {
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < endpoints.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                results[i] = test_single_proxy(endpoints[i], test_url, timeout);

                std::lock_guard<std::mutex> lock(progress_mutex);
                ++completed;
                if (!progress_callback || callback_error)
                    return;
                try {
                    progress_callback(completed, endpoints.size());
                } catch (...) {
                    // rethrown on the calling thread once the pool has drained
                    Logger::error("Progress callback threw, no further progress updates");
                    callback_error = std::current_exception();
                }
            });
        }
        pool.join();
    }
    if (callback_error)
        std::rethrow_exception(callback_error);

    TestSummary summary = summarize(results);
    Logger::info("Batch test complete: " + std::to_string(summary.succeeded) + "/"
                 + std::to_string(summary.total) + " successful, "
                 + std::to_string(summary.failed) + " failed, avg response time: "
                 + std::to_string(static_cast<long>(summary.avg_ms)) + "ms");
    return results;
}

TestSummary Tester::summarize(const std::vector<TestResult>& results) {
    TestSummary summary;
    summary.total = results.size();
    double sum    = 0.0;
    for (const auto& r : results) {
        if (!r.success) {
            summary.failed++;
            continue;
        }
        double ms = r.response_time_ms.value_or(0.0);
        if (summary.succeeded == 0 || ms < summary.min_ms)
            summary.min_ms = ms;
        if (summary.succeeded == 0 || ms > summary.max_ms)
            summary.max_ms = ms;
        sum += ms;
        summary.succeeded++;
    }
    if (summary.succeeded > 0)
        summary.avg_ms = sum / static_cast<double>(summary.succeeded);
    return summary;
}

}  // namespace Testing
}  // namespace Proxy
}  // namespace Conduit
