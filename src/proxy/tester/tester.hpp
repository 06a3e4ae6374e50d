#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../endpoint/endpoint.hpp"
#include "../meter/meter.hpp"

namespace Conduit {
namespace Proxy {
namespace Testing {

using Network::Http::HttpClient;

enum class TestErrorKind { None, Timeout, Auth, Connection, Unknown };

std::string to_string(TestErrorKind kind);

struct TestResult {
    Endpoint                              endpoint;
    bool                                  success = false;
    std::optional<double>                 response_time_ms;
    long                                  status_code = 0;
    std::optional<std::string>            egress_ip;
    TestErrorKind                         error_kind = TestErrorKind::None;
    std::string                           error;
    std::string                           test_url;
    std::chrono::system_clock::time_point timestamp;
};

struct TestSummary {
    size_t total     = 0;
    size_t succeeded = 0;
    size_t failed    = 0;
    double avg_ms    = 0.0;
    double min_ms    = 0.0;
    double max_ms    = 0.0;
};

using ClientFactory    = std::function<std::unique_ptr<HttpClient>()>;
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

// Health checks for endpoints. Network failures are reported in the TestResult,
// never thrown.
class Tester {
public:
    explicit Tester(ClientFactory factory = default_client_factory(),
                    Metering::Meter* meter  = nullptr);

    TestResult test_single_proxy(
        const Endpoint&           endpoint,
        const std::string&        test_url = Core::Constants::DEFAULT_TEST_URL,
        std::chrono::milliseconds timeout =
            std::chrono::seconds(Core::Constants::DEFAULT_TEST_TIMEOUT_SECONDS)) const;

    // Results come back in the order of `endpoints`, whatever order the workers finish in.
    std::vector<TestResult> test_batch(
        const std::vector<Endpoint>& endpoints,
        const std::string&           test_url = Core::Constants::DEFAULT_TEST_URL,
        std::chrono::milliseconds    timeout =
            std::chrono::seconds(Core::Constants::DEFAULT_TEST_TIMEOUT_SECONDS),
        int              max_workers       = Core::Constants::DEFAULT_TEST_WORKERS,
        ProgressCallback progress_callback = nullptr) const;

    static TestSummary                summarize(const std::vector<TestResult>& results);
    static std::optional<std::string> extract_egress_ip(const std::string& body);
    static ClientFactory              default_client_factory();

private:
    ClientFactory    factory_;
    Metering::Meter* meter_;
};

}  // namespace Testing
}  // namespace Proxy
}  // namespace Conduit
