#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "../endpoint/endpoint.hpp"

namespace Conduit {
namespace Proxy {
namespace Metering {

using SystemTime = std::chrono::system_clock::time_point;

struct EndpointMetrics {
    std::string                endpoint_id;
    std::string                provider;
    std::string                host;
    int                        port = 0;
    std::optional<std::string> session;
    ProxyType                  proxy_type = ProxyType::Datacenter;
    std::optional<std::string> region;
    std::string                purpose;

    uint64_t requests_count = 0;
    uint64_t success_count  = 0;
    uint64_t failure_count  = 0;
    uint64_t bytes_sent     = 0;
    uint64_t bytes_received = 0;
    double   cost_estimate  = 0.0;

    uint64_t                   acquisitions = 0;
    uint64_t                   outstanding  = 0;  // leases not yet released
    bool                       active       = false;
    SystemTime                 first_seen;
    SystemTime                 last_seen;
    std::optional<std::string> last_release_reason;
    std::chrono::milliseconds  last_lease_duration{0};
    std::chrono::milliseconds  total_lease_duration{0};

    uint64_t total_bytes() const { return bytes_sent + bytes_received; }
    double   total_gb() const;
    double   success_rate() const;  // percent, 0 when nothing was recorded
};

struct ProviderUsage {
    uint64_t endpoints = 0;
    uint64_t requests  = 0;
    uint64_t bytes     = 0;
    uint64_t errors    = 0;
    double   gb        = 0.0;
    double   cost      = 0.0;
};

struct UsageSummary {
    uint64_t                             total_endpoints      = 0;
    uint64_t                             total_requests       = 0;
    uint64_t                             total_bytes          = 0;
    double                               total_gb             = 0.0;
    uint64_t                             total_errors         = 0;
    double                               overall_success_rate = 0.0;
    double                               total_cost_estimate  = 0.0;
    std::map<std::string, ProviderUsage> by_provider;
};

// Usage ledger keyed by Endpoint::identity_key(). Entries are never dropped except by reset().
class Meter {
public:
    Meter();

    void register_provider_price(const std::string& provider, double price_per_gb);

    void record_acquire(const Endpoint& endpoint, const std::optional<std::string>& purpose);
    void record_request(const Endpoint& endpoint,
                        uint64_t        bytes_sent,
                        uint64_t        bytes_received,
                        bool            success);
    void record_release(const Endpoint& endpoint, const std::optional<std::string>& reason);

    std::map<std::string, EndpointMetrics> get_metrics(
        const std::optional<std::string>& provider = std::nullopt) const;
    UsageSummary get_summary() const;

    void reset();

private:
    // Several leases may share one identity key; they are closed oldest first.
    struct Entry {
        std::mutex                                        mutex;
        EndpointMetrics                                   metrics;
        std::deque<std::chrono::steady_clock::time_point> open_leases;
    };

    std::shared_ptr<Entry> find_or_create(const Endpoint& endpoint, bool& created);
    std::shared_ptr<Entry> find(const std::string& key) const;
    double                 price_for(const std::string& provider) const;

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::unordered_map<std::string, double>                 prices_;
};

}  // namespace Metering
}  // namespace Proxy
}  // namespace Conduit
