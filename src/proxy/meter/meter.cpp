#include "meter.hpp"
#include <vector>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"

namespace Conduit {
namespace Proxy {
namespace Metering {

using namespace Conduit::Core;

namespace {

std::string describe(const EndpointMetrics& m) {
    return "provider=" + m.provider + " host=" + m.host + ":" + std::to_string(m.port);
}

}  // namespace

double EndpointMetrics::total_gb() const {
    return static_cast<double>(total_bytes()) / Constants::BYTES_PER_GB;
}

double EndpointMetrics::success_rate() const {
    if (requests_count == 0)
        return 0.0;
    return static_cast<double>(success_count) / static_cast<double>(requests_count) * 100.0;
}

Meter::Meter() {
    Logger::info("Proxy meter initialized");
}

void Meter::register_provider_price(const std::string& provider, double price_per_gb) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[provider] = price_per_gb;
}

double Meter::price_for(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = prices_.find(provider);
    return it == prices_.end() ? 0.0 : it->second;
}

std::shared_ptr<Meter::Entry> Meter::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<Meter::Entry> Meter::find_or_create(const Endpoint& endpoint, bool& created) {
    std::string                 key = endpoint.identity_key();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        created = false;
        return it->second;
    }

    auto entry                 = std::make_shared<Entry>();
    entry->metrics.endpoint_id = key;
    entry->metrics.provider    = endpoint.provider.empty() ? "unknown" : endpoint.provider;
    entry->metrics.host        = endpoint.host;
    entry->metrics.port        = endpoint.port;
    entry->metrics.session     = endpoint.session;
    entry->metrics.proxy_type  = endpoint.proxy_type;
    entry->metrics.region      = endpoint.region;
    entry->metrics.purpose     = Constants::DEFAULT_PURPOSE;
    entry->metrics.first_seen  = std::chrono::system_clock::now();
    entry->metrics.last_seen   = entry->metrics.first_seen;
    entries_.emplace(key, entry);
    created = true;
    return entry;
}

void Meter::record_acquire(const Endpoint& endpoint, const std::optional<std::string>& purpose) {
    bool created = false;
    auto entry   = find_or_create(endpoint, created);

    std::lock_guard<std::mutex> lock(entry->mutex);
    EndpointMetrics&            m = entry->metrics;
    m.purpose                     = purpose.value_or(Constants::DEFAULT_PURPOSE);
    m.acquisitions++;
    entry->open_leases.push_back(std::chrono::steady_clock::now());
    m.outstanding = entry->open_leases.size();
    m.active      = true;
    m.last_seen   = std::chrono::system_clock::now();

    if (created) {
        Logger::info("New proxy endpoint acquired: " + describe(m) + " type="
                     + to_string(m.proxy_type) + " region=" + m.region.value_or("any"));
    }
}

void Meter::record_request(const Endpoint& endpoint,
                           uint64_t        bytes_sent,
                           uint64_t        bytes_received,
                           bool            success) {
    bool   created = false;
    auto   entry   = find_or_create(endpoint, created);
    if (created)
        Logger::warn("Request recorded for an endpoint that was never acquired: "
                     + endpoint.identity_key());
    double price = price_for(entry->metrics.provider);

    std::lock_guard<std::mutex> lock(entry->mutex);
    EndpointMetrics&            m = entry->metrics;
    m.requests_count++;
    m.bytes_sent += bytes_sent;
    m.bytes_received += bytes_received;
    m.last_seen = std::chrono::system_clock::now();
    if (success) {
        m.success_count++;
    }
    else {
        m.failure_count++;
        Logger::warn("Proxy request failed: " + describe(m) + " errors="
                     + std::to_string(m.failure_count) + "/" + std::to_string(m.requests_count));
    }
    m.cost_estimate = static_cast<double>(m.total_bytes()) / Constants::BYTES_PER_GB * price;
}

void Meter::record_release(const Endpoint& endpoint, const std::optional<std::string>& reason) {
    auto entry = find(endpoint.identity_key());
    if (!entry) {
        Logger::warn("Release recorded for unknown endpoint: " + endpoint.identity_key()
                     + " (reason=" + reason.value_or("normal") + ")");
        return;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    EndpointMetrics&            m = entry->metrics;
    if (entry->open_leases.empty()) {
        Logger::warn("Release recorded with no open lease: " + endpoint.identity_key()
                     + " (reason=" + reason.value_or("normal") + ")");
        return;
    }

    auto held = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry->open_leases.front());
    entry->open_leases.pop_front();
    m.outstanding         = entry->open_leases.size();
    m.active              = m.outstanding > 0;
    m.last_release_reason = reason.value_or("normal");
    m.last_lease_duration = held;
    m.total_lease_duration += held;
    m.last_seen = std::chrono::system_clock::now();

    Logger::info("Proxy released: " + describe(m) + " session=" + m.session.value_or("-")
                 + " reason=" + *m.last_release_reason + " requests="
                 + std::to_string(m.requests_count) + " errors=" + std::to_string(m.failure_count)
                 + " held=" + std::to_string(held.count()) + "ms");
}

std::map<std::string, EndpointMetrics> Meter::get_metrics(
    const std::optional<std::string>& provider) const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& kv : entries_)
            snapshot.push_back(kv.second);
    }

    std::map<std::string, EndpointMetrics> out;
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (provider && entry->metrics.provider != *provider)
            continue;
        out.emplace(entry->metrics.endpoint_id, entry->metrics);
    }
    return out;
}

UsageSummary Meter::get_summary() const {
    UsageSummary summary;
    for (const auto& kv : get_metrics()) {
        const EndpointMetrics& m = kv.second;
        summary.total_endpoints++;
        summary.total_requests += m.requests_count;
        summary.total_bytes += m.total_bytes();
        summary.total_errors += m.failure_count;
        summary.total_cost_estimate += m.cost_estimate;

        ProviderUsage& usage = summary.by_provider[m.provider];
        usage.endpoints++;
        usage.requests += m.requests_count;
        usage.bytes += m.total_bytes();
        usage.errors += m.failure_count;
        usage.cost += m.cost_estimate;
    }

    summary.total_gb = static_cast<double>(summary.total_bytes) / Constants::BYTES_PER_GB;
    if (summary.total_requests > 0) {
        summary.overall_success_rate =
            static_cast<double>(summary.total_requests - summary.total_errors)
            / static_cast<double>(summary.total_requests) * 100.0;
    }
    for (auto& kv : summary.by_provider)
        kv.second.gb = static_cast<double>(kv.second.bytes) / Constants::BYTES_PER_GB;
    return summary;
}

void Meter::reset() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = entries_.size();
        entries_.clear();
    }
    Logger::warn("Proxy meter reset: cleared " + std::to_string(count) + " endpoint metrics");
}

}  // namespace Metering
}  // namespace Proxy
}  // namespace Conduit
