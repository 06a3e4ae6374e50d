#include "json_report.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Conduit {
namespace Proxy {
namespace Report {

namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Credentials never appear in reports.
nlohmann::json to_json(const Endpoint& endpoint) {
    return {{"server", endpoint.server()},
            {"provider", endpoint.provider},
            {"session", optional_value(endpoint.session)},
            {"region", optional_value(endpoint.region)},
            {"proxy_type", to_string(endpoint.proxy_type)},
            {"ip_version", to_string(endpoint.ip_version)},
            {"rotation_type", to_string(endpoint.rotation_type)}};
}

nlohmann::json to_json(const Metering::EndpointMetrics& m) {
    return {{"endpoint_id", m.endpoint_id},
            {"provider", m.provider},
            {"host", m.host},
            {"port", m.port},
            {"session", optional_value(m.session)},
            {"proxy_type", to_string(m.proxy_type)},
            {"region", optional_value(m.region)},
            {"purpose", m.purpose},
            {"requests_count", m.requests_count},
            {"success_count", m.success_count},
            {"failure_count", m.failure_count},
            {"bytes_sent", m.bytes_sent},
            {"bytes_received", m.bytes_received},
            {"total_gb", m.total_gb()},
            {"success_rate", m.success_rate()},
            {"cost_estimate", m.cost_estimate},
            {"acquisitions", m.acquisitions},
            {"active", m.active},
            {"outstanding", m.outstanding},
            {"first_seen", format_time(m.first_seen)},
            {"last_seen", format_time(m.last_seen)},
            {"last_release_reason", optional_value(m.last_release_reason)},
            {"total_lease_ms", m.total_lease_duration.count()}};
}

nlohmann::json to_json(const Metering::UsageSummary& s) {
    nlohmann::json by_provider = nlohmann::json::object();
    for (const auto& kv : s.by_provider) {
        by_provider[kv.first] = {{"endpoints", kv.second.endpoints},
                                 {"requests", kv.second.requests},
                                 {"bytes", kv.second.bytes},
                                 {"gb", kv.second.gb},
                                 {"errors", kv.second.errors},
                                 {"cost", kv.second.cost}};
    }
    return {{"total_endpoints", s.total_endpoints},
            {"total_requests", s.total_requests},
            {"total_bytes", s.total_bytes},
            {"total_gb", s.total_gb},
            {"total_errors", s.total_errors},
            {"overall_success_rate", s.overall_success_rate},
            {"total_cost_estimate", s.total_cost_estimate},
            {"by_provider", by_provider}};
}

nlohmann::json to_json(const ManagerStats& stats) {
    nlohmann::json providers = nlohmann::json::object();
    for (const auto& p : stats.providers) {
        providers[p.name] = {{"type", p.type},
                             {"active_count", p.active_count},
                             {"limit", optional_value(p.limit)},
                             {"price_per_gb", optional_value(p.price_per_gb)}};
    }
    nlohmann::json out = {{"providers", providers}};
    if (stats.usage)
        out["usage_summary"] = to_json(*stats.usage);
    return out;
}

nlohmann::json to_json(const Testing::TestResult& r) {
    return {{"endpoint", to_json(r.endpoint)},
            {"success", r.success},
            {"response_time_ms", optional_value(r.response_time_ms)},
            {"status_code", r.status_code},
            {"egress_ip", optional_value(r.egress_ip)},
            {"error_kind", Testing::to_string(r.error_kind)},
            {"error", r.error},
            {"test_url", r.test_url},
            {"timestamp", format_time(r.timestamp)}};
}

nlohmann::json to_json(const std::vector<Testing::TestResult>& results) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results)
        arr.push_back(to_json(r));
    return arr;
}

}  // namespace Report
}  // namespace Proxy
}  // namespace Conduit
