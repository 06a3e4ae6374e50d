#pragma once
#include <nlohmann/json.hpp>
#include <vector>
#include "../manager/manager.hpp"
#include "../meter/meter.hpp"
#include "../tester/tester.hpp"

namespace Conduit {
namespace Proxy {
namespace Report {

nlohmann::json to_json(const Endpoint& endpoint);
nlohmann::json to_json(const Metering::EndpointMetrics& metrics);
nlohmann::json to_json(const Metering::UsageSummary& summary);
nlohmann::json to_json(const ManagerStats& stats);
nlohmann::json to_json(const Testing::TestResult& result);
nlohmann::json to_json(const std::vector<Testing::TestResult>& results);

std::string format_time(std::chrono::system_clock::time_point tp);

}  // namespace Report
}  // namespace Proxy
}  // namespace Conduit
