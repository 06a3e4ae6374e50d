#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../../core/config/provider_config.hpp"
#include "../endpoint/endpoint.hpp"
#include "../meter/meter.hpp"
#include "../providers/provider.hpp"

namespace Conduit {
namespace Proxy {

using Core::ProviderConfig;
using Metering::Meter;
using Metering::UsageSummary;
using Providers::Provider;

struct ProviderStats {
    std::string           name;
    std::string           type;
    int                   active_count = 0;
    std::optional<int>    limit;  // nullopt = unlimited
    std::optional<double> price_per_gb;
};

struct ManagerStats {
    std::vector<ProviderStats>  providers;
    std::optional<UsageSummary> usage;  // set when metering is enabled
};

// Owns the configured providers and enforces each one's concurrency budget.
// acquire() never waits for capacity: it either leases an endpoint or throws.
class Manager {
public:
    explicit Manager(const std::vector<ProviderConfig>& configs, bool enable_metering = true);

    Manager(const Manager&)            = delete;
    Manager& operator=(const Manager&) = delete;

    // With a name, only that provider is tried. Without one, the cheapest provider that
    // has spare capacity wins; ties go to the one declared first.
    Endpoint acquire(const std::optional<std::string>& name    = std::nullopt,
                     const std::optional<std::string>& region  = std::nullopt,
                     const std::optional<std::string>& purpose = std::nullopt);

    void release(const Endpoint& endpoint, const std::optional<std::string>& reason = std::nullopt);

    void record_request(const Endpoint& endpoint,
                        uint64_t        bytes_sent,
                        uint64_t        bytes_received,
                        bool            success);

    ManagerStats             get_stats() const;
    int                      active_count(const std::string& name) const;
    std::vector<std::string> provider_names() const;
    Provider&                provider(const std::string& name);

    Meter* meter() { return meter_.get(); }

private:
    struct Slot {
        std::unique_ptr<Provider>            provider;
        std::optional<int>                   limit;
        int                                  active = 0;
        std::unordered_map<std::string, int> leases;
        mutable std::mutex                   mutex;
    };

    Slot&       slot_for(const std::string& name);
    const Slot& slot_for(const std::string& name) const;

    bool     try_reserve(Slot& slot);
    void     cancel_reservation(Slot& slot);
    Endpoint lease(Slot&                             slot,
                   const std::optional<std::string>& region,
                   const std::optional<std::string>& purpose);

    std::vector<std::unique_ptr<Slot>>     slots_;  // declaration order
    std::vector<Slot*>                     by_price_;
    std::unordered_map<std::string, Slot*> by_name_;
    std::unique_ptr<Meter>                 meter_;
};

}  // namespace Proxy
}  // namespace Conduit
