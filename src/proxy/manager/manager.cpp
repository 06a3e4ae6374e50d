#include "manager.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../providers/provider_factory.hpp"

namespace Conduit {
namespace Proxy {

using namespace Conduit::Core;

namespace {

double selection_price(const ProviderConfig& cfg) {
    return cfg.price_per_gb.value_or(std::numeric_limits<double>::infinity());
}

std::string limit_text(const std::optional<int>& limit) {
    return limit ? std::to_string(*limit) : "unlimited";
}

}  // namespace

Manager::Manager(const std::vector<ProviderConfig>& configs, bool enable_metering) {
    if (enable_metering)
        meter_ = std::make_unique<Meter>();

    for (const auto& cfg : configs) {
        if (by_name_.count(cfg.name))
            throw ConfigurationError("Duplicate provider name: " + cfg.name);
        if (cfg.price_per_gb && !(std::isfinite(*cfg.price_per_gb) && *cfg.price_per_gb >= 0.0))
            throw ConfigurationError("Provider '" + cfg.name + "' has an invalid price_per_gb");

        auto slot      = std::make_unique<Slot>();
        slot->provider = Providers::make_provider(cfg);
        slot->limit    = cfg.concurrency_limit;
        by_name_.emplace(cfg.name, slot.get());
        by_price_.push_back(slot.get());
        if (meter_)
            meter_->register_provider_price(cfg.name, cfg.price_or_zero());
        slots_.push_back(std::move(slot));
    }

    std::stable_sort(by_price_.begin(), by_price_.end(), [](const Slot* a, const Slot* b) {
        return selection_price(a->provider->config()) < selection_price(b->provider->config());
    });

    Logger::info("Proxy manager ready with " + std::to_string(slots_.size()) + " provider(s)"
                 + (meter_ ? ", metering enabled" : ""));
}

Manager::Slot& Manager::slot_for(const std::string& name) {
    auto it = by_name_.find(name);
    if (it == by_name_.end())
        throw ProviderNotFoundError(name);
    return *it->second;
}

const Manager::Slot& Manager::slot_for(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end())
        throw ProviderNotFoundError(name);
    return *it->second;
}

bool Manager::try_reserve(Slot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.limit && slot.active >= *slot.limit)
        return false;
    slot.active++;
    return true;
}

void Manager::cancel_reservation(Slot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.active > 0)
        slot.active--;
}

Endpoint Manager::lease(Slot&                             slot,
                        const std::optional<std::string>& region,
                        const std::optional<std::string>& purpose) {
    Endpoint endpoint;
    try {
        endpoint = slot.provider->acquire(region, purpose);
    } catch (...) {
        cancel_reservation(slot);
        throw;
    }

    int active = 0;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.leases[endpoint.identity_key()]++;
        active = slot.active;
    }

    if (meter_)
        meter_->record_acquire(endpoint, purpose);

    Logger::info("Proxy acquired: provider=" + slot.provider->name() + " endpoint="
                 + endpoint.redacted_url() + " session=" + endpoint.session.value_or("-")
                 + " region=" + endpoint.region.value_or("any") + " active="
                 + std::to_string(active) + "/" + limit_text(slot.limit));
    return endpoint;
}

Endpoint Manager::acquire(const std::optional<std::string>& name,
                          const std::optional<std::string>& region,
                          const std::optional<std::string>& purpose) {
    if (name) {
        Slot& slot = slot_for(*name);
        if (!try_reserve(slot)) {
            Logger::warn("Concurrency limit reached for provider " + *name + " ("
                         + limit_text(slot.limit) + ")");
            throw ConcurrencyLimitError(*name, slot.limit.value_or(0));
        }
        return lease(slot, region, purpose);
    }

    if (slots_.empty())
        throw NoProviderAvailableError("No proxy providers configured");

    for (Slot* slot : by_price_) {
        if (!try_reserve(*slot))
            continue;
        try {
            return lease(*slot, region, purpose);
        } catch (const ProviderGenerationError& e) {
            Logger::warn("Provider " + slot->provider->name()
                         + " failed to generate an endpoint, trying next: " + e.what());
        }
    }

    Logger::error("No proxy provider has spare capacity");
    throw NoProviderAvailableError("No proxy provider has spare capacity");
}

void Manager::release(const Endpoint& endpoint, const std::optional<std::string>& reason) {
    auto it = by_name_.find(endpoint.provider);
    if (it == by_name_.end()) {
        Logger::warn("Release ignored for endpoint of unknown provider '" + endpoint.provider
                     + "': " + endpoint.redacted_url());
        return;
    }

    Slot&       slot     = *it->second;
    std::string key      = endpoint.identity_key();
    bool        released = false;
    int         active   = 0;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        auto                        lease = slot.leases.find(key);
        if (lease != slot.leases.end()) {
            if (--lease->second == 0)
                slot.leases.erase(lease);
            if (slot.active > 0)
                slot.active--;
            released = true;
        }
        active = slot.active;
    }

    if (!released) {
        Logger::warn("Release ignored, no outstanding lease for " + key
                     + " (double release?) active=" + std::to_string(active));
        return;
    }

    if (meter_)
        meter_->record_release(endpoint, reason);
}

void Manager::record_request(const Endpoint& endpoint,
                             uint64_t        bytes_sent,
                             uint64_t        bytes_received,
                             bool            success) {
    if (meter_)
        meter_->record_request(endpoint, bytes_sent, bytes_received, success);
}

ManagerStats Manager::get_stats() const {
    ManagerStats stats;
    for (const auto& slot : slots_) {
        ProviderStats ps;
        ps.name         = slot->provider->name();
        ps.type         = slot->provider->config().type;
        ps.limit        = slot->limit;
        ps.price_per_gb = slot->provider->config().price_per_gb;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            ps.active_count = slot->active;
        }
        stats.providers.push_back(std::move(ps));
    }
    if (meter_)
        stats.usage = meter_->get_summary();
    return stats;
}

int Manager::active_count(const std::string& name) const {
    const Slot&                 slot = slot_for(name);
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.active;
}

std::vector<std::string> Manager::provider_names() const {
    std::vector<std::string> names;
    for (const auto& slot : slots_)
        names.push_back(slot->provider->name());
    return names;
}

Provider& Manager::provider(const std::string& name) {
    return *slot_for(name).provider;
}

}  // namespace Proxy
}  // namespace Conduit
