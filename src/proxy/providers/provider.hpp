#pragma once
#include <optional>
#include <string>
#include "../../core/config/provider_config.hpp"
#include "../endpoint/endpoint.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

using Core::ProviderConfig;

class Provider {
public:
    explicit Provider(ProviderConfig config) : config_(std::move(config)) {}
    virtual ~Provider() = default;

    Provider(const Provider&)            = delete;
    Provider& operator=(const Provider&) = delete;

    virtual Endpoint acquire(const std::optional<std::string>& region,
                             const std::optional<std::string>& purpose) = 0;

    const ProviderConfig& config() const { return config_; }
    const std::string&    name() const { return config_.name; }

protected:
    int parse_port(const std::string& text) const;

private:
    const ProviderConfig config_;
};

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
