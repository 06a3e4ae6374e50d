#pragma once
#include <optional>
#include "provider.hpp"
#include "session_registry.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

// Rotating residential sessions. Each acquire embeds a fresh session token and the
// target country in the username:
//   <username>-session-<token>-country-<cc>[-city-<city>]
class BrightDataProvider : public Provider {
public:
    explicit BrightDataProvider(ProviderConfig config);

    Endpoint acquire(const std::optional<std::string>& region,
                     const std::optional<std::string>& purpose) override;

    size_t sessions_issued() const { return sessions_.size(); }

private:
    std::string                host_;
    int                        port_;
    std::string                username_;
    std::string                password_;
    std::optional<std::string> country_;
    std::optional<std::string> city_;
    ProxyType                  proxy_type_;
    IpVersion                  ip_version_;

    SessionRegistry sessions_;
};

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
