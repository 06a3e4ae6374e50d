#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include "provider.hpp"
#include "session_registry.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

// Sticky sessions in two modes. With an "entries" option the provider cycles through
// pre-generated host:port:user:pass_country-XX_session-ID strings; otherwise it builds
// a new session per acquire from base credentials.
class MooProxyProvider : public Provider {
public:
    enum class Mode { Static, Dynamic };

    explicit MooProxyProvider(ProviderConfig config);

    Endpoint acquire(const std::optional<std::string>& region,
                     const std::optional<std::string>& purpose) override;

    Mode                         mode() const { return mode_; }
    const std::vector<Endpoint>& pool() const { return pool_; }

    static std::optional<std::string> extract_session_id(const std::string& password);
    static std::optional<std::string> extract_region(const std::string& password);

private:
    std::vector<Endpoint> parse_entries(const std::string& raw) const;
    Endpoint              synthesize(const std::optional<std::string>& region,
                                     const std::optional<std::string>& purpose);

    Mode      mode_;
    ProxyType proxy_type_;
    IpVersion ip_version_;

    // static mode
    std::vector<Endpoint> pool_;
    std::atomic<uint64_t> next_{0};

    // dynamic mode
    std::string     scheme_;
    std::string     host_;
    int             port_ = 0;
    std::string     username_;
    std::string     password_;
    std::string     country_;
    SessionRegistry sessions_;
};

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
