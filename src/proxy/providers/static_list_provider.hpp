#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include "provider.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

class StaticListProvider : public Provider {
public:
    explicit StaticListProvider(ProviderConfig config);

    Endpoint acquire(const std::optional<std::string>& region,
                     const std::optional<std::string>& purpose) override;

    const std::vector<Endpoint>& pool() const { return pool_; }
    uint64_t                     cursor() const { return next_.load(); }

private:
    std::vector<Endpoint> parse_entries(const std::string& raw) const;
    static std::string    read_entries_file(const std::string& path);

    std::string  default_scheme_;
    ProxyType    proxy_type_;
    IpVersion    ip_version_;
    RotationType rotation_type_;

    std::vector<Endpoint> pool_;
    std::atomic<uint64_t> next_{0};
};

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
