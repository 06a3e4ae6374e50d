#pragma once
#include <map>
#include <optional>
#include <string>

namespace Conduit {
namespace Proxy {

enum class ProxyType { Residential, Datacenter, Isp, Mobile };

enum class IpVersion { V4, V6 };

enum class RotationType { Rotating, Sticky };

std::string  to_string(ProxyType type);
std::string  to_string(IpVersion version);
std::string  to_string(RotationType rotation);
ProxyType    parse_proxy_type(const std::string& text);
IpVersion    parse_ip_version(const std::string& text);
RotationType parse_rotation_type(const std::string& text);

struct BrowserProxySpec {
    std::string                server;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

// One resolved proxy connection. Providers build these and never touch them again.
struct Endpoint {
    std::string                        scheme = "http";
    std::string                        host;
    int                                port = 0;
    std::string                        username;
    std::string                        password;
    std::string                        provider;
    std::optional<std::string>         session;
    ProxyType                          proxy_type    = ProxyType::Datacenter;
    IpVersion                          ip_version    = IpVersion::V4;
    RotationType                       rotation_type = RotationType::Sticky;
    std::optional<std::string>         region;
    std::map<std::string, std::string> metadata;

    // provider:host:port:session, session empty when the provider has none.
    std::string identity_key() const;

    std::string server() const;
    std::string url() const;
    std::string redacted_url() const;

    std::map<std::string, std::string> as_http_proxy_spec() const;
    BrowserProxySpec                   as_browser_proxy_spec() const;

    bool operator==(const Endpoint& other) const;
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

}  // namespace Proxy
}  // namespace Conduit
