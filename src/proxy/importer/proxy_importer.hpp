#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../../core/config/provider_config.hpp"
#include "../endpoint/endpoint.hpp"

namespace Conduit {
namespace Proxy {
namespace Importer {

struct DetectionResult {
    std::string                scheme = "http";
    std::string                host;
    int                        port = 0;
    std::string                username;
    std::string                password;
    std::optional<std::string> provider;
    std::optional<std::string> session;
    std::optional<std::string> region;
    ProxyType                  proxy_type    = ProxyType::Datacenter;
    IpVersion                  ip_version    = IpVersion::V4;
    RotationType               rotation_type = RotationType::Sticky;
    double                     confidence    = 1.0;
};

// Guesses vendor, proxy type and address family from free-form proxy strings.
class Detector {
public:
    static std::optional<std::string> detect_provider(const std::string& host,
                                                      const std::string& username,
                                                      const std::string& password);
    static ProxyType detect_proxy_type(const std::string& host, const std::string& password);
    static IpVersion detect_ip_version(const std::string& host);

    // Accepts host:port, user:pass@host:port, host:port:user:pass and an optional scheme://
    // prefix. Returns nullopt when no host or a valid port can be found.
    static std::optional<DetectionResult> parse(const std::string& proxy_string);
};

class BatchImporter {
public:
    static constexpr const char* DEFAULT_PROVIDER_NAME = "auto-imported";
    static constexpr double      DEFAULT_PRICE_PER_GB  = 5.0;

    // Unparseable strings are skipped with a warning.
    static std::vector<Endpoint> import_from_list(
        const std::vector<std::string>& proxy_strings,
        const std::string&              provider_name = DEFAULT_PROVIDER_NAME,
        std::optional<ProxyType>        proxy_type    = std::nullopt);

    // One proxy per line; blank lines and '#' comment lines are ignored.
    static std::vector<Endpoint> import_from_file(
        const std::string&       path,
        const std::string&       provider_name = DEFAULT_PROVIDER_NAME,
        std::optional<ProxyType> proxy_type    = std::nullopt);

    // Packs imported endpoints into a descriptor the Manager can load. MooProxy hosts with
    // full credentials become a static-mode mooproxy provider, anything else a static_list.
    static Core::ProviderConfig create_provider_config(
        const std::vector<Endpoint>& endpoints,
        const std::string&           name,
        double                       price_per_gb      = DEFAULT_PRICE_PER_GB,
        std::optional<int>           concurrency_limit = std::nullopt);
};

}  // namespace Importer
}  // namespace Proxy
}  // namespace Conduit
