#include "brightdata_provider.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/crypto/session_token.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

using namespace Conduit::Core;

BrightDataProvider::BrightDataProvider(ProviderConfig config)
    : Provider(std::move(config)),
      host_(this->config().option("host", Constants::BRIGHTDATA_DEFAULT_HOST)),
      port_(parse_port(this->config().option(
          "port", std::to_string(Constants::BRIGHTDATA_DEFAULT_PORT)))),
      username_(this->config().option("username")),
      password_(this->config().option("password")),
      proxy_type_(parse_proxy_type(this->config().option("proxy_type", "residential"))),
      ip_version_(parse_ip_version(this->config().option("ip_version", "ipv4"))) {
    if (username_.empty() || password_.empty()) {
        Logger::error("BrightData provider '" + name() + "' requires username and password");
        throw ConfigurationError("BrightData provider '" + name()
                                 + "' requires username and password");
    }
    if (this->config().has_option("country"))
        country_ = this->config().option("country");
    if (this->config().has_option("city"))
        city_ = this->config().option("city");

    Logger::info("Initialized BrightData provider: name=" + name() + " host=" + host_ + ":"
                 + std::to_string(port_) + " type=" + to_string(proxy_type_)
                 + " ip_version=" + to_string(ip_version_)
                 + " country=" + country_.value_or("any"));
}

Endpoint BrightDataProvider::acquire(const std::optional<std::string>& region,
                                     const std::optional<std::string>& purpose) {
    std::string session = sessions_.issue(
        [] { return Utils::Crypto::random_hex(Constants::BRIGHTDATA_SESSION_BYTES); });

    std::optional<std::string> cc = (region && !region->empty()) ? region : country_;

    std::string user = username_ + "-session-" + session;
    if (cc)
        user += "-country-" + *cc;
    if (city_)
        user += "-city-" + *city_;

    Endpoint ep;
    ep.scheme        = Constants::DEFAULT_SCHEME;
    ep.host          = host_;
    ep.port          = port_;
    ep.username      = user;
    ep.password      = password_;
    ep.provider      = name();
    ep.session       = session;
    ep.proxy_type    = proxy_type_;
    ep.ip_version    = ip_version_;
    ep.rotation_type = RotationType::Rotating;
    ep.region        = cc;
    ep.metadata      = {{"kind", "metered"},
                        {"provider", "brightdata"},
                        {"purpose", purpose.value_or(Constants::DEFAULT_PURPOSE)}};
    return ep;
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
