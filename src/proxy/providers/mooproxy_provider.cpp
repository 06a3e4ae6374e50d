#include "mooproxy_provider.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/crypto/session_token.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

using namespace Conduit::Core;
namespace Text = Utils::Text;

namespace {
const std::string SESSION_MARKER = "_session-";
const std::string COUNTRY_MARKER = "_country-";
}  // namespace

MooProxyProvider::MooProxyProvider(ProviderConfig config)
    : Provider(std::move(config)),
      mode_(this->config().has_option("entries") ? Mode::Static : Mode::Dynamic),
      proxy_type_(parse_proxy_type(this->config().option("proxy_type", "residential"))),
      ip_version_(parse_ip_version(this->config().option("ip_version", "ipv4"))) {
    if (mode_ == Mode::Static) {
        pool_ = parse_entries(this->config().option("entries"));
        if (pool_.empty())
            throw ConfigurationError("MooProxy provider '" + name() + "' entries list is empty");
        Logger::info("Initialized MooProxy provider (static mode): name=" + name()
                     + " entries=" + std::to_string(pool_.size())
                     + " type=" + to_string(proxy_type_));
        return;
    }

    const ProviderConfig& cfg = this->config();
    if (!cfg.has_option("host") || !cfg.has_option("port") || !cfg.has_option("username")
        || !cfg.has_option("password")) {
        Logger::error("MooProxy provider '" + name()
                      + "' dynamic mode requires host, port, username, password");
        throw ConfigurationError("MooProxy provider '" + name()
                                 + "' requires either 'entries' or host, port, username, password");
    }
    scheme_   = Text::to_lower(cfg.option("scheme", Constants::DEFAULT_SCHEME));
    host_     = cfg.option("host");
    port_     = parse_port(cfg.option("port"));
    username_ = cfg.option("username");
    password_ = cfg.option("password");
    country_  = cfg.option("country", Constants::MOOPROXY_DEFAULT_COUNTRY);

    Logger::info("Initialized MooProxy provider (dynamic mode): name=" + name() + " host=" + host_
                 + ":" + std::to_string(port_) + " type=" + to_string(proxy_type_)
                 + " ip_version=" + to_string(ip_version_) + " country=" + country_);
}

std::optional<std::string> MooProxyProvider::extract_session_id(const std::string& password) {
    size_t pos = password.rfind(SESSION_MARKER);
    if (pos == std::string::npos)
        return std::nullopt;
    std::string id = password.substr(pos + SESSION_MARKER.size());
    if (id.empty())
        return std::nullopt;
    return id;
}

std::optional<std::string> MooProxyProvider::extract_region(const std::string& password) {
    size_t pos = password.find(COUNTRY_MARKER);
    if (pos == std::string::npos)
        return std::nullopt;
    std::string rest    = password.substr(pos + COUNTRY_MARKER.size());
    std::string country = rest.substr(0, rest.find('_'));
    if (country.empty())
        return std::nullopt;
    return country;
}

std::vector<Endpoint> MooProxyProvider::parse_entries(const std::string& raw) const {
    std::vector<Endpoint> entries;
    for (const auto& line : Text::split_any(raw, ",\n")) {
        // host:port:user:password, where the password itself may contain colons
        size_t first  = line.find(':');
        size_t second = first == std::string::npos ? first : line.find(':', first + 1);
        size_t third  = second == std::string::npos ? second : line.find(':', second + 1);
        if (third == std::string::npos)
            throw ProviderGenerationError("Malformed MooProxy entry in provider '" + name()
                                          + "' (expected host:port:user:pass): " + line);

        std::string host     = line.substr(0, first);
        std::string port_s   = line.substr(first + 1, second - first - 1);
        std::string username = line.substr(second + 1, third - second - 1);
        std::string password = line.substr(third + 1);
        if (host.empty() || username.empty() || password.empty())
            throw ProviderGenerationError("Malformed MooProxy entry in provider '" + name()
                                          + "': " + line);

        int port = 0;
        try {
            port = parse_port(port_s);
        } catch (const ConfigurationError&) {
            throw ProviderGenerationError("Invalid port in MooProxy entry of provider '" + name()
                                          + "': " + line);
        }

        Endpoint ep;
        ep.scheme        = Constants::DEFAULT_SCHEME;
        ep.host          = host;
        ep.port          = port;
        ep.username      = username;
        ep.password      = password;
        ep.provider      = name();
        ep.session       = extract_session_id(password);
        ep.proxy_type    = proxy_type_;
        ep.ip_version    = ip_version_;
        ep.rotation_type = RotationType::Sticky;
        ep.region        = extract_region(password);
        ep.metadata      = {{"kind", "mooproxy"}, {"mode", "static"}};
        entries.push_back(std::move(ep));
    }
    return entries;
}

Endpoint MooProxyProvider::synthesize(const std::optional<std::string>& region,
                                      const std::optional<std::string>& purpose) {
    std::string country = (region && !region->empty()) ? *region : country_;
    if (!Text::is_alnum(country))
        throw ProviderGenerationError("MooProxy provider '" + name()
                                      + "' cannot encode region: '" + country + "'");

    std::string session = sessions_.issue(
        [] { return Utils::Crypto::random_urlsafe(Constants::MOOPROXY_SESSION_BYTES); });

    Endpoint ep;
    ep.scheme        = scheme_;
    ep.host          = host_;
    ep.port          = port_;
    ep.username      = username_;
    ep.password      = password_ + COUNTRY_MARKER + country + SESSION_MARKER + session;
    ep.provider      = name();
    ep.session       = session;
    ep.proxy_type    = proxy_type_;
    ep.ip_version    = ip_version_;
    ep.rotation_type = RotationType::Sticky;
    ep.region        = country;
    ep.metadata      = {{"kind", "mooproxy"},
                        {"mode", "dynamic"},
                        {"country", country},
                        {"purpose", purpose.value_or(Constants::DEFAULT_PURPOSE)}};
    return ep;
}

Endpoint MooProxyProvider::acquire(const std::optional<std::string>& region,
                                   const std::optional<std::string>& purpose) {
    if (mode_ == Mode::Static) {
        uint64_t index = next_.fetch_add(1);
        return pool_[index % pool_.size()];
    }
    return synthesize(region, purpose);
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
