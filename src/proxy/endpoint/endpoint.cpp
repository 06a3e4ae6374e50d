#include "endpoint.hpp"
#include "../../core/errors/errors.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Proxy {

using Core::ConfigurationError;
namespace Text = Utils::Text;
namespace Http = Network::Http;

std::string to_string(ProxyType type) {
    switch (type) {
        case ProxyType::Residential: return "residential";
        case ProxyType::Datacenter: return "datacenter";
        case ProxyType::Isp: return "isp";
        case ProxyType::Mobile: return "mobile";
    }
    return "unknown";
}

std::string to_string(IpVersion version) {
    return version == IpVersion::V6 ? "ipv6" : "ipv4";
}

std::string to_string(RotationType rotation) {
    return rotation == RotationType::Rotating ? "rotating" : "sticky";
}

ProxyType parse_proxy_type(const std::string& text) {
    std::string value = Text::to_lower(Text::trim(text));
    if (value == "residential")
        return ProxyType::Residential;
    if (value == "datacenter")
        return ProxyType::Datacenter;
    if (value == "isp")
        return ProxyType::Isp;
    if (value == "mobile")
        return ProxyType::Mobile;
    throw ConfigurationError("Unknown proxy_type: " + text);
}

IpVersion parse_ip_version(const std::string& text) {
    std::string value = Text::to_lower(Text::trim(text));
    if (value == "ipv4" || value == "v4")
        return IpVersion::V4;
    if (value == "ipv6" || value == "v6")
        return IpVersion::V6;
    throw ConfigurationError("Unknown ip_version: " + text);
}

RotationType parse_rotation_type(const std::string& text) {
    std::string value = Text::to_lower(Text::trim(text));
    if (value == "rotating")
        return RotationType::Rotating;
    if (value == "sticky")
        return RotationType::Sticky;
    throw ConfigurationError("Unknown rotation_type: " + text);
}

std::string Endpoint::identity_key() const {
    return provider + ":" + host + ":" + std::to_string(port) + ":" + session.value_or("");
}

std::string Endpoint::server() const {
    std::string h = host;
    if (h.find(':') != std::string::npos && h.front() != '[')
        h = "[" + h + "]";
    return scheme + "://" + h + ":" + std::to_string(port);
}

std::string Endpoint::url() const {
    std::string auth;
    if (!username.empty() && !password.empty())
        auth = Http::CurlClient::escape(username) + ":" + Http::CurlClient::escape(password) + "@";
    else if (!username.empty())
        auth = Http::CurlClient::escape(username) + "@";

    std::string base = server();
    return base.insert(scheme.size() + 3, auth);
}

std::string Endpoint::redacted_url() const {
    std::string auth;
    if (!username.empty())
        auth = username + (password.empty() ? "" : ":***") + "@";
    std::string base = server();
    return base.insert(scheme.size() + 3, auth);
}

std::map<std::string, std::string> Endpoint::as_http_proxy_spec() const {
    std::string u = url();
    return {{"http", u}, {"https", u}};
}

BrowserProxySpec Endpoint::as_browser_proxy_spec() const {
    BrowserProxySpec spec;
    spec.server = server();
    if (!username.empty())
        spec.username = username;
    if (!password.empty())
        spec.password = password;
    return spec;
}

bool Endpoint::operator==(const Endpoint& other) const {
    return scheme == other.scheme && host == other.host && port == other.port
           && username == other.username && password == other.password
           && provider == other.provider && session == other.session
           && proxy_type == other.proxy_type && ip_version == other.ip_version
           && rotation_type == other.rotation_type && region == other.region
           && metadata == other.metadata;
}

}  // namespace Proxy
}  // namespace Conduit
