#include "proxy_importer.hpp"
#include <fstream>
#include <initializer_list>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../providers/mooproxy_provider.hpp"

namespace Conduit {
namespace Proxy {
namespace Importer {

using namespace Conduit::Core;
namespace Text = Utils::Text;
using Providers::MooProxyProvider;

namespace {

const std::vector<std::pair<std::string, std::vector<std::string>>>& provider_patterns() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> patterns = {
        {"mooproxy", {R"(mooproxy\.net)", R"(_session-[A-Za-z0-9]+)"}},
        {"brightdata", {R"(lum-superproxy\.io)", R"(zproxy\.lum)"}},
        {"smartproxy", {R"(smartproxy\.com)", R"(gate\.smartproxy)"}},
        {"oxylabs", {R"(oxylabs\.io)", R"(pr\.oxylabs)"}},
        {"iproyal", {R"(iproyal\.com)"}},
    };
    return patterns;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

std::optional<int> parse_port(const std::string& text) {
    try {
        size_t consumed = 0;
        int    port     = std::stoi(text, &consumed);
        if (consumed == text.size() && port > 0 && port <= 65535)
            return port;
    } catch (const std::logic_error&) {
    }
    return std::nullopt;
}

std::string strip_brackets(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

// host:port:user:pass, the password keeping any further colons.
bool parse_colon_form(const std::string& text, DetectionResult& out) {
    size_t first  = text.find(':');
    size_t second = first == std::string::npos ? first : text.find(':', first + 1);
    size_t third  = second == std::string::npos ? second : text.find(':', second + 1);
    if (third == std::string::npos)
        return false;

    auto port = parse_port(text.substr(first + 1, second - first - 1));
    if (!port || first == 0)
        return false;
    out.host     = text.substr(0, first);
    out.port     = *port;
    out.username = text.substr(second + 1, third - second - 1);
    out.password = text.substr(third + 1);
    return true;
}

// [user[:pass]@]host:port
bool parse_at_form(const std::string& text, DetectionResult& out) {
    std::string hostport = text;
    std::string username;
    std::string password;
    size_t      at = text.rfind('@');
    if (at != std::string::npos) {
        std::string creds = text.substr(0, at);
        hostport          = text.substr(at + 1);
        size_t colon      = creds.find(':');
        username          = creds.substr(0, colon);
        if (colon != std::string::npos)
            password = creds.substr(colon + 1);
    }

    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos)
        return false;
    auto port = parse_port(hostport.substr(colon + 1));
    if (!port)
        return false;
    std::string host = strip_brackets(hostport.substr(0, colon));
    if (host.empty())
        return false;

    out.host     = host;
    out.port     = *port;
    out.username = username;
    out.password = password;
    return true;
}

std::string format_confidence(double confidence) {
    std::ostringstream out;
    out << confidence;
    return out.str();
}

std::string bracket_host(const std::string& host) {
    return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}

}  // namespace

std::optional<std::string> Detector::detect_provider(const std::string& host,
                                                     const std::string& username,
                                                     const std::string& password) {
    std::string text = host + " " + username + " " + password;
    for (const auto& [provider, patterns] : provider_patterns()) {
        for (const auto& pattern : patterns) {
            if (std::regex_search(text, std::regex(pattern, std::regex::icase)))
                return provider;
        }
    }
    return std::nullopt;
}

ProxyType Detector::detect_proxy_type(const std::string& host, const std::string& password) {
    std::string text = Text::to_lower(host) + " " + Text::to_lower(password);
    if (contains_any(text, {"static-residential"}))
        return ProxyType::Isp;
    if (contains_any(text, {"residential", "resi", "home", "dsl", "cable"}))
        return ProxyType::Residential;
    if (contains_any(text, {"isp"}))
        return ProxyType::Isp;
    if (contains_any(text, {"mobile", "4g", "5g", "cellular"}))
        return ProxyType::Mobile;
    return ProxyType::Datacenter;
}

IpVersion Detector::detect_ip_version(const std::string& host) {
    if (host.find(':') != std::string::npos || contains_any(Text::to_lower(host), {"v6"}))
        return IpVersion::V6;
    return IpVersion::V4;
}

std::optional<DetectionResult> Detector::parse(const std::string& proxy_string) {
    std::string     text = Text::trim(proxy_string);
    DetectionResult result;

    size_t sep = text.find("://");
    if (sep != std::string::npos) {
        result.scheme = Text::to_lower(text.substr(0, sep));
        text          = text.substr(sep + 3);
    }
    if (result.scheme.empty())
        result.scheme = Constants::DEFAULT_SCHEME;

    // user:pass@host:port first: its passwords may hold colons too
    bool parsed = (text.find('@') != std::string::npos && parse_at_form(text, result))
               || parse_colon_form(text, result) || parse_at_form(text, result);
    if (!parsed) {
        Logger::warn("Could not parse proxy string (" + std::to_string(text.size()) + " chars)");
        return std::nullopt;
    }

    result.provider      = detect_provider(result.host, result.username, result.password);
    result.proxy_type    = detect_proxy_type(result.host, result.password);
    result.ip_version    = detect_ip_version(result.host);
    result.rotation_type = RotationType::Sticky;
    result.session       = MooProxyProvider::extract_session_id(result.password);
    result.region        = MooProxyProvider::extract_region(result.password);
    result.confidence    = result.provider ? 1.0 : 0.7;
    return result;
}

std::vector<Endpoint> BatchImporter::import_from_list(const std::vector<std::string>& proxy_strings,
                                                      const std::string&       provider_name,
                                                      std::optional<ProxyType> proxy_type) {
    std::vector<Endpoint> endpoints;
    std::string           total = std::to_string(proxy_strings.size());

    for (size_t i = 0; i < proxy_strings.size(); ++i) {
        std::string index  = std::to_string(i + 1);
        auto        result = Detector::parse(proxy_strings[i]);
        if (!result) {
            Logger::warn("Skipped invalid proxy " + index + "/" + total);
            continue;
        }

        Endpoint ep;
        ep.scheme        = result->scheme;
        ep.host          = result->host;
        ep.port          = result->port;
        ep.username      = result->username;
        ep.password      = result->password;
        ep.provider      = result->provider.value_or(provider_name);
        ep.session       = result->session;
        ep.proxy_type    = proxy_type.value_or(result->proxy_type);
        ep.ip_version    = result->ip_version;
        ep.rotation_type = result->rotation_type;
        ep.region        = result->region;
        ep.metadata      = {{"imported", "true"},
                            {"detection_confidence", format_confidence(result->confidence)},
                            {"batch_index", index}};
        endpoints.push_back(std::move(ep));
    }

    Logger::info("Imported " + std::to_string(endpoints.size()) + "/" + total + " proxies");
    return endpoints;
}

std::vector<Endpoint> BatchImporter::import_from_file(const std::string&       path,
                                                      const std::string&       provider_name,
                                                      std::optional<ProxyType> proxy_type) {
    std::ifstream file(path);
    if (!file)
        throw ConfigurationError("Cannot read proxy import file: " + path);

    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(file, line)) {
        line = Text::trim(line);
        if (line.empty() || Text::starts_with(line, "#"))
            continue;
        lines.push_back(line);
    }
    Logger::info("Read " + std::to_string(lines.size()) + " proxies from " + path);
    return import_from_list(lines, provider_name, proxy_type);
}

ProviderConfig BatchImporter::create_provider_config(const std::vector<Endpoint>& endpoints,
                                                     const std::string&           name,
                                                     double                       price_per_gb,
                                                     std::optional<int> concurrency_limit) {
    if (endpoints.empty())
        throw ConfigurationError("Cannot build provider '" + name + "' from zero endpoints");

    bool mooproxy_host = false;
    bool full_creds    = true;
    for (const auto& ep : endpoints) {
        if (Text::to_lower(ep.host).find("mooproxy") != std::string::npos)
            mooproxy_host = true;
        if (ep.username.empty() || ep.password.empty())
            full_creds = false;
    }
    bool as_mooproxy = mooproxy_host && full_creds;

    std::string entries;
    for (const auto& ep : endpoints) {
        std::string entry;
        if (as_mooproxy) {
            entry = ep.host + ":" + std::to_string(ep.port) + ":" + ep.username + ":" + ep.password;
        }
        else {
            std::string auth;
            if (!ep.username.empty())
                auth = ep.password.empty() ? ep.username + "@"
                                           : ep.username + ":" + ep.password + "@";
            entry = ep.scheme + "://" + auth + bracket_host(ep.host) + ":"
                  + std::to_string(ep.port);
        }
        if (!entries.empty())
            entries += "\n";
        entries += entry;
    }

    ProviderConfig cfg;
    cfg.name              = name;
    cfg.type              = as_mooproxy ? "mooproxy" : "static_list";
    cfg.price_per_gb      = price_per_gb;
    cfg.concurrency_limit = concurrency_limit;
    if (cfg.concurrency_limit && *cfg.concurrency_limit <= 0)
        cfg.concurrency_limit = std::nullopt;
    cfg.options = {{"entries", entries},
                   {"proxy_type", to_string(endpoints.front().proxy_type)},
                   {"ip_version", to_string(endpoints.front().ip_version)}};

    Logger::info("Created provider config: " + name + " (" + cfg.type + ") with "
                 + std::to_string(endpoints.size()) + " endpoints");
    return cfg;
}

}  // namespace Importer
}  // namespace Proxy
}  // namespace Conduit
