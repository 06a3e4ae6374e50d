#include "static_list_provider.hpp"
#include <fstream>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

using namespace Conduit::Core;
namespace Text = Utils::Text;

StaticListProvider::StaticListProvider(ProviderConfig config)
    : Provider(std::move(config)),
      default_scheme_(Text::to_lower(this->config().option("scheme", Constants::DEFAULT_SCHEME))),
      proxy_type_(parse_proxy_type(this->config().option("proxy_type", "datacenter"))),
      ip_version_(parse_ip_version(this->config().option("ip_version", "ipv4"))),
      rotation_type_(parse_rotation_type(this->config().option("rotation_type", "sticky"))) {
    std::string raw = this->config().option("entries");
    if (this->config().has_option("entries_file")) {
        std::string from_file = read_entries_file(this->config().option("entries_file"));
        raw += raw.empty() ? from_file : "\n" + from_file;
    }

    pool_ = parse_entries(raw);
    if (pool_.empty()) {
        Logger::error("StaticList provider '" + name() + "' has no usable entries");
        throw ConfigurationError("StaticList provider '" + name()
                                 + "' requires at least one proxy entry");
    }

    Logger::info("Initialized StaticList provider: name=" + name()
                 + " entries=" + std::to_string(pool_.size()) + " type=" + to_string(proxy_type_)
                 + " ip_version=" + to_string(ip_version_));
}

std::string StaticListProvider::read_entries_file(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw ConfigurationError("Cannot read proxy entries file: " + path);

    std::string out;
    std::string line;
    while (std::getline(file, line)) {
        // only whole-line comments: passwords may contain '#'
        line = Text::trim(line);
        if (line.empty() || Text::starts_with(line, "#"))
            continue;
        if (!out.empty())
            out += "\n";
        out += line;
    }
    return out;
}

std::vector<Endpoint> StaticListProvider::parse_entries(const std::string& raw) const {
    std::vector<Endpoint> entries;
    for (const auto& line : Text::split_any(raw, ",\n")) {
        std::string scheme = default_scheme_;
        std::string rest   = line;

        size_t sep = line.find("://");
        if (sep != std::string::npos) {
            scheme = Text::to_lower(line.substr(0, sep));
            rest   = line.substr(sep + 3);
        }

        std::string username;
        std::string password;
        std::string hostport = rest;
        size_t      at       = rest.rfind('@');
        if (at != std::string::npos) {
            std::string creds = rest.substr(0, at);
            hostport          = rest.substr(at + 1);
            size_t colon      = creds.find(':');
            if (colon != std::string::npos) {
                username = creds.substr(0, colon);
                password = creds.substr(colon + 1);
            }
            else {
                username = creds;
            }
        }

        size_t colon = hostport.rfind(':');
        if (colon == std::string::npos) {
            Logger::warn("Skipping invalid static proxy entry (no port): " + line);
            continue;
        }
        std::string host = hostport.substr(0, colon);
        if (host.size() > 2 && host.front() == '[' && host.back() == ']')
            host = host.substr(1, host.size() - 2);

        int port = 0;
        try {
            port = parse_port(hostport.substr(colon + 1));
        } catch (const ConfigurationError&) {
            Logger::warn("Skipping invalid static proxy entry (bad port): " + line);
            continue;
        }
        if (host.empty()) {
            Logger::warn("Skipping invalid static proxy entry (no host): " + line);
            continue;
        }

        Endpoint ep;
        ep.scheme        = scheme;
        ep.host          = host;
        ep.port          = port;
        ep.username      = username;
        ep.password      = password;
        ep.provider      = name();
        ep.proxy_type    = proxy_type_;
        ep.ip_version    = ip_version_;
        ep.rotation_type = rotation_type_;
        ep.metadata      = {{"kind", "static"}};
        entries.push_back(std::move(ep));
    }
    return entries;
}

Endpoint StaticListProvider::acquire(const std::optional<std::string>& /*region*/,
                                     const std::optional<std::string>& /*purpose*/) {
    uint64_t index = next_.fetch_add(1);
    return pool_[index % pool_.size()];
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
