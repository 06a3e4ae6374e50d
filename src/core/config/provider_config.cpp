#include "provider_config.hpp"
#include <cmath>
#include <cstdlib>
#include <set>
#include <yaml-cpp/yaml.h>
#include "../errors/errors.hpp"
#include "../logger/logger.hpp"
#include "../types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Core {

namespace {

std::string scalar_or_joined(const YAML::Node& node, const std::string& key) {
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!joined.empty())
                joined += "\n";
            joined += item.as<std::string>();
        }
        return joined;
    }
    if (!node.IsScalar())
        throw ConfigurationError("Option '" + key + "' must be a scalar or a list");
    return node.as<std::string>();
}

ProviderConfig parse_descriptor(const YAML::Node& item, size_t index, const EnvLookup& env) {
    if (!item.IsMap())
        throw ConfigurationError("Provider entry #" + std::to_string(index) + " is not a mapping");

    ProviderConfig cfg;
    if (!item["name"] || item["name"].as<std::string>().empty())
        throw ConfigurationError("Provider entry #" + std::to_string(index) + " has no name");
    cfg.name = item["name"].as<std::string>();

    if (!item["type"] || item["type"].as<std::string>().empty())
        throw ConfigurationError("Provider '" + cfg.name + "' has no type");
    cfg.type = item["type"].as<std::string>();

    if (item["price_per_gb"] && !item["price_per_gb"].IsNull()) {
        double price = item["price_per_gb"].as<double>();
        if (!std::isfinite(price))
            throw ConfigurationError("Provider '" + cfg.name + "' has a non-finite price_per_gb");
        if (price < 0.0)
            throw ConfigurationError("Provider '" + cfg.name + "' has a negative price_per_gb");
        cfg.price_per_gb = price;
    }

    if (item["concurrency_limit"] && !item["concurrency_limit"].IsNull()) {
        int limit = item["concurrency_limit"].as<int>();
        if (limit < 0)
            throw ConfigurationError("Provider '" + cfg.name
                                     + "' has a negative concurrency_limit");
        if (limit > 0)
            cfg.concurrency_limit = limit;
    }

    const YAML::Node options = item["options"];
    if (options && !options.IsNull()) {
        if (!options.IsMap())
            throw ConfigurationError("Provider '" + cfg.name + "' options must be a mapping");
        for (auto it = options.begin(); it != options.end(); ++it) {
            std::string key   = it->first.as<std::string>();
            std::string value = scalar_or_joined(it->second, key);
            cfg.options[key]  = resolve_secret(value, env);
        }
    }
    return cfg;
}

}  // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr)
            return std::nullopt;
        return std::string(value);
    };
}

std::string ProviderConfig::option(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    if (it == options.end() || it->second.empty())
        return fallback;
    return it->second;
}

bool ProviderConfig::has_option(const std::string& key) const {
    auto it = options.find(key);
    return it != options.end() && !it->second.empty();
}

std::string resolve_secret(const std::string& value, const EnvLookup& env) {
    const std::string prefix = Constants::SECRET_PREFIX;
    if (!Utils::Text::starts_with(value, prefix))
        return value;

    std::string var = value.substr(prefix.size());
    if (var.empty())
        throw ConfigurationError("Empty environment reference in secret: " + value);

    auto resolved = env(var);
    if (!resolved || resolved->empty())
        throw ConfigurationError("Unresolved secret reference: environment variable " + var
                                 + " is not set");
    return *resolved;
}

std::vector<ProviderConfig> parse_provider_configs(const YAML::Node& root, const EnvLookup& env) {
    YAML::Node list = root;
    if (root.IsMap())
        list = root["providers"];
    if (!list || list.IsNull())
        return {};
    if (!list.IsSequence())
        throw ConfigurationError("'providers' must be a list of provider descriptors");

    std::vector<ProviderConfig> configs;
    std::set<std::string>       names;
    size_t                      index = 0;
    try {
        for (const auto& item : list) {
            ProviderConfig cfg = parse_descriptor(item, index++, env);
            if (!names.insert(cfg.name).second)
                throw ConfigurationError("Duplicate provider name: " + cfg.name);
            configs.push_back(std::move(cfg));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid provider entry: " + std::string(e.what()));
    }

    Logger::info("Loaded " + std::to_string(configs.size()) + " provider configuration(s)");
    return configs;
}

std::vector<ProviderConfig> parse_provider_configs(const std::string& yaml_text,
                                                   const EnvLookup&   env) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing provider config: " + std::string(e.what()));
    }
    return parse_provider_configs(root, env);
}

std::vector<ProviderConfig> load_provider_configs(const std::string& path, const EnvLookup& env) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing config file " + path + ": "
                                 + std::string(e.what()));
    }
    return parse_provider_configs(root, env);
}

}  // namespace Core
}  // namespace Conduit
