#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Conduit {
namespace Core {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

struct ProviderConfig {
    std::string                        name;
    std::string                        type;
    std::optional<double>              price_per_gb;
    std::optional<int>                 concurrency_limit;  // nullopt = unlimited
    std::map<std::string, std::string> options;

    bool        unlimited() const { return !concurrency_limit.has_value(); }
    double      price_or_zero() const { return price_per_gb.value_or(0.0); }
    std::string option(const std::string& key, const std::string& fallback = "") const;
    bool        has_option(const std::string& key) const;
};

// Expands an "env:VAR" reference. Plain values are returned unchanged.
std::string resolve_secret(const std::string& value, const EnvLookup& env);

std::vector<ProviderConfig> parse_provider_configs(const YAML::Node& root,
                                                   const EnvLookup& env = process_env());
std::vector<ProviderConfig> parse_provider_configs(const std::string& yaml_text,
                                                   const EnvLookup&   env = process_env());
std::vector<ProviderConfig> load_provider_configs(const std::string& path,
                                                  const EnvLookup&   env = process_env());

}  // namespace Core
}  // namespace Conduit
