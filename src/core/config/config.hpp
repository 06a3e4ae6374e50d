#pragma once
#include <optional>
#include <string>

#include "../types/constants.hpp"

namespace Conduit {
namespace Core {

// Settings for the conduit command-line tool. Provider descriptors live in the same
// YAML file and are loaded separately by load_provider_configs().
struct Config {
    std::string                config_path;
    std::optional<std::string> provider;
    std::optional<std::string> region;
    std::optional<std::string> purpose;
    int                        count          = Constants::DEFAULT_ACQUIRE_COUNT;
    bool                       run_tests      = false;
    std::string                test_url       = Constants::DEFAULT_TEST_URL;
    int                        timeout        = Constants::DEFAULT_TEST_TIMEOUT_SECONDS;
    int                        workers        = Constants::DEFAULT_TEST_WORKERS;
    bool                       enable_metering = true;
    bool                       quiet           = false;
    std::string                log_level       = "info";
    std::string                output_path;
    std::string                import_path;  // extra proxies, one per line

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Conduit
