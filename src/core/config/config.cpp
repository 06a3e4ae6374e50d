#include "config.hpp"
#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>
#include "../errors/errors.hpp"

namespace Conduit {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml.IsSequence())
            return;  // bare provider list, no tool settings
        if (yaml["provider"])
            config.provider = yaml["provider"].as<std::string>();
        if (yaml["region"])
            config.region = yaml["region"].as<std::string>();
        if (yaml["purpose"])
            config.purpose = yaml["purpose"].as<std::string>();
        if (yaml["count"])
            config.count = yaml["count"].as<int>();
        if (yaml["test"])
            config.run_tests = yaml["test"].as<bool>();
        if (yaml["test_url"])
            config.test_url = yaml["test_url"].as<std::string>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["workers"])
            config.workers = yaml["workers"].as<int>();
        if (yaml["metering"])
            config.enable_metering = yaml["metering"].as<bool>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
        if (yaml["output"])
            config.output_path = yaml["output"].as<std::string>();
        if (yaml["import"])
            config.import_path = yaml["import"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Conduit - proxy acquisition, metering and health testing"};

    std::string provider;
    std::string region;
    std::string purpose;

    app.add_option("-c,--config", config.config_path, "YAML file with provider descriptors")
        ->required();
    app.add_option("-p,--provider", provider, "Acquire from this provider only");
    app.add_option("-r,--region", region, "Region / country code to request");
    app.add_option("--purpose", purpose, "Purpose tag recorded by the meter");
    app.add_option("-n,--count", config.count, "Number of endpoints to acquire");
    app.add_option("--test-url", config.test_url, "IP echo URL used for health tests");
    app.add_option("--timeout", config.timeout, "Per-test timeout in seconds");
    app.add_option("-w,--workers", config.workers, "Parallel health-test workers");
    app.add_option("--log-level", config.log_level, "info, warn, error or none");
    app.add_option("-o,--output", config.output_path, "Write the JSON report to this file");
    app.add_option("--import", config.import_path,
                   "Proxy list to auto-detect and load as an extra provider");
    app.add_flag("--test", config.run_tests, "Health-test every acquired endpoint");
    app.add_flag(
        "--no-meter",
        [&](size_t count) {
            if (count > 0)
                config.enable_metering = false;
        },
        "Disable usage metering");
    app.add_flag("-q,--quiet", config.quiet, "Only print errors");
    app.set_version_flag("--version", Constants::VERSION);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    load_yaml(config, config.config_path);

    // Second pass so command-line values win over the file.
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!provider.empty())
        config.provider = provider;
    if (!region.empty())
        config.region = region;
    if (!purpose.empty())
        config.purpose = purpose;
    if (config.count < 1)
        config.count = 1;
    if (config.timeout < 1)
        config.timeout = 1;
    if (config.workers < 1)
        config.workers = 1;
    if (config.quiet)
        config.log_level = "error";

    return config;
}

}  // namespace Core
}  // namespace Conduit
