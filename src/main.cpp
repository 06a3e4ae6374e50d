#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <vector>
#include "core/config/config.hpp"
#include "core/config/provider_config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "proxy/importer/proxy_importer.hpp"
#include "proxy/manager/manager.hpp"
#include "proxy/report/json_report.hpp"
#include "proxy/tester/tester.hpp"

using namespace Conduit;
using namespace Conduit::Core;

namespace {

std::vector<Proxy::Endpoint> acquire_endpoints(Proxy::Manager& manager, const Config& config) {
    std::vector<Proxy::Endpoint> endpoints;
    for (int i = 0; i < config.count; ++i) {
        try {
            endpoints.push_back(manager.acquire(config.provider, config.region, config.purpose));
        } catch (const ConcurrencyLimitError& e) {
            Logger::warn(std::string("Stopping early: ") + e.what());
            break;
        } catch (const NoProviderAvailableError& e) {
            Logger::warn(std::string("Stopping early: ") + e.what());
            break;
        }
    }
    Logger::info("Acquired " + std::to_string(endpoints.size()) + "/"
                 + std::to_string(config.count) + " endpoint(s)");
    return endpoints;
}

nlohmann::json run(const Config& config) {
    auto providers = load_provider_configs(config.config_path);
    if (!config.import_path.empty()) {
        using Proxy::Importer::BatchImporter;
        auto imported = BatchImporter::import_from_file(config.import_path);
        providers.push_back(BatchImporter::create_provider_config(
            imported, BatchImporter::DEFAULT_PROVIDER_NAME));
    }
    Proxy::Manager manager(providers, config.enable_metering);

    auto           endpoints = acquire_endpoints(manager, config);
    nlohmann::json report;

    if (config.run_tests && !endpoints.empty()) {
        Proxy::Testing::Tester tester(Proxy::Testing::Tester::default_client_factory(),
                                      manager.meter());
        auto                   results = tester.test_batch(
            endpoints,
            config.test_url,
            std::chrono::seconds(config.timeout),
            config.workers,
            [](size_t completed, size_t total) {
                Logger::info("Tested " + std::to_string(completed) + "/" + std::to_string(total));
            });
        report["tests"] = Proxy::Report::to_json(results);

        auto summary      = Proxy::Testing::Tester::summarize(results);
        report["summary"] = {{"total", summary.total},
                             {"succeeded", summary.succeeded},
                             {"failed", summary.failed},
                             {"avg_ms", summary.avg_ms},
                             {"min_ms", summary.min_ms},
                             {"max_ms", summary.max_ms}};
        for (size_t i = 0; i < endpoints.size(); ++i)
            manager.release(endpoints[i], results[i].success ? "tested" : "failed");
    }
    else {
        report["endpoints"] = nlohmann::json::array();
        for (const auto& ep : endpoints) {
            report["endpoints"].push_back(Proxy::Report::to_json(ep));
            manager.release(ep, std::string("complete"));
        }
    }

    report["stats"] = Proxy::Report::to_json(manager.get_stats());
    return report;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const ConfigurationError& e) {
        Logger::error(e.what());
        return 1;
    }
    Logger::set_level(Logger::parse_level(config.log_level));

    curl_global_init(CURL_GLOBAL_ALL);
    int exit_code = 0;
    try {
        nlohmann::json report = run(config);
        if (config.output_path.empty()) {
            std::cout << report.dump(2) << std::endl;
        }
        else {
            std::ofstream out(config.output_path);
            if (!out)
                throw ConfigurationError("Cannot write report to " + config.output_path);
            out << report.dump(2) << std::endl;
            Logger::success("Report written to " + config.output_path);
        }
    } catch (const ConfigurationError& e) {
        Logger::error(e.what());
        exit_code = 1;
    } catch (const ProxyError& e) {
        Logger::error(e.what());
        exit_code = 2;
    }
    curl_global_cleanup();
    return exit_code;
}
