#include "provider_factory.hpp"
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"
#include "brightdata_provider.hpp"
#include "mooproxy_provider.hpp"
#include "static_list_provider.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

std::unique_ptr<Provider> make_provider(const ProviderConfig& config) {
    std::string type = Utils::Text::to_lower(config.type);
    if (type == "static_list")
        return std::make_unique<StaticListProvider>(config);
    if (type == "brightdata")
        return std::make_unique<BrightDataProvider>(config);
    if (type == "mooproxy")
        return std::make_unique<MooProxyProvider>(config);
    throw Core::ConfigurationError("Unknown proxy provider type '" + config.type
                                   + "' for provider '" + config.name
                                   + "' (expected static_list, brightdata or mooproxy)");
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
