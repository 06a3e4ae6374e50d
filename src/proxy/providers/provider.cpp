#include "provider.hpp"
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

int Provider::parse_port(const std::string& text) const {
    std::string value = Utils::Text::trim(text);
    try {
        size_t consumed = 0;
        int    port     = std::stoi(value, &consumed);
        if (consumed == value.size() && port > 0 && port <= 65535)
            return port;
    } catch (const std::logic_error&) {
    }
    throw Core::ConfigurationError("Provider '" + name() + "' has an invalid port: " + text);
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
