#pragma once
#include <memory>
#include <string>
#include "provider.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

std::unique_ptr<Provider> make_provider(const ProviderConfig& config);

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
