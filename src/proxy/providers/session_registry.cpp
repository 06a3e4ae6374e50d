#include "session_registry.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/types/constants.hpp"

namespace Conduit {
namespace Proxy {
namespace Providers {

using Core::Constants;

std::string SessionRegistry::issue(const std::function<std::string()>& generate) {
    for (int attempt = 0; attempt < Constants::SESSION_GENERATION_ATTEMPTS; ++attempt) {
        std::string candidate = generate();
        if (candidate.empty())
            continue;
        std::lock_guard<std::mutex> lock(mutex_);
        if (issued_.insert(candidate).second)
            return candidate;
    }
    throw Core::ProviderGenerationError("Could not generate a unique session id after "
                                        + std::to_string(Constants::SESSION_GENERATION_ATTEMPTS)
                                        + " attempts");
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issued_.size();
}

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
