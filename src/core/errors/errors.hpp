#pragma once
#include <stdexcept>
#include <string>

namespace Conduit {
namespace Core {

class ProxyError : public std::runtime_error {
public:
    explicit ProxyError(const std::string& message) : std::runtime_error(message) {}
};

// Raised while loading provider descriptors or constructing providers.
class ConfigurationError : public ProxyError {
public:
    explicit ConfigurationError(const std::string& message) : ProxyError(message) {}
};

class ConcurrencyLimitError : public ProxyError {
public:
    ConcurrencyLimitError(const std::string& provider, int limit)
        : ProxyError("Concurrency limit reached for provider '" + provider + "' ("
                     + std::to_string(limit) + " active)"),
          provider_(provider),
          limit_(limit) {}

    const std::string& provider() const { return provider_; }
    int                limit() const { return limit_; }

private:
    std::string provider_;
    int         limit_;
};

class NoProviderAvailableError : public ProxyError {
public:
    explicit NoProviderAvailableError(const std::string& message) : ProxyError(message) {}
};

class ProviderNotFoundError : public ProxyError {
public:
    explicit ProviderNotFoundError(const std::string& name)
        : ProxyError("Proxy provider not found: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class ProviderGenerationError : public ProxyError {
public:
    explicit ProviderGenerationError(const std::string& message) : ProxyError(message) {}
};

}  // namespace Core
}  // namespace Conduit
