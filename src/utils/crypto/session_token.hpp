#pragma once
#include <cstddef>
#include <string>

namespace Conduit {
namespace Utils {
namespace Crypto {

// Both draw from OpenSSL's CSPRNG and throw ProviderGenerationError if it fails.
std::string random_hex(size_t num_bytes);
std::string random_urlsafe(size_t num_bytes);

}  // namespace Crypto
}  // namespace Utils
}  // namespace Conduit
