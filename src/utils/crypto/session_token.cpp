#include "session_token.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <vector>
#include "../../core/errors/errors.hpp"

namespace Conduit {
namespace Utils {
namespace Crypto {

namespace {

std::vector<unsigned char> draw(size_t num_bytes) {
    std::vector<unsigned char> buf(num_bytes);
    if (num_bytes == 0)
        return buf;
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        char reason[256] = {0};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw Core::ProviderGenerationError("Random source failure: " + std::string(reason));
    }
    return buf;
}

}  // namespace

std::string random_hex(size_t num_bytes) {
    static const char* HEX = "0123456789abcdef";
    std::string        out;
    out.reserve(num_bytes * 2);
    for (unsigned char b : draw(num_bytes)) {
        out.push_back(HEX[b >> 4]);
        out.push_back(HEX[b & 0x0F]);
    }
    return out;
}

// Unpadded base64url, matching what vendors accept in password fields.
std::string random_urlsafe(size_t num_bytes) {
    static const char* ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    auto        bytes = draw(num_bytes);
    std::string out;
    out.reserve((num_bytes * 4 + 2) / 3);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        unsigned v = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back(ALPHABET[v & 0x3F]);
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        unsigned v = bytes[i] << 16;
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
    }
    else if (rest == 2) {
        unsigned v = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
    }
    return out;
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Conduit
