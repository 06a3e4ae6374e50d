#pragma once
#include <cstdint>

namespace Conduit {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.1.0";

    static constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

    static constexpr const char* DEFAULT_TEST_URL             = "http://httpbin.org/ip";
    static constexpr int         DEFAULT_TEST_TIMEOUT_SECONDS = 10;
    static constexpr int         DEFAULT_TEST_WORKERS         = 10;
    static constexpr int         DEFAULT_ACQUIRE_COUNT        = 1;
    static constexpr const char* USER_AGENT                   = "Conduit-ProxyTester/1.0";

    static constexpr const char* DEFAULT_SCHEME  = "http";
    static constexpr const char* DEFAULT_PURPOSE = "general";
    static constexpr const char* SECRET_PREFIX   = "env:";

    static constexpr const char* BRIGHTDATA_DEFAULT_HOST = "zproxy.lum-superproxy.io";
    static constexpr int         BRIGHTDATA_DEFAULT_PORT = 22225;
    static constexpr int         BRIGHTDATA_SESSION_BYTES = 6;

    static constexpr const char* MOOPROXY_DEFAULT_COUNTRY = "US";
    static constexpr int         MOOPROXY_SESSION_BYTES   = 8;

    static constexpr int SESSION_GENERATION_ATTEMPTS = 8;
};

}  // namespace Core
}  // namespace Conduit
