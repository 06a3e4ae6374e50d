#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace Conduit {
namespace Proxy {
namespace Providers {

// Remembers every session id a provider has handed out so none is ever reused.
class SessionRegistry {
public:
    std::string issue(const std::function<std::string()>& generate);
    size_t      size() const;

private:
    mutable std::mutex              mutex_;
    std::unordered_set<std::string> issued_;
};

}  // namespace Providers
}  // namespace Proxy
}  // namespace Conduit
