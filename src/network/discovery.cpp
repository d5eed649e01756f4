#include "network/discovery.hpp"

namespace astv::network {

const char* to_string(ResolveError error) noexcept {
    switch (error) {
        case ResolveError::NotFound: return "not-found";
        case ResolveError::Busy: return "busy";
        case ResolveError::BadArgument: return "bad-argument";
        case ResolveError::Canceled: return "canceled";
        case ResolveError::InvalidConfiguration: return "invalid-configuration";
        case ResolveError::Timeout: return "timeout";
        case ResolveError::Unknown: return "unknown";
    }
    return "unknown";
}

// Used when the platform has no mDNS stack; every request is refused.
class FallbackDiscoveryBackend : public DiscoveryBackend {
public:
    Result<void, Error> search(const QString&, std::chrono::milliseconds) override {
        return Result<void, Error>::err(Error{"mDNS not available on this platform"});
    }

    void stop() override {}

    Result<void, Error> resolve(const ServiceCandidate&, std::chrono::milliseconds) override {
        return Result<void, Error>::err(Error{"mDNS not available on this platform"});
    }
};

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend() {
#ifdef ASTV_HAS_AVAHI
    // Implemented in platform/linux/avahi_discovery.cpp
    extern std::unique_ptr<DiscoveryBackend> createAvahiBackend();
    return createAvahiBackend();
#else
    return std::make_unique<FallbackDiscoveryBackend>();
#endif
}

} // namespace astv::network
