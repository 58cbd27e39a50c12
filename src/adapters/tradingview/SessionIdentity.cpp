#include "adapters/tradingview/SessionIdentity.hpp"

namespace adapters::tradingview {

SessionIdentity::SessionIdentity() : rng_{std::random_device{}()} {}

SessionIdentity::SessionIdentity(std::mt19937::result_type seed) : rng_{seed} {}

SessionIds SessionIdentity::newSession() {
    SessionIds ids;
    ids.quoteSession = randomId_("qs_");
    ids.chartSession = randomId_("cs_");
    return ids;
}

std::string SessionIdentity::randomId_(const char* prefix) {
    std::uniform_int_distribution<int> letter('a', 'z');
    std::string id{prefix};
    id.reserve(id.size() + kSuffixLength);
    for (std::size_t i = 0; i < kSuffixLength; ++i) {
        id.push_back(static_cast<char>(letter(rng_)));
    }
    return id;
}

}  // namespace adapters::tradingview
