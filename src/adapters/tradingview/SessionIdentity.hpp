#pragma once

#include <cstddef>
#include <random>
#include <string>

namespace adapters::tradingview {

struct SessionIds {
    std::string quoteSession;
    std::string chartSession;
};

// Produces the quote/chart session pair that scopes server state to one connection.
class SessionIdentity {
public:
    static constexpr std::size_t kSuffixLength = 12;

    SessionIdentity();
    explicit SessionIdentity(std::mt19937::result_type seed);

    SessionIds newSession();

private:
    std::string randomId_(const char* prefix);

    std::mt19937 rng_;
};

}  // namespace adapters::tradingview
