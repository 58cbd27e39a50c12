#pragma once

#include <optional>
#include <string>

namespace domain {

// EXCHANGE:SYMBOL, or EXCHANGE:SYMBOL<contract>! for a continuous futures contract.
// Already-qualified symbols (containing ':') are returned unchanged.
// Throws std::invalid_argument when the contract is not >= 1.
std::string format_symbol(const std::string& symbol,
                          const std::string& exchange,
                          std::optional<int> contract = std::nullopt);

// Section key used by the security-info store: "CBOT:ZC1!" -> "ZC1_CBOT".
std::string security_key(const std::string& formattedSymbol);

}  // namespace domain
