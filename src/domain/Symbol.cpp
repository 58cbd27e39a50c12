#include "domain/Symbol.hpp"

#include <algorithm>
#include <stdexcept>

namespace domain {

std::string format_symbol(const std::string& symbol,
                          const std::string& exchange,
                          std::optional<int> contract) {
    if (symbol.find(':') != std::string::npos) {
        return symbol;
    }
    if (symbol.empty()) {
        throw std::invalid_argument("symbol cannot be empty");
    }
    if (!contract.has_value()) {
        return exchange + ":" + symbol;
    }
    if (*contract < 1) {
        throw std::invalid_argument("not a valid contract: " + std::to_string(*contract));
    }
    return exchange + ":" + symbol + std::to_string(*contract) + "!";
}

std::string security_key(const std::string& formattedSymbol) {
    const auto colon = formattedSymbol.find(':');
    if (colon == std::string::npos) {
        return formattedSymbol;
    }
    std::string exchange = formattedSymbol.substr(0, colon);
    std::string ticker = formattedSymbol.substr(colon + 1);
    ticker.erase(std::remove(ticker.begin(), ticker.end(), '!'), ticker.end());
    return ticker + "_" + exchange;
}

}  // namespace domain
