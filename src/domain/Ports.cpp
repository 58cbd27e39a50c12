#include "domain/Ports.hpp"

namespace domain {

const char* to_string(FetchStatus status) noexcept {
    switch (status) {
    case FetchStatus::Ok:
        return "ok";
    case FetchStatus::Empty:
        return "empty";
    case FetchStatus::SymbolError:
        return "symbol_error";
    case FetchStatus::AuthFailed:
        return "auth_failed";
    case FetchStatus::ConnectFailed:
        return "connect_failed";
    }
    return "unknown";
}

}  // namespace domain
