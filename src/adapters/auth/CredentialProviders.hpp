#pragma once

#include <optional>
#include <string>

#include "domain/Ports.hpp"

namespace adapters::auth {

// Fixed token handed in by the caller. Recovery always fails.
class StaticCredentialProvider : public domain::ICredentialProvider {
public:
    StaticCredentialProvider(std::string token, std::string planTier);

    std::optional<domain::Credentials> obtain() override;
    std::optional<domain::Credentials> recover(const std::string& rejectedToken) override;

private:
    domain::Credentials credentials_;
};

// Cached token file: first line is the token, an optional second line the plan
// tier (falls back to the configured tier). Another process may refresh the
// file; recover() only succeeds when it then holds a different token.
class TokenFileCredentialProvider : public domain::ICredentialProvider {
public:
    explicit TokenFileCredentialProvider(std::string path, std::string fallbackPlanTier = {},
                                         bool deleteOnReject = false);

    std::optional<domain::Credentials> obtain() override;
    std::optional<domain::Credentials> recover(const std::string& rejectedToken) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::optional<domain::Credentials> read_() const;

    std::string path_;
    std::string fallbackPlanTier_;
    bool deleteOnReject_;
};

}  // namespace adapters::auth
