#include "adapters/auth/CredentialProviders.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "logging/Log.h"

namespace adapters::auth {
namespace {

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

}  // namespace

StaticCredentialProvider::StaticCredentialProvider(std::string token, std::string planTier)
    : credentials_{std::move(token), std::move(planTier)} {}

std::optional<domain::Credentials> StaticCredentialProvider::obtain() {
    if (credentials_.token.empty()) {
        return std::nullopt;
    }
    return credentials_;
}

std::optional<domain::Credentials> StaticCredentialProvider::recover(const std::string&) {
    LOG_ERROR(logging::LogCategory::AUTH, "Configured token was rejected and cannot be refreshed");
    return std::nullopt;
}

TokenFileCredentialProvider::TokenFileCredentialProvider(std::string path, std::string fallbackPlanTier,
                                                         bool deleteOnReject)
    : path_(std::move(path)), fallbackPlanTier_(std::move(fallbackPlanTier)), deleteOnReject_(deleteOnReject) {}

std::optional<domain::Credentials> TokenFileCredentialProvider::read_() const {
    std::ifstream in(path_);
    if (!in) {
        return std::nullopt;
    }
    std::string token;
    std::string plan;
    std::getline(in, token);
    std::getline(in, plan);
    token = trim(std::move(token));
    plan = trim(std::move(plan));
    if (token.empty()) {
        return std::nullopt;
    }
    return domain::Credentials{std::move(token), plan.empty() ? fallbackPlanTier_ : std::move(plan)};
}

std::optional<domain::Credentials> TokenFileCredentialProvider::obtain() {
    auto credentials = read_();
    if (credentials) {
        LOG_INFO(logging::LogCategory::AUTH, "Using cached token from %s", path_.c_str());
    } else {
        LOG_DEBUG(logging::LogCategory::AUTH, "No cached token at %s", path_.c_str());
    }
    return credentials;
}

std::optional<domain::Credentials> TokenFileCredentialProvider::recover(const std::string& rejectedToken) {
    auto credentials = read_();
    if (credentials && credentials->token != rejectedToken) {
        LOG_INFO(logging::LogCategory::AUTH, "Token file %s holds a refreshed token", path_.c_str());
        return credentials;
    }
    if (deleteOnReject_ && credentials) {
        std::error_code ec;
        if (std::filesystem::remove(path_, ec)) {
            LOG_WARN(logging::LogCategory::AUTH, "Removed rejected cached token %s", path_.c_str());
        } else if (ec) {
            LOG_WARN(logging::LogCategory::AUTH, "Could not remove %s: %s", path_.c_str(), ec.message().c_str());
        }
    }
    return std::nullopt;
}

}  // namespace adapters::auth
