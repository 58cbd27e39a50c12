#pragma once

#include <map>
#include <optional>
#include <string>

#include "domain/Ports.hpp"
#include "domain/Types.h"

namespace adapters::storage {

// Append-only TOML-like file of "[KEY]" sections holding "name = value" lines.
// A section is written once; later stores for the same key are ignored.
class SecurityInfoFileStore : public domain::ISecurityInfoCache {
public:
    explicit SecurityInfoFileStore(std::string path);

    std::optional<domain::SecurityInfo> lookup(const std::string& key) const override;

    // Throws std::runtime_error when the file cannot be written.
    bool store(const std::string& key, const domain::SecurityInfo& info) override;

    // Every section keyed by its header; a missing file reads as empty.
    std::map<std::string, domain::SecurityInfo> readAll() const;

    const std::string& path() const noexcept { return path_; }

    static std::string formatValue(const domain::SecurityValue& value);

private:
    std::string path_;
};

}  // namespace adapters::storage
