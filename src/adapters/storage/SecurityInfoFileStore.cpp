#include "adapters/storage/SecurityInfoFileStore.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "logging/Log.h"

namespace adapters::storage {
namespace {

std::string quote(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (const char ch : text) {
        switch (ch) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
        }
    }
    out.push_back('"');
    return out;
}

// Shortest text that reads back to the same double, always marked as a float.
std::string format_double(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    std::string text(buffer);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

// Reads a quoted string starting at text[pos] == '"'; pos ends past the closing quote.
std::optional<std::string> read_quoted(const std::string& text, std::size_t& pos) {
    std::string out;
    ++pos;
    while (pos < text.size()) {
        const char ch = text[pos++];
        if (ch == '"') {
            return out;
        }
        if (ch != '\\' || pos >= text.size()) {
            out.push_back(ch);
            continue;
        }
        const char escaped = text[pos++];
        switch (escaped) {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        default:
            out.push_back(escaped);
        }
    }
    return std::nullopt;
}

std::optional<domain::SecurityValue> parse_value(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '"') {
        std::size_t pos = 0;
        auto parsed = read_quoted(text, pos);
        if (!parsed) {
            return std::nullopt;
        }
        return domain::SecurityValue{std::move(*parsed)};
    }
    if (text.front() == '[') {
        std::vector<std::string> items;
        std::size_t pos = 1;
        while (pos < text.size()) {
            const char ch = text[pos];
            if (ch == ']') {
                return domain::SecurityValue{std::move(items)};
            }
            if (ch == '"') {
                auto item = read_quoted(text, pos);
                if (!item) {
                    return std::nullopt;
                }
                items.push_back(std::move(*item));
                continue;
            }
            ++pos;
        }
        return std::nullopt;
    }
    if (text == "true") {
        return domain::SecurityValue{true};
    }
    if (text == "false") {
        return domain::SecurityValue{false};
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    if (text.find_first_of(".eEn") == std::string::npos) {
        const long long integer = std::strtoll(begin, &end, 10);
        if (end != begin && *end == '\0' && errno == 0) {
            return domain::SecurityValue{static_cast<std::int64_t>(integer)};
        }
        return std::nullopt;
    }
    const double real = std::strtod(begin, &end);
    if (end != begin && *end == '\0') {
        return domain::SecurityValue{real};
    }
    return std::nullopt;
}

}  // namespace

SecurityInfoFileStore::SecurityInfoFileStore(std::string path) : path_(std::move(path)) {}

std::string SecurityInfoFileStore::formatValue(const domain::SecurityValue& value) {
    struct Formatter {
        std::string operator()(const std::string& text) const { return quote(text); }
        std::string operator()(std::int64_t number) const { return std::to_string(number); }
        std::string operator()(double number) const { return format_double(number); }
        std::string operator()(bool flag) const { return flag ? "true" : "false"; }
        std::string operator()(const std::vector<std::string>& items) const {
            std::string out = "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i != 0) {
                    out += ", ";
                }
                out += quote(items[i]);
            }
            out += "]";
            return out;
        }
    };
    return std::visit(Formatter{}, value);
}

std::map<std::string, domain::SecurityInfo> SecurityInfoFileStore::readAll() const {
    std::map<std::string, domain::SecurityInfo> sections;
    std::ifstream in(path_);
    if (!in) {
        return sections;
    }

    domain::SecurityInfo* current = nullptr;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']' && trimmed.find('=') == std::string::npos) {
            const std::string key = trimmed.substr(1, trimmed.size() - 2);
            // A repeated header keeps the first section's values.
            const bool fresh = sections.find(key) == sections.end();
            current = fresh ? &sections[key] : nullptr;
            continue;
        }
        if (current == nullptr) {
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            LOG_DEBUG(logging::LogCategory::CACHE, "%s:%zu: ignoring line without '='", path_.c_str(), lineNumber);
            continue;
        }
        const std::string name = trim(trimmed.substr(0, eq));
        auto value = parse_value(trim(trimmed.substr(eq + 1)));
        if (name.empty() || !value) {
            LOG_DEBUG(logging::LogCategory::CACHE, "%s:%zu: unreadable entry", path_.c_str(), lineNumber);
            continue;
        }
        current->emplace(name, std::move(*value));
    }
    return sections;
}

std::optional<domain::SecurityInfo> SecurityInfoFileStore::lookup(const std::string& key) const {
    auto sections = readAll();
    auto it = sections.find(key);
    if (it == sections.end()) {
        return std::nullopt;
    }
    return std::move(it->second);
}

bool SecurityInfoFileStore::store(const std::string& key, const domain::SecurityInfo& info) {
    if (lookup(key)) {
        LOG_DEBUG(logging::LogCategory::CACHE, "[%s] already present in %s, not overwriting", key.c_str(),
                  path_.c_str());
        return false;
    }

    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory for " + path_ + ": " + ec.message());
        }
    }

    std::ostringstream section;
    section << '[' << key << "]\n";
    for (const auto& [name, value] : info) {
        section << name << " = " << formatValue(value) << '\n';
    }
    section << '\n';

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open " + path_ + " for writing");
    }
    out << section.str();
    if (!out) {
        throw std::runtime_error("Failed writing security info to " + path_);
    }
    LOG_INFO(logging::LogCategory::CACHE, "Stored [%s] (%zu fields) in %s", key.c_str(), info.size(), path_.c_str());
    return true;
}

}  // namespace adapters::storage
