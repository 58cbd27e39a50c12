#include "adapters/tradingview/QuoteAssembler.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

namespace adapters::tradingview {
namespace {

std::string to_std_string(const boost::json::string& value) {
    return std::string(value.data(), value.size());
}

std::optional<domain::SecurityValue> to_security_value(const boost::json::value& value) {
    if (value.is_string()) {
        return domain::SecurityValue{to_std_string(value.as_string())};
    }
    if (value.is_bool()) {
        return domain::SecurityValue{value.as_bool()};
    }
    if (value.is_int64()) {
        return domain::SecurityValue{value.as_int64()};
    }
    if (value.is_uint64()) {
        return domain::SecurityValue{static_cast<std::int64_t>(value.as_uint64())};
    }
    if (value.is_double()) {
        return domain::SecurityValue{value.as_double()};
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value.as_array()) {
            if (!item.is_string()) {
                return std::nullopt;
            }
            items.push_back(to_std_string(item.as_string()));
        }
        return domain::SecurityValue{std::move(items)};
    }
    return std::nullopt;
}

const boost::json::array* packet_params(const boost::json::value& packet, const char* method) {
    if (!packet.is_object()) {
        return nullptr;
    }
    const auto& obj = packet.as_object();
    const auto* name = obj.if_contains("m");
    if (name == nullptr || !name->is_string() || name->as_string() != method) {
        return nullptr;
    }
    const auto* params = obj.if_contains("p");
    return params != nullptr && params->is_array() ? &params->as_array() : nullptr;
}

void fold_fields(const boost::json::object& fields, domain::SecurityInfo& info) {
    for (const auto& field : fields) {
        if (auto converted = to_security_value(field.value())) {
            info[std::string(field.key())] = std::move(*converted);
        }
    }
}

std::optional<double> numeric_field(const domain::SecurityInfo& info, const char* name) {
    const auto it = info.find(name);
    if (it == info.end()) {
        return std::nullopt;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&it->second)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&it->second)) {
        return *real;
    }
    return std::nullopt;
}

}  // namespace

domain::SecurityInfo assemble_quote(const std::vector<boost::json::value>& packets) {
    domain::SecurityInfo info;
    for (const auto& packet : packets) {
        const auto* params = packet_params(packet, "symbol_resolved");
        if (params != nullptr && params->size() >= 3 && (*params)[2].is_object()) {
            fold_fields((*params)[2].as_object(), info);
        }
    }
    for (const auto& packet : packets) {
        const auto* params = packet_params(packet, "qsd");
        if (params == nullptr || params->size() < 2 || !(*params)[1].is_object()) {
            continue;
        }
        const auto& body = (*params)[1].as_object();
        if (const auto* status = body.if_contains("s"); status != nullptr && status->is_string() &&
                                                         status->as_string() != "ok") {
            continue;
        }
        if (const auto* name = body.if_contains("n"); name != nullptr && name->is_string()) {
            info["symbol"] = to_std_string(name->as_string());
        }
        if (const auto* fields = body.if_contains("v"); fields != nullptr && fields->is_object()) {
            fold_fields(fields->as_object(), info);
        }
    }

    const auto minmov = numeric_field(info, "minmov");
    const auto pricescale = numeric_field(info, "pricescale");
    if (minmov && pricescale && *pricescale > 0 && info.find("tick_size") == info.end()) {
        info["tick_size"] = *minmov / *pricescale;
    }
    if (const auto pointvalue = numeric_field(info, "pointvalue"); pointvalue && info.find("point_value") == info.end()) {
        info["point_value"] = *pointvalue;
    }
    return info;
}

}  // namespace adapters::tradingview
