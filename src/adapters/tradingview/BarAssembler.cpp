#include "adapters/tradingview/BarAssembler.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include "logging/Log.h"

namespace adapters::tradingview {
namespace {

constexpr std::size_t kMinTupleSize = 5;
constexpr std::size_t kMaxTupleSize = 7;

std::optional<double> json_number(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    return std::nullopt;
}

bool is_update_packet(const boost::json::object& packet) {
    const auto* method = packet.if_contains("m");
    if (method == nullptr || !method->is_string()) {
        return false;
    }
    const std::string_view name{method->as_string().data(), method->as_string().size()};
    return name == "timescale_update" || name == "du";
}

// p[1]["s1"], falling back to p[1]["sds_1"].
const boost::json::array* series_entries(const boost::json::object& packet) {
    const auto* params = packet.if_contains("p");
    if (params == nullptr || !params->is_array() || params->as_array().size() < 2) {
        return nullptr;
    }
    const auto& payload = params->as_array()[1];
    if (!payload.is_object()) {
        return nullptr;
    }
    const auto& payloadObj = payload.as_object();
    const auto* series = payloadObj.if_contains("s1");
    if (series == nullptr) {
        series = payloadObj.if_contains("sds_1");
    }
    if (series == nullptr || !series->is_object()) {
        return nullptr;
    }
    const auto* entries = series->as_object().if_contains("s");
    if (entries == nullptr || !entries->is_array()) {
        return nullptr;
    }
    return &entries->as_array();
}

}  // namespace

std::optional<domain::Bar> bar_from_tuple(const boost::json::value& tuple) {
    if (!tuple.is_array()) {
        return std::nullopt;
    }
    const auto& values = tuple.as_array();
    if (values.size() < kMinTupleSize || values.size() > kMaxTupleSize) {
        return std::nullopt;
    }

    double numbers[kMaxTupleSize] = {};
    for (std::size_t i = 0; i < values.size(); ++i) {
        const auto number = json_number(values[i]);
        if (!number || !std::isfinite(*number)) {
            return std::nullopt;
        }
        numbers[i] = *number;
    }

    domain::Bar bar;
    bar.timestamp = static_cast<domain::TimestampMs>(std::llround(numbers[0] * 1000.0));
    bar.open = numbers[1];
    bar.high = numbers[2];
    bar.low = numbers[3];
    bar.close = numbers[4];
    bar.volume = values.size() > 5 ? numbers[5] : 0.0;
    if (values.size() > 6) {
        bar.openInterest = numbers[6];
    }
    return bar;
}

domain::BarSeries assemble_bars(const std::vector<boost::json::value>& packets, const std::string& symbol) {
    domain::BarSeries series;
    series.symbol = symbol;
    std::size_t skipped = 0;

    for (const auto& packet : packets) {
        if (!packet.is_object() || !is_update_packet(packet.as_object())) {
            continue;
        }
        const auto* entries = series_entries(packet.as_object());
        if (entries == nullptr) {
            continue;
        }
        for (const auto& entry : *entries) {
            const boost::json::value* tuple = nullptr;
            if (entry.is_object()) {
                tuple = entry.as_object().if_contains("v");
            }
            auto bar = tuple != nullptr ? bar_from_tuple(*tuple) : std::nullopt;
            if (!bar) {
                ++skipped;
                LOG_DEBUG(logging::LogCategory::DATA, "Skipping malformed bar for %s", symbol.c_str());
                continue;
            }
            if (bar->openInterest) {
                series.hasOpenInterest = true;
            }
            series.bars.push_back(*bar);
        }
    }

    if (series.bars.empty()) {
        LOG_ERROR(logging::LogCategory::DATA, "No data for %s, please check the exchange and symbol",
                  symbol.c_str());
    }
    else if (skipped > 0) {
        LOG_DEBUG(logging::LogCategory::DATA, "Assembled %zu bars for %s (skipped=%zu)", series.bars.size(),
                  symbol.c_str(), skipped);
    }
    return series;
}

}  // namespace adapters::tradingview
