#include "adapters/tradingview/FrameCodec.hpp"

#include <cctype>
#include <cstddef>

#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

#include "logging/Log.h"

namespace adapters::tradingview {
namespace {

// Length of a "~m~<digits>~m~" marker starting at pos, or 0 when there is none.
std::size_t marker_length_at(std::string_view raw, std::size_t pos) {
    if (raw.compare(pos, kFrameMarker.size(), kFrameMarker) != 0) {
        return 0;
    }
    std::size_t cursor = pos + kFrameMarker.size();
    const std::size_t digitsStart = cursor;
    while (cursor < raw.size() && std::isdigit(static_cast<unsigned char>(raw[cursor])) != 0) {
        ++cursor;
    }
    if (cursor == digitsStart) {
        return 0;
    }
    if (raw.compare(cursor, kFrameMarker.size(), kFrameMarker) != 0) {
        return 0;
    }
    return cursor + kFrameMarker.size() - pos;
}

std::vector<std::string_view> split_fragments(std::string_view raw) {
    std::vector<std::string_view> fragments;
    std::size_t fragmentStart = 0;
    std::size_t pos = raw.find(kFrameMarker);
    while (pos != std::string_view::npos) {
        const std::size_t markerLength = marker_length_at(raw, pos);
        if (markerLength == 0) {
            pos = raw.find(kFrameMarker, pos + 1);
            continue;
        }
        fragments.push_back(raw.substr(fragmentStart, pos - fragmentStart));
        fragmentStart = pos + markerLength;
        pos = raw.find(kFrameMarker, fragmentStart);
    }
    fragments.push_back(raw.substr(fragmentStart));
    return fragments;
}

std::string_view trim_right(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

bool is_heartbeat(std::string_view fragment) {
    return fragment.substr(0, kHeartbeatPrefix.size()) == kHeartbeatPrefix;
}

}  // namespace

std::string wrap_frame(std::string_view payload) {
    std::string frame;
    const std::string length = std::to_string(payload.size());
    frame.reserve(kFrameMarker.size() * 2 + length.size() + payload.size());
    frame.append(kFrameMarker);
    frame.append(length);
    frame.append(kFrameMarker);
    frame.append(payload);
    return frame;
}

std::string encode(const std::string& method, const boost::json::array& params) {
    boost::json::object envelope;
    envelope["m"] = method;
    envelope["p"] = params;
    return wrap_frame(boost::json::serialize(envelope));
}

std::vector<boost::json::value> decode(std::string_view raw) {
    std::vector<boost::json::value> packets;
    for (const auto fragment : split_fragments(raw)) {
        const auto trimmed = trim_right(fragment);
        if (trimmed.empty() || is_heartbeat(trimmed)) {
            continue;
        }
        boost::json::error_code ec;
        auto value = boost::json::parse(trimmed, ec);
        if (ec) {
            LOG_TRACE(logging::LogCategory::PROTO, "Dropping unparseable frame bytes=%zu error=%s",
                      trimmed.size(), ec.message().c_str());
            continue;
        }
        packets.push_back(std::move(value));
    }
    return packets;
}

std::vector<std::string> heartbeats(std::string_view raw) {
    std::vector<std::string> result;
    for (const auto fragment : split_fragments(raw)) {
        const auto trimmed = trim_right(fragment);
        if (is_heartbeat(trimmed)) {
            result.emplace_back(trimmed);
        }
    }
    return result;
}

}  // namespace adapters::tradingview
