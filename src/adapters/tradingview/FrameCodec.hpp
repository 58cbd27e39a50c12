#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

namespace adapters::tradingview {

constexpr std::string_view kFrameMarker = "~m~";
constexpr std::string_view kHeartbeatPrefix = "~h~";

// "~m~<byte length>~m~<payload>"
std::string wrap_frame(std::string_view payload);

// Compact {"m":method,"p":params} wrapped in a length-prefixed frame.
std::string encode(const std::string& method, const boost::json::array& params);

// Splits a raw read (possibly several concatenated frames) into JSON packets.
// Empty fragments, heartbeats and fragments that fail to parse are dropped.
std::vector<boost::json::value> decode(std::string_view raw);

// Heartbeat payloads ("~h~<n>") contained in a raw read, in order.
std::vector<std::string> heartbeats(std::string_view raw);

}  // namespace adapters::tradingview
