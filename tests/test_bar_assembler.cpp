#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "adapters/tradingview/BarAssembler.hpp"
#include "adapters/tradingview/FrameCodec.hpp"
#include "adapters/tradingview/QuoteAssembler.hpp"

namespace json = boost::json;
using namespace adapters::tradingview;

namespace {

json::value update_packet(const char* method, const char* seriesKey, json::array entries) {
    json::object series;
    series["s"] = std::move(entries);
    json::object payload;
    payload[seriesKey] = std::move(series);
    json::object packet;
    packet["m"] = method;
    packet["p"] = json::array{"cs_testsession", std::move(payload)};
    return packet;
}

json::object entry(int index, json::array tuple) {
    json::object e;
    e["i"] = index;
    e["v"] = std::move(tuple);
    return e;
}

}  // namespace

int main() {
    {
        constexpr double kDay = 86'400.0;
        const double first = 1'704'067'200.0;  // 2024-01-01T00:00:00Z
        json::array entries;
        for (int i = 0; i < 10; ++i) {
            const double base = 100.0 + i;
            entries.push_back(entry(i, json::array{first + i * kDay, base, base + 2.5, base - 1.25, base + 1.0,
                                                   1'000'000 + i}));
        }
        std::string raw = wrap_frame(R"({"m":"series_loading","p":["cs_testsession","s1","s1_1"]})");
        raw += wrap_frame(json::serialize(update_packet("timescale_update", "s1", std::move(entries))));
        raw += wrap_frame("~h~3");
        raw += wrap_frame(R"({"m":"series_completed","p":["cs_testsession","s1","s1_1"]})");

        const auto series = assemble_bars(decode(raw), "NSE:NIFTY");
        if (series.size() != 10) {
            std::cerr << "Expected 10 bars, got " << series.size() << '\n';
            return 1;
        }
        if (series.hasOpenInterest) {
            std::cerr << "Open interest column must be absent\n";
            return 1;
        }
        for (std::size_t i = 0; i < series.bars.size(); ++i) {
            const auto& bar = series.bars[i];
            if (i > 0 && bar.timestamp <= series.bars[i - 1].timestamp) {
                std::cerr << "Bars are not ascending at " << i << '\n';
                return 1;
            }
            if (bar.volume != 1'000'000.0 + static_cast<double>(i) || bar.openInterest.has_value()) {
                std::cerr << "Unexpected volume or open interest at " << i << '\n';
                return 1;
            }
        }
        if (series.bars.front().timestamp != 1'704'067'200'000LL || series.bars.front().high != 102.5 ||
            series.bars.front().low != 98.75) {
            std::cerr << "First bar mapped incorrectly\n";
            return 1;
        }
    }

    {
        // One bar with open interest promotes the column; missing volume defaults to zero.
        json::array entries;
        entries.push_back(entry(0, json::array{1'700'000'000, 1, 2, 0.5, 1.5}));
        entries.push_back(entry(1, json::array{1'700'086'400, 1.5, 2.5, 1, 2, 300, 4'200}));
        const std::vector<json::value> packets{update_packet("du", "sds_1", std::move(entries))};
        const auto series = assemble_bars(packets, "CBOT:ZC1!");
        if (series.size() != 2 || !series.hasOpenInterest) {
            std::cerr << "Expected open interest to be promoted from the du/sds_1 payload\n";
            return 1;
        }
        if (series.bars[0].volume != 0.0 || series.bars[0].openInterest.has_value() ||
            series.bars[1].openInterest.value_or(0) != 4'200.0) {
            std::cerr << "Volume default or open interest mapped incorrectly\n";
            return 1;
        }
    }

    {
        json::array entries;
        entries.push_back(entry(0, json::array{1'700'000'000, 1, 2, 0.5}));               // too short
        entries.push_back(entry(1, json::array{1'700'000'060, 1, 2, 0.5, 1, 2, 3, 4}));   // too long
        entries.push_back(entry(2, json::array{1'700'000'120, "x", 2, 0.5, 1}));          // non-numeric
        entries.push_back(entry(3, json::array{1'700'000'180, 1, 2, 0.5, 1.5, 10}));
        json::object noTuple;
        noTuple["i"] = 4;
        entries.push_back(noTuple);
        const std::vector<json::value> packets{update_packet("timescale_update", "s1", std::move(entries))};
        const auto series = assemble_bars(packets, "NASDAQ:AAPL");
        if (series.size() != 1 || series.bars.front().timestamp != 1'700'000'180'000LL) {
            std::cerr << "Malformed entries must be skipped individually, got " << series.size() << " bars\n";
            return 1;
        }
    }

    {
        const std::vector<json::value> packets{json::parse(R"({"m":"symbol_error","p":["cs_x","symbol_1","invalid symbol"]})")};
        if (!assemble_bars(packets, "NSE:NOPE").empty()) {
            std::cerr << "No update packets must yield an empty series\n";
            return 1;
        }
    }

    {
        const std::vector<json::value> packets{
            json::parse(R"({"m":"symbol_resolved","p":["cs_x","symbol_1",{"description":"Corn Futures","pricescale":400,"minmov":1,"pointvalue":50,"typespecs":["continuous"]}]})"),
            json::parse(R"({"m":"qsd","p":["qs_x",{"n":"CBOT:ZC1!","s":"ok","v":{"type":"futures","is_tradable":true,"lp":451.25}}]})"),
            json::parse(R"({"m":"qsd","p":["qs_x",{"n":"CBOT:ZC1!","s":"error","v":{"type":"bogus"}}]})")};
        const auto info = assemble_quote(packets);
        if (std::get<std::string>(info.at("symbol")) != "CBOT:ZC1!" || std::get<std::string>(info.at("type")) != "futures" ||
            !std::get<bool>(info.at("is_tradable"))) {
            std::cerr << "Quote fields not folded\n";
            return 1;
        }
        if (std::fabs(std::get<double>(info.at("tick_size")) - 0.0025) > 1e-12 ||
            std::get<double>(info.at("point_value")) != 50.0) {
            std::cerr << "Derived tick_size/point_value incorrect\n";
            return 1;
        }
        if (std::get<std::vector<std::string>>(info.at("typespecs")).size() != 1) {
            std::cerr << "String lists must be kept\n";
            return 1;
        }
    }

    std::cout << "test_bar_assembler passed\n";
    return 0;
}
