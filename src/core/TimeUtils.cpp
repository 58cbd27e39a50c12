#include "core/TimeUtils.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace core {
namespace {

struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

CivilDate civil_from_days(std::int64_t z) noexcept {
    z += 719'468;
    const std::int64_t era = (z >= 0 ? z : z - 146'096) / 146'097;
    const auto doe = static_cast<unsigned>(z - era * 146'097);
    const unsigned yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

bool is_leap(std::int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(std::int64_t year, unsigned month) noexcept {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    bool done() const noexcept { return pos_ >= text_.size(); }
    char peek() const noexcept { return done() ? '\0' : text_[pos_]; }
    void advance() noexcept { ++pos_; }

    int digits(std::size_t count) {
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            if (done() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("expected digit");
            }
            value = value * 10 + (peek() - '0');
            advance();
        }
        return value;
    }

    void expect(char ch) {
        if (peek() != ch) {
            fail(std::string("expected '") + ch + "'");
        }
        advance();
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Invalid ISO-8601 timestamp '" + text_ + "': " + what);
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) noexcept {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146'097 + static_cast<std::int64_t>(doe) - 719'468;
}

domain::TimestampMs parse_iso8601_ms(const std::string& text) {
    Cursor cur(text);
    const int year = cur.digits(4);
    cur.expect('-');
    const int month = cur.digits(2);
    cur.expect('-');
    const int day = cur.digits(2);
    if (month < 1 || month > 12) {
        cur.fail("month out of range");
    }
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        cur.fail("day out of range");
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    std::int64_t offsetMinutes = 0;

    if (!cur.done() && (cur.peek() == 'T' || cur.peek() == 't' || cur.peek() == ' ')) {
        cur.advance();
        hour = cur.digits(2);
        cur.expect(':');
        minute = cur.digits(2);
        if (cur.peek() == ':') {
            cur.advance();
            second = cur.digits(2);
            if (cur.peek() == '.') {
                cur.advance();
                int scale = 100;
                bool any = false;
                while (std::isdigit(static_cast<unsigned char>(cur.peek())) != 0) {
                    millis += (cur.peek() - '0') * scale;
                    scale /= 10;
                    any = true;
                    cur.advance();
                }
                if (!any) {
                    cur.fail("empty fraction");
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            cur.fail("time out of range");
        }

        if (cur.peek() == 'Z' || cur.peek() == 'z') {
            cur.advance();
        }
        else if (cur.peek() == '+' || cur.peek() == '-') {
            const int sign = cur.peek() == '-' ? -1 : 1;
            cur.advance();
            const int offHours = cur.digits(2);
            if (cur.peek() == ':') {
                cur.advance();
            }
            const int offMinutes = cur.digits(2);
            offsetMinutes = sign * (offHours * 60 + offMinutes);
        }
    }

    if (!cur.done()) {
        cur.fail("trailing characters");
    }

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * TimeUtils::kSecondsPerDay + hour * 3'600 + minute * 60 + second -
                                 offsetMinutes * 60;
    return seconds * TimeUtils::kMillisPerSecond + millis;
}

std::string format_iso8601(domain::TimestampMs ms) {
    std::int64_t days = ms / domain::kMillisPerDay;
    std::int64_t rem = ms % domain::kMillisPerDay;
    if (rem < 0) {
        rem += domain::kMillisPerDay;
        --days;
    }
    const auto date = civil_from_days(days);
    const auto secOfDay = rem / 1'000;
    const auto millis = rem % 1'000;

    char buffer[48];
    if (millis != 0) {
        std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<long long>(secOfDay / 3'600), static_cast<long long>((secOfDay / 60) % 60),
                      static_cast<long long>(secOfDay % 60), static_cast<long long>(millis));
    }
    else {
        std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<long long>(secOfDay / 3'600), static_cast<long long>((secOfDay / 60) % 60),
                      static_cast<long long>(secOfDay % 60));
    }
    return buffer;
}

std::string format_date(domain::TimestampMs ms) {
    return format_iso8601(ms).substr(0, 10);
}

domain::TimestampMs now_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

}  // namespace core
