#include "toban/date.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace toban {

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// 民用暦 → 通算日数（Howard Hinnant の days_from_civil）
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct Civil {
    int year;
    int month;
    int day;
};

Civil civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

} // namespace

int days_in_month(int year, int month) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return table[month - 1];
}

const char* weekday_name(Weekday wd) {
    static const char* names[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
    return names[static_cast<int>(wd)];
}

Date::Date(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    serial_ = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::from_serial(serial_type serial) {
    Date d;
    d.serial_ = serial;
    return d;
}

Date Date::parse(const std::string& text) {
    // YYYY-MM-DD 固定長
    bool well_formed = text.size() == 10 && text[4] == '-' && text[7] == '-';
    for (size_t i = 0; well_formed && i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            well_formed = false;
        }
    }
    if (!well_formed) {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + text);
    }
    int y = std::stoi(text.substr(0, 4));
    int m = std::stoi(text.substr(5, 2));
    int d = std::stoi(text.substr(8, 2));
    return Date(y, m, d);
}

int Date::year() const { return civil_from_days(serial_).year; }
int Date::month() const { return civil_from_days(serial_).month; }
int Date::day() const { return civil_from_days(serial_).day; }

Weekday Date::weekday() const {
    // 1970-01-01 は木曜日
    int64_t w = (serial_ + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<Weekday>(w);
}

Date Date::add_months(int months) const {
    auto c = civil_from_days(serial_);
    int64_t total = static_cast<int64_t>(c.year) * 12 + (c.month - 1) + months;
    int64_t y = total >= 0 ? total / 12 : (total - 11) / 12;
    int m = static_cast<int>(total - y * 12) + 1;
    int d = c.day;
    int last = days_in_month(static_cast<int>(y), m);
    if (d > last) d = last;
    return Date(static_cast<int>(y), m, d);
}

std::string Date::to_string() const {
    auto c = civil_from_days(serial_);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buf;
}

} // namespace toban
