#include "toban/calendar.hpp"
#include <algorithm>
#include <set>

namespace toban {

Date rotation_end(const Date& start) {
    return start.add_months(2) - 1;
}

RotationPeriod make_period(const Date& start, std::optional<Date> end) {
    RotationPeriod period{start, end ? *end : rotation_end(start)};
    validate_period(period);
    return period;
}

void validate_period(const RotationPeriod& period) {
    if (period.end < period.start) {
        throw InvalidPeriod("end date " + period.end.to_string() +
                            " precedes start date " + period.start.to_string());
    }
    if (period.end - period.start + 1 < 7) {
        throw InvalidPeriod("period " + period.start.to_string() + " .. " +
                            period.end.to_string() +
                            " is shorter than one week");
    }
}

std::vector<Date> weekends_in(const RotationPeriod& period) {
    std::vector<Date> result;
    for (Date d = period.start; d <= period.end; d += 1) {
        if (d.is_weekend()) {
            result.push_back(d);
        }
    }
    return result;
}

std::vector<Date> mondays_in(const RotationPeriod& period) {
    std::vector<Date> result;
    Date d = period.start;
    while (d.weekday() != Weekday::Monday) {
        d += 1;
    }
    for (; d <= period.end; d += 7) {
        result.push_back(d);
    }
    return result;
}

SlotPlan generate_slots(const RotationPeriod& period, const std::vector<Date>& holidays) {
    validate_period(period);

    std::set<Date::serial_type> holiday_set;
    for (const auto& h : holidays) {
        holiday_set.insert(h.serial());
    }
    auto is_holiday = [&holiday_set](const Date& d) {
        return holiday_set.count(d.serial()) > 0;
    };

    SlotPlan plan;
    for (Date d = period.start; d <= period.end; d += 1) {
        if (d.is_weekend()) {
            if (is_holiday(d)) {
                plan.notes.push_back("day shifts on " + d.to_string() +
                                     " skipped (global holiday)");
                continue;
            }
            for (int index = 1; index <= index_count(ShiftType::Day); ++index) {
                plan.slots.push_back(DutySlot{d, ShiftType::Day, index});
            }
        } else if (d.weekday() == Weekday::Monday) {
            // 月〜金がすべて休日の週は夜勤なし
            bool full_holiday_week = true;
            for (int i = 0; i < 5; ++i) {
                if (!is_holiday(d + i)) {
                    full_holiday_week = false;
                    break;
                }
            }
            if (full_holiday_week) {
                plan.notes.push_back("night shifts for week of " + d.to_string() +
                                     " skipped (global holiday week)");
                continue;
            }
            for (int index = 1; index <= index_count(ShiftType::Night); ++index) {
                plan.slots.push_back(DutySlot{d, ShiftType::Night, index});
            }
        }
    }
    return plan;
}

} // namespace toban
