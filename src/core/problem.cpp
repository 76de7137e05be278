#include "toban/problem.hpp"
#include "toban/calendar.hpp"
#include <set>

namespace toban {

const Member* Problem::find_member(const std::string& name) const {
    for (const auto& m : members) {
        if (m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

void Problem::validate() const {
    validate_period(period);

    std::set<std::string> names;
    for (const auto& m : members) {
        if (m.name.empty()) {
            throw ConfigInconsistency("member with empty name");
        }
        if (!names.insert(m.name).second) {
            throw ConfigInconsistency("duplicate member '" + m.name + "'");
        }
        if ((m.min_interval_day && *m.min_interval_day <= 0) ||
            (m.min_interval_night && *m.min_interval_night <= 0)) {
            throw ConfigInconsistency("member '" + m.name + "' has a non-positive interval");
        }
    }

    if (fixed_pattern) {
        if (!find_member(fixed_pattern->member)) {
            throw ConfigInconsistency("fixed pattern references unknown member '" +
                                      fixed_pattern->member + "'");
        }
        if (!is_valid_index(ShiftType::Night, fixed_pattern->target_index)) {
            throw ConfigInconsistency("fixed pattern target index " +
                                      std::to_string(fixed_pattern->target_index) +
                                      " is not a night index");
        }
        if (fixed_pattern->cadence_days <= 0 || fixed_pattern->cadence_days % 7 != 0) {
            throw ConfigInconsistency("fixed pattern cadence " +
                                      std::to_string(fixed_pattern->cadence_days) +
                                      " is not a positive multiple of 7 days");
        }
    }

    for (const auto& [name, dates] : ng_rules.by_member) {
        if (!find_member(name)) {
            throw ConfigInconsistency("NG date references unknown member '" + name + "'");
        }
    }
    for (const auto& [name, periods] : ng_rules.by_period) {
        if (!find_member(name)) {
            throw ConfigInconsistency("NG period references unknown member '" + name + "'");
        }
        for (const auto& p : periods) {
            if (p.end < p.start) {
                throw ConfigInconsistency("NG period " + p.start.to_string() + " .. " +
                                          p.end.to_string() + " for '" + name +
                                          "' ends before it starts");
            }
        }
    }

    for (const auto& rec : history) {
        if (!is_valid_index(rec.shift, rec.index)) {
            throw ConfigInconsistency("history record " + rec.date.to_string() + " has " +
                                      shift_name(rec.shift) + " index " +
                                      std::to_string(rec.index));
        }
    }

    if (settings.min_interval_day <= 0 || settings.min_interval_night <= 0 ||
        (settings.min_interval_day_index3 && *settings.min_interval_day_index3 <= 0)) {
        throw ConfigInconsistency("minimum intervals must be positive");
    }
    if (settings.cooldown_days < 0) {
        throw ConfigInconsistency("cooldown_days must not be negative");
    }
    if (settings.history_months < 0) {
        throw ConfigInconsistency("history_months must not be negative");
    }
}

} // namespace toban
