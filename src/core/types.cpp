#include "toban/types.hpp"
#include <algorithm>

namespace toban {

const char* shift_name(ShiftType shift) {
    return shift == ShiftType::Day ? "day" : "night";
}

const char* group_name(IndexGroup group) {
    switch (group) {
        case IndexGroup::DayIndex12: return "day12";
        case IndexGroup::DayIndex3: return "day3";
        case IndexGroup::NightIndex1: return "night1";
        case IndexGroup::NightIndex2: return "night2";
    }
    return "?";
}

std::optional<IndexGroup> Member::group_for(ShiftType shift) const {
    for (auto g : groups) {
        bool is_day = (g == IndexGroup::DayIndex12 || g == IndexGroup::DayIndex3);
        if (is_day == (shift == ShiftType::Day)) {
            return g;
        }
    }
    return std::nullopt;
}

std::string DutySlot::to_string() const {
    return date.to_string() + " " + shift_name(shift) + " " + std::to_string(index);
}

bool NgRules::is_global(const Date& d) const {
    return std::find(global.begin(), global.end(), d) != global.end();
}

} // namespace toban
