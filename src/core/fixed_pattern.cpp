#include "toban/fixed_pattern.hpp"

namespace toban {

FixedPatternOverride::FixedPatternOverride(std::optional<FixedPattern> pattern)
    : pattern_(std::move(pattern)) {}

int64_t FixedPatternOverride::weeks_between(const Date& reference, const Date& week_start) {
    int64_t days = week_start - reference;
    // 床関数除算（基準日より前の週も周期を保つ）
    int64_t q = days / 7;
    if (days % 7 != 0 && days < 0) {
        --q;
    }
    return q;
}

std::optional<std::string> FixedPatternOverride::fixed_assignment(const DutySlot& slot) const {
    if (!pattern_ || slot.shift != ShiftType::Night || slot.index != pattern_->target_index) {
        return std::nullopt;
    }
    int64_t period_weeks = pattern_->cadence_days / 7;
    int64_t r = weeks_between(pattern_->reference_date, slot.date) % period_weeks;
    if (r != 0) {
        return std::nullopt;
    }
    return pattern_->member;
}

} // namespace toban
