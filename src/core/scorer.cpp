#include "toban/scorer.hpp"

namespace toban {

namespace {

size_t slot_of(ShiftType shift) {
    return shift == ShiftType::Day ? 0 : 1;
}

} // namespace

// ============================================================================
// FairnessState
// ============================================================================

FairnessState::FairnessState(const std::vector<Member>& members,
                             const HistoryWindow& history) {
    for (const auto& m : members) {
        for (auto shift : {ShiftType::Day, ShiftType::Night}) {
            auto s = history.summary(m.name, shift);
            Tally t;
            t.count = s.count;
            t.last_date = s.last_date;
            tallies_[slot_of(shift)][m.name] = t;
        }
    }
}

const FairnessState::Tally* FairnessState::find(const std::string& member,
                                                ShiftType shift) const {
    const auto& m = tallies_[slot_of(shift)];
    auto it = m.find(member);
    return it == m.end() ? nullptr : &it->second;
}

int FairnessState::count(const std::string& member, ShiftType shift) const {
    auto t = find(member, shift);
    return t ? t->count : 0;
}

std::optional<Date> FairnessState::last_date(const std::string& member,
                                             ShiftType shift) const {
    auto t = find(member, shift);
    return t ? t->last_date : std::nullopt;
}

std::optional<int64_t> FairnessState::days_since_last(const std::string& member,
                                                      ShiftType shift,
                                                      const Date& on) const {
    auto last = last_date(member, shift);
    if (!last) {
        return std::nullopt;
    }
    return on - *last;
}

void FairnessState::commit(const Assignment& assignment) {
    auto& t = tallies_[slot_of(assignment.slot.shift)][assignment.member];
    t.count++;
    if (!t.last_date || *t.last_date < assignment.slot.date) {
        t.last_date = assignment.slot.date;
    }
}

// ============================================================================
// PriorityKey / score
// ============================================================================

bool PriorityKey::operator<(const PriorityKey& other) const {
    if (count != other.count) {
        return count < other.count;
    }
    // 未担当（nullopt）は最も間隔が空いているものとして扱う
    if (gap_days != other.gap_days) {
        if (!gap_days) return true;
        if (!other.gap_days) return false;
        return *gap_days > *other.gap_days;
    }
    return name < other.name;
}

PriorityKey score(const Member& member, const DutySlot& slot, const FairnessState& fairness) {
    PriorityKey key;
    key.count = fairness.count(member.name, slot.shift);
    key.gap_days = fairness.days_since_last(member.name, slot.shift, slot.date);
    key.name = member.name;
    return key;
}

int required_interval(const Member& member, const DutySlot& slot, const Settings& settings) {
    if (slot.shift == ShiftType::Night) {
        return member.min_interval_night.value_or(settings.min_interval_night);
    }
    if (slot.index == 3 && settings.min_interval_day_index3) {
        return *settings.min_interval_day_index3;
    }
    return member.min_interval_day.value_or(settings.min_interval_day);
}

// ============================================================================
// FairnessPolicy
// ============================================================================

std::string FairnessPolicy::name() const {
    return "fairness";
}

size_t FairnessPolicy::select(const std::vector<const Member*>& pool, const DutySlot& slot,
                              const FairnessState& fairness) const {
    size_t best = 0;
    PriorityKey best_key = score(*pool[0], slot, fairness);
    for (size_t i = 1; i < pool.size(); ++i) {
        PriorityKey key = score(*pool[i], slot, fairness);
        if (key < best_key) {
            best = i;
            best_key = std::move(key);
        }
    }
    return best;
}

} // namespace toban
