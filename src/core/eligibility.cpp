#include "toban/eligibility.hpp"

namespace toban {

namespace {

const std::set<int> kEmpty;

std::set<int> group_indices(IndexGroup group) {
    switch (group) {
        case IndexGroup::DayIndex12: return {1, 2};
        case IndexGroup::DayIndex3: return {3};
        case IndexGroup::NightIndex1: return {1};
        case IndexGroup::NightIndex2: return {2};
    }
    return {};
}

} // namespace

EligibilityTable::EligibilityTable(const std::vector<Member>& members,
                                   const HistoryWindow& history) {
    for (const auto& m : members) {
        Entry entry;

        // 日勤: 直近実績があれば優先（1,2 と 3 の両方を担当していればどちらも不可）
        if (auto g = m.group_for(ShiftType::Day)) {
            HistorySummary summary = history.summary(m.name, ShiftType::Day);
            auto& day = entry.indices[slot_of(ShiftType::Day)];
            if (summary.count > 0) {
                bool has_12 = false;
                bool has_3 = false;
                for (int i : summary.indexes) {
                    if (i == 3) {
                        has_3 = true;
                    } else {
                        has_12 = true;
                    }
                }
                if (has_12 && !has_3) {
                    day = {1, 2};
                } else if (has_3 && !has_12) {
                    day = {3};
                }
                entry.sources[slot_of(ShiftType::Day)] = EligibilitySource::History;
            } else {
                day = group_indices(*g);
                entry.sources[slot_of(ShiftType::Day)] = EligibilitySource::Group;
            }
        }

        // 夜勤: 静的グループのみ
        if (auto g = m.group_for(ShiftType::Night)) {
            entry.indices[slot_of(ShiftType::Night)] = group_indices(*g);
            entry.sources[slot_of(ShiftType::Night)] = EligibilitySource::Group;
        }

        table_[m.name] = std::move(entry);
    }
}

const std::set<int>& EligibilityTable::eligible_indices(const std::string& member,
                                                        ShiftType shift) const {
    auto it = table_.find(member);
    if (it == table_.end()) {
        return kEmpty;
    }
    return it->second.indices[slot_of(shift)];
}

EligibilitySource EligibilityTable::source(const std::string& member, ShiftType shift) const {
    auto it = table_.find(member);
    if (it == table_.end()) {
        return EligibilitySource::None;
    }
    return it->second.sources[slot_of(shift)];
}

} // namespace toban
