#include "toban/analysis.hpp"
#include "toban/fixed_pattern.hpp"
#include "toban/scorer.hpp"
#include <algorithm>
#include <climits>

namespace toban {

const char* violation_name(Violation::Kind kind) {
    switch (kind) {
        case Violation::Kind::DuplicateSlot: return "duplicate-slot";
        case Violation::Kind::Overlap: return "overlap";
        case Violation::Kind::Cooldown: return "cooldown";
        case Violation::Kind::Interval: return "interval";
        case Violation::Kind::Index: return "index";
        case Violation::Kind::FixedPattern: return "fixed-pattern";
    }
    return "?";
}

int ScheduleReport::spread(const std::vector<std::string>& members, ShiftType shift) const {
    if (members.empty()) {
        return 0;
    }
    int lo = INT_MAX;
    int hi = INT_MIN;
    for (const auto& name : members) {
        auto it = counts.find(name);
        int c = 0;
        if (it != counts.end()) {
            c = shift == ShiftType::Day ? it->second.day : it->second.night;
        }
        lo = std::min(lo, c);
        hi = std::max(hi, c);
    }
    return hi - lo;
}

ScheduleReport analyze(const Problem& problem, const std::vector<Assignment>& assignments) {
    ScheduleReport report;
    for (const auto& m : problem.members) {
        report.counts[m.name] = MemberCounts{};
    }

    // 枠の重複
    for (size_t i = 0; i < assignments.size(); ++i) {
        for (size_t j = i + 1; j < assignments.size(); ++j) {
            if (assignments[i].slot == assignments[j].slot) {
                report.violations.push_back({Violation::Kind::DuplicateSlot,
                                             assignments[j].member,
                                             assignments[j].slot.to_string() + " assigned twice"});
            }
        }
    }

    // 固定パターン対象メンバーは対象週の枠にだけ入る
    if (problem.fixed_pattern) {
        FixedPatternOverride fixed(problem.fixed_pattern);
        const auto& pattern = *problem.fixed_pattern;
        for (const auto& a : assignments) {
            if (a.member == pattern.member && a.slot.shift == ShiftType::Night &&
                a.slot.index == pattern.target_index && !fixed.fixed_assignment(a.slot)) {
                report.violations.push_back({Violation::Kind::FixedPattern, a.member,
                                             a.slot.to_string() + " is off the fixed cadence"});
            }
        }
    }

    // メンバーごとに日付順
    std::map<std::string, std::vector<DutySlot>> by_member;
    for (const auto& a : assignments) {
        by_member[a.member].push_back(a.slot);
        auto& c = report.counts[a.member];
        if (a.slot.shift == ShiftType::Day) {
            c.day++;
        } else {
            c.night++;
        }
    }

    for (auto& [name, slots] : by_member) {
        std::stable_sort(slots.begin(), slots.end(), [](const DutySlot& a, const DutySlot& b) {
            return a.date < b.date;
        });
        const Member* member = problem.find_member(name);

        for (size_t i = 0; i < slots.size(); ++i) {
            const auto& s = slots[i];

            // index 区分
            if (!member || !member->serves(s.shift)) {
                report.violations.push_back({Violation::Kind::Index, name,
                                             s.to_string() + " outside member's shift types"});
            } else if (s.shift == ShiftType::Night) {
                int expected = *member->group_for(ShiftType::Night) == IndexGroup::NightIndex1 ? 1 : 2;
                if (s.index != expected) {
                    report.violations.push_back({Violation::Kind::Index, name,
                                                 s.to_string() + " outside night index group"});
                }
            }

            for (size_t j = i + 1; j < slots.size(); ++j) {
                const auto& t = slots[j];
                if (s.span_begin() <= t.span_end() && t.span_begin() <= s.span_end()) {
                    report.violations.push_back({Violation::Kind::Overlap, name,
                                                 s.to_string() + " overlaps " + t.to_string()});
                }
                // 夜勤明け（どちらが先でも夜勤終了後の日勤を調べる）
                const DutySlot* night = nullptr;
                const DutySlot* day = nullptr;
                if (s.shift == ShiftType::Night && t.shift == ShiftType::Day) {
                    night = &s;
                    day = &t;
                } else if (t.shift == ShiftType::Night && s.shift == ShiftType::Day) {
                    night = &t;
                    day = &s;
                }
                if (night && day) {
                    int64_t d = day->date - night->span_end();
                    if (0 < d && d < problem.settings.cooldown_days) {
                        report.violations.push_back({Violation::Kind::Cooldown, name,
                                                     day->to_string() + " is " + std::to_string(d) +
                                                     " day(s) after night week ending " +
                                                     night->span_end().to_string()});
                    }
                }
            }
        }

        // 同一勤務種別の連続する担当の間隔
        if (!member) {
            continue;
        }
        for (auto shift : {ShiftType::Day, ShiftType::Night}) {
            const DutySlot* prev = nullptr;
            for (const auto& s : slots) {
                if (s.shift != shift) continue;
                if (prev) {
                    int64_t gap = s.date - prev->date;
                    int required = required_interval(*member, s, problem.settings);
                    if (gap < required) {
                        report.violations.push_back({Violation::Kind::Interval, name,
                                                     prev->to_string() + " -> " + s.to_string() +
                                                     " is " + std::to_string(gap) +
                                                     " day(s), minimum " +
                                                     std::to_string(required)});
                    }
                }
                prev = &s;
            }
        }
    }
    return report;
}

} // namespace toban
