#include <catch2/catch_test_macros.hpp>
#include "toban/builder.hpp"
#include "scenario_fixtures.hpp"
#include <algorithm>

using namespace toban;
using toban::testing::fixed_pattern_problem;
using toban::testing::make_member;
using toban::testing::standard_problem;

namespace {

/**
 * @brief 2025-03-22 の3枠は埋まるが 03-23 の日勤 index 1 で候補が尽きる問題
 */
Problem exhausted_problem() {
    Problem p;
    p.period = RotationPeriod{Date(2025, 3, 22), Date(2025, 3, 30)};
    p.members = {
        make_member("D01", {IndexGroup::DayIndex12}),
        make_member("D02", {IndexGroup::DayIndex12}),
        make_member("T01", {IndexGroup::DayIndex3}),
        make_member("N01", {IndexGroup::NightIndex1}),
        make_member("M01", {IndexGroup::NightIndex2}),
    };
    return p;
}

const Assignment* find_slot(const BuildResult& r, const DutySlot& slot) {
    for (const auto& a : r.assignments) {
        if (a.slot == slot) return &a;
    }
    return nullptr;
}

bool has_kind(const std::vector<Elimination>& reasons, EliminationKind kind) {
    return std::any_of(reasons.begin(), reasons.end(),
                       [kind](const Elimination& e) { return e.kind == kind; });
}

/**
 * @brief 常にプール末尾を選ぶポリシー
 */
class LastInPoolPolicy : public SelectionPolicy {
public:
    std::string name() const override { return "last"; }
    size_t select(const std::vector<const Member*>& pool, const DutySlot&,
                  const FairnessState&) const override {
        return pool.size() - 1;
    }
};

} // namespace

// ============================================================================
// Construction / validation
// ============================================================================

TEST_CASE("ScheduleBuilder validates its input", "[builder]") {
    SECTION("valid problem") {
        REQUIRE_NOTHROW(ScheduleBuilder(standard_problem()));
    }

    SECTION("period shorter than a week") {
        Problem p = standard_problem();
        p.period.end = Date(2025, 3, 25);
        REQUIRE_THROWS_AS(ScheduleBuilder(p), InvalidPeriod);
    }

    SECTION("period end before start") {
        Problem p = standard_problem();
        p.period.end = Date(2025, 3, 1);
        REQUIRE_THROWS_AS(ScheduleBuilder(p), InvalidPeriod);
    }

    SECTION("duplicate member") {
        Problem p = standard_problem();
        p.members.push_back(make_member("D01", {IndexGroup::DayIndex3}));
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("fixed pattern for an unknown member") {
        Problem p = fixed_pattern_problem();
        p.fixed_pattern->member = "nobody";
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("fixed pattern cadence not in whole weeks") {
        Problem p = fixed_pattern_problem();
        p.fixed_pattern->cadence_days = 10;
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("fixed pattern on a day index") {
        Problem p = fixed_pattern_problem();
        p.fixed_pattern->target_index = 3;
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("NG date for an unknown member") {
        Problem p = standard_problem();
        p.ng_rules.by_member["nobody"] = {Date(2025, 3, 22)};
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("NG period ending before it starts") {
        Problem p = standard_problem();
        p.ng_rules.by_period["D01"] = {NgPeriod{Date(2025, 4, 10), Date(2025, 4, 1), ""}};
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("history record with an impossible index") {
        Problem p = standard_problem();
        p.history.push_back(HistoryRecord{Date(2025, 3, 10), ShiftType::Night, 3, "N01"});
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }

    SECTION("non-positive interval") {
        Problem p = standard_problem();
        p.settings.min_interval_day = 0;
        REQUIRE_THROWS_AS(ScheduleBuilder(p), ConfigInconsistency);
    }
}

// ============================================================================
// Slot processing
// ============================================================================

TEST_CASE("Builder fills slots greedily in date order", "[builder]") {
    ScheduleBuilder builder(standard_problem());
    auto result = builder.build();

    REQUIRE(result.ok());
    REQUIRE(result.assignments.size() == 72);
    REQUIRE(!result.failure);

    SECTION("first weekend") {
        REQUIRE(result.assignments[0].member == "D01");
        REQUIRE(result.assignments[1].member == "D02");
        REQUIRE(result.assignments[2].member == "T01");
        REQUIRE(result.assignments[3].member == "D03");
        REQUIRE(result.assignments[4].member == "D04");
        REQUIRE(result.assignments[5].member == "T02");
    }

    SECTION("first night week") {
        REQUIRE(result.assignments[6].slot == DutySlot{Date(2025, 3, 24), ShiftType::Night, 1});
        REQUIRE(result.assignments[6].member == "N01");
        // 全員未担当なら名前順で F01 が M01 より先
        REQUIRE(result.assignments[7].member == "F01");
        REQUIRE(result.assignments[8].member == "D05");
    }

    SECTION("stats") {
        const auto& s = builder.stats();
        REQUIRE(s.slot_count == 72);
        REQUIRE(s.processed_count == 72);
        REQUIRE(s.forced_count == 0);
        REQUIRE(s.min_pool_size >= 1);
        REQUIRE(s.rule_check_count > 0);
    }

    SECTION("fairness state after build") {
        REQUIRE(builder.fairness().count("N01", ShiftType::Night) == 3);
        REQUIRE(builder.fairness().count("D01", ShiftType::Day) >= 3);
    }
}

TEST_CASE("Builder is deterministic", "[builder]") {
    ScheduleBuilder builder(fixed_pattern_problem());
    auto first = builder.build();
    auto second = builder.build();
    REQUIRE(first.assignments == second.assignments);
    REQUIRE(first.notes == second.notes);

    ScheduleBuilder other(fixed_pattern_problem());
    REQUIRE(other.build().assignments == first.assignments);
}

TEST_CASE("Builder reports exhausted candidates", "[builder]") {
    ScheduleBuilder builder(exhausted_problem());
    auto result = builder.build();

    REQUIRE(result.status == BuildStatus::NoCandidate);
    REQUIRE(!result.ok());
    REQUIRE(result.failure);

    SECTION("assignments made before the failure are kept") {
        REQUIRE(result.assignments.size() == 3);
        REQUIRE(result.assignments[0].member == "D01");
        REQUIRE(result.assignments[1].member == "D02");
        REQUIRE(result.assignments[2].member == "T01");
    }

    SECTION("diagnostic covers every member") {
        const auto& f = *result.failure;
        REQUIRE(f.slot == DutySlot{Date(2025, 3, 23), ShiftType::Day, 1});
        REQUIRE(f.eliminations.size() == 5);

        REQUIRE(f.eliminations.at("D01").size() == 1);
        REQUIRE(f.eliminations.at("D01")[0].kind == EliminationKind::MinInterval);
        REQUIRE(has_kind(f.eliminations.at("T01"), EliminationKind::IndexIneligible));
        REQUIRE(has_kind(f.eliminations.at("T01"), EliminationKind::MinInterval));
        REQUIRE(has_kind(f.eliminations.at("N01"), EliminationKind::IndexIneligible));
        REQUIRE(has_kind(f.eliminations.at("M01"), EliminationKind::IndexIneligible));
    }

    SECTION("message names the slot and the reasons") {
        auto msg = result.failure->message();
        REQUIRE(msg.find("no candidate for 2025-03-23 day 1") != std::string::npos);
        REQUIRE(msg.find("min-interval") != std::string::npos);
        REQUIRE(msg.find("D02") != std::string::npos);
    }

    SECTION("relaxing the interval lets the run complete") {
        Problem p = exhausted_problem();
        p.settings.min_interval_day = 1;
        p.settings.min_interval_night = 1;
        ScheduleBuilder relaxed(p);
        auto r = relaxed.build();
        REQUIRE(r.ok());
        REQUIRE(r.assignments.size() == 14);
    }
}

TEST_CASE("Builder stop", "[builder]") {
    ScheduleBuilder builder(standard_problem());
    builder.stop();
    REQUIRE(builder.is_stopped());

    auto result = builder.build();
    REQUIRE(result.status == BuildStatus::Stopped);
    REQUIRE(result.assignments.empty());

    builder.reset_stop();
    REQUIRE(!builder.is_stopped());
    REQUIRE(builder.build().ok());
}

TEST_CASE("Builder uses the configured selection policy", "[builder]") {
    ScheduleBuilder builder(standard_problem());
    builder.set_policy(std::make_shared<LastInPoolPolicy>());
    auto result = builder.build();

    // プールはロスター順
    REQUIRE(result.assignments[0].member == "D10");
    REQUIRE(result.assignments[2].member == "T04");
}

// ============================================================================
// Global holidays and history
// ============================================================================

TEST_CASE("Builder skips global holidays", "[builder]") {
    Problem p = standard_problem();
    p.ng_rules.global = {Date(2025, 5, 3), Date(2025, 5, 4)};

    SECTION("skipped slots are reported as notes") {
        ScheduleBuilder builder(p);
        auto result = builder.build();
        REQUIRE(result.ok());
        REQUIRE(result.assignments.size() == 66);
        REQUIRE(result.notes.size() == 2);
        for (const auto& a : result.assignments) {
            REQUIRE(a.slot.date != Date(2025, 5, 3));
            REQUIRE(a.slot.date != Date(2025, 5, 4));
        }
    }

    SECTION("without skipping, the holiday leaves no candidate") {
        p.settings.skip_global_holidays = false;
        ScheduleBuilder builder(p);
        auto result = builder.build();
        REQUIRE(result.status == BuildStatus::NoCandidate);
        REQUIRE(result.assignments.size() == 48);
        REQUIRE(result.failure->slot == DutySlot{Date(2025, 5, 3), ShiftType::Day, 1});
        for (const auto& [name, reasons] : result.failure->eliminations) {
            REQUIRE(has_kind(reasons, EliminationKind::GlobalNgDate));
        }
    }
}

TEST_CASE("Builder seeds state from recent history", "[builder]") {
    Problem p = standard_problem();
    p.ng_rules.global = {Date(2025, 5, 3), Date(2025, 5, 4)};
    p.history = {
        HistoryRecord{Date(2025, 3, 15), ShiftType::Day, 3, "D01"},
        HistoryRecord{Date(2025, 3, 8), ShiftType::Day, 1, "T01"},
        HistoryRecord{Date(2025, 3, 17), ShiftType::Night, 1, "N01"},
        HistoryRecord{Date(2025, 1, 1), ShiftType::Day, 1, "T02"},     // 範囲外
        HistoryRecord{Date(2025, 3, 9), ShiftType::Day, 1, "retired"}, // ロスター外
    };
    ScheduleBuilder builder(p);
    auto result = builder.build();
    REQUIRE(result.ok());
    REQUIRE(result.assignments.size() == 66);

    SECTION("day index follows the history window") {
        int d01 = 0;
        for (const auto& a : result.assignments) {
            if (a.member == "D01") {
                REQUIRE(a.slot.index == 3);
                d01++;
            }
            if (a.member == "T01") {
                REQUIRE(a.slot.index != 3);
            }
            if (a.member == "T02") {
                REQUIRE(a.slot.index == 3);
            }
        }
        REQUIRE(d01 == 4);
    }

    SECTION("previous night week blocks the interval") {
        const auto* a = find_slot(result, DutySlot{Date(2025, 3, 24), ShiftType::Night, 1});
        REQUIRE(a);
        REQUIRE(a->member == "N02");
    }

    SECTION("history is not part of the result") {
        for (const auto& a : result.assignments) {
            REQUIRE(a.slot.date >= Date(2025, 3, 21));
        }
        REQUIRE(builder.fairness().count("N01", ShiftType::Night) >= 1);
    }
}

TEST_CASE("Night week from history straddling the start blocks the first weekend",
          "[builder]") {
    Problem p = standard_problem();
    for (auto& m : p.members) {
        if (m.name == "D01") m.groups.push_back(IndexGroup::NightIndex1);
    }
    // 2025-03-17 .. 2025-03-23
    p.history = {HistoryRecord{Date(2025, 3, 17), ShiftType::Night, 1, "D01"}};
    ScheduleBuilder builder(p);
    auto result = builder.build();
    REQUIRE(result.ok());

    std::vector<Assignment> d01;
    for (const auto& a : result.assignments) {
        if (a.member == "D01") d01.push_back(a);
    }
    REQUIRE(!d01.empty());
    // 週内（03-22, 03-23）と夜勤明け（03-29）は不可、03-30 から可
    REQUIRE(d01.front().slot.date == Date(2025, 3, 30));
    REQUIRE(d01.front().slot.shift == ShiftType::Day);
}

// ============================================================================
// Fixed pattern
// ============================================================================

TEST_CASE("FixedPatternOverride week arithmetic", "[builder][fixed]") {
    FixedPatternOverride fp(FixedPattern{"F01", Date(2025, 3, 24), 2, 14});
    REQUIRE(fp.enabled());
    REQUIRE(!FixedPatternOverride().enabled());

    REQUIRE(FixedPatternOverride::weeks_between(Date(2025, 3, 24), Date(2025, 4, 7)) == 2);
    REQUIRE(FixedPatternOverride::weeks_between(Date(2025, 3, 24), Date(2025, 3, 17)) == -1);
    REQUIRE(FixedPatternOverride::weeks_between(Date(2025, 3, 26), Date(2025, 3, 24)) == -1);

    REQUIRE(fp.fixed_assignment(DutySlot{Date(2025, 3, 24), ShiftType::Night, 2}) == "F01");
    REQUIRE(fp.fixed_assignment(DutySlot{Date(2025, 4, 7), ShiftType::Night, 2}) == "F01");
    REQUIRE(fp.fixed_assignment(DutySlot{Date(2025, 3, 10), ShiftType::Night, 2}) == "F01");
    REQUIRE(!fp.fixed_assignment(DutySlot{Date(2025, 3, 31), ShiftType::Night, 2}));
    REQUIRE(!fp.fixed_assignment(DutySlot{Date(2025, 3, 17), ShiftType::Night, 2}));
    REQUIRE(!fp.fixed_assignment(DutySlot{Date(2025, 3, 24), ShiftType::Night, 1}));
    REQUIRE(!fp.fixed_assignment(DutySlot{Date(2025, 3, 22), ShiftType::Day, 2}));

    SECTION("four-week cadence") {
        FixedPatternOverride monthly(FixedPattern{"F01", Date(2025, 3, 24), 1, 28});
        REQUIRE(monthly.fixed_assignment(DutySlot{Date(2025, 4, 21), ShiftType::Night, 1}));
        REQUIRE(!monthly.fixed_assignment(DutySlot{Date(2025, 4, 7), ShiftType::Night, 1}));
    }
}

TEST_CASE("Builder places the fixed member on alternate weeks", "[builder][fixed]") {
    ScheduleBuilder builder(fixed_pattern_problem());
    auto result = builder.build();
    REQUIRE(result.ok());
    REQUIRE(builder.stats().forced_count == 5);
    REQUIRE(builder.stats().fallback_count == 0);

    std::vector<std::string> f01_weeks;
    for (const auto& a : result.assignments) {
        if (a.member == "F01") {
            REQUIRE(a.slot.shift == ShiftType::Night);
            REQUIRE(a.slot.index == 2);
            f01_weeks.push_back(a.slot.date.to_string());
        }
    }
    REQUIRE(f01_weeks == std::vector<std::string>{"2025-03-24", "2025-04-07", "2025-04-21",
                                                  "2025-05-05", "2025-05-19"});
}

TEST_CASE("Fixed member stays off the weeks between its cadence", "[builder][fixed]") {
    // 期間最初の月曜 03-24 が基準日 03-31 から奇数週になる
    Problem p = fixed_pattern_problem();
    p.fixed_pattern->reference_date = Date(2025, 3, 31);
    ScheduleBuilder builder(p);
    auto result = builder.build();

    REQUIRE(result.ok());
    REQUIRE(result.notes.empty());
    REQUIRE(builder.stats().forced_count == 4);
    REQUIRE(builder.stats().fallback_count == 0);

    std::vector<std::string> f01_weeks;
    for (const auto& a : result.assignments) {
        if (a.member == "F01") {
            REQUIRE(FixedPatternOverride::weeks_between(Date(2025, 3, 31), a.slot.date) % 2 == 0);
            f01_weeks.push_back(a.slot.date.to_string());
        }
    }
    REQUIRE(f01_weeks == std::vector<std::string>{"2025-03-31", "2025-04-14", "2025-04-28",
                                                  "2025-05-12"});

    const auto* first = find_slot(result, DutySlot{Date(2025, 3, 24), ShiftType::Night, 2});
    REQUIRE(first);
    REQUIRE(first->member == "M01");
}

TEST_CASE("Fixed member blocked by a hard rule falls back", "[builder][fixed]") {
    Problem p = fixed_pattern_problem();
    p.ng_rules.by_member["F01"] = {Date(2025, 4, 7)};
    ScheduleBuilder builder(p);
    auto result = builder.build();

    REQUIRE(result.ok());
    REQUIRE(builder.stats().forced_count == 4);
    REQUIRE(builder.stats().fallback_count == 1);

    const auto* a = find_slot(result, DutySlot{Date(2025, 4, 7), ShiftType::Night, 2});
    REQUIRE(a);
    REQUIRE(a->member == "M02");

    REQUIRE(result.notes.size() == 1);
    REQUIRE(result.notes[0].find("F01 cannot take 2025-04-07 night 2") != std::string::npos);
    REQUIRE(result.notes[0].find("ng-date") != std::string::npos);
}
