/**
 * @file scenario_fixtures.hpp
 * @brief テスト用の標準ロスター（2025-03-21 .. 2025-05-20、22人）
 */
#ifndef TOBAN_TESTS_SCENARIO_FIXTURES_HPP
#define TOBAN_TESTS_SCENARIO_FIXTURES_HPP

#include "toban/problem.hpp"
#include <cstdio>
#include <string>
#include <vector>

namespace toban {
namespace testing {

inline Member make_member(const std::string& name, std::vector<IndexGroup> groups) {
    Member m;
    m.name = name;
    m.groups = std::move(groups);
    return m;
}

inline std::string numbered(const char* prefix, int i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%s%02d", prefix, i);
    return buf;
}

inline std::vector<std::string> names_with_prefix(const char* prefix, int n) {
    std::vector<std::string> names;
    for (int i = 1; i <= n; ++i) {
        names.push_back(numbered(prefix, i));
    }
    return names;
}

/**
 * @brief 日勤 index 1,2 が D01..D10、index 3 が T01..T04、
 *        夜勤 index 1 が N01..N04、index 2 が M01..M03 と F01
 *
 * F01 は固定パターン用で、夜勤の最小間隔を 14 日に緩めている。
 */
inline std::vector<Member> standard_members() {
    std::vector<Member> members;
    for (const auto& n : names_with_prefix("D", 10)) {
        members.push_back(make_member(n, {IndexGroup::DayIndex12}));
    }
    for (const auto& n : names_with_prefix("T", 4)) {
        members.push_back(make_member(n, {IndexGroup::DayIndex3}));
    }
    for (const auto& n : names_with_prefix("N", 4)) {
        members.push_back(make_member(n, {IndexGroup::NightIndex1}));
    }
    for (const auto& n : names_with_prefix("M", 3)) {
        members.push_back(make_member(n, {IndexGroup::NightIndex2}));
    }
    Member f = make_member("F01", {IndexGroup::NightIndex2});
    f.min_interval_night = 14;
    members.push_back(f);
    return members;
}

/**
 * @brief 固定パターンなしの標準問題
 */
inline Problem standard_problem() {
    Problem p;
    p.period = RotationPeriod{Date(2025, 3, 21), Date(2025, 5, 20)};
    p.members = standard_members();
    return p;
}

/**
 * @brief F01 を 2025-03-24 から隔週で夜勤 index 2 に固定した標準問題
 */
inline Problem fixed_pattern_problem() {
    Problem p = standard_problem();
    p.fixed_pattern = FixedPattern{"F01", Date(2025, 3, 24), 2, 14};
    return p;
}

} // namespace testing
} // namespace toban

#endif // TOBAN_TESTS_SCENARIO_FIXTURES_HPP
