/**
 * @file analysis.hpp
 * @brief 作成済みスケジュールの検査と集計
 */
#ifndef TOBAN_ANALYSIS_HPP
#define TOBAN_ANALYSIS_HPP

#include "toban/problem.hpp"
#include <map>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 検出した違反
 */
struct Violation {
    enum class Kind {
        DuplicateSlot,   // 同じ枠に2件以上
        Overlap,         // 同一メンバーの期間重複
        Cooldown,        // 夜勤明け期間中の日勤
        Interval,        // 最小間隔未満
        Index,           // 担当区分外の index
        FixedPattern     // 固定パターン対象外の週に対象メンバー
    };

    Kind kind;
    std::string member;
    std::string detail;
};

const char* violation_name(Violation::Kind kind);

/**
 * @brief メンバーごとの担当回数
 */
struct MemberCounts {
    int day = 0;
    int night = 0;
};

/**
 * @brief 検査結果
 */
struct ScheduleReport {
    std::vector<Violation> violations;
    std::map<std::string, MemberCounts> counts;  // 全メンバー（0件を含む）

    bool clean() const { return violations.empty(); }

    /**
     * @brief 指定メンバー集合の担当回数の最大 − 最小
     */
    int spread(const std::vector<std::string>& members, ShiftType shift) const;
};

/**
 * @brief 割当列を検査
 *
 * 今回の割当のみを対象とし、過去実績は見ない。
 */
ScheduleReport analyze(const Problem& problem, const std::vector<Assignment>& assignments);

} // namespace toban

#endif // TOBAN_ANALYSIS_HPP
