/**
 * @file problem.hpp
 * @brief 当番表作成の入力一式（不変の設定値）
 */
#ifndef TOBAN_PROBLEM_HPP
#define TOBAN_PROBLEM_HPP

#include "toban/history.hpp"
#include "toban/types.hpp"
#include <optional>
#include <vector>

namespace toban {

/**
 * @brief 当番表作成の入力
 *
 * ScheduleBuilder に明示的に渡す。プロセス全体の状態は持たない。
 */
struct Problem {
    RotationPeriod period;
    std::vector<Member> members;
    std::vector<HistoryRecord> history;
    NgRules ng_rules;
    std::optional<FixedPattern> fixed_pattern;
    Settings settings;

    /**
     * @brief 名前でメンバーを検索（なければ nullptr）
     */
    const Member* find_member(const std::string& name) const;

    /**
     * @brief 入力の整合性を検証
     *
     * 期間の検証（InvalidPeriod）に加え、以下を ConfigInconsistency として検出する:
     * - メンバー名の重複、空のメンバー名
     * - 固定パターン・NG日が存在しないメンバーを参照
     * - 終了日が開始日より前の NG 期間
     * - 勤務種別に対して不正な index の過去実績
     * - 正でない間隔・日数設定、7の倍数でない固定パターン周期、不正な固定 index
     */
    void validate() const;
};

} // namespace toban

#endif // TOBAN_PROBLEM_HPP
