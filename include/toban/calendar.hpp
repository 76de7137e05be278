/**
 * @file calendar.hpp
 * @brief ローテーション期間から当番枠列を生成する
 */
#ifndef TOBAN_CALENDAR_HPP
#define TOBAN_CALENDAR_HPP

#include "toban/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 開始日から暗黙の終了日（2ヶ月後の前日、21日開始なら20日）を計算
 */
Date rotation_end(const Date& start);

/**
 * @brief ローテーション期間を作成
 * @param start 開始日
 * @param end 終了日（省略時は rotation_end(start)）
 * @throws InvalidPeriod 期間が不正な場合
 */
RotationPeriod make_period(const Date& start, std::optional<Date> end = std::nullopt);

/**
 * @brief 期間の妥当性を検証
 *
 * 終了日が開始日より前、または期間が1週間に満たない（週単位の夜勤を置けない）
 * 場合は InvalidPeriod を送出する。
 */
void validate_period(const RotationPeriod& period);

/**
 * @brief 期間内の土日
 */
std::vector<Date> weekends_in(const RotationPeriod& period);

/**
 * @brief 期間内の月曜日
 */
std::vector<Date> mondays_in(const RotationPeriod& period);

/**
 * @brief 枠生成の結果
 */
struct SlotPlan {
    std::vector<DutySlot> slots;
    std::vector<std::string> notes;  // 休日によりスキップした枠
};

/**
 * @brief 当番枠列を生成
 *
 * 日付昇順。同一日内では日勤 index 1,2,3、夜勤 index 1,2 の順。
 * holidays に含まれる土日の日勤枠と、月〜金がすべて holidays の週の夜勤枠は生成しない。
 *
 * @param period ローテーション期間
 * @param holidays スキップ対象の全体休日（空なら何もスキップしない）
 * @throws InvalidPeriod 期間が不正な場合
 */
SlotPlan generate_slots(const RotationPeriod& period,
                        const std::vector<Date>& holidays = {});

} // namespace toban

#endif // TOBAN_CALENDAR_HPP
