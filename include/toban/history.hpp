/**
 * @file history.hpp
 * @brief 過去の当番実績と直近ウィンドウ
 */
#ifndef TOBAN_HISTORY_HPP
#define TOBAN_HISTORY_HPP

#include "toban/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 過去の当番実績1件
 *
 * 夜勤の date は担当週の月曜日。
 */
struct HistoryRecord {
    Date date;
    ShiftType shift = ShiftType::Day;
    int index = 1;
    std::string member;
};

/**
 * @brief メンバー・勤務種別ごとの実績集計
 */
struct HistorySummary {
    int count = 0;
    std::optional<Date> last_date;
    std::vector<int> indexes;  // 担当した index（昇順・重複なし）
};

/**
 * @brief ローテーション開始前の直近実績ビュー（読み取り専用）
 *
 * [begin, end) に含まれる実績のみを保持する。
 */
class HistoryWindow {
public:
    HistoryWindow() = default;

    /**
     * @brief 実績から直近ウィンドウを構築
     * @param records 全実績（範囲外のものは捨てる）
     * @param rotation_start ローテーション開始日（ウィンドウの終端、含まない）
     * @param months 遡る月数
     * @throws ConfigInconsistency index が勤務種別に対して不正な実績がある場合
     */
    HistoryWindow(const std::vector<HistoryRecord>& records,
                  const Date& rotation_start, int months);

    const Date& begin() const { return begin_; }
    const Date& end() const { return end_; }

    /**
     * @brief ウィンドウ内の実績（日付昇順）
     */
    const std::vector<HistoryRecord>& records() const { return records_; }

    /**
     * @brief メンバー・勤務種別の集計（実績がなければ空の集計）
     */
    HistorySummary summary(const std::string& member, ShiftType shift) const;

private:
    Date begin_;
    Date end_;
    std::vector<HistoryRecord> records_;
};

} // namespace toban

#endif // TOBAN_HISTORY_HPP
