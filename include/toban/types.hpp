/**
 * @file types.hpp
 * @brief 当番表の基本データ型（メンバー、枠、割当、NG日、設定）
 */
#ifndef TOBAN_TYPES_HPP
#define TOBAN_TYPES_HPP

#include "toban/date.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 勤務種別
 */
enum class ShiftType {
    Day,    // 土日の日勤
    Night   // 月曜開始の週夜勤
};

/**
 * @brief index グループ（メンバーの静的な担当区分）
 */
enum class IndexGroup {
    DayIndex12,
    DayIndex3,
    NightIndex1,
    NightIndex2
};

const char* shift_name(ShiftType shift);
const char* group_name(IndexGroup group);

/**
 * @brief 勤務種別ごとの index 数（日勤 3、夜勤 2）
 */
inline int index_count(ShiftType shift) {
    return shift == ShiftType::Day ? 3 : 2;
}

inline bool is_valid_index(ShiftType shift, int index) {
    return index >= 1 && index <= index_count(shift);
}

/**
 * @brief 当番メンバー
 */
struct Member {
    std::string name;
    bool active = true;
    std::vector<IndexGroup> groups;
    std::optional<int> min_interval_day;    // 個別の日勤最小間隔
    std::optional<int> min_interval_night;  // 個別の夜勤最小間隔

    /**
     * @brief 指定勤務種別のグループを取得（なければ nullopt）
     */
    std::optional<IndexGroup> group_for(ShiftType shift) const;

    bool serves(ShiftType shift) const { return group_for(shift).has_value(); }
};

/**
 * @brief 当番枠
 *
 * 日勤は土日の1日、夜勤は月曜から日曜までの7日間を占める。
 */
struct DutySlot {
    Date date;          // 日勤: 当日、夜勤: 週の月曜日
    ShiftType shift = ShiftType::Day;
    int index = 1;

    Date span_begin() const { return date; }
    Date span_end() const { return shift == ShiftType::Night ? date + 6 : date; }

    bool covers(const Date& d) const { return span_begin() <= d && d <= span_end(); }

    /**
     * @brief 表示用文字列（"2025-03-22 day 1" など）
     */
    std::string to_string() const;

    bool operator==(const DutySlot& other) const {
        return date == other.date && shift == other.shift && index == other.index;
    }
    bool operator!=(const DutySlot& other) const { return !(*this == other); }
};

/**
 * @brief 枠とメンバーの割当
 */
struct Assignment {
    DutySlot slot;
    std::string member;

    bool operator==(const Assignment& other) const {
        return slot == other.slot && member == other.member;
    }
};

/**
 * @brief 期間指定の NG（両端を含む）
 */
struct NgPeriod {
    Date start;
    Date end;
    std::string reason;

    bool contains(const Date& d) const { return start <= d && d <= end; }
};

/**
 * @brief NG日設定
 */
struct NgRules {
    std::map<std::string, std::vector<Date>> by_member;
    std::vector<Date> global;
    std::map<std::string, std::vector<NgPeriod>> by_period;

    bool is_global(const Date& d) const;
};

/**
 * @brief 固定パターン設定（指定メンバーを隔週で夜勤 index に固定配置）
 */
struct FixedPattern {
    std::string member;
    Date reference_date;
    int target_index = 2;
    int cadence_days = 14;
};

/**
 * @brief ローテーション期間（両端を含む）
 */
struct RotationPeriod {
    Date start;
    Date end;
};

/**
 * @brief 制約パラメータ
 */
struct Settings {
    int min_interval_day = 14;
    int min_interval_night = 21;
    std::optional<int> min_interval_day_index3;  // 設定時のみ index 3 の日勤間隔を置き換える
    int cooldown_days = 7;                       // 夜勤明けから日勤不可の日数
    int history_months = 2;
    bool skip_global_holidays = true;
};

/**
 * @brief ローテーション期間の指定が不正
 */
class InvalidPeriod : public std::runtime_error {
public:
    explicit InvalidPeriod(const std::string& what)
        : std::runtime_error("Invalid period: " + what) {}
};

/**
 * @brief 設定間の不整合（存在しないメンバーの参照など）
 */
class ConfigInconsistency : public std::runtime_error {
public:
    explicit ConfigInconsistency(const std::string& what)
        : std::runtime_error("Config inconsistency: " + what) {}
};

} // namespace toban

#endif // TOBAN_TYPES_HPP
