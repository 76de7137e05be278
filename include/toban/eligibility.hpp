/**
 * @file eligibility.hpp
 * @brief メンバーごとの担当可能 index 表
 */
#ifndef TOBAN_ELIGIBILITY_HPP
#define TOBAN_ELIGIBILITY_HPP

#include "toban/history.hpp"
#include "toban/types.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 担当可能 index 集合の決定根拠
 */
enum class EligibilitySource {
    None,       // その勤務種別に属していない
    Group,      // 静的な index グループ
    History     // 直近実績
};

/**
 * @brief 担当可能 index 表
 *
 * 実行開始時に一度だけ構築し、以後は参照のみ（枠ごとの再計算はしない）。
 *
 * - 日勤: 直近に index 1,2 を担当 → {1,2}、index 3 を担当 → {3}。
 *   両方ある場合は空集合（どちらの制限にもかかる）。
 *   直近実績がなければ静的グループに従う。
 * - 夜勤: 静的グループのみ（index 1 グループ → {1}、index 2 グループ → {2}）。
 */
class EligibilityTable {
public:
    EligibilityTable() = default;

    EligibilityTable(const std::vector<Member>& members, const HistoryWindow& history);

    /**
     * @brief 担当可能 index 集合（未知のメンバーは空集合）
     */
    const std::set<int>& eligible_indices(const std::string& member, ShiftType shift) const;

    bool is_eligible(const std::string& member, ShiftType shift, int index) const {
        return eligible_indices(member, shift).count(index) > 0;
    }

    EligibilitySource source(const std::string& member, ShiftType shift) const;

private:
    struct Entry {
        std::set<int> indices[2];
        EligibilitySource sources[2] = {EligibilitySource::None, EligibilitySource::None};
    };

    static size_t slot_of(ShiftType shift) { return shift == ShiftType::Day ? 0 : 1; }

    std::map<std::string, Entry> table_;
};

} // namespace toban

#endif // TOBAN_ELIGIBILITY_HPP
