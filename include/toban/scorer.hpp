/**
 * @file scorer.hpp
 * @brief 公平性状態、優先度キー、候補選択ポリシー
 */
#ifndef TOBAN_SCORER_HPP
#define TOBAN_SCORER_HPP

#include "toban/history.hpp"
#include "toban/types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief メンバーごとの公平性カウンタ
 *
 * 直近実績で初期化し、割当の確定直後にのみ更新する。
 */
class FairnessState {
public:
    struct Tally {
        int count = 0;
        std::optional<Date> last_date;
    };

    FairnessState() = default;

    /**
     * @brief 直近実績から初期化
     */
    FairnessState(const std::vector<Member>& members, const HistoryWindow& history);

    int count(const std::string& member, ShiftType shift) const;
    std::optional<Date> last_date(const std::string& member, ShiftType shift) const;

    /**
     * @brief 最終担当からの経過日数（担当なしなら nullopt）
     */
    std::optional<int64_t> days_since_last(const std::string& member, ShiftType shift,
                                           const Date& on) const;

    /**
     * @brief 確定した割当を反映
     */
    void commit(const Assignment& assignment);

private:
    const Tally* find(const std::string& member, ShiftType shift) const;

    std::map<std::string, Tally> tallies_[2];
};

/**
 * @brief 優先度キー（小さいほど優先）
 *
 * 1. 担当回数（少ないほど優先）
 * 2. 最終担当からの経過日数（長いほど優先、未担当は最長扱い）
 * 3. メンバー名（バイト順昇順）
 */
struct PriorityKey {
    int count = 0;
    std::optional<int64_t> gap_days;
    std::string name;

    bool operator<(const PriorityKey& other) const;
};

/**
 * @brief 候補者の優先度キーを計算
 */
PriorityKey score(const Member& member, const DutySlot& slot, const FairnessState& fairness);

/**
 * @brief 枠に必要な最小間隔（日数）
 *
 * 夜勤: 個別設定 > 既定値。日勤: index 3 緩和設定（あれば） > 個別設定 > 既定値。
 */
int required_interval(const Member& member, const DutySlot& slot, const Settings& settings);

/**
 * @brief 候補選択ポリシーの基底クラス
 *
 * 候補プールは全ハード制約を通過済み。戻り値は pool 内の位置。
 */
class SelectionPolicy {
public:
    virtual ~SelectionPolicy() = default;

    virtual std::string name() const = 0;

    /**
     * @brief 候補を1人選ぶ
     * @pre pool は空でない
     */
    virtual size_t select(const std::vector<const Member*>& pool, const DutySlot& slot,
                          const FairnessState& fairness) const = 0;
};

using SelectionPolicyPtr = std::shared_ptr<SelectionPolicy>;

/**
 * @brief 公平性ポリシー（PriorityKey 最小の候補を選ぶ）
 */
class FairnessPolicy : public SelectionPolicy {
public:
    std::string name() const override;
    size_t select(const std::vector<const Member*>& pool, const DutySlot& slot,
                  const FairnessState& fairness) const override;
};

} // namespace toban

#endif // TOBAN_SCORER_HPP
