/**
 * @file rule.hpp
 * @brief ハード制約ルールの基底クラスと評価コンテキスト
 */
#ifndef TOBAN_RULE_HPP
#define TOBAN_RULE_HPP

#include "toban/eligibility.hpp"
#include "toban/scorer.hpp"
#include "toban/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 候補から外れた理由の種類
 */
enum class EliminationKind {
    Inactive,           // 非アクティブ
    NgDate,             // 個人NG日・NG期間
    GlobalNgDate,       // 全体NG日
    Overlap,            // 同日・同週の重複
    Cooldown,           // 夜勤明けの日勤禁止期間
    IndexIneligible,    // 担当不可 index（勤務種別に属さない場合を含む）
    MinInterval,        // 最小間隔未満
    FixedPattern        // 固定パターン対象外の週
};

const char* elimination_name(EliminationKind kind);

/**
 * @brief 候補から外れた理由
 */
struct Elimination {
    EliminationKind kind;
    std::string detail;

    std::string to_string() const;
};

/**
 * @brief 確定済みの割当（過去実績の夜勤・日勤を含む）
 *
 * 重複・夜勤明けチェックはここに記録された枠だけを参照する。
 */
class CommitLog {
public:
    /**
     * @brief 過去実績の枠を記録（割当結果には含めない）
     */
    void add_prior(const std::string& member, const DutySlot& slot);

    /**
     * @brief 今回確定した割当を記録
     */
    void commit(const Assignment& assignment);

    /**
     * @brief 今回確定した割当（確定順）
     */
    const std::vector<Assignment>& assignments() const { return assignments_; }

    /**
     * @brief メンバーが占める全枠（過去実績を含む、記録順）
     */
    const std::vector<DutySlot>& slots_of(const std::string& member) const;

private:
    std::vector<Assignment> assignments_;
    std::map<std::string, std::vector<DutySlot>> by_member_;
};

/**
 * @brief ルール評価に必要な状態（すべて読み取り専用）
 */
struct RuleContext {
    const Settings& settings;
    const NgRules& ng_rules;
    const EligibilityTable& eligibility;
    const CommitLog& committed;
    const FairnessState& fairness;
};

/**
 * @brief ハード制約ルールの基底クラス
 *
 * check() は確定済み状態と静的設定だけを参照する純関数であること。
 * 評価対象より後の枠は見ない。
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief ルール名
     */
    virtual std::string name() const = 0;

    /**
     * @brief 候補を評価
     * @return 違反していれば理由、問題なければ nullopt
     */
    virtual std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                             const RuleContext& ctx) const = 0;
};

using RulePtr = std::shared_ptr<Rule>;

} // namespace toban

#endif // TOBAN_RULE_HPP
