/**
 * @file rules.hpp
 * @brief 具体的なハード制約ルール（除外ルール、index 制約、最小間隔）
 */
#ifndef TOBAN_RULES_HPP
#define TOBAN_RULES_HPP

#include "toban/fixed_pattern.hpp"
#include "toban/rule.hpp"
#include <vector>

namespace toban {

/**
 * @brief 非アクティブなメンバーは常に除外
 */
class InactiveRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief NG日（個人NG日、個人NG期間、全体NG日）が slot.date に当たれば除外
 */
class NgDateRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief 日勤・夜勤の重複禁止
 *
 * - 日勤: その日を含む夜勤週に配置済みなら不可
 * - 夜勤: その週内に日勤配置済みなら不可
 * - 同じ日付に既に別の枠を持っていれば不可
 */
class OverlapRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief 夜勤明けの日勤禁止期間
 *
 * 夜勤週の終了日（日曜）から 0 < 経過日数 < cooldown_days の日勤は不可。
 */
class CooldownRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief 担当可能 index 表に含まれない index は不可
 */
class IndexEligibilityRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief 同一勤務種別の最小間隔（スコアの減点ではなく候補から除外）
 */
class MinIntervalRule : public Rule {
public:
    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;
};

/**
 * @brief 固定パターン対象メンバーを対象週以外の target_index 夜勤から外す
 *
 * 対象週の枠は FixedPatternOverride 側で扱うため、ここでは判定しない。
 */
class FixedPatternRule : public Rule {
public:
    explicit FixedPatternRule(FixedPatternOverride fixed);

    std::string name() const override;
    std::optional<Elimination> check(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const override;

private:
    FixedPatternOverride fixed_;
};

/**
 * @brief 除外ルール（非アクティブ・NG日・重複・夜勤明け）の集合
 */
class ExclusionRules {
public:
    ExclusionRules();

    /**
     * @brief いずれかの除外ルールに該当するか
     */
    bool is_excluded(const Member& member, const DutySlot& slot,
                     const RuleContext& ctx) const;

    /**
     * @brief 該当する除外理由をすべて列挙
     */
    std::vector<Elimination> reasons(const Member& member, const DutySlot& slot,
                                     const RuleContext& ctx) const;

    const std::vector<RulePtr>& rules() const { return rules_; }

private:
    std::vector<RulePtr> rules_;
};

/**
 * @brief 候補プールの絞り込みに使う全ルール（除外 → index → 最小間隔 → 固定パターンの順）
 *
 * 固定パターンが無効なら FixedPatternRule は含めない。
 */
std::vector<RulePtr> default_rules(const FixedPatternOverride& fixed = FixedPatternOverride());

/**
 * @brief rules のうち違反したものの理由をすべて列挙
 */
std::vector<Elimination> evaluate_rules(const std::vector<RulePtr>& rules,
                                        const Member& member, const DutySlot& slot,
                                        const RuleContext& ctx);

} // namespace toban

#endif // TOBAN_RULES_HPP
