#include "toban/rules.hpp"
#include <algorithm>
#include <utility>

namespace toban {

const char* elimination_name(EliminationKind kind) {
    switch (kind) {
        case EliminationKind::Inactive: return "inactive";
        case EliminationKind::NgDate: return "ng-date";
        case EliminationKind::GlobalNgDate: return "global-ng-date";
        case EliminationKind::Overlap: return "overlap";
        case EliminationKind::Cooldown: return "cooldown";
        case EliminationKind::IndexIneligible: return "index-ineligible";
        case EliminationKind::MinInterval: return "min-interval";
        case EliminationKind::FixedPattern: return "fixed-pattern";
    }
    return "?";
}

std::string Elimination::to_string() const {
    return std::string(elimination_name(kind)) + ": " + detail;
}

// ============================================================================
// CommitLog
// ============================================================================

void CommitLog::add_prior(const std::string& member, const DutySlot& slot) {
    by_member_[member].push_back(slot);
}

void CommitLog::commit(const Assignment& assignment) {
    assignments_.push_back(assignment);
    by_member_[assignment.member].push_back(assignment.slot);
}

const std::vector<DutySlot>& CommitLog::slots_of(const std::string& member) const {
    static const std::vector<DutySlot> empty;
    auto it = by_member_.find(member);
    return it == by_member_.end() ? empty : it->second;
}

// ============================================================================
// InactiveRule
// ============================================================================

std::string InactiveRule::name() const {
    return "inactive";
}

std::optional<Elimination> InactiveRule::check(const Member& member, const DutySlot&,
                                               const RuleContext&) const {
    if (!member.active) {
        return Elimination{EliminationKind::Inactive, member.name + " is inactive"};
    }
    return std::nullopt;
}

// ============================================================================
// NgDateRule
// ============================================================================

std::string NgDateRule::name() const {
    return "ng_date";
}

std::optional<Elimination> NgDateRule::check(const Member& member, const DutySlot& slot,
                                             const RuleContext& ctx) const {
    const auto& ng = ctx.ng_rules;
    const Date& d = slot.date;

    auto m_it = ng.by_member.find(member.name);
    if (m_it != ng.by_member.end() &&
        std::find(m_it->second.begin(), m_it->second.end(), d) != m_it->second.end()) {
        return Elimination{EliminationKind::NgDate,
                           member.name + " has NG date " + d.to_string()};
    }

    auto p_it = ng.by_period.find(member.name);
    if (p_it != ng.by_period.end()) {
        for (const auto& period : p_it->second) {
            if (period.contains(d)) {
                std::string reason = period.reason.empty() ? "NG period" : period.reason;
                return Elimination{EliminationKind::NgDate,
                                   member.name + " has NG period " + period.start.to_string() +
                                   " .. " + period.end.to_string() + " (" + reason + ")"};
            }
        }
    }

    if (ng.is_global(d)) {
        return Elimination{EliminationKind::GlobalNgDate,
                           d.to_string() + " is a global NG date"};
    }
    return std::nullopt;
}

// ============================================================================
// OverlapRule
// ============================================================================

std::string OverlapRule::name() const {
    return "overlap";
}

std::optional<Elimination> OverlapRule::check(const Member& member, const DutySlot& slot,
                                              const RuleContext& ctx) const {
    for (const auto& held : ctx.committed.slots_of(member.name)) {
        // 期間が1日でも重なれば不可
        if (held.span_begin() <= slot.span_end() && slot.span_begin() <= held.span_end()) {
            std::string what = held.shift == ShiftType::Night
                ? "night week " + held.span_begin().to_string() + " .. " +
                  held.span_end().to_string()
                : std::string("day shift on ") + held.date.to_string();
            return Elimination{EliminationKind::Overlap,
                               member.name + " already holds " + what};
        }
    }
    return std::nullopt;
}

// ============================================================================
// CooldownRule
// ============================================================================

std::string CooldownRule::name() const {
    return "cooldown";
}

std::optional<Elimination> CooldownRule::check(const Member& member, const DutySlot& slot,
                                               const RuleContext& ctx) const {
    if (slot.shift != ShiftType::Day) {
        return std::nullopt;
    }
    const int gap = ctx.settings.cooldown_days;
    for (const auto& held : ctx.committed.slots_of(member.name)) {
        if (held.shift != ShiftType::Night) {
            continue;
        }
        int64_t days_since = slot.date - held.span_end();
        if (0 < days_since && days_since < gap) {
            return Elimination{EliminationKind::Cooldown,
                               member.name + " finished night week on " +
                               held.span_end().to_string() + ", " +
                               std::to_string(gap - days_since) + " more day(s) required"};
        }
    }
    return std::nullopt;
}

// ============================================================================
// IndexEligibilityRule
// ============================================================================

std::string IndexEligibilityRule::name() const {
    return "index_eligibility";
}

std::optional<Elimination> IndexEligibilityRule::check(const Member& member,
                                                       const DutySlot& slot,
                                                       const RuleContext& ctx) const {
    if (!member.serves(slot.shift)) {
        return Elimination{EliminationKind::IndexIneligible,
                           member.name + " does not serve " + shift_name(slot.shift) +
                           " shifts"};
    }
    if (!ctx.eligibility.is_eligible(member.name, slot.shift, slot.index)) {
        const auto& allowed = ctx.eligibility.eligible_indices(member.name, slot.shift);
        std::string list;
        for (int i : allowed) {
            if (!list.empty()) list += ",";
            list += std::to_string(i);
        }
        const char* basis =
            ctx.eligibility.source(member.name, slot.shift) == EligibilitySource::History
                ? "recent history"
                : "index group";
        return Elimination{EliminationKind::IndexIneligible,
                           member.name + " may hold " + shift_name(slot.shift) + " index {" +
                           list + "} only (" + basis + ")"};
    }
    return std::nullopt;
}

// ============================================================================
// MinIntervalRule
// ============================================================================

std::string MinIntervalRule::name() const {
    return "min_interval";
}

std::optional<Elimination> MinIntervalRule::check(const Member& member, const DutySlot& slot,
                                                  const RuleContext& ctx) const {
    auto days = ctx.fairness.days_since_last(member.name, slot.shift, slot.date);
    if (!days) {
        return std::nullopt;
    }
    int required = required_interval(member, slot, ctx.settings);
    if (*days < required) {
        auto last = ctx.fairness.last_date(member.name, slot.shift);
        return Elimination{EliminationKind::MinInterval,
                           member.name + " last " + shift_name(slot.shift) + " shift " +
                           last->to_string() + " is " + std::to_string(*days) +
                           " day(s) ago, minimum " + std::to_string(required)};
    }
    return std::nullopt;
}

// ============================================================================
// FixedPatternRule
// ============================================================================

FixedPatternRule::FixedPatternRule(FixedPatternOverride fixed)
    : fixed_(std::move(fixed)) {}

std::string FixedPatternRule::name() const {
    return "fixed_pattern";
}

std::optional<Elimination> FixedPatternRule::check(const Member& member, const DutySlot& slot,
                                                   const RuleContext&) const {
    const auto& pattern = fixed_.pattern();
    if (!pattern || member.name != pattern->member || slot.shift != ShiftType::Night ||
        slot.index != pattern->target_index) {
        return std::nullopt;
    }
    if (fixed_.fixed_assignment(slot)) {
        return std::nullopt;
    }
    return Elimination{EliminationKind::FixedPattern,
                       member.name + " takes " + shift_name(slot.shift) + " index " +
                       std::to_string(slot.index) + " only every " +
                       std::to_string(pattern->cadence_days) + " days from " +
                       pattern->reference_date.to_string()};
}

// ============================================================================
// ExclusionRules
// ============================================================================

ExclusionRules::ExclusionRules()
    : rules_{std::make_shared<InactiveRule>(),
             std::make_shared<NgDateRule>(),
             std::make_shared<OverlapRule>(),
             std::make_shared<CooldownRule>()} {}

bool ExclusionRules::is_excluded(const Member& member, const DutySlot& slot,
                                 const RuleContext& ctx) const {
    for (const auto& rule : rules_) {
        if (rule->check(member, slot, ctx)) {
            return true;
        }
    }
    return false;
}

std::vector<Elimination> ExclusionRules::reasons(const Member& member, const DutySlot& slot,
                                                 const RuleContext& ctx) const {
    return evaluate_rules(rules_, member, slot, ctx);
}

std::vector<RulePtr> default_rules(const FixedPatternOverride& fixed) {
    std::vector<RulePtr> rules = ExclusionRules().rules();
    rules.push_back(std::make_shared<IndexEligibilityRule>());
    rules.push_back(std::make_shared<MinIntervalRule>());
    if (fixed.enabled()) {
        rules.push_back(std::make_shared<FixedPatternRule>(fixed));
    }
    return rules;
}

std::vector<Elimination> evaluate_rules(const std::vector<RulePtr>& rules,
                                        const Member& member, const DutySlot& slot,
                                        const RuleContext& ctx) {
    std::vector<Elimination> result;
    for (const auto& rule : rules) {
        if (auto e = rule->check(member, slot, ctx)) {
            result.push_back(std::move(*e));
        }
    }
    return result;
}

} // namespace toban
