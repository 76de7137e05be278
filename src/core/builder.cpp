#include "toban/builder.hpp"
#include "toban/eligibility.hpp"
#include "toban/history.hpp"
#include <iostream>
#include <limits>

namespace toban {

namespace {

std::string join_reasons(const std::vector<Elimination>& reasons) {
    std::string s;
    for (const auto& e : reasons) {
        if (!s.empty()) s += "; ";
        s += e.to_string();
    }
    return s;
}

} // namespace

std::string NoCandidateError::message() const {
    std::string msg = "no candidate for " + slot.to_string() + " (" +
                      weekday_name(slot.date.weekday()) + ")\n";
    for (const auto& [name, reasons] : eliminations) {
        msg += "  " + name + ":\n";
        for (const auto& e : reasons) {
            msg += "    - " + e.to_string() + "\n";
        }
    }
    return msg;
}

ScheduleBuilder::ScheduleBuilder(Problem problem)
    : problem_(std::move(problem))
    , override_(problem_.fixed_pattern)
    , rules_(default_rules(override_))
    , policy_(std::make_shared<FairnessPolicy>()) {
    problem_.validate();
}

BuildResult ScheduleBuilder::build() {
    const auto& settings = problem_.settings;
    const auto& members = problem_.members;

    stats_ = BuildStats{};
    BuildResult result;

    // 直近実績から担当可能 index 表と公平性状態を作る
    HistoryWindow window(problem_.history, problem_.period.start, settings.history_months);
    EligibilityTable eligibility(members, window);
    fairness_ = FairnessState(members, window);
    committed_ = CommitLog{};
    for (const auto& rec : window.records()) {
        if (!problem_.find_member(rec.member)) {
            if (verbose_) {
                std::cerr << "% [verbose] history record for unknown member "
                          << rec.member << " on " << rec.date.to_string() << " ignored\n";
            }
            continue;
        }
        committed_.add_prior(rec.member, DutySlot{rec.date, rec.shift, rec.index});
    }

    static const std::vector<Date> no_holidays;
    SlotPlan plan = generate_slots(problem_.period,
                                   settings.skip_global_holidays ? problem_.ng_rules.global
                                                                 : no_holidays);
    result.notes = plan.notes;
    stats_.slot_count = plan.slots.size();
    stats_.min_pool_size = std::numeric_limits<size_t>::max();

    if (verbose_) {
        std::cerr << "% [verbose] build start: " << problem_.period.start.to_string()
                  << " .. " << problem_.period.end.to_string() << ", "
                  << plan.slots.size() << " slots, " << members.size() << " members, "
                  << window.records().size() << " history records\n";
    }

    RuleContext ctx{settings, problem_.ng_rules, eligibility, committed_, fairness_};

    for (const auto& slot : plan.slots) {
        if (stopped_) {
            if (verbose_) std::cerr << "% [verbose] build stopped before " << slot.to_string() << "\n";
            result.status = BuildStatus::Stopped;
            break;
        }

        if (try_fixed(slot, ctx, result)) {
            stats_.processed_count++;
            continue;
        }

        // 候補プール（ロスター順、全員の除外理由も記録）
        std::vector<const Member*> pool;
        NoCandidateError diagnostic{slot, {}};
        for (const auto& m : members) {
            auto reasons = evaluate_rules(rules_, m, slot, ctx);
            stats_.rule_check_count += rules_.size();
            if (reasons.empty()) {
                pool.push_back(&m);
            } else {
                diagnostic.eliminations[m.name] = std::move(reasons);
            }
        }

        if (pool.empty()) {
            if (verbose_) {
                std::cerr << "% [verbose] no candidate for " << slot.to_string() << "\n";
            }
            result.status = BuildStatus::NoCandidate;
            result.failure = std::move(diagnostic);
            stats_.min_pool_size = 0;
            break;
        }

        if (pool.size() < stats_.min_pool_size) {
            stats_.min_pool_size = pool.size();
        }

        const Member* selected = pool[policy_->select(pool, slot, fairness_)];
        if (verbose_) {
            auto key = score(*selected, slot, fairness_);
            std::cerr << "% [verbose] " << slot.to_string() << ": " << pool.size()
                      << " candidate(s), selected " << selected->name
                      << " (count=" << key.count << " gap="
                      << (key.gap_days ? std::to_string(*key.gap_days) : std::string("-"))
                      << ")\n";
        }
        commit(Assignment{slot, selected->name}, result);
        stats_.processed_count++;
    }

    if (stats_.min_pool_size == std::numeric_limits<size_t>::max()) {
        stats_.min_pool_size = 0;
    }
    if (verbose_) {
        std::cerr << "% [verbose] build done: " << result.assignments.size()
                  << " assignment(s)\n";
    }
    return result;
}

bool ScheduleBuilder::try_fixed(const DutySlot& slot, const RuleContext& ctx,
                                BuildResult& result) {
    auto forced = override_.fixed_assignment(slot);
    if (!forced) {
        return false;
    }
    const Member* member = problem_.find_member(*forced);
    if (!member) {
        // validate() 済みなので到達しない
        throw ConfigInconsistency("fixed pattern references unknown member '" + *forced + "'");
    }

    auto reasons = evaluate_rules(rules_, *member, slot, ctx);
    stats_.rule_check_count += rules_.size();
    if (reasons.empty()) {
        if (verbose_) {
            std::cerr << "% [verbose] " << slot.to_string() << ": fixed pattern -> "
                      << member->name << "\n";
        }
        commit(Assignment{slot, member->name}, result);
        stats_.forced_count++;
        return true;
    }

    result.notes.push_back("fixed pattern: " + member->name + " cannot take " +
                           slot.to_string() + " (" + join_reasons(reasons) +
                           "); filled by normal selection");
    stats_.fallback_count++;
    if (verbose_) {
        std::cerr << "% [verbose] " << result.notes.back() << "\n";
    }
    return false;
}

void ScheduleBuilder::commit(const Assignment& assignment, BuildResult& result) {
    committed_.commit(assignment);
    fairness_.commit(assignment);
    result.assignments.push_back(assignment);
}

} // namespace toban
