#include "toban/roster/model.hpp"
#include "toban/calendar.hpp"
#include <cstdint>
#include <stdexcept>

namespace toban {
namespace roster {

namespace {

[[noreturn]] void fail(int line, const std::string& what) {
    throw std::runtime_error("line " + std::to_string(line) + ": " + what);
}

Date to_date(const std::string& text, int line) {
    try {
        return Date::parse(text);
    } catch (const std::invalid_argument& e) {
        fail(line, e.what());
    }
}

// 範囲を確かめてから int に縮める
int to_bounded(int64_t value, int64_t lo, int64_t hi, const std::string& what, int line) {
    if (value < lo || value > hi) {
        fail(line, "value " + std::to_string(value) + " for " + what + " is out of range");
    }
    return static_cast<int>(value);
}

int to_int(const SettingDecl& decl) {
    return to_bounded(decl.value, 0, 3650, "'" + decl.name + "'", decl.line);
}

IndexGroup to_group(const std::string& name, int line) {
    if (name == "day12") return IndexGroup::DayIndex12;
    if (name == "day3") return IndexGroup::DayIndex3;
    if (name == "night1") return IndexGroup::NightIndex1;
    if (name == "night2") return IndexGroup::NightIndex2;
    fail(line, "unknown index group '" + name + "' (expected day12, day3, night1, night2)");
}

} // namespace

void Model::set_period(PeriodDecl decl) {
    period_ = std::move(decl);
}

void Model::add_setting(SettingDecl decl) {
    settings_.push_back(std::move(decl));
}

void Model::add_member(MemberDecl decl) {
    members_.push_back(std::move(decl));
}

void Model::add_history(HistoryDecl decl) {
    history_.push_back(std::move(decl));
}

void Model::add_ng(NgDecl decl) {
    ng_decls_.push_back(std::move(decl));
}

void Model::set_fixed(FixedDecl decl) {
    fixed_ = std::move(decl);
}

void Model::override_period(const std::optional<std::string>& start,
                            const std::optional<std::string>& end) {
    if (!start && !end) {
        return;
    }
    if (!period_) {
        period_ = PeriodDecl{};
    }
    if (start) {
        period_->start = *start;
        // 開始日だけ指定された場合は終了日を暗黙に戻す
        if (!end) period_->end.reset();
    }
    if (end) {
        period_->end = *end;
    }
}

Problem Model::to_problem() const {
    Problem problem;

    // 期間
    if (!period_ || period_->start.empty()) {
        throw std::runtime_error("no period given (add 'period YYYY-MM-DD;' or use --start)");
    }
    Date start = to_date(period_->start, period_->line);
    std::optional<Date> end;
    if (period_->end) {
        end = to_date(*period_->end, period_->line);
    }
    problem.period = make_period(start, end);

    // 全体設定
    for (const auto& s : settings_) {
        auto& st = problem.settings;
        if (s.name == "min_interval_day") {
            st.min_interval_day = to_int(s);
        } else if (s.name == "min_interval_night") {
            st.min_interval_night = to_int(s);
        } else if (s.name == "min_interval_day_index3") {
            st.min_interval_day_index3 = to_int(s);
        } else if (s.name == "cooldown_days") {
            st.cooldown_days = to_int(s);
        } else if (s.name == "history_months") {
            st.history_months = to_int(s);
        } else if (s.name == "skip_global_holidays") {
            st.skip_global_holidays = s.value != 0;
        } else {
            fail(s.line, "unknown setting '" + s.name + "'");
        }
    }

    // メンバー
    for (const auto& decl : members_) {
        Member m;
        m.name = decl.name;
        m.active = decl.active;
        bool has_day = false;
        bool has_night = false;
        for (const auto& g : decl.groups) {
            IndexGroup group = to_group(g, decl.line);
            bool is_day = (group == IndexGroup::DayIndex12 || group == IndexGroup::DayIndex3);
            bool& seen = is_day ? has_day : has_night;
            if (seen) {
                fail(decl.line, "member '" + decl.name + "' has more than one " +
                                (is_day ? "day" : "night") + " index group");
            }
            seen = true;
            m.groups.push_back(group);
        }
        for (const auto& o : decl.overrides) {
            if (o.name == "min_interval_day") {
                m.min_interval_day = to_int(o);
            } else if (o.name == "min_interval_night") {
                m.min_interval_night = to_int(o);
            } else {
                fail(o.line, "unknown member setting '" + o.name + "'");
            }
        }
        problem.members.push_back(std::move(m));
    }

    // 過去実績
    for (const auto& h : history_) {
        if (h.index < 1 || h.index > 3 || !is_valid_index(h.shift, static_cast<int>(h.index))) {
            fail(h.line, std::string(shift_name(h.shift)) + " index " +
                         std::to_string(h.index) + " does not exist");
        }
        problem.history.push_back(
            HistoryRecord{to_date(h.date, h.line), h.shift, static_cast<int>(h.index), h.member});
    }

    // NG日
    for (const auto& ng : ng_decls_) {
        Date first = to_date(ng.start, ng.line);
        if (ng.member.empty()) {
            Date last = ng.end ? to_date(*ng.end, ng.line) : first;
            if (last < first) {
                fail(ng.line, "global NG range ends before it starts");
            }
            for (Date d = first; d <= last; d += 1) {
                problem.ng_rules.global.push_back(d);
            }
        } else if (ng.end) {
            problem.ng_rules.by_period[ng.member].push_back(
                NgPeriod{first, to_date(*ng.end, ng.line), ng.reason});
        } else {
            problem.ng_rules.by_member[ng.member].push_back(first);
        }
    }

    // 固定パターン
    if (fixed_) {
        FixedPattern fp;
        fp.member = fixed_->member;
        fp.target_index = to_bounded(fixed_->index, 1, 2, "fixed night index", fixed_->line);
        fp.reference_date = to_date(fixed_->reference_date, fixed_->line);
        fp.cadence_days = to_bounded(fixed_->cadence_days, 0, 3650, "fixed cadence",
                                     fixed_->line);
        problem.fixed_pattern = fp;
    }

    return problem;
}

} // namespace roster
} // namespace toban
