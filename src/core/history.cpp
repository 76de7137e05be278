#include "toban/history.hpp"
#include <algorithm>

namespace toban {

HistoryWindow::HistoryWindow(const std::vector<HistoryRecord>& records,
                             const Date& rotation_start, int months)
    : begin_(rotation_start.add_months(-months))
    , end_(rotation_start) {
    for (const auto& rec : records) {
        if (!is_valid_index(rec.shift, rec.index)) {
            throw ConfigInconsistency("history record " + rec.date.to_string() + " " +
                                      shift_name(rec.shift) + " index " +
                                      std::to_string(rec.index) + " for " + rec.member +
                                      " has no such index");
        }
        if (rec.date < begin_ || rec.date >= end_) {
            continue;
        }
        records_.push_back(rec);
    }
    std::stable_sort(records_.begin(), records_.end(),
                     [](const HistoryRecord& a, const HistoryRecord& b) {
                         return a.date < b.date;
                     });
}

HistorySummary HistoryWindow::summary(const std::string& member, ShiftType shift) const {
    HistorySummary s;
    for (const auto& rec : records_) {
        if (rec.member != member || rec.shift != shift) {
            continue;
        }
        s.count++;
        // records_ は日付昇順なので最後に見たものが最新
        s.last_date = rec.date;
        if (std::find(s.indexes.begin(), s.indexes.end(), rec.index) == s.indexes.end()) {
            s.indexes.push_back(rec.index);
        }
    }
    std::sort(s.indexes.begin(), s.indexes.end());
    return s;
}

} // namespace toban
