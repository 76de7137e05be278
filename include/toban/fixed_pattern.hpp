/**
 * @file fixed_pattern.hpp
 * @brief 指定メンバーの隔週固定配置
 */
#ifndef TOBAN_FIXED_PATTERN_HPP
#define TOBAN_FIXED_PATTERN_HPP

#include "toban/types.hpp"
#include <optional>
#include <string>

namespace toban {

/**
 * @brief 固定パターンによる強制配置の判定
 *
 * 夜勤の target_index 枠に対し、基準日から週開始日までの週数
 * floor(days / 7) が (cadence_days / 7) の倍数なら指定メンバーを返す。
 * cadence_days = 14 なら偶数週。
 */
class FixedPatternOverride {
public:
    FixedPatternOverride() = default;
    explicit FixedPatternOverride(std::optional<FixedPattern> pattern);

    bool enabled() const { return pattern_.has_value(); }
    const std::optional<FixedPattern>& pattern() const { return pattern_; }

    /**
     * @brief 枠に強制配置されるメンバー名（対象外なら nullopt）
     */
    std::optional<std::string> fixed_assignment(const DutySlot& slot) const;

    /**
     * @brief 基準日から週開始日までの週数（負方向は切り捨て）
     */
    static int64_t weeks_between(const Date& reference, const Date& week_start);

private:
    std::optional<FixedPattern> pattern_;
};

} // namespace toban

#endif // TOBAN_FIXED_PATTERN_HPP
