/**
 * @file builder.hpp
 * @brief スケジュール構築エンジン（グリーディ、単一パス、バックトラックなし）
 */
#ifndef TOBAN_BUILDER_HPP
#define TOBAN_BUILDER_HPP

#include "toban/calendar.hpp"
#include "toban/fixed_pattern.hpp"
#include "toban/problem.hpp"
#include "toban/rules.hpp"
#include "toban/scorer.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toban {

/**
 * @brief 構築結果の状態
 */
enum class BuildStatus {
    Complete,     // 全枠を割り当てた
    NoCandidate,  // 候補者のいない枠で停止
    Stopped       // 枠の間で中断された
};

/**
 * @brief 候補者がいない枠の診断情報
 *
 * ロスター全員について、候補から外れた理由をすべて列挙する。
 */
struct NoCandidateError {
    DutySlot slot;
    std::map<std::string, std::vector<Elimination>> eliminations;

    /**
     * @brief 人が読むための複数行メッセージ
     */
    std::string message() const;
};

/**
 * @brief 構築統計情報
 */
struct BuildStats {
    size_t slot_count = 0;
    size_t processed_count = 0;
    size_t forced_count = 0;     // 固定パターンで確定した枠
    size_t fallback_count = 0;   // 固定パターンが制約で通常選択に戻った枠
    size_t rule_check_count = 0;
    size_t min_pool_size = 0;    // 処理した枠の最小候補数
};

/**
 * @brief 構築結果
 *
 * 失敗・中断時も、それまでに確定した割当はそのまま保持する。
 */
struct BuildResult {
    BuildStatus status = BuildStatus::Complete;
    std::vector<Assignment> assignments;
    std::optional<NoCandidateError> failure;
    std::vector<std::string> notes;

    bool ok() const { return status == BuildStatus::Complete; }
};

/**
 * @brief スケジュール構築エンジン
 *
 * 枠列を先頭から1枠ずつ処理する:
 * 1. 固定パターン判定（制約を満たせば確定して次へ）
 * 2. 候補プール = 全メンバー − 除外ルール − index 不可 − 最小間隔未満
 * 3. 空なら全員分の除外理由を付けて停止
 * 4. 選択ポリシーで1人選んで確定し、公平性状態を更新
 *
 * build() は呼び出しごとに状態を作り直すため、同じ入力なら同じ結果になる。
 */
class ScheduleBuilder {
public:
    /**
     * @brief 入力を検証して構築エンジンを作成
     * @throws InvalidPeriod 期間が不正な場合
     * @throws ConfigInconsistency 設定間に不整合がある場合
     */
    explicit ScheduleBuilder(Problem problem);

    /**
     * @brief スケジュールを構築
     */
    BuildResult build();

    const Problem& problem() const { return problem_; }

    /**
     * @brief 選択ポリシーを差し替える（既定は FairnessPolicy）
     */
    void set_policy(SelectionPolicyPtr policy) { policy_ = std::move(policy); }

    /**
     * @brief 統計情報を取得（直近の build() のもの）
     */
    const BuildStats& stats() const { return stats_; }

    /**
     * @brief 直近の build() 終了時点の公平性状態
     */
    const FairnessState& fairness() const { return fairness_; }

    /**
     * @brief 構築を中断する（シグナルハンドラから呼び出し可能、枠の間で反映）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 中断フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief 固定パターンの枠を処理
     * @return 確定したら true
     */
    bool try_fixed(const DutySlot& slot, const RuleContext& ctx, BuildResult& result);

    /**
     * @brief 確定処理（割当記録と公平性状態の更新）
     */
    void commit(const Assignment& assignment, BuildResult& result);

    Problem problem_;
    FixedPatternOverride override_;
    std::vector<RulePtr> rules_;
    SelectionPolicyPtr policy_;

    // build() ごとに作り直す状態
    CommitLog committed_;
    FairnessState fairness_;

    BuildStats stats_;
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;
};

} // namespace toban

#endif // TOBAN_BUILDER_HPP
