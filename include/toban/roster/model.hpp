/**
 * @file model.hpp
 * @brief ロスター入力ファイルの中間表現
 */
#ifndef TOBAN_ROSTER_MODEL_HPP
#define TOBAN_ROSTER_MODEL_HPP

#include "toban/problem.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toban {
namespace roster {

/**
 * @brief setting 文、またはメンバー個別設定
 */
struct SettingDecl {
    std::string name;
    int64_t value = 0;
    int line = 0;
};

/**
 * @brief period 文
 */
struct PeriodDecl {
    std::string start;
    std::optional<std::string> end;
    int line = 0;
};

/**
 * @brief member 文
 */
struct MemberDecl {
    std::string name;
    std::vector<std::string> groups;   // "day12", "day3", "night1", "night2"
    bool active = true;
    std::vector<SettingDecl> overrides;
    int line = 0;
};

/**
 * @brief history 文
 */
struct HistoryDecl {
    std::string date;
    ShiftType shift = ShiftType::Day;
    int64_t index = 0;
    std::string member;
    int line = 0;
};

/**
 * @brief ng 文（member が空なら全体NG）
 */
struct NgDecl {
    std::string member;
    std::string start;
    std::optional<std::string> end;
    std::string reason;
    int line = 0;
};

/**
 * @brief fixed 文
 */
struct FixedDecl {
    std::string member;
    int64_t index = 0;
    std::string reference_date;
    int64_t cadence_days = 0;
    int line = 0;
};

/**
 * @brief ロスター入力ファイルのモデル
 */
class Model {
public:
    Model() = default;

    void set_period(PeriodDecl decl);
    void add_setting(SettingDecl decl);
    void add_member(MemberDecl decl);
    void add_history(HistoryDecl decl);
    void add_ng(NgDecl decl);
    void set_fixed(FixedDecl decl);

    const std::optional<PeriodDecl>& period() const { return period_; }
    const std::vector<SettingDecl>& settings() const { return settings_; }
    const std::vector<MemberDecl>& members() const { return members_; }
    const std::vector<HistoryDecl>& history() const { return history_; }
    const std::vector<NgDecl>& ng_decls() const { return ng_decls_; }
    const std::optional<FixedDecl>& fixed() const { return fixed_; }

    /**
     * @brief 期間を上書き（コマンドライン指定用）
     */
    void override_period(const std::optional<std::string>& start,
                         const std::optional<std::string>& end);

    /**
     * @brief コアの Problem に変換
     *
     * 日付・設定名・グループ名の解釈はここで行い、誤りは行番号付きで報告する。
     * 参照整合性の検証は Problem::validate() に任せる。
     *
     * @throws std::runtime_error 解釈できない宣言がある場合
     * @throws InvalidPeriod 期間が不正な場合
     */
    Problem to_problem() const;

private:
    std::optional<PeriodDecl> period_;
    std::vector<SettingDecl> settings_;
    std::vector<MemberDecl> members_;
    std::vector<HistoryDecl> history_;
    std::vector<NgDecl> ng_decls_;
    std::optional<FixedDecl> fixed_;
};

/**
 * @brief ロスター入力ファイルをパース
 * @param filename ファイル名
 * @return パースされたモデル
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Model> parse_file(const std::string& filename);

/**
 * @brief ロスター入力文字列をパース
 * @param input 入力文字列
 * @return パースされたモデル
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Model> parse_string(const std::string& input);

} // namespace roster
} // namespace toban

#endif // TOBAN_ROSTER_MODEL_HPP
