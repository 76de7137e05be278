/**
 * @file date.hpp
 * @brief 暦日クラス（グレゴリオ暦、日単位の演算）
 */
#ifndef TOBAN_DATE_HPP
#define TOBAN_DATE_HPP

#include <cstdint>
#include <string>

namespace toban {

/**
 * @brief 曜日（ISO 順、月曜 = 0）
 */
enum class Weekday {
    Monday = 0,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday
};

/**
 * @brief 暦日
 *
 * 1970-01-01 からの通算日数で保持する値型。
 * 加減算・比較は通算日数の整数演算で行う。
 */
class Date {
public:
    using serial_type = int64_t;

    Date() = default;

    /**
     * @brief 年月日から作成
     * @throws std::invalid_argument 存在しない日付の場合
     */
    Date(int year, int month, int day);

    /**
     * @brief 通算日数から作成
     */
    static Date from_serial(serial_type serial);

    /**
     * @brief YYYY-MM-DD 形式の文字列をパース
     * @throws std::invalid_argument 形式不正・存在しない日付の場合
     */
    static Date parse(const std::string& text);

    int year() const;
    int month() const;
    int day() const;

    serial_type serial() const { return serial_; }

    Weekday weekday() const;

    bool is_weekend() const {
        auto wd = weekday();
        return wd == Weekday::Saturday || wd == Weekday::Sunday;
    }

    /**
     * @brief n ヶ月後の同日（存在しなければ月末に丸める）
     */
    Date add_months(int months) const;

    /**
     * @brief YYYY-MM-DD 形式の文字列
     */
    std::string to_string() const;

    Date operator+(int64_t days) const { return from_serial(serial_ + days); }
    Date operator-(int64_t days) const { return from_serial(serial_ - days); }
    Date& operator+=(int64_t days) { serial_ += days; return *this; }

    /**
     * @brief 日付の差（日数）
     */
    int64_t operator-(const Date& other) const { return serial_ - other.serial_; }

    bool operator==(const Date& other) const { return serial_ == other.serial_; }
    bool operator!=(const Date& other) const { return serial_ != other.serial_; }
    bool operator<(const Date& other) const { return serial_ < other.serial_; }
    bool operator<=(const Date& other) const { return serial_ <= other.serial_; }
    bool operator>(const Date& other) const { return serial_ > other.serial_; }
    bool operator>=(const Date& other) const { return serial_ >= other.serial_; }

private:
    serial_type serial_ = 0;
};

/**
 * @brief 月の日数
 */
int days_in_month(int year, int month);

/**
 * @brief 曜日の短縮名（"Mon" など）
 */
const char* weekday_name(Weekday wd);

} // namespace toban

#endif // TOBAN_DATE_HPP
