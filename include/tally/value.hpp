// ==============================================================================
// tally/value.hpp - Базовые типы значений
// ==============================================================================
//
// Назначение:
// - Decimal: точное число с фиксированной точкой (суммы транзакций)
// - Date: календарная дата с гранулярностью в один день
// - Строковые утилиты без учёта регистра (ASCII)
//
// Decimal хранит значение как int64 в миллионных долях. Плавающая точка
// нигде не используется: сравнение сумм всегда точное.
//
// ==============================================================================

#ifndef TALLY_VALUE_HPP
#define TALLY_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::value {

// ============================================================================
// Decimal
// ============================================================================

class Decimal {
public:
    /// Число знаков после запятой
    static constexpr int DIGITS = 6;
    /// Масштаб: 10^DIGITS
    static constexpr std::int64_t SCALE = 1000000;

    Decimal() = default;

    /// Из целого числа (1500 -> 1500.000000)
    static Decimal from_int(std::int64_t v);

    /// Из сырых единиц (миллионных долей)
    static Decimal from_units(std::int64_t units);

    /// Разобрать строку вида "-1500", "4.50", "+0.5"
    /// Возвращает nullopt при синтаксической ошибке, переполнении или
    /// более чем DIGITS знаках после точки.
    static std::optional<Decimal> parse(std::string_view s);

    std::int64_t units() const { return units_; }

    Decimal abs() const { return Decimal(units_ < 0 ? -units_ : units_); }
    Decimal negated() const { return Decimal(-units_); }
    bool is_negative() const { return units_ < 0; }
    bool is_zero() const { return units_ == 0; }

    /// Каноническое представление без хвостовых нулей: "-1500", "4.5"
    std::string to_string() const;

    friend bool operator==(Decimal a, Decimal b) { return a.units_ == b.units_; }
    friend bool operator!=(Decimal a, Decimal b) { return a.units_ != b.units_; }
    friend bool operator<(Decimal a, Decimal b) { return a.units_ < b.units_; }
    friend bool operator<=(Decimal a, Decimal b) { return a.units_ <= b.units_; }
    friend bool operator>(Decimal a, Decimal b) { return a.units_ > b.units_; }
    friend bool operator>=(Decimal a, Decimal b) { return a.units_ >= b.units_; }

private:
    explicit Decimal(std::int64_t units) : units_(units) {}

    std::int64_t units_ = 0;
};

// ============================================================================
// Date
// ============================================================================

/// Календарная дата (пролептический григорианский календарь)
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Разобрать дату. Поддерживаемые форматы:
    ///   yyyy-MM-dd, dd/MM/yyyy, dd-MM-yyyy, yyyy-MM-ddT... (ISO-8601)
    static std::optional<Date> parse(std::string_view s);

    /// Дата по числу дней от 1970-01-01
    static Date from_days(std::int64_t days);

    /// Текущая локальная дата
    static Date today();

    /// Число дней от 1970-01-01 (может быть отрицательным)
    std::int64_t days() const;

    Date add_days(std::int64_t n) const { return from_days(days() + n); }

    /// Формат yyyy-MM-dd
    std::string to_string() const;

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) { return a.days() < b.days(); }
    friend bool operator<=(const Date& a, const Date& b) { return a.days() <= b.days(); }
    friend bool operator>(const Date& a, const Date& b) { return a.days() > b.days(); }
    friend bool operator>=(const Date& a, const Date& b) { return a.days() >= b.days(); }
};

/// Проверка корректности календарной даты
bool is_valid_date(int year, int month, int day);

// ============================================================================
// Строковые утилиты (ASCII, без учёта регистра)
// ============================================================================

std::string ascii_lowercase(std::string_view str);
bool iequals(std::string_view a, std::string_view b);
bool icontains(std::string_view haystack, std::string_view needle);
bool istarts_with(std::string_view str, std::string_view prefix);
bool iends_with(std::string_view str, std::string_view suffix);

/// Убрать пробельные символы по краям
std::string_view trim(std::string_view s);

/// Разбить строку по разделителю (пустые части сохраняются)
std::vector<std::string> split(std::string_view s, std::string_view delimiter);

/// Склеить части через разделитель
std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

}  // namespace tally::value

#endif  // TALLY_VALUE_HPP
