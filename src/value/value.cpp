// ==============================================================================
// value.cpp - Базовые типы значений
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <limits>
#include <tally/value.hpp>

namespace tally::value {

// ============================================================================
// Decimal
// ============================================================================

Decimal Decimal::from_int(std::int64_t v) {
    return Decimal(v * SCALE);
}

Decimal Decimal::from_units(std::int64_t units) {
    return Decimal(units);
}

std::optional<Decimal> Decimal::parse(std::string_view s) {
    s = trim(s);
    if (s.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (s.front() == '-' || s.front() == '+') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    std::string_view int_part = s;
    std::string_view frac_part;
    auto dot = s.find('.');
    if (dot != std::string_view::npos) {
        int_part = s.substr(0, dot);
        frac_part = s.substr(dot + 1);
    }

    // Хотя бы одна цифра: "5", ".5", "5." допустимы, "." нет
    if (int_part.empty() && frac_part.empty()) {
        return std::nullopt;
    }
    if (frac_part.size() > static_cast<std::size_t>(DIGITS)) {
        return std::nullopt;
    }

    constexpr std::int64_t max_int = std::numeric_limits<std::int64_t>::max() / SCALE;
    std::int64_t whole = 0;
    for (char c : int_part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        whole = whole * 10 + (c - '0');
        if (whole > max_int) {
            return std::nullopt;
        }
    }

    std::int64_t frac = 0;
    for (char c : frac_part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        frac = frac * 10 + (c - '0');
    }
    for (std::size_t i = frac_part.size(); i < static_cast<std::size_t>(DIGITS); ++i) {
        frac *= 10;
    }

    // Целая часть проверена без дробной: сумма ещё может выйти за int64
    if (whole > (std::numeric_limits<std::int64_t>::max() - frac) / SCALE) {
        return std::nullopt;
    }
    std::int64_t units = whole * SCALE + frac;
    return Decimal(negative ? -units : units);
}

std::string Decimal::to_string() const {
    std::int64_t magnitude = units_ < 0 ? -units_ : units_;
    std::string result;
    if (units_ < 0) {
        result += '-';
    }
    result += std::to_string(magnitude / SCALE);

    std::int64_t frac = magnitude % SCALE;
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, static_cast<std::size_t>(DIGITS) - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        result += '.';
        result += digits;
    }
    return result;
}

// ============================================================================
// Date
// ============================================================================

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return table[month - 1];
}

/// Разобрать ровно count цифр начиная с pos
std::optional<int> parse_digits(std::string_view s, std::size_t pos, std::size_t count) {
    if (pos + count > s.size()) {
        return std::nullopt;
    }
    int v = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return std::nullopt;
        }
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

std::optional<Date> make_date(std::optional<int> y, std::optional<int> m, std::optional<int> d) {
    if (!y || !m || !d || !is_valid_date(*y, *m, *d)) {
        return std::nullopt;
    }
    return Date{*y, *m, *d};
}

}  // namespace

bool is_valid_date(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= days_in_month(year, month);
}

std::optional<Date> Date::parse(std::string_view s) {
    s = trim(s);
    if (s.size() < 10) {
        return std::nullopt;
    }

    // yyyy-MM-dd и ISO-8601 префикс yyyy-MM-ddT...
    if (s[4] == '-' && s[7] == '-') {
        if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') {
            return std::nullopt;
        }
        return make_date(parse_digits(s, 0, 4), parse_digits(s, 5, 2), parse_digits(s, 8, 2));
    }

    if (s.size() != 10) {
        return std::nullopt;
    }

    // dd/MM/yyyy и dd-MM-yyyy
    if ((s[2] == '/' && s[5] == '/') || (s[2] == '-' && s[5] == '-')) {
        return make_date(parse_digits(s, 6, 4), parse_digits(s, 3, 2), parse_digits(s, 0, 2));
    }

    return std::nullopt;
}

// Алгоритм days_from_civil / civil_from_days (H. Hinnant)
std::int64_t Date::days() const {
    std::int64_t y = year - (month <= 2 ? 1 : 0);
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t mp = (month + 9) % 12;
    std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(std::int64_t z) {
    z += 719468;
    std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    std::int64_t doe = z - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t y = yoe + era * 400;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
    std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return Date{static_cast<int>(m <= 2 ? y + 1 : y), static_cast<int>(m), static_cast<int>(d)};
}

Date Date::today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

// ============================================================================
// Строковые утилиты
// ============================================================================

std::string ascii_lowercase(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty())
        return true;
    if (haystack.size() < needle.size())
        return false;

    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

bool istarts_with(std::string_view str, std::string_view prefix) {
    if (str.size() < prefix.size())
        return false;
    return iequals(str.substr(0, prefix.size()), prefix);
}

bool iends_with(std::string_view str, std::string_view suffix) {
    if (str.size() < suffix.size())
        return false;
    return iequals(str.substr(str.size() - suffix.size()), suffix);
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string> split(std::string_view s, std::string_view delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.emplace_back(s);
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view delimiter) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result.append(delimiter);
        }
        result += parts[i];
    }
    return result;
}

}  // namespace tally::value
