// ==============================================================================
// trigger.cpp - Вычисление триггеров и групп триггеров
// ==============================================================================

#include <functional>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <tally/field.hpp>
#include <tally/trigger.hpp>
#include <type_traits>
#include <unordered_map>

namespace tally::trigger {

using field::CategoryValue;
using field::TypedValue;
using model::TransactionKind;
using model::TriggerField;
using model::TriggerOperator;
using value::Date;
using value::Decimal;

// ============================================================================
// Regex cache
// ============================================================================

namespace {

constexpr std::size_t REGEX_CACHE_LIMIT = 1000;

struct RegexCache {
    std::mutex mutex;
    // nullptr - шаблон не компилируется
    std::unordered_map<std::string, std::shared_ptr<const std::regex>> entries;
};

RegexCache& regex_cache() {
    static RegexCache cache;
    return cache;
}

/// Флаг "(?i)" не поддерживается ECMAScript, регистр и так игнорируется
std::string_view strip_inline_flags(std::string_view pattern) {
    constexpr std::string_view icase_flag = "(?i)";
    if (pattern.substr(0, icase_flag.size()) == icase_flag) {
        pattern.remove_prefix(icase_flag.size());
    }
    return pattern;
}

std::shared_ptr<const std::regex> compile_regex(const std::string& pattern) {
    auto& cache = regex_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);

    auto it = cache.entries.find(pattern);
    if (it != cache.entries.end()) {
        return it->second;
    }
    if (cache.entries.size() >= REGEX_CACHE_LIMIT) {
        cache.entries.clear();
    }

    std::shared_ptr<const std::regex> compiled;
    try {
        auto body = strip_inline_flags(pattern);
        compiled = std::make_shared<const std::regex>(
            body.begin(), body.end(), std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error&) {
        compiled = nullptr;
    }
    cache.entries.emplace(pattern, compiled);
    return compiled;
}

// ============================================================================
// Разбор значений
// ============================================================================

std::optional<TransactionKind> try_parse_kind(std::string_view s) {
    try {
        return model::parse_kind(s);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

/// Границы between: "low..high"
std::optional<std::pair<std::string, std::string>> split_between(std::string_view v) {
    auto pos = v.find(model::BETWEEN_SEPARATOR);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(value::trim(v.substr(0, pos))),
                          std::string(value::trim(v.substr(pos + model::BETWEEN_SEPARATOR.size()))));
}

/// Дата значения поля: сама дата или дата, разобранная из текста
std::optional<Date> date_of(const TypedValue& v) {
    if (auto d = std::get_if<Date>(&v)) {
        return *d;
    }
    if (auto s = std::get_if<std::string>(&v)) {
        return Date::parse(*s);
    }
    return std::nullopt;
}

/// Число значения поля: сумма или число, разобранное из текста
std::optional<Decimal> number_of(const TypedValue& v) {
    if (auto n = std::get_if<Decimal>(&v)) {
        return *n;
    }
    if (auto s = std::get_if<std::string>(&v)) {
        return Decimal::parse(*s);
    }
    return std::nullopt;
}

template <typename T>
bool apply_ordering(const T& lhs, const T& rhs, TriggerOperator op) {
    switch (op) {
    case TriggerOperator::GreaterThan:
    case TriggerOperator::After:
        return lhs > rhs;
    case TriggerOperator::LessThan:
    case TriggerOperator::Before:
        return lhs < rhs;
    case TriggerOperator::GreaterThanOrEqual:
        return lhs >= rhs;
    case TriggerOperator::LessThanOrEqual:
        return lhs <= rhs;
    case TriggerOperator::Equals:
    case TriggerOperator::On:
        return lhs == rhs;
    default:
        return false;
    }
}

// ============================================================================
// Операторы
// ============================================================================

bool is_empty_value(const TypedValue& v) {
    if (auto s = std::get_if<std::string>(&v)) {
        return value::trim(*s).empty();
    }
    if (auto c = std::get_if<CategoryValue>(&v)) {
        return !c->assigned;
    }
    return false;
}

/// Числовое сравнение. Для суммы неотрицательная граница сравнивается
/// с модулем суммы, отрицательная - со знаковым значением.
bool compare_numbers(const TypedValue& v, const std::vector<Decimal>& bounds,
                     const std::function<bool(Decimal)>& predicate) {
    auto lhs = number_of(v);
    if (!lhs) {
        return false;
    }
    bool magnitude = std::holds_alternative<Decimal>(v);
    for (const auto& b : bounds) {
        if (b.is_negative()) {
            magnitude = false;
        }
    }
    return predicate(magnitude ? lhs->abs() : *lhs);
}

bool evaluate_ordering(const TypedValue& v, const std::string& raw, TriggerOperator op) {
    if (std::holds_alternative<Date>(v)) {
        auto rhs = Date::parse(raw);
        return rhs && apply_ordering(std::get<Date>(v), *rhs, op);
    }
    auto rhs = Decimal::parse(raw);
    if (!rhs) {
        return false;
    }
    return compare_numbers(v, {*rhs}, [&](Decimal lhs) { return apply_ordering(lhs, *rhs, op); });
}

bool evaluate_equals(const TypedValue& v, const std::string& raw) {
    return std::visit(
        [&](const auto& val) -> bool {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return value::iequals(value::trim(val), value::trim(raw));
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return evaluate_ordering(v, raw, TriggerOperator::Equals);
            } else if constexpr (std::is_same_v<T, Date>) {
                auto rhs = Date::parse(raw);
                return rhs && val == *rhs;
            } else if constexpr (std::is_same_v<T, CategoryValue>) {
                return value::iequals(val.name, value::trim(raw));
            } else {
                if (auto kind = try_parse_kind(raw)) {
                    return val == *kind;
                }
                return value::iequals(model::to_string(val), value::trim(raw));
            }
        },
        v);
}

bool evaluate_between(const TypedValue& v, const std::string& raw) {
    auto bounds = split_between(raw);
    if (!bounds) {
        return false;
    }
    if (auto d = std::get_if<Date>(&v)) {
        auto low = Date::parse(bounds->first);
        auto high = Date::parse(bounds->second);
        return low && high && *low <= *d && *d <= *high;
    }
    auto low = Decimal::parse(bounds->first);
    auto high = Decimal::parse(bounds->second);
    if (!low || !high) {
        return false;
    }
    return compare_numbers(v, {*low, *high},
                           [&](Decimal lhs) { return *low <= lhs && lhs <= *high; });
}

bool evaluate_relative_date(const TypedValue& v, const Date& expected) {
    auto d = date_of(v);
    return d && *d == expected;
}

bool evaluate_raw(const model::Trigger& trigger, const TypedValue& v, const Context& ctx) {
    switch (trigger.op) {
    case TriggerOperator::IsEmpty:
        return is_empty_value(v);
    case TriggerOperator::IsNotEmpty:
        return !is_empty_value(v);
    case TriggerOperator::Contains:
        return value::icontains(field::to_text(v), trigger.value);
    case TriggerOperator::StartsWith:
        return value::istarts_with(field::to_text(v), trigger.value);
    case TriggerOperator::EndsWith:
        return value::iends_with(field::to_text(v), trigger.value);
    case TriggerOperator::Matches: {
        auto re = compile_regex(trigger.value);
        return re && std::regex_search(field::to_text(v), *re);
    }
    case TriggerOperator::Equals:
        return evaluate_equals(v, trigger.value);
    case TriggerOperator::GreaterThan:
    case TriggerOperator::LessThan:
    case TriggerOperator::GreaterThanOrEqual:
    case TriggerOperator::LessThanOrEqual:
        return evaluate_ordering(v, trigger.value, trigger.op);
    case TriggerOperator::Between:
        return evaluate_between(v, trigger.value);
    case TriggerOperator::Before:
    case TriggerOperator::After:
    case TriggerOperator::On: {
        auto lhs = date_of(v);
        auto rhs = Date::parse(trigger.value);
        return lhs && rhs && apply_ordering(*lhs, *rhs, trigger.op);
    }
    case TriggerOperator::Today:
        return evaluate_relative_date(v, ctx.today);
    case TriggerOperator::Yesterday:
        return evaluate_relative_date(v, ctx.today.add_days(-1));
    case TriggerOperator::Tomorrow:
        return evaluate_relative_date(v, ctx.today.add_days(1));
    }
    return false;
}

}  // namespace

// ============================================================================
// Evaluation
// ============================================================================

bool evaluate(const model::Trigger& trigger, const model::Transaction& tx, const Context& ctx) {
    TypedValue v = field::extract(trigger.field, tx);
    bool raw = evaluate_raw(trigger, v, ctx);
    return trigger.negate ? !raw : raw;
}

bool evaluate_group(const model::TriggerGroup& group, const model::Transaction& tx,
                    const Context& ctx) {
    if (group.combinator == model::Combinator::All) {
        for (const auto& t : group.triggers) {
            if (!evaluate(t, tx, ctx)) {
                return false;
            }
        }
        for (const auto& g : group.groups) {
            if (!evaluate_group(g, tx, ctx)) {
                return false;
            }
        }
        return true;
    }

    for (const auto& t : group.triggers) {
        if (evaluate(t, tx, ctx)) {
            return true;
        }
    }
    for (const auto& g : group.groups) {
        if (evaluate_group(g, tx, ctx)) {
            return true;
        }
    }
    return false;
}

bool evaluate_rule(const model::Rule& rule, const model::Transaction& tx, const Context& ctx) {
    if (!rule.root) {
        return false;
    }
    return evaluate_group(*rule.root, tx, ctx);
}

void clear_regex_cache() {
    auto& cache = regex_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    cache.entries.clear();
}

// ============================================================================
// Validation
// ============================================================================

bool requires_value(TriggerOperator op) {
    switch (op) {
    case TriggerOperator::IsEmpty:
    case TriggerOperator::IsNotEmpty:
    case TriggerOperator::Today:
    case TriggerOperator::Yesterday:
    case TriggerOperator::Tomorrow:
        return false;
    default:
        return true;
    }
}

bool is_compatible(TriggerField f, TriggerOperator op) {
    bool presence = op == TriggerOperator::IsEmpty || op == TriggerOperator::IsNotEmpty;
    bool text_op = op == TriggerOperator::Contains || op == TriggerOperator::StartsWith ||
                   op == TriggerOperator::EndsWith || op == TriggerOperator::Equals ||
                   op == TriggerOperator::Matches;
    bool ordering = op == TriggerOperator::GreaterThan || op == TriggerOperator::LessThan ||
                    op == TriggerOperator::GreaterThanOrEqual ||
                    op == TriggerOperator::LessThanOrEqual || op == TriggerOperator::Between;
    bool date_op = op == TriggerOperator::Before || op == TriggerOperator::After ||
                   op == TriggerOperator::On || op == TriggerOperator::Today ||
                   op == TriggerOperator::Yesterday || op == TriggerOperator::Tomorrow;

    switch (field::field_type(f)) {
    case field::FieldType::Number:
        return presence || ordering || op == TriggerOperator::Equals;
    case field::FieldType::Date:
        return presence || ordering || date_op || op == TriggerOperator::Equals;
    case field::FieldType::Text:
    case field::FieldType::Category:
    case field::FieldType::Kind:
        return presence || text_op;
    }
    return false;
}

std::vector<Issue> validate(const model::Trigger& trigger) {
    std::vector<Issue> issues;
    const std::string subject = model::to_string(trigger.field) + " " +
                                model::to_string(trigger.op);

    if (!is_compatible(trigger.field, trigger.op)) {
        issues.push_back({Severity::Error, subject + ": operator is not valid for this field"});
        return issues;
    }

    if (!requires_value(trigger.op)) {
        if (!value::trim(trigger.value).empty()) {
            issues.push_back({Severity::Warning, subject + ": value is ignored"});
        }
        return issues;
    }

    if (value::trim(trigger.value).empty()) {
        issues.push_back({Severity::Error, subject + ": value is required"});
        return issues;
    }

    const auto type = field::field_type(trigger.field);
    switch (trigger.op) {
    case TriggerOperator::Matches:
        if (!compile_regex(trigger.value)) {
            issues.push_back({Severity::Error, subject + ": invalid regular expression '" +
                                                   trigger.value + "'"});
        }
        break;
    case TriggerOperator::Between: {
        auto bounds = split_between(trigger.value);
        if (!bounds) {
            issues.push_back({Severity::Error, subject + ": expected 'low" +
                                                   std::string(model::BETWEEN_SEPARATOR) +
                                                   "high'"});
            break;
        }
        if (type == field::FieldType::Date) {
            auto low = Date::parse(bounds->first);
            auto high = Date::parse(bounds->second);
            if (!low || !high) {
                issues.push_back({Severity::Error, subject + ": invalid date bounds"});
            } else if (*high < *low) {
                issues.push_back({Severity::Error, subject + ": lower bound exceeds upper bound"});
            }
        } else {
            auto low = Decimal::parse(bounds->first);
            auto high = Decimal::parse(bounds->second);
            if (!low || !high) {
                issues.push_back({Severity::Error, subject + ": invalid numeric bounds"});
            } else if (*high < *low) {
                issues.push_back({Severity::Error, subject + ": lower bound exceeds upper bound"});
            }
        }
        break;
    }
    case TriggerOperator::Before:
    case TriggerOperator::After:
    case TriggerOperator::On:
        if (!Date::parse(trigger.value)) {
            issues.push_back({Severity::Error, subject + ": invalid date '" + trigger.value + "'"});
        }
        break;
    case TriggerOperator::Equals:
    case TriggerOperator::GreaterThan:
    case TriggerOperator::LessThan:
    case TriggerOperator::GreaterThanOrEqual:
    case TriggerOperator::LessThanOrEqual:
        if (type == field::FieldType::Number && !Decimal::parse(trigger.value)) {
            issues.push_back({Severity::Error, subject + ": invalid number '" + trigger.value + "'"});
        } else if (type == field::FieldType::Date && !Date::parse(trigger.value)) {
            issues.push_back({Severity::Error, subject + ": invalid date '" + trigger.value + "'"});
        } else if (type == field::FieldType::Kind && trigger.op == TriggerOperator::Equals &&
                   !try_parse_kind(trigger.value)) {
            issues.push_back({Severity::Warning,
                              subject + ": unknown transaction type '" + trigger.value + "'"});
        }
        break;
    default:
        break;
    }
    return issues;
}

namespace {

void validate_into(const model::TriggerGroup& group, const std::string& path,
                   std::vector<Issue>& out) {
    for (std::size_t i = 0; i < group.triggers.size(); ++i) {
        for (auto& issue : validate(group.triggers[i])) {
            issue.message = path + ".conditions[" + std::to_string(i) + "]: " + issue.message;
            out.push_back(std::move(issue));
        }
    }
    for (std::size_t i = 0; i < group.groups.size(); ++i) {
        validate_into(group.groups[i], path + ".groups[" + std::to_string(i) + "]", out);
    }
}

}  // namespace

std::vector<Issue> validate(const model::TriggerGroup& group) {
    std::vector<Issue> issues;
    validate_into(group, "triggers", issues);
    return issues;
}

}  // namespace tally::trigger
