// ==============================================================================
// tally/rule.hpp - Загрузка книги правил (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка групп и правил из YAML-файла
// - Отбор активных правил (с учётом активности группы)
// - Lint: проверка триггеров, действий, ссылок на группы и уникальности id
// - Сериализация правил обратно в YAML
//
// Формат:
//   groups:
//     - {id: 1, name: Subscriptions, order: 1, active: true}
//   rules:
//     - id: 10
//       name: Netflix
//       group: 1
//       priority: 1
//       stop_processing: false
//       triggers:
//         match: all
//         conditions:
//           - {field: description, operator: contains, value: netflix}
//         groups: []
//       actions:
//         - {type: set_category, value: Subscriptions}
//
// ==============================================================================

#ifndef TALLY_RULE_HPP
#define TALLY_RULE_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <tally/model.hpp>
#include <tally/trigger.hpp>
#include <vector>

namespace tally::rule {

// ============================================================================
// RuleBook
// ============================================================================

struct RuleBook {
    std::vector<model::RuleGroup> groups;
    std::vector<model::Rule> rules;

    /// Активные правила в активных группах (или без группы).
    /// Порядок: по order группы, правила без группы в конце.
    /// Внутри движка правила затем стабильно сортируются по priority.
    std::vector<model::Rule> active_rules() const;

    /// Удалить группу; её правила становятся правилами без группы.
    /// @return false, если группы нет
    bool remove_group(model::GroupId id);

    model::Rule* find_rule(model::RuleId id);
    const model::Rule* find_rule(model::RuleId id) const;
    const model::RuleGroup* find_group(model::GroupId id) const;
};

// ============================================================================
// Error handling
// ============================================================================

/// Ошибка загрузки книги правил
struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    RuleBook book;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Результат lint. ok - файл прочитан; найденные проблемы в issues.
struct LintResult {
    bool ok = false;
    std::vector<trigger::Issue> issues;
    Error error;

    std::size_t error_count() const;
    std::size_t warning_count() const;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Load / lint / emit
// ============================================================================

/// Загрузить книгу правил из файла (.yml / .yaml)
LoadResult load(const std::filesystem::path& path);

/// Загрузить книгу правил из YAML-строки
LoadResult load_string(std::string_view yaml);

/// Проверить уже загруженную книгу
LintResult lint(const RuleBook& book);

/// Загрузить и проверить файл
LintResult lint(const std::filesystem::path& path);

/// Правило в формате книги (один элемент списка rules)
std::string to_yaml(const model::Rule& rule);

/// Книга целиком
std::string to_yaml(const RuleBook& book);

}  // namespace tally::rule

#endif  // TALLY_RULE_HPP
