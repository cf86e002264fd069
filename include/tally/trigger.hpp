// ==============================================================================
// tally/trigger.hpp - Вычисление триггеров и групп триггеров
// ==============================================================================
//
// Назначение:
// - evaluate(): один триггер против транзакции
// - evaluate_group(): рекурсивное AND/OR дерево с коротким замыканием
// - validate(): статическая проверка триггеров для lint
//
// Вычисление никогда не бросает исключений. Значение, которое не удалось
// разобрать как число или дату, даёт false. Строковые операторы не учитывают
// регистр.
//
// ==============================================================================

#ifndef TALLY_TRIGGER_HPP
#define TALLY_TRIGGER_HPP

#include <string>
#include <tally/model.hpp>
#include <tally/value.hpp>
#include <vector>

namespace tally::trigger {

/// Контекст вычисления: "сегодня" для относительных операторов дат
struct Context {
    value::Date today = value::Date::today();
};

// ============================================================================
// Evaluation
// ============================================================================

/// Вычислить один триггер (с учётом negate)
bool evaluate(const model::Trigger& trigger, const model::Transaction& tx,
              const Context& ctx = Context{});

/// Вычислить группу триггеров
///   пустая AND-группа -> true, пустая OR-группа -> false
///   сначала листовые триггеры по порядку, затем вложенные группы
bool evaluate_group(const model::TriggerGroup& group, const model::Transaction& tx,
                    const Context& ctx = Context{});

/// Вычислить корень правила. Правило без корня не совпадает ни с чем.
bool evaluate_rule(const model::Rule& rule, const model::Transaction& tx,
                   const Context& ctx = Context{});

// ============================================================================
// Validation
// ============================================================================

enum class Severity { Warning, Error };

struct Issue {
    Severity severity = Severity::Error;
    std::string message;
};

/// Требует ли оператор значения
bool requires_value(model::TriggerOperator op);

/// Допустим ли оператор для поля
bool is_compatible(model::TriggerField field, model::TriggerOperator op);

/// Проверить триггер: совместимость поля и оператора, наличие значения,
/// корректность regex, числа, даты и границ between
std::vector<Issue> validate(const model::Trigger& trigger);

/// Проверить всё дерево (путь к триггеру добавляется в сообщение)
std::vector<Issue> validate(const model::TriggerGroup& group);

/// Регулярные выражения кэшируются (не более 1000 записей).
/// Очистка кэша, используется в тестах.
void clear_regex_cache();

}  // namespace tally::trigger

#endif  // TALLY_TRIGGER_HPP
