// ==============================================================================
// tally/action.hpp - Выполнение действий правил
// ==============================================================================
//
// Назначение:
// - Атомарное применение упорядоченного списка действий к транзакции
// - Результат по каждому действию и агрегированные счётчики
//
// Атомарность: действия изменяют рабочую копию внутри единицы работы
// хранилища. Первая ошибка откатывает всё (включая созданные категории),
// транзакция вызывающего остаётся неизменной.
//
// ==============================================================================

#ifndef TALLY_ACTION_HPP
#define TALLY_ACTION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <tally/model.hpp>
#include <tally/store.hpp>
#include <vector>

namespace tally::action {

// ============================================================================
// Errors
// ============================================================================

enum class ErrorKind {
    Validation,         // пустое или некорректное значение
    ReferenceNotFound,  // счёт не найден
    Store               // сбой хранилища
};

struct ActionError {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;

    std::string format() const;
};

std::string to_string(ErrorKind kind);

// ============================================================================
// ExecutionResult
// ============================================================================

enum class Status {
    Applied,      // выполнено и сохранено
    Failed,       // ошибка
    RolledBack,   // выполнено, но откачено из-за ошибки в другом действии
    NotAttempted  // не выполнялось (после ошибки)
};

std::string to_string(Status status);

struct ActionOutcome {
    model::ActionType type = model::ActionType::SetCategory;
    std::string value;
    Status status = Status::NotAttempted;
    std::optional<ActionError> error;
};

struct ExecutionResult {
    bool ok = false;
    std::vector<ActionOutcome> outcomes;
    std::size_t success_count = 0;  // сохранённые действия
    std::size_t failure_count = 0;

    /// Ошибка, из-за которой пакет откатился
    std::optional<ActionError> error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Execution
// ============================================================================

/// Применить действия к транзакции атомарно.
/// При успехе tx заменяется результатом и сохраняется в store.
/// При ошибке tx и store не изменяются.
ExecutionResult execute(const std::vector<model::RuleAction>& actions, model::Transaction& tx,
                        store::Store& store);

/// Применить одно действие к рабочей копии (без единицы работы).
/// Возвращает ошибку или nullopt. Используется execute().
std::optional<ActionError> apply(const model::RuleAction& action, model::Transaction& working,
                                 store::Store& store);

}  // namespace tally::action

#endif  // TALLY_ACTION_HPP
