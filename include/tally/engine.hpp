// ==============================================================================
// tally/engine.hpp - Движок правил
// ==============================================================================
//
// Назначение:
// - Упорядочивание активных правил по приоритету
// - Вычисление корня каждого правила против текущего состояния транзакции
// - Атомарное выполнение действий совпавшего правила
// - Флаг stop_processing: остановка после совпадения
// - Обновление статистики правил
//
// Движок не хранит правил и не имеет глобального состояния: список правил
// передаётся в каждый вызов.
//
// ==============================================================================

#ifndef TALLY_ENGINE_HPP
#define TALLY_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <tally/action.hpp>
#include <tally/model.hpp>
#include <tally/store.hpp>
#include <tally/trigger.hpp>
#include <vector>

namespace tally::engine {

/// Результат одного вычисленного правила
struct RuleOutcome {
    model::RuleId rule_id = 0;
    std::string rule_name;
    bool matched = false;
    std::optional<action::ExecutionResult> execution;  // только при совпадении
};

/// Результат применения правил к одной транзакции
struct TransactionResult {
    model::TransactionId transaction_id = 0;
    std::vector<RuleOutcome> outcomes;  // только вычисленные правила
    std::vector<model::RuleId> matched_rules;
    std::size_t actions_applied = 0;
    std::size_t actions_failed = 0;
    bool stopped_early = false;
    std::vector<std::string> errors;  // "<rule>: <error>"

    /// Ни один пакет действий не завершился ошибкой
    bool ok() const { return errors.empty(); }
    bool matched() const { return !matched_rules.empty(); }
};

/// Активные правила, отсортированные по приоритету (стабильно)
std::vector<model::Rule*> order_rules(std::vector<model::Rule>& rules);

class RuleEngine {
public:
    explicit RuleEngine(store::Store& store, trigger::Context ctx = trigger::Context{});

    /// Применить правила к транзакции.
    /// Статистика правил обновляется и сохраняется через store.
    /// @throw store::StoreError при сбое сохранения статистики
    TransactionResult apply(std::vector<model::Rule>& rules, model::Transaction& tx) const;

    /// Применить одно правило независимо от флага active
    TransactionResult apply_rule(model::Rule& rule, model::Transaction& tx) const;

    /// Совпадает ли правило с транзакцией (без побочных эффектов)
    bool matches(const model::Rule& rule, const model::Transaction& tx) const;

    const trigger::Context& context() const { return ctx_; }

private:
    /// Вычислить правило и выполнить его действия; true при совпадении
    bool run_rule(model::Rule& rule, model::Transaction& tx, TransactionResult& result) const;

    store::Store& store_;
    trigger::Context ctx_;
};

}  // namespace tally::engine

#endif  // TALLY_ENGINE_HPP
