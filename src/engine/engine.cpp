// ==============================================================================
// engine.cpp - Движок правил
// ==============================================================================

#include <algorithm>
#include <tally/engine.hpp>

namespace tally::engine {

std::vector<model::Rule*> order_rules(std::vector<model::Rule>& rules) {
    std::vector<model::Rule*> ordered;
    ordered.reserve(rules.size());
    for (auto& rule : rules) {
        if (rule.active) {
            ordered.push_back(&rule);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const model::Rule* a, const model::Rule* b) {
                         return a->priority < b->priority;
                     });
    return ordered;
}

RuleEngine::RuleEngine(store::Store& store, trigger::Context ctx)
    : store_(store), ctx_(ctx) {}

bool RuleEngine::matches(const model::Rule& rule, const model::Transaction& tx) const {
    return trigger::evaluate_rule(rule, tx, ctx_);
}

bool RuleEngine::run_rule(model::Rule& rule, model::Transaction& tx,
                          TransactionResult& result) const {
    RuleOutcome outcome;
    outcome.rule_id = rule.id;
    outcome.rule_name = rule.name;
    outcome.matched = matches(rule, tx);
    ++rule.stats.total_evaluations;

    if (!outcome.matched) {
        result.outcomes.push_back(std::move(outcome));
        return false;
    }

    result.matched_rules.push_back(rule.id);
    auto execution = action::execute(rule.actions, tx, store_);
    if (execution.ok) {
        ++rule.stats.match_count;
        rule.stats.last_matched_at = ctx_.today;
        result.actions_applied += execution.success_count;
    } else {
        ++rule.stats.error_count;
        result.actions_failed += execution.failure_count;
        std::string message = execution.error ? execution.error->format() : "action failed";
        result.errors.push_back(rule.name + ": " + message);
    }
    outcome.execution = std::move(execution);
    result.outcomes.push_back(std::move(outcome));

    store_.persist_rule_statistics(rule.id, rule.stats);
    return true;
}

TransactionResult RuleEngine::apply(std::vector<model::Rule>& rules,
                                    model::Transaction& tx) const {
    TransactionResult result;
    result.transaction_id = tx.id;

    for (model::Rule* rule : order_rules(rules)) {
        bool matched = run_rule(*rule, tx, result);
        // Остановка по совпадению, даже если действия не выполнились
        if (matched && rule->stop_processing) {
            result.stopped_early = true;
            break;
        }
    }
    return result;
}

TransactionResult RuleEngine::apply_rule(model::Rule& rule, model::Transaction& tx) const {
    TransactionResult result;
    result.transaction_id = tx.id;
    run_rule(rule, tx, result);
    return result;
}

}  // namespace tally::engine
