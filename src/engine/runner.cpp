// ==============================================================================
// runner.cpp - Пакетное применение правил
// ==============================================================================

#include <chrono>
#include <tally/runner.hpp>
#include <tally/value.hpp>

namespace tally::runner {

using model::Transaction;

std::string RunSummary::format() const {
    return std::to_string(succeeded) + " applied, " + std::to_string(failed) + " failed";
}

// ============================================================================
// BulkRunner
// ============================================================================

BulkRunner::BulkRunner(store::Store& store, RunOptions options)
    : store_(store), options_(std::move(options)), engine_(store, options_.context) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = DEFAULT_CHUNK_SIZE;
    }
}

void BulkRunner::for_each_chunk(
    const std::function<bool(std::vector<Transaction>&)>& visit) {
    std::optional<model::TransactionId> last_id;
    const auto& filter = options_.filter;

    while (true) {
        auto chunk = store_.fetch_after(last_id, filter, options_.chunk_size);
        if (chunk.empty()) {
            break;
        }
        last_id = chunk.back().id;
        bool full = chunk.size() == options_.chunk_size;
        if (!visit(chunk) || !full) {
            break;
        }
    }
}

RunSummary BulkRunner::run(const TransactionStep& step, const CancellationToken* cancel) {
    RunSummary summary;

    try {
        summary.total = store_.count_transactions(options_.filter);

        for_each_chunk([&](std::vector<Transaction>& chunk) {
            // Отмена проверяется только между порциями
            if (cancel != nullptr && cancel->cancelled()) {
                summary.cancelled = true;
                return false;
            }

            for (auto& tx : chunk) {
                ++summary.processed;
                try {
                    auto result = step(tx);
                    if (result.matched()) {
                        ++summary.matched;
                    }
                    summary.actions_applied += result.actions_applied;
                    for (const auto& outcome : result.outcomes) {
                        if (outcome.execution && outcome.execution->ok) {
                            ++summary.rule_matches[outcome.rule_id];
                        }
                    }
                    if (result.ok()) {
                        ++summary.succeeded;
                    } else {
                        ++summary.failed;
                        summary.failures.push_back({tx.id, value::join(result.errors, "; ")});
                    }
                } catch (const store::StoreError& e) {
                    ++summary.failed;
                    summary.failures.push_back({tx.id, std::string("store: ") + e.what()});
                }
            }

            if (options_.on_progress) {
                options_.on_progress(Progress{summary.processed, summary.total,
                                              summary.succeeded, summary.failed,
                                              summary.matched});
            }
            return true;
        });
    } catch (const store::StoreError& e) {
        // Сбой выборки: дальнейшие порции недоступны
        summary.warnings.push_back(std::string("fetch failed: ") + e.what());
    }

    return summary;
}

RunSummary BulkRunner::apply_all(std::vector<model::Rule>& rules,
                                 const CancellationToken* cancel) {
    auto summary = run([&](Transaction& tx) { return engine_.apply(rules, tx); }, cancel);

    // Сохранить счётчики вычислений, в том числе у несовпавших правил
    for (const auto& rule : rules) {
        if (!rule.active) {
            continue;
        }
        try {
            store_.persist_rule_statistics(rule.id, rule.stats);
        } catch (const store::StoreError& e) {
            summary.warnings.push_back("rule " + std::to_string(rule.id) +
                                       " statistics: " + e.what());
        }
    }
    return summary;
}

RunSummary BulkRunner::apply_rule(model::Rule& rule, const CancellationToken* cancel) {
    auto summary = run([&](Transaction& tx) { return engine_.apply_rule(rule, tx); }, cancel);
    try {
        store_.persist_rule_statistics(rule.id, rule.stats);
    } catch (const store::StoreError& e) {
        summary.warnings.push_back("rule " + std::to_string(rule.id) + " statistics: " + e.what());
    }
    return summary;
}

TestReport BulkRunner::test_rule(const model::Rule& rule) {
    TestReport report;
    report.actions = rule.actions;
    for_each_chunk([&](std::vector<Transaction>& chunk) {
        for (const auto& tx : chunk) {
            ++report.evaluated;
            if (engine_.matches(rule, tx)) {
                report.matches.push_back(tx.id);
            }
        }
        return true;
    });
    return report;
}

Preview BulkRunner::preview(const model::TriggerGroup& group, std::size_t sample_limit) {
    Preview result;
    for_each_chunk([&](std::vector<Transaction>& chunk) {
        for (const auto& tx : chunk) {
            ++result.evaluated;
            if (trigger::evaluate_group(group, tx, options_.context)) {
                ++result.match_count;
                if (result.sample.size() < sample_limit) {
                    result.sample.push_back(tx.id);
                }
            }
        }
        return true;
    });
    return result;
}

// ============================================================================
// RunHandle
// ============================================================================

RunHandle::RunHandle(std::shared_ptr<CancellationToken> token, std::future<RunSummary> future)
    : token_(std::move(token)), future_(std::move(future)) {}

bool RunHandle::ready() const {
    return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

RunSummary RunHandle::wait() {
    return future_.get();
}

RunHandle start(store::Store& store, std::vector<model::Rule> rules, RunOptions options) {
    auto token = std::make_shared<CancellationToken>();
    auto future = std::async(
        std::launch::async,
        [&store, token, rules = std::move(rules), options = std::move(options)]() mutable {
            BulkRunner runner(store, std::move(options));
            return runner.apply_all(rules, token.get());
        });
    return RunHandle(std::move(token), std::move(future));
}

}  // namespace tally::runner
