// ==============================================================================
// tally/runner.hpp - Пакетное применение правил
// ==============================================================================
//
// Назначение:
// - Применение всех активных правил или одного правила к множеству
//   транзакций хранилища порциями фиксированного размера
// - Прогресс (push-callback после каждой порции)
// - Кооперативная отмена между порциями
// - Запуск всего пакета в фоновом потоке (RunHandle)
// - Предпросмотр и пробный прогон правила без изменений
//
// Ошибка одной транзакции не останавливает пакет: она записывается в
// сводку, обработка продолжается. Уже обработанные порции при отмене
// не откатываются.
//
// ==============================================================================

#ifndef TALLY_RUNNER_HPP
#define TALLY_RUNNER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <tally/engine.hpp>
#include <tally/model.hpp>
#include <tally/store.hpp>
#include <tally/trigger.hpp>
#include <vector>

namespace tally::runner {

/// Размер порции по умолчанию
constexpr std::size_t DEFAULT_CHUNK_SIZE = 100;

// ============================================================================
// Progress / cancellation
// ============================================================================

struct Progress {
    std::size_t processed = 0;
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t matched = 0;
};

using ProgressCallback = std::function<void(const Progress&)>;

/// Сигнал кооперативной отмены
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Options / summary
// ============================================================================

struct RunOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    store::TransactionPredicate filter;  // пустой - все транзакции
    ProgressCallback on_progress;
    trigger::Context context;
};

struct Failure {
    model::TransactionId transaction_id = 0;
    std::string reason;
};

struct RunSummary {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t matched = 0;  // транзакции хотя бы с одним совпадением
    std::size_t actions_applied = 0;
    bool cancelled = false;
    std::vector<Failure> failures;
    std::map<model::RuleId, std::size_t> rule_matches;  // успешные применения
    std::vector<std::string> warnings;                  // не относятся к транзакциям

    /// "{succeeded} applied, {failed} failed"
    std::string format() const;
};

/// Пробный прогон одного правила
struct TestReport {
    std::size_t evaluated = 0;
    std::vector<model::TransactionId> matches;
    std::vector<model::RuleAction> actions;  // что было бы выполнено
};

/// Предпросмотр группы триггеров
struct Preview {
    std::size_t evaluated = 0;
    std::size_t match_count = 0;
    std::vector<model::TransactionId> sample;  // первые совпадения
};

// ============================================================================
// BulkRunner
// ============================================================================

class BulkRunner {
public:
    explicit BulkRunner(store::Store& store, RunOptions options = RunOptions{});

    /// Все активные правила (импорт / автокатегоризация)
    RunSummary apply_all(std::vector<model::Rule>& rules, const CancellationToken* cancel = nullptr);

    /// Одно правило независимо от флага active
    RunSummary apply_rule(model::Rule& rule, const CancellationToken* cancel = nullptr);

    /// Пробный прогон: какие транзакции совпали и что бы выполнилось
    TestReport test_rule(const model::Rule& rule);

    /// Число совпадений группы триггеров и первые sample_limit id
    Preview preview(const model::TriggerGroup& group, std::size_t sample_limit = 10);

    const RunOptions& options() const { return options_; }

private:
    using TransactionStep =
        std::function<engine::TransactionResult(model::Transaction&)>;

    /// Порционный обход: id > last_id, чтобы изменения не сдвигали страницы
    void for_each_chunk(const std::function<bool(std::vector<model::Transaction>&)>& visit);

    RunSummary run(const TransactionStep& step, const CancellationToken* cancel);

    store::Store& store_;
    RunOptions options_;
    engine::RuleEngine engine_;
};

// ============================================================================
// Фоновый запуск
// ============================================================================

/// Дескриптор фонового пакета: отмена и ожидание результата
class RunHandle {
public:
    RunHandle(std::shared_ptr<CancellationToken> token, std::future<RunSummary> future);

    RunHandle(RunHandle&&) = default;
    RunHandle& operator=(RunHandle&&) = default;

    void cancel() { token_->cancel(); }
    bool cancelled() const { return token_->cancelled(); }
    bool ready() const;

    /// Дождаться завершения. Повторный вызов недопустим.
    RunSummary wait();

private:
    std::shared_ptr<CancellationToken> token_;
    std::future<RunSummary> future_;
};

/// Запустить apply_all в фоновом потоке. Правила копируются в поток,
/// статистика сохраняется через store. store должен пережить handle.
RunHandle start(store::Store& store, std::vector<model::Rule> rules, RunOptions options);

}  // namespace tally::runner

#endif  // TALLY_RUNNER_HPP
