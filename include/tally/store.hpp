// ==============================================================================
// tally/store.hpp - Интерфейс хранилища и хранилище в памяти
// ==============================================================================
//
// Назначение:
// - Store: абстрактное хранилище с единицей работы (begin/commit/rollback)
// - AtomicUpdate: RAII-охрана единицы работы (откат в деструкторе)
// - MemoryStore: реализация в памяти
// - Снимок MemoryStore в JSON (RapidJSON)
//
// Хранилище однопоточное: одновременно им пользуется ровно один пакет.
//
// ==============================================================================

#ifndef TALLY_STORE_HPP
#define TALLY_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tally/model.hpp>
#include <vector>

namespace tally::store {

/// Сбой хранилища (ввод-вывод, нарушение ограничений)
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Предикат выборки; пустой предикат выбирает все транзакции
using TransactionPredicate = std::function<bool(const model::Transaction&)>;

// ============================================================================
// Store
// ============================================================================

class Store {
public:
    virtual ~Store() = default;

    /// Счёт по имени: точное совпадение, вхождение подстроки или IBAN
    virtual std::optional<model::Account> find_account_by_name(std::string_view name) = 0;

    /// Категория по точному имени; создаётся при отсутствии
    virtual model::Category find_or_create_category(std::string_view name) = 0;

    /// Начать единицу работы над транзакцией
    /// @throw StoreError если единица работы уже открыта
    virtual void begin(model::TransactionId id) = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;

    /// Записать транзакцию (внутри единицы работы - отложенно до commit)
    virtual void update_transaction(const model::Transaction& tx) = 0;

    /// Выборка в порядке возрастания id
    virtual std::vector<model::Transaction> fetch_transactions(
        const TransactionPredicate& predicate, std::size_t offset, std::size_t limit) = 0;

    /// Порция с id > after_id (keyset), в порядке возрастания id.
    /// По умолчанию сводится к fetch_transactions с фильтром по id.
    virtual std::vector<model::Transaction> fetch_after(
        std::optional<model::TransactionId> after_id, const TransactionPredicate& predicate,
        std::size_t limit) {
        return fetch_transactions(
            [&](const model::Transaction& tx) {
                return (!after_id || tx.id > *after_id) && (!predicate || predicate(tx));
            },
            0, limit);
    }

    virtual std::size_t count_transactions(const TransactionPredicate& predicate) = 0;

    virtual void persist_rule_statistics(model::RuleId rule,
                                         const model::RuleStatistics& stats) = 0;
};

// ============================================================================
// AtomicUpdate
// ============================================================================

/// Единица работы над одной транзакцией. Без commit() откатывается.
class AtomicUpdate {
public:
    AtomicUpdate(Store& store, model::TransactionId id) : store_(store) { store_.begin(id); }

    ~AtomicUpdate() {
        if (active_) {
            store_.rollback();
        }
    }

    AtomicUpdate(const AtomicUpdate&) = delete;
    AtomicUpdate& operator=(const AtomicUpdate&) = delete;

    void commit() {
        store_.commit();
        active_ = false;
    }

    void rollback() noexcept {
        if (active_) {
            store_.rollback();
            active_ = false;
        }
    }

private:
    Store& store_;
    bool active_ = true;
};

// ============================================================================
// MemoryStore
// ============================================================================

class MemoryStore : public Store {
public:
    MemoryStore() = default;

    // Наполнение
    // -------------------------------------------------------------------------

    model::Account add_account(std::string name, std::string iban);
    void add_account(const model::Account& account);
    model::Category add_category(std::string name);
    void add_category(const model::Category& category);
    /// Добавить или заменить транзакцию с тем же id
    void put_transaction(const model::Transaction& tx);

    // Чтение
    // -------------------------------------------------------------------------

    std::optional<model::Transaction> transaction(model::TransactionId id) const;
    std::vector<model::Transaction> transactions() const;
    const std::vector<model::Account>& accounts() const { return accounts_; }
    const std::vector<model::Category>& categories() const { return categories_; }
    const std::map<model::RuleId, model::RuleStatistics>& rule_statistics() const {
        return rule_stats_;
    }
    bool in_update() const { return pending_.has_value(); }

    // Store
    // -------------------------------------------------------------------------

    std::optional<model::Account> find_account_by_name(std::string_view name) override;
    model::Category find_or_create_category(std::string_view name) override;
    void begin(model::TransactionId id) override;
    void commit() override;
    void rollback() noexcept override;
    void update_transaction(const model::Transaction& tx) override;
    std::vector<model::Transaction> fetch_transactions(const TransactionPredicate& predicate,
                                                       std::size_t offset,
                                                       std::size_t limit) override;
    std::vector<model::Transaction> fetch_after(std::optional<model::TransactionId> after_id,
                                                const TransactionPredicate& predicate,
                                                std::size_t limit) override;
    std::size_t count_transactions(const TransactionPredicate& predicate) override;
    void persist_rule_statistics(model::RuleId rule,
                                 const model::RuleStatistics& stats) override;

private:
    struct PendingUpdate {
        model::TransactionId id = 0;
        std::size_t categories_mark = 0;
        model::CategoryId next_category_id_mark = 0;
        std::optional<model::Transaction> staged;
    };

    std::vector<model::Account> accounts_;
    std::vector<model::Category> categories_;
    std::map<model::TransactionId, model::Transaction> transactions_;
    std::map<model::RuleId, model::RuleStatistics> rule_stats_;

    std::optional<PendingUpdate> pending_;
    model::AccountId next_account_id_ = 1;
    model::CategoryId next_category_id_ = 1;
};

// ============================================================================
// JSON snapshot
// ============================================================================

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct SnapshotResult {
    bool ok = false;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить снимок из JSON-строки в store (добавляется к содержимому)
SnapshotResult parse_snapshot(std::string_view json, MemoryStore& store);

/// Загрузить снимок из файла
SnapshotResult load_snapshot(const std::filesystem::path& path, MemoryStore& store);

/// Сериализовать store в JSON (с отступами)
std::string to_json(const MemoryStore& store);

/// Сохранить снимок в файл
SnapshotResult save_snapshot(const MemoryStore& store, const std::filesystem::path& path);

}  // namespace tally::store

#endif  // TALLY_STORE_HPP
