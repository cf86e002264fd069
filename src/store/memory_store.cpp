// ==============================================================================
// memory_store.cpp - Хранилище в памяти
// ==============================================================================

#include <algorithm>
#include <tally/store.hpp>
#include <tally/value.hpp>

namespace tally::store {

using model::Account;
using model::Category;
using model::Transaction;

// ============================================================================
// Наполнение
// ============================================================================

Account MemoryStore::add_account(std::string name, std::string iban) {
    Account account{next_account_id_, std::move(name), std::move(iban)};
    add_account(account);
    return account;
}

void MemoryStore::add_account(const Account& account) {
    accounts_.push_back(account);
    next_account_id_ = std::max(next_account_id_, account.id + 1);
}

Category MemoryStore::add_category(std::string name) {
    Category category{next_category_id_, std::move(name)};
    add_category(category);
    return category;
}

void MemoryStore::add_category(const Category& category) {
    categories_.push_back(category);
    next_category_id_ = std::max(next_category_id_, category.id + 1);
}

void MemoryStore::put_transaction(const Transaction& tx) {
    transactions_[tx.id] = tx;
}

// ============================================================================
// Чтение
// ============================================================================

std::optional<Transaction> MemoryStore::transaction(model::TransactionId id) const {
    auto it = transactions_.find(id);
    if (it == transactions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transaction> MemoryStore::transactions() const {
    std::vector<Transaction> result;
    result.reserve(transactions_.size());
    for (const auto& [id, tx] : transactions_) {
        result.push_back(tx);
    }
    return result;
}

// ============================================================================
// Store
// ============================================================================

std::optional<Account> MemoryStore::find_account_by_name(std::string_view name) {
    auto needle = value::trim(name);
    if (needle.empty()) {
        return std::nullopt;
    }
    // Точное совпадение имени важнее вхождения подстроки
    for (const auto& account : accounts_) {
        if (value::iequals(account.name, needle)) {
            return account;
        }
    }
    for (const auto& account : accounts_) {
        if (value::icontains(account.name, needle) || account.iban == needle) {
            return account;
        }
    }
    return std::nullopt;
}

Category MemoryStore::find_or_create_category(std::string_view name) {
    for (const auto& category : categories_) {
        if (category.name == name) {
            return category;
        }
    }
    return add_category(std::string(name));
}

void MemoryStore::begin(model::TransactionId id) {
    if (pending_) {
        throw StoreError("atomic update already in progress for transaction " +
                         std::to_string(pending_->id));
    }
    if (transactions_.find(id) == transactions_.end()) {
        throw StoreError("transaction " + std::to_string(id) + " not found");
    }
    pending_ = PendingUpdate{id, categories_.size(), next_category_id_, std::nullopt};
}

void MemoryStore::commit() {
    if (!pending_) {
        throw StoreError("commit without atomic update");
    }
    if (pending_->staged) {
        transactions_[pending_->id] = *pending_->staged;
    }
    pending_.reset();
}

void MemoryStore::rollback() noexcept {
    if (!pending_) {
        return;
    }
    // Категории, созданные внутри единицы работы, отбрасываются
    categories_.resize(pending_->categories_mark);
    next_category_id_ = pending_->next_category_id_mark;
    pending_.reset();
}

void MemoryStore::update_transaction(const Transaction& tx) {
    auto it = transactions_.find(tx.id);
    if (it == transactions_.end()) {
        throw StoreError("transaction " + std::to_string(tx.id) + " not found");
    }
    if (!pending_) {
        it->second = tx;
        return;
    }
    if (pending_->id != tx.id) {
        throw StoreError("transaction " + std::to_string(tx.id) +
                         " is outside the current atomic update");
    }
    pending_->staged = tx;
}

std::vector<Transaction> MemoryStore::fetch_transactions(const TransactionPredicate& predicate,
                                                         std::size_t offset,
                                                         std::size_t limit) {
    std::vector<Transaction> result;
    std::size_t skipped = 0;
    for (const auto& [id, tx] : transactions_) {
        if (result.size() >= limit) {
            break;
        }
        if (predicate && !predicate(tx)) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        result.push_back(tx);
    }
    return result;
}

std::vector<Transaction> MemoryStore::fetch_after(std::optional<model::TransactionId> after_id,
                                                  const TransactionPredicate& predicate,
                                                  std::size_t limit) {
    std::vector<Transaction> result;
    auto it = after_id ? transactions_.upper_bound(*after_id) : transactions_.begin();
    for (; it != transactions_.end() && result.size() < limit; ++it) {
        if (!predicate || predicate(it->second)) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::size_t MemoryStore::count_transactions(const TransactionPredicate& predicate) {
    if (!predicate) {
        return transactions_.size();
    }
    return static_cast<std::size_t>(
        std::count_if(transactions_.begin(), transactions_.end(),
                      [&](const auto& entry) { return predicate(entry.second); }));
}

void MemoryStore::persist_rule_statistics(model::RuleId rule,
                                          const model::RuleStatistics& stats) {
    rule_stats_[rule] = stats;
}

}  // namespace tally::store
