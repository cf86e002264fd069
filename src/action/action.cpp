// ==============================================================================
// action.cpp - Выполнение действий правил
// ==============================================================================

#include <algorithm>
#include <tally/action.hpp>
#include <tally/field.hpp>
#include <tally/value.hpp>

namespace tally::action {

using model::ActionType;
using model::Transaction;

// ============================================================================
// Errors
// ============================================================================

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::ReferenceNotFound:
        return "reference not found";
    case ErrorKind::Store:
        return "store";
    }
    return "unknown";
}

std::string ActionError::format() const {
    return to_string(kind) + ": " + message;
}

std::string to_string(Status status) {
    switch (status) {
    case Status::Applied:
        return "applied";
    case Status::Failed:
        return "failed";
    case Status::RolledBack:
        return "rolled back";
    case Status::NotAttempted:
        return "not attempted";
    }
    return "unknown";
}

namespace {

ActionError not_found(std::string_view name) {
    return ActionError{ErrorKind::ReferenceNotFound, "account '" + std::string(name) + "' not found"};
}

/// "Transfer to: NAME (IBAN)"
std::string transfer_segment(const model::Account& account) {
    std::string segment(field::TRANSFER_MARKER);
    segment += account.name;
    if (!account.iban.empty()) {
        segment += " (" + account.iban + ")";
    }
    return segment;
}

/// Имя счёта из значения маркера "NAME (IBAN)": всё до первого " ("
std::string transfer_account_name(std::string_view marker_value) {
    return std::string(value::trim(marker_value.substr(0, marker_value.find(" ("))));
}

void record_destination(Transaction& tx, const model::Account& account) {
    tx.notes = field::replace_marker(tx.notes, field::TRANSFER_MARKER, transfer_segment(account));
}

std::optional<ActionError> swap_accounts(Transaction& tx, store::Store& store) {
    auto destination = field::find_marker(tx.notes, field::TRANSFER_MARKER);
    if (!destination || destination->empty()) {
        return ActionError{ErrorKind::Validation, "no destination account recorded"};
    }
    if (!tx.account_name || tx.account_name->empty()) {
        return ActionError{ErrorKind::Validation, "no source account to swap"};
    }

    auto name = transfer_account_name(*destination);
    auto target = store.find_account_by_name(name);
    if (!target) {
        return not_found(name);
    }

    model::Account previous{tx.account_id.value_or(0), *tx.account_name, tx.iban};
    tx.account_id = target->id;
    tx.account_name = target->name;
    tx.iban = target->iban;
    record_destination(tx, previous);
    tx.amount = tx.amount.negated();
    return std::nullopt;
}

}  // namespace

// ============================================================================
// apply
// ============================================================================

std::optional<ActionError> apply(const model::RuleAction& action, Transaction& tx,
                                 store::Store& store) {
    const std::string v(value::trim(action.value));
    if (model::requires_value(action.type) && v.empty()) {
        return ActionError{ErrorKind::Validation,
                           model::to_string(action.type) + " requires a value"};
    }

    switch (action.type) {
    case ActionType::SetCategory:
        tx.category_override = store.find_or_create_category(v).name;
        break;
    case ActionType::ClearCategory:
        tx.category_override.reset();
        break;
    case ActionType::SetNotes:
        tx.notes = v;
        break;
    case ActionType::SetDescription:
        tx.description = v;
        break;
    case ActionType::AppendDescription:
        tx.description = tx.description.empty() ? v : tx.description + " " + v;
        break;
    case ActionType::PrependDescription:
        tx.description = tx.description.empty() ? v : v + " " + tx.description;
        break;
    case ActionType::AddTag: {
        auto tags = field::parse_tags(tx.notes);
        if (std::find(tags.begin(), tags.end(), v) == tags.end()) {
            tags.push_back(v);
        }
        tx.notes = field::with_tags(tx.notes, tags);
        break;
    }
    case ActionType::RemoveTag: {
        auto tags = field::parse_tags(tx.notes);
        tags.erase(std::remove(tags.begin(), tags.end(), v), tags.end());
        tx.notes = field::with_tags(tx.notes, tags);
        break;
    }
    case ActionType::ClearAllTags:
        tx.notes = field::with_tags(tx.notes, {});
        break;
    case ActionType::SetCounterParty:
        tx.counter_name = v;
        tx.standardized_name = v;
        break;
    case ActionType::SetSourceAccount: {
        auto account = store.find_account_by_name(v);
        if (!account) {
            return not_found(v);
        }
        tx.account_id = account->id;
        tx.account_name = account->name;
        tx.iban = account->iban;
        break;
    }
    case ActionType::SetDestinationAccount: {
        auto account = store.find_account_by_name(v);
        if (!account) {
            return not_found(v);
        }
        record_destination(tx, *account);
        break;
    }
    case ActionType::SwapAccounts:
        return swap_accounts(tx, store);
    case ActionType::ConvertToDeposit:
        tx.kind = model::TransactionKind::Income;
        tx.amount = tx.amount.abs();
        break;
    case ActionType::ConvertToWithdrawal:
        tx.kind = model::TransactionKind::Expense;
        tx.amount = tx.amount.abs().negated();
        break;
    case ActionType::ConvertToTransfer:
        if (!v.empty()) {
            auto account = store.find_account_by_name(v);
            if (!account) {
                return not_found(v);
            }
            record_destination(tx, *account);
        }
        tx.kind = model::TransactionKind::Transfer;
        break;
    case ActionType::DeleteTransaction:
        if (!field::is_deleted(tx)) {
            std::string marked(field::DELETED_MARKER);
            if (tx.notes && !tx.notes->empty()) {
                marked += " " + *tx.notes;
            }
            tx.notes = marked;
        }
        break;
    case ActionType::SetExternalId:
        tx.notes = field::append_segment(tx.notes, std::string(field::EXTERNAL_ID_MARKER) + v);
        break;
    case ActionType::SetInternalReference:
        tx.notes =
            field::append_segment(tx.notes, std::string(field::INTERNAL_REFERENCE_MARKER) + v);
        break;
    }
    return std::nullopt;
}

// ============================================================================
// execute
// ============================================================================

ExecutionResult execute(const std::vector<model::RuleAction>& actions, Transaction& tx,
                        store::Store& store) {
    ExecutionResult result;
    result.outcomes.reserve(actions.size());
    for (const auto& a : actions) {
        result.outcomes.push_back(ActionOutcome{a.type, a.value, Status::NotAttempted, std::nullopt});
    }

    if (actions.empty()) {
        result.ok = true;
        return result;
    }

    // Первая ошибка: отметить действие и откатить уже выполненные
    auto fail = [&](std::size_t index, ActionError error) {
        for (std::size_t i = 0; i < index && i < result.outcomes.size(); ++i) {
            result.outcomes[i].status = Status::RolledBack;
        }
        if (index < result.outcomes.size()) {
            result.outcomes[index].status = Status::Failed;
            result.outcomes[index].error = error;
        }
        result.ok = false;
        result.success_count = 0;
        result.failure_count = 1;
        result.error = std::move(error);
    };

    Transaction working = tx;
    std::size_t current = 0;
    try {
        store::AtomicUpdate update(store, tx.id);
        for (current = 0; current < actions.size(); ++current) {
            if (auto error = apply(actions[current], working, store)) {
                fail(current, std::move(*error));
                return result;
            }
            result.outcomes[current].status = Status::Applied;
        }
        store.update_transaction(working);
        update.commit();
    } catch (const store::StoreError& e) {
        // current == actions.size(): сбой при сохранении или commit
        fail(current, ActionError{ErrorKind::Store, e.what()});
        if (current >= actions.size()) {
            for (auto& outcome : result.outcomes) {
                outcome.status = Status::RolledBack;
            }
        }
        return result;
    }

    tx = std::move(working);
    result.ok = true;
    result.success_count = actions.size();
    return result;
}

}  // namespace tally::action
