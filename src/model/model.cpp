// ==============================================================================
// model.cpp - Модель данных: транзакции и правила
// ==============================================================================

#include <stdexcept>
#include <tally/model.hpp>

namespace tally::model {

// ============================================================================
// Transaction
// ============================================================================

std::string Transaction::effective_category() const {
    if (category_override && !category_override->empty()) {
        return *category_override;
    }
    if (auto_category && !auto_category->empty()) {
        return *auto_category;
    }
    return UNCATEGORIZED;
}

bool operator==(const Transaction& a, const Transaction& b) {
    return a.id == b.id && a.amount == b.amount && a.date == b.date &&
           a.description == b.description && a.counter_name == b.counter_name &&
           a.standardized_name == b.standardized_name && a.counter_iban == b.counter_iban &&
           a.iban == b.iban && a.category_override == b.category_override &&
           a.auto_category == b.auto_category && a.notes == b.notes && a.kind == b.kind &&
           a.account_id == b.account_id && a.account_name == b.account_name;
}

// ============================================================================
// Actions
// ============================================================================

bool requires_value(ActionType type) {
    switch (type) {
    case ActionType::ClearCategory:
    case ActionType::ClearAllTags:
    case ActionType::SwapAccounts:
    case ActionType::ConvertToDeposit:
    case ActionType::ConvertToWithdrawal:
    case ActionType::ConvertToTransfer:
    case ActionType::DeleteTransaction:
        return false;
    case ActionType::SetCategory:
    case ActionType::SetNotes:
    case ActionType::SetDescription:
    case ActionType::AppendDescription:
    case ActionType::PrependDescription:
    case ActionType::AddTag:
    case ActionType::RemoveTag:
    case ActionType::SetCounterParty:
    case ActionType::SetSourceAccount:
    case ActionType::SetDestinationAccount:
    case ActionType::SetExternalId:
    case ActionType::SetInternalReference:
        return true;
    }
    return true;
}

// ============================================================================
// RuleStatistics
// ============================================================================

double RuleStatistics::match_rate() const {
    if (total_evaluations <= 0) {
        return 0.0;
    }
    return static_cast<double>(match_count) / static_cast<double>(total_evaluations) * 100.0;
}

double RuleStatistics::error_rate() const {
    if (match_count <= 0) {
        return 0.0;
    }
    return static_cast<double>(error_count) / static_cast<double>(match_count) * 100.0;
}

// ============================================================================
// to_string
// ============================================================================

std::string to_string(TriggerField f) {
    switch (f) {
    case TriggerField::Description:
        return "description";
    case TriggerField::AccountName:
        return "account_name";
    case TriggerField::CounterParty:
        return "counter_party";
    case TriggerField::Amount:
        return "amount";
    case TriggerField::Date:
        return "date";
    case TriggerField::Iban:
        return "iban";
    case TriggerField::CounterIban:
        return "counter_iban";
    case TriggerField::TransactionType:
        return "transaction_type";
    case TriggerField::Category:
        return "category";
    case TriggerField::Notes:
        return "notes";
    case TriggerField::ExternalId:
        return "external_id";
    case TriggerField::InternalReference:
        return "internal_reference";
    case TriggerField::Tags:
        return "tags";
    }
    return "unknown";
}

std::string to_string(TriggerOperator op) {
    switch (op) {
    case TriggerOperator::Contains:
        return "contains";
    case TriggerOperator::StartsWith:
        return "starts_with";
    case TriggerOperator::EndsWith:
        return "ends_with";
    case TriggerOperator::Equals:
        return "equals";
    case TriggerOperator::Matches:
        return "matches";
    case TriggerOperator::GreaterThan:
        return "greater_than";
    case TriggerOperator::LessThan:
        return "less_than";
    case TriggerOperator::GreaterThanOrEqual:
        return "greater_than_or_equal";
    case TriggerOperator::LessThanOrEqual:
        return "less_than_or_equal";
    case TriggerOperator::Between:
        return "between";
    case TriggerOperator::IsEmpty:
        return "is_empty";
    case TriggerOperator::IsNotEmpty:
        return "is_not_empty";
    case TriggerOperator::Before:
        return "before";
    case TriggerOperator::After:
        return "after";
    case TriggerOperator::On:
        return "on";
    case TriggerOperator::Today:
        return "today";
    case TriggerOperator::Yesterday:
        return "yesterday";
    case TriggerOperator::Tomorrow:
        return "tomorrow";
    }
    return "unknown";
}

std::string to_string(ActionType t) {
    switch (t) {
    case ActionType::SetCategory:
        return "set_category";
    case ActionType::ClearCategory:
        return "clear_category";
    case ActionType::SetNotes:
        return "set_notes";
    case ActionType::SetDescription:
        return "set_description";
    case ActionType::AppendDescription:
        return "append_description";
    case ActionType::PrependDescription:
        return "prepend_description";
    case ActionType::AddTag:
        return "add_tag";
    case ActionType::RemoveTag:
        return "remove_tag";
    case ActionType::ClearAllTags:
        return "clear_all_tags";
    case ActionType::SetCounterParty:
        return "set_counter_party";
    case ActionType::SetSourceAccount:
        return "set_source_account";
    case ActionType::SetDestinationAccount:
        return "set_destination_account";
    case ActionType::SwapAccounts:
        return "swap_accounts";
    case ActionType::ConvertToDeposit:
        return "convert_to_deposit";
    case ActionType::ConvertToWithdrawal:
        return "convert_to_withdrawal";
    case ActionType::ConvertToTransfer:
        return "convert_to_transfer";
    case ActionType::DeleteTransaction:
        return "delete_transaction";
    case ActionType::SetExternalId:
        return "set_external_id";
    case ActionType::SetInternalReference:
        return "set_internal_reference";
    }
    return "unknown";
}

std::string to_string(Combinator c) {
    switch (c) {
    case Combinator::All:
        return "all";
    case Combinator::Any:
        return "any";
    }
    return "unknown";
}

std::string to_string(TransactionKind k) {
    switch (k) {
    case TransactionKind::Income:
        return "income";
    case TransactionKind::Expense:
        return "expense";
    case TransactionKind::Transfer:
        return "transfer";
    case TransactionKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

// ============================================================================
// Списки значений
// ============================================================================

const std::vector<TriggerField>& all_fields() {
    static const std::vector<TriggerField> fields = {
        TriggerField::Description, TriggerField::AccountName,     TriggerField::CounterParty,
        TriggerField::Amount,      TriggerField::Date,            TriggerField::Iban,
        TriggerField::CounterIban, TriggerField::TransactionType, TriggerField::Category,
        TriggerField::Notes,       TriggerField::ExternalId,      TriggerField::InternalReference,
        TriggerField::Tags};
    return fields;
}

const std::vector<TriggerOperator>& all_operators() {
    static const std::vector<TriggerOperator> ops = {
        TriggerOperator::Contains,     TriggerOperator::StartsWith,
        TriggerOperator::EndsWith,     TriggerOperator::Equals,
        TriggerOperator::Matches,      TriggerOperator::GreaterThan,
        TriggerOperator::LessThan,     TriggerOperator::GreaterThanOrEqual,
        TriggerOperator::LessThanOrEqual, TriggerOperator::Between,
        TriggerOperator::IsEmpty,      TriggerOperator::IsNotEmpty,
        TriggerOperator::Before,       TriggerOperator::After,
        TriggerOperator::On,           TriggerOperator::Today,
        TriggerOperator::Yesterday,    TriggerOperator::Tomorrow};
    return ops;
}

const std::vector<ActionType>& all_action_types() {
    static const std::vector<ActionType> types = {
        ActionType::SetCategory,        ActionType::ClearCategory,
        ActionType::SetNotes,           ActionType::SetDescription,
        ActionType::AppendDescription,  ActionType::PrependDescription,
        ActionType::AddTag,             ActionType::RemoveTag,
        ActionType::ClearAllTags,       ActionType::SetCounterParty,
        ActionType::SetSourceAccount,   ActionType::SetDestinationAccount,
        ActionType::SwapAccounts,       ActionType::ConvertToDeposit,
        ActionType::ConvertToWithdrawal, ActionType::ConvertToTransfer,
        ActionType::DeleteTransaction,  ActionType::SetExternalId,
        ActionType::SetInternalReference};
    return types;
}

// ============================================================================
// parse
// ============================================================================

TriggerField parse_field(std::string_view s) {
    for (TriggerField f : all_fields()) {
        if (s == to_string(f)) {
            return f;
        }
    }
    throw std::invalid_argument("unknown trigger field '" + std::string(s) + "'");
}

TriggerOperator parse_operator(std::string_view s) {
    if (s == "has_value") {
        return TriggerOperator::IsNotEmpty;
    }
    for (TriggerOperator op : all_operators()) {
        if (s == to_string(op)) {
            return op;
        }
    }
    throw std::invalid_argument("unknown trigger operator '" + std::string(s) + "'");
}

ActionType parse_action_type(std::string_view s) {
    for (ActionType t : all_action_types()) {
        if (s == to_string(t)) {
            return t;
        }
    }
    throw std::invalid_argument("unknown action type '" + std::string(s) + "'");
}

Combinator parse_combinator(std::string_view s) {
    if (s == "all" || s == "and")
        return Combinator::All;
    if (s == "any" || s == "or")
        return Combinator::Any;
    throw std::invalid_argument("unknown combinator, must be: all, or any");
}

TransactionKind parse_kind(std::string_view s) {
    std::string lower = value::ascii_lowercase(value::trim(s));
    if (lower == "income" || lower == "deposit")
        return TransactionKind::Income;
    if (lower == "expense" || lower == "withdrawal")
        return TransactionKind::Expense;
    if (lower == "transfer")
        return TransactionKind::Transfer;
    if (lower == "unknown")
        return TransactionKind::Unknown;
    throw std::invalid_argument(
        "unknown transaction type, must be: income, expense, transfer or unknown");
}

}  // namespace tally::model
