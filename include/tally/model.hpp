// ==============================================================================
// tally/model.hpp - Модель данных: транзакции и правила
// ==============================================================================
//
// Назначение:
// - Транзакция, счёт, категория (внешние сущности, изменяемые действиями)
// - Группа правил, правило, дерево групп триггеров, триггер, действие
// - Закрытые перечисления полей, операторов и типов действий
//
// Правило ссылается на группу только по идентификатору (group_id), группа
// правилами не владеет. Дерево триггеров - рекурсивный тип-значение.
//
// ==============================================================================

#ifndef TALLY_MODEL_HPP
#define TALLY_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tally/value.hpp>
#include <vector>

namespace tally::model {

using TransactionId = std::int64_t;
using AccountId = std::int64_t;
using CategoryId = std::int64_t;
using RuleId = std::int64_t;
using GroupId = std::int64_t;

/// Имя категории для транзакции без назначенной категории
constexpr const char* UNCATEGORIZED = "Uncategorized";

// ============================================================================
// Transaction
// ============================================================================

enum class TransactionKind { Income, Expense, Transfer, Unknown };

struct Account {
    AccountId id = 0;
    std::string name;
    std::string iban;
};

struct Category {
    CategoryId id = 0;
    std::string name;
};

struct Transaction {
    TransactionId id = 0;
    value::Decimal amount;
    value::Date date;
    std::string description;

    std::optional<std::string> counter_name;
    std::optional<std::string> standardized_name;
    std::optional<std::string> counter_iban;
    std::string iban;  // IBAN собственного счёта

    std::optional<std::string> category_override;
    std::optional<std::string> auto_category;

    // Свободный текст. Одновременно хранит теги (список через ", ")
    // и служебные маркеры (External ID, Ref, Transfer to, удаление).
    std::optional<std::string> notes;

    TransactionKind kind = TransactionKind::Unknown;

    std::optional<AccountId> account_id;
    std::optional<std::string> account_name;

    /// override, иначе auto, иначе "Uncategorized"
    std::string effective_category() const;

    friend bool operator==(const Transaction& a, const Transaction& b);
    friend bool operator!=(const Transaction& a, const Transaction& b) { return !(a == b); }
};

// ============================================================================
// Triggers
// ============================================================================

enum class TriggerField {
    Description,
    AccountName,
    CounterParty,
    Amount,
    Date,
    Iban,
    CounterIban,
    TransactionType,
    Category,
    Notes,
    ExternalId,
    InternalReference,
    Tags
};

enum class TriggerOperator {
    Contains,
    StartsWith,
    EndsWith,
    Equals,
    Matches,
    GreaterThan,
    LessThan,
    GreaterThanOrEqual,
    LessThanOrEqual,
    Between,
    IsEmpty,
    IsNotEmpty,
    Before,
    After,
    On,
    Today,
    Yesterday,
    Tomorrow
};

/// Комбинатор группы: All = AND, Any = OR
enum class Combinator { All, Any };

/// Разделитель границ оператора between: "100..200"
constexpr std::string_view BETWEEN_SEPARATOR = "..";

struct Trigger {
    TriggerField field = TriggerField::Description;
    TriggerOperator op = TriggerOperator::Contains;
    std::string value;
    bool negate = false;
};

/// Узел дерева условий. Комбинатор применяется ко всем детям уровня:
/// и к листовым триггерам, и к вложенным группам.
struct TriggerGroup {
    Combinator combinator = Combinator::All;
    std::vector<Trigger> triggers;
    std::vector<TriggerGroup> groups;

    bool empty() const { return triggers.empty() && groups.empty(); }
};

// ============================================================================
// Actions
// ============================================================================

enum class ActionType {
    SetCategory,
    ClearCategory,
    SetNotes,
    SetDescription,
    AppendDescription,
    PrependDescription,
    AddTag,
    RemoveTag,
    ClearAllTags,
    SetCounterParty,
    SetSourceAccount,
    SetDestinationAccount,
    SwapAccounts,
    ConvertToDeposit,
    ConvertToWithdrawal,
    ConvertToTransfer,
    DeleteTransaction,
    SetExternalId,
    SetInternalReference
};

struct RuleAction {
    ActionType type = ActionType::SetCategory;
    std::string value;
};

/// Требует ли действие непустого значения
bool requires_value(ActionType type);

// ============================================================================
// Rules
// ============================================================================

struct RuleStatistics {
    std::int64_t match_count = 0;
    std::int64_t total_evaluations = 0;
    std::int64_t error_count = 0;
    std::optional<value::Date> last_matched_at;

    /// Доля совпадений в процентах (0..100)
    double match_rate() const;
    /// Доля ошибок среди совпадений в процентах (0..100)
    double error_rate() const;
};

struct RuleGroup {
    GroupId id = 0;
    std::string name;
    int order = 0;
    bool active = true;
};

struct Rule {
    RuleId id = 0;
    std::string name;
    int priority = 0;  // меньше - раньше
    bool active = true;
    bool stop_processing = false;
    std::optional<GroupId> group_id;

    // Ровно один корень. nullopt только у структурно повреждённых правил,
    // такое правило ничему не соответствует.
    std::optional<TriggerGroup> root = TriggerGroup{};

    std::vector<RuleAction> actions;
    RuleStatistics stats;
};

// ============================================================================
// Parse / to_string
// ============================================================================

/// @throw std::invalid_argument если строка не распознана
TriggerField parse_field(std::string_view s);
TriggerOperator parse_operator(std::string_view s);
ActionType parse_action_type(std::string_view s);
Combinator parse_combinator(std::string_view s);
/// Принимает синонимы: deposit = income, withdrawal = expense
TransactionKind parse_kind(std::string_view s);

std::string to_string(TriggerField f);
std::string to_string(TriggerOperator op);
std::string to_string(ActionType t);
std::string to_string(Combinator c);
std::string to_string(TransactionKind k);

/// Полные списки значений перечислений
const std::vector<TriggerField>& all_fields();
const std::vector<TriggerOperator>& all_operators();
const std::vector<ActionType>& all_action_types();

}  // namespace tally::model

#endif  // TALLY_MODEL_HPP
