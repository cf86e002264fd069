// ==============================================================================
// tally/field.hpp - Доступ к полям транзакции
// ==============================================================================
//
// Назначение:
// - Извлечение типизированного значения поля транзакции (TypedValue)
// - Кодек поля notes: теги и служебные маркеры
//
// extract() - тотальная функция: отсутствующие данные дают значение по
// умолчанию (пустая строка, ноль, "Uncategorized"), исключений нет.
//
// Формат notes:
//   теги            "groceries, large-expense"     (через ", ")
//   маркеры         "External ID: 42 | Ref: ABC"   (через " | ")
//   удаление        "[DELETED by rule] ..."        (префикс)
//
// Теги живут в одном сегменте без маркера и никогда не смешиваются
// с сегментами маркеров.
//
// ==============================================================================

#ifndef TALLY_FIELD_HPP
#define TALLY_FIELD_HPP

#include <optional>
#include <string>
#include <string_view>
#include <tally/model.hpp>
#include <tally/value.hpp>
#include <variant>
#include <vector>

namespace tally::field {

// ============================================================================
// TypedValue
// ============================================================================

/// Категория транзакции: имя эффективной категории и признак назначения
struct CategoryValue {
    std::string name;
    bool assigned = false;
};

/// Text | Number | Date | Category | TransactionKind
using TypedValue = std::variant<std::string, value::Decimal, value::Date, CategoryValue,
                                model::TransactionKind>;

/// Семантический тип поля
enum class FieldType { Text, Number, Date, Category, Kind };

FieldType field_type(model::TriggerField f);

/// Извлечь значение поля
TypedValue extract(model::TriggerField f, const model::Transaction& tx);

/// Текстовое представление значения для строковых операторов
std::string to_text(const TypedValue& v);

// ============================================================================
// Кодек notes
// ============================================================================

constexpr std::string_view TAG_SEPARATOR = ", ";
constexpr std::string_view MARKER_SEPARATOR = " | ";
constexpr std::string_view EXTERNAL_ID_MARKER = "External ID: ";
constexpr std::string_view INTERNAL_REFERENCE_MARKER = "Ref: ";
constexpr std::string_view TRANSFER_MARKER = "Transfer to: ";
constexpr std::string_view DELETED_MARKER = "[DELETED by rule]";

/// notes, разобранные на сегменты " | ". Порядок сегментов сохраняется.
struct Notes {
    bool deleted = false;  // префикс "[DELETED by rule]"
    std::vector<std::string> segments;
};

Notes split_notes(const std::optional<std::string>& notes);

/// Обратная сборка; без сегментов и без пометки удаления - nullopt
std::optional<std::string> join_notes(const Notes& notes);

/// Сегмент начинается с External ID / Ref / Transfer to
bool is_marker_segment(std::string_view segment);

/// Теги из первого сегмента без маркера: разбиение по "," с обрезкой
/// пробелов, пустые отбрасываются
std::vector<std::string> parse_tags(const std::optional<std::string>& notes);

/// Сериализация тегов; пустой список - nullopt
std::optional<std::string> format_tags(const std::vector<std::string>& tags);

/// Записать теги в notes. Сегменты маркеров и пометка удаления не меняются.
std::optional<std::string> with_tags(const std::optional<std::string>& notes,
                                     const std::vector<std::string>& tags);

/// Значение последнего маркера с данным префиксом ("External ID: 42" -> "42")
std::optional<std::string> find_marker(const std::optional<std::string>& notes,
                                       std::string_view marker);

/// Дописать сегмент в notes через " | "
std::string append_segment(const std::optional<std::string>& notes, std::string_view segment);

/// Заменить все сегменты с префиксом marker на segment (или дописать)
std::string replace_marker(const std::optional<std::string>& notes, std::string_view marker,
                           std::string_view segment);

/// Помечена ли транзакция как удалённая
bool is_deleted(const model::Transaction& tx);

}  // namespace tally::field

#endif  // TALLY_FIELD_HPP
