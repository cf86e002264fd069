// ==============================================================================
// tally/templates.hpp - Встроенные шаблоны правил
// ==============================================================================
//
// Готовые правила для типовых сценариев: подписки, переводы, продуктовые
// магазины, зарплата. Шаблон превращается в правило через create_rule().
//
// ==============================================================================

#ifndef TALLY_TEMPLATES_HPP
#define TALLY_TEMPLATES_HPP

#include <string>
#include <string_view>
#include <tally/model.hpp>
#include <vector>

namespace tally::templates {

enum class TemplateCategory { Categorization, Cleanup, Automation, Detection };

struct TemplateAction {
    model::ActionType type = model::ActionType::SetCategory;
    std::string value;
    bool stop_processing = false;
};

struct RuleTemplate {
    std::string name;
    std::string description;
    TemplateCategory category = TemplateCategory::Categorization;
    std::vector<model::Trigger> triggers;
    std::vector<TemplateAction> actions;
    std::vector<std::string> tags;

    /// Правило с корнем AND из триггеров шаблона.
    /// stop_processing выставляется, если его несёт любое действие.
    model::Rule create_rule(model::RuleId id) const;
};

/// Все шаблоны в фиксированном порядке
const std::vector<RuleTemplate>& all();

std::vector<RuleTemplate> for_category(TemplateCategory category);
std::vector<RuleTemplate> with_tag(std::string_view tag);

/// Поиск без учёта регистра по имени, описанию и тегам.
/// Пустой запрос возвращает все шаблоны.
std::vector<RuleTemplate> search(std::string_view query);

/// Шаблон по имени (без учёта регистра), nullptr если нет
const RuleTemplate* find(std::string_view name);

/// @throw std::invalid_argument если строка не распознана
TemplateCategory parse_category(std::string_view s);
std::string to_string(TemplateCategory category);

}  // namespace tally::templates

#endif  // TALLY_TEMPLATES_HPP
