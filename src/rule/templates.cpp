// ==============================================================================
// templates.cpp - Встроенные шаблоны правил
// ==============================================================================

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <tally/templates.hpp>
#include <tally/value.hpp>

namespace tally::templates {

using model::ActionType;
using model::TriggerField;
using model::TriggerOperator;

// ============================================================================
// Category
// ============================================================================

std::string to_string(TemplateCategory category) {
    switch (category) {
    case TemplateCategory::Categorization:
        return "categorization";
    case TemplateCategory::Cleanup:
        return "cleanup";
    case TemplateCategory::Automation:
        return "automation";
    case TemplateCategory::Detection:
        return "detection";
    }
    return "unknown";
}

TemplateCategory parse_category(std::string_view s) {
    if (value::iequals(s, "categorization"))
        return TemplateCategory::Categorization;
    if (value::iequals(s, "cleanup"))
        return TemplateCategory::Cleanup;
    if (value::iequals(s, "automation"))
        return TemplateCategory::Automation;
    if (value::iequals(s, "detection"))
        return TemplateCategory::Detection;
    throw std::invalid_argument(
        "unknown template category, must be: categorization, cleanup, automation or detection");
}

// ============================================================================
// RuleTemplate
// ============================================================================

model::Rule RuleTemplate::create_rule(model::RuleId id) const {
    model::Rule rule;
    rule.id = id;
    rule.name = name;
    rule.root = model::TriggerGroup{model::Combinator::All, triggers, {}};
    for (const auto& a : actions) {
        rule.actions.push_back(model::RuleAction{a.type, a.value});
        rule.stop_processing = rule.stop_processing || a.stop_processing;
    }
    return rule;
}

// ============================================================================
// Built-in templates
// ============================================================================

namespace {

std::vector<RuleTemplate> build_templates() {
    std::vector<RuleTemplate> list;

    list.push_back(RuleTemplate{
        "Subscription Detection",
        "Automatically categorize recurring small payments as subscriptions",
        TemplateCategory::Categorization,
        {
            {TriggerField::Amount, TriggerOperator::GreaterThan, "-50", false},
            {TriggerField::Amount, TriggerOperator::LessThan, "-2", false},
            {TriggerField::Description, TriggerOperator::Contains, "subscription", false},
        },
        {{ActionType::SetCategory, "Subscriptions", true}},
        {"automation", "categorization", "subscriptions"},
    });

    list.push_back(RuleTemplate{
        "Transfer Cleanup",
        "Remove categories from inter-account transfers",
        TemplateCategory::Cleanup,
        {{TriggerField::Description, TriggerOperator::Contains, "overboeking", false}},
        {{ActionType::ClearCategory, "", true}},
        {"cleanup", "transfers"},
    });

    list.push_back(RuleTemplate{
        "Merchant Standardization",
        "Standardize merchant names (Albert Heijn variations)",
        TemplateCategory::Cleanup,
        {{TriggerField::CounterParty, TriggerOperator::Contains, "AH ", false}},
        {
            {ActionType::SetCounterParty, "Albert Heijn", false},
            {ActionType::SetCategory, "Groceries", false},
        },
        {"standardization", "merchants", "groceries"},
    });

    list.push_back(RuleTemplate{
        "Grocery Store Detection",
        "Auto-categorize common Dutch grocery stores",
        TemplateCategory::Categorization,
        {{TriggerField::CounterParty, TriggerOperator::Matches,
          "(?i)(albert heijn|jumbo|lidl|aldi|plus|coop)", false}},
        {{ActionType::SetCategory, "Groceries", true}},
        {"categorization", "groceries", "regex"},
    });

    list.push_back(RuleTemplate{
        "Salary Detection",
        "Automatically categorize salary payments",
        TemplateCategory::Categorization,
        {
            {TriggerField::Amount, TriggerOperator::GreaterThan, "1000", false},
            {TriggerField::Description, TriggerOperator::Matches, "(?i)(salaris|loon|salary)",
             false},
        },
        {{ActionType::SetCategory, "Salary", true}},
        {"categorization", "income", "salary"},
    });

    return list;
}

template <typename Pred>
std::vector<RuleTemplate> select(Pred&& pred) {
    std::vector<RuleTemplate> out;
    std::copy_if(all().begin(), all().end(), std::back_inserter(out), pred);
    return out;
}

}  // anonymous namespace

const std::vector<RuleTemplate>& all() {
    static const std::vector<RuleTemplate> templates = build_templates();
    return templates;
}

std::vector<RuleTemplate> for_category(TemplateCategory category) {
    return select([category](const RuleTemplate& t) { return t.category == category; });
}

std::vector<RuleTemplate> with_tag(std::string_view tag) {
    return select([tag](const RuleTemplate& t) {
        return std::find(t.tags.begin(), t.tags.end(), tag) != t.tags.end();
    });
}

std::vector<RuleTemplate> search(std::string_view query) {
    auto q = value::trim(query);
    if (q.empty()) {
        return all();
    }
    return select([q](const RuleTemplate& t) {
        return value::icontains(t.name, q) || value::icontains(t.description, q) ||
               std::any_of(t.tags.begin(), t.tags.end(),
                           [q](const std::string& tag) { return value::icontains(tag, q); });
    });
}

const RuleTemplate* find(std::string_view name) {
    const auto& list = all();
    auto it = std::find_if(list.begin(), list.end(),
                           [name](const RuleTemplate& t) { return value::iequals(t.name, name); });
    return it == list.end() ? nullptr : &*it;
}

}  // namespace tally::templates
