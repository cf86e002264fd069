// ==============================================================================
// test_rule_gtest.cpp - Unit тесты для модуля tally::rule
// ==============================================================================
//
// Загрузка книги правил из YAML, отбор активных правил, lint, запись YAML.
//
// ==============================================================================

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <tally/rule.hpp>

namespace model = tally::model;
namespace rule = tally::rule;
namespace trigger = tally::trigger;
using model::ActionType;
using model::TriggerField;
using model::TriggerOperator;

// ============================================================================
// Test Fixtures Path
// ============================================================================

#ifndef TALLY_SOURCE_DIR
#define TALLY_SOURCE_DIR "."
#endif

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(TALLY_SOURCE_DIR) / "tests" / "fixtures" / "rules";
}

bool has_issue(const rule::LintResult& result, trigger::Severity severity,
               const std::string& fragment) {
    return std::any_of(result.issues.begin(), result.issues.end(), [&](const trigger::Issue& i) {
        return i.severity == severity && i.message.find(fragment) != std::string::npos;
    });
}

}  // namespace

// ============================================================================
// Загрузка
// ============================================================================

TEST(RuleBookLoader, LoadBasicBook) {
    auto result = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();

    const auto& book = result.book;
    ASSERT_EQ(book.groups.size(), 3u);
    ASSERT_EQ(book.rules.size(), 6u);
    EXPECT_EQ(book.groups[2].name, "Archive");
    EXPECT_FALSE(book.groups[2].active);

    const auto* netflix = book.find_rule(10);
    ASSERT_NE(netflix, nullptr);
    EXPECT_EQ(netflix->name, "Netflix");
    EXPECT_EQ(netflix->group_id, std::optional<model::GroupId>(2));
    EXPECT_EQ(netflix->priority, 1);
    EXPECT_TRUE(netflix->active);
    EXPECT_FALSE(netflix->stop_processing);
    ASSERT_TRUE(netflix->root.has_value());
    ASSERT_EQ(netflix->root->triggers.size(), 1u);
    EXPECT_EQ(netflix->root->triggers[0].field, TriggerField::Description);
    EXPECT_EQ(netflix->root->triggers[0].op, TriggerOperator::Contains);
    EXPECT_EQ(netflix->root->triggers[0].value, "netflix");
    ASSERT_EQ(netflix->actions.size(), 1u);
    EXPECT_EQ(netflix->actions[0].type, ActionType::SetCategory);
    EXPECT_EQ(netflix->actions[0].value, "Subscriptions");
}

TEST(RuleBookLoader, NestedGroupsAndNegation) {
    auto result = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();

    const auto* large = result.book.find_rule(30);
    ASSERT_NE(large, nullptr);
    EXPECT_FALSE(large->group_id.has_value());
    ASSERT_EQ(large->root->triggers.size(), 2u);
    ASSERT_EQ(large->root->groups.size(), 1u);

    const auto& nested = large->root->groups[0];
    EXPECT_EQ(nested.combinator, model::Combinator::Any);
    ASSERT_EQ(nested.triggers.size(), 2u);
    EXPECT_TRUE(nested.triggers[1].negate);
}

TEST(RuleBookLoader, StatsAndDefaults) {
    auto result = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();

    const auto* disabled = result.book.find_rule(50);
    ASSERT_NE(disabled, nullptr);
    EXPECT_FALSE(disabled->active);
    EXPECT_EQ(disabled->stats.match_count, 3);
    EXPECT_EQ(disabled->stats.total_evaluations, 12);
    EXPECT_EQ(disabled->stats.error_count, 1);
    ASSERT_TRUE(disabled->stats.last_matched_at.has_value());
    EXPECT_EQ(disabled->stats.last_matched_at->to_string(), "2024-03-01");
    EXPECT_DOUBLE_EQ(disabled->stats.match_rate(), 25.0);

    // Триггер без value
    EXPECT_EQ(result.book.find_rule(40)->root->triggers[0].value, "");
}

TEST(RuleBookLoader, UnknownOperatorReportsPath) {
    auto result = rule::load(fixtures_path() / "invalid_operator.yml");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("rules[0].triggers.conditions[0]"), std::string::npos);
    EXPECT_NE(result.error.message.find("unknown trigger operator 'sounds_like'"), std::string::npos);
    EXPECT_NE(result.error.format().find("invalid_operator.yml"), std::string::npos);
}

TEST(RuleBookLoader, MissingTriggersKey) {
    auto result = rule::load(fixtures_path() / "missing_triggers.yml");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("missing 'triggers'"), std::string::npos);
}

TEST(RuleBookLoader, MalformedYaml) {
    auto result = rule::load(fixtures_path() / "malformed.yml");
    ASSERT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

TEST(RuleBookLoader, WrongExtension) {
    auto result = rule::load(fixtures_path() / "not_yaml.txt");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "rule book must have a yaml file extension");
}

TEST(RuleBookLoader, MissingFile) {
    auto result = rule::load(fixtures_path() / "does_not_exist.yml");
    ASSERT_FALSE(result.ok);
}

TEST(RuleBookLoader, LoadString) {
    auto result = rule::load_string(R"(
rules:
  - id: 1
    name: Any gym
    triggers:
      match: or
      conditions:
        - {field: description, operator: has_value}
    actions:
      - {type: add_tag, value: sport}
)");
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.book.rules.size(), 1u);
    EXPECT_EQ(result.book.rules[0].root->combinator, model::Combinator::Any);
    EXPECT_EQ(result.book.rules[0].root->triggers[0].op, TriggerOperator::IsNotEmpty);
}

TEST(RuleBookLoader, EmptyDocumentIsEmptyBook) {
    auto result = rule::load_string("");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.book.rules.empty());
}

TEST(RuleBookLoader, RulesMustBeList) {
    auto result = rule::load_string("rules: {id: 1}");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'rules' must be a list"), std::string::npos);
}

// ============================================================================
// RuleBook
// ============================================================================

TEST(RuleBook, ActiveRulesOrderedByGroup) {
    auto result = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();

    auto active = result.book.active_rules();
    std::vector<model::RuleId> ids;
    for (const auto& r : active) {
        ids.push_back(r.id);
    }
    // Группа 1 (Income), группа 2, затем правила без группы.
    // Группа 3 неактивна, правило 50 выключено.
    EXPECT_EQ(ids, (std::vector<model::RuleId>{20, 21, 10, 30}));
}

TEST(RuleBook, RemoveGroupUngroupsRules) {
    auto result = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();
    auto book = result.book;

    EXPECT_TRUE(book.remove_group(3));
    EXPECT_FALSE(book.remove_group(3));
    EXPECT_EQ(book.find_group(3), nullptr);
    EXPECT_FALSE(book.find_rule(40)->group_id.has_value());

    // Правило из неактивной группы становится активным
    auto active = book.active_rules();
    EXPECT_TRUE(std::any_of(active.begin(), active.end(),
                            [](const model::Rule& r) { return r.id == 40; }));
}

TEST(RuleBook, FindRuleMutable) {
    rule::RuleBook book;
    book.rules.push_back(model::Rule{});
    book.rules[0].id = 5;
    book.find_rule(5)->name = "renamed";
    EXPECT_EQ(book.rules[0].name, "renamed");
    EXPECT_EQ(book.find_rule(6), nullptr);
}

// ============================================================================
// Lint
// ============================================================================

TEST(RuleBookLint, BasicBookIsClean) {
    auto result = rule::lint(fixtures_path() / "basic.yml");
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.error_count(), 0u);
    EXPECT_EQ(result.warning_count(), 0u);
}

TEST(RuleBookLint, ReportsIssues) {
    auto result = rule::lint(fixtures_path() / "lint_issues.yml");
    ASSERT_TRUE(result.ok) << result.error.format();

    using trigger::Severity;
    EXPECT_TRUE(has_issue(result, Severity::Error, "group 1: duplicate id"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "rule 1 'Duplicate id': duplicate id"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "unknown group 9"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "invalid regular expression '(unclosed'"));
    EXPECT_TRUE(has_issue(result, Severity::Warning, "no triggers, rule matches every transaction"));
    EXPECT_TRUE(has_issue(result, Severity::Warning, "'Duplicate id': no actions"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "amount contains: operator is not valid for this field"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "lower bound exceeds upper bound"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "actions[0]: set_source_account requires a value"));
    EXPECT_TRUE(has_issue(result, Severity::Error, "rule 4 'No root': missing trigger root"));
    EXPECT_GE(result.error_count(), 8u);
}

TEST(RuleBookLint, LoadFailureIsNotOk) {
    auto result = rule::lint(fixtures_path() / "invalid_operator.yml");
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.issues.empty());
}

TEST(RuleBookLint, OrRootWithoutTriggers) {
    rule::RuleBook book;
    model::Rule r;
    r.id = 1;
    r.name = "empty or";
    r.root = model::TriggerGroup{model::Combinator::Any, {}, {}};
    r.actions = {{ActionType::ClearCategory, ""}};
    book.rules.push_back(r);

    auto result = rule::lint(book);
    EXPECT_TRUE(has_issue(result, trigger::Severity::Warning, "no triggers, rule never matches"));
    EXPECT_EQ(result.error_count(), 0u);
}

// ============================================================================
// Запись YAML
// ============================================================================

TEST(RuleBookYaml, EmittedBookLoadsBack) {
    auto original = rule::load(fixtures_path() / "basic.yml");
    ASSERT_TRUE(original.ok) << original.error.format();

    auto text = rule::to_yaml(original.book);
    auto reloaded = rule::load_string(text);
    ASSERT_TRUE(reloaded.ok) << reloaded.error.format() << "\n" << text;

    ASSERT_EQ(reloaded.book.rules.size(), original.book.rules.size());
    ASSERT_EQ(reloaded.book.groups.size(), original.book.groups.size());
    for (std::size_t i = 0; i < original.book.rules.size(); ++i) {
        const auto& a = original.book.rules[i];
        const auto& b = reloaded.book.rules[i];
        EXPECT_EQ(a.id, b.id);
        EXPECT_EQ(a.name, b.name);
        EXPECT_EQ(a.group_id, b.group_id);
        EXPECT_EQ(a.stop_processing, b.stop_processing);
        EXPECT_EQ(a.actions.size(), b.actions.size());
        EXPECT_EQ(a.stats.match_count, b.stats.match_count);
    }
    const auto* large = reloaded.book.find_rule(30);
    ASSERT_NE(large, nullptr);
    EXPECT_EQ(large->root->groups.size(), 1u);
    EXPECT_TRUE(large->root->groups[0].triggers[1].negate);
    EXPECT_EQ(large->root->triggers[0].value, "1000");
}

TEST(RuleBookYaml, RuleWithoutRootEmitsNull) {
    model::Rule r;
    r.id = 7;
    r.name = "orphan";
    r.root.reset();

    rule::RuleBook book;
    book.rules.push_back(r);
    auto reloaded = rule::load_string(rule::to_yaml(book));
    ASSERT_TRUE(reloaded.ok) << reloaded.error.format();
    EXPECT_FALSE(reloaded.book.rules[0].root.has_value());
}

TEST(RuleBookYaml, SingleRuleContainsFields) {
    model::Rule r;
    r.id = 3;
    r.name = "Coffee";
    r.root = model::TriggerGroup{
        model::Combinator::All, {{TriggerField::Description, TriggerOperator::Contains, "coffee", false}}, {}};
    r.actions = {{ActionType::AddTag, "coffee"}};

    auto text = rule::to_yaml(r);
    EXPECT_NE(text.find("name: Coffee"), std::string::npos);
    EXPECT_NE(text.find("operator: contains"), std::string::npos);
    EXPECT_NE(text.find("type: add_tag"), std::string::npos);
    EXPECT_EQ(text.find("stats"), std::string::npos);
}
