// ==============================================================================
// test_trigger_gtest.cpp - Unit тесты для модуля tally::trigger
// ==============================================================================
//
// Операторы по типам полей, группы AND/OR, negate, валидация.
// Свойства проверяются на случайных деревьях с фиксированным seed.
//
// ==============================================================================

#include <gtest/gtest.h>
#include <random>
#include <tally/trigger.hpp>

namespace model = tally::model;
namespace trigger = tally::trigger;
using model::Combinator;
using model::TriggerField;
using model::TriggerOperator;
using tally::value::Date;
using tally::value::Decimal;

namespace {

model::Trigger make(TriggerField f, TriggerOperator op, std::string v = "", bool negate = false) {
    return model::Trigger{f, op, std::move(v), negate};
}

model::Transaction expense(const std::string& amount, const std::string& description) {
    model::Transaction tx;
    tx.id = 1;
    tx.amount = *Decimal::parse(amount);
    tx.date = Date{2024, 3, 15};
    tx.description = description;
    tx.kind = model::TransactionKind::Expense;
    tx.iban = "NL01BANK0123456789";
    return tx;
}

trigger::Context fixed_context() {
    trigger::Context ctx;
    ctx.today = Date{2024, 3, 15};
    return ctx;
}

}  // namespace

// ============================================================================
// Текстовые операторы
// ============================================================================

TEST(TriggerText, ContainsIsCaseInsensitive) {
    auto tx = expense("-12.99", "NETFLIX.COM");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Contains, "netflix"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Contains, "spotify"), tx));
}

TEST(TriggerText, StartsEndsEquals) {
    auto tx = expense("-5", "AH Amsterdam");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::StartsWith, "ah "), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::EndsWith, "DAM"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Equals, " ah amsterdam "), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Equals, "AH"), tx));
}

TEST(TriggerText, Matches) {
    auto tx = expense("-5", "Jumbo Supermarkt 0042");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Matches, "(albert heijn|jumbo|lidl)"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Matches, "(?i)supermarkt\\s+\\d+"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Matches, "^lidl"), tx));
}

TEST(TriggerText, InvalidRegexNeverMatches) {
    trigger::clear_regex_cache();
    auto tx = expense("-5", "(unclosed");
    auto t = make(TriggerField::Description, TriggerOperator::Matches, "(unclosed");
    EXPECT_FALSE(trigger::evaluate(t, tx));
    // Повторно из кэша
    EXPECT_FALSE(trigger::evaluate(t, tx));
}

TEST(TriggerText, EmptyChecks) {
    auto tx = expense("-5", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::CounterParty, TriggerOperator::IsEmpty), tx));
    tx.counter_name = "   ";
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::CounterParty, TriggerOperator::IsEmpty), tx));
    tx.counter_name = "Shop";
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::CounterParty, TriggerOperator::IsNotEmpty), tx));
}

TEST(TriggerText, CategoryEmptyMeansUnassigned) {
    auto tx = expense("-5", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Category, TriggerOperator::IsEmpty), tx));
    tx.auto_category = "Groceries";
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Category, TriggerOperator::IsEmpty), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Category, TriggerOperator::Equals, "groceries"), tx));
}

TEST(TriggerText, TagsSearchNotes) {
    auto tx = expense("-5", "x");
    tx.notes = "weekly, large-expense";
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Tags, TriggerOperator::Contains, "large-expense"), tx));
}

// ============================================================================
// Числовые операторы
// ============================================================================

TEST(TriggerNumber, PositiveBoundComparesMagnitude) {
    auto tx = expense("-1500.00", "Rent");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::GreaterThan, "1000"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::LessThan, "1000"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Equals, "1500"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::GreaterThanOrEqual, "1500.00"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::LessThanOrEqual, "1500"), tx));
}

TEST(TriggerNumber, NegativeBoundComparesSigned) {
    auto tx = expense("-12.99", "Netflix");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::GreaterThan, "-50"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::LessThan, "-2"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::GreaterThan, "-10"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Equals, "-12.99"), tx));
}

TEST(TriggerNumber, Between) {
    auto tx = expense("-42.50", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Between, "40..50"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Between, "-50..-40"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Between, "0..40"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Between, "40-50"), tx));
}

TEST(TriggerNumber, UnparsableValueIsFalse) {
    auto tx = expense("-42.50", "x");
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::GreaterThan, "lots"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Amount, TriggerOperator::Equals, ""), tx));
}

// ============================================================================
// Даты
// ============================================================================

TEST(TriggerDate, BeforeAfterOn) {
    auto tx = expense("-1", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Before, "2024-04-01"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::After, "29/02/2024"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::On, "2024-03-15"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Equals, "15-03-2024"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::On, "not a date"), tx));
}

TEST(TriggerDate, BetweenInclusive) {
    auto tx = expense("-1", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Between, "2024-03-01..2024-03-15"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Between, "2024-03-16..2024-03-31"), tx));
}

TEST(TriggerDate, RelativeToContext) {
    auto tx = expense("-1", "x");
    auto ctx = fixed_context();
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Today), tx, ctx));

    ctx.today = Date{2024, 3, 16};
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Yesterday), tx, ctx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Today), tx, ctx));

    ctx.today = Date{2024, 3, 14};
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Date, TriggerOperator::Tomorrow), tx, ctx));
}

// ============================================================================
// Тип транзакции
// ============================================================================

TEST(TriggerKind, EqualsAcceptsAliases) {
    auto tx = expense("-1", "x");
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::TransactionType, TriggerOperator::Equals, "withdrawal"), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::TransactionType, TriggerOperator::Equals, "Expense"), tx));
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::TransactionType, TriggerOperator::Equals, "deposit"), tx));
}

// ============================================================================
// Negation
// ============================================================================

TEST(TriggerNegation, InvertsResult) {
    auto tx = expense("-12.99", "NETFLIX.COM");
    EXPECT_FALSE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Contains, "netflix", true), tx));
    EXPECT_TRUE(trigger::evaluate(make(TriggerField::Description, TriggerOperator::Contains, "spotify", true), tx));
}

TEST(TriggerNegation, HoldsForEveryFieldAndOperator) {
    std::vector<model::Transaction> transactions;
    transactions.push_back(expense("-12.99", "NETFLIX.COM"));
    transactions.push_back(expense("1500", ""));
    transactions.back().notes = "External ID: 9";
    transactions.back().auto_category = "Salary";
    transactions.push_back(model::Transaction{});

    const std::vector<std::string> values = {"", "netflix", "10", "-20", "0..2000", "2024-03-15",
                                             "(", "income"};
    auto ctx = fixed_context();
    for (const auto& tx : transactions) {
        for (auto f : model::all_fields()) {
            for (auto op : model::all_operators()) {
                for (const auto& v : values) {
                    bool plain = trigger::evaluate(make(f, op, v, false), tx, ctx);
                    bool negated = trigger::evaluate(make(f, op, v, true), tx, ctx);
                    EXPECT_NE(plain, negated) << model::to_string(f) << " " << model::to_string(op)
                                              << " '" << v << "'";
                }
            }
        }
    }
}

// ============================================================================
// Группы
// ============================================================================

TEST(TriggerGroup, EmptyGroupIdentity) {
    model::TriggerGroup all_group{Combinator::All, {}, {}};
    model::TriggerGroup any_group{Combinator::Any, {}, {}};

    for (const auto& tx : {expense("-1", "a"), expense("2500", "b"), model::Transaction{}}) {
        EXPECT_TRUE(trigger::evaluate_group(all_group, tx));
        EXPECT_FALSE(trigger::evaluate_group(any_group, tx));
    }
}

TEST(TriggerGroup, AndRequiresAll) {
    model::TriggerGroup g{Combinator::All,
                          {make(TriggerField::Amount, TriggerOperator::GreaterThan, "1000"),
                           make(TriggerField::TransactionType, TriggerOperator::Equals, "withdrawal")},
                          {}};
    EXPECT_TRUE(trigger::evaluate_group(g, expense("-1500.00", "Rent")));
    EXPECT_FALSE(trigger::evaluate_group(g, expense("-500.00", "Rent")));
}

TEST(TriggerGroup, OrWithNestedGroup) {
    model::TriggerGroup nested{Combinator::All,
                               {make(TriggerField::Description, TriggerOperator::Contains, "rent"),
                                make(TriggerField::Amount, TriggerOperator::GreaterThan, "1000")},
                               {}};
    model::TriggerGroup g{Combinator::Any,
                          {make(TriggerField::Description, TriggerOperator::Contains, "netflix")},
                          {nested}};

    EXPECT_TRUE(trigger::evaluate_group(g, expense("-12.99", "Netflix")));
    EXPECT_TRUE(trigger::evaluate_group(g, expense("-1500", "Rent April")));
    EXPECT_FALSE(trigger::evaluate_group(g, expense("-500", "Rent garage")));
}

TEST(TriggerGroup, RuleWithoutRootNeverMatches) {
    model::Rule rule;
    rule.root.reset();
    EXPECT_FALSE(trigger::evaluate_rule(rule, expense("-1", "x")));

    rule.root = model::TriggerGroup{};
    EXPECT_TRUE(trigger::evaluate_rule(rule, expense("-1", "x")));
}

TEST(TriggerGroup, DeepNesting) {
    model::TriggerGroup g{Combinator::All,
                          {make(TriggerField::Description, TriggerOperator::Contains, "rent")},
                          {}};
    for (int depth = 0; depth < 200; ++depth) {
        model::TriggerGroup outer;
        outer.combinator = (depth % 2 == 0) ? Combinator::Any : Combinator::All;
        outer.groups.push_back(std::move(g));
        g = std::move(outer);
    }

    EXPECT_TRUE(trigger::evaluate_group(g, expense("-1500", "Rent April")));
    EXPECT_FALSE(trigger::evaluate_group(g, expense("-12.99", "Netflix")));
}

// ----------------------------------------------------------------------------
// Сравнение с наивным вычислителем на случайных деревьях
// ----------------------------------------------------------------------------

namespace {

/// Вычисляет всех детей без раннего выхода
bool naive_evaluate(const model::TriggerGroup& group, const model::Transaction& tx,
                    const trigger::Context& ctx) {
    std::vector<bool> results;
    for (const auto& t : group.triggers) {
        results.push_back(trigger::evaluate(t, tx, ctx));
    }
    for (const auto& g : group.groups) {
        results.push_back(naive_evaluate(g, tx, ctx));
    }
    bool all = true;
    bool any = false;
    for (bool r : results) {
        all = all && r;
        any = any || r;
    }
    return group.combinator == Combinator::All ? all : any;
}

model::Trigger random_trigger(std::mt19937& rng) {
    static const std::vector<model::Trigger> pool = {
        make(TriggerField::Description, TriggerOperator::Contains, "netflix"),
        make(TriggerField::Description, TriggerOperator::StartsWith, "ah"),
        make(TriggerField::Description, TriggerOperator::Matches, "rent|huur"),
        make(TriggerField::Amount, TriggerOperator::GreaterThan, "100"),
        make(TriggerField::Amount, TriggerOperator::LessThan, "-20"),
        make(TriggerField::Amount, TriggerOperator::Between, "10..500"),
        make(TriggerField::TransactionType, TriggerOperator::Equals, "income"),
        make(TriggerField::Date, TriggerOperator::After, "2024-03-10"),
        make(TriggerField::Category, TriggerOperator::IsEmpty),
        make(TriggerField::Notes, TriggerOperator::Contains, "weekly"),
    };
    auto t = pool[std::uniform_int_distribution<std::size_t>(0, pool.size() - 1)(rng)];
    t.negate = std::bernoulli_distribution(0.3)(rng);
    return t;
}

model::TriggerGroup random_group(std::mt19937& rng, int depth) {
    model::TriggerGroup g;
    g.combinator = std::bernoulli_distribution(0.5)(rng) ? Combinator::All : Combinator::Any;
    int triggers = std::uniform_int_distribution<int>(0, 3)(rng);
    for (int i = 0; i < triggers; ++i) {
        g.triggers.push_back(random_trigger(rng));
    }
    if (depth > 0) {
        int groups = std::uniform_int_distribution<int>(0, 2)(rng);
        for (int i = 0; i < groups; ++i) {
            g.groups.push_back(random_group(rng, depth - 1));
        }
    }
    return g;
}

model::Transaction random_transaction(std::mt19937& rng) {
    static const std::vector<std::string> descriptions = {"NETFLIX.COM", "AH Amsterdam", "Huur april",
                                                          "Salary", ""};
    static const std::vector<std::string> amounts = {"-12.99", "-250", "1500", "15", "-5"};
    model::Transaction tx;
    tx.description = descriptions[std::uniform_int_distribution<std::size_t>(0, 4)(rng)];
    tx.amount = *Decimal::parse(amounts[std::uniform_int_distribution<std::size_t>(0, 4)(rng)]);
    tx.kind = tx.amount.is_negative() ? model::TransactionKind::Expense
                                      : model::TransactionKind::Income;
    tx.date = Date{2024, 3, 1}.add_days(std::uniform_int_distribution<int>(0, 20)(rng));
    if (std::bernoulli_distribution(0.5)(rng)) {
        tx.auto_category = "Misc";
    }
    if (std::bernoulli_distribution(0.3)(rng)) {
        tx.notes = "weekly";
    }
    return tx;
}

}  // namespace

TEST(TriggerGroup, ShortCircuitMatchesNaiveEvaluation) {
    std::mt19937 rng(20240315);
    auto ctx = fixed_context();
    for (int i = 0; i < 500; ++i) {
        auto group = random_group(rng, 3);
        for (int j = 0; j < 10; ++j) {
            auto tx = random_transaction(rng);
            ASSERT_EQ(trigger::evaluate_group(group, tx, ctx), naive_evaluate(group, tx, ctx))
                << "tree " << i << ", transaction " << j;
        }
    }
}

// ============================================================================
// Валидация
// ============================================================================

TEST(TriggerValidate, AcceptsWellFormed) {
    EXPECT_TRUE(trigger::validate(make(TriggerField::Description, TriggerOperator::Contains, "x")).empty());
    EXPECT_TRUE(trigger::validate(make(TriggerField::Amount, TriggerOperator::Between, "10..20")).empty());
    EXPECT_TRUE(trigger::validate(make(TriggerField::Date, TriggerOperator::Today)).empty());
}

TEST(TriggerValidate, IncompatibleOperator) {
    auto issues = trigger::validate(make(TriggerField::Amount, TriggerOperator::Contains, "12"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].severity, trigger::Severity::Error);
    EXPECT_NE(issues[0].message.find("not valid for this field"), std::string::npos);
    EXPECT_FALSE(trigger::is_compatible(TriggerField::Description, TriggerOperator::Before));
    EXPECT_TRUE(trigger::is_compatible(TriggerField::Date, TriggerOperator::Between));
}

TEST(TriggerValidate, MissingAndIgnoredValue) {
    auto missing = trigger::validate(make(TriggerField::Description, TriggerOperator::Contains, " "));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].severity, trigger::Severity::Error);

    auto ignored = trigger::validate(make(TriggerField::Notes, TriggerOperator::IsEmpty, "x"));
    ASSERT_EQ(ignored.size(), 1u);
    EXPECT_EQ(ignored[0].severity, trigger::Severity::Warning);
}

TEST(TriggerValidate, BadValues) {
    EXPECT_FALSE(trigger::validate(make(TriggerField::Description, TriggerOperator::Matches, "(")).empty());
    EXPECT_FALSE(trigger::validate(make(TriggerField::Amount, TriggerOperator::GreaterThan, "ten")).empty());
    EXPECT_FALSE(trigger::validate(make(TriggerField::Date, TriggerOperator::Before, "soon")).empty());
    EXPECT_FALSE(trigger::validate(make(TriggerField::Amount, TriggerOperator::Between, "20..10")).empty());
    EXPECT_FALSE(trigger::validate(make(TriggerField::Amount, TriggerOperator::Between, "20")).empty());
}

TEST(TriggerValidate, GroupPathsInMessages) {
    model::TriggerGroup inner{Combinator::Any,
                              {make(TriggerField::Amount, TriggerOperator::Matches, "x")}, {}};
    model::TriggerGroup root{Combinator::All,
                             {make(TriggerField::Description, TriggerOperator::Contains, "ok")},
                             {inner}};
    auto issues = trigger::validate(root);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].message.rfind("triggers.groups[0].conditions[0]: ", 0), 0u);
}

// ============================================================================
// Сквозной сценарий: подписка Netflix
// ============================================================================

TEST(TriggerScenario, NetflixDescriptionMatchesRule) {
    model::Rule rule;
    rule.root = model::TriggerGroup{
        Combinator::All, {make(TriggerField::Description, TriggerOperator::Contains, "netflix")}, {}};
    EXPECT_TRUE(trigger::evaluate_rule(rule, expense("-12.99", "NETFLIX.COM")));
}
