// ==============================================================================
// test_field_gtest.cpp - Unit тесты для модуля tally::field
// ==============================================================================

#include <gtest/gtest.h>
#include <tally/field.hpp>

namespace field = tally::field;
namespace model = tally::model;
using tally::value::Date;
using tally::value::Decimal;

namespace {

model::Transaction sample_transaction() {
    model::Transaction tx;
    tx.id = 7;
    tx.amount = *Decimal::parse("-42.50");
    tx.date = Date{2024, 3, 15};
    tx.description = "AH Amsterdam 1234";
    tx.counter_name = "Albert Heijn";
    tx.counter_iban = "NL99AHBN0000000001";
    tx.iban = "NL01BANK0123456789";
    tx.kind = model::TransactionKind::Expense;
    tx.account_id = 1;
    tx.account_name = "Checking";
    return tx;
}

}  // namespace

// ============================================================================
// extract
// ============================================================================

TEST(FieldExtract, TextFields) {
    auto tx = sample_transaction();
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::Description, tx)),
              "AH Amsterdam 1234");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::AccountName, tx)),
              "Checking");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::CounterParty, tx)),
              "Albert Heijn");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::Iban, tx)),
              "NL01BANK0123456789");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::CounterIban, tx)),
              "NL99AHBN0000000001");
}

TEST(FieldExtract, AbsentOptionalIsEmptyText) {
    model::Transaction tx;
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::CounterParty, tx)), "");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::Notes, tx)), "");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::ExternalId, tx)), "");
}

TEST(FieldExtract, TypedFields) {
    auto tx = sample_transaction();
    EXPECT_EQ(std::get<Decimal>(field::extract(model::TriggerField::Amount, tx)),
              *Decimal::parse("-42.5"));
    EXPECT_EQ(std::get<Date>(field::extract(model::TriggerField::Date, tx)), (Date{2024, 3, 15}));
    EXPECT_EQ(std::get<model::TransactionKind>(
                  field::extract(model::TriggerField::TransactionType, tx)),
              model::TransactionKind::Expense);
}

TEST(FieldExtract, CategoryPrefersOverride) {
    auto tx = sample_transaction();
    auto unassigned = std::get<field::CategoryValue>(field::extract(model::TriggerField::Category, tx));
    EXPECT_FALSE(unassigned.assigned);
    EXPECT_EQ(unassigned.name, model::UNCATEGORIZED);

    tx.auto_category = "Groceries";
    auto automatic = std::get<field::CategoryValue>(field::extract(model::TriggerField::Category, tx));
    EXPECT_TRUE(automatic.assigned);
    EXPECT_EQ(automatic.name, "Groceries");

    tx.category_override = "Food";
    EXPECT_EQ(std::get<field::CategoryValue>(field::extract(model::TriggerField::Category, tx)).name,
              "Food");

    // Пустой override не считается назначенным
    tx.category_override = "";
    EXPECT_EQ(tx.effective_category(), "Groceries");
}

TEST(FieldExtract, MarkersFromNotes) {
    auto tx = sample_transaction();
    tx.notes = "imported | External ID: 42 | Ref: INV-7";
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::ExternalId, tx)), "42");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::InternalReference, tx)),
              "INV-7");
    // Tags - только сегмент без маркеров
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::Tags, tx)), "imported");
    EXPECT_EQ(std::get<std::string>(field::extract(model::TriggerField::Notes, tx)), *tx.notes);
}

TEST(FieldExtract, ToText) {
    EXPECT_EQ(field::to_text(field::TypedValue{*Decimal::parse("-1500.00")}), "-1500");
    EXPECT_EQ(field::to_text(field::TypedValue{Date{2024, 1, 2}}), "2024-01-02");
    EXPECT_EQ(field::to_text(field::TypedValue{model::TransactionKind::Income}), "income");
    EXPECT_EQ(field::to_text(field::TypedValue{field::CategoryValue{"Rent", true}}), "Rent");
}

TEST(FieldType, Mapping) {
    EXPECT_EQ(field::field_type(model::TriggerField::Amount), field::FieldType::Number);
    EXPECT_EQ(field::field_type(model::TriggerField::Date), field::FieldType::Date);
    EXPECT_EQ(field::field_type(model::TriggerField::Category), field::FieldType::Category);
    EXPECT_EQ(field::field_type(model::TriggerField::TransactionType), field::FieldType::Kind);
    EXPECT_EQ(field::field_type(model::TriggerField::Tags), field::FieldType::Text);
}

// ============================================================================
// Кодек notes
// ============================================================================

TEST(NotesCodec, ParseTags) {
    auto tags = field::parse_tags(std::string("food,  weekly ,, large-expense"));
    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(tags[0], "food");
    EXPECT_EQ(tags[1], "weekly");
    EXPECT_EQ(tags[2], "large-expense");
    EXPECT_TRUE(field::parse_tags(std::nullopt).empty());
}

TEST(NotesCodec, FormatTags) {
    EXPECT_EQ(field::format_tags({"a", "b"}), std::optional<std::string>("a, b"));
    EXPECT_FALSE(field::format_tags({}).has_value());
}

TEST(NotesCodec, FindMarkerTakesLast) {
    std::optional<std::string> notes = "External ID: 1 | x | External ID: 2";
    EXPECT_EQ(field::find_marker(notes, field::EXTERNAL_ID_MARKER), std::optional<std::string>("2"));
    EXPECT_FALSE(field::find_marker(notes, field::TRANSFER_MARKER).has_value());
    EXPECT_FALSE(field::find_marker(std::nullopt, field::TRANSFER_MARKER).has_value());
}

TEST(NotesCodec, AppendSegment) {
    EXPECT_EQ(field::append_segment(std::nullopt, "Ref: A"), "Ref: A");
    EXPECT_EQ(field::append_segment(std::string("note"), "Ref: A"), "note | Ref: A");
}

TEST(NotesCodec, ReplaceMarker) {
    std::optional<std::string> notes = "a | Transfer to: Old | b | Transfer to: Older";
    EXPECT_EQ(field::replace_marker(notes, field::TRANSFER_MARKER, "Transfer to: New"),
              "a | Transfer to: New | b");
    EXPECT_EQ(field::replace_marker(std::string("a"), field::TRANSFER_MARKER, "Transfer to: X"),
              "a | Transfer to: X");
}

TEST(NotesCodec, SplitAndJoin) {
    auto parts = field::split_notes(std::string("[DELETED by rule] food | Ref: A"));
    EXPECT_TRUE(parts.deleted);
    ASSERT_EQ(parts.segments.size(), 2u);
    EXPECT_EQ(parts.segments[0], "food");
    EXPECT_EQ(parts.segments[1], "Ref: A");
    EXPECT_EQ(field::join_notes(parts), std::optional<std::string>("[DELETED by rule] food | Ref: A"));

    EXPECT_FALSE(field::join_notes(field::split_notes(std::nullopt)).has_value());
    EXPECT_TRUE(field::is_marker_segment("Transfer to: Savings"));
    EXPECT_FALSE(field::is_marker_segment("groceries"));
}

TEST(NotesCodec, TagsSkipMarkerSegments) {
    std::optional<std::string> notes = "External ID: 42 | food, weekly | Ref: INV-7";
    auto tags = field::parse_tags(notes);
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[1], "weekly");

    EXPECT_TRUE(field::parse_tags(std::string("External ID: 1, 2")).empty());
}

TEST(NotesCodec, WithTagsKeepsMarkers) {
    std::optional<std::string> notes = "External ID: 42";
    notes = field::with_tags(notes, {"work"});
    EXPECT_EQ(notes, std::optional<std::string>("work | External ID: 42"));
    EXPECT_EQ(field::find_marker(notes, field::EXTERNAL_ID_MARKER), std::optional<std::string>("42"));

    notes = field::with_tags(notes, {"work", "travel"});
    EXPECT_EQ(notes, std::optional<std::string>("work, travel | External ID: 42"));

    EXPECT_EQ(field::with_tags(notes, {}), std::optional<std::string>("External ID: 42"));
    EXPECT_FALSE(field::with_tags(std::string("a, b"), {}).has_value());
    EXPECT_EQ(field::with_tags(std::string("[DELETED by rule]"), {"x"}),
              std::optional<std::string>("[DELETED by rule] x"));
}

TEST(NotesCodec, DeletedMarker) {
    model::Transaction tx;
    EXPECT_FALSE(field::is_deleted(tx));
    tx.notes = "[DELETED by rule] original";
    EXPECT_TRUE(field::is_deleted(tx));
}
