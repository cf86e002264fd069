// ==============================================================================
// snapshot.cpp - Снимок MemoryStore в JSON (RapidJSON)
// ==============================================================================
//
// Формат:
//   {
//     "accounts":     [{"id": 1, "name": "Checking", "iban": "NL01..."}],
//     "categories":   [{"id": 1, "name": "Groceries"}],
//     "transactions": [{"id": 1, "amount": "-12.50", "date": "2024-03-01", ...}],
//     "rule_statistics": {"10": {"match_count": 3, ...}}
//   }
//
// Числа читаются как строки (kParseNumbersAsStringsFlag), поэтому суммы
// не проходят через double и остаются точными.
//
// ==============================================================================

#include <charconv>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>
#include <stdexcept>
#include <tally/store.hpp>

namespace tally::store {

std::string Error::format() const {
    if (path.empty()) {
        return message;
    }
    return path + ": " + message;
}

namespace {

using model::Transaction;

// ============================================================================
// Чтение полей
// ============================================================================

/// Число или строка с числом (при kParseNumbersAsStringsFlag числа - строки)
std::int64_t read_int(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        throw std::invalid_argument(std::string("missing or invalid '") + key + "'");
    }
    std::string_view s(it->value.GetString(), it->value.GetStringLength());
    std::int64_t v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        throw std::invalid_argument(std::string("'") + key + "' is not an integer");
    }
    return v;
}

std::optional<std::int64_t> read_optional_int(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return std::nullopt;
    }
    return read_int(obj, key);
}

std::optional<std::string> read_optional_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return std::nullopt;
    }
    if (!it->value.IsString()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::string read_string(const rapidjson::Value& obj, const char* key) {
    return read_optional_string(obj, key).value_or(std::string());
}

Transaction read_transaction(const rapidjson::Value& obj) {
    if (!obj.IsObject()) {
        throw std::invalid_argument("transaction must be an object");
    }
    Transaction tx;
    tx.id = read_int(obj, "id");

    auto amount_text = read_optional_string(obj, "amount");
    if (amount_text) {
        auto amount = value::Decimal::parse(*amount_text);
        if (!amount) {
            throw std::invalid_argument("transaction " + std::to_string(tx.id) +
                                        ": invalid amount '" + *amount_text + "'");
        }
        tx.amount = *amount;
    }

    auto date_text = read_optional_string(obj, "date");
    if (date_text) {
        auto date = value::Date::parse(*date_text);
        if (!date) {
            throw std::invalid_argument("transaction " + std::to_string(tx.id) +
                                        ": invalid date '" + *date_text + "'");
        }
        tx.date = *date;
    }

    tx.description = read_string(obj, "description");
    tx.counter_name = read_optional_string(obj, "counter_name");
    tx.standardized_name = read_optional_string(obj, "standardized_name");
    tx.counter_iban = read_optional_string(obj, "counter_iban");
    tx.iban = read_string(obj, "iban");
    tx.category_override = read_optional_string(obj, "category_override");
    tx.auto_category = read_optional_string(obj, "auto_category");
    tx.notes = read_optional_string(obj, "notes");
    if (auto kind = read_optional_string(obj, "kind")) {
        tx.kind = model::parse_kind(*kind);
    }
    tx.account_id = read_optional_int(obj, "account_id");
    tx.account_name = read_optional_string(obj, "account_name");
    return tx;
}

model::RuleStatistics read_statistics(const rapidjson::Value& obj) {
    if (!obj.IsObject()) {
        throw std::invalid_argument("rule statistics must be an object");
    }
    model::RuleStatistics stats;
    stats.match_count = read_optional_int(obj, "match_count").value_or(0);
    stats.total_evaluations = read_optional_int(obj, "total_evaluations").value_or(0);
    stats.error_count = read_optional_int(obj, "error_count").value_or(0);
    if (auto last = read_optional_string(obj, "last_matched_at")) {
        stats.last_matched_at = value::Date::parse(*last);
    }
    return stats;
}

const rapidjson::Value* find_array(const rapidjson::Value& root, const char* key) {
    auto it = root.FindMember(key);
    if (it == root.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    if (!it->value.IsArray()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an array");
    }
    return &it->value;
}

// ============================================================================
// Запись полей
// ============================================================================

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value make_string(const std::string& s, Allocator& alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

rapidjson::Value make_optional(const std::optional<std::string>& s, Allocator& alloc) {
    if (!s) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return make_string(*s, alloc);
}

rapidjson::Value write_transaction(const Transaction& tx, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("id", rapidjson::Value(static_cast<std::int64_t>(tx.id)), alloc);
    obj.AddMember("amount", make_string(tx.amount.to_string(), alloc), alloc);
    obj.AddMember("date", make_string(tx.date.to_string(), alloc), alloc);
    obj.AddMember("description", make_string(tx.description, alloc), alloc);
    obj.AddMember("counter_name", make_optional(tx.counter_name, alloc), alloc);
    obj.AddMember("standardized_name", make_optional(tx.standardized_name, alloc), alloc);
    obj.AddMember("counter_iban", make_optional(tx.counter_iban, alloc), alloc);
    obj.AddMember("iban", make_string(tx.iban, alloc), alloc);
    obj.AddMember("category_override", make_optional(tx.category_override, alloc), alloc);
    obj.AddMember("auto_category", make_optional(tx.auto_category, alloc), alloc);
    obj.AddMember("notes", make_optional(tx.notes, alloc), alloc);
    obj.AddMember("kind", make_string(model::to_string(tx.kind), alloc), alloc);
    if (tx.account_id) {
        obj.AddMember("account_id", rapidjson::Value(static_cast<std::int64_t>(*tx.account_id)),
                      alloc);
    } else {
        obj.AddMember("account_id", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    obj.AddMember("account_name", make_optional(tx.account_name, alloc), alloc);
    return obj;
}

}  // namespace

// ============================================================================
// Загрузка
// ============================================================================

SnapshotResult parse_snapshot(std::string_view json, MemoryStore& store) {
    SnapshotResult result;

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseNumbersAsStringsFlag>(json.data(), json.size());
    if (doc.HasParseError()) {
        result.error = Error{std::string("JSON parse error: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()) +
                                 " at offset " + std::to_string(doc.GetErrorOffset()),
                             ""};
        return result;
    }
    if (!doc.IsObject()) {
        result.error = Error{"snapshot must be a JSON object", ""};
        return result;
    }

    try {
        if (auto accounts = find_array(doc, "accounts")) {
            for (const auto& a : accounts->GetArray()) {
                store.add_account(
                    model::Account{read_int(a, "id"), read_string(a, "name"), read_string(a, "iban")});
            }
        }
        if (auto categories = find_array(doc, "categories")) {
            for (const auto& c : categories->GetArray()) {
                store.add_category(model::Category{read_int(c, "id"), read_string(c, "name")});
            }
        }
        if (auto transactions = find_array(doc, "transactions")) {
            for (const auto& t : transactions->GetArray()) {
                store.put_transaction(read_transaction(t));
            }
        }
        auto stats = doc.FindMember("rule_statistics");
        if (stats != doc.MemberEnd() && stats->value.IsObject()) {
            for (const auto& entry : stats->value.GetObject()) {
                std::string_view key(entry.name.GetString(), entry.name.GetStringLength());
                model::RuleId id = 0;
                auto res = std::from_chars(key.data(), key.data() + key.size(), id);
                if (res.ec != std::errc() || res.ptr != key.data() + key.size()) {
                    throw std::invalid_argument("rule statistics key '" + std::string(key) +
                                                "' is not a rule id");
                }
                store.persist_rule_statistics(id, read_statistics(entry.value));
            }
        }
        result.ok = true;
    } catch (const std::invalid_argument& e) {
        result.error = Error{e.what(), ""};
    }
    return result;
}

SnapshotResult load_snapshot(const std::filesystem::path& path, MemoryStore& store) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SnapshotResult result;
        result.error = Error{"could not open file", path.string()};
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    SnapshotResult result = parse_snapshot(content, store);
    if (!result.ok) {
        result.error.path = path.string();
    }
    return result;
}

// ============================================================================
// Сохранение
// ============================================================================

std::string to_json(const MemoryStore& store) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    rapidjson::Value accounts(rapidjson::kArrayType);
    for (const auto& a : store.accounts()) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("id", rapidjson::Value(static_cast<std::int64_t>(a.id)), alloc);
        obj.AddMember("name", make_string(a.name, alloc), alloc);
        obj.AddMember("iban", make_string(a.iban, alloc), alloc);
        accounts.PushBack(obj, alloc);
    }
    doc.AddMember("accounts", accounts, alloc);

    rapidjson::Value categories(rapidjson::kArrayType);
    for (const auto& c : store.categories()) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("id", rapidjson::Value(static_cast<std::int64_t>(c.id)), alloc);
        obj.AddMember("name", make_string(c.name, alloc), alloc);
        categories.PushBack(obj, alloc);
    }
    doc.AddMember("categories", categories, alloc);

    rapidjson::Value transactions(rapidjson::kArrayType);
    for (const auto& tx : store.transactions()) {
        transactions.PushBack(write_transaction(tx, alloc), alloc);
    }
    doc.AddMember("transactions", transactions, alloc);

    rapidjson::Value stats(rapidjson::kObjectType);
    for (const auto& [id, s] : store.rule_statistics()) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("match_count", rapidjson::Value(static_cast<std::int64_t>(s.match_count)), alloc);
        obj.AddMember("total_evaluations",
                      rapidjson::Value(static_cast<std::int64_t>(s.total_evaluations)), alloc);
        obj.AddMember("error_count", rapidjson::Value(static_cast<std::int64_t>(s.error_count)), alloc);
        if (s.last_matched_at) {
            obj.AddMember("last_matched_at", make_string(s.last_matched_at->to_string(), alloc),
                          alloc);
        }
        stats.AddMember(make_string(std::to_string(id), alloc), obj, alloc);
    }
    doc.AddMember("rule_statistics", stats, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

SnapshotResult save_snapshot(const MemoryStore& store, const std::filesystem::path& path) {
    SnapshotResult result;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        result.error = Error{"could not open file for writing", path.string()};
        return result;
    }
    file << to_json(store) << '\n';
    if (!file) {
        result.error = Error{"write failed", path.string()};
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace tally::store
