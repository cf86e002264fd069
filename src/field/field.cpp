// ==============================================================================
// field.cpp - Доступ к полям транзакции
// ==============================================================================

#include <cstddef>
#include <tally/field.hpp>
#include <type_traits>

namespace tally::field {

using model::TriggerField;

namespace {

std::string value_or_empty(const std::optional<std::string>& s) {
    return s ? *s : std::string();
}

}  // namespace

// ============================================================================
// extract
// ============================================================================

FieldType field_type(TriggerField f) {
    switch (f) {
    case TriggerField::Amount:
        return FieldType::Number;
    case TriggerField::Date:
        return FieldType::Date;
    case TriggerField::Category:
        return FieldType::Category;
    case TriggerField::TransactionType:
        return FieldType::Kind;
    case TriggerField::Description:
    case TriggerField::AccountName:
    case TriggerField::CounterParty:
    case TriggerField::Iban:
    case TriggerField::CounterIban:
    case TriggerField::Notes:
    case TriggerField::ExternalId:
    case TriggerField::InternalReference:
    case TriggerField::Tags:
        return FieldType::Text;
    }
    return FieldType::Text;
}

TypedValue extract(TriggerField f, const model::Transaction& tx) {
    switch (f) {
    case TriggerField::Description:
        return tx.description;
    case TriggerField::AccountName:
        return value_or_empty(tx.account_name);
    case TriggerField::CounterParty:
        return value_or_empty(tx.counter_name);
    case TriggerField::Amount:
        return tx.amount;
    case TriggerField::Date:
        return tx.date;
    case TriggerField::Iban:
        return tx.iban;
    case TriggerField::CounterIban:
        return value_or_empty(tx.counter_iban);
    case TriggerField::TransactionType:
        return tx.kind;
    case TriggerField::Category: {
        bool assigned = (tx.category_override && !tx.category_override->empty()) ||
                        (tx.auto_category && !tx.auto_category->empty());
        return CategoryValue{tx.effective_category(), assigned};
    }
    case TriggerField::Notes:
        return value_or_empty(tx.notes);
    case TriggerField::Tags:
        return format_tags(parse_tags(tx.notes)).value_or(std::string());
    case TriggerField::ExternalId:
        return value_or_empty(find_marker(tx.notes, EXTERNAL_ID_MARKER));
    case TriggerField::InternalReference:
        return value_or_empty(find_marker(tx.notes, INTERNAL_REFERENCE_MARKER));
    }
    return std::string();
}

std::string to_text(const TypedValue& v) {
    return std::visit(
        [](const auto& val) -> std::string {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return val;
            } else if constexpr (std::is_same_v<T, value::Decimal>) {
                return val.to_string();
            } else if constexpr (std::is_same_v<T, value::Date>) {
                return val.to_string();
            } else if constexpr (std::is_same_v<T, CategoryValue>) {
                return val.name;
            } else {
                return model::to_string(val);
            }
        },
        v);
}

// ============================================================================
// Кодек notes
// ============================================================================

Notes split_notes(const std::optional<std::string>& notes) {
    Notes result;
    if (!notes) {
        return result;
    }
    std::string_view body(*notes);
    if (body.substr(0, DELETED_MARKER.size()) == DELETED_MARKER) {
        result.deleted = true;
        body.remove_prefix(DELETED_MARKER.size());
    }
    body = value::trim(body);
    if (body.empty()) {
        return result;
    }
    for (const auto& part : value::split(body, MARKER_SEPARATOR)) {
        auto segment = value::trim(part);
        if (!segment.empty()) {
            result.segments.emplace_back(segment);
        }
    }
    return result;
}

std::optional<std::string> join_notes(const Notes& notes) {
    std::string body = value::join(notes.segments, MARKER_SEPARATOR);
    if (notes.deleted) {
        std::string marked(DELETED_MARKER);
        if (!body.empty()) {
            marked += " " + body;
        }
        return marked;
    }
    if (body.empty()) {
        return std::nullopt;
    }
    return body;
}

bool is_marker_segment(std::string_view segment) {
    for (auto marker : {EXTERNAL_ID_MARKER, INTERNAL_REFERENCE_MARKER, TRANSFER_MARKER}) {
        if (segment.substr(0, marker.size()) == marker) {
            return true;
        }
    }
    return false;
}

namespace {

/// Индекс сегмента с тегами или segments.size()
std::size_t tag_segment(const Notes& notes) {
    std::size_t i = 0;
    while (i < notes.segments.size() && is_marker_segment(notes.segments[i])) {
        ++i;
    }
    return i;
}

}  // namespace

std::vector<std::string> parse_tags(const std::optional<std::string>& notes) {
    std::vector<std::string> tags;
    auto parts = split_notes(notes);
    auto index = tag_segment(parts);
    if (index == parts.segments.size()) {
        return tags;
    }
    for (const auto& part : value::split(parts.segments[index], ",")) {
        auto tag = value::trim(part);
        if (!tag.empty()) {
            tags.emplace_back(tag);
        }
    }
    return tags;
}

std::optional<std::string> format_tags(const std::vector<std::string>& tags) {
    if (tags.empty()) {
        return std::nullopt;
    }
    return value::join(tags, TAG_SEPARATOR);
}

std::optional<std::string> with_tags(const std::optional<std::string>& notes,
                                     const std::vector<std::string>& tags) {
    auto parts = split_notes(notes);
    auto index = tag_segment(parts);
    auto text = format_tags(tags);
    auto& segments = parts.segments;

    if (index < segments.size()) {
        if (text) {
            segments[index] = *text;
        } else {
            segments.erase(segments.begin() + static_cast<std::ptrdiff_t>(index));
        }
    } else if (text) {
        segments.insert(segments.begin(), *text);
    }
    return join_notes(parts);
}

std::optional<std::string> find_marker(const std::optional<std::string>& notes,
                                       std::string_view marker) {
    std::optional<std::string> found;
    for (const auto& segment : split_notes(notes).segments) {
        std::string_view s(segment);
        if (s.substr(0, marker.size()) == marker) {
            found = std::string(value::trim(s.substr(marker.size())));
        }
    }
    return found;
}

std::string append_segment(const std::optional<std::string>& notes, std::string_view segment) {
    auto parts = split_notes(notes);
    parts.segments.emplace_back(segment);
    return join_notes(parts).value_or(std::string(segment));
}

std::string replace_marker(const std::optional<std::string>& notes, std::string_view marker,
                           std::string_view segment) {
    auto parts = split_notes(notes);
    std::vector<std::string> kept;
    bool replaced = false;
    for (auto& s : parts.segments) {
        if (std::string_view(s).substr(0, marker.size()) == marker) {
            if (!replaced) {
                kept.emplace_back(segment);
                replaced = true;
            }
            continue;
        }
        kept.push_back(std::move(s));
    }
    if (!replaced) {
        kept.emplace_back(segment);
    }
    parts.segments = std::move(kept);
    return join_notes(parts).value_or(std::string(segment));
}

bool is_deleted(const model::Transaction& tx) {
    return tx.notes && tx.notes->compare(0, DELETED_MARKER.size(), DELETED_MARKER) == 0;
}

}  // namespace tally::field
