// ==============================================================================
// rule.cpp - Загрузка книги правил
// ==============================================================================
//
// Разбор YAML через yaml-cpp. Ошибки разбора содержат путь до элемента:
// "rules[2].triggers.conditions[0]: unknown operator 'foo'".
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tally/rule.hpp>
#include <tally/value.hpp>
#include <yaml-cpp/yaml.h>

namespace tally::rule {

using model::Rule;
using model::RuleGroup;

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "rule book error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::size_t LintResult::error_count() const {
    return static_cast<std::size_t>(
        std::count_if(issues.begin(), issues.end(), [](const trigger::Issue& i) {
            return i.severity == trigger::Severity::Error;
        }));
}

std::size_t LintResult::warning_count() const {
    return issues.size() - error_count();
}

// ============================================================================
// RuleBook
// ============================================================================

std::vector<Rule> RuleBook::active_rules() const {
    constexpr int UNGROUPED = std::numeric_limits<int>::max();

    std::vector<std::pair<int, const Rule*>> selected;
    for (const auto& rule : rules) {
        if (!rule.active) {
            continue;
        }
        int order = UNGROUPED;
        if (rule.group_id) {
            if (const auto* group = find_group(*rule.group_id)) {
                if (!group->active) {
                    continue;
                }
                order = group->order;
            }
        }
        selected.emplace_back(order, &rule);
    }

    std::stable_sort(selected.begin(), selected.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Rule> result;
    result.reserve(selected.size());
    for (const auto& entry : selected) {
        result.push_back(*entry.second);
    }
    return result;
}

bool RuleBook::remove_group(model::GroupId id) {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [id](const RuleGroup& g) { return g.id == id; });
    if (it == groups.end()) {
        return false;
    }
    groups.erase(it);
    for (auto& rule : rules) {
        if (rule.group_id == id) {
            rule.group_id.reset();
        }
    }
    return true;
}

Rule* RuleBook::find_rule(model::RuleId id) {
    auto it = std::find_if(rules.begin(), rules.end(), [id](const Rule& r) { return r.id == id; });
    return it == rules.end() ? nullptr : &*it;
}

const Rule* RuleBook::find_rule(model::RuleId id) const {
    auto it = std::find_if(rules.begin(), rules.end(), [id](const Rule& r) { return r.id == id; });
    return it == rules.end() ? nullptr : &*it;
}

const RuleGroup* RuleBook::find_group(model::GroupId id) const {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [id](const RuleGroup& g) { return g.id == id; });
    return it == groups.end() ? nullptr : &*it;
}

// ============================================================================
// YAML parsing helpers
// ============================================================================

namespace {

std::runtime_error parse_error(const std::string& where, const std::string& message) {
    return std::runtime_error(where + ": " + message);
}

bool present(const YAML::Node& node) {
    return node.IsDefined() && !node.IsNull();
}

template <typename T>
T required(const YAML::Node& node, const char* key, const std::string& where) {
    const YAML::Node child = node[key];
    if (!present(child)) {
        throw parse_error(where, std::string("missing '") + key + "'");
    }
    return child.as<T>();
}

/// Вызов parse_* с привязкой std::invalid_argument к месту в файле
template <typename Fn>
auto located(const std::string& where, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        throw parse_error(where, e.what());
    }
}

YAML::Node sequence(const YAML::Node& node, const char* key, const std::string& where) {
    const YAML::Node child = node[key];
    if (present(child) && !child.IsSequence()) {
        throw parse_error(where, std::string("'") + key + "' must be a list");
    }
    return child;
}

model::Trigger parse_trigger(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw parse_error(where, "condition must be a map");
    }

    model::Trigger trigger;
    auto field = required<std::string>(node, "field", where);
    auto op = required<std::string>(node, "operator", where);
    trigger.field = located(where, [&] { return model::parse_field(field); });
    trigger.op = located(where, [&] { return model::parse_operator(op); });
    if (present(node["value"])) {
        trigger.value = node["value"].as<std::string>();
    }
    trigger.negate = node["negate"].as<bool>(false);
    return trigger;
}

model::TriggerGroup parse_group(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw parse_error(where, "trigger group must be a map");
    }

    model::TriggerGroup group;
    auto match = node["match"].as<std::string>("all");
    group.combinator = located(where, [&] { return model::parse_combinator(match); });

    const auto conditions = sequence(node, "conditions", where);
    if (present(conditions)) {
        for (std::size_t i = 0; i < conditions.size(); ++i) {
            group.triggers.push_back(
                parse_trigger(conditions[i], where + ".conditions[" + std::to_string(i) + "]"));
        }
    }

    const auto children = sequence(node, "groups", where);
    if (present(children)) {
        for (std::size_t i = 0; i < children.size(); ++i) {
            group.groups.push_back(
                parse_group(children[i], where + ".groups[" + std::to_string(i) + "]"));
        }
    }
    return group;
}

model::RuleAction parse_action(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw parse_error(where, "action must be a map");
    }

    model::RuleAction action;
    auto type = required<std::string>(node, "type", where);
    action.type = located(where, [&] { return model::parse_action_type(type); });
    if (present(node["value"])) {
        action.value = node["value"].as<std::string>();
    }
    return action;
}

model::RuleStatistics parse_stats(const YAML::Node& node, const std::string& where) {
    model::RuleStatistics stats;
    if (!present(node)) {
        return stats;
    }
    if (!node.IsMap()) {
        throw parse_error(where, "stats must be a map");
    }
    stats.match_count = node["match_count"].as<std::int64_t>(0);
    stats.total_evaluations = node["total_evaluations"].as<std::int64_t>(0);
    stats.error_count = node["error_count"].as<std::int64_t>(0);
    if (present(node["last_matched_at"])) {
        auto text = node["last_matched_at"].as<std::string>();
        stats.last_matched_at = value::Date::parse(text);
        if (!stats.last_matched_at) {
            throw parse_error(where, "invalid date '" + text + "'");
        }
    }
    return stats;
}

Rule parse_rule(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw parse_error(where, "rule must be a map");
    }

    Rule rule;
    rule.id = required<model::RuleId>(node, "id", where);
    rule.name = required<std::string>(node, "name", where);
    rule.priority = node["priority"].as<int>(0);
    rule.active = node["active"].as<bool>(true);
    rule.stop_processing = node["stop_processing"].as<bool>(false);
    if (present(node["group"])) {
        rule.group_id = node["group"].as<model::GroupId>();
    }

    // triggers: null допустим и даёт правило без корня
    const YAML::Node triggers = node["triggers"];
    if (!triggers.IsDefined()) {
        throw parse_error(where, "missing 'triggers'");
    }
    if (triggers.IsNull()) {
        rule.root.reset();
    } else {
        rule.root = parse_group(triggers, where + ".triggers");
    }

    const auto actions = sequence(node, "actions", where);
    if (present(actions)) {
        for (std::size_t i = 0; i < actions.size(); ++i) {
            rule.actions.push_back(
                parse_action(actions[i], where + ".actions[" + std::to_string(i) + "]"));
        }
    }

    rule.stats = parse_stats(node["stats"], where + ".stats");
    return rule;
}

RuleGroup parse_rule_group(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw parse_error(where, "group must be a map");
    }

    RuleGroup group;
    group.id = required<model::GroupId>(node, "id", where);
    group.name = node["name"].as<std::string>("");
    group.order = node["order"].as<int>(0);
    group.active = node["active"].as<bool>(true);
    return group;
}

RuleBook parse_book(const YAML::Node& root) {
    RuleBook book;
    if (!present(root)) {
        return book;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a map with 'groups' and 'rules'");
    }

    const auto groups = sequence(root, "groups", "groups");
    if (present(groups)) {
        for (std::size_t i = 0; i < groups.size(); ++i) {
            book.groups.push_back(parse_rule_group(groups[i], "groups[" + std::to_string(i) + "]"));
        }
    }

    const auto rules = sequence(root, "rules", "rules");
    if (present(rules)) {
        for (std::size_t i = 0; i < rules.size(); ++i) {
            book.rules.push_back(parse_rule(rules[i], "rules[" + std::to_string(i) + "]"));
        }
    }
    return book;
}

bool is_yaml_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yml" || ext == ".yaml";
}

// ============================================================================
// YAML emitting helpers
// ============================================================================

void emit_group(YAML::Emitter& out, const model::TriggerGroup& group) {
    out << YAML::BeginMap;
    out << YAML::Key << "match" << YAML::Value << model::to_string(group.combinator);
    out << YAML::Key << "conditions" << YAML::Value << YAML::BeginSeq;
    for (const auto& t : group.triggers) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "field" << YAML::Value << model::to_string(t.field);
        out << YAML::Key << "operator" << YAML::Value << model::to_string(t.op);
        if (!t.value.empty()) {
            out << YAML::Key << "value" << YAML::Value << YAML::DoubleQuoted << t.value;
        }
        if (t.negate) {
            out << YAML::Key << "negate" << YAML::Value << true;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    if (!group.groups.empty()) {
        out << YAML::Key << "groups" << YAML::Value << YAML::BeginSeq;
        for (const auto& child : group.groups) {
            emit_group(out, child);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

void emit_rule(YAML::Emitter& out, const Rule& rule) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << rule.id;
    out << YAML::Key << "name" << YAML::Value << rule.name;
    if (rule.group_id) {
        out << YAML::Key << "group" << YAML::Value << *rule.group_id;
    }
    out << YAML::Key << "priority" << YAML::Value << rule.priority;
    out << YAML::Key << "active" << YAML::Value << rule.active;
    out << YAML::Key << "stop_processing" << YAML::Value << rule.stop_processing;

    out << YAML::Key << "triggers" << YAML::Value;
    if (rule.root) {
        emit_group(out, *rule.root);
    } else {
        out << YAML::Null;
    }

    out << YAML::Key << "actions" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : rule.actions) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "type" << YAML::Value << model::to_string(a.type);
        if (!a.value.empty()) {
            out << YAML::Key << "value" << YAML::Value << YAML::DoubleQuoted << a.value;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    const auto& s = rule.stats;
    if (s.total_evaluations > 0 || s.match_count > 0 || s.error_count > 0) {
        out << YAML::Key << "stats" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "match_count" << YAML::Value << s.match_count;
        out << YAML::Key << "total_evaluations" << YAML::Value << s.total_evaluations;
        out << YAML::Key << "error_count" << YAML::Value << s.error_count;
        if (s.last_matched_at) {
            out << YAML::Key << "last_matched_at" << YAML::Value << s.last_matched_at->to_string();
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

}  // anonymous namespace

// ============================================================================
// Load / lint / emit
// ============================================================================

LoadResult load_string(std::string_view yaml) {
    LoadResult result;
    try {
        result.book = parse_book(YAML::Load(std::string(yaml)));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), ""};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), ""};
    }
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;

    if (!is_yaml_extension(path)) {
        result.error = Error{"rule book must have a yaml file extension", path.string()};
        return result;
    }

    try {
        result.book = parse_book(YAML::LoadFile(path.string()));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path.string()};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path.string()};
    }
    return result;
}

LintResult lint(const RuleBook& book) {
    using trigger::Severity;

    LintResult result;
    result.ok = true;
    auto report = [&](Severity severity, std::string message) {
        result.issues.push_back({severity, std::move(message)});
    };

    std::set<model::GroupId> group_ids;
    for (const auto& group : book.groups) {
        if (!group_ids.insert(group.id).second) {
            report(Severity::Error, "group " + std::to_string(group.id) + ": duplicate id");
        }
    }

    std::set<model::RuleId> rule_ids;
    for (const auto& rule : book.rules) {
        const std::string subject = "rule " + std::to_string(rule.id) + " '" + rule.name + "'";

        if (!rule_ids.insert(rule.id).second) {
            report(Severity::Error, subject + ": duplicate id");
        }
        if (rule.group_id && group_ids.count(*rule.group_id) == 0) {
            report(Severity::Error,
                   subject + ": unknown group " + std::to_string(*rule.group_id));
        }

        if (!rule.root) {
            report(Severity::Error, subject + ": missing trigger root, rule never matches");
        } else if (rule.root->empty()) {
            report(Severity::Warning,
                   subject + (rule.root->combinator == model::Combinator::All
                                  ? ": no triggers, rule matches every transaction"
                                  : ": no triggers, rule never matches"));
        } else {
            for (auto& issue : trigger::validate(*rule.root)) {
                issue.message = subject + ": " + issue.message;
                result.issues.push_back(std::move(issue));
            }
        }

        if (rule.actions.empty()) {
            report(Severity::Warning, subject + ": no actions");
        }
        for (std::size_t i = 0; i < rule.actions.size(); ++i) {
            const auto& action = rule.actions[i];
            if (model::requires_value(action.type) && value::trim(action.value).empty()) {
                report(Severity::Error, subject + ": actions[" + std::to_string(i) + "]: " +
                                            model::to_string(action.type) +
                                            " requires a value");
            }
        }
    }
    return result;
}

LintResult lint(const std::filesystem::path& path) {
    auto loaded = load(path);
    if (!loaded) {
        LintResult result;
        result.error = loaded.error;
        return result;
    }
    return lint(loaded.book);
}

std::string to_yaml(const Rule& rule) {
    YAML::Emitter out;
    emit_rule(out, rule);
    return out.c_str();
}

std::string to_yaml(const RuleBook& book) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (!book.groups.empty()) {
        out << YAML::Key << "groups" << YAML::Value << YAML::BeginSeq;
        for (const auto& g : book.groups) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "id" << YAML::Value << g.id;
            out << YAML::Key << "name" << YAML::Value << g.name;
            out << YAML::Key << "order" << YAML::Value << g.order;
            out << YAML::Key << "active" << YAML::Value << g.active;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
    for (const auto& rule : book.rules) {
        emit_rule(out, rule);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    std::string text = out.c_str();
    text += '\n';
    return text;
}

}  // namespace tally::rule
