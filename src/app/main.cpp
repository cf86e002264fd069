// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "tally/cli.hpp"
#include "tally/model.hpp"
#include "tally/output.hpp"
#include "tally/rule.hpp"
#include "tally/runner.hpp"
#include "tally/store.hpp"
#include "tally/templates.hpp"
#include "tally/value.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <rapidjson/document.h>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace {

using namespace tally;

constexpr std::size_t MAX_LISTED_FAILURES = 20;

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

std::string describe(const model::Rule& rule) {
    return "rule " + std::to_string(rule.id) + " '" + rule.name + "'";
}

/// Загрузить книгу правил и снимок; ошибки печатаются
bool load_inputs(const std::filesystem::path& rules_path, const std::filesystem::path& data_path,
                 rule::RuleBook& book, store::MemoryStore& store, output::Writer& writer) {
    auto loaded = rule::load(rules_path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    book = std::move(loaded.book);

    auto snapshot = store::load_snapshot(data_path, store);
    if (!snapshot) {
        writer.error(snapshot.error.format());
        return false;
    }

    writer.info("Loaded " + std::to_string(book.rules.size()) + " rules and " +
                std::to_string(store.count_transactions({})) + " transactions");
    return true;
}

/// Начальная статистика правил берётся из снимка
void seed_statistics(std::vector<model::Rule>& rules, const store::MemoryStore& store) {
    const auto& saved = store.rule_statistics();
    for (auto& rule : rules) {
        auto it = saved.find(rule.id);
        if (it != saved.end()) {
            rule.stats = it->second;
        }
    }
}

rapidjson::Document summary_to_json(const runner::RunSummary& summary,
                                    const std::vector<model::Rule>& rules) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("total", static_cast<uint64_t>(summary.total), alloc);
    doc.AddMember("processed", static_cast<uint64_t>(summary.processed), alloc);
    doc.AddMember("succeeded", static_cast<uint64_t>(summary.succeeded), alloc);
    doc.AddMember("failed", static_cast<uint64_t>(summary.failed), alloc);
    doc.AddMember("matched", static_cast<uint64_t>(summary.matched), alloc);
    doc.AddMember("actions_applied", static_cast<uint64_t>(summary.actions_applied), alloc);
    doc.AddMember("cancelled", summary.cancelled, alloc);

    rapidjson::Value rule_list(rapidjson::kArrayType);
    for (const auto& rule : rules) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("id", static_cast<int64_t>(rule.id), alloc);
        entry.AddMember("name", rapidjson::Value(rule.name.c_str(), alloc), alloc);
        auto it = summary.rule_matches.find(rule.id);
        entry.AddMember(
            "applied",
            static_cast<uint64_t>(it == summary.rule_matches.end() ? 0 : it->second), alloc);
        entry.AddMember("match_count", static_cast<int64_t>(rule.stats.match_count), alloc);
        entry.AddMember("total_evaluations", static_cast<int64_t>(rule.stats.total_evaluations),
                        alloc);
        entry.AddMember("error_count", static_cast<int64_t>(rule.stats.error_count), alloc);
        rule_list.PushBack(entry, alloc);
    }
    doc.AddMember("rules", rule_list, alloc);

    rapidjson::Value failures(rapidjson::kArrayType);
    for (const auto& failure : summary.failures) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("transaction_id", static_cast<int64_t>(failure.transaction_id), alloc);
        entry.AddMember("reason", rapidjson::Value(failure.reason.c_str(), alloc), alloc);
        failures.PushBack(entry, alloc);
    }
    doc.AddMember("failures", failures, alloc);

    rapidjson::Value warnings(rapidjson::kArrayType);
    for (const auto& warning : summary.warnings) {
        warnings.PushBack(rapidjson::Value(warning.c_str(), alloc), alloc);
    }
    doc.AddMember("warnings", warnings, alloc);
    return doc;
}

void print_rule_table(const runner::RunSummary& summary, const std::vector<model::Rule>& rules,
                      output::Writer& writer) {
    output::Table table;
    table.set_headers({"ID", "Rule", "Priority", "Applied", "Match rate", "Errors"});
    table.set_align(0, output::Align::Right);
    table.set_align(2, output::Align::Right);
    table.set_align(3, output::Align::Right);
    table.set_align(4, output::Align::Right);
    table.set_align(5, output::Align::Right);

    for (const auto& rule : rules) {
        auto it = summary.rule_matches.find(rule.id);
        std::size_t applied = it == summary.rule_matches.end() ? 0 : it->second;
        table.add_row({std::to_string(rule.id), output::format_cell(rule.name, 40),
                       std::to_string(rule.priority), std::to_string(applied),
                       percent(rule.stats.match_rate()), std::to_string(rule.stats.error_count)});
    }
    table.print(writer);
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_apply(const cli::ApplyCommand& cmd, output::Writer& writer) {
    rule::RuleBook book;
    store::MemoryStore store;
    if (!load_inputs(cmd.rules, cmd.data, book, store, writer)) {
        return 1;
    }

    std::vector<model::Rule> rules;
    if (cmd.rule_id) {
        const auto* selected = book.find_rule(*cmd.rule_id);
        if (selected == nullptr) {
            writer.error("rule " + std::to_string(*cmd.rule_id) + " not found");
            return 1;
        }
        rules.push_back(*selected);
    } else {
        rules = book.active_rules();
    }
    seed_statistics(rules, store);
    writer.debug("Applying " + std::to_string(rules.size()) + " rules in chunks of " +
                 std::to_string(cmd.chunk_size));

    runner::RunOptions options;
    options.chunk_size = cmd.chunk_size;
    options.on_progress = [&writer](const runner::Progress& p) {
        writer.progress_tick(p.processed);
        writer.trace("Processed " + std::to_string(p.processed) + "/" +
                     std::to_string(p.total) + " (" + std::to_string(p.failed) + " failed)");
    };

    runner::BulkRunner bulk(store, options);
    writer.progress_begin("Applying rules", store.count_transactions({}));
    auto summary = cmd.rule_id ? bulk.apply_rule(rules.front()) : bulk.apply_all(rules);
    writer.progress_end();

    if (cmd.json) {
        writer.write_json_pretty(summary_to_json(summary, rules));
    } else if (!rules.empty()) {
        print_rule_table(summary, rules, writer);
    }

    for (std::size_t i = 0; i < summary.failures.size() && i < MAX_LISTED_FAILURES; ++i) {
        const auto& failure = summary.failures[i];
        writer.warn("transaction " + std::to_string(failure.transaction_id) + ": " +
                    failure.reason);
    }
    if (summary.failures.size() > MAX_LISTED_FAILURES) {
        writer.warn("... and " + std::to_string(summary.failures.size() - MAX_LISTED_FAILURES) +
                    " more failures");
    }
    for (const auto& warning : summary.warnings) {
        writer.warn(warning);
    }

    writer.info(summary.format() + " (" + std::to_string(summary.matched) + " matched, " +
                std::to_string(summary.actions_applied) + " actions)");

    if (cmd.dry_run) {
        writer.info("Dry run, snapshot not written");
    } else {
        const auto target = cmd.output.value_or(cmd.data);
        auto saved = store::save_snapshot(store, target);
        if (!saved) {
            writer.error(saved.error.format());
            return 1;
        }
        writer.debug("Snapshot written to " + target.string());
    }

    return (summary.failed == 0 && summary.warnings.empty()) ? 0 : 1;
}

int run_preview(const cli::PreviewCommand& cmd, output::Writer& writer) {
    rule::RuleBook book;
    store::MemoryStore store;
    if (!load_inputs(cmd.rules, cmd.data, book, store, writer)) {
        return 1;
    }

    const auto* selected = book.find_rule(cmd.rule_id);
    if (selected == nullptr) {
        writer.error("rule " + std::to_string(cmd.rule_id) + " not found");
        return 1;
    }
    if (!selected->root) {
        writer.error(describe(*selected) + " has no trigger root");
        return 1;
    }

    runner::BulkRunner bulk(store);
    auto preview = bulk.preview(*selected->root, cmd.limit);

    writer.info(describe(*selected) + " matches " + std::to_string(preview.match_count) +
                " of " + std::to_string(preview.evaluated) + " transactions");

    if (!preview.sample.empty()) {
        output::Table table;
        table.set_headers({"ID", "Date", "Amount", "Description", "Category"});
        table.set_align(0, output::Align::Right);
        table.set_align(2, output::Align::Right);
        for (auto id : preview.sample) {
            auto tx = store.transaction(id);
            if (!tx) {
                continue;
            }
            table.add_row({std::to_string(tx->id), tx->date.to_string(), tx->amount.to_string(),
                           output::format_cell(tx->description, 48), tx->effective_category()});
        }
        table.print(writer);
    }

    std::vector<std::string> actions;
    for (const auto& action : selected->actions) {
        actions.push_back(action.value.empty()
                              ? model::to_string(action.type)
                              : model::to_string(action.type) + "(" + action.value + ")");
    }
    writer.info("Actions: " + (actions.empty() ? std::string("none") : value::join(actions, ", ")));
    return 0;
}

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    writer.info("Validating rule book " + cmd.path.string() + "...");

    auto loaded = rule::load(cmd.path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }

    auto result = rule::lint(loaded.book);
    for (const auto& issue : result.issues) {
        writer.warn(issue.message);
    }

    const auto errors = result.error_count();
    writer.info("Validated " + std::to_string(loaded.book.rules.size()) + " rules: " +
                std::to_string(errors) + " errors, " + std::to_string(result.warning_count()) +
                " warnings");
    return errors == 0 ? 0 : 1;
}

int run_templates(const cli::TemplatesCommand& cmd, output::Writer& writer) {
    if (cmd.emit) {
        const auto* found = templates::find(*cmd.emit);
        if (found == nullptr) {
            writer.error("template '" + *cmd.emit + "' not found");
            return 1;
        }
        rule::RuleBook book;
        book.rules.push_back(found->create_rule(1));
        writer.write(output::Stream::Stdout, rule::to_yaml(book));
        return 0;
    }

    auto list = templates::search(cmd.query.value_or(""));
    if (cmd.category) {
        templates::TemplateCategory category{};
        try {
            category = templates::parse_category(*cmd.category);
        } catch (const std::invalid_argument& e) {
            writer.error(std::string("Invalid category '") + *cmd.category + "': " + e.what());
            return 2;
        }
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [category](const templates::RuleTemplate& t) {
                                      return t.category != category;
                                  }),
                   list.end());
    }

    output::Table table;
    table.set_headers({"Name", "Category", "Triggers", "Actions", "Tags"});
    table.set_align(2, output::Align::Right);
    table.set_align(3, output::Align::Right);
    for (const auto& t : list) {
        table.add_row({t.name, templates::to_string(t.category), std::to_string(t.triggers.size()),
                       std::to_string(t.actions.size()), value::join(t.tags, ", ")});
    }
    if (table.row_count() > 0) {
        table.print(writer);
    }
    writer.info(std::to_string(list.size()) + " templates");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Ошибки парсинга печатаются без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ApplyCommand>) {
                return run_apply(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::PreviewCommand>) {
                return run_preview(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                return run_lint(cmd, writer);
            } else {
                static_assert(std::is_same_v<T, cli::TemplatesCommand>, "Unhandled command");
                return run_templates(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
