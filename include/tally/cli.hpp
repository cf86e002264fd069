// ==============================================================================
// tally/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef TALLY_CLI_HPP
#define TALLY_CLI_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace tally::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// apply - применить правила к снимку транзакций
struct ApplyCommand {
    std::filesystem::path rules;
    std::filesystem::path data;
    std::optional<std::int64_t> rule_id;          // --rule: только одно правило
    std::size_t chunk_size = 100;                 // --chunk-size
    bool json = false;                            // --json
    std::optional<std::filesystem::path> output;  // -o, --output (иначе на месте)
    bool dry_run = false;                         // --dry-run
};

/// preview - предпросмотр совпадений правила
struct PreviewCommand {
    std::filesystem::path rules;
    std::filesystem::path data;
    std::int64_t rule_id = 0;  // --rule (обязательно)
    std::size_t limit = 10;    // --limit
};

/// lint - проверка книги правил
struct LintCommand {
    std::filesystem::path path;
};

/// templates - встроенные шаблоны
struct TemplatesCommand {
    std::optional<std::string> query;
    std::optional<std::string> category;  // --category
    std::optional<std::string> emit;      // --emit <NAME>
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<ApplyCommand, PreviewCommand, LintCommand, TemplatesCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.3.0";
constexpr const char* ABOUT = "Apply transaction rules to a ledger snapshot";

}  // namespace tally::cli

#endif  // TALLY_CLI_HPP
