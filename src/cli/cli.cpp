// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv. Ошибки использования возвращаются как
// CliDiagnostic с exit code 2, печатает их main.
//
// ==============================================================================

#include "tally/cli.hpp"

#include <charconv>
#include <cstring>
#include <string_view>
#include <system_error>

namespace tally::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

std::string usage_of(const std::string& command) {
    if (command == "apply") {
        return "Usage: tally apply [OPTIONS] <RULES> <DATA>";
    }
    if (command == "preview") {
        return "Usage: tally preview [OPTIONS] --rule <ID> <RULES> <DATA>";
    }
    if (command == "lint") {
        return "Usage: tally lint <RULES>";
    }
    if (command == "templates") {
        return "Usage: tally templates [OPTIONS] [QUERY]";
    }
    return "Usage: tally [OPTIONS] <COMMAND>";
}

// ----------------------------------------------------------------------------
// ArgParser - разбор аргументов одной подкоманды
// ----------------------------------------------------------------------------

class ArgParser {
public:
    ArgParser(int argc, char** argv, int start, std::string command, ParseResult& result)
        : argc_(argc), argv_(argv), index_(start), command_(std::move(command)),
          result_(result) {}

    bool done() const { return failed_ || index_ >= argc_; }
    bool failed() const { return failed_; }

    const char* next() { return argv_[index_++]; }

    /// "--name value" или "--name=value". true, если arg - эта опция.
    /// Отсутствие значения фиксируется как ошибка.
    bool option(const char* arg, const char* short_name, const char* long_name,
                const char* placeholder, std::string& out) {
        std::string_view a(arg);
        std::string_view l(long_name);
        if (a.size() > l.size() && a.substr(0, l.size()) == l && a[l.size()] == '=') {
            out = std::string(a.substr(l.size() + 1));
            return true;
        }
        if (!(a == l || (short_name != nullptr && a == short_name))) {
            return false;
        }
        if (index_ >= argc_) {
            fail(std::string("error: a value is required for '") + long_name + " " + placeholder +
                 "' but none was supplied");
            return true;
        }
        out = argv_[index_++];
        return true;
    }

    template <typename T>
    bool number(const std::string& text, const char* long_name, const char* placeholder,
                T& out) {
        T value{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            fail("error: invalid value '" + text + "' for '" + long_name + " " + placeholder +
                 "': expected a number");
            return false;
        }
        out = value;
        return true;
    }

    /// Общие для всех подкоманд флаги: -q, -v, -h
    bool common(const char* arg) {
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result_.global.quiet = true;
            return true;
        }
        if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result_.global.verbose++;
            return true;
        }
        if (str_eq(arg, "-vv")) {
            result_.global.verbose += 2;
            return true;
        }
        return false;
    }

    void unexpected(const char* arg) {
        fail(std::string("error: unexpected argument '") + arg + "' found");
    }

    void missing(const std::string& what) {
        fail("error: the following required arguments were not provided:\n  " + what);
    }

    void fail(const std::string& message) {
        if (failed_) {
            return;
        }
        failed_ = true;
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message =
            message + "\n\n" + usage_of(command_) + "\n\nFor more information, try '--help'.\n";
    }

private:
    int argc_;
    char** argv_;
    int index_;
    std::string command_;
    ParseResult& result_;
    bool failed_ = false;
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_apply(ArgParser& p, ParseResult& result) {
    ApplyCommand cmd;
    int positional = 0;
    std::string value;

    while (!p.done()) {
        const char* arg = p.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"apply"};
            return;
        } else if (p.common(arg)) {
            continue;
        } else if (p.option(arg, nullptr, "--rule", "<ID>", value)) {
            std::int64_t id = 0;
            if (!p.failed() && p.number(value, "--rule", "<ID>", id)) {
                cmd.rule_id = id;
            }
        } else if (p.option(arg, nullptr, "--chunk-size", "<N>", value)) {
            if (!p.failed() && p.number(value, "--chunk-size", "<N>", cmd.chunk_size) &&
                cmd.chunk_size == 0) {
                p.fail("error: invalid value '0' for '--chunk-size <N>': must be positive");
            }
        } else if (p.option(arg, "-o", "--output", "<OUT>", value)) {
            cmd.output = std::filesystem::path(value);
        } else if (str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            p.unexpected(arg);
        } else if (positional == 0) {
            cmd.rules = std::filesystem::path(arg);
            ++positional;
        } else if (positional == 1) {
            cmd.data = std::filesystem::path(arg);
            ++positional;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (positional < 2) {
        p.missing(positional == 0 ? "<RULES>\n  <DATA>" : "<DATA>");
        return;
    }
    result.ok = true;
    result.command = cmd;
}

void parse_preview(ArgParser& p, ParseResult& result) {
    PreviewCommand cmd;
    bool has_rule = false;
    int positional = 0;
    std::string value;

    while (!p.done()) {
        const char* arg = p.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"preview"};
            return;
        } else if (p.common(arg)) {
            continue;
        } else if (p.option(arg, nullptr, "--rule", "<ID>", value)) {
            has_rule = !p.failed() && p.number(value, "--rule", "<ID>", cmd.rule_id);
        } else if (p.option(arg, nullptr, "--limit", "<N>", value)) {
            if (!p.failed()) {
                p.number(value, "--limit", "<N>", cmd.limit);
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            p.unexpected(arg);
        } else if (positional == 0) {
            cmd.rules = std::filesystem::path(arg);
            ++positional;
        } else if (positional == 1) {
            cmd.data = std::filesystem::path(arg);
            ++positional;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (!has_rule) {
        p.missing("--rule <ID>");
        return;
    }
    if (positional < 2) {
        p.missing(positional == 0 ? "<RULES>\n  <DATA>" : "<DATA>");
        return;
    }
    result.ok = true;
    result.command = cmd;
}

void parse_lint(ArgParser& p, ParseResult& result) {
    LintCommand cmd;
    while (!p.done()) {
        const char* arg = p.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"lint"};
            return;
        } else if (p.common(arg)) {
            continue;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            p.unexpected(arg);
        } else if (cmd.path.empty()) {
            cmd.path = std::filesystem::path(arg);
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (cmd.path.empty()) {
        p.missing("<RULES>");
        return;
    }
    result.ok = true;
    result.command = cmd;
}

void parse_templates(ArgParser& p, ParseResult& result) {
    TemplatesCommand cmd;
    std::string value;
    while (!p.done()) {
        const char* arg = p.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"templates"};
            return;
        } else if (p.common(arg)) {
            continue;
        } else if (p.option(arg, nullptr, "--category", "<CAT>", value)) {
            cmd.category = value;
        } else if (p.option(arg, nullptr, "--emit", "<NAME>", value)) {
            cmd.emit = value;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            p.unexpected(arg);
        } else if (!cmd.query) {
            cmd.query = arg;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    result.ok = true;
    result.command = cmd;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("tally ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: tally [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  apply      Apply rules to every transaction of a snapshot\n"
               "  preview    Show which transactions a rule would match\n"
               "  lint       Check a rule book for errors\n"
               "  templates  List or emit the built-in rule templates\n"
               "  help       Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "  -q             Suppress informational output\n"
               "  -v...          Print verbose output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Apply all active rules and save the result:\n"
               "        ./tally apply rules.yml ledger.json -o ledger.out.json\n"
               "\n"
               "    Preview a single rule:\n"
               "        ./tally preview rules.yml ledger.json --rule 10\n";
    } else if (*command == "apply") {
        return "Apply rules to every transaction of a snapshot\n"
               "\n"
               "Usage: tally apply [OPTIONS] <RULES> <DATA>\n"
               "\n"
               "Arguments:\n"
               "  <RULES>  Rule book (.yml/.yaml)\n"
               "  <DATA>   Transaction snapshot (.json)\n"
               "\n"
               "Options:\n"
               "      --rule <ID>         Apply only this rule (even if inactive)\n"
               "      --chunk-size <N>    Transactions per batch [default: 100]\n"
               "      --json              Print the summary as JSON\n"
               "  -o, --output <OUT>      Write the snapshot here instead of in place\n"
               "      --dry-run           Do not write the snapshot\n"
               "  -h, --help              Print help\n";
    } else if (*command == "preview") {
        return "Show which transactions a rule would match\n"
               "\n"
               "Usage: tally preview [OPTIONS] --rule <ID> <RULES> <DATA>\n"
               "\n"
               "Arguments:\n"
               "  <RULES>  Rule book (.yml/.yaml)\n"
               "  <DATA>   Transaction snapshot (.json)\n"
               "\n"
               "Options:\n"
               "      --rule <ID>   Rule to preview\n"
               "      --limit <N>   Sample size [default: 10]\n"
               "  -h, --help        Print help\n";
    } else if (*command == "lint") {
        return "Check a rule book for errors\n"
               "\n"
               "Usage: tally lint <RULES>\n"
               "\n"
               "Arguments:\n"
               "  <RULES>  Rule book (.yml/.yaml)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "templates") {
        return "List or emit the built-in rule templates\n"
               "\n"
               "Usage: tally templates [OPTIONS] [QUERY]\n"
               "\n"
               "Arguments:\n"
               "  [QUERY]  Search name, description and tags\n"
               "\n"
               "Options:\n"
               "      --category <CAT>  categorization, cleanup, automation or detection\n"
               "      --emit <NAME>     Print the template as a rule book\n"
               "  -h, --help            Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = std::string("error: unexpected argument '") + arg +
                                               "' found\n\n" + usage_of("") +
                                               "\n\nFor more information, try '--help'.\n";
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const std::string cmd = argv[cmd_idx];
    ArgParser p(argc, argv, cmd_idx + 1, cmd, result);

    if (cmd == "apply") {
        parse_apply(p, result);
    } else if (cmd == "preview") {
        parse_preview(p, result);
    } else if (cmd == "lint") {
        parse_lint(p, result);
    } else if (cmd == "templates") {
        parse_templates(p, result);
    } else if (cmd == "help") {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else if (cmd == "version") {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = "error: unrecognized subcommand '" + cmd + "'\n\n" +
                                           usage_of("") +
                                           "\n\nFor more information, try '--help'.\n";
    }
    return result;
}

}  // namespace tally::cli
