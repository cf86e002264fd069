// ==============================================================================
// tally/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Таблицы (Unicode box-drawing) и JSON (RapidJSON)
// - Прогресс пакетной обработки
//
// Библиотечные модули ничего не печатают: они возвращают результаты,
// а печатает только этот слой.
//
// ==============================================================================

#ifndef TALLY_OUTPUT_HPP
#define TALLY_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace tally::output {

enum class Stream { Stdout, Stderr };

enum class Format {
    Std,  // таблицы/текст
    Json  // pretty JSON
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;  // -q: подавить [+] и [!]
    int verbose = 0;     // -v: [*], -vv: [~]
    Format format = Format::Std;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (verbose > 1)
    void trace(std::string_view message);

    /// Pretty JSON в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс
    // -------------------------------------------------------------------------

    /// Прогресс выводится только в терминал и скрыт при quiet/verbose
    void progress_begin(std::string_view label, std::size_t total);
    void progress_tick(std::size_t current);
    void progress_end();

    bool progress_active() const { return progress_active_; }

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Стереть строку прогресса перед обычным сообщением
    void clear_progress_line();

    OutputConfig config_;

    std::string progress_label_;
    std::size_t progress_total_ = 0;
    std::size_t progress_current_ = 0;
    bool progress_active_ = false;
    bool progress_drawn_ = false;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

enum class Align { Left, Right };

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Выравнивание столбца (по умолчанию влево)
    void set_align(std::size_t col, Align align);

    void print(Writer& w) const;
    std::string to_string() const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::size_t> widths() const;
    std::string format_line(const std::vector<std::size_t>& widths, const char* left,
                            const char* middle, const char* right) const;
    std::string format_row(const std::vector<std::size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<Align> aligns_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message);
std::string format_error(std::string_view message);
std::string format_warning(std::string_view message);
std::string format_debug(std::string_view message);

/// "\r[+] <label>: <current>/<total> (<percent>%)"
std::string format_progress(std::string_view label, std::size_t current, std::size_t total);

/// Очистить ячейку: \n \r \t и повторные пробелы сворачиваются в один пробел.
/// При limit > 0 длинные значения обрезаются с "...".
std::string format_cell(std::string_view field, std::size_t limit = 0);

/// Ширина строки в символах (UTF-8)
std::size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace tally::output

#endif  // TALLY_OUTPUT_HPP
