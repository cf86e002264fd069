// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты пишутся через fwrite,
// без std::endl.
//
// ==============================================================================

#include "tally/output.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace tally::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

FILE* file_of(Stream s) {
    return (s == Stream::Stdout) ? stdout : stderr;
}

std::string prefixed(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    progress_end();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), file_of(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    if (s == Stream::Stderr) {
        clear_progress_line();
    }
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    clear_progress_line();
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
        write(Stream::Stderr, " ");
    } else {
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, " ");
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~]", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::progress_begin(std::string_view label, std::size_t total) {
    // Прогресс скрыт при verbose или quiet
    if (config_.verbose > 0 || config_.quiet) {
        return;
    }

    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_active_ = true;
    progress_drawn_ = false;
}

void Writer::progress_tick(std::size_t current) {
    if (!progress_active_) {
        return;
    }

    progress_current_ = current;
    // Строка с возвратом каретки имеет смысл только в терминале
    if (!supports_color(Stream::Stderr)) {
        return;
    }
    write(Stream::Stderr, format_progress(progress_label_, progress_current_, progress_total_));
    progress_drawn_ = true;
    std::fflush(stderr);
}

void Writer::progress_end() {
    if (!progress_active_) {
        return;
    }

    if (progress_drawn_) {
        write(Stream::Stderr, "\n");
    }
    progress_active_ = false;
    progress_drawn_ = false;
    progress_label_.clear();
}

void Writer::clear_progress_line() {
    if (progress_drawn_) {
        write(Stream::Stderr, "\r\x1b[2K");
        progress_drawn_ = false;
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_align(std::size_t col, Align align) {
    if (col >= aligns_.size()) {
        aligns_.resize(col + 1, Align::Left);
    }
    aligns_[col] = align;
}

std::vector<std::size_t> Table::widths() const {
    std::size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<std::size_t> result(num_cols, 0);
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        result[i] = std::max(result[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            result[i] = std::max(result[i], display_width(row[i]));
        }
    }
    return result;
}

std::string Table::format_line(const std::vector<std::size_t>& widths, const char* left,
                               const char* middle, const char* right) const {
    std::string line = left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        const std::size_t pad = widths[i] - std::min(widths[i], display_width(cell));
        const bool right = i < aligns_.size() && aligns_[i] == Align::Right;

        line += ' ';
        if (right) {
            line.append(pad, ' ');
        }
        line += cell;
        if (!right) {
            line.append(pad, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    const auto w = widths();
    std::string result;

    result += format_line(w, BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(w, headers_);
        result += '\n';
        result += format_line(w, BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(w, row);
        result += '\n';
    }

    result += format_line(w, BOX_BL, BOX_BT, BOX_BR);
    result += '\n';
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return prefixed("[+]", message);
}

std::string format_error(std::string_view message) {
    return prefixed("[x]", message);
}

std::string format_warning(std::string_view message) {
    return prefixed("[!]", message);
}

std::string format_debug(std::string_view message) {
    return prefixed("[*]", message);
}

std::string format_progress(std::string_view label, std::size_t current, std::size_t total) {
    std::string result = "\r[+] ";
    result.append(label);
    result += ": " + std::to_string(current) + "/" + std::to_string(total);
    if (total > 0) {
        result += " (" + std::to_string(std::min<std::size_t>(current * 100 / total, 100)) + "%)";
    }
    return result;
}

std::string format_cell(std::string_view field, std::size_t limit) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (limit > 3 && display_width(result) > limit) {
        // Обрезка по границе символа UTF-8
        std::size_t chars = 0;
        std::size_t cut = 0;
        for (; cut < result.size(); ++cut) {
            if ((static_cast<unsigned char>(result[cut]) & 0xC0) != 0x80) {
                if (chars == limit - 3) {
                    break;
                }
                ++chars;
            }
        }
        result.resize(cut);
        result += "...";
    }
    return result;
}

std::size_t display_width(std::string_view s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        return "";
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
#ifdef _WIN32
    return _isatty(_fileno(file_of(s))) != 0;
#else
    return isatty(fileno(file_of(s))) != 0;
#endif
}

}  // namespace tally::output
