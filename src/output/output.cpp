// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. std::endl не используется:
// байты пишутся через fwrite, сброс буферов явный.
//
// ==============================================================================

#include <ntreg/output.hpp>
#include <ntreg/platform.hpp>

#include <algorithm>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace ntreg::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";

// Box-drawing символы (UTF-8)
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

constexpr std::size_t FIELD_LENGTH_LIMIT = 496;

struct Border {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr Border BORDER_TOP = {BOX_TL, BOX_TT, BOX_TR};
constexpr Border BORDER_MIDDLE = {BOX_LT, BOX_CROSS, BOX_RT};
constexpr Border BORDER_BOTTOM = {BOX_BL, BOX_BT, BOX_BR};

std::string border_line(const std::vector<std::size_t>& widths, const Border& border) {
    std::string line = border.left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? border.middle : border.right;
    }
    line += '\n';
    return line;
}

std::string row_line(const std::vector<std::size_t>& widths,
                     const std::vector<std::string>& cells) {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = i < cells.size() ? cells[i] : std::string();
        line += ' ';
        line += cell;
        const std::size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    line += '\n';
    return line;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

FILE* Writer::target(Stream s) const {
    // stdout перенаправляется в файл при -o
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    write_colored(Stream::Stderr, prefix, color);
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (!config_.quiet) {
        write_prefixed("[+]", Color::Green, message);
    }
}

void Writer::warn(std::string_view message) {
    if (!config_.quiet) {
        write_prefixed("[!]", Color::Yellow, message);
    }
}

void Writer::error(std::string_view message) {
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose > 0) {
        write_prefixed("[*]", Color::Cyan, message);
    }
}

void Writer::trace(std::string_view message) {
    if (config_.verbose > 1) {
        write_prefixed("[~]", Color::Magenta, message);
    }
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл ANSI коды не пишутся
    const bool to_file = s == Stream::Stdout && output_file_ != nullptr;
    if (!to_file && supports_color(s) && color != Color::Default) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);
    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    const auto& path = *config_.output_path;
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
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

std::vector<std::size_t> Table::column_widths() const {
    std::size_t columns = headers_.size();
    for (const auto& row : rows_) {
        columns = std::max(columns, row.size());
    }

    std::vector<std::size_t> widths(columns, 0);
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = display_width(headers_[i]);
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::to_string() const {
    const auto widths = column_widths();

    std::string result = border_line(widths, BORDER_TOP);
    if (!headers_.empty()) {
        result += row_line(widths, headers_);
        result += border_line(widths, BORDER_MIDDLE);
    }
    for (const auto& row : rows_) {
        result += row_line(widths, row);
    }
    result += border_line(widths, BORDER_BOTTOM);
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_field(std::string_view field, bool full_output) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        const bool space = c == ' ' || c == '\n' || c == '\r' || c == '\t';
        if (space) {
            if (!prev_space) {
                result += ' ';
            }
            prev_space = true;
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (!full_output && result.size() > FIELD_LENGTH_LIMIT) {
        // Не разрезаем многобайтовую последовательность UTF-8
        std::size_t cut = FIELD_LENGTH_LIMIT;
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result.resize(cut);
        result += "...";
    }
    return result;
}

std::size_t display_width(std::string_view text) {
    std::size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return "";
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace ntreg::output
