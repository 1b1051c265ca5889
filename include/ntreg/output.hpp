// ==============================================================================
// ntreg/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+] [!] [x] [*] [~])
// - Таблицы (box-drawing), JSON и JSON Lines через RapidJSON
// - Цвет только для TTY; вывод в файл (--output) без ANSI кодов
//
// ==============================================================================

#ifndef NTREG_OUTPUT_HPP
#define NTREG_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace ntreg::output {

enum class Stream { Stdout, Stderr };

/// Формат вывода результатов
enum class Format {
    Std,   // Таблица / текст
    Json,  // Один JSON массив
    Jsonl  // Один JSON объект на строку
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

/// Конфигурация вывода
struct OutputConfig {
    bool quiet = false;        // -q
    int verbose = 0;           // -v (повторяется)
    bool no_banner = false;    // --no-banner
    bool full_output = false;  // --full: не обрезать длинные значения
    Format format = Format::Std;

    std::optional<std::filesystem::path> output_path;  // -o
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

    /// "[+] <message>" в stderr (подавляется -q)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (подавляется -q)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>" при verbose > 1
    void trace(std::string_view message);

    /// Компактный JSON в stdout
    void write_json(const rapidjson::Value& value);

    /// Компактный JSON + '\n'
    void write_json_line(const rapidjson::Value& value);

    /// JSON с отступами + '\n'
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыт ли файл, заданный через -o (false если открыть не удалось)
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    bool open_output_file();
    void close_output_file();
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* target(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    std::string to_string() const;
    void print(Writer& w) const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Подготовить значение для ячейки таблицы
///
/// Переводы строк и табуляции заменяются пробелом, повторные пробелы
/// схлопываются. При full_output=false строка обрезается до 496 байт.
std::string format_field(std::string_view field, bool full_output);

/// Число отображаемых символов UTF-8 строки (continuation байты не считаются)
std::size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);
bool supports_color(Stream s);

}  // namespace ntreg::output

#endif  // NTREG_OUTPUT_HPP
