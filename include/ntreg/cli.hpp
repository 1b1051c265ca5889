// ==============================================================================
// ntreg/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в GlobalOptions + Command
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef NTREG_CLI_HPP
#define NTREG_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ntreg::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
    bool json = false;       // -j, --json
    bool jsonl = false;      // --jsonl
    bool full = false;       // --full

    std::optional<std::filesystem::path> store;   // --store <FILE>
    std::optional<std::filesystem::path> output;  // -o, --output <FILE>
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// keys - перечислить подключи
struct KeysCommand {
    std::string path;
};

/// values - перечислить значения
struct ValuesCommand {
    std::string path;
};

/// tree - подключи и значения каждого подключа
struct TreeCommand {
    std::string path;
};

/// Данные для set: --dword, --qword, --string или --binary
using SetData = std::variant<std::uint32_t, std::uint64_t, std::string, std::vector<std::uint8_t>>;

/// set - записать значение
struct SetCommand {
    std::string path;
    std::string name;
    SetData data;
};

/// delete-value - удалить значение
struct DeleteValueCommand {
    std::string path;
    std::string name;
};

/// delete-key - удалить ключ
struct DeleteKeyCommand {
    std::string path;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<KeysCommand, ValuesCommand, TreeCommand, SetCommand,
                             DeleteValueCommand, DeleteKeyCommand, HelpCommand, VersionCommand>;

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

constexpr const char* ABOUT = "Enumerate and edit NT registry keys and values";

}  // namespace ntreg::cli

#endif  // NTREG_CLI_HPP
