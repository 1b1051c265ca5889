// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Глобальные опции допускаются до и после подкоманды. Первый аргумент,
// не начинающийся с '-', является подкомандой; остальные - позиционные.
//
// ==============================================================================

#include <ntreg/cli.hpp>
#include <ntreg/platform.hpp>
#include <ntreg/value.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace ntreg::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Разобрать десятичное или 0x-шестнадцатеричное беззнаковое число
std::optional<std::uint64_t> parse_number(const char* text) {
    if (text == nullptr) {
        return std::nullopt;
    }
    int base = 10;
    if (text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text += 2;
    }
    // strtoull сам пропускает пробелы и принимает знак
    const unsigned char first = static_cast<unsigned char>(*text);
    if (base == 16 ? !std::isxdigit(first) : !std::isdigit(first)) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text, &end, base);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(v);
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

constexpr const char* MAIN_USAGE = "ntreg [OPTIONS] <COMMAND>";

/// Описание подкоманды: имя, число позиционных аргументов, usage
struct CommandInfo {
    const char* name;
    std::size_t positional;
    const char* usage;
    const char* arguments;
};

constexpr CommandInfo COMMANDS[] = {
    {"keys", 1, "ntreg keys [OPTIONS] <PATH>", "<PATH>"},
    {"values", 1, "ntreg values [OPTIONS] <PATH>", "<PATH>"},
    {"tree", 1, "ntreg tree [OPTIONS] <PATH>", "<PATH>"},
    {"set", 2,
     "ntreg set [OPTIONS] <PATH> <NAME> "
     "<--dword <N>|--qword <N>|--string <S>|--binary <HEX>>",
     "<PATH> <NAME>"},
    {"delete-value", 2, "ntreg delete-value [OPTIONS] <PATH> <NAME>", "<PATH> <NAME>"},
    {"delete-key", 1, "ntreg delete-key [OPTIONS] <PATH>", "<PATH>"},
};

const CommandInfo* find_command(const char* name) {
    for (const auto& info : COMMANDS) {
        if (str_eq(info.name, name)) {
            return &info;
        }
    }
    return nullptr;
}

ParseResult fail(ParseResult result, std::string message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = std::move(message);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("ntreg ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    static const char* OPTIONS =
        "Options:\n"
        "      --store <FILE>   Use a YAML key store instead of the system registry\n"
        "  -j, --json           Output as JSON\n"
        "      --jsonl          Output as JSON lines\n"
        "  -o, --output <FILE>  Save output to a file\n"
        "      --full           Do not truncate long values\n"
        "  -v...                Print verbose output\n"
        "  -q                   Suppress informational output\n"
        "      --no-banner      Hide the banner\n"
        "  -h, --help           Print help\n";

    if (!command) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: ntreg [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  keys          List the subkeys of a key\n"
               "  values        List the values of a key\n"
               "  tree          List the subkeys of a key with their values\n"
               "  set           Write a value\n"
               "  delete-value  Delete a value\n"
               "  delete-key    Delete a key without subkeys\n"
               "  help          Print this message or the help of the given subcommand\n"
               "\n" +
               OPTIONS +
               "  -V, --version        Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    List autorun entries:\n"
               "        ntreg values '\\Registry\\Machine\\Software\\Microsoft\\Windows"
               "\\CurrentVersion\\Run'\n"
               "\n"
               "    Enumerate a key from a YAML store as JSON:\n"
               "        ntreg --store store.yml keys '\\Registry\\Machine\\Software' --json\n";
    }

    const CommandInfo* info = find_command(command->c_str());
    if (info == nullptr) {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }

    std::string help = std::string("Usage: ") + info->usage + "\n\nArguments:\n";
    help += "  <PATH>  Full key path, e.g. \\Registry\\Machine\\Software\n";
    if (info->positional > 1) {
        help += "  <NAME>  Value name (empty string for the default value)\n";
    }
    help += "\n";
    if (str_eq(info->name, "set")) {
        help += "Data:\n"
                "      --dword <N>      REG_DWORD (decimal or 0x hex)\n"
                "      --qword <N>      REG_QWORD (decimal or 0x hex)\n"
                "      --string <S>     REG_SZ\n"
                "      --binary <HEX>   REG_BINARY, e.g. 0a0b0c\n"
                "\n";
    }
    help += OPTIONS;
    return help;
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        return fail(result, render_help(std::nullopt));
    }

    const CommandInfo* info = nullptr;
    bool help_command = false;
    bool help_requested = false;
    std::vector<std::string> positional;
    std::optional<SetData> set_data;
    int set_data_count = 0;

    auto usage = [&]() { return info != nullptr ? info->usage : MAIN_USAGE; };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Опции с аргументом
        auto take_value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing_value = [&](const char* option) {
            return fail(result, render_usage_error(std::string("error: a value is required for '") +
                                                       option + "' but none was supplied",
                                                   usage()));
        };

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            result.global.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            result.global.jsonl = true;
        } else if (str_eq(arg, "--full")) {
            result.global.full = true;
        } else if (str_eq(arg, "--store")) {
            const char* v = take_value();
            if (v == nullptr) {
                return missing_value("--store <FILE>");
            }
            result.global.store = platform::path_from_utf8(v);
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            const char* v = take_value();
            if (v == nullptr) {
                return missing_value("--output <FILE>");
            }
            result.global.output = platform::path_from_utf8(v);
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            help_requested = true;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--dword") || str_eq(arg, "--qword")) {
            const bool dword = str_eq(arg, "--dword");
            const char* v = take_value();
            if (v == nullptr) {
                return missing_value(dword ? "--dword <N>" : "--qword <N>");
            }
            auto number = parse_number(v);
            if (!number || (dword && *number > std::numeric_limits<std::uint32_t>::max())) {
                return fail(result, render_usage_error(std::string("error: invalid value '") + v +
                                                           "' for '" + arg + " <N>'",
                                                       usage()));
            }
            if (dword) {
                set_data = static_cast<std::uint32_t>(*number);
            } else {
                set_data = *number;
            }
            ++set_data_count;
        } else if (str_eq(arg, "--string")) {
            const char* v = take_value();
            if (v == nullptr) {
                return missing_value("--string <S>");
            }
            set_data = std::string(v);
            ++set_data_count;
        } else if (str_eq(arg, "--binary")) {
            const char* v = take_value();
            if (v == nullptr) {
                return missing_value("--binary <HEX>");
            }
            auto bytes = parse_hex_bytes(v);
            if (!bytes) {
                return fail(result, render_usage_error(std::string("error: invalid value '") + v +
                                                           "' for '--binary <HEX>'",
                                                       usage()));
            }
            set_data = std::move(*bytes);
            ++set_data_count;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            return fail(result,
                        render_usage_error(std::string("error: unexpected argument '") + arg +
                                               "' found",
                                           usage()));
        } else if (info == nullptr && !help_command) {
            if (str_eq(arg, "help")) {
                help_command = true;
                continue;
            }
            info = find_command(arg);
            if (info == nullptr) {
                return fail(result, render_usage_error(
                                        std::string("error: unrecognized subcommand '") + arg + "'",
                                        MAIN_USAGE));
            }
        } else {
            positional.emplace_back(arg);
        }
    }

    // help [COMMAND]
    if (help_command) {
        result.ok = true;
        if (info != nullptr) {
            result.command = HelpCommand{std::string(info->name)};
        } else if (!positional.empty()) {
            result.command = HelpCommand{positional.front()};
        }
        return result;
    }
    if (help_requested) {
        result.ok = true;
        if (info != nullptr) {
            result.command = HelpCommand{std::string(info->name)};
        }
        return result;
    }
    if (info == nullptr) {
        return fail(result, render_help(std::nullopt));
    }

    if (positional.size() < info->positional) {
        return fail(result, render_usage_error(
                                std::string("error: the following required arguments were not "
                                            "provided:\n  ") +
                                    info->arguments,
                                info->usage));
    }
    if (positional.size() > info->positional) {
        return fail(result, render_usage_error("error: unexpected argument '" +
                                                   positional[info->positional] + "' found",
                                               info->usage));
    }

    if (set_data_count > 0 && !str_eq(info->name, "set")) {
        return fail(result, render_usage_error(
                                "error: value data options are only valid for 'set'",
                                info->usage));
    }

    if (result.global.json && result.global.jsonl) {
        return fail(result, render_usage_error(
                                "error: the argument '--json' cannot be used with '--jsonl'",
                                info->usage));
    }

    const std::string& path = positional[0];
    if (str_eq(info->name, "keys")) {
        result.command = KeysCommand{path};
    } else if (str_eq(info->name, "values")) {
        result.command = ValuesCommand{path};
    } else if (str_eq(info->name, "tree")) {
        result.command = TreeCommand{path};
    } else if (str_eq(info->name, "set")) {
        if (set_data_count != 1) {
            return fail(result, render_usage_error(
                                    "error: exactly one of '--dword', '--qword', '--string' or "
                                    "'--binary' is required",
                                    info->usage));
        }
        result.command = SetCommand{path, positional[1], std::move(*set_data)};
    } else if (str_eq(info->name, "delete-value")) {
        result.command = DeleteValueCommand{path, positional[1]};
    } else {
        result.command = DeleteKeyCommand{path};
    }

    result.ok = true;
    return result;
}

}  // namespace ntreg::cli
