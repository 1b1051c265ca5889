// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Выбор транспорта и выполнение команды (app)
// 4. Возврат exit code
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include <ntreg/app.hpp>
#include <ntreg/cli.hpp>
#include <ntreg/output.hpp>
#include <ntreg/platform.hpp>

#include <exception>
#include <iostream>

namespace {

constexpr const char* BANNER = R"(
    ███╗   ██╗████████╗██████╗ ███████╗ ██████╗
    ████╗  ██║╚══██╔══╝██╔══██╗██╔════╝██╔════╝
    ██╔██╗ ██║   ██║   ██████╔╝█████╗  ██║  ███╗
    ██║╚██╗██║   ██║   ██╔══██╗██╔══╝  ██║   ██║
    ██║ ╚████║   ██║   ██║  ██║███████╗╚██████╔╝
    ╚═╝  ╚═══╝   ╚═╝   ╚═╝  ╚═╝╚══════╝ ╚═════╝
)";

void print_banner(ntreg::output::Writer& writer) {
    const auto& cfg = writer.config();
    if (cfg.no_banner || cfg.quiet) {
        return;
    }
    writer.write(ntreg::output::Stream::Stderr, BANNER);
    writer.write_line(ntreg::output::Stream::Stderr, "");
}

int run(int argc, char** argv) {
    using namespace ntreg;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    out_cfg.full_output = parse_result.global.full;
    if (parse_result.global.json) {
        out_cfg.format = output::Format::Json;
    } else if (parse_result.global.jsonl) {
        out_cfg.format = output::Format::Jsonl;
    }
    out_cfg.output_path = parse_result.global.output;

    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // help и version не требуют транспорта и не выводят баннер
    if (std::holds_alternative<cli::HelpCommand>(parse_result.command) ||
        std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        return app::run_command(parse_result.command, nullptr, writer);
    }

    if (out_cfg.output_path && !writer.has_output_file()) {
        writer.error("Unable to open output file: " + platform::path_to_utf8(*out_cfg.output_path));
        return 1;
    }

    print_banner(writer);

    auto transport = app::open_transport(parse_result.global);
    if (auto* err = std::get_if<RegError>(&transport)) {
        writer.error(err->format());
        return 1;
    }
    if (parse_result.global.store) {
        writer.debug("Loaded store " + platform::path_to_utf8(*parse_result.global.store));
    }

    return app::run_command(parse_result.command,
                            std::get<std::shared_ptr<Transport>>(transport), writer);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
