// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "sysguard/cli.hpp"
#include "sysguard/commands.hpp"
#include "sysguard/output.hpp"
#include "sysguard/platform.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace {

using namespace sysguard;

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.log_path = parse_result.global.log_file;
    if (const auto* load = std::get_if<cli::LoadCommand>(&parse_result.command);
        load != nullptr && load->json) {
        out_cfg.format = output::Format::Json;
    }
    output::Writer writer(out_cfg);

    if (out_cfg.log_path.has_value() && !writer.has_log_file()) {
        writer.error("Failed to open log file: " + platform::path_to_utf8(*out_cfg.log_path));
        return 1;
    }

    writer.trace(std::string("sysguard ") + cli::VERSION + " on " + platform::os_name());

    // Ошибки парсинга выводятся без префикса [x]
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
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                return app::run_lint(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LoadCommand>) {
                return app::run_load(cmd, writer);
            } else {
                return 1;
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
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
