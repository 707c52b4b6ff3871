// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv: формат ошибок в стиле clap, exit code 2 для
// ошибок использования.
//
// ==============================================================================

#include "sysguard/cli.hpp"

#include "sysguard/platform.hpp"

#include <cstring>

namespace sysguard::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-v", "-vv", "-vvv"
bool is_verbose_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

ParseResult usage_error(std::string message) {
    ParseResult result;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        "error: " + std::move(message) + "\n\nFor more information, try '--help'.\n";
    return result;
}

ParseResult missing_paths(const char* command) {
    return usage_error(std::string("the following required arguments were not provided:\n"
                                   "  <PATH>...\n\n"
                                   "Usage: sysguard ") +
                       command + " <PATH>...");
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sysguard ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: sysguard [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  lint  Validate rule files without loading them\n"
               "  load  Load rule files into the rule store and print the active rules\n"
               "  help  Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -v...                  Print verbose output\n"
               "  -q                     Suppress informational output\n"
               "      --log-file <FILE>  Write diagnostics to a file instead of stderr\n"
               "  -h, --help             Print help\n"
               "  -V, --version          Print version\n";
    } else if (*command == "lint") {
        return "Validate rule files without loading them\n"
               "\n"
               "Usage: sysguard lint <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Rule files (.yml/.yaml)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "load") {
        return "Load rule files into the rule store and print the active rules\n"
               "\n"
               "Usage: sysguard load [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Rule files, loaded in order; each file replaces the previous rules\n"
               "\n"
               "Options:\n"
               "  -j, --json             Print the active rules as JSON\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -h, --help             Print help\n";
    }
    return render_help(std::nullopt);
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;

    // Глобальные опции до подкоманды
    int cmd_idx = 1;
    for (; cmd_idx < argc; ++cmd_idx) {
        const char* arg = argv[cmd_idx];
        if (is_verbose_flag(arg)) {
            result.global.verbose += static_cast<int>(std::strlen(arg)) - 1;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--log-file")) {
            if (cmd_idx + 1 >= argc) {
                return usage_error("a value is required for '--log-file <FILE>' but none was "
                                   "supplied");
            }
            ++cmd_idx;
            result.global.log_file = platform::path_from_utf8(argv[cmd_idx]);
        } else if (starts_with(arg, "--log-file=")) {
            result.global.log_file = platform::path_from_utf8(arg + 11);  // strlen("--log-file=")
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error(std::string("unexpected argument '") + arg + "' found");
        } else {
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "help")) {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            help_cmd.command = argv[cmd_idx + 1];
        }
        result.ok = true;
        result.command = help_cmd;
    } else if (str_eq(cmd, "lint")) {
        LintCommand lint_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"lint"};
                return result;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (is_verbose_flag(arg)) {
                result.global.verbose += static_cast<int>(std::strlen(arg)) - 1;
            } else if (arg[0] != '-') {
                lint_cmd.paths.push_back(platform::path_from_utf8(arg));
            } else {
                return usage_error(std::string("unexpected argument '") + arg + "' found");
            }
        }
        if (lint_cmd.paths.empty()) {
            return missing_paths("lint");
        }
        result.ok = true;
        result.command = lint_cmd;
    } else if (str_eq(cmd, "load")) {
        LoadCommand load_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"load"};
                return result;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                load_cmd.json = true;
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                if (i + 1 >= argc) {
                    return usage_error(
                        "a value is required for '--output <OUTPUT>' but none was supplied");
                }
                ++i;
                load_cmd.output = platform::path_from_utf8(argv[i]);
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (is_verbose_flag(arg)) {
                result.global.verbose += static_cast<int>(std::strlen(arg)) - 1;
            } else if (arg[0] != '-') {
                load_cmd.paths.push_back(platform::path_from_utf8(arg));
            } else {
                return usage_error(std::string("unexpected argument '") + arg + "' found");
            }
        }
        if (load_cmd.paths.empty()) {
            return missing_paths("load");
        }
        result.ok = true;
        result.command = load_cmd;
    } else {
        return usage_error(std::string("unrecognized subcommand '") + cmd + "'");
    }

    return result;
}

}  // namespace sysguard::cli
