// ==============================================================================
// sysguard/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SYSGUARD_CLI_HPP
#define SYSGUARD_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sysguard::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                                // -v (repeatable)
    bool quiet = false;                             // -q
    std::optional<std::filesystem::path> log_file;  // --log-file
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// lint - проверка файлов правил без загрузки
struct LintCommand {
    std::vector<std::filesystem::path> paths;
};

/// load - последовательная загрузка файлов в хранилище и вывод активных правил
struct LoadCommand {
    std::vector<std::filesystem::path> paths;
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> output;  // -o, --output
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<LintCommand, LoadCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
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

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Validate and load adaptive system protection rules";

}  // namespace sysguard::cli

#endif  // SYSGUARD_CLI_HPP
