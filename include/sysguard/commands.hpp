// ==============================================================================
// sysguard/commands.hpp - Команды приложения (lint, load)
// ==============================================================================
//
// Назначение:
// - lint: разбор файлов правил и проверка каждого правила validate()
// - load: последовательная загрузка файлов в RuleStore и вывод активных правил
//
// Диагностика пишется в переданный Writer, результаты - в его stdout
// (или в файл --output). Функции возвращают exit code.
//
// ==============================================================================

#ifndef SYSGUARD_COMMANDS_HPP
#define SYSGUARD_COMMANDS_HPP

#include <sysguard/cli.hpp>

namespace sysguard::output {
class Writer;
}

namespace sysguard::app {

/// 0 - все файлы разобраны (некорректные правила только предупреждение),
/// 1 - хотя бы один файл не разобран
int run_lint(const cli::LintCommand& cmd, output::Writer& writer);

/// 0 - все файлы загружены и правила выведены,
/// 1 - ошибка разбора, загрузки или открытия --output
int run_load(const cli::LoadCommand& cmd, output::Writer& writer);

}  // namespace sysguard::app

#endif  // SYSGUARD_COMMANDS_HPP
