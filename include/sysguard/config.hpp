// ==============================================================================
// sysguard/config.hpp - Загрузка системных правил из YAML
// ==============================================================================
//
// Формат файла:
//
//   rules:
//     - id: cpu-guard
//       metric_type: cpu_usage   # load | avg_rt | concurrency | inbound_qps | cpu_usage
//       trigger_count: 0.8
//       strategy: bbr            # необязательно, no_adaptive по умолчанию
//       resource: ""             # необязательно
//
// Допускается также последовательность правил без ключа "rules".
//
// Здесь проверяется только структура. Пороги проверяет rule::validate()
// при загрузке в хранилище, поэтому файл может содержать правило, которое
// хранилище отбросит с предупреждением.
//
// ==============================================================================

#ifndef SYSGUARD_CONFIG_HPP
#define SYSGUARD_CONFIG_HPP

#include <sysguard/rule.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sysguard::config {

/// Ошибка разбора конфигурации
struct ConfigError {
    std::string message;
    std::string path;

    std::string format() const;
};

/// Результат разбора
struct ConfigResult {
    bool ok = false;
    std::vector<rule::Rule> rules;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать правила из YAML текста
ConfigResult parse_rules(std::string_view yaml);

/// Загрузить правила из файла (.yml/.yaml)
ConfigResult load_rule_file(const std::filesystem::path& path);

}  // namespace sysguard::config

#endif  // SYSGUARD_CONFIG_HPP
