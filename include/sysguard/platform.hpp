// ==============================================================================
// sysguard/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY (для цветного вывода диагностики)
// - Временные файлы (лог-файлы, тесты)
//
// Вся платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef SYSGUARD_PLATFORM_HPP
#define SYSGUARD_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace sysguard::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление path
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл с заданным префиксом
/// @throw std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(std::string_view prefix);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Linux", "macOS", "Windows" или "Unknown"
std::string os_name();

}  // namespace sysguard::platform

#endif  // SYSGUARD_PLATFORM_HPP
