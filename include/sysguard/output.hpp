// ==============================================================================
// sysguard/output.hpp - Диагностика и пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами [+] [!] [x] [*] [~]
// - Перенаправление диагностики в лог-файл (--log-file)
// - Таблицы и JSON (RapidJSON) для вывода правил
//
// Writer разделяется потоками загрузки и чтения правил: одно сообщение
// всегда выводится целиком, без перемешивания с другими потоками.
//
// ==============================================================================

#ifndef SYSGUARD_OUTPUT_HPP
#define SYSGUARD_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace sysguard::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,  // таблицы/текст
    Json  // JSON документ
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // информация
    Yellow,  // предупреждения
    Red,     // ошибки
    Cyan,    // отладка
    Magenta  // трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить [+] и [!]
    int verbose = 0;              // -v: уровень подробности (0..2+)
    Format format = Format::Std;  // формат stdout

    // Путь для stdout (результаты)
    std::optional<std::filesystem::path> output_path;

    // Путь для диагностики (--log-file); по умолчанию stderr
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Диагностика
    // -------------------------------------------------------------------------

    /// "[+] <message>" (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    // JSON
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Проверить, пишется ли диагностика в файл
    bool has_log_file() const { return log_file_ != nullptr; }

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    /// Записать сообщение диагностики с префиксом (под mutex_)
    void emit(std::string_view prefix, Color color, std::string_view message);

    /// Записать байты без блокировки
    void write_unlocked(Stream s, std::string_view bytes);

    FILE* get_file(Stream s) const;

    static FILE* open_file(const std::filesystem::path& path);

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // stdout -> файл (output_path)
    FILE* log_file_ = nullptr;     // stderr -> файл (log_path)
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position, const std::vector<size_t>& widths) const;

    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace sysguard::output

#endif  // SYSGUARD_OUTPUT_HPP
