// ==============================================================================
// sysguard/rule.hpp - Системные правила адаптивной защиты
// ==============================================================================
//
// Назначение:
// - Структура системного правила (Rule) и перечисления метрик/стратегий
// - Валидация правила (validate)
// - Ошибки модуля (InvalidRule / UpdateRejected)
// - Строковое и JSON представление правил для диагностики
//
// Правило, принятое в активный индекс, не изменяется: обновление всегда
// заменяет набор правил целиком.
//
// ==============================================================================

#ifndef SYSGUARD_RULE_HPP
#define SYSGUARD_RULE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysguard::rule {

// ============================================================================
// Enums
// ============================================================================

/// Системная метрика, которую ограничивает правило
enum class MetricType {
    Load,         // load average
    AvgRt,        // среднее время ответа входящего трафика
    Concurrency,  // число запросов в обработке
    InboundQps,   // входящий QPS
    CpuUsage      // доля загрузки CPU, [0.0, 1.0]
};

/// Количество известных значений MetricType.
/// Значения вне [0, METRIC_TYPE_COUNT) считаются неизвестными.
constexpr int METRIC_TYPE_COUNT = 5;

/// Адаптивная стратегия. Модуль её не интерпретирует, только хранит.
enum class AdaptiveStrategy { NoAdaptive, Bbr };

// ============================================================================
// Rule
// ============================================================================

struct Rule {
    std::string id;
    MetricType metric_type = MetricType::Load;
    double trigger_count = 0.0;  // порог, смысл зависит от metric_type
    AdaptiveStrategy strategy = AdaptiveStrategy::NoAdaptive;

    // Ресурс для регистрации слота проверки. Пусто - имя метрики.
    std::string resource;

    /// Имя ресурса, под которым правило регистрируется в цепочке слотов
    std::string resource_name() const;

    /// Однострочное представление для диагностики
    std::string to_string() const;
};

bool operator==(const Rule& lhs, const Rule& rhs);
bool operator!=(const Rule& lhs, const Rule& rhs);

// ============================================================================
// Error handling
// ============================================================================

enum class ErrorKind {
    InvalidRule,    // правило не прошло валидацию, отбрасывается с предупреждением
    UpdateRejected  // обработчик обновления отклонил публикацию
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidRule;
    std::string message;

    std::string format() const;
};

// ============================================================================
// Validation
// ============================================================================

/// Проверить правило.
///
/// InvalidRule, если:
/// - rule == nullptr
/// - trigger_count < 0 или NaN
/// - trigger_count == +inf
/// - metric_type вне известного диапазона
/// - metric_type == CpuUsage и trigger_count > 1.0
///
/// @return std::nullopt для корректного правила
std::optional<Error> validate(const Rule* rule);

std::optional<Error> validate(const Rule& rule);

// ============================================================================
// String conversion
// ============================================================================

std::string to_string(MetricType t);

std::string to_string(AdaptiveStrategy s);

std::string to_string(ErrorKind k);

/// @throw std::invalid_argument если строка не распознана
MetricType parse_metric_type(std::string_view s);

/// @throw std::invalid_argument если строка не распознана
AdaptiveStrategy parse_strategy(std::string_view s);

// ============================================================================
// JSON (RapidJSON)
// ============================================================================

/// Компактный JSON объект правила
std::string rule_to_json(const Rule& r);

/// Компактный JSON массив правил
std::string rules_to_json(const std::vector<Rule>& rules);

}  // namespace sysguard::rule

#endif  // SYSGUARD_RULE_HPP
