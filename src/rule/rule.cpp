// ==============================================================================
// rule.cpp - Системные правила: строки, валидация, JSON
// ==============================================================================

#include <cmath>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sstream>
#include <stdexcept>
#include <sysguard/rule.hpp>

namespace sysguard::rule {

namespace {

template <typename JsonWriter>
void write_rule(JsonWriter& w, const Rule& r) {
    w.StartObject();
    w.Key("id");
    w.String(r.id.c_str(), static_cast<rapidjson::SizeType>(r.id.size()));
    w.Key("metric_type");
    const std::string metric = to_string(r.metric_type);
    w.String(metric.c_str(), static_cast<rapidjson::SizeType>(metric.size()));
    w.Key("trigger_count");
    w.Double(r.trigger_count);
    w.Key("strategy");
    const std::string strategy = to_string(r.strategy);
    w.String(strategy.c_str(), static_cast<rapidjson::SizeType>(strategy.size()));
    if (!r.resource.empty()) {
        w.Key("resource");
        w.String(r.resource.c_str(), static_cast<rapidjson::SizeType>(r.resource.size()));
    }
    w.EndObject();
}

}  // namespace

// ============================================================================
// Rule
// ============================================================================

std::string Rule::resource_name() const {
    if (!resource.empty()) {
        return resource;
    }
    return rule::to_string(metric_type);
}

std::string Rule::to_string() const {
    std::ostringstream oss;
    oss << "Rule{id=" << id << ", metric_type=" << rule::to_string(metric_type)
        << ", trigger_count=" << trigger_count << ", strategy=" << rule::to_string(strategy);
    if (!resource.empty()) {
        oss << ", resource=" << resource;
    }
    oss << "}";
    return oss.str();
}

bool operator==(const Rule& lhs, const Rule& rhs) {
    return lhs.id == rhs.id && lhs.metric_type == rhs.metric_type &&
           lhs.trigger_count == rhs.trigger_count && lhs.strategy == rhs.strategy &&
           lhs.resource == rhs.resource;
}

bool operator!=(const Rule& lhs, const Rule& rhs) {
    return !(lhs == rhs);
}

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    return to_string(kind) + ": " + message;
}

// ============================================================================
// Validation
// ============================================================================

std::optional<Error> validate(const Rule* rule) {
    if (rule == nullptr) {
        return Error{ErrorKind::InvalidRule, "nil rule"};
    }
    // NaN не проходит сравнение >= 0 и отбрасывается вместе с отрицательными
    if (!(rule->trigger_count >= 0.0)) {
        return Error{ErrorKind::InvalidRule, "negative threshold"};
    }
    // +inf не имеет смысла как порог и не представим в JSON
    if (!std::isfinite(rule->trigger_count)) {
        return Error{ErrorKind::InvalidRule, "threshold must be finite"};
    }
    const int metric = static_cast<int>(rule->metric_type);
    if (metric < 0 || metric >= METRIC_TYPE_COUNT) {
        return Error{ErrorKind::InvalidRule, "invalid metric type"};
    }
    if (rule->metric_type == MetricType::CpuUsage && rule->trigger_count > 1.0) {
        return Error{ErrorKind::InvalidRule, "invalid CPU usage, valid range is [0.0, 1.0]"};
    }
    return std::nullopt;
}

std::optional<Error> validate(const Rule& rule) {
    return validate(&rule);
}

// ============================================================================
// String conversion
// ============================================================================

std::string to_string(MetricType t) {
    switch (t) {
    case MetricType::Load:
        return "load";
    case MetricType::AvgRt:
        return "avg_rt";
    case MetricType::Concurrency:
        return "concurrency";
    case MetricType::InboundQps:
        return "inbound_qps";
    case MetricType::CpuUsage:
        return "cpu_usage";
    }
    return "unknown(" + std::to_string(static_cast<int>(t)) + ")";
}

std::string to_string(AdaptiveStrategy s) {
    switch (s) {
    case AdaptiveStrategy::NoAdaptive:
        return "no_adaptive";
    case AdaptiveStrategy::Bbr:
        return "bbr";
    }
    return "unknown";
}

std::string to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::InvalidRule:
        return "invalid rule";
    case ErrorKind::UpdateRejected:
        return "update rejected";
    }
    return "unknown";
}

MetricType parse_metric_type(std::string_view s) {
    if (s == "load")
        return MetricType::Load;
    if (s == "avg_rt")
        return MetricType::AvgRt;
    if (s == "concurrency")
        return MetricType::Concurrency;
    if (s == "inbound_qps")
        return MetricType::InboundQps;
    if (s == "cpu_usage")
        return MetricType::CpuUsage;
    throw std::invalid_argument(
        "unknown metric type, must be: load, avg_rt, concurrency, inbound_qps or cpu_usage");
}

AdaptiveStrategy parse_strategy(std::string_view s) {
    if (s == "no_adaptive")
        return AdaptiveStrategy::NoAdaptive;
    if (s == "bbr")
        return AdaptiveStrategy::Bbr;
    throw std::invalid_argument("unknown strategy, must be: no_adaptive or bbr");
}

// ============================================================================
// JSON
// ============================================================================

std::string rule_to_json(const Rule& r) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write_rule(writer, r);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string rules_to_json(const std::vector<Rule>& rules) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartArray();
    for (const auto& r : rules) {
        write_rule(writer, r);
    }
    writer.EndArray();
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace sysguard::rule
