// ==============================================================================
// sysguard/rule_index.hpp - Индекс правил по типу метрики
// ==============================================================================
//
// Назначение:
// - RuleIndex: неизменяемая группировка правил по MetricType
// - build_index: валидация кандидатов, группировка, регистрация слотов
//
// Индекс строится заново при каждой загрузке и после построения не
// изменяется (copy-on-write снимок). Все правила в индексе прошли validate().
// Внутри группы сохраняется порядок приёма правил. Через индекс правила
// доступны только на чтение.
//
// ==============================================================================

#ifndef SYSGUARD_RULE_INDEX_HPP
#define SYSGUARD_RULE_INDEX_HPP

#include <sysguard/rule.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace sysguard::output {
class Writer;
}

namespace sysguard::slot {
class SlotRegistrar;
}

namespace sysguard::rule {

using RulePtr = std::shared_ptr<Rule>;
using ConstRulePtr = std::shared_ptr<const Rule>;

class RuleIndex {
public:
    using Bucket = std::vector<ConstRulePtr>;
    using Buckets = std::map<MetricType, Bucket>;

    RuleIndex() = default;
    explicit RuleIndex(Buckets buckets);

    /// Общее число правил
    std::size_t size() const { return size_; }

    bool empty() const { return size_ == 0; }

    /// Число непустых групп
    std::size_t bucket_count() const { return buckets_.size(); }

    /// Правила одного типа; пустой вектор, если группы нет
    const Bucket& rules_of(MetricType t) const;

    /// Все правила: группы по возрастанию MetricType, внутри - порядок приёма
    std::vector<ConstRulePtr> all() const;

    const Buckets& buckets() const { return buckets_; }

private:
    Buckets buckets_;
    std::size_t size_ = 0;
};

using RuleIndexPtr = std::shared_ptr<const RuleIndex>;

/// Построить индекс из кандидатов.
///
/// - Пустой список даёт пустой индекс (так очищаются правила)
/// - Некорректные правила пропускаются с предупреждением, остальные
///   продолжают обрабатываться
/// - Для каждого принятого правила вызывается
///   registrar.register_check_slot(rule->resource_name(), DEFAULT_ADAPTIVE_SLOT);
///   исключение регистратора логируется и не отменяет приём правила
RuleIndexPtr build_index(const std::vector<RulePtr>& candidates, slot::SlotRegistrar& registrar,
                         output::Writer& log);

}  // namespace sysguard::rule

#endif  // SYSGUARD_RULE_INDEX_HPP
