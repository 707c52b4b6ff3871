// ==============================================================================
// rule_index.cpp - Построение индекса правил
// ==============================================================================

#include <exception>
#include <sysguard/output.hpp>
#include <sysguard/rule_index.hpp>
#include <sysguard/slot.hpp>
#include <utility>

namespace sysguard::rule {

RuleIndex::RuleIndex(Buckets buckets) : buckets_(std::move(buckets)) {
    for (const auto& [type, bucket] : buckets_) {
        (void)type;
        size_ += bucket.size();
    }
}

const RuleIndex::Bucket& RuleIndex::rules_of(MetricType t) const {
    static const Bucket empty_bucket;
    auto it = buckets_.find(t);
    return it != buckets_.end() ? it->second : empty_bucket;
}

std::vector<ConstRulePtr> RuleIndex::all() const {
    std::vector<ConstRulePtr> result;
    result.reserve(size_);
    for (const auto& [type, bucket] : buckets_) {
        (void)type;
        result.insert(result.end(), bucket.begin(), bucket.end());
    }
    return result;
}

RuleIndexPtr build_index(const std::vector<RulePtr>& candidates, slot::SlotRegistrar& registrar,
                         output::Writer& log) {
    RuleIndex::Buckets buckets;

    for (const auto& candidate : candidates) {
        if (auto err = validate(candidate.get())) {
            log.warn("[System build_index] Ignoring invalid system rule: rule=" +
                     (candidate ? candidate->to_string() : std::string("null")) +
                     ", err=" + err->message);
            continue;
        }

        buckets[candidate->metric_type].push_back(candidate);

        // Сбой регистрации слота не отменяет приём правила
        try {
            registrar.register_check_slot(candidate->resource_name(), slot::DEFAULT_ADAPTIVE_SLOT);
        } catch (const std::exception& e) {
            log.warn("[System build_index] Failed to register check slot for resource " +
                     candidate->resource_name() + ": " + e.what());
        }
    }

    return std::make_shared<const RuleIndex>(std::move(buckets));
}

}  // namespace sysguard::rule
