// ==============================================================================
// store.cpp - Хранилище активных системных правил
// ==============================================================================

#include <sysguard/output.hpp>
#include <sysguard/slot.hpp>
#include <sysguard/store.hpp>

#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace sysguard::store {

namespace {

std::string candidates_to_string(const std::vector<rule::RulePtr>& rules) {
    std::string result = "[";
    for (size_t i = 0; i < rules.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += rules[i] ? rules[i]->to_string() : "null";
    }
    result += "]";
    return result;
}

std::vector<rule::Rule> copy_rules(const rule::RuleIndex::Bucket& bucket) {
    std::vector<rule::Rule> result;
    result.reserve(bucket.size());
    for (const auto& r : bucket) {
        result.push_back(*r);
    }
    return result;
}

}  // namespace

RuleStore::RuleStore(slot::SlotRegistrar& registrar, output::Writer& log)
    : registrar_(registrar),
      log_(log),
      index_(std::make_shared<const rule::RuleIndex>()),
      publisher_(std::make_shared<PassThroughPublisher>()) {}

// ============================================================================
// Чтение
// ============================================================================

rule::RuleIndexPtr RuleStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_;
}

std::vector<rule::Rule> RuleStore::rules() const {
    // Копии делаются вне блокировки: снимок неизменяем
    auto index = snapshot();
    std::vector<rule::Rule> result;
    result.reserve(index->size());
    for (const auto& r : index->all()) {
        result.push_back(*r);
    }
    return result;
}

std::vector<rule::RulePtr> RuleStore::current_rules() const {
    auto index = snapshot();
    // Индекс строится из изменяемых правил (build_index), снятие const корректно
    std::vector<rule::RulePtr> result;
    result.reserve(index->size());
    for (const auto& r : index->all()) {
        result.push_back(std::const_pointer_cast<rule::Rule>(r));
    }
    return result;
}

std::vector<rule::Rule> RuleStore::rules_of(rule::MetricType t) const {
    auto index = snapshot();
    return copy_rules(index->rules_of(t));
}

std::size_t RuleStore::size() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_->size();
}

// ============================================================================
// Загрузка
// ============================================================================

LoadResult RuleStore::load_rules(const std::vector<rule::RulePtr>& rules) {
    auto index = rule::build_index(rules, registrar_, log_);
    auto publisher = current_publisher();

    Publication publication;
    Installer installer = [this, &publication](rule::RuleIndexPtr built) {
        return install(std::move(built), publication);
    };

    std::optional<rule::Error> err;
    try {
        err = publisher->publish(installer, std::move(index));
    } catch (const std::exception& e) {
        err = rule::Error{rule::ErrorKind::UpdateRejected, e.what()};
    }

    if (err) {
        err->kind = rule::ErrorKind::UpdateRejected;
        if (publication.installed && roll_back(publication)) {
            log_.warn("[SystemRuleManager] Restored previous system rules after failed update");
        }
        log_.error("Fail to load rules in RuleStore::load_rules: " + err->message +
                   ", rules=" + candidates_to_string(rules));
        return LoadResult{false, *err};
    }
    return LoadResult{true, {}};
}

LoadResult RuleStore::load_rules(const std::vector<rule::Rule>& rules) {
    std::vector<rule::RulePtr> candidates;
    candidates.reserve(rules.size());
    for (const auto& r : rules) {
        candidates.push_back(std::make_shared<rule::Rule>(r));
    }
    return load_rules(candidates);
}

LoadResult RuleStore::clear_rules() {
    return load_rules(std::vector<rule::RulePtr>{});
}

std::optional<rule::Error> RuleStore::install(rule::RuleIndexPtr index,
                                              Publication& publication) {
    if (!index) {
        return rule::Error{rule::ErrorKind::UpdateRejected, "nil rule index"};
    }
    const std::size_t count = index->size();
    // JSON для диагностики собирается до блокировки и только если будет выведен
    std::vector<rule::Rule> published;
    if (!log_.config().quiet && count > 0) {
        published.reserve(count);
        for (const auto& r : index->all()) {
            published.push_back(*r);
        }
    }

    publication.installed = index;
    const auto start = std::chrono::steady_clock::now();
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        index_.swap(index);
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() -
                                                             start);
    // Прежний индекс живёт до конца загрузки и освобождается вне критической секции
    publication.previous = std::move(index);

    log_.debug("[System install] Time statistic(ns) for updating system rule: timeCost=" +
               std::to_string(elapsed.count()));
    if (count > 0) {
        log_.info("[SystemRuleManager] System rules loaded: " + rule::rules_to_json(published));
    } else {
        log_.info("[SystemRuleManager] System rules were cleared");
    }
    return std::nullopt;
}

bool RuleStore::roll_back(const Publication& publication) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    if (index_ != publication.installed) {
        return false;
    }
    index_ = publication.previous;
    return true;
}

// ============================================================================
// Перехват публикации
// ============================================================================

std::shared_ptr<Publisher> RuleStore::current_publisher() const {
    std::lock_guard<std::mutex> lock(publisher_mutex_);
    return publisher_;
}

void RuleStore::register_update_handler(UpdateHandler handler) {
    std::shared_ptr<Publisher> publisher;
    if (handler) {
        publisher = std::make_shared<HandlerPublisher>(std::move(handler));
    }
    set_publisher(std::move(publisher));
}

void RuleStore::set_publisher(std::shared_ptr<Publisher> publisher) {
    if (!publisher) {
        publisher = std::make_shared<PassThroughPublisher>();
    }
    std::lock_guard<std::mutex> lock(publisher_mutex_);
    publisher_ = std::move(publisher);
}

}  // namespace sysguard::store
