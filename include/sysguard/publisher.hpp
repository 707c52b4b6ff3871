// ==============================================================================
// sysguard/publisher.hpp - Публикация нового индекса правил
// ==============================================================================
//
// Назначение:
// - Installer: callback хранилища, атомарно устанавливающий индекс
// - UpdateHandler: функция-перехватчик каждой загрузки
// - Publisher: стратегия публикации; реализации комбинируются через
//   композицию (PassThrough, адаптер UpdateHandler, FanOut)
//
// Publisher сам решает, вызывать ли installer. Ошибка, возвращённая
// publisher'ом, оставляет хранилище без изменений.
//
// ==============================================================================

#ifndef SYSGUARD_PUBLISHER_HPP
#define SYSGUARD_PUBLISHER_HPP

#include <sysguard/rule.hpp>
#include <sysguard/rule_index.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sysguard::output {
class Writer;
}

namespace sysguard::store {

/// Установить индекс в хранилище (обмен указателя под эксклюзивной блокировкой)
using Installer = std::function<std::optional<rule::Error>(rule::RuleIndexPtr)>;

/// Перехватчик загрузки: получает installer и построенный индекс
using UpdateHandler =
    std::function<std::optional<rule::Error>(const Installer&, rule::RuleIndexPtr)>;

/// Обработчик по умолчанию: сразу вызывает installer
std::optional<rule::Error> default_update_handler(const Installer& install,
                                                  rule::RuleIndexPtr index);

// ----------------------------------------------------------------------------
// Publisher
// ----------------------------------------------------------------------------

class Publisher {
public:
    virtual ~Publisher() = default;

    virtual std::optional<rule::Error> publish(const Installer& install,
                                               rule::RuleIndexPtr index) = 0;
};

/// Публикация без перехвата
class PassThroughPublisher final : public Publisher {
public:
    std::optional<rule::Error> publish(const Installer& install, rule::RuleIndexPtr index) override;
};

/// Адаптер UpdateHandler -> Publisher
class HandlerPublisher final : public Publisher {
public:
    explicit HandlerPublisher(UpdateHandler handler);

    std::optional<rule::Error> publish(const Installer& install, rule::RuleIndexPtr index) override;

private:
    UpdateHandler handler_;
};

/// Устанавливает индекс через inner publisher, затем раздаёт его слушателям.
/// При ошибке установки слушатели не вызываются. К моменту вызова слушателей
/// индекс уже активен, поэтому исключение слушателя не отменяет загрузку:
/// оно логируется (если задан log), остальные слушатели вызываются.
class FanOutPublisher final : public Publisher {
public:
    using Listener = std::function<void(const rule::RuleIndexPtr&)>;

    /// inner == nullptr - PassThroughPublisher
    explicit FanOutPublisher(std::shared_ptr<Publisher> inner = nullptr,
                             output::Writer* log = nullptr);

    void add_listener(Listener listener);

    std::optional<rule::Error> publish(const Installer& install, rule::RuleIndexPtr index) override;

    /// Число исключений, выброшенных слушателями
    std::size_t failed_notifications() const;

private:
    std::shared_ptr<Publisher> inner_;
    output::Writer* log_;
    mutable std::mutex mutex_;
    std::vector<Listener> listeners_;
    std::size_t failed_ = 0;
};

}  // namespace sysguard::store

#endif  // SYSGUARD_PUBLISHER_HPP
