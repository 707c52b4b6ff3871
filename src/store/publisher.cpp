// ==============================================================================
// publisher.cpp - Стратегии публикации индекса правил
// ==============================================================================

#include <sysguard/output.hpp>
#include <sysguard/publisher.hpp>

#include <exception>
#include <string>
#include <utility>

namespace sysguard::store {

std::optional<rule::Error> default_update_handler(const Installer& install,
                                                  rule::RuleIndexPtr index) {
    return install(std::move(index));
}

std::optional<rule::Error> PassThroughPublisher::publish(const Installer& install,
                                                         rule::RuleIndexPtr index) {
    return install(std::move(index));
}

HandlerPublisher::HandlerPublisher(UpdateHandler handler) : handler_(std::move(handler)) {}

std::optional<rule::Error> HandlerPublisher::publish(const Installer& install,
                                                     rule::RuleIndexPtr index) {
    if (!handler_) {
        return default_update_handler(install, std::move(index));
    }
    return handler_(install, std::move(index));
}

FanOutPublisher::FanOutPublisher(std::shared_ptr<Publisher> inner, output::Writer* log)
    : inner_(inner ? std::move(inner) : std::make_shared<PassThroughPublisher>()), log_(log) {}

void FanOutPublisher::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

std::optional<rule::Error> FanOutPublisher::publish(const Installer& install,
                                                    rule::RuleIndexPtr index) {
    if (auto err = inner_->publish(install, index)) {
        return err;
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(index);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++failed_;
            }
            if (log_ != nullptr) {
                log_->warn(std::string("[FanOutPublisher] Listener failed: ") + e.what());
            }
        }
    }
    return std::nullopt;
}

std::size_t FanOutPublisher::failed_notifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

}  // namespace sysguard::store
