// ==============================================================================
// slot.cpp - Регистрация слотов проверки
// ==============================================================================

#include "sysguard/slot.hpp"

namespace sysguard::slot {

void SlotRegistry::register_check_slot(const std::string& resource, const std::string& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[resource].insert(slot);
    ++calls_;
}

bool SlotRegistry::has_slot(const std::string& resource, const std::string& slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(resource);
    return it != slots_.end() && it->second.count(slot) > 0;
}

std::vector<std::string> SlotRegistry::slots_of(const std::string& resource) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(resource);
    if (it == slots_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> SlotRegistry::resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(slots_.size());
    for (const auto& [resource, slots] : slots_) {
        (void)slots;
        result.push_back(resource);
    }
    return result;
}

std::size_t SlotRegistry::registration_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

}  // namespace sysguard::slot
