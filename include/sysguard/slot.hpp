// ==============================================================================
// sysguard/slot.hpp - Регистрация слотов проверки для ресурсов
// ==============================================================================
//
// Назначение:
// - Интерфейс SlotRegistrar: цепочка обработки ресурса узнаёт, что для
//   ресурса нужно выполнять проверку системных правил
// - SlotRegistry: потокобезопасная реализация в памяти
//
// Регистрация идемпотентна: повторная регистрация пары (ресурс, слот)
// ничего не меняет. Удаление регистраций не поддерживается.
//
// ==============================================================================

#ifndef SYSGUARD_SLOT_HPP
#define SYSGUARD_SLOT_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sysguard::slot {

/// Слот, выполняющий проверку системных правил
constexpr const char* DEFAULT_ADAPTIVE_SLOT = "system-adaptive";

// ----------------------------------------------------------------------------
// SlotRegistrar
// ----------------------------------------------------------------------------

class SlotRegistrar {
public:
    virtual ~SlotRegistrar() = default;

    /// Зарегистрировать слот проверки для ресурса.
    /// Может бросить std::exception при сбое.
    virtual void register_check_slot(const std::string& resource, const std::string& slot) = 0;
};

// ----------------------------------------------------------------------------
// SlotRegistry
// ----------------------------------------------------------------------------

class SlotRegistry final : public SlotRegistrar {
public:
    SlotRegistry() = default;

    void register_check_slot(const std::string& resource, const std::string& slot) override;

    bool has_slot(const std::string& resource, const std::string& slot) const;

    /// Слоты ресурса в лексикографическом порядке
    std::vector<std::string> slots_of(const std::string& resource) const;

    /// Зарегистрированные ресурсы в лексикографическом порядке
    std::vector<std::string> resources() const;

    /// Общее число вызовов register_check_slot, включая повторные
    std::size_t registration_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>> slots_;
    std::size_t calls_ = 0;
};

}  // namespace sysguard::slot

#endif  // SYSGUARD_SLOT_HPP
