// ==============================================================================
// sysguard/store.hpp - Хранилище активных системных правил
// ==============================================================================
//
// Назначение:
// - Хранение текущего индекса правил (RuleIndex)
// - Чтение под разделяемой блокировкой (копии или общие указатели)
// - Загрузка: построение индекса вне блокировки, публикация через Publisher,
//   обмен указателя под эксклюзивной блокировкой
//
// Читатели никогда не видят индекс, смешивающий правила двух загрузок.
// Если publisher сообщил об ошибке уже после установки индекса, прежний
// индекс возвращается на место (если его не сменила другая загрузка).
// Параллельные загрузки не упорядочены между собой: побеждает та, что
// последней захватила блокировку. Вызывающему, которому нужен полный
// порядок, следует сериализовать загрузки самому.
//
// ==============================================================================

#ifndef SYSGUARD_STORE_HPP
#define SYSGUARD_STORE_HPP

#include <sysguard/publisher.hpp>
#include <sysguard/rule.hpp>
#include <sysguard/rule_index.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace sysguard::output {
class Writer;
}

namespace sysguard::slot {
class SlotRegistrar;
}

namespace sysguard::store {

/// Результат загрузки правил
struct LoadResult {
    bool ok = false;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

class RuleStore {
public:
    /// registrar и log должны пережить хранилище
    RuleStore(slot::SlotRegistrar& registrar, output::Writer& log);

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // Чтение
    // -------------------------------------------------------------------------

    /// Копии всех активных правил. Изменение результата не влияет на хранилище.
    /// Копирование дорогое: на горячем пути использовать snapshot().
    std::vector<rule::Rule> rules() const;

    /// Активные правила без копирования. Изменения через указатели видны
    /// в хранилище - только для внутреннего движка проверок.
    std::vector<rule::RulePtr> current_rules() const;

    /// Копии правил одного типа метрики
    std::vector<rule::Rule> rules_of(rule::MetricType t) const;

    /// Текущий неизменяемый индекс (правила только на чтение)
    rule::RuleIndexPtr snapshot() const;

    std::size_t size() const;

    // Загрузка
    // -------------------------------------------------------------------------

    /// Заменить все правила. Некорректные кандидаты пропускаются.
    /// При ошибке публикации прежние правила остаются активными,
    /// результат содержит ошибку UpdateRejected.
    LoadResult load_rules(const std::vector<rule::RulePtr>& rules);

    /// То же для значений (правила копируются)
    LoadResult load_rules(const std::vector<rule::Rule>& rules);

    /// load_rules({}). Регистрации слотов не удаляются.
    LoadResult clear_rules();

    // Перехват публикации
    // -------------------------------------------------------------------------

    /// Заменить обработчик обновления. Пустая функция - обработчик по умолчанию.
    /// Загрузка, уже получившая publisher, завершится с ним.
    void register_update_handler(UpdateHandler handler);

    /// Заменить стратегию публикации. nullptr - PassThroughPublisher.
    void set_publisher(std::shared_ptr<Publisher> publisher);

private:
    /// Что установил installer одной загрузки
    struct Publication {
        rule::RuleIndexPtr installed;
        rule::RuleIndexPtr previous;
    };

    /// Установить индекс: обмен указателя под эксклюзивной блокировкой
    std::optional<rule::Error> install(rule::RuleIndexPtr index, Publication& publication);

    /// Вернуть прежний индекс, если установленный всё ещё активен
    bool roll_back(const Publication& publication);

    std::shared_ptr<Publisher> current_publisher() const;

    slot::SlotRegistrar& registrar_;
    output::Writer& log_;

    mutable std::shared_mutex index_mutex_;
    rule::RuleIndexPtr index_;

    mutable std::mutex publisher_mutex_;
    std::shared_ptr<Publisher> publisher_;
};

}  // namespace sysguard::store

#endif  // SYSGUARD_STORE_HPP
