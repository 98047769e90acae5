/**
 * @file probe_registry.hpp
 * @brief Реестр проб в каноническом порядке
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "probe.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hostdiag::core {

/**
 * @brief Канонический упорядоченный список проб.
 *
 * Заполняется при старте и далее только читается. Порядок регистрации
 * определяет порядок разделов в любом отчёте.
 */
class ProbeRegistry {
public:
    /**
     * @brief Зарегистрировать пробу в конец списка
     * @throws std::invalid_argument При пустом или повторном имени
     */
    void add(std::unique_ptr<Probe> probe);

    [[nodiscard]] const std::vector<std::unique_ptr<Probe>>& list() const noexcept { return probes_; }

    /**
     * @brief Поиск по имени
     * @return Проба или nullptr, если имя не зарегистрировано
     */
    [[nodiscard]] Probe* find(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    /// Имена в каноническом порядке
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const noexcept { return probes_.size(); }

private:
    std::vector<std::unique_ptr<Probe>> probes_;
};

} // namespace hostdiag::core
