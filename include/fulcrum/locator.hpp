// ==============================================================================
// fulcrum/locator.hpp - Поиск последнего контейнера целевой версии
// ==============================================================================
//
// Назначение:
// - Разбор текстового листинга контейнеров (вывод docker ps)
// - Имена вида <version>-mc-<n>, где n - подверсия
// - Выбор записи с максимальной подверсией (числовое сравнение)
//
// Модуль не выполняет ввод-вывод: листинг передаётся вызывающим.
//
// ==============================================================================

#ifndef FULCRUM_LOCATOR_HPP
#define FULCRUM_LOCATOR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fulcrum::locator {

/// Разделитель в имени контейнера
constexpr const char* NAME_INFIX = "-mc-";

struct ContainerRecord {
    std::string name;
    std::uint64_t subversion = 0;
};

struct LocateResult {
    bool ok = false;  // false - NotFound
    ContainerRecord record;
    std::size_t candidates = 0;

    explicit operator bool() const { return ok; }
};

/// Все записи листинга для target_version в порядке появления
/// (не более одной записи на строку)
std::vector<ContainerRecord> parse_listing(std::string_view listing,
                                           std::string_view target_version);

/// Запись с максимальной подверсией; при равенстве - первая встреченная
LocateResult find_latest(std::string_view listing, std::string_view target_version);

/// "<target_version>-mc-<subversion>"
std::string container_name(std::string_view target_version, std::uint64_t subversion);

}  // namespace fulcrum::locator

#endif  // FULCRUM_LOCATOR_HPP
