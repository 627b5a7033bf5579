// ==============================================================================
// fulcrum/volume.hpp - Эфемерные тома данных
// ==============================================================================
//
// Назначение:
// - Вычисление следующего свободного слота tmp-mc-<n> (max + 1)
// - Сканирование корня томов
// - Атомарное создание каталога слота
//
// Пропуски в нумерации не заполняются, слоты не переиспользуются.
//
// ==============================================================================

#ifndef FULCRUM_VOLUME_HPP
#define FULCRUM_VOLUME_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace fulcrum::volume {

constexpr const char* SLOT_PREFIX = "tmp-mc-";

struct VolumeSlot {
    std::uint64_t version = 0;
    std::filesystem::path path;

    /// "tmp-mc-<version>"
    std::string name() const;
};

/// Номер слота из имени "tmp-mc-<n>"
std::optional<std::uint64_t> parse_slot_name(std::string_view name);

/// Следующий слот по набору существующих имён; пустой набор -> tmp-mc-1.
/// Имена, не подходящие под шаблон, игнорируются.
VolumeSlot next_slot(const std::set<std::string>& existing,
                     const std::filesystem::path& root = {});

/// Имена записей в корне (отсутствующий корень - пустой набор)
/// @throws std::filesystem::filesystem_error при ошибке чтения каталога
std::set<std::string> scan_slots(const std::filesystem::path& root);

/// Создать следующий слот в root
///
/// Создание каталога эксклюзивно: если параллельный вызов занял тот же
/// номер, корень пересканируется и берётся следующий.
///
/// @throws std::runtime_error если за max_attempts попыток слот не создан
/// @throws std::filesystem::filesystem_error при ошибке файловой системы
VolumeSlot provision(const std::filesystem::path& root, int max_attempts = 16);

}  // namespace fulcrum::volume

#endif  // FULCRUM_VOLUME_HPP
