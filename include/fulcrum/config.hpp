// ==============================================================================
// fulcrum/config.hpp - Настройки процесса
// ==============================================================================
//
// Назначение:
// - Загрузка bot_settings.json (RapidJSON)
// - Значения по умолчанию для всех ключей
// - Проверка формата целевой версии (^(\d+\.){2}\d+$)
//
// ==============================================================================

#ifndef FULCRUM_CONFIG_HPP
#define FULCRUM_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fulcrum::config {

struct ServerSettings {
    /// Минимальный интервал между стартами сессии
    std::chrono::seconds restart_threshold{7200};

    /// Версия в виде "1.19.3"
    std::string target_version = "1.19.3";

    std::filesystem::path volume_root = "volumes";
    int port = 25565;
    std::string image = "itzg/minecraft-server";
    std::string data_mount = "/data";
};

struct DaemonSettings {
    bool enabled = true;
    int max_checks = 5;
    std::chrono::milliseconds poll_interval{2000};
    std::vector<std::string> check_command{"docker", "info"};
    std::vector<std::string> start_command{"systemctl", "start", "docker"};
};

struct LogSettings {
    std::optional<std::filesystem::path> path = std::filesystem::path("fulcrum.log");
    std::uint64_t max_bytes = 32ULL * 1024 * 1024;
    int backup_count = 5;
};

struct Settings {
    ServerSettings server;
    DaemonSettings daemon;
    LogSettings log;

    /// YAML схема команды start; пусто - встроенная
    std::optional<std::filesystem::path> schema_path;

    /// Per-user ограничение частоты запросов start
    std::chrono::seconds per_user_cooldown{10};

    /// Версия без точек ("1193")
    std::string target_tag() const;
};

struct SettingsResult {
    bool ok = false;
    Settings settings;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Загрузить настройки из JSON файла
SettingsResult load_settings(const std::filesystem::path& path);

/// Разобрать настройки из JSON текста.
/// Относительные пути разрешаются от base_dir.
SettingsResult parse_settings(std::string_view json_text,
                              const std::filesystem::path& base_dir = {});

/// Версия соответствует ^(\d+\.){2}\d+$
bool is_valid_version(std::string_view version);

/// Проверить версию и убрать точки: "1.19.3" -> "1193"
std::optional<std::string> strip_version(std::string_view version);

}  // namespace fulcrum::config

#endif  // FULCRUM_CONFIG_HPP
