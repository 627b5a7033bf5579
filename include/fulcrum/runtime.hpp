// ==============================================================================
// fulcrum/runtime.hpp - Контейнерная среда (внешние примитивы)
// ==============================================================================
//
// Назначение:
// - Абстрактный интерфейс ContainerRuntime: листинг, запуск
//   существующего экземпляра, запуск нового на свежем томе,
//   проверка и запуск демона
// - DockerRuntime: реализация через docker CLI
//
// Движок оркестрации зависит только от интерфейса; тесты подставляют
// собственную реализацию.
//
// ==============================================================================

#ifndef FULCRUM_RUNTIME_HPP
#define FULCRUM_RUNTIME_HPP

#include <fulcrum/volume.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fulcrum::runtime {

struct ListResult {
    bool ok = false;
    std::string text;
    std::string error;
};

struct LaunchResult {
    bool ok = false;
    std::string instance;
    std::string id;  // идентификатор, если среда его вернула
    std::string error;
};

/// Параметры нового экземпляра
struct LaunchOptions {
    std::optional<std::int64_t> memory_gib;
    std::optional<std::string> motd;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// Листинг экземпляров, отфильтрованный по target (без точек: "1193")
    virtual ListResult list(const std::string& target) = 0;

    /// Запустить существующий экземпляр; не ждёт его работы
    virtual LaunchResult start_existing(const std::string& name) = 0;

    /// Запустить новый экземпляр name с томом slot
    virtual LaunchResult run_fresh(const std::string& name, const volume::VolumeSlot& slot,
                                   const LaunchOptions& options) = 0;

    /// Одна проверка готовности демона
    virtual bool probe_daemon() = 0;

    /// Запустить демон в фоне
    virtual void launch_daemon() = 0;
};

// ----------------------------------------------------------------------------
// DockerRuntime
// ----------------------------------------------------------------------------

struct DockerConfig {
    std::string docker = "docker";
    std::string image = "itzg/minecraft-server";

    /// Версия в исходном виде ("1.19.3"), передаётся образу
    std::string version;

    /// Публикуемый порт (host:container)
    int port = 25565;

    /// Точка монтирования тома внутри контейнера
    std::string data_mount = "/data";

    std::vector<std::string> check_command{"docker", "info"};
    std::vector<std::string> start_command{"systemctl", "start", "docker"};
};

class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(DockerConfig config);

    ListResult list(const std::string& target) override;
    LaunchResult start_existing(const std::string& name) override;
    LaunchResult run_fresh(const std::string& name, const volume::VolumeSlot& slot,
                           const LaunchOptions& options) override;
    bool probe_daemon() override;
    void launch_daemon() override;

    /// argv для docker run (для журнала и тестов)
    std::vector<std::string> run_arguments(const std::string& name, const volume::VolumeSlot& slot,
                                           const LaunchOptions& options) const;

    /// argv для docker ps
    std::vector<std::string> list_arguments(const std::string& target) const;

private:
    DockerConfig config_;
};

}  // namespace fulcrum::runtime

#endif  // FULCRUM_RUNTIME_HPP
