// ==============================================================================
// fulcrum/daemon.hpp - Ожидание готовности внешнего демона
// ==============================================================================
//
// Назначение:
// - Однократный запуск демона, затем ограниченное число проверок
// - Фиксированная пауза между проверками
// - Кеширование готовности до конца жизни процесса
//
// Пауза выполняется без удержания каких-либо блокировок сессии;
// одновременные вызовы ensure_ready() ждут друг друга только между собой.
//
// ==============================================================================

#ifndef FULCRUM_DAEMON_HPP
#define FULCRUM_DAEMON_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace fulcrum::daemon {

enum class Readiness { Ready, DaemonUnavailable };

/// Проверка готовности; true - демон отвечает
using Probe = std::function<bool()>;

/// Запуск демона (fire-and-forget)
using Launcher = std::function<void()>;

/// Приостановка между попытками; в тестах подменяется
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper по умолчанию: std::this_thread::sleep_for
Sleeper default_sleeper();

class ReadinessPoller {
public:
    ReadinessPoller();
    explicit ReadinessPoller(Sleeper sleeper);

    ReadinessPoller(const ReadinessPoller&) = delete;
    ReadinessPoller& operator=(const ReadinessPoller&) = delete;

    /// Убедиться, что демон готов
    ///
    /// Если готовность уже подтверждена - сразу Ready без проверок.
    /// Иначе: launch() один раз, затем до max_checks вызовов probe()
    /// с паузой interval между ними. Ровно max_checks неудачных
    /// проверок дают DaemonUnavailable.
    Readiness ensure_ready(const Probe& probe, int max_checks, std::chrono::milliseconds interval,
                           const Launcher& launch);

    bool is_ready() const { return ready_.load(std::memory_order_acquire); }

    /// Число проверок в последнем опросе
    int last_attempts() const;

private:
    Sleeper sleeper_;
    mutable std::mutex mutex_;
    std::atomic<bool> ready_{false};
    int last_attempts_ = 0;
};

}  // namespace fulcrum::daemon

#endif  // FULCRUM_DAEMON_HPP
