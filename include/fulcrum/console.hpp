// ==============================================================================
// fulcrum/console.hpp - Консольный фронтенд запросов
// ==============================================================================
//
// Назначение:
// - Разбор строки запроса "<requester> <command> [args...]"
// - Per-user ограничение частоты запросов start
// - Диспетчеризация команд в Engine
// - Пул потоков-обработчиков запросов (WorkerSet)
//
// Консоль заменяет чат-платформу: ограничение частоты - её забота,
// Engine получает только сигнал "слишком много запросов".
//
// ==============================================================================

#ifndef FULCRUM_CONSOLE_HPP
#define FULCRUM_CONSOLE_HPP

#include <fulcrum/engine.hpp>
#include <fulcrum/session.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fulcrum::console {

struct Request {
    std::string requester;
    std::string command;
    std::vector<std::string> args;
};

/// Разобрать строку запроса; пустые строки и комментарии (#) -> nullopt
std::optional<Request> parse_request(std::string_view line);

// ----------------------------------------------------------------------------
// RequestThrottle
// ----------------------------------------------------------------------------

/// Один запрос на пользователя за окно per_user
class RequestThrottle {
public:
    explicit RequestThrottle(std::chrono::seconds per_user);

    /// nullopt - запрос допущен (и окно перезапущено);
    /// иначе - сколько секунд осталось ждать (округление вверх)
    std::optional<std::chrono::seconds> check(const std::string& requester, session::Timestamp now);

private:
    std::mutex mutex_;
    std::map<std::string, session::Timestamp> last_;
    const std::chrono::seconds per_user_;
};

// ----------------------------------------------------------------------------
// Frontend
// ----------------------------------------------------------------------------

class Frontend {
public:
    Frontend(engine::Engine& engine, std::chrono::seconds per_user_cooldown);

    /// Выполнить запрос. Исключения Engine пробрасываются.
    engine::Reply dispatch(const Request& request, session::Timestamp now);

private:
    engine::Engine& engine_;
    RequestThrottle throttle_;
};

// ----------------------------------------------------------------------------
// WorkerSet
// ----------------------------------------------------------------------------

/// Потоки обработки запросов. Завершившиеся потоки собираются в reap(),
/// число одновременно живых ограничено limit: spawn() при заполнении
/// ждёт самый старый поток.
class WorkerSet {
public:
    explicit WorkerSet(std::size_t limit);
    ~WorkerSet();

    WorkerSet(const WorkerSet&) = delete;
    WorkerSet& operator=(const WorkerSet&) = delete;

    void spawn(std::function<void()> task);

    /// Присоединить завершившиеся потоки; возвращает их число
    std::size_t reap();

    void join_all();

    std::size_t size() const { return workers_.size(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::list<Worker> workers_;
    const std::size_t limit_;
};

/// Текст ответа на help и неизвестные команды
std::string help_text();

}  // namespace fulcrum::console

#endif  // FULCRUM_CONSOLE_HPP
