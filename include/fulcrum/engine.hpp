// ==============================================================================
// fulcrum/engine.hpp - Движок оркестрации сессии
// ==============================================================================
//
// Назначение:
// - Приём вызова команды start
// - Валидация аргументов -> шлюз сессии -> готовность демона ->
//   поиск существующего экземпляра или новый том -> запуск
// - Преобразование всех ожидаемых отказов в один текстовый ответ
//
// Состояния:
//   Idle -> Validating -> GateChecking -> (DaemonPolling)? ->
//   (Locating | Provisioning) -> Launching -> Idle
//
// После допуска сессия считается активной, даже если запуск затем
// не удался; откат не выполняется.
//
// ==============================================================================

#ifndef FULCRUM_ENGINE_HPP
#define FULCRUM_ENGINE_HPP

#include <fulcrum/daemon.hpp>
#include <fulcrum/output.hpp>
#include <fulcrum/runtime.hpp>
#include <fulcrum/schema.hpp>
#include <fulcrum/session.hpp>
#include <fulcrum/validator.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fulcrum::engine {

enum class State {
    Idle,
    Validating,
    GateChecking,
    DaemonPolling,
    Locating,
    Provisioning,
    Launching
};

const char* state_to_string(State state);

// ----------------------------------------------------------------------------
// Вызов и ответ
// ----------------------------------------------------------------------------

struct Invocation {
    /// Имя автора запроса (для ответа и журнала)
    std::string requester;

    /// Время создания сообщения; используется как "now" для шлюза
    session::Timestamp created_at{};

    /// Аргументы команды без её имени
    std::vector<std::string> tokens;
};

enum class ReplyKind {
    Started,
    Busy,
    InvalidArguments,
    DaemonUnavailable,
    ContainerNotFound,
    LaunchFailed,
    RateLimited,
    Help
};

const char* reply_kind_to_string(ReplyKind kind);

struct Reply {
    ReplyKind kind = ReplyKind::Help;
    std::string text;

    /// Имя запущенного экземпляра (только для Started)
    std::string instance;

    bool ok() const { return kind == ReplyKind::Started; }
};

// ----------------------------------------------------------------------------
// EngineConfig
// ----------------------------------------------------------------------------

struct EngineConfig {
    std::chrono::seconds restart_threshold{7200};

    bool ensure_daemon = true;
    int max_checks = 5;
    std::chrono::milliseconds poll_interval{2000};

    std::filesystem::path volume_root = "volumes";

    /// Версия без точек ("1193") - префикс имён экземпляров
    std::string target_tag;
};

// ----------------------------------------------------------------------------
// Engine
// ----------------------------------------------------------------------------

class Engine {
public:
    /// runtime и log должны жить дольше Engine
    Engine(EngineConfig config, schema::ArgumentSchema schema, runtime::ContainerRuntime& runtime,
           output::Writer& log, daemon::Sleeper sleeper = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Обработать вызов start.
    /// Ожидаемые отказы возвращаются как Reply; прочие исключения
    /// журналируются и пробрасываются дальше.
    Reply handle(const Invocation& invocation);

    /// Ответ на сигнал платформы "слишком много запросов"
    Reply rate_limited(const std::string& requester, std::chrono::seconds retry_after) const;

    session::Session session() const { return gate_.snapshot(); }

    bool daemon_ready() const { return poller_.is_ready(); }

    const schema::ArgumentSchema& schema() const { return schema_; }

    const EngineConfig& config() const { return config_; }

private:
    Reply run(const Invocation& invocation, State& state);
    void enter(State& state, State next, const Invocation& invocation);

    /// session - сессия, зафиксированная шлюзом для этого вызова
    Reply launch_existing(const Invocation& invocation, const session::Session& session,
                          State& state);
    Reply launch_fresh(const Invocation& invocation, const validator::ParsedCommand& command,
                       const session::Session& session, State& state);

    Reply started_reply(const Invocation& invocation, const session::Session& session,
                        const runtime::LaunchResult& launch, const std::string& detail) const;

    EngineConfig config_;
    schema::ArgumentSchema schema_;
    runtime::ContainerRuntime& runtime_;
    output::Writer& log_;

    session::SessionGate gate_;
    daemon::ReadinessPoller poller_;

    std::optional<unsigned> fresh_bit_;
    std::optional<unsigned> verbose_bit_;
};

}  // namespace fulcrum::engine

#endif  // FULCRUM_ENGINE_HPP
