// ==============================================================================
// engine.cpp - Движок оркестрации сессии
// ==============================================================================

#include "fulcrum/engine.hpp"

#include "fulcrum/locator.hpp"
#include "fulcrum/platform.hpp"
#include "fulcrum/volume.hpp"

#include <exception>
#include <stdexcept>

namespace fulcrum::engine {

namespace {

std::string code_block(const std::string& body) {
    return "```\n" + body + "\n```";
}

std::optional<unsigned> bit_of(const schema::ArgumentSchema& schema, std::string_view name) {
    const auto* spec = schema.find(name);
    if (spec == nullptr) {
        return std::nullopt;
    }
    return spec->bit;
}

}  // namespace

const char* state_to_string(State state) {
    switch (state) {
    case State::Idle:
        return "Idle";
    case State::Validating:
        return "Validating";
    case State::GateChecking:
        return "GateChecking";
    case State::DaemonPolling:
        return "DaemonPolling";
    case State::Locating:
        return "Locating";
    case State::Provisioning:
        return "Provisioning";
    case State::Launching:
        return "Launching";
    }
    return "Unknown";
}

const char* reply_kind_to_string(ReplyKind kind) {
    switch (kind) {
    case ReplyKind::Started:
        return "started";
    case ReplyKind::Busy:
        return "busy";
    case ReplyKind::InvalidArguments:
        return "invalid_arguments";
    case ReplyKind::DaemonUnavailable:
        return "daemon_unavailable";
    case ReplyKind::ContainerNotFound:
        return "container_not_found";
    case ReplyKind::LaunchFailed:
        return "launch_failed";
    case ReplyKind::RateLimited:
        return "rate_limited";
    case ReplyKind::Help:
        return "help";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Engine
// ----------------------------------------------------------------------------

Engine::Engine(EngineConfig config, schema::ArgumentSchema schema,
               runtime::ContainerRuntime& runtime, output::Writer& log, daemon::Sleeper sleeper)
    : config_(std::move(config)),
      schema_(std::move(schema)),
      runtime_(runtime),
      log_(log),
      gate_(config_.restart_threshold),
      poller_(std::move(sleeper)),
      fresh_bit_(bit_of(schema_, "fresh")),
      verbose_bit_(bit_of(schema_, "verbose")) {
    if (config_.target_tag.empty()) {
        throw std::invalid_argument("engine: target tag must not be empty");
    }
}

Reply Engine::handle(const Invocation& invocation) {
    State state = State::Idle;
    try {
        Reply reply = run(invocation, state);
        enter(state, State::Idle, invocation);
        return reply;
    } catch (const std::exception& e) {
        log_.error("request by '" + invocation.requester + "' abandoned in state " +
                   state_to_string(state) + ": " + e.what());
        throw;
    }
}

void Engine::enter(State& state, State next, const Invocation& invocation) {
    log_.trace("[" + invocation.requester + "] " + state_to_string(state) + " -> " +
               state_to_string(next));
    state = next;
}

Reply Engine::run(const Invocation& invocation, State& state) {
    // --- Validating ---
    enter(state, State::Validating, invocation);

    auto validated = validator::validate(schema_, invocation.tokens);
    if (!validated) {
        std::string line = validator::join_tokens(invocation.tokens);
        log_.info("rejected arguments from '" + invocation.requester + "': " +
                  validator::error_kind_to_string(validated.error.kind) + " - " +
                  validated.error.message);

        Reply reply;
        reply.kind = ReplyKind::InvalidArguments;
        reply.text = "Invalid arguments:\n" + code_block(validated.error.render(line));
        return reply;
    }
    const validator::ParsedCommand& command = validated.command;

    auto memory = command.flags.find("memory");
    if (memory != command.flags.end()) {
        const auto* gib = std::get_if<std::int64_t>(&memory->second);
        if (gib != nullptr && *gib < 1) {
            Reply reply;
            reply.kind = ReplyKind::InvalidArguments;
            reply.text = "Invalid arguments: -memory must be at least 1 (GiB)";
            return reply;
        }
    }

    // --- GateChecking ---
    enter(state, State::GateChecking, invocation);

    auto admitted = gate_.try_admit_and_commit(invocation.created_at);
    if (!admitted.admitted()) {
        log_.info("session busy, request by '" + invocation.requester + "' refused");

        Reply reply;
        reply.kind = ReplyKind::Busy;
        reply.text = "A session is already currently running!\n" +
                     code_block("Request cool-down window: " +
                                session::format_cooldown(gate_.threshold()));
        return reply;
    }
    log_.info("session admitted for '" + invocation.requester + "' at " +
              session::format_timestamp(admitted.session.start));

    // --- DaemonPolling ---
    if (config_.ensure_daemon) {
        enter(state, State::DaemonPolling, invocation);

        auto readiness = poller_.ensure_ready(
            [this]() { return runtime_.probe_daemon(); }, config_.max_checks,
            config_.poll_interval, [this]() {
                log_.info("starting container daemon");
                try {
                    runtime_.launch_daemon();
                } catch (const std::runtime_error& e) {
                    // Демон мог уже работать; решают проверки
                    log_.warn(std::string("failed to start container daemon: ") + e.what());
                }
            });

        if (readiness == daemon::Readiness::DaemonUnavailable) {
            log_.error("container daemon is unavailable after " +
                       std::to_string(config_.max_checks) + " checks");

            Reply reply;
            reply.kind = ReplyKind::DaemonUnavailable;
            reply.text = "The container daemon is not responding. Please try again later.";
            return reply;
        }
    }

    bool fresh = fresh_bit_.has_value() && command.has_option(*fresh_bit_);
    if (fresh) {
        return launch_fresh(invocation, command, admitted.session, state);
    }
    return launch_existing(invocation, admitted.session, state);
}

Reply Engine::launch_existing(const Invocation& invocation, const session::Session& session,
                              State& state) {
    // --- Locating ---
    enter(state, State::Locating, invocation);

    auto listing = runtime_.list(config_.target_tag);
    if (!listing.ok) {
        log_.error("container listing failed: " + listing.error);

        Reply reply;
        reply.kind = ReplyKind::DaemonUnavailable;
        reply.text = "Could not list server instances. Please try again later.";
        return reply;
    }

    auto located = locator::find_latest(listing.text, config_.target_tag);
    if (!located) {
        log_.warn("no instance matching '" + config_.target_tag + "-mc-<n>' found");

        Reply reply;
        reply.kind = ReplyKind::ContainerNotFound;
        reply.text = "No server instance for version " + config_.target_tag +
                     " was found. Use --fresh to start a new one.";
        return reply;
    }
    log_.debug("selected " + located.record.name + " out of " +
               std::to_string(located.candidates) + " candidate(s)");

    // --- Launching ---
    enter(state, State::Launching, invocation);

    auto launch = runtime_.start_existing(located.record.name);
    if (!launch.ok) {
        log_.error("failed to start " + located.record.name + ": " + launch.error);

        Reply reply;
        reply.kind = ReplyKind::LaunchFailed;
        reply.text = "Failed to start server instance " + located.record.name + ".";
        return reply;
    }

    return started_reply(invocation, session, launch, "resumed");
}

Reply Engine::launch_fresh(const Invocation& invocation, const validator::ParsedCommand& command,
                           const session::Session& session, State& state) {
    // --- Provisioning ---
    enter(state, State::Provisioning, invocation);

    auto slot = volume::provision(config_.volume_root);
    log_.info("provisioned volume " + platform::path_to_utf8(slot.path));

    runtime::LaunchOptions options;
    auto memory = command.flags.find("memory");
    if (memory != command.flags.end()) {
        if (const auto* gib = std::get_if<std::int64_t>(&memory->second)) {
            options.memory_gib = *gib;
        }
    }
    auto motd = command.flags.find("motd");
    if (motd != command.flags.end()) {
        if (const auto* text = std::get_if<std::string>(&motd->second)) {
            options.motd = *text;
        }
    }

    std::string name = locator::container_name(config_.target_tag, slot.version);

    // --- Launching ---
    enter(state, State::Launching, invocation);

    auto launch = runtime_.run_fresh(name, slot, options);
    if (!launch.ok) {
        log_.error("failed to run " + name + ": " + launch.error);

        Reply reply;
        reply.kind = ReplyKind::LaunchFailed;
        reply.text = "Failed to start a fresh server instance.";
        return reply;
    }

    std::string detail = "fresh volume " + slot.name();
    if (verbose_bit_.has_value() && command.has_option(*verbose_bit_)) {
        detail += " at " + platform::path_to_utf8(slot.path);
        if (!launch.id.empty()) {
            detail += ", id " + launch.id;
        }
    }
    return started_reply(invocation, session, launch, detail);
}

Reply Engine::started_reply(const Invocation& invocation, const session::Session& session,
                            const runtime::LaunchResult& launch,
                            const std::string& detail) const {
    log_.info("started " + launch.instance + " for '" + invocation.requester + "' (" + detail +
              ")");

    Reply reply;
    reply.kind = ReplyKind::Started;
    reply.instance = launch.instance;
    reply.text = "Session started for " + invocation.requester + ".\n\n" +
                 code_block("Starting a new server session...\n"
                            "Request origin: " +
                            invocation.requester +
                            "\n"
                            "Request session start @ " +
                            session::format_timestamp(session.start) +
                            "\n"
                            "Request cool-down window: " +
                            session::format_cooldown(gate_.threshold()) +
                            "\n"
                            "Instance: " +
                            launch.instance + " (" + detail + ")");
    return reply;
}

Reply Engine::rate_limited(const std::string& requester, std::chrono::seconds retry_after) const {
    log_.debug("request by '" + requester + "' throttled for " +
               std::to_string(retry_after.count()) + "s");

    Reply reply;
    reply.kind = ReplyKind::RateLimited;
    reply.text = "Slow down " + requester + "! Try again in " +
                 std::to_string(retry_after.count()) + "s.";
    return reply;
}

}  // namespace fulcrum::engine
