// ==============================================================================
// console.cpp - Консольный фронтенд запросов
// ==============================================================================

#include "fulcrum/console.hpp"

#include "fulcrum/validator.hpp"

#include <utility>

namespace fulcrum::console {

std::optional<Request> parse_request(std::string_view line) {
    auto tokens = validator::split_tokens(line);
    if (tokens.empty() || tokens.front().front() == '#') {
        return std::nullopt;
    }

    Request request;
    request.requester = tokens[0];
    if (tokens.size() > 1) {
        request.command = tokens[1];
    }
    if (tokens.size() > 2) {
        request.args.assign(tokens.begin() + 2, tokens.end());
    }
    return request;
}

// ----------------------------------------------------------------------------
// RequestThrottle
// ----------------------------------------------------------------------------

RequestThrottle::RequestThrottle(std::chrono::seconds per_user) : per_user_(per_user) {}

std::optional<std::chrono::seconds> RequestThrottle::check(const std::string& requester,
                                                           session::Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = last_.find(requester);
    if (it != last_.end()) {
        auto elapsed = now - it->second;
        if (elapsed < per_user_) {
            auto remaining = per_user_ - elapsed;
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(remaining);
            if (secs < remaining) {
                ++secs;
            }
            return secs;
        }
    }
    last_[requester] = now;
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Frontend
// ----------------------------------------------------------------------------

Frontend::Frontend(engine::Engine& engine, std::chrono::seconds per_user_cooldown)
    : engine_(engine), throttle_(per_user_cooldown) {}

engine::Reply Frontend::dispatch(const Request& request, session::Timestamp now) {
    if (request.command == "start") {
        if (auto retry_after = throttle_.check(request.requester, now)) {
            return engine_.rate_limited(request.requester, *retry_after);
        }

        engine::Invocation invocation;
        invocation.requester = request.requester;
        invocation.created_at = now;
        invocation.tokens = request.args;
        return engine_.handle(invocation);
    }

    engine::Reply reply;
    reply.kind = engine::ReplyKind::Help;
    if (request.command.empty() || request.command == "help") {
        reply.text = help_text();
    } else {
        reply.text = "Unknown command '" + request.command + "'.\n" + help_text();
    }
    return reply;
}

// ----------------------------------------------------------------------------
// WorkerSet
// ----------------------------------------------------------------------------

WorkerSet::WorkerSet(std::size_t limit) : limit_(limit == 0 ? 1 : limit) {}

WorkerSet::~WorkerSet() { join_all(); }

void WorkerSet::spawn(std::function<void()> task) {
    reap();
    while (workers_.size() >= limit_) {
        workers_.front().thread.join();
        workers_.pop_front();
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        task();
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

std::size_t WorkerSet::reap() {
    std::size_t reaped = 0;
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }
    return reaped;
}

void WorkerSet::join_all() {
    for (auto& worker : workers_) {
        worker.thread.join();
    }
    workers_.clear();
}

std::string help_text() {
    return "Commands:\n"
           "  start [--fresh] [--verbose] [-memory <GIB>] [-motd <WORD>]\n"
           "  help";
}

}  // namespace fulcrum::console
