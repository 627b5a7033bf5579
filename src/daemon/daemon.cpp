// ==============================================================================
// daemon.cpp - Ожидание готовности внешнего демона
// ==============================================================================

#include "fulcrum/daemon.hpp"

#include <thread>

namespace fulcrum::daemon {

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

ReadinessPoller::ReadinessPoller() : sleeper_(default_sleeper()) {}

ReadinessPoller::ReadinessPoller(Sleeper sleeper)
    : sleeper_(sleeper ? std::move(sleeper) : default_sleeper()) {}

Readiness ReadinessPoller::ensure_ready(const Probe& probe, int max_checks,
                                        std::chrono::milliseconds interval,
                                        const Launcher& launch) {
    if (ready_.load(std::memory_order_acquire)) {
        return Readiness::Ready;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Пока ждали мьютекс, другой вызов мог подтвердить готовность
    if (ready_.load(std::memory_order_acquire)) {
        return Readiness::Ready;
    }

    if (launch) {
        launch();
    }

    last_attempts_ = 0;
    for (int attempt = 1; attempt <= max_checks; ++attempt) {
        ++last_attempts_;
        if (probe()) {
            ready_.store(true, std::memory_order_release);
            return Readiness::Ready;
        }
        if (attempt < max_checks) {
            sleeper_(interval);
        }
    }

    return Readiness::DaemonUnavailable;
}

int ReadinessPoller::last_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_attempts_;
}

}  // namespace fulcrum::daemon
