// ==============================================================================
// session.cpp - Единственная сессия и её шлюз
// ==============================================================================

#include "fulcrum/session.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fulcrum::session {

Admission try_admit(const Session& session, Timestamp now, std::chrono::seconds threshold) {
    // Нестрогое сравнение: ровно threshold - уже можно
    return (now - session.start >= threshold) ? Admission::Admitted : Admission::Busy;
}

// ----------------------------------------------------------------------------
// SessionGate
// ----------------------------------------------------------------------------

SessionGate::SessionGate(std::chrono::seconds threshold) : threshold_(threshold) {}

AdmitResult SessionGate::try_admit_and_commit(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    AdmitResult result;
    result.admission = try_admit(session_, now, threshold_);
    if (result.admitted()) {
        session_.active = true;
        session_.start = now;
    }
    result.session = session_;
    return result;
}

Session SessionGate::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_cooldown(std::chrono::seconds threshold) {
    auto total = threshold.count();
    if (total < 0) {
        total = 0;
    }
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << hours << "h:" << std::setw(2) << minutes << "m:"
        << std::setw(2) << seconds << "s";
    return out.str();
}

std::string format_timestamp(Timestamp ts) {
    std::time_t t = Clock::to_time_t(ts);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

}  // namespace fulcrum::session
