// ==============================================================================
// fulcrum/session.hpp - Единственная сессия и её шлюз
// ==============================================================================
//
// Назначение:
// - Запись Session (активна ли, когда стартовала)
// - Решение admit/busy по интервалу с последнего старта
// - Атомарная пара "проверка + фиксация" под мьютексом
// - Форматирование окна охлаждения для ответа
//
// ==============================================================================

#ifndef FULCRUM_SESSION_HPP
#define FULCRUM_SESSION_HPP

#include <chrono>
#include <mutex>
#include <string>

namespace fulcrum::session {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ----------------------------------------------------------------------------
// Session
// ----------------------------------------------------------------------------

/// Создаётся неактивной со стартом в эпохе 0
struct Session {
    bool active = false;
    Timestamp start{};
};

enum class Admission { Admitted, Busy };

/// Admitted тогда и только тогда, когда now - start >= threshold
Admission try_admit(const Session& session, Timestamp now, std::chrono::seconds threshold);

// ----------------------------------------------------------------------------
// SessionGate
// ----------------------------------------------------------------------------

struct AdmitResult {
    Admission admission = Admission::Busy;

    /// Состояние сессии после решения (при Busy - без изменений)
    Session session;

    bool admitted() const { return admission == Admission::Admitted; }
};

/// Владеет единственной Session. Раздельных check/write нет:
/// наружу выставлена только атомарная операция try_admit_and_commit.
class SessionGate {
public:
    explicit SessionGate(std::chrono::seconds threshold);

    SessionGate(const SessionGate&) = delete;
    SessionGate& operator=(const SessionGate&) = delete;

    /// Проверить интервал и при успехе выставить active = true, start = now.
    /// Два одновременных вызова не могут оба получить Admitted.
    AdmitResult try_admit_and_commit(Timestamp now);

    /// Копия текущего состояния
    Session snapshot() const;

    std::chrono::seconds threshold() const { return threshold_; }

private:
    mutable std::mutex mutex_;
    Session session_;
    const std::chrono::seconds threshold_;
};

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

/// "02h:00m:00s"
std::string format_cooldown(std::chrono::seconds threshold);

/// "YYYY-MM-DD HH:MM:SS" в локальном времени
std::string format_timestamp(Timestamp ts);

}  // namespace fulcrum::session

#endif  // FULCRUM_SESSION_HPP
