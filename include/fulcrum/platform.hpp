// ==============================================================================
// fulcrum/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY
// - Запуск внешних процессов без shell (fork/execvp/waitpid)
//
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef FULCRUM_PLATFORM_HPP
#define FULCRUM_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fulcrum::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();

bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

/// Код выхода, если программу не удалось запустить (exec failed)
constexpr int EXIT_EXEC_FAILED = 127;

struct ProcessResult {
    int exit_code = -1;

    /// Захваченный stdout
    std::string output;

    bool ok() const { return exit_code == 0; }
};

/// Запустить программу и дождаться завершения, захватив stdout.
/// stderr дочернего процесса отбрасывается.
/// @throws std::runtime_error если не удалось создать pipe/процесс
/// @throws std::invalid_argument при пустом argv
ProcessResult run_process(const std::vector<std::string>& argv);

/// Запустить программу в фоне, не дожидаясь завершения
/// @throws std::runtime_error если не удалось создать процесс
void spawn_detached(const std::vector<std::string>& argv);

/// Склеить argv для журнала
std::string describe_command(const std::vector<std::string>& argv);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace fulcrum::platform

#endif  // FULCRUM_PLATFORM_HPP
