// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Запуск процессов реализован только для POSIX.
//
// ==============================================================================

#include "fulcrum/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fulcrum::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

#ifndef _WIN32

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1U);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

/// Перенаправить fd на /dev/null (в дочернем процессе)
void redirect_to_null(int fd, int flags) {
    int null_fd = ::open("/dev/null", flags);
    if (null_fd >= 0) {
        ::dup2(null_fd, fd);
        ::close(null_fd);
    }
}

/// pipe с FD_CLOEXEC на обоих концах: процессы, запущенные параллельно
/// из других потоков, не наследуют пишущий конец и не задерживают EOF
bool make_cloexec_pipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    for (int i = 0; i < 2; ++i) {
        int flags = ::fcntl(fds[i], F_GETFD);
        if (flags < 0 || ::fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) < 0) {
            int saved = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            errno = saved;
            return false;
        }
    }
    return true;
#endif
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}  // namespace

#endif

ProcessResult run_process(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("run_process: empty argv");
    }
#ifdef _WIN32
    throw std::runtime_error("run_process is not supported on Windows");
#else
    int fds[2];
    if (!make_cloexec_pipe(fds)) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    // argv готовим до fork: в дочернем процессе не аллоцируем
    auto argv = make_argv(args);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::close(fds[0]);
        if (::dup2(fds[1], STDOUT_FILENO) < 0) {
            _exit(EXIT_EXEC_FAILED);
        }
        ::close(fds[1]);
        redirect_to_null(STDERR_FILENO, O_WRONLY);
        redirect_to_null(STDIN_FILENO, O_RDONLY);

        ::execvp(argv[0], argv.data());
        _exit(EXIT_EXEC_FAILED);
    }

    ::close(fds[1]);

    ProcessResult result;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    result.exit_code = decode_status(status);
    return result;
#endif
}

void spawn_detached(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("spawn_detached: empty argv");
    }
#ifdef _WIN32
    throw std::runtime_error("spawn_detached is not supported on Windows");
#else
    auto argv = make_argv(args);

    // Двойной fork: внук усыновляется init, зомби не остаётся
    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? EXIT_EXEC_FAILED : 0);
        }
        redirect_to_null(STDIN_FILENO, O_RDONLY);
        redirect_to_null(STDOUT_FILENO, O_WRONLY);
        redirect_to_null(STDERR_FILENO, O_WRONLY);
        ::execvp(argv[0], argv.data());
        _exit(EXIT_EXEC_FAILED);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (decode_status(status) != 0) {
        throw std::runtime_error("failed to detach '" + args[0] + "'");
    }
#endif
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += argv[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace fulcrum::platform
