// ==============================================================================
// output.cpp - Журнал и пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr и в файл журнала.
// Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "fulcrum/output.hpp"

#include "fulcrum/platform.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <system_error>

namespace fulcrum::output {

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string now_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf, n);
}

std::filesystem::path backup_path(const std::filesystem::path& base, int index) {
    std::filesystem::path p = base;
    p += "." + std::to_string(index);
    return p;
}

}  // namespace

const char* level_to_string(Level level) {
    switch (level) {
    case Level::Trace:
        return "TRACE";
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char* level_prefix(Level level) {
    switch (level) {
    case Level::Trace:
        return "[~] ";
    case Level::Debug:
        return "[*] ";
    case Level::Info:
        return "[+] ";
    case Level::Warning:
        return "[!] ";
    case Level::Error:
        return "[x] ";
    }
    return "[?] ";
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.log_path.has_value()) {
        open_log_file();
    }
}

Writer::~Writer() {
    close_log_file();
    std::fflush(stdout);
    std::fflush(stderr);
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(s, bytes);
    write_impl(s, "\n");
}

void Writer::info(std::string_view message) {
    message_impl(Level::Info, Color::Green, message, !config_.quiet);
}

void Writer::warn(std::string_view message) {
    message_impl(Level::Warning, Color::Yellow, message, !config_.quiet);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при quiet
    message_impl(Level::Error, Color::Red, message, true);
}

void Writer::debug(std::string_view message) {
    message_impl(Level::Debug, Color::Cyan, message, config_.verbose > 0);
}

void Writer::trace(std::string_view message) {
    message_impl(Level::Trace, Color::Magenta, message, config_.verbose > 1);
}

void Writer::message_impl(Level level, Color color, std::string_view message, bool to_console) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (to_console) {
        write_colored_prefix(level_prefix(level), color);
        write_impl(Stream::Stderr, message);
        write_impl(Stream::Stderr, "\n");
    }
    // В файл trace попадает только при verbose > 1, остальное - всегда
    if (level != Level::Trace || config_.verbose > 1) {
        log_impl(level, message);
    }
}

void Writer::write_colored_prefix(const char* prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write_impl(Stream::Stderr, ansi_color_code(color));
        write_impl(Stream::Stderr, prefix);
        write_impl(Stream::Stderr, ANSI_RESET);
    } else {
        write_impl(Stream::Stderr, prefix);
    }
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::log_impl(Level level, std::string_view message) {
    if (log_file_ == nullptr) {
        return;
    }

    std::string line = format_log_line(now_timestamp(), level, config_.logger_name, message);

    if (config_.log_max_bytes > 0 && log_bytes_ > 0 &&
        log_bytes_ + line.size() > config_.log_max_bytes) {
        rotate_log();
        if (log_file_ == nullptr) {
            return;
        }
    }

    std::fwrite(line.data(), 1, line.size(), log_file_);
    std::fflush(log_file_);
    log_bytes_ += line.size();
}

void Writer::rotate_log() {
    const auto& base = config_.log_path.value();

    std::fclose(log_file_);
    log_file_ = nullptr;

    // Ошибки rename/remove не критичны: отсутствующие архивы пропускаются
    std::error_code ec;
    if (config_.log_backup_count > 0) {
        std::filesystem::remove(backup_path(base, config_.log_backup_count), ec);
        for (int i = config_.log_backup_count - 1; i >= 1; --i) {
            std::filesystem::rename(backup_path(base, i), backup_path(base, i + 1), ec);
        }
        std::filesystem::rename(base, backup_path(base, 1), ec);
    } else {
        std::filesystem::remove(base, ec);
    }

    std::string path_str = platform::path_to_utf8(base);
    log_file_ = std::fopen(path_str.c_str(), "wb");
    log_bytes_ = 0;
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write_impl(Stream::Stdout, "\n");
    std::fflush(stdout);
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::has_log_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_ != nullptr;
}

bool Writer::open_log_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.log_path.has_value() || log_file_ != nullptr) {
        return log_file_ != nullptr;
    }

    const auto& path = config_.log_path.value();
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::string path_str = platform::path_to_utf8(path);
    log_file_ = std::fopen(path_str.c_str(), "ab");
    if (log_file_ == nullptr) {
        return false;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    log_bytes_ = ec ? 0 : size;
    return true;
}

void Writer::close_log_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_log_line(std::string_view timestamp, Level level, std::string_view logger,
                            std::string_view message) {
    std::string level_name = level_to_string(level);
    if (level_name.size() < 8) {
        level_name.append(8 - level_name.size(), ' ');
    }

    std::string line;
    line.reserve(timestamp.size() + logger.size() + message.size() + 20);
    line += "[";
    line.append(timestamp);
    line += "] [";
    line += level_name;
    line += "] ";
    line.append(logger);
    line += ": ";
    line.append(message);
    line += "\n";
    return line;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace fulcrum::output
