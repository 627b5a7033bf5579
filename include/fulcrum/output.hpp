// ==============================================================================
// fulcrum/output.hpp - Журнал и пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал в файл с ротацией по размеру
// - Цветной вывод (ANSI escape codes) только для TTY
// - JSON Lines для машиночитаемых событий (RapidJSON)
//
// Writer потокобезопасен: вызовы из параллельных обращений
// сериализуются внутренним мьютексом.
//
// ==============================================================================

#ifndef FULCRUM_OUTPUT_HPP
#define FULCRUM_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace fulcrum::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

enum class Level { Trace, Debug, Info, Warning, Error };

/// "TRACE", "DEBUG", "INFO", "WARNING", "ERROR"
const char* level_to_string(Level level);

/// Консольный префикс уровня: "[~] ", "[*] ", "[+] ", "[!] ", "[x] "
const char* level_prefix(Level level);

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить info/warn в stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)

    /// Журнал в файл (все уровни, без цветов)
    std::optional<std::filesystem::path> log_path;

    /// Размер, после которого файл журнала ротируется
    std::uint64_t log_max_bytes = 32ULL * 1024 * 1024;

    /// Сколько архивов хранить (<log>.1 ... <log>.N)
    int log_backup_count = 5;

    /// Имя в строке журнала
    std::string logger_name = "fulcrum";
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // JSON
    // -------------------------------------------------------------------------

    /// Компактный JSON + newline в stdout
    void write_json_line(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_log_file() const;

    /// Открыть файл журнала (при log_path задан)
    bool open_log_file();

    void close_log_file();

private:
    void message_impl(Level level, Color color, std::string_view message, bool to_console);
    void write_impl(Stream s, std::string_view bytes);
    void write_colored_prefix(const char* prefix, Color color);
    void log_impl(Level level, std::string_view message);
    void rotate_log();
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    mutable std::mutex mutex_;
    FILE* log_file_ = nullptr;
    std::uint64_t log_bytes_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Строка журнала:
/// "[YYYY-MM-DD HH:MM:SS] [LEVEL   ] <logger>: <message>\n"
std::string format_log_line(std::string_view timestamp, Level level, std::string_view logger,
                            std::string_view message);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace fulcrum::output

#endif  // FULCRUM_OUTPUT_HPP
