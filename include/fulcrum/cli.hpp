// ==============================================================================
// fulcrum/cli.hpp - Опции командной строки процесса
// ==============================================================================
//
// Назначение:
// - Парсинг argv хост-процесса
// - Генерация --help / --version
// - Диагностические ошибки CLI
//
// ==============================================================================

#ifndef FULCRUM_CLI_HPP
#define FULCRUM_CLI_HPP

#include <filesystem>
#include <string>
#include <variant>

namespace fulcrum::cli {

// ----------------------------------------------------------------------------
// Опции
// ----------------------------------------------------------------------------

struct HostOptions {
    std::filesystem::path config = "bot_settings.json";  // --config
    bool dev = false;                                    // -d, --dev
    bool client_off = false;                             // -lco, --client-off
    bool channel = false;                                // -c, --channel
    bool json_events = false;                            // --json-events
    int verbose = 0;                                     // -v (repeatable)
    bool quiet = false;                                  // -q
};

/// Запуск фронтенда
struct RunCommand {};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    HostOptions options;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

std::string render_help();

std::string render_version();

/// Версия программы
constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Chat-driven control surface for a managed game server session";

}  // namespace fulcrum::cli

#endif  // FULCRUM_CLI_HPP
