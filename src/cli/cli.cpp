// ==============================================================================
// cli.cpp - Опции командной строки процесса
// ==============================================================================
//
// Собственный слой CLI без сторонних библиотек.
//
// ==============================================================================

#include "fulcrum/cli.hpp"

#include "fulcrum/platform.hpp"

#include <cstring>

namespace fulcrum::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: fulcrum [OPTIONS]\n\n"
                       "For more information, try '--help'.\n";
}

}  // anonymous namespace

std::string render_version() {
    return std::string("fulcrum ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: fulcrum [OPTIONS]\n"
           "\n"
           "Reads requests from stdin, one per line: <requester> <command> [ARGS]...\n"
           "\n"
           "Commands:\n"
           "  start [--fresh] [--verbose] [-memory <GIB>] [-motd <WORD>]\n"
           "                 Start the server session (resume the latest instance,\n"
           "                 or a new one on a fresh volume with --fresh)\n"
           "  help           Show available commands\n"
           "\n"
           "Options:\n"
           "      --config <PATH>  Settings file [default: bot_settings.json]\n"
           "  -d, --dev            Enable developer mode\n"
           "  -lco, --client-off   Do not start the front end; check settings and exit\n"
           "  -c, --channel        Report developer messages to the reply channel\n"
           "      --json-events    Print replies as JSON lines\n"
           "  -v...                Print verbose output\n"
           "  -q                   Suppress informational output\n"
           "  -h, --help           Print help\n"
           "  -V, --version        Print version\n";
}

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = RunCommand{};

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-d") || str_eq(arg, "--dev")) {
            result.options.dev = true;
        } else if (str_eq(arg, "-lco") || str_eq(arg, "--client-off")) {
            result.options.client_off = true;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--channel")) {
            result.options.channel = true;
        } else if (str_eq(arg, "--json-events")) {
            result.options.json_events = true;
        } else if (str_eq(arg, "-q")) {
            result.options.quiet = true;
        } else if (str_eq(arg, "-v")) {
            result.options.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.options.verbose += 2;
        } else if (str_eq(arg, "--config")) {
            // --config требует следующий аргумент
            if (i + 1 >= argc) {
                result.diagnostic.stderr_message = render_usage_error(
                    "error: a value is required for '--config <PATH>' but none was supplied");
                return result;
            }
            ++i;
            result.options.config = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--config=")) {
            const char* value = arg + 9;  // strlen("--config=")
            if (*value == '\0') {
                result.diagnostic.stderr_message = render_usage_error(
                    "error: a value is required for '--config <PATH>' but none was supplied");
                return result;
            }
            result.options.config = platform::path_from_utf8(value);
        } else {
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    result.ok = true;
    return result;
}

}  // namespace fulcrum::cli
