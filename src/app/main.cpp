// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Загрузка настроек и схемы команды start
// 3. Создание Writer с журналом в файл
// 4. Чтение запросов из stdin, каждый запрос в отдельном потоке
// 5. Возврат exit code
//
// Исключения перехватываются на границе app и превращаются в exit code 1.
//
// ==============================================================================

#include "fulcrum/cli.hpp"
#include "fulcrum/config.hpp"
#include "fulcrum/console.hpp"
#include "fulcrum/engine.hpp"
#include "fulcrum/output.hpp"
#include "fulcrum/platform.hpp"
#include "fulcrum/runtime.hpp"
#include "fulcrum/schema.hpp"
#include "fulcrum/session.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <string>

namespace {

/// Потоки обработки запросов, живущие одновременно
constexpr std::size_t MAX_REQUEST_WORKERS = 16;

constexpr const char* BANNER = R"(
    ┌─┐┬ ┬┬  ┌─┐┬─┐┬ ┬┌┬┐
    ├┤ │ ││  │  ├┬┘│ ││││
    └  └─┘┴─┘└─┘┴└─└─┘┴ ┴
)";

void print_banner(fulcrum::output::Writer& writer, const fulcrum::cli::HostOptions& options) {
    if (options.quiet || options.json_events) {
        return;
    }
    writer.write(fulcrum::output::Stream::Stderr, BANNER);
    writer.write_line(fulcrum::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Вывод ответов
// ----------------------------------------------------------------------------

void emit_reply(fulcrum::output::Writer& writer, bool json_events, const std::string& requester,
                const fulcrum::engine::Reply& reply) {
    using namespace fulcrum;

    if (!json_events) {
        writer.write_line(output::Stream::Stdout, "@" + requester + " " + reply.text);
        return;
    }

    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    doc.AddMember("requester", rapidjson::Value(requester.c_str(), alloc), alloc);
    doc.AddMember("kind", rapidjson::Value(engine::reply_kind_to_string(reply.kind), alloc),
                  alloc);
    doc.AddMember("ok", reply.ok(), alloc);
    if (!reply.instance.empty()) {
        doc.AddMember("instance", rapidjson::Value(reply.instance.c_str(), alloc), alloc);
    }
    doc.AddMember("text", rapidjson::Value(reply.text.c_str(), alloc), alloc);
    writer.write_json_line(doc);
}

void emit_notice(fulcrum::output::Writer& writer, bool json_events, const std::string& text) {
    if (!json_events) {
        writer.write_line(fulcrum::output::Stream::Stdout, text);
        return;
    }

    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    doc.AddMember("kind", "notice", alloc);
    doc.AddMember("text", rapidjson::Value(text.c_str(), alloc), alloc);
    writer.write_json_line(doc);
}

// ----------------------------------------------------------------------------
// Фронтенд
// ----------------------------------------------------------------------------

int run_frontend(const fulcrum::cli::HostOptions& options, const fulcrum::config::Settings& settings,
                 fulcrum::output::Writer& writer) {
    using namespace fulcrum;

    auto schema_result = settings.schema_path
                             ? schema::load_schema(*settings.schema_path)
                             : schema::SchemaResult{true, schema::default_start_schema(), {}};
    if (!schema_result) {
        writer.error("Failed to load command schema: " + schema_result.error);
        return 1;
    }

    runtime::DockerConfig docker;
    docker.image = settings.server.image;
    docker.version = settings.server.target_version;
    docker.port = settings.server.port;
    docker.data_mount = settings.server.data_mount;
    docker.check_command = settings.daemon.check_command;
    docker.start_command = settings.daemon.start_command;
    runtime::DockerRuntime runtime(docker);

    engine::EngineConfig engine_cfg;
    engine_cfg.restart_threshold = settings.server.restart_threshold;
    engine_cfg.ensure_daemon = settings.daemon.enabled;
    engine_cfg.max_checks = settings.daemon.max_checks;
    engine_cfg.poll_interval = settings.daemon.poll_interval;
    engine_cfg.volume_root = settings.server.volume_root;
    engine_cfg.target_tag = settings.target_tag();

    engine::Engine engine(engine_cfg, std::move(schema_result.schema), runtime, writer);

    writer.debug("Target version: " + settings.server.target_version + " (tag " +
                 engine_cfg.target_tag + ")");
    writer.debug("Restart threshold: " +
                 session::format_cooldown(settings.server.restart_threshold));

    if (options.client_off) {
        writer.info("Front end disabled; settings and schema are valid");
        return 0;
    }

    std::string ready_at = session::format_timestamp(session::Clock::now());
    if (options.dev) {
        writer.info("Developer mode on " + platform::os_name() + ", ready @ " + ready_at);
        if (options.channel) {
            emit_notice(writer, options.json_events, "fulcrum is up @ " + ready_at);
        }
    } else {
        writer.info("Ready @ " + ready_at);
    }

    console::Frontend frontend(engine, settings.per_user_cooldown);
    std::atomic<bool> failed{false};
    console::WorkerSet workers(MAX_REQUEST_WORKERS);

    std::string line;
    while (std::getline(std::cin, line)) {
        auto request = console::parse_request(line);
        if (!request) {
            continue;
        }
        auto now = session::Clock::now();

        workers.spawn([&, req = std::move(*request), now]() {
            try {
                engine::Reply reply = frontend.dispatch(req, now);
                emit_reply(writer, options.json_events, req.requester, reply);
            } catch (const std::exception& e) {
                writer.error("Request from " + req.requester + " failed: " + e.what());
                failed = true;
            }
        });
    }

    workers.join_all();

    writer.debug("Input closed, shutting down");
    writer.flush();
    return failed ? 1 : 0;
}

int run(int argc, char** argv) {
    using namespace fulcrum;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.options.quiet;
    out_cfg.verbose = parse_result.options.verbose;

    if (!parse_result.ok) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (std::holds_alternative<cli::HelpCommand>(parse_result.command)) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stdout, cli::render_help());
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    const cli::HostOptions& options = parse_result.options;

    auto settings_result = config::load_settings(options.config);
    if (!settings_result) {
        output::Writer writer(out_cfg);
        writer.error("Failed to load settings from " + platform::path_to_utf8(options.config) +
                     ": " + settings_result.error);
        return 1;
    }
    const config::Settings& settings = settings_result.settings;

    out_cfg.log_path = settings.log.path;
    out_cfg.log_max_bytes = settings.log.max_bytes;
    out_cfg.log_backup_count = settings.log.backup_count;
    output::Writer writer(out_cfg);
    if (out_cfg.log_path && !writer.open_log_file()) {
        writer.warn("Unable to open log file " + platform::path_to_utf8(*out_cfg.log_path));
    }

    print_banner(writer, options);
    return run_frontend(options, settings, writer);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
