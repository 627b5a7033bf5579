// ==============================================================================
// docker.cpp - Реализация ContainerRuntime через docker CLI
// ==============================================================================

#include "fulcrum/runtime.hpp"

#include "fulcrum/platform.hpp"

#include <stdexcept>

namespace fulcrum::runtime {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string failure_message(const std::vector<std::string>& argv,
                            const platform::ProcessResult& pr) {
    if (pr.exit_code == platform::EXIT_EXEC_FAILED) {
        return "cannot execute '" + argv[0] + "'";
    }
    return "'" + platform::describe_command(argv) + "' exited with code " +
           std::to_string(pr.exit_code);
}

}  // namespace

DockerRuntime::DockerRuntime(DockerConfig config) : config_(std::move(config)) {}

std::vector<std::string> DockerRuntime::list_arguments(const std::string& target) const {
    return {config_.docker, "ps", "-a", "--filter", "name=" + target, "--format", "{{.Names}}"};
}

std::vector<std::string> DockerRuntime::run_arguments(const std::string& name,
                                                      const volume::VolumeSlot& slot,
                                                      const LaunchOptions& options) const {
    std::string port = std::to_string(config_.port);
    std::vector<std::string> argv{config_.docker,
                                  "run",
                                  "-d",
                                  "--name",
                                  name,
                                  "-p",
                                  port + ":" + port,
                                  "-v",
                                  platform::path_to_utf8(slot.path) + ":" + config_.data_mount,
                                  "-e",
                                  "EULA=TRUE"};
    if (!config_.version.empty()) {
        argv.push_back("-e");
        argv.push_back("VERSION=" + config_.version);
    }
    if (options.memory_gib.has_value()) {
        argv.push_back("-e");
        argv.push_back("MEMORY=" + std::to_string(*options.memory_gib) + "G");
    }
    if (options.motd.has_value()) {
        argv.push_back("-e");
        argv.push_back("MOTD=" + *options.motd);
    }
    argv.push_back(config_.image);
    return argv;
}

ListResult DockerRuntime::list(const std::string& target) {
    ListResult result;
    auto argv = list_arguments(target);
    auto pr = platform::run_process(argv);
    if (!pr.ok()) {
        result.error = failure_message(argv, pr);
        return result;
    }
    result.ok = true;
    result.text = std::move(pr.output);
    return result;
}

LaunchResult DockerRuntime::start_existing(const std::string& name) {
    LaunchResult result;
    result.instance = name;
    std::vector<std::string> argv{config_.docker, "start", name};
    auto pr = platform::run_process(argv);
    if (!pr.ok()) {
        result.error = failure_message(argv, pr);
        return result;
    }
    result.ok = true;
    return result;
}

LaunchResult DockerRuntime::run_fresh(const std::string& name, const volume::VolumeSlot& slot,
                                      const LaunchOptions& options) {
    LaunchResult result;
    result.instance = name;
    auto argv = run_arguments(name, slot, options);
    auto pr = platform::run_process(argv);
    if (!pr.ok()) {
        result.error = failure_message(argv, pr);
        return result;
    }
    // docker run -d печатает id контейнера
    result.id = trim(pr.output).substr(0, 12);
    result.ok = true;
    return result;
}

bool DockerRuntime::probe_daemon() {
    if (config_.check_command.empty()) {
        return true;
    }
    return platform::run_process(config_.check_command).ok();
}

void DockerRuntime::launch_daemon() {
    if (config_.start_command.empty()) {
        return;
    }
    platform::spawn_detached(config_.start_command);
}

}  // namespace fulcrum::runtime
