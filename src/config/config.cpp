// ==============================================================================
// config.cpp - Настройки процесса
// ==============================================================================

#include "fulcrum/config.hpp"

#include "fulcrum/platform.hpp"

#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <string>

namespace fulcrum::config {

namespace {

/// Верхняя граница секундных интервалов (10 лет): при переводе
/// в наносекунды значение остаётся в пределах int64
constexpr std::int64_t MAX_DURATION_SECONDS = 10LL * 365 * 24 * 3600;

// ----------------------------------------------------------------------------
// Чтение полей с проверкой типов
// ----------------------------------------------------------------------------

class FieldReader {
public:
    explicit FieldReader(std::string& error) : error_(error) {}

    bool failed() const { return !error_.empty(); }

    const rapidjson::Value* object(const rapidjson::Value& parent, const char* key) {
        auto it = parent.FindMember(key);
        if (it == parent.MemberEnd()) {
            return nullptr;
        }
        if (!it->value.IsObject()) {
            fail(key, "an object");
            return nullptr;
        }
        return &it->value;
    }

    void integer(const rapidjson::Value& obj, const char* key, std::int64_t& out) {
        auto it = obj.FindMember(key);
        if (it == obj.MemberEnd()) {
            return;
        }
        if (!it->value.IsInt64()) {
            fail(key, "an integer");
            return;
        }
        out = it->value.GetInt64();
    }

    void boolean(const rapidjson::Value& obj, const char* key, bool& out) {
        auto it = obj.FindMember(key);
        if (it == obj.MemberEnd()) {
            return;
        }
        if (!it->value.IsBool()) {
            fail(key, "a boolean");
            return;
        }
        out = it->value.GetBool();
    }

    void string(const rapidjson::Value& obj, const char* key, std::string& out) {
        auto it = obj.FindMember(key);
        if (it == obj.MemberEnd()) {
            return;
        }
        if (!it->value.IsString()) {
            fail(key, "a string");
            return;
        }
        out.assign(it->value.GetString(), it->value.GetStringLength());
    }

    void string_list(const rapidjson::Value& obj, const char* key, std::vector<std::string>& out) {
        auto it = obj.FindMember(key);
        if (it == obj.MemberEnd()) {
            return;
        }
        if (!it->value.IsArray()) {
            fail(key, "an array of strings");
            return;
        }
        std::vector<std::string> values;
        for (const auto& item : it->value.GetArray()) {
            if (!item.IsString()) {
                fail(key, "an array of strings");
                return;
            }
            values.emplace_back(item.GetString(), item.GetStringLength());
        }
        out = std::move(values);
    }

    void fail(const char* key, const char* expected) {
        if (error_.empty()) {
            error_ = std::string("setting '") + key + "' must be " + expected;
        }
    }

    void fail_message(std::string message) {
        if (error_.empty()) {
            error_ = std::move(message);
        }
    }

private:
    std::string& error_;
};

std::filesystem::path resolve(const std::filesystem::path& base_dir, const std::string& value) {
    auto p = platform::path_from_utf8(value);
    if (p.is_relative() && !base_dir.empty()) {
        return base_dir / p;
    }
    return p;
}

}  // namespace

std::string Settings::target_tag() const {
    return strip_version(server.target_version).value_or(std::string());
}

// ----------------------------------------------------------------------------
// Версия
// ----------------------------------------------------------------------------

bool is_valid_version(std::string_view version) {
    int groups = 0;
    std::size_t i = 0;
    while (true) {
        std::size_t start = i;
        while (i < version.size() && version[i] >= '0' && version[i] <= '9') {
            ++i;
        }
        if (i == start) {
            return false;
        }
        ++groups;
        if (i == version.size()) {
            return groups == 3;
        }
        if (version[i] != '.' || groups == 3) {
            return false;
        }
        ++i;
    }
}

std::optional<std::string> strip_version(std::string_view version) {
    if (!is_valid_version(version)) {
        return std::nullopt;
    }
    std::string out;
    for (char c : version) {
        if (c != '.') {
            out += c;
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

SettingsResult parse_settings(std::string_view json_text, const std::filesystem::path& base_dir) {
    SettingsResult result;

    rapidjson::Document doc;
    doc.Parse(json_text.data(), json_text.size());
    if (doc.HasParseError()) {
        result.error = std::string("JSON parse error at offset ") +
                       std::to_string(doc.GetErrorOffset()) + ": " +
                       rapidjson::GetParseError_En(doc.GetParseError());
        return result;
    }
    if (!doc.IsObject()) {
        result.error = "settings root must be an object";
        return result;
    }

    Settings& s = result.settings;
    FieldReader reader(result.error);

    if (const auto* server = reader.object(doc, "server")) {
        std::int64_t threshold = s.server.restart_threshold.count();
        reader.integer(*server, "restart_threshold", threshold);
        if (threshold < 0 || threshold > MAX_DURATION_SECONDS) {
            reader.fail_message("setting 'restart_threshold' must be in 0.." +
                                std::to_string(MAX_DURATION_SECONDS));
        }
        s.server.restart_threshold = std::chrono::seconds(threshold);

        reader.string(*server, "target_version", s.server.target_version);

        std::string root;
        reader.string(*server, "volume_root", root);
        if (!root.empty()) {
            s.server.volume_root = resolve(base_dir, root);
        }

        std::int64_t port = s.server.port;
        reader.integer(*server, "port", port);
        if (port < 1 || port > 65535) {
            reader.fail_message("setting 'port' must be in 1..65535");
        }
        s.server.port = static_cast<int>(port);

        reader.string(*server, "image", s.server.image);
        reader.string(*server, "data_mount", s.server.data_mount);
    }

    if (const auto* daemon = reader.object(doc, "daemon")) {
        reader.boolean(*daemon, "enabled", s.daemon.enabled);

        std::int64_t max_checks = s.daemon.max_checks;
        reader.integer(*daemon, "max_checks", max_checks);
        if (max_checks < 1 || max_checks > 1000) {
            reader.fail_message("setting 'max_checks' must be in 1..1000");
        }
        s.daemon.max_checks = static_cast<int>(max_checks);

        std::int64_t interval = s.daemon.poll_interval.count();
        reader.integer(*daemon, "poll_interval_ms", interval);
        if (interval < 0) {
            reader.fail_message("setting 'poll_interval_ms' must not be negative");
        }
        s.daemon.poll_interval = std::chrono::milliseconds(interval);

        reader.string_list(*daemon, "check_command", s.daemon.check_command);
        reader.string_list(*daemon, "start_command", s.daemon.start_command);
    }

    if (const auto* commands = reader.object(doc, "commands")) {
        std::string schema;
        reader.string(*commands, "schema", schema);
        if (!schema.empty()) {
            s.schema_path = resolve(base_dir, schema);
        }
    }

    if (const auto* requests = reader.object(doc, "requests")) {
        std::int64_t cooldown = s.per_user_cooldown.count();
        reader.integer(*requests, "per_user_cooldown", cooldown);
        if (cooldown < 0 || cooldown > MAX_DURATION_SECONDS) {
            reader.fail_message("setting 'per_user_cooldown' must be in 0.." +
                                std::to_string(MAX_DURATION_SECONDS));
        }
        s.per_user_cooldown = std::chrono::seconds(cooldown);
    }

    if (const auto* log = reader.object(doc, "log")) {
        auto it = log->FindMember("path");
        if (it != log->MemberEnd()) {
            if (it->value.IsNull()) {
                s.log.path.reset();
            } else if (it->value.IsString()) {
                s.log.path = resolve(base_dir, it->value.GetString());
            } else {
                reader.fail("path", "a string or null");
            }
        }

        std::int64_t max_bytes = static_cast<std::int64_t>(s.log.max_bytes);
        reader.integer(*log, "max_bytes", max_bytes);
        if (max_bytes < 0) {
            reader.fail_message("setting 'max_bytes' must not be negative");
        }
        s.log.max_bytes = static_cast<std::uint64_t>(max_bytes);

        std::int64_t backups = s.log.backup_count;
        reader.integer(*log, "backup_count", backups);
        if (backups < 0 || backups > 100) {
            reader.fail_message("setting 'backup_count' must be in 0..100");
        }
        s.log.backup_count = static_cast<int>(backups);
    }

    if (reader.failed()) {
        return result;
    }

    if (!is_valid_version(s.server.target_version)) {
        result.error = "setting 'target_version' must look like 1.19.3, got '" +
                       s.server.target_version + "'";
        return result;
    }

    result.ok = true;
    return result;
}

SettingsResult load_settings(const std::filesystem::path& path) {
    SettingsResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.error = "cannot open settings file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    result = parse_settings(ss.str(), path.parent_path());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

}  // namespace fulcrum::config
