// ==============================================================================
// schema.cpp - Декларативная схема аргументов команды
// ==============================================================================

#include "fulcrum/schema.hpp"

#include "fulcrum/platform.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fulcrum::schema {

// ----------------------------------------------------------------------------
// ValueType
// ----------------------------------------------------------------------------

const char* value_type_to_string(ValueType type) {
    switch (type) {
    case ValueType::Integer:
        return "integer";
    case ValueType::Float:
        return "float";
    case ValueType::Boolean:
        return "boolean";
    case ValueType::Text:
        return "text";
    }
    return "unknown";
}

std::optional<ValueType> value_type_from_string(std::string_view name) {
    if (name == "integer" || name == "int") {
        return ValueType::Integer;
    }
    if (name == "float") {
        return ValueType::Float;
    }
    if (name == "boolean" || name == "bool") {
        return ValueType::Boolean;
    }
    if (name == "text" || name == "string") {
        return ValueType::Text;
    }
    return std::nullopt;
}

bool is_valid_flag_name(std::string_view name) {
    auto is_lower = [](char c) { return c >= 'a' && c <= 'z'; };
    if (name.empty() || !is_lower(name.front()) || name.back() == '-') {
        return false;
    }
    char prev = name.front();
    for (char c : name.substr(1)) {
        if (c == '-' ? prev == '-' : !is_lower(c)) {
            return false;
        }
        prev = c;
    }
    return true;
}

// ----------------------------------------------------------------------------
// ArgumentSchema
// ----------------------------------------------------------------------------

ArgumentSchema::ArgumentSchema(std::string command) : command_(std::move(command)) {}

void ArgumentSchema::add(FlagSpec spec) {
    if (spec.name.empty()) {
        throw std::invalid_argument("flag name must not be empty");
    }
    if (!is_valid_flag_name(spec.name)) {
        throw std::invalid_argument("flag name '" + spec.name +
                                    "' must be lowercase letters with single inner dashes");
    }
    if (find(spec.name) != nullptr) {
        throw std::invalid_argument("duplicate flag '" + spec.name + "'");
    }
    if (spec.bit.has_value()) {
        if (spec.type != ValueType::Boolean) {
            throw std::invalid_argument("flag '" + spec.name + "' has a bit position but is " +
                                        value_type_to_string(spec.type));
        }
        if (*spec.bit > MAX_BIT_POSITION) {
            throw std::invalid_argument("bit position " + std::to_string(*spec.bit) +
                                        " of flag '" + spec.name + "' is out of range");
        }
        for (const auto& existing : flags_) {
            if (existing.bit == spec.bit) {
                throw std::invalid_argument("bit position " + std::to_string(*spec.bit) +
                                            " is used by both '" + existing.name + "' and '" +
                                            spec.name + "'");
            }
        }
    }
    flags_.push_back(std::move(spec));
}

const FlagSpec* ArgumentSchema::find(std::string_view name) const {
    for (const auto& spec : flags_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// Загрузка из YAML
// ----------------------------------------------------------------------------

namespace {

SchemaResult parse_schema_node(const YAML::Node& root) {
    SchemaResult result;

    if (!root || !root.IsMap()) {
        result.error = "schema must be a mapping";
        return result;
    }

    std::string command;
    if (root["command"]) {
        command = root["command"].as<std::string>();
    }
    ArgumentSchema schema(command);

    const YAML::Node flags = root["flags"];
    if (flags && !flags.IsSequence()) {
        result.error = "schema field 'flags' must be a sequence";
        return result;
    }

    if (flags) {
        for (const auto& node : flags) {
            if (!node["name"]) {
                result.error = "schema flag is missing 'name'";
                return result;
            }
            FlagSpec spec;
            spec.name = node["name"].as<std::string>();

            if (!node["type"]) {
                result.error = "schema flag '" + spec.name + "' is missing 'type'";
                return result;
            }
            auto type_name = node["type"].as<std::string>();
            auto type = value_type_from_string(type_name);
            if (!type) {
                result.error = "schema flag '" + spec.name + "' has unknown type '" + type_name + "'";
                return result;
            }
            spec.type = *type;

            if (node["bit"]) {
                int bit = node["bit"].as<int>();
                if (bit < 0) {
                    result.error = "schema flag '" + spec.name + "' has a negative bit position";
                    return result;
                }
                spec.bit = static_cast<unsigned>(bit);
            }
            if (node["required"]) {
                spec.required = node["required"].as<bool>();
            }

            try {
                schema.add(std::move(spec));
            } catch (const std::invalid_argument& e) {
                result.error = e.what();
                return result;
            }
        }
    }

    result.schema = std::move(schema);
    result.ok = true;
    return result;
}

}  // namespace

SchemaResult parse_schema(std::string_view yaml_text) {
    SchemaResult result;
    try {
        return parse_schema_node(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

SchemaResult load_schema(const std::filesystem::path& path) {
    SchemaResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = "cannot open schema file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    result = parse_schema(ss.str());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

ArgumentSchema default_start_schema() {
    ArgumentSchema schema("start");
    schema.add({"fresh", ValueType::Boolean, 0u, false});
    schema.add({"verbose", ValueType::Boolean, 1u, false});
    schema.add({"memory", ValueType::Integer, std::nullopt, false});
    schema.add({"motd", ValueType::Text, std::nullopt, false});
    return schema;
}

}  // namespace fulcrum::schema
