// ==============================================================================
// validator.cpp - Валидация аргументов команды
// ==============================================================================
//
// Разбор - конечный автомат по классам токенов с одним слотом
// просмотра назад (класс предыдущего токена):
//
//   предыдущий       | значение           | -flag        | --flag
//   -----------------+--------------------+--------------+-----------------
//   нет / значение   | позиционное        | ждать знач.  | опция
//   -flag            | привязать к флагу  | ошибка       | ошибка
//   --flag           | позиционное        | ждать знач.  | опция
//
// ==============================================================================

#include "fulcrum/validator.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace fulcrum::validator {

namespace {

// ----------------------------------------------------------------------------
// Предикаты классификации
// ----------------------------------------------------------------------------

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Число: не более одного ведущего минуса, не более одной точки,
/// хотя бы одна цифра
std::optional<TokenClass> classify_numeric(std::string_view token) {
    std::size_t pos = 0;
    if (pos < token.size() && token[pos] == '-') {
        ++pos;
    }
    if (pos == token.size()) {
        return std::nullopt;
    }

    bool has_digit = false;
    bool has_point = false;
    for (; pos < token.size(); ++pos) {
        char c = token[pos];
        if (is_digit(c)) {
            has_digit = true;
        } else if (c == '.' && !has_point) {
            has_point = true;
        } else {
            return std::nullopt;
        }
    }
    if (!has_digit) {
        return std::nullopt;
    }
    return has_point ? TokenClass::Float : TokenClass::Integer;
}

bool is_word(std::string_view token) {
    if (token.empty()) {
        return false;
    }
    for (char c : token) {
        if (!is_alpha(c)) {
            return false;
        }
    }
    return true;
}

/// Флаг: 1-2 дефиса, строчная буква, затем строчные буквы и одиночные
/// внутренние дефисы (не в конце, не подряд)
std::optional<TokenClass> classify_flag(std::string_view token) {
    std::size_t dashes = 0;
    while (dashes < token.size() && dashes < 2 && token[dashes] == '-') {
        ++dashes;
    }
    if (dashes == 0 || !schema::is_valid_flag_name(token.substr(dashes))) {
        return std::nullopt;
    }
    return dashes == 1 ? TokenClass::ShortFlag : TokenClass::LongFlag;
}

bool is_ascii(std::string_view token) {
    for (char c : token) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            return false;
        }
    }
    return true;
}

std::string_view flag_name(std::string_view token) {
    std::size_t dashes = (token.size() > 1 && token[1] == '-') ? 2 : 1;
    return token.substr(dashes);
}

// ----------------------------------------------------------------------------
// Построение ошибок
// ----------------------------------------------------------------------------

class ErrorBuilder {
public:
    ErrorBuilder(const std::vector<std::string>& tokens, const std::vector<std::size_t>& offsets,
                 const std::vector<std::size_t>& lengths)
        : tokens_(tokens), offsets_(offsets), lengths_(lengths) {}

    TokenRef ref(std::size_t index) const {
        return TokenRef{tokens_[index], index, offsets_[index], lengths_[index]};
    }

    ValidateResult fail(ErrorKind kind, std::string message,
                        std::initializer_list<std::size_t> indices) const {
        ValidateResult result;
        result.ok = false;
        result.error.kind = kind;
        result.error.message = std::move(message);
        for (auto index : indices) {
            result.error.tokens.push_back(ref(index));
        }
        return result;
    }

private:
    const std::vector<std::string>& tokens_;
    const std::vector<std::size_t>& offsets_;
    const std::vector<std::size_t>& lengths_;
};

std::string quoted(std::string_view s) {
    return "'" + std::string(s) + "'";
}

std::string at_offset(std::size_t offset) {
    return " at offset " + std::to_string(offset);
}

// ----------------------------------------------------------------------------
// Разбор значений
// ----------------------------------------------------------------------------

std::optional<Value> parse_value(std::string_view token, TokenClass cls) {
    switch (cls) {
    case TokenClass::Integer: {
        std::int64_t v = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
        if (ec != std::errc() || ptr != token.data() + token.size()) {
            return std::nullopt;
        }
        return Value{v};
    }
    case TokenClass::Float: {
        std::string buf(token);
        char* end = nullptr;
        double v = std::strtod(buf.c_str(), &end);
        if (end != buf.c_str() + buf.size()) {
            return std::nullopt;
        }
        return Value{v};
    }
    case TokenClass::Word:
        return Value{std::string(token)};
    default:
        return std::nullopt;
    }
}

/// Привести значение к объявленному типу флага.
/// Целое допускается для Float и расширяется до double.
std::optional<Value> coerce(const Value& value, schema::ValueType declared) {
    switch (declared) {
    case schema::ValueType::Integer:
        if (std::holds_alternative<std::int64_t>(value)) {
            return value;
        }
        return std::nullopt;
    case schema::ValueType::Float:
        if (std::holds_alternative<double>(value)) {
            return value;
        }
        if (std::holds_alternative<std::int64_t>(value)) {
            return Value{static_cast<double>(std::get<std::int64_t>(value))};
        }
        return std::nullopt;
    case schema::ValueType::Text:
        if (std::holds_alternative<std::string>(value)) {
            return value;
        }
        return std::nullopt;
    case schema::ValueType::Boolean:
        return std::nullopt;
    }
    return std::nullopt;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

schema::ValueType value_type(const Value& value) {
    if (std::holds_alternative<std::int64_t>(value)) {
        return schema::ValueType::Integer;
    }
    if (std::holds_alternative<double>(value)) {
        return schema::ValueType::Float;
    }
    if (std::holds_alternative<bool>(value)) {
        return schema::ValueType::Boolean;
    }
    return schema::ValueType::Text;
}

std::string value_to_string(const Value& value) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::string s = std::to_string(*d);
        // Убираем хвостовые нули: 1.500000 -> 1.5
        auto last = s.find_last_not_of('0');
        if (last != std::string::npos && s[last] == '.') {
            ++last;
        }
        s.erase(last + 1);
        return s;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    return std::get<std::string>(value);
}

bool ParsedCommand::has_option(unsigned bit) const {
    if (bit > schema::MAX_BIT_POSITION) {
        return false;
    }
    return (options & (std::uint32_t{1} << bit)) != 0;
}

bool ParsedCommand::has_flag(std::string_view name) const {
    return flags.find(std::string(name)) != flags.end();
}

// ----------------------------------------------------------------------------
// Классификация
// ----------------------------------------------------------------------------

TokenClass classify(std::string_view token) {
    if (auto numeric = classify_numeric(token)) {
        return *numeric;
    }
    if (is_word(token)) {
        return TokenClass::Word;
    }
    if (auto flag = classify_flag(token)) {
        return *flag;
    }
    return TokenClass::Malformed;
}

std::size_t char_length(std::string_view utf8) {
    std::size_t count = 0;
    for (char c : utf8) {
        // Байты продолжения 10xxxxxx не начинают новый символ
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TokenTooLarge:
        return "TokenTooLarge";
    case ErrorKind::NonAsciiToken:
        return "NonAsciiToken";
    case ErrorKind::MalformedToken:
        return "MalformedToken";
    case ErrorKind::UnknownFlag:
        return "UnknownFlag";
    case ErrorKind::MissingFlagValue:
        return "MissingFlagValue";
    case ErrorKind::FlagTypeMismatch:
        return "FlagTypeMismatch";
    }
    return "Unknown";
}

std::string ValidationError::render(std::string_view command_line) const {
    std::string carets;
    for (const auto& ref : tokens) {
        if (carets.size() < ref.offset + ref.length) {
            carets.resize(ref.offset + ref.length, ' ');
        }
        for (std::size_t i = 0; i < ref.length; ++i) {
            carets[ref.offset + i] = '^';
        }
    }

    std::string out(command_line);
    out += "\n";
    out += carets;
    out += "\n";
    out += message;
    return out;
}

// ----------------------------------------------------------------------------
// validate
// ----------------------------------------------------------------------------

ValidateResult validate(const schema::ArgumentSchema& schema,
                        const std::vector<std::string>& tokens) {
    std::vector<std::size_t> lengths;
    std::vector<std::size_t> offsets;
    lengths.reserve(tokens.size());
    offsets.reserve(tokens.size());

    std::size_t offset = 0;
    for (const auto& token : tokens) {
        auto len = char_length(token);
        offsets.push_back(offset);
        lengths.push_back(len);
        offset += len + 1;
    }

    ErrorBuilder errors(tokens, offsets, lengths);

    // Шаг 1: длина
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (lengths[i] > MAX_TOKEN_LENGTH) {
            return errors.fail(ErrorKind::TokenTooLarge,
                               "token" + at_offset(offsets[i]) + " is " +
                                   std::to_string(lengths[i]) + " characters long (maximum " +
                                   std::to_string(MAX_TOKEN_LENGTH) + ")",
                               {i});
        }
    }

    // Шаг 2: ASCII
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (!is_ascii(tokens[i])) {
            return errors.fail(ErrorKind::NonAsciiToken,
                               "token " + validator::quoted(tokens[i]) + at_offset(offsets[i]) +
                                   " contains non-ASCII characters",
                               {i});
        }
    }

    // Шаг 3: классификация и связывание
    ValidateResult result;
    ParsedCommand& command = result.command;

    enum class Prev { None, Value, ShortFlag, LongFlag };
    Prev prev = Prev::None;
    std::size_t pending_flag = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        TokenClass cls = classify(token);

        if (cls == TokenClass::Malformed) {
            return errors.fail(ErrorKind::MalformedToken,
                               "token " + validator::quoted(token) + at_offset(offsets[i]) +
                                   " is neither a number, a word nor a flag",
                               {i});
        }

        if (cls == TokenClass::ShortFlag || cls == TokenClass::LongFlag) {
            if (prev == Prev::ShortFlag) {
                return errors.fail(ErrorKind::MissingFlagValue,
                                   "flag " + validator::quoted(tokens[pending_flag]) +
                                       at_offset(offsets[pending_flag]) + " expects a value",
                                   {pending_flag});
            }

            if (cls == TokenClass::ShortFlag) {
                pending_flag = i;
                prev = Prev::ShortFlag;
                continue;
            }

            // Длинный флаг: только Boolean из схемы, неизвестные пропускаются
            const auto* spec = schema.find(flag_name(token));
            if (spec != nullptr && spec->type == schema::ValueType::Boolean) {
                command.flags[spec->name] = Value{true};
                if (spec->bit.has_value()) {
                    command.options |= std::uint32_t{1} << *spec->bit;
                }
            }
            prev = Prev::LongFlag;
            continue;
        }

        // Значение
        auto value = parse_value(token, cls);
        if (!value) {
            return errors.fail(ErrorKind::MalformedToken,
                               "number " + validator::quoted(token) + at_offset(offsets[i]) +
                                   " is out of range",
                               {i});
        }

        if (prev != Prev::ShortFlag) {
            command.positionals.push_back(std::move(*value));
            prev = Prev::Value;
            continue;
        }

        const std::string& flag_token = tokens[pending_flag];
        const auto* spec = schema.find(flag_name(flag_token));
        if (spec == nullptr) {
            return errors.fail(ErrorKind::UnknownFlag,
                               "unknown flag " + validator::quoted(flag_token) +
                                   at_offset(offsets[pending_flag]),
                               {pending_flag, i});
        }

        auto coerced = coerce(*value, spec->type);
        if (!coerced) {
            return errors.fail(ErrorKind::FlagTypeMismatch,
                               "flag " + validator::quoted(flag_token) + " expects " +
                                   schema::value_type_to_string(spec->type) + ", got " +
                                   schema::value_type_to_string(value_type(*value)) + " " +
                                   validator::quoted(token),
                               {pending_flag, i});
        }

        command.flags[spec->name] = std::move(*coerced);
        prev = Prev::Value;
    }

    if (prev == Prev::ShortFlag) {
        return errors.fail(ErrorKind::MissingFlagValue,
                           "flag " + validator::quoted(tokens[pending_flag]) +
                               at_offset(offsets[pending_flag]) + " expects a value",
                           {pending_flag});
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Утилиты
// ----------------------------------------------------------------------------

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += tokens[i];
    }
    return out;
}

std::vector<std::string> split_tokens(std::string_view line) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        std::size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

}  // namespace fulcrum::validator
