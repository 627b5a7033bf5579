// ==============================================================================
// fulcrum/validator.hpp - Валидация аргументов команды
// ==============================================================================
//
// Назначение:
// - Проверка токенов (длина, ASCII, грамматика флагов и значений)
// - Связывание значений с предшествующим коротким флагом
// - Сборка маски опций из длинных Boolean флагов
// - Диагностика с позицией токена в исходной строке команды
//
// Токены уже разбиты по пробелам, порядок не меняется.
// validate() - чистая функция без побочных эффектов.
//
// ==============================================================================

#ifndef FULCRUM_VALIDATOR_HPP
#define FULCRUM_VALIDATOR_HPP

#include <fulcrum/schema.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fulcrum::validator {

/// Максимальная длина токена в символах
constexpr std::size_t MAX_TOKEN_LENGTH = 128;

// ----------------------------------------------------------------------------
// Value - типизированное значение
// ----------------------------------------------------------------------------

using Value = std::variant<std::int64_t, double, bool, std::string>;

/// Тип значения в терминах схемы
schema::ValueType value_type(const Value& value);

/// Текстовое представление значения
std::string value_to_string(const Value& value);

// ----------------------------------------------------------------------------
// ParsedCommand
// ----------------------------------------------------------------------------

struct ParsedCommand {
    /// Позиционные значения в порядке появления
    std::vector<Value> positionals;

    /// Флаги; каждый ключ есть в схеме, тип значения совпадает с объявленным
    std::map<std::string, Value> flags;

    /// Маска опций из длинных Boolean флагов с битом
    std::uint32_t options = 0;

    bool has_option(unsigned bit) const;
    bool has_flag(std::string_view name) const;
};

// ----------------------------------------------------------------------------
// Классификация токенов
// ----------------------------------------------------------------------------

enum class TokenClass {
    Integer,    // -12, 7
    Float,      // 1.5, -.5, 3.
    Word,       // только буквы
    ShortFlag,  // -name
    LongFlag,   // --name
    Malformed
};

/// Классифицировать отдельный токен
TokenClass classify(std::string_view token);

/// Количество символов (кодовых точек UTF-8) в строке
std::size_t char_length(std::string_view utf8);

// ----------------------------------------------------------------------------
// ValidationError
// ----------------------------------------------------------------------------

enum class ErrorKind {
    TokenTooLarge,     // токен длиннее MAX_TOKEN_LENGTH
    NonAsciiToken,     // токен содержит не-ASCII символ
    MalformedToken,    // не число, не слово и не флаг
    UnknownFlag,       // значение привязано к флагу, которого нет в схеме
    MissingFlagValue,  // за коротким флагом не следует значение
    FlagTypeMismatch   // тип значения не совпадает с объявленным
};

const char* error_kind_to_string(ErrorKind kind);

/// Ссылка на токен в исходной строке
struct TokenRef {
    std::string token;
    std::size_t index = 0;   // номер токена
    std::size_t offset = 0;  // смещение в символах в строке, склеенной через пробел
    std::size_t length = 0;  // длина в символах
};

struct ValidationError {
    ErrorKind kind = ErrorKind::MalformedToken;

    /// Токены, на которые указывает ошибка (флаг, затем значение)
    std::vector<TokenRef> tokens;

    std::string message;

    /// Диагностика с подчёркиванием:
    /// @code
    ///   start -memory big
    ///         ^^^^^^^ ^^^
    ///   flag '-memory' expects integer, got text 'big'
    /// @endcode
    std::string render(std::string_view command_line) const;
};

// ----------------------------------------------------------------------------
// validate
// ----------------------------------------------------------------------------

struct ValidateResult {
    bool ok = false;
    ParsedCommand command;
    ValidationError error;

    explicit operator bool() const { return ok; }
};

/// Проверить токены против схемы
///
/// Порядок проверок:
/// 1. Длина каждого токена (TokenTooLarge)
/// 2. ASCII (NonAsciiToken)
/// 3. Классификация и связывание значений слева направо
///
/// Значение - позиционное, если предыдущий токен был значением,
/// длинным флагом или отсутствует; иначе оно привязывается к
/// предыдущему короткому флагу.
///
/// Количество позиционных значений не проверяется.
ValidateResult validate(const schema::ArgumentSchema& schema,
                        const std::vector<std::string>& tokens);

/// Склеить токены через один пробел
std::string join_tokens(const std::vector<std::string>& tokens);

/// Разбить строку по пробельным символам
std::vector<std::string> split_tokens(std::string_view line);

}  // namespace fulcrum::validator

#endif  // FULCRUM_VALIDATOR_HPP
