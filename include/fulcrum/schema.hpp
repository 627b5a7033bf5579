// ==============================================================================
// fulcrum/schema.hpp - Декларативная схема аргументов команды
// ==============================================================================
//
// Назначение:
// - Описание распознаваемых флагов команды (имя, тип, бит опции)
// - Проверка инвариантов схемы при построении
// - Загрузка схемы из YAML (yaml-cpp)
// - Встроенная схема команды start
//
// ==============================================================================

#ifndef FULCRUM_SCHEMA_HPP
#define FULCRUM_SCHEMA_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fulcrum::schema {

// ----------------------------------------------------------------------------
// ValueType - объявленный тип флага
// ----------------------------------------------------------------------------

enum class ValueType {
    Integer,  // целое со знаком (64 бита)
    Float,    // число с плавающей точкой
    Boolean,  // флаг-переключатель (только --name)
    Text      // слово из букв
};

/// Преобразовать ValueType в строку ("integer", "float", "boolean", "text")
const char* value_type_to_string(ValueType type);

/// Разобрать имя типа из файла схемы
/// @return std::nullopt для неизвестного имени
std::optional<ValueType> value_type_from_string(std::string_view name);

// ----------------------------------------------------------------------------
// FlagSpec - описание одного флага
// ----------------------------------------------------------------------------

struct FlagSpec {
    /// Имя без ведущих дефисов ("fresh" для --fresh, "memory" для -memory)
    std::string name;

    ValueType type = ValueType::Boolean;

    /// Позиция бита в маске опций; допустима только для Boolean
    std::optional<unsigned> bit;

    bool required = false;
};

/// Максимальная позиция бита (маска опций - 32 бита)
constexpr unsigned MAX_BIT_POSITION = 31;

/// Имя флага без дефисов: строчная буква, затем строчные буквы
/// и одиночные внутренние дефисы ("memory", "dry-run")
bool is_valid_flag_name(std::string_view name);

// ----------------------------------------------------------------------------
// ArgumentSchema
// ----------------------------------------------------------------------------

/// Упорядоченный набор FlagSpec с уникальными именами и битами.
/// Порядок соответствует порядку объявления.
class ArgumentSchema {
public:
    ArgumentSchema() = default;
    explicit ArgumentSchema(std::string command);

    /// Добавить флаг
    /// @throws std::invalid_argument при нарушении инвариантов:
    ///   имя вне грамматики флагов, повторное имя, повторный бит, бит у не-Boolean, бит > MAX_BIT_POSITION
    void add(FlagSpec spec);

    /// Найти флаг по имени (без дефисов)
    const FlagSpec* find(std::string_view name) const;

    const std::string& command() const { return command_; }
    const std::vector<FlagSpec>& flags() const { return flags_; }
    std::size_t size() const { return flags_.size(); }
    bool empty() const { return flags_.empty(); }

private:
    std::string command_;
    std::vector<FlagSpec> flags_;
};

// ----------------------------------------------------------------------------
// Загрузка схемы
// ----------------------------------------------------------------------------

struct SchemaResult {
    bool ok = false;
    ArgumentSchema schema;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Загрузить схему из YAML файла
///
/// Формат:
/// @code
///   command: start
///   flags:
///     - name: fresh
///       type: boolean
///       bit: 0
///     - name: memory
///       type: integer
/// @endcode
SchemaResult load_schema(const std::filesystem::path& path);

/// Разобрать схему из YAML текста
SchemaResult parse_schema(std::string_view yaml_text);

/// Встроенная схема команды start:
/// --fresh (бит 0), --verbose (бит 1), -memory <integer>, -motd <text>
ArgumentSchema default_start_schema();

}  // namespace fulcrum::schema

#endif  // FULCRUM_SCHEMA_HPP
