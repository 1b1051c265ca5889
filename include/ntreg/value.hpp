// ==============================================================================
// ntreg/value.hpp - Типы значений registry и декодированный payload
// ==============================================================================
//
// Назначение:
// - ValueType: закрытый набор тегов REG_* (+ Unknown для остальных чисел)
// - TypedValue: декодированный payload значения (None, String, Dword,
//   Qword, Binary, Unknown)
// - Человекочитаемое представление и конверсия в RapidJSON Value
//
// ==============================================================================

#ifndef NTREG_VALUE_HPP
#define NTREG_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace ntreg {

// ----------------------------------------------------------------------------
// ValueType
// ----------------------------------------------------------------------------

/// Тег типа значения (числовые значения совпадают с winnt.h)
enum class ValueType : std::uint32_t {
    None = 0,                        // REG_NONE
    String = 1,                      // REG_SZ
    ExpandString = 2,                // REG_EXPAND_SZ
    Binary = 3,                      // REG_BINARY
    Dword = 4,                       // REG_DWORD
    DwordBigEndian = 5,              // REG_DWORD_BIG_ENDIAN
    Link = 6,                        // REG_LINK
    MultiString = 7,                 // REG_MULTI_SZ
    ResourceList = 8,                // REG_RESOURCE_LIST
    FullResourceDescriptor = 9,      // REG_FULL_RESOURCE_DESCRIPTOR
    ResourceRequirementsList = 10,   // REG_RESOURCE_REQUIREMENTS_LIST
    Qword = 11,                      // REG_QWORD
    Unknown = 0xFFFFFFFF             // Любой другой числовой тег
};

/// Отобразить числовой тег на ValueType (неизвестные -> Unknown)
ValueType value_type_from_u32(std::uint32_t tag);

/// Преобразовать ValueType в строку ("REG_SZ", ...)
const char* value_type_to_string(ValueType type);

/// Разобрать имя типа ("REG_SZ") или десятичное число ("4")
/// @return nullopt если строка не распознана
std::optional<std::uint32_t> value_type_tag_from_string(std::string_view name);

/// Разобрать hex строку ("0a0B ff", пробелы допускаются) в байты
/// @return nullopt при нечётном числе цифр или недопустимом символе
std::optional<std::vector<std::uint8_t>> parse_hex_bytes(std::string_view text);

// ----------------------------------------------------------------------------
// TypedValue
// ----------------------------------------------------------------------------

/// Декодированный payload значения
class TypedValue {
public:
    struct NoneValue {
        bool operator==(const NoneValue&) const { return true; }
    };
    struct UnknownValue {
        bool operator==(const UnknownValue&) const { return true; }
    };
    using String = std::string;
    using Dword = std::uint32_t;
    using Qword = std::uint64_t;
    using Binary = std::vector<std::uint8_t>;

private:
    std::variant<NoneValue, String, Dword, Qword, Binary, UnknownValue> data_;

public:
    /// None значение
    TypedValue() : data_(NoneValue{}) {}

    // -------------------------------------------------------------------------
    // Фабричные методы
    // -------------------------------------------------------------------------

    static TypedValue make_none() { return TypedValue(); }

    static TypedValue make_string(std::string v) {
        TypedValue t;
        t.data_ = std::move(v);
        return t;
    }

    static TypedValue make_dword(std::uint32_t v) {
        TypedValue t;
        t.data_ = v;
        return t;
    }

    static TypedValue make_qword(std::uint64_t v) {
        TypedValue t;
        t.data_ = v;
        return t;
    }

    static TypedValue make_binary(std::vector<std::uint8_t> v) {
        TypedValue t;
        t.data_ = std::move(v);
        return t;
    }

    static TypedValue make_unknown() {
        TypedValue t;
        t.data_ = UnknownValue{};
        return t;
    }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_none() const { return std::holds_alternative<NoneValue>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_dword() const { return std::holds_alternative<Dword>(data_); }
    bool is_qword() const { return std::holds_alternative<Qword>(data_); }
    bool is_binary() const { return std::holds_alternative<Binary>(data_); }
    bool is_unknown() const { return std::holds_alternative<UnknownValue>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }
    const Dword* get_dword() const { return std::get_if<Dword>(&data_); }
    const Qword* get_qword() const { return std::get_if<Qword>(&data_); }
    const Binary* get_binary() const { return std::get_if<Binary>(&data_); }

    bool operator==(const TypedValue& other) const { return data_ == other.data_; }
    bool operator!=(const TypedValue& other) const { return !(*this == other); }

    /// Человекочитаемое представление:
    /// строка как есть, числа в десятичном виде, binary как "[1, 2, 3]",
    /// "? None" и "? Unknown" для остальных
    std::string to_string() const;

    /// Конвертировать в RapidJSON Value
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;
};

}  // namespace ntreg

#endif  // NTREG_VALUE_HPP
