// ==============================================================================
// ntreg/decode.hpp - Декодирование имён и payload значений
// ==============================================================================
//
// Назначение:
// - decode_name: выделение имени (offset + число code units) из записи
// - decode_value: интерпретация payload по тегу типа
// - decode_subkey_record / decode_value_record: полный разбор одной записи
//   перечисления (заголовок + имя + значение)
//
// Все срезы буфера проверяются на границы до чтения; ошибка декодирования
// возвращается вызывающему, а не заменяется значением по умолчанию (кроме
// пустой строки для REG_SZ нулевой длины и Unknown для неизвестного тега).
//
// ==============================================================================

#ifndef NTREG_DECODE_HPP
#define NTREG_DECODE_HPP

#include <cstddef>
#include <cstdint>
#include <ntreg/error.hpp>
#include <ntreg/unicode.hpp>
#include <ntreg/value.hpp>
#include <ntreg/wire.hpp>
#include <variant>

namespace ntreg {

/// Выделить имя из записи
///
/// Берёт code_unit_count * 2 байт начиная с byte_offset. Если байт меньше,
/// возвращает пустую последовательность. NUL code units сохраняются.
CodeUnits decode_name(const RawRecord& raw, std::size_t byte_offset,
                      std::uint32_t code_unit_count);

/// Декодировать payload значения по тегу header.value_type
///
/// - REG_NONE -> None (всегда)
/// - REG_SZ / REG_EXPAND_SZ -> String ("" при data_length == 0)
/// - REG_DWORD / REG_DWORD_BIG_ENDIAN -> Dword (>= 4 байт, иначе DwordConversion)
/// - REG_QWORD -> Qword (>= 8 байт, иначе QwordConversion)
/// - REG_BINARY -> Binary (копия payload, допускается пустой)
/// - остальные -> Unknown (всегда)
///
/// data_offset + data_length за пределами raw -> LengthMismatch.
std::variant<TypedValue, RegError> decode_value(const ValueFullHeader& header,
                                                const RawRecord& raw);

// ----------------------------------------------------------------------------
// Разбор целой записи
// ----------------------------------------------------------------------------

/// Разобранная запись подключа
struct SubkeyRecord {
    KeyBasicHeader header;
    CodeUnits name;
};

/// Разобранная запись значения
struct ValueRecord {
    ValueFullHeader header;
    CodeUnits name;
    TypedValue value;
};

/// Разобрать запись KEY_BASIC_INFORMATION (заголовок + имя)
std::variant<SubkeyRecord, RegError> decode_subkey_record(const RawRecord& raw);

/// Разобрать запись KEY_VALUE_FULL_INFORMATION (заголовок + имя + значение)
///
/// Имя, не помещающееся в буфер, даёт SmallNameBlob.
std::variant<ValueRecord, RegError> decode_value_record(const RawRecord& raw);

}  // namespace ntreg

#endif  // NTREG_DECODE_HPP
