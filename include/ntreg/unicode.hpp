// ==============================================================================
// ntreg/unicode.hpp - Последовательности UTF-16 code units и конверсия в UTF-8
// ==============================================================================
//
// Назначение:
// - CodeUnits: сырые 16-битные code units в native порядке, без потерь
//   (встроенные NUL сохраняются)
// - Строгая конверсия code units -> UTF-8: одиночный surrogate является
//   ошибкой, а не заменяется
// - NUL code units отбрасываются только на границе конверсии в текст
//
// ==============================================================================

#ifndef NTREG_UNICODE_HPP
#define NTREG_UNICODE_HPP

#include <cstdint>
#include <ntreg/error.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ntreg {

/// Последовательность UTF-16 code units
using CodeUnits = std::u16string;

/// Конвертировать UTF-8 в code units (без завершающего NUL)
/// @return nullopt если вход не является валидным UTF-8
std::optional<CodeUnits> utf8_to_code_units(std::string_view text);

/// Конвертировать code units в UTF-8
///
/// NUL code units (терминаторы и встроенные) отбрасываются.
/// @param units Исходные code units
/// @param kind Вид ошибки для невалидной последовательности
///             (NameConversion или StringConversion)
std::variant<std::string, RegError> code_units_to_utf8(
    std::u16string_view units, RegErrorKind kind = RegErrorKind::NameConversion);

/// Удалить все NUL code units
CodeUnits strip_terminators(std::u16string_view units);

/// Упаковать code units в байты (native порядок), опционально с NUL в конце
std::vector<std::uint8_t> code_units_to_bytes(std::u16string_view units, bool terminate);

}  // namespace ntreg

#endif  // NTREG_UNICODE_HPP
