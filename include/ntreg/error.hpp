// ==============================================================================
// ntreg/error.hpp - Таксономия ошибок ntreg
// ==============================================================================
//
// Назначение:
// - Единый тип ошибки RegError для транспорта, декодирования и конверсии текста
// - Отображение NT status кодов на виды ошибок
// - Ни одна операция библиотеки не бросает исключения наружу: ошибки
//   возвращаются через std::variant<T, RegError> или std::optional<RegError>
//
// ==============================================================================

#ifndef NTREG_ERROR_HPP
#define NTREG_ERROR_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace ntreg {

// ----------------------------------------------------------------------------
// NT status коды, которые различает библиотека
// ----------------------------------------------------------------------------

constexpr std::uint32_t STATUS_SUCCESS = 0x00000000;
constexpr std::uint32_t STATUS_BUFFER_OVERFLOW = 0x80000005;
constexpr std::uint32_t STATUS_NO_MORE_ENTRIES = 0x8000001A;
constexpr std::uint32_t STATUS_INVALID_HANDLE = 0xC0000008;
constexpr std::uint32_t STATUS_INVALID_PARAMETER = 0xC000000D;
constexpr std::uint32_t STATUS_BUFFER_TOO_SMALL = 0xC0000023;
constexpr std::uint32_t STATUS_ACCESS_DENIED = 0xC0000022;
constexpr std::uint32_t STATUS_OBJECT_NAME_INVALID = 0xC0000033;
constexpr std::uint32_t STATUS_OBJECT_NAME_NOT_FOUND = 0xC0000034;
constexpr std::uint32_t STATUS_INSUFFICIENT_RESOURCES = 0xC000009A;
constexpr std::uint32_t STATUS_KEY_DELETED = 0xC000017C;
constexpr std::uint32_t STATUS_CANNOT_DELETE = 0xC0000121;

// ----------------------------------------------------------------------------
// RegErrorKind
// ----------------------------------------------------------------------------

/// Виды ошибок
enum class RegErrorKind {
    // Транспорт
    OpenFailed,             // Не удалось открыть ключ
    AccessDenied,           // STATUS_ACCESS_DENIED
    InvalidHandle,          // STATUS_INVALID_HANDLE
    InsufficientResources,  // STATUS_INSUFFICIENT_RESOURCES
    NameNotFound,           // STATUS_OBJECT_NAME_NOT_FOUND
    HandleClosed,           // Handle уже закрыт владельцем
    TransportFailure,       // Прочий ненулевой status

    // Декодирование
    TruncatedHeader,  // Буфер короче фиксированного заголовка
    HeaderReadError,  // Буфер закончился посреди поля
    LengthMismatch,   // data_offset + data_length за пределами буфера
    DwordConversion,  // Payload короче 4 байт
    QwordConversion,  // Payload короче 8 байт
    SmallNameBlob,    // Имя не помещается в буфер

    // Конверсия текста
    NameConversion,   // Имя не является валидным текстом
    StringConversion  // Строковое значение не является валидным текстом
};

/// Преобразовать RegErrorKind в строку
const char* reg_error_kind_to_string(RegErrorKind kind);

// ----------------------------------------------------------------------------
// RegError
// ----------------------------------------------------------------------------

/// Ошибка операции с registry
struct RegError {
    RegErrorKind kind = RegErrorKind::TransportFailure;

    /// Человекочитаемое сообщение
    std::string message;

    /// Имя операции (open, enumerate_key, set_value, ...)
    std::string operation;

    /// Имя ресурса (путь ключа или имя значения), если применимо
    std::string resource;

    /// Исходный status код транспорта (0 для ошибок декодирования)
    std::uint32_t status = STATUS_SUCCESS;

    /// Форматировать ошибку
    std::string format() const;

    /// Ошибка транспорта (ненулевой status)?
    bool is_transport() const;

    /// Ошибка разбора буфера?
    bool is_decode() const;

    /// Ошибка конверсии текста?
    bool is_text() const;
};

/// Создать ошибку декодирования / конверсии без status кода
RegError make_error(RegErrorKind kind, std::string message);

/// Отобразить ненулевой status код на RegError
///
/// @param operation Имя операции ("open", "delete_key", ...)
/// @param resource Путь ключа или имя значения
/// @param status Status код, полученный от транспорта
RegError error_from_status(std::string_view operation, std::string_view resource,
                           std::uint32_t status);

/// Форматировать status как "0x%08x"
std::string format_status(std::uint32_t status);

}  // namespace ntreg

#endif  // NTREG_ERROR_HPP
