// ==============================================================================
// ntreg/wire.hpp - Декодеры фиксированных заголовков записей
// ==============================================================================
//
// Назначение:
// - RawRecord: буфер, возвращённый одним вызовом перечисления
// - ByteCursor: последовательное чтение скаляров с проверкой границ
// - KeyBasicHeader / ValueFullHeader: фиксированные заголовки записей
//   KEY_BASIC_INFORMATION и KEY_VALUE_FULL_INFORMATION
//
// Структуры никогда не накладываются на байты буфера: каждое поле читается
// отдельно, через memcpy, в native порядке байт.
//
// Формат KEY_BASIC_INFORMATION (16 байт + имя):
//   0x00  last_write_time  8 байт (не интерпретируется)
//   0x08  title_index      u32
//   0x0C  name_length      u32 (в байтах)
//   0x10  name             name_length байт UTF-16
//
// Формат KEY_VALUE_FULL_INFORMATION (20 байт + имя + данные):
//   0x00  title_index      u32
//   0x04  value_type       u32
//   0x08  data_offset      u32 (от начала записи)
//   0x0C  data_length      u32
//   0x10  name_length      u32 (в байтах)
//   0x14  name             name_length байт UTF-16
//   data_offset            data_length байт payload
//
// ==============================================================================

#ifndef NTREG_WIRE_HPP
#define NTREG_WIRE_HPP

#include <cstddef>
#include <cstdint>
#include <ntreg/error.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace ntreg {

/// Буфер одной записи перечисления
using RawRecord = std::vector<std::uint8_t>;

/// Размер фиксированной части KEY_BASIC_INFORMATION
constexpr std::size_t KEY_BASIC_HEADER_SIZE = 16;

/// Размер фиксированной части KEY_VALUE_FULL_INFORMATION
constexpr std::size_t VALUE_FULL_HEADER_SIZE = 20;

// ----------------------------------------------------------------------------
// ByteCursor
// ----------------------------------------------------------------------------

/// Последовательный reader поверх байтового буфера
///
/// Каждое чтение проверяет оставшуюся длину; при нехватке байт возвращает
/// nullopt и не сдвигает позицию.
class ByteCursor {
public:
    ByteCursor(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    explicit ByteCursor(const RawRecord& record) : data_(record.data()), size_(record.size()) {}

    /// Прочитать u32 в native порядке
    std::optional<std::uint32_t> read_u32();

    /// Прочитать u64 в native порядке
    std::optional<std::uint64_t> read_u64();

    /// Пропустить n байт
    bool skip(std::size_t n);

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return size_ - pos_; }

private:
    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t pos_ = 0;
};

// ----------------------------------------------------------------------------
// Заголовки
// ----------------------------------------------------------------------------

/// Фиксированная часть KEY_BASIC_INFORMATION
struct KeyBasicHeader {
    std::uint64_t last_write_time = 0;
    std::uint32_t title_index = 0;
    std::uint32_t name_length = 0;  // в байтах
};

/// Фиксированная часть KEY_VALUE_FULL_INFORMATION
struct ValueFullHeader {
    std::uint32_t title_index = 0;
    std::uint32_t value_type = 0;
    std::uint32_t data_offset = 0;  // от начала записи
    std::uint32_t data_length = 0;
    std::uint32_t name_length = 0;  // в байтах
};

/// Разобрать заголовок записи подключа
///
/// @return TruncatedHeader если буфер короче KEY_BASIC_HEADER_SIZE
std::variant<KeyBasicHeader, RegError> decode_key_basic_header(const std::uint8_t* data,
                                                               std::size_t size);

std::variant<KeyBasicHeader, RegError> decode_key_basic_header(const RawRecord& record);

/// Разобрать заголовок записи значения
std::variant<ValueFullHeader, RegError> decode_value_full_header(const std::uint8_t* data,
                                                                 std::size_t size);

std::variant<ValueFullHeader, RegError> decode_value_full_header(const RawRecord& record);

/// Прочитать заголовок подключа с текущей позиции курсора
///
/// Длина не проверяется заранее: если курсор закончился посреди поля,
/// возвращается HeaderReadError с именем поля.
std::variant<KeyBasicHeader, RegError> read_key_basic_header(ByteCursor& cursor);

/// Прочитать заголовок значения с текущей позиции курсора
std::variant<ValueFullHeader, RegError> read_value_full_header(ByteCursor& cursor);

/// Дописать скаляр в native порядке байт (в том же порядке его читает decode_value)
void append_u32(RawRecord& out, std::uint32_t value);
void append_u64(RawRecord& out, std::uint64_t value);

/// Сериализовать заголовок подключа (для транспортов, формирующих записи)
void encode_key_basic_header(const KeyBasicHeader& header, RawRecord& out);

/// Сериализовать заголовок значения
void encode_value_full_header(const ValueFullHeader& header, RawRecord& out);

}  // namespace ntreg

#endif  // NTREG_WIRE_HPP
