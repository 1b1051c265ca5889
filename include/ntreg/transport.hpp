// ==============================================================================
// ntreg/transport.hpp - Внешний транспорт registry
// ==============================================================================
//
// Назначение:
// - Transport: абстракция примитивов open/enumerate/close/set/delete
// - MemoryTransport: in-memory хранилище, формирующее записи в том же
//   формате, что и NtEnumerateKey / NtEnumerateValueKey
// - load_memory_store: загрузка хранилища из YAML (yaml-cpp)
// - create_native_transport: ntdll транспорт (только Windows)
//
// Транспорт не интерпретирует записи: он возвращает сырые буферы или
// status коды. Декодирование выполняется в decode.hpp.
//
// ==============================================================================

#ifndef NTREG_TRANSPORT_HPP
#define NTREG_TRANSPORT_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <ntreg/error.hpp>
#include <ntreg/unicode.hpp>
#include <ntreg/wire.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ntreg {

/// Непрозрачный идентификатор открытого ключа
using Handle = std::uint64_t;

/// Намерение доступа при открытии
enum class Access {
    Read,      // KEY_READ
    ReadWrite  // KEY_ALL_ACCESS
};

/// Результат open
struct OpenResult {
    std::uint32_t status = STATUS_SUCCESS;
    Handle handle = 0;

    explicit operator bool() const { return status == STATUS_SUCCESS; }
};

// ----------------------------------------------------------------------------
// Transport
// ----------------------------------------------------------------------------

/// Примитивы registry, предоставляемые окружением
class Transport {
public:
    virtual ~Transport() = default;

    /// Запись KEY_BASIC_INFORMATION подключа с номером index
    /// @return nullopt при исчерпании или ошибке вызова, определяющего размер
    virtual std::optional<RawRecord> enumerate_key(Handle handle, std::uint32_t index) = 0;

    /// Запись KEY_VALUE_FULL_INFORMATION значения с номером index
    virtual std::optional<RawRecord> enumerate_value(Handle handle, std::uint32_t index) = 0;

    /// Открыть ключ по полному пути (например "\\Registry\\Machine\\Software")
    virtual OpenResult open(std::string_view path, Access access) = 0;

    virtual std::uint32_t close(Handle handle) = 0;

    virtual std::uint32_t delete_key(Handle handle) = 0;

    virtual std::uint32_t delete_value(Handle handle, std::u16string_view name) = 0;

    virtual std::uint32_t set_value(Handle handle, std::u16string_view name, std::uint32_t type,
                                    const std::vector<std::uint8_t>& payload) = 0;

protected:
    Transport() = default;
};

// ----------------------------------------------------------------------------
// MemoryTransport
// ----------------------------------------------------------------------------

/// In-memory хранилище ключей и значений
///
/// Имена сравниваются без учёта регистра (ASCII). Подключи и значения
/// перечисляются в порядке вставки. Ключ, помеченный read-only, не
/// открывается с Access::ReadWrite (STATUS_ACCESS_DENIED).
class MemoryTransport : public Transport {
public:
    MemoryTransport();
    ~MemoryTransport() override;

    MemoryTransport(const MemoryTransport&) = delete;
    MemoryTransport& operator=(const MemoryTransport&) = delete;

    // -------------------------------------------------------------------------
    // Наполнение хранилища
    // -------------------------------------------------------------------------

    /// Создать ключ (и все промежуточные ключи)
    /// @return false если путь пуст или не является валидным UTF-8
    bool create_key(std::string_view path);

    /// Записать значение в ключ, создавая ключ при необходимости
    bool put_value(std::string_view key_path, std::u16string_view name, std::uint32_t type,
                   std::vector<std::uint8_t> data);

    /// Пометить ключ как read-only
    bool set_read_only(std::string_view path, bool read_only);

    /// Проверить существование ключа
    bool key_exists(std::string_view path) const;

    // -------------------------------------------------------------------------
    // Transport
    // -------------------------------------------------------------------------

    std::optional<RawRecord> enumerate_key(Handle handle, std::uint32_t index) override;
    std::optional<RawRecord> enumerate_value(Handle handle, std::uint32_t index) override;
    OpenResult open(std::string_view path, Access access) override;
    std::uint32_t close(Handle handle) override;
    std::uint32_t delete_key(Handle handle) override;
    std::uint32_t delete_value(Handle handle, std::u16string_view name) override;
    std::uint32_t set_value(Handle handle, std::u16string_view name, std::uint32_t type,
                            const std::vector<std::uint8_t>& payload) override;

    // -------------------------------------------------------------------------
    // Диагностика
    // -------------------------------------------------------------------------

    /// Число открытых handle
    std::size_t open_handle_count() const;

    /// Сколько раз close() завершился успешно
    std::size_t close_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Загрузить MemoryTransport из YAML файла
///
/// Формат:
/// @code
///   keys:
///     - path: '\Registry\Machine\Software\Vendor'
///       read_only: false
///       values:
///         - { name: Version, type: REG_SZ, data: "1.0" }
///         - { name: Count, type: REG_DWORD, data: 1337 }
///         - { name: Blob, type: REG_BINARY, data: [1, 2, 3] }
///         - { name: Raw, type: 99, hex: "0a0b" }
/// @endcode
std::variant<std::shared_ptr<MemoryTransport>, RegError> load_memory_store(
    const std::filesystem::path& path);

/// Загрузить MemoryTransport из YAML текста
std::variant<std::shared_ptr<MemoryTransport>, RegError> load_memory_store_from_string(
    std::string_view yaml_text);

/// Создать транспорт поверх ntdll
/// @return nullptr на платформах, отличных от Windows
std::shared_ptr<Transport> create_native_transport();

}  // namespace ntreg

#endif  // NTREG_TRANSPORT_HPP
