// ==============================================================================
// ntreg/key.hpp - Открытые ключи, записи и итераторы перечисления
// ==============================================================================
//
// Назначение:
// - HandleSlot: владение handle открытого ключа (закрывается ровно один раз)
// - RegKey: открытый ключ (чтение/запись/удаление/перечисление)
// - SubkeyDescriptor: подключ, полученный при перечислении
// - ValueItem: значение, полученное при перечислении
// - KeyIterator / ValueIterator: ленивое перечисление по индексу
//
// Итераторы разделяют HandleSlot с RegKey, но handle закрывает только
// RegKey: явным close() или в деструкторе. После закрытия следующий next()
// итератора завершается с ошибкой HandleClosed.
//
// ==============================================================================

#ifndef NTREG_KEY_HPP
#define NTREG_KEY_HPP

#include <cstdint>
#include <memory>
#include <ntreg/error.hpp>
#include <ntreg/transport.hpp>
#include <ntreg/unicode.hpp>
#include <ntreg/value.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ntreg {

// ----------------------------------------------------------------------------
// HandleSlot
// ----------------------------------------------------------------------------

/// Владелец handle открытого ключа
class HandleSlot {
public:
    HandleSlot(std::shared_ptr<Transport> transport, Handle handle, Access access);
    ~HandleSlot();

    HandleSlot(const HandleSlot&) = delete;
    HandleSlot& operator=(const HandleSlot&) = delete;

    Transport& transport() const { return *transport_; }
    const std::shared_ptr<Transport>& transport_ptr() const { return transport_; }
    Handle handle() const { return handle_; }
    Access access() const { return access_; }
    bool closed() const { return closed_; }

    /// Закрыть handle; повторный вызов ничего не делает и возвращает STATUS_SUCCESS
    std::uint32_t close();

private:
    std::shared_ptr<Transport> transport_;
    Handle handle_;
    Access access_;
    bool closed_ = false;
};

class KeyIterator;
class ValueIterator;

// ----------------------------------------------------------------------------
// RegKey
// ----------------------------------------------------------------------------

/// Открытый ключ registry
class RegKey {
public:
    /// Открыть ключ на чтение
    static std::variant<RegKey, RegError> open(std::shared_ptr<Transport> transport,
                                               std::string_view path);

    /// Открыть ключ на чтение и запись
    static std::variant<RegKey, RegError> open_write(std::shared_ptr<Transport> transport,
                                                     std::string_view path);

    ~RegKey();

    RegKey(RegKey&&) noexcept = default;
    RegKey& operator=(RegKey&& other) noexcept;
    RegKey(const RegKey&) = delete;
    RegKey& operator=(const RegKey&) = delete;

    /// Путь ключа в UTF-8
    const std::string& path() const { return path_; }

    /// Путь ключа в code units (с завершающим NUL)
    const CodeUnits& path_units() const { return *path_units_; }

    Access access() const;
    bool is_open() const;

    // -------------------------------------------------------------------------
    // Перечисление
    // -------------------------------------------------------------------------

    KeyIterator enum_keys() const;
    ValueIterator enum_values() const;

    // -------------------------------------------------------------------------
    // Запись (требует open_write)
    // -------------------------------------------------------------------------

    std::optional<RegError> write_dword_value(std::string_view name, std::uint32_t value);
    std::optional<RegError> write_qword_value(std::string_view name, std::uint64_t value);

    /// REG_SZ: UTF-16 payload с завершающим NUL
    std::optional<RegError> write_string_value(std::string_view name, std::string_view value);

    std::optional<RegError> write_binary_value(std::string_view name,
                                               const std::vector<std::uint8_t>& value);

    /// Записать payload с произвольным тегом типа
    std::optional<RegError> set_value(std::string_view name, std::uint32_t type,
                                      const std::vector<std::uint8_t>& payload);

    std::optional<RegError> delete_value(std::string_view name);

    /// Удалить сам ключ (ключ должен быть без подключей)
    std::optional<RegError> delete_key();

    /// Закрыть handle немедленно
    std::optional<RegError> close();

private:
    RegKey(std::shared_ptr<HandleSlot> slot, std::string path,
           std::shared_ptr<const CodeUnits> path_units);

    static std::variant<RegKey, RegError> open_with(std::shared_ptr<Transport> transport,
                                                    std::string_view path, Access access);

    std::optional<RegError> check_open(const char* operation) const;

    std::shared_ptr<HandleSlot> slot_;
    std::string path_;
    std::shared_ptr<const CodeUnits> path_units_;
};

// ----------------------------------------------------------------------------
// SubkeyDescriptor
// ----------------------------------------------------------------------------

/// Подключ, полученный при перечислении
///
/// Хранит разделяемую ссылку на путь родителя, поэтому остаётся валидным
/// после уничтожения родительского RegKey.
class SubkeyDescriptor {
public:
    SubkeyDescriptor() = default;

    /// Имя подключа в UTF-8
    const std::string& name() const { return name_; }

    /// Имя подключа в code units
    const CodeUnits& name_units() const { return name_units_; }

    /// LastWriteTime (FILETIME)
    std::uint64_t last_write_time() const { return last_write_time_; }

    /// Путь родителя + '\' + имя
    std::variant<std::string, RegError> full_path() const;

    std::variant<RegKey, RegError> open() const;
    std::variant<RegKey, RegError> open_write() const;

    /// Имя подключа
    std::string to_string() const { return name_; }

private:
    friend class KeyIterator;

    std::variant<RegKey, RegError> open_with(Access access) const;

    std::string name_;
    CodeUnits name_units_;
    std::uint64_t last_write_time_ = 0;
    std::shared_ptr<const CodeUnits> parent_path_;
    std::shared_ptr<Transport> transport_;
};

// ----------------------------------------------------------------------------
// ValueItem
// ----------------------------------------------------------------------------

/// Значение, полученное при перечислении
class ValueItem {
public:
    ValueItem() = default;

    /// Имя значения в UTF-8 (конверсия выполняется при каждом вызове)
    std::variant<std::string, RegError> name() const;

    const CodeUnits& name_units() const { return name_units_; }
    const TypedValue& value() const { return value_; }
    std::uint32_t type_tag() const { return type_tag_; }
    ValueType type() const { return value_type_from_u32(type_tag_); }

    /// Имя значения (пустая строка, если имя не конвертируется)
    std::string to_string() const;

private:
    friend class ValueIterator;

    CodeUnits name_units_;
    TypedValue value_;
    std::uint32_t type_tag_ = 0;
};

// ----------------------------------------------------------------------------
// Итераторы
// ----------------------------------------------------------------------------

/// Ленивое перечисление подключей
///
/// Пример:
/// @code
///   auto it = key.enum_keys();
///   SubkeyDescriptor sub;
///   while (it.next(sub)) { ... }
///   if (it.last_error()) { ... }
/// @endcode
class KeyIterator {
public:
    /// Получить следующий подключ
    /// @return false при исчерпании или ошибке (см. last_error())
    bool next(SubkeyDescriptor& out);

    /// Перечисление завершено (повторные next() возвращают false)
    bool exhausted() const { return exhausted_; }

    /// Индекс следующего запроса
    std::uint32_t index() const { return index_; }

    /// Ошибка, завершившая перечисление
    const std::optional<RegError>& last_error() const { return last_error_; }

private:
    friend class RegKey;

    KeyIterator(std::shared_ptr<const HandleSlot> slot, std::shared_ptr<const CodeUnits> parent);

    bool fail(RegError error);

    std::shared_ptr<const HandleSlot> slot_;
    std::shared_ptr<const CodeUnits> parent_path_;
    std::uint32_t index_ = 0;
    bool exhausted_ = false;
    std::optional<RegError> last_error_;
};

/// Ленивое перечисление значений
class ValueIterator {
public:
    bool next(ValueItem& out);

    bool exhausted() const { return exhausted_; }
    std::uint32_t index() const { return index_; }
    const std::optional<RegError>& last_error() const { return last_error_; }

private:
    friend class RegKey;

    explicit ValueIterator(std::shared_ptr<const HandleSlot> slot);

    bool fail(RegError error);

    std::shared_ptr<const HandleSlot> slot_;
    std::uint32_t index_ = 0;
    bool exhausted_ = false;
    std::optional<RegError> last_error_;
};

}  // namespace ntreg

#endif  // NTREG_KEY_HPP
