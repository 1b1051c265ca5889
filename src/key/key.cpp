// ==============================================================================
// key.cpp - HandleSlot и RegKey
// ==============================================================================

#include <ntreg/key.hpp>
#include <ntreg/wire.hpp>

namespace ntreg {

// ============================================================================
// HandleSlot
// ============================================================================

HandleSlot::HandleSlot(std::shared_ptr<Transport> transport, Handle handle, Access access)
    : transport_(std::move(transport)), handle_(handle), access_(access) {}

HandleSlot::~HandleSlot() {
    if (!closed_) {
        // Деструктор не может сообщить status
        close();
    }
}

std::uint32_t HandleSlot::close() {
    if (closed_) {
        return STATUS_SUCCESS;
    }
    closed_ = true;
    return transport_->close(handle_);
}

// ============================================================================
// RegKey
// ============================================================================

namespace {

RegError name_conversion_error(const char* operation, const std::string& resource) {
    RegError err = make_error(RegErrorKind::NameConversion, "Could not convert name into string");
    err.operation = operation;
    err.resource = resource;
    return err;
}

}  // anonymous namespace

RegKey::RegKey(std::shared_ptr<HandleSlot> slot, std::string path,
               std::shared_ptr<const CodeUnits> path_units)
    : slot_(std::move(slot)), path_(std::move(path)), path_units_(std::move(path_units)) {}

std::variant<RegKey, RegError> RegKey::open(std::shared_ptr<Transport> transport,
                                            std::string_view path) {
    return open_with(std::move(transport), path, Access::Read);
}

std::variant<RegKey, RegError> RegKey::open_write(std::shared_ptr<Transport> transport,
                                                  std::string_view path) {
    return open_with(std::move(transport), path, Access::ReadWrite);
}

std::variant<RegKey, RegError> RegKey::open_with(std::shared_ptr<Transport> transport,
                                                 std::string_view path, Access access) {
    if (!transport) {
        RegError err = make_error(RegErrorKind::OpenFailed,
                                  "Could not open registry key " + std::string(path) +
                                      ": no transport");
        err.operation = "open";
        err.resource = std::string(path);
        return err;
    }

    auto units = utf8_to_code_units(path);
    if (!units) {
        return name_conversion_error("open", std::string(path));
    }

    const OpenResult result = transport->open(path, access);
    if (!result) {
        return error_from_status("open", path, result.status);
    }

    units->push_back(u'\0');
    auto slot = std::make_shared<HandleSlot>(std::move(transport), result.handle, access);
    return RegKey(std::move(slot), std::string(path),
                  std::make_shared<const CodeUnits>(std::move(*units)));
}

RegKey::~RegKey() {
    if (slot_) {
        // Деструктор не может сообщить status
        slot_->close();
    }
}

RegKey& RegKey::operator=(RegKey&& other) noexcept {
    if (this != &other) {
        if (slot_) {
            slot_->close();
        }
        slot_ = std::move(other.slot_);
        path_ = std::move(other.path_);
        path_units_ = std::move(other.path_units_);
    }
    return *this;
}

Access RegKey::access() const {
    return slot_ ? slot_->access() : Access::Read;
}

bool RegKey::is_open() const {
    return slot_ && !slot_->closed();
}

KeyIterator RegKey::enum_keys() const {
    return KeyIterator(slot_, path_units_);
}

ValueIterator RegKey::enum_values() const {
    return ValueIterator(slot_);
}

std::optional<RegError> RegKey::check_open(const char* operation) const {
    if (is_open()) {
        return std::nullopt;
    }
    RegError err = make_error(RegErrorKind::HandleClosed, "Registry key " + path_ + " is closed");
    err.operation = operation;
    err.resource = path_;
    return err;
}

std::optional<RegError> RegKey::set_value(std::string_view name, std::uint32_t type,
                                          const std::vector<std::uint8_t>& payload) {
    if (auto err = check_open("set_value")) {
        return err;
    }
    auto units = utf8_to_code_units(name);
    if (!units) {
        return name_conversion_error("set_value", path_);
    }

    const auto status = slot_->transport().set_value(slot_->handle(), *units, type, payload);
    if (status != STATUS_SUCCESS) {
        return error_from_status("set_value", path_ + "\\" + std::string(name), status);
    }
    return std::nullopt;
}

std::optional<RegError> RegKey::write_dword_value(std::string_view name, std::uint32_t value) {
    std::vector<std::uint8_t> payload;
    append_u32(payload, value);
    return set_value(name, static_cast<std::uint32_t>(ValueType::Dword), payload);
}

std::optional<RegError> RegKey::write_qword_value(std::string_view name, std::uint64_t value) {
    std::vector<std::uint8_t> payload;
    append_u64(payload, value);
    return set_value(name, static_cast<std::uint32_t>(ValueType::Qword), payload);
}

std::optional<RegError> RegKey::write_string_value(std::string_view name,
                                                   std::string_view value) {
    auto units = utf8_to_code_units(value);
    if (!units) {
        RegError err = make_error(RegErrorKind::StringConversion,
                                  "Could not convert registry data to string");
        err.operation = "set_value";
        err.resource = path_ + "\\" + std::string(name);
        return err;
    }
    return set_value(name, static_cast<std::uint32_t>(ValueType::String),
                     code_units_to_bytes(*units, true));
}

std::optional<RegError> RegKey::write_binary_value(std::string_view name,
                                                   const std::vector<std::uint8_t>& value) {
    return set_value(name, static_cast<std::uint32_t>(ValueType::Binary), value);
}

std::optional<RegError> RegKey::delete_value(std::string_view name) {
    if (auto err = check_open("delete_value")) {
        return err;
    }
    auto units = utf8_to_code_units(name);
    if (!units) {
        return name_conversion_error("delete_value", path_);
    }

    const auto status = slot_->transport().delete_value(slot_->handle(), *units);
    if (status != STATUS_SUCCESS) {
        return error_from_status("delete_value", path_ + "\\" + std::string(name), status);
    }
    return std::nullopt;
}

std::optional<RegError> RegKey::delete_key() {
    if (auto err = check_open("delete_key")) {
        return err;
    }
    const auto status = slot_->transport().delete_key(slot_->handle());
    if (status != STATUS_SUCCESS) {
        return error_from_status("delete_key", path_, status);
    }
    return std::nullopt;
}

std::optional<RegError> RegKey::close() {
    if (!is_open()) {
        return std::nullopt;
    }
    const auto status = slot_->close();
    if (status != STATUS_SUCCESS) {
        return error_from_status("close", path_, status);
    }
    return std::nullopt;
}

}  // namespace ntreg
