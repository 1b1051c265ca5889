// ==============================================================================
// decode.cpp - Декодирование имён и payload значений
// ==============================================================================

#include <cstring>
#include <ntreg/decode.hpp>
#include <string>

namespace ntreg {

namespace {

/// Проверенный срез payload
struct Payload {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
};

/// Проверить data_offset/data_length против длины буфера
std::variant<Payload, RegError> slice_payload(const ValueFullHeader& header,
                                              const RawRecord& raw) {
    auto offset = static_cast<std::uint64_t>(header.data_offset);
    auto length = static_cast<std::uint64_t>(header.data_length);
    if (offset + length > raw.size()) {
        return make_error(RegErrorKind::LengthMismatch,
                          "Data blob is too small: offset " + std::to_string(offset) +
                              " + length " + std::to_string(length) + " exceeds record of " +
                              std::to_string(raw.size()) + " bytes");
    }
    Payload payload;
    payload.data = raw.data() + header.data_offset;
    payload.size = header.data_length;
    return payload;
}

std::variant<TypedValue, RegError> decode_string(const Payload& payload) {
    CodeUnits units;
    units.reserve(payload.size / 2);
    // Нечётный хвостовой байт не образует code unit и отбрасывается
    for (std::size_t i = 0; i + 1 < payload.size; i += 2) {
        char16_t unit = 0;
        std::memcpy(&unit, payload.data + i, sizeof(unit));
        if (unit != 0) {
            units.push_back(unit);
        }
    }

    auto text = code_units_to_utf8(units, RegErrorKind::StringConversion);
    if (auto* err = std::get_if<RegError>(&text)) {
        return std::move(*err);
    }
    return TypedValue::make_string(std::move(std::get<std::string>(text)));
}

std::variant<TypedValue, RegError> decode_dword(const Payload& payload, bool big_endian) {
    if (payload.size < sizeof(std::uint32_t)) {
        return make_error(RegErrorKind::DwordConversion,
                          "Could not convert registry data to DWORD: " +
                              std::to_string(payload.size) + " bytes");
    }
    std::uint32_t v = 0;
    if (big_endian) {
        v = (static_cast<std::uint32_t>(payload.data[0]) << 24) |
            (static_cast<std::uint32_t>(payload.data[1]) << 16) |
            (static_cast<std::uint32_t>(payload.data[2]) << 8) |
            static_cast<std::uint32_t>(payload.data[3]);
    } else {
        std::memcpy(&v, payload.data, sizeof(v));
    }
    return TypedValue::make_dword(v);
}

std::variant<TypedValue, RegError> decode_qword(const Payload& payload) {
    if (payload.size < sizeof(std::uint64_t)) {
        return make_error(RegErrorKind::QwordConversion,
                          "Could not convert registry data to QWORD: " +
                              std::to_string(payload.size) + " bytes");
    }
    std::uint64_t v = 0;
    std::memcpy(&v, payload.data, sizeof(v));
    return TypedValue::make_qword(v);
}

}  // anonymous namespace

// ============================================================================
// decode_name
// ============================================================================

CodeUnits decode_name(const RawRecord& raw, std::size_t byte_offset,
                      std::uint32_t code_unit_count) {
    const std::size_t byte_count = static_cast<std::size_t>(code_unit_count) * 2;
    if (byte_offset > raw.size() || raw.size() - byte_offset < byte_count) {
        return {};
    }

    CodeUnits name(code_unit_count, u'\0');
    if (byte_count > 0) {
        std::memcpy(name.data(), raw.data() + byte_offset, byte_count);
    }
    return name;
}

// ============================================================================
// decode_value
// ============================================================================

std::variant<TypedValue, RegError> decode_value(const ValueFullHeader& header,
                                                const RawRecord& raw) {
    const ValueType type = value_type_from_u32(header.value_type);

    switch (type) {
    case ValueType::None:
        return TypedValue::make_none();

    case ValueType::String:
    case ValueType::ExpandString: {
        if (header.data_length == 0) {
            return TypedValue::make_string({});
        }
        auto slice = slice_payload(header, raw);
        if (auto* err = std::get_if<RegError>(&slice)) {
            return std::move(*err);
        }
        return decode_string(std::get<Payload>(slice));
    }

    case ValueType::Dword:
    case ValueType::DwordBigEndian: {
        auto slice = slice_payload(header, raw);
        if (auto* err = std::get_if<RegError>(&slice)) {
            return std::move(*err);
        }
        return decode_dword(std::get<Payload>(slice), type == ValueType::DwordBigEndian);
    }

    case ValueType::Qword: {
        auto slice = slice_payload(header, raw);
        if (auto* err = std::get_if<RegError>(&slice)) {
            return std::move(*err);
        }
        return decode_qword(std::get<Payload>(slice));
    }

    case ValueType::Binary: {
        auto slice = slice_payload(header, raw);
        if (auto* err = std::get_if<RegError>(&slice)) {
            return std::move(*err);
        }
        const auto& payload = std::get<Payload>(slice);
        return TypedValue::make_binary(
            std::vector<std::uint8_t>(payload.data, payload.data + payload.size));
    }

    default:
        // REG_LINK, REG_MULTI_SZ, resource lists и нераспознанные теги
        return TypedValue::make_unknown();
    }
}

// ============================================================================
// Разбор записей
// ============================================================================

std::variant<SubkeyRecord, RegError> decode_subkey_record(const RawRecord& raw) {
    auto header = decode_key_basic_header(raw);
    if (auto* err = std::get_if<RegError>(&header)) {
        return std::move(*err);
    }

    SubkeyRecord record;
    record.header = std::get<KeyBasicHeader>(header);
    record.name = decode_name(raw, KEY_BASIC_HEADER_SIZE, record.header.name_length / 2);
    return record;
}

std::variant<ValueRecord, RegError> decode_value_record(const RawRecord& raw) {
    auto header = decode_value_full_header(raw);
    if (auto* err = std::get_if<RegError>(&header)) {
        return std::move(*err);
    }

    ValueRecord record;
    record.header = std::get<ValueFullHeader>(header);

    const std::uint32_t unit_count = record.header.name_length / 2;
    if (raw.size() - VALUE_FULL_HEADER_SIZE < static_cast<std::size_t>(unit_count) * 2) {
        return make_error(RegErrorKind::SmallNameBlob,
                          "Name blob is too small: " + std::to_string(record.header.name_length) +
                              " bytes declared, " +
                              std::to_string(raw.size() - VALUE_FULL_HEADER_SIZE) + " available");
    }
    record.name = decode_name(raw, VALUE_FULL_HEADER_SIZE, unit_count);

    auto value = decode_value(record.header, raw);
    if (auto* err = std::get_if<RegError>(&value)) {
        return std::move(*err);
    }
    record.value = std::move(std::get<TypedValue>(value));
    return record;
}

}  // namespace ntreg
