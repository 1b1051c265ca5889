// ==============================================================================
// wire.cpp - Декодеры фиксированных заголовков записей
// ==============================================================================

#include <cstring>
#include <ntreg/wire.hpp>
#include <string>

namespace ntreg {

namespace {

template <typename T>
void append_scalar(RawRecord& out, T value) {
    std::uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

RegError header_read_error(const char* header, const char* field) {
    return make_error(RegErrorKind::HeaderReadError,
                      std::string("Could not read ") + header + ": buffer ends inside '" + field +
                          "'");
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// ByteCursor
// ----------------------------------------------------------------------------

std::optional<std::uint32_t> ByteCursor::read_u32() {
    if (remaining() < sizeof(std::uint32_t)) {
        return std::nullopt;
    }
    std::uint32_t v = 0;
    std::memcpy(&v, data_ + pos_, sizeof(v));
    pos_ += sizeof(v);
    return v;
}

std::optional<std::uint64_t> ByteCursor::read_u64() {
    if (remaining() < sizeof(std::uint64_t)) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    std::memcpy(&v, data_ + pos_, sizeof(v));
    pos_ += sizeof(v);
    return v;
}

bool ByteCursor::skip(std::size_t n) {
    if (remaining() < n) {
        return false;
    }
    pos_ += n;
    return true;
}

// ----------------------------------------------------------------------------
// KEY_BASIC_INFORMATION
// ----------------------------------------------------------------------------

std::variant<KeyBasicHeader, RegError> read_key_basic_header(ByteCursor& cursor) {
    KeyBasicHeader header;

    auto last_write = cursor.read_u64();
    if (!last_write) {
        return header_read_error("key basic information", "last_write_time");
    }
    header.last_write_time = *last_write;

    auto title_index = cursor.read_u32();
    if (!title_index) {
        return header_read_error("key basic information", "title_index");
    }
    header.title_index = *title_index;

    auto name_length = cursor.read_u32();
    if (!name_length) {
        return header_read_error("key basic information", "name_length");
    }
    header.name_length = *name_length;

    return header;
}

std::variant<KeyBasicHeader, RegError> decode_key_basic_header(const std::uint8_t* data,
                                                               std::size_t size) {
    if (data == nullptr || size < KEY_BASIC_HEADER_SIZE) {
        return make_error(RegErrorKind::TruncatedHeader,
                          "Could not read key basic information: buffer of " +
                              std::to_string(size) + " bytes is shorter than header");
    }

    ByteCursor cursor(data, size);
    return read_key_basic_header(cursor);
}

std::variant<KeyBasicHeader, RegError> decode_key_basic_header(const RawRecord& record) {
    return decode_key_basic_header(record.data(), record.size());
}

// ----------------------------------------------------------------------------
// KEY_VALUE_FULL_INFORMATION
// ----------------------------------------------------------------------------

std::variant<ValueFullHeader, RegError> read_value_full_header(ByteCursor& cursor) {
    ValueFullHeader header;

    struct Field {
        const char* name;
        std::uint32_t* target;
    };
    const Field fields[] = {{"title_index", &header.title_index},
                            {"value_type", &header.value_type},
                            {"data_offset", &header.data_offset},
                            {"data_length", &header.data_length},
                            {"name_length", &header.name_length}};

    for (const auto& field : fields) {
        auto v = cursor.read_u32();
        if (!v) {
            return header_read_error("key value full information", field.name);
        }
        *field.target = *v;
    }

    return header;
}

std::variant<ValueFullHeader, RegError> decode_value_full_header(const std::uint8_t* data,
                                                                 std::size_t size) {
    if (data == nullptr || size < VALUE_FULL_HEADER_SIZE) {
        return make_error(RegErrorKind::TruncatedHeader,
                          "Could not read key value full information: buffer of " +
                              std::to_string(size) + " bytes is shorter than header");
    }

    ByteCursor cursor(data, size);
    return read_value_full_header(cursor);
}

std::variant<ValueFullHeader, RegError> decode_value_full_header(const RawRecord& record) {
    return decode_value_full_header(record.data(), record.size());
}

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

void append_u32(RawRecord& out, std::uint32_t value) {
    append_scalar(out, value);
}

void append_u64(RawRecord& out, std::uint64_t value) {
    append_scalar(out, value);
}

void encode_key_basic_header(const KeyBasicHeader& header, RawRecord& out) {
    append_scalar(out, header.last_write_time);
    append_scalar(out, header.title_index);
    append_scalar(out, header.name_length);
}

void encode_value_full_header(const ValueFullHeader& header, RawRecord& out) {
    append_scalar(out, header.title_index);
    append_scalar(out, header.value_type);
    append_scalar(out, header.data_offset);
    append_scalar(out, header.data_length);
    append_scalar(out, header.name_length);
}

}  // namespace ntreg
