// ==============================================================================
// value.cpp - ValueType и TypedValue
// ==============================================================================

#include <cctype>
#include <ntreg/value.hpp>
#include <rapidjson/document.h>

namespace ntreg {

// ============================================================================
// ValueType
// ============================================================================

namespace {

struct TypeName {
    ValueType type;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {ValueType::None, "REG_NONE"},
    {ValueType::String, "REG_SZ"},
    {ValueType::ExpandString, "REG_EXPAND_SZ"},
    {ValueType::Binary, "REG_BINARY"},
    {ValueType::Dword, "REG_DWORD"},
    {ValueType::DwordBigEndian, "REG_DWORD_BIG_ENDIAN"},
    {ValueType::Link, "REG_LINK"},
    {ValueType::MultiString, "REG_MULTI_SZ"},
    {ValueType::ResourceList, "REG_RESOURCE_LIST"},
    {ValueType::FullResourceDescriptor, "REG_FULL_RESOURCE_DESCRIPTOR"},
    {ValueType::ResourceRequirementsList, "REG_RESOURCE_REQUIREMENTS_LIST"},
    {ValueType::Qword, "REG_QWORD"},
};

}  // anonymous namespace

ValueType value_type_from_u32(std::uint32_t tag) {
    if (tag <= static_cast<std::uint32_t>(ValueType::Qword)) {
        return static_cast<ValueType>(tag);
    }
    return ValueType::Unknown;
}

const char* value_type_to_string(ValueType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "REG_UNKNOWN";
}

std::optional<std::uint32_t> value_type_tag_from_string(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    // Десятичный тег
    bool all_digits = true;
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        if (name.size() > 10) {
            return std::nullopt;
        }
        std::uint64_t v = 0;
        for (char c : name) {
            v = v * 10 + static_cast<std::uint64_t>(c - '0');
        }
        if (v > 0xFFFFFFFFULL) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(v);
    }

    for (const auto& entry : TYPE_NAMES) {
        if (name == entry.name) {
            return static_cast<std::uint32_t>(entry.type);
        }
    }
    return std::nullopt;
}

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // anonymous namespace

std::optional<std::vector<std::uint8_t>> parse_hex_bytes(std::string_view text) {
    std::vector<std::uint8_t> bytes;
    int high = -1;
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            continue;
        }
        const int digit = hex_digit(c);
        if (digit < 0) {
            return std::nullopt;
        }
        if (high < 0) {
            high = digit;
        } else {
            bytes.push_back(static_cast<std::uint8_t>((high << 4) | digit));
            high = -1;
        }
    }
    if (high >= 0) {
        return std::nullopt;
    }
    return bytes;
}

// ============================================================================
// TypedValue
// ============================================================================

std::string TypedValue::to_string() const {
    if (const auto* s = get_string()) {
        return *s;
    }
    if (const auto* d = get_dword()) {
        return std::to_string(*d);
    }
    if (const auto* q = get_qword()) {
        return std::to_string(*q);
    }
    if (const auto* b = get_binary()) {
        std::string result = "[";
        for (std::size_t i = 0; i < b->size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += std::to_string(static_cast<unsigned>((*b)[i]));
        }
        result += "]";
        return result;
    }
    if (is_unknown()) {
        return "? Unknown";
    }
    return "? None";
}

void TypedValue::to_rapidjson(rapidjson::Value& out,
                              rapidjson::Document::AllocatorType& alloc) const {
    if (const auto* s = get_string()) {
        out.SetString(s->c_str(), static_cast<rapidjson::SizeType>(s->size()), alloc);
        return;
    }
    if (const auto* d = get_dword()) {
        out.SetUint(*d);
        return;
    }
    if (const auto* q = get_qword()) {
        out.SetUint64(*q);
        return;
    }
    if (const auto* b = get_binary()) {
        out.SetArray();
        out.Reserve(static_cast<rapidjson::SizeType>(b->size()), alloc);
        for (std::uint8_t byte : *b) {
            out.PushBack(rapidjson::Value(static_cast<unsigned>(byte)), alloc);
        }
        return;
    }
    // None и Unknown
    out.SetNull();
}

}  // namespace ntreg
