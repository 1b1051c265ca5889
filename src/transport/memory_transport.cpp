// ==============================================================================
// memory_transport.cpp - In-memory хранилище registry
// ==============================================================================
//
// Записи перечисления формируются так же, как их возвращает ядро:
// KEY_BASIC_INFORMATION = заголовок (16 байт) + имя,
// KEY_VALUE_FULL_INFORMATION = заголовок (20 байт) + имя + данные,
// data_offset указывает сразу за имя.
//
// ==============================================================================

#include <algorithm>
#include <chrono>
#include <ntreg/transport.hpp>
#include <unordered_map>

namespace ntreg {

namespace {

char16_t fold_ascii(char16_t c) {
    if (c >= u'A' && c <= u'Z') {
        return static_cast<char16_t>(c - u'A' + u'a');
    }
    return c;
}

bool names_equal(std::u16string_view a, std::u16string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (fold_ascii(a[i]) != fold_ascii(b[i])) {
            return false;
        }
    }
    return true;
}

/// Разбить путь на компоненты по '\', пустые компоненты пропускаются
std::optional<std::vector<CodeUnits>> split_path(std::string_view path) {
    auto units = utf8_to_code_units(path);
    if (!units) {
        return std::nullopt;
    }

    std::vector<CodeUnits> parts;
    CodeUnits current;
    for (char16_t c : *units) {
        if (c == u'\\') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

/// FILETIME: 100-нс интервалы с 1601-01-01
std::uint64_t filetime_now() {
    constexpr std::uint64_t EPOCH_DIFFERENCE = 116444736000000000ULL;
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ticks = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count() * 10;
    return EPOCH_DIFFERENCE + static_cast<std::uint64_t>(ticks);
}

void append_units(RawRecord& out, std::u16string_view units) {
    auto bytes = code_units_to_bytes(units, false);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // anonymous namespace

// ============================================================================
// Impl
// ============================================================================

struct MemoryTransport::Impl {
    struct StoredValue {
        CodeUnits name;
        std::uint32_t type = 0;
        std::vector<std::uint8_t> data;
    };

    struct Node {
        CodeUnits name;
        std::uint64_t last_write_time = 0;
        bool read_only = false;
        bool deleted = false;
        Node* parent = nullptr;
        std::vector<std::shared_ptr<Node>> subkeys;
        std::vector<StoredValue> values;

        std::shared_ptr<Node> find_child(std::u16string_view child) const {
            for (const auto& sub : subkeys) {
                if (names_equal(sub->name, child)) {
                    return sub;
                }
            }
            return nullptr;
        }

        StoredValue* find_value(std::u16string_view value_name) {
            for (auto& v : values) {
                if (names_equal(v.name, value_name)) {
                    return &v;
                }
            }
            return nullptr;
        }
    };

    struct OpenKey {
        std::shared_ptr<Node> node;
        Access access = Access::Read;
    };

    std::shared_ptr<Node> root = std::make_shared<Node>();
    std::unordered_map<Handle, OpenKey> handles;
    Handle next_handle = 0x100;
    std::size_t closes = 0;

    std::shared_ptr<Node> lookup(const std::vector<CodeUnits>& parts) const {
        std::shared_ptr<Node> node = root;
        for (const auto& part : parts) {
            node = node->find_child(part);
            if (!node) {
                return nullptr;
            }
        }
        return node;
    }

    std::shared_ptr<Node> lookup_or_create(const std::vector<CodeUnits>& parts) {
        std::shared_ptr<Node> node = root;
        for (const auto& part : parts) {
            auto child = node->find_child(part);
            if (!child) {
                child = std::make_shared<Node>();
                child->name = part;
                child->last_write_time = filetime_now();
                child->parent = node.get();
                node->subkeys.push_back(child);
            }
            node = std::move(child);
        }
        return node;
    }

    /// Найти живой ключ по handle
    OpenKey* find_handle(Handle handle) {
        auto it = handles.find(handle);
        if (it == handles.end()) {
            return nullptr;
        }
        return &it->second;
    }
};

MemoryTransport::MemoryTransport() : impl_(std::make_unique<Impl>()) {}

MemoryTransport::~MemoryTransport() = default;

// ============================================================================
// Наполнение хранилища
// ============================================================================

bool MemoryTransport::create_key(std::string_view path) {
    auto parts = split_path(path);
    if (!parts || parts->empty()) {
        return false;
    }
    return impl_->lookup_or_create(*parts) != nullptr;
}

bool MemoryTransport::put_value(std::string_view key_path, std::u16string_view name,
                                std::uint32_t type, std::vector<std::uint8_t> data) {
    auto parts = split_path(key_path);
    if (!parts || parts->empty()) {
        return false;
    }
    auto node = impl_->lookup_or_create(*parts);

    if (auto* existing = node->find_value(name)) {
        existing->type = type;
        existing->data = std::move(data);
    } else {
        Impl::StoredValue value;
        value.name = CodeUnits(name);
        value.type = type;
        value.data = std::move(data);
        node->values.push_back(std::move(value));
    }
    node->last_write_time = filetime_now();
    return true;
}

bool MemoryTransport::set_read_only(std::string_view path, bool read_only) {
    auto parts = split_path(path);
    if (!parts) {
        return false;
    }
    auto node = impl_->lookup(*parts);
    if (!node) {
        return false;
    }
    node->read_only = read_only;
    return true;
}

bool MemoryTransport::key_exists(std::string_view path) const {
    auto parts = split_path(path);
    if (!parts || parts->empty()) {
        return false;
    }
    return impl_->lookup(*parts) != nullptr;
}

// ============================================================================
// Transport
// ============================================================================

std::optional<RawRecord> MemoryTransport::enumerate_key(Handle handle, std::uint32_t index) {
    auto* key = impl_->find_handle(handle);
    if (!key || key->node->deleted) {
        return std::nullopt;
    }
    const auto& subkeys = key->node->subkeys;
    if (index >= subkeys.size()) {
        return std::nullopt;  // STATUS_NO_MORE_ENTRIES
    }

    const auto& sub = *subkeys[index];
    KeyBasicHeader header;
    header.last_write_time = sub.last_write_time;
    header.title_index = 0;
    header.name_length = static_cast<std::uint32_t>(sub.name.size() * sizeof(char16_t));

    RawRecord record;
    record.reserve(KEY_BASIC_HEADER_SIZE + header.name_length);
    encode_key_basic_header(header, record);
    append_units(record, sub.name);
    return record;
}

std::optional<RawRecord> MemoryTransport::enumerate_value(Handle handle, std::uint32_t index) {
    auto* key = impl_->find_handle(handle);
    if (!key || key->node->deleted) {
        return std::nullopt;
    }
    const auto& values = key->node->values;
    if (index >= values.size()) {
        return std::nullopt;
    }

    const auto& value = values[index];
    const auto name_size = static_cast<std::uint32_t>(value.name.size() * sizeof(char16_t));

    ValueFullHeader header;
    header.title_index = 0;
    header.value_type = value.type;
    header.data_offset = static_cast<std::uint32_t>(VALUE_FULL_HEADER_SIZE) + name_size;
    header.data_length = static_cast<std::uint32_t>(value.data.size());
    header.name_length = name_size;

    RawRecord record;
    record.reserve(header.data_offset + header.data_length);
    encode_value_full_header(header, record);
    append_units(record, value.name);
    record.insert(record.end(), value.data.begin(), value.data.end());
    return record;
}

OpenResult MemoryTransport::open(std::string_view path, Access access) {
    OpenResult result;

    auto parts = split_path(path);
    if (!parts || parts->empty()) {
        result.status = STATUS_OBJECT_NAME_INVALID;
        return result;
    }

    auto node = impl_->lookup(*parts);
    if (!node) {
        result.status = STATUS_OBJECT_NAME_NOT_FOUND;
        return result;
    }
    if (access == Access::ReadWrite && node->read_only) {
        result.status = STATUS_ACCESS_DENIED;
        return result;
    }

    const Handle handle = impl_->next_handle;
    impl_->next_handle += 4;
    impl_->handles[handle] = Impl::OpenKey{std::move(node), access};

    result.handle = handle;
    return result;
}

std::uint32_t MemoryTransport::close(Handle handle) {
    auto it = impl_->handles.find(handle);
    if (it == impl_->handles.end()) {
        return STATUS_INVALID_HANDLE;
    }
    impl_->handles.erase(it);
    ++impl_->closes;
    return STATUS_SUCCESS;
}

std::uint32_t MemoryTransport::delete_key(Handle handle) {
    auto* key = impl_->find_handle(handle);
    if (!key) {
        return STATUS_INVALID_HANDLE;
    }
    if (key->access != Access::ReadWrite) {
        return STATUS_ACCESS_DENIED;
    }
    auto& node = key->node;
    if (node->deleted) {
        return STATUS_KEY_DELETED;
    }
    if (!node->subkeys.empty() || node->parent == nullptr) {
        return STATUS_CANNOT_DELETE;
    }

    auto& siblings = node->parent->subkeys;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
    node->parent->last_write_time = filetime_now();
    node->parent = nullptr;
    node->deleted = true;
    return STATUS_SUCCESS;
}

std::uint32_t MemoryTransport::delete_value(Handle handle, std::u16string_view name) {
    auto* key = impl_->find_handle(handle);
    if (!key) {
        return STATUS_INVALID_HANDLE;
    }
    if (key->access != Access::ReadWrite) {
        return STATUS_ACCESS_DENIED;
    }
    auto& node = *key->node;
    if (node.deleted) {
        return STATUS_KEY_DELETED;
    }

    auto it = std::find_if(node.values.begin(), node.values.end(),
                           [&](const Impl::StoredValue& v) { return names_equal(v.name, name); });
    if (it == node.values.end()) {
        return STATUS_OBJECT_NAME_NOT_FOUND;
    }
    node.values.erase(it);
    node.last_write_time = filetime_now();
    return STATUS_SUCCESS;
}

std::uint32_t MemoryTransport::set_value(Handle handle, std::u16string_view name,
                                         std::uint32_t type,
                                         const std::vector<std::uint8_t>& payload) {
    auto* key = impl_->find_handle(handle);
    if (!key) {
        return STATUS_INVALID_HANDLE;
    }
    if (key->access != Access::ReadWrite) {
        return STATUS_ACCESS_DENIED;
    }
    auto& node = *key->node;
    if (node.deleted) {
        return STATUS_KEY_DELETED;
    }

    if (auto* existing = node.find_value(name)) {
        existing->type = type;
        existing->data = payload;
    } else {
        Impl::StoredValue value;
        value.name = CodeUnits(name);
        value.type = type;
        value.data = payload;
        node.values.push_back(std::move(value));
    }
    node.last_write_time = filetime_now();
    return STATUS_SUCCESS;
}

// ============================================================================
// Диагностика
// ============================================================================

std::size_t MemoryTransport::open_handle_count() const {
    return impl_->handles.size();
}

std::size_t MemoryTransport::close_count() const {
    return impl_->closes;
}

}  // namespace ntreg
