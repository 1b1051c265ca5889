// ==============================================================================
// store_loader.cpp - Загрузка MemoryTransport из YAML
// ==============================================================================

#include <fstream>
#include <ntreg/platform.hpp>
#include <ntreg/transport.hpp>
#include <ntreg/value.hpp>
#include <ntreg/wire.hpp>
#include <yaml-cpp/yaml.h>

namespace ntreg {

namespace {

/// Ошибка разбора хранилища
struct StoreError {
    std::string message;
};

/// Собрать payload значения из YAML node
std::optional<std::vector<std::uint8_t>> build_payload(const YAML::Node& node,
                                                       std::uint32_t tag, std::string& error) {
    if (node["hex"]) {
        auto bytes = parse_hex_bytes(node["hex"].as<std::string>());
        if (!bytes) {
            error = "invalid hex payload";
        }
        return bytes;
    }

    const YAML::Node data = node["data"];
    std::vector<std::uint8_t> out;

    switch (value_type_from_u32(tag)) {
    case ValueType::None:
        return out;

    case ValueType::String:
    case ValueType::ExpandString: {
        auto units = utf8_to_code_units(data ? data.as<std::string>() : std::string());
        if (!units) {
            error = "string data is not valid UTF-8";
            return std::nullopt;
        }
        return code_units_to_bytes(*units, true);
    }

    case ValueType::Dword:
        append_u32(out, data.as<std::uint32_t>());
        return out;

    case ValueType::DwordBigEndian: {
        const auto v = data.as<std::uint32_t>();
        for (int i = 3; i >= 0; --i) {
            out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
        return out;
    }

    case ValueType::Qword:
        append_u64(out, data.as<std::uint64_t>());
        return out;

    case ValueType::Binary:
        if (!data) {
            return out;
        }
        if (data.IsSequence()) {
            for (const auto& byte : data) {
                const auto v = byte.as<unsigned>();
                if (v > 0xFF) {
                    error = "binary element out of range: " + std::to_string(v);
                    return std::nullopt;
                }
                out.push_back(static_cast<std::uint8_t>(v));
            }
            return out;
        }
        error = "binary data must be a sequence of bytes";
        return std::nullopt;

    default:
        error = "type " + std::to_string(tag) + " requires a 'hex' payload";
        return std::nullopt;
    }
}

std::optional<StoreError> load_key(MemoryTransport& store, const YAML::Node& key) {
    if (!key["path"]) {
        return StoreError{"key entry missing 'path' field"};
    }
    const auto path = key["path"].as<std::string>();
    if (!store.create_key(path)) {
        return StoreError{"invalid key path '" + path + "'"};
    }

    if (key["values"]) {
        if (!key["values"].IsSequence()) {
            return StoreError{"'values' of '" + path + "' must be a sequence"};
        }
        for (const auto& value : key["values"]) {
            const auto name = value["name"] ? value["name"].as<std::string>() : std::string();
            auto name_units = utf8_to_code_units(name);
            if (!name_units) {
                return StoreError{"value name is not valid UTF-8 in '" + path + "'"};
            }

            if (!value["type"]) {
                return StoreError{"value '" + name + "' in '" + path + "' missing 'type' field"};
            }
            const auto type_text = value["type"].as<std::string>();
            auto tag = value_type_tag_from_string(type_text);
            if (!tag) {
                return StoreError{"unknown value type '" + type_text + "'"};
            }

            std::string error;
            auto payload = build_payload(value, *tag, error);
            if (!payload) {
                return StoreError{"value '" + name + "' in '" + path + "': " + error};
            }
            store.put_value(path, *name_units, *tag, std::move(*payload));
        }
    }

    if (key["read_only"] && key["read_only"].as<bool>()) {
        store.set_read_only(path, true);
    }
    return std::nullopt;
}

RegError yaml_error(const std::string& source, const std::string& message) {
    RegError err = make_error(RegErrorKind::TransportFailure, message);
    err.operation = "load_store";
    err.resource = source;
    return err;
}

std::variant<std::shared_ptr<MemoryTransport>, RegError> load_from_node(
    const YAML::Node& root, const std::string& source) {
    auto fail = [&](const std::string& message) { return yaml_error(source, message); };

    if (!root.IsMap() || !root["keys"]) {
        return fail("store file missing 'keys' field: " + source);
    }
    if (!root["keys"].IsSequence()) {
        return fail("'keys' must be a sequence: " + source);
    }

    auto store = std::make_shared<MemoryTransport>();
    for (const auto& key : root["keys"]) {
        if (auto err = load_key(*store, key)) {
            return fail(err->message + " (" + source + ")");
        }
    }
    return store;
}

}  // anonymous namespace

std::variant<std::shared_ptr<MemoryTransport>, RegError> load_memory_store(
    const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);
    try {
        std::ifstream file(path);
        if (!file) {
            return yaml_error(source, "failed to open store file: " + source);
        }
        YAML::Node root = YAML::Load(file);
        return load_from_node(root, source);

    } catch (const YAML::Exception& e) {
        return yaml_error(source, std::string("YAML parse error: ") + e.what());
    } catch (const std::exception& e) {
        return yaml_error(source, std::string("error loading store: ") + e.what());
    }
}

std::variant<std::shared_ptr<MemoryTransport>, RegError> load_memory_store_from_string(
    std::string_view yaml_text) {
    const std::string source = "<string>";
    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));
        return load_from_node(root, source);

    } catch (const YAML::Exception& e) {
        return yaml_error(source, std::string("YAML parse error: ") + e.what());
    } catch (const std::exception& e) {
        return yaml_error(source, std::string("error loading store: ") + e.what());
    }
}

}  // namespace ntreg
