// ==============================================================================
// app.cpp - Выполнение команд CLI
// ==============================================================================

#include <ntreg/app.hpp>
#include <ntreg/platform.hpp>

#include <cstdio>
#include <type_traits>
#include <vector>

namespace ntreg::app {

namespace {

/// Приёмник записей: таблица, JSON массив или JSON Lines
class RecordSink {
public:
    RecordSink(output::Writer& writer, std::vector<std::string> headers)
        : writer_(writer), format_(writer.config().format) {
        table_.set_headers(headers);
        doc_.SetArray();
    }

    bool json() const { return format_ != output::Format::Std; }

    rapidjson::Document::AllocatorType& allocator() { return doc_.GetAllocator(); }

    void add_json(rapidjson::Value& value) {
        if (format_ == output::Format::Jsonl) {
            writer_.write_json_line(value);
        } else {
            doc_.PushBack(value, doc_.GetAllocator());
        }
        ++count_;
    }

    void add_row(const std::vector<std::string>& cells) {
        table_.add_row(cells);
        ++count_;
    }

    std::size_t count() const { return count_; }

    void finish() {
        if (format_ == output::Format::Json) {
            writer_.write_json_pretty(doc_);
        } else if (format_ == output::Format::Std && table_.row_count() > 0) {
            table_.print(writer_);
        }
        writer_.flush();
    }

private:
    output::Writer& writer_;
    output::Format format_;
    output::Table table_;
    rapidjson::Document doc_;
    std::size_t count_ = 0;
};

void report(output::Writer& writer, const RegError& err) {
    writer.error(err.format());
    writer.debug(std::string("kind: ") + reg_error_kind_to_string(err.kind) +
                 (err.status != STATUS_SUCCESS ? ", status: " + format_status(err.status) : ""));
}

std::string value_name_or_warn(const ValueItem& item, output::Writer& writer) {
    auto name = item.name();
    if (auto* err = std::get_if<RegError>(&name)) {
        writer.warn(err->format());
        return {};
    }
    return std::get<std::string>(name);
}

/// Открыть ключ; при ошибке вывести её и вернуть nullopt
std::optional<RegKey> open_key(const std::shared_ptr<Transport>& transport,
                               const std::string& path, Access access, output::Writer& writer) {
    auto key = access == Access::ReadWrite ? RegKey::open_write(transport, path)
                                           : RegKey::open(transport, path);
    if (auto* err = std::get_if<RegError>(&key)) {
        report(writer, *err);
        return std::nullopt;
    }
    writer.debug("Opened " + path);
    return std::move(std::get<RegKey>(key));
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_keys(const cli::KeysCommand& cmd, const std::shared_ptr<Transport>& transport,
             output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::Read, writer);
    if (!key) {
        return 1;
    }

    RecordSink sink(writer, {"Name", "Last Write"});
    auto it = key->enum_keys();
    SubkeyDescriptor subkey;
    while (it.next(subkey)) {
        if (sink.json()) {
            rapidjson::Value obj;
            subkey_to_json(subkey, obj, sink.allocator());
            sink.add_json(obj);
        } else {
            sink.add_row({subkey.name(), format_filetime(subkey.last_write_time())});
        }
    }
    sink.finish();

    if (it.last_error()) {
        report(writer, *it.last_error());
        return 1;
    }
    writer.info("Found " + std::to_string(sink.count()) + " subkeys of " + cmd.path);
    return 0;
}

/// Вывести значения открытого ключа в sink; key_path добавляется первой колонкой
bool list_values(const RegKey& key, const std::optional<std::string>& key_path, RecordSink& sink,
                 output::Writer& writer) {
    auto it = key.enum_values();
    ValueItem item;
    while (it.next(item)) {
        if (sink.json()) {
            rapidjson::Value obj;
            value_to_json(item, obj, sink.allocator());
            if (key_path) {
                rapidjson::Value k;
                k.SetString(key_path->c_str(), static_cast<rapidjson::SizeType>(key_path->size()),
                            sink.allocator());
                obj.AddMember("key", k, sink.allocator());
            }
            sink.add_json(obj);
            continue;
        }

        std::vector<std::string> row;
        if (key_path) {
            row.push_back(*key_path);
        }
        row.push_back(value_name_or_warn(item, writer));
        row.push_back(value_type_to_string(item.type()));
        row.push_back(output::format_field(item.value().to_string(), writer.config().full_output));
        sink.add_row(row);
    }

    if (it.last_error()) {
        report(writer, *it.last_error());
        return false;
    }
    return true;
}

int run_values(const cli::ValuesCommand& cmd, const std::shared_ptr<Transport>& transport,
               output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::Read, writer);
    if (!key) {
        return 1;
    }

    RecordSink sink(writer, {"Name", "Type", "Data"});
    const bool ok = list_values(*key, std::nullopt, sink, writer);
    sink.finish();
    if (!ok) {
        return 1;
    }
    writer.info("Found " + std::to_string(sink.count()) + " values in " + cmd.path);
    return 0;
}

int run_tree(const cli::TreeCommand& cmd, const std::shared_ptr<Transport>& transport,
             output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::Read, writer);
    if (!key) {
        return 1;
    }

    RecordSink sink(writer, {"Key", "Name", "Type", "Data"});
    int exit_code = 0;
    std::size_t subkeys = 0;

    auto it = key->enum_keys();
    SubkeyDescriptor subkey;
    while (it.next(subkey)) {
        ++subkeys;
        auto path = subkey.full_path();
        if (auto* err = std::get_if<RegError>(&path)) {
            writer.warn(err->format());
            exit_code = 1;
            continue;
        }
        auto child = subkey.open();
        if (auto* err = std::get_if<RegError>(&child)) {
            writer.warn(err->format());
            exit_code = 1;
            continue;
        }
        writer.trace("Listing values of " + std::get<std::string>(path));
        if (!list_values(std::get<RegKey>(child), std::get<std::string>(path), sink, writer)) {
            exit_code = 1;
        }
    }
    sink.finish();

    if (it.last_error()) {
        report(writer, *it.last_error());
        return 1;
    }
    writer.info("Listed " + std::to_string(sink.count()) + " values in " +
                std::to_string(subkeys) + " subkeys of " + cmd.path);
    return exit_code;
}

int run_set(const cli::SetCommand& cmd, const std::shared_ptr<Transport>& transport,
            output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::ReadWrite, writer);
    if (!key) {
        return 1;
    }

    auto result = std::visit(
        [&](const auto& data) -> std::optional<RegError> {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, std::uint32_t>) {
                return key->write_dword_value(cmd.name, data);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return key->write_qword_value(cmd.name, data);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return key->write_string_value(cmd.name, data);
            } else {
                return key->write_binary_value(cmd.name, data);
            }
        },
        cmd.data);

    if (result) {
        report(writer, *result);
        return 1;
    }
    writer.info("Wrote value '" + cmd.name + "' to " + cmd.path);
    return 0;
}

int run_delete_value(const cli::DeleteValueCommand& cmd,
                     const std::shared_ptr<Transport>& transport, output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::ReadWrite, writer);
    if (!key) {
        return 1;
    }
    if (auto err = key->delete_value(cmd.name)) {
        report(writer, *err);
        return 1;
    }
    writer.info("Deleted value '" + cmd.name + "' from " + cmd.path);
    return 0;
}

int run_delete_key(const cli::DeleteKeyCommand& cmd, const std::shared_ptr<Transport>& transport,
                   output::Writer& writer) {
    auto key = open_key(transport, cmd.path, Access::ReadWrite, writer);
    if (!key) {
        return 1;
    }
    if (auto err = key->delete_key()) {
        report(writer, *err);
        return 1;
    }
    writer.info("Deleted key " + cmd.path);
    return 0;
}

}  // anonymous namespace

// ============================================================================
// Публичные функции
// ============================================================================

std::variant<std::shared_ptr<Transport>, RegError> open_transport(
    const cli::GlobalOptions& global) {
    if (global.store) {
        auto store = load_memory_store(*global.store);
        if (auto* err = std::get_if<RegError>(&store)) {
            return std::move(*err);
        }
        return std::shared_ptr<Transport>(std::get<std::shared_ptr<MemoryTransport>>(store));
    }

    auto native = create_native_transport();
    if (!native) {
        RegError err = make_error(RegErrorKind::TransportFailure,
                                  "No system registry on " + platform::os_name() +
                                      ", use --store <FILE>");
        err.operation = "open_transport";
        return err;
    }
    return native;
}

int run_command(const cli::Command& command, const std::shared_ptr<Transport>& transport,
                output::Writer& writer) {
    return std::visit(
        [&](const auto& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, cli::KeysCommand>) {
                return run_keys(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::ValuesCommand>) {
                return run_values(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::TreeCommand>) {
                return run_tree(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::SetCommand>) {
                return run_set(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::DeleteValueCommand>) {
                return run_delete_value(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::DeleteKeyCommand>) {
                return run_delete_key(cmd, transport, writer);
            } else if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            }
        },
        command);
}

std::string format_filetime(std::uint64_t filetime) {
    if (filetime == 0) {
        return {};
    }
    constexpr std::int64_t TICKS_PER_SECOND = 10000000;
    constexpr std::int64_t EPOCH_DIFFERENCE = 11644473600;  // 1601-01-01 -> 1970-01-01

    const std::int64_t seconds =
        static_cast<std::int64_t>(filetime / TICKS_PER_SECOND) - EPOCH_DIFFERENCE;
    std::int64_t days = seconds / 86400;
    std::int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    // days since 1970-01-01 -> civil date
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const std::int64_t day = doy - (153 * mp + 2) / 5 + 1;
    const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
    const std::int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lldT%02lld:%02lld:%02lldZ",
                  static_cast<long long>(year), static_cast<long long>(month),
                  static_cast<long long>(day), static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60), static_cast<long long>(rem % 60));
    return buf;
}

void subkey_to_json(const SubkeyDescriptor& subkey, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();

    rapidjson::Value name;
    name.SetString(subkey.name().c_str(), static_cast<rapidjson::SizeType>(subkey.name().size()),
                   alloc);
    out.AddMember("name", name, alloc);

    rapidjson::Value path;
    auto full = subkey.full_path();
    if (const auto* text = std::get_if<std::string>(&full)) {
        path.SetString(text->c_str(), static_cast<rapidjson::SizeType>(text->size()), alloc);
    }
    out.AddMember("path", path, alloc);

    out.AddMember("last_write_time", rapidjson::Value(subkey.last_write_time()), alloc);
}

void value_to_json(const ValueItem& item, rapidjson::Value& out,
                   rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();

    rapidjson::Value name;
    auto text = item.name();
    if (const auto* s = std::get_if<std::string>(&text)) {
        name.SetString(s->c_str(), static_cast<rapidjson::SizeType>(s->size()), alloc);
    }
    out.AddMember("name", name, alloc);

    out.AddMember("type", rapidjson::StringRef(value_type_to_string(item.type())), alloc);

    rapidjson::Value data;
    item.value().to_rapidjson(data, alloc);
    out.AddMember("data", data, alloc);
}

}  // namespace ntreg::app
