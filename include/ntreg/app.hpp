// ==============================================================================
// ntreg/app.hpp - Выполнение команд CLI
// ==============================================================================
//
// Назначение:
// - Выбор транспорта (--store или ntdll)
// - Выполнение команд keys/values/tree/set/delete-value/delete-key
// - Представление записей в виде таблицы или JSON
//
// ==============================================================================

#ifndef NTREG_APP_HPP
#define NTREG_APP_HPP

#include <cstdint>
#include <memory>
#include <ntreg/cli.hpp>
#include <ntreg/error.hpp>
#include <ntreg/key.hpp>
#include <ntreg/output.hpp>
#include <ntreg/transport.hpp>
#include <string>
#include <variant>

#include <rapidjson/document.h>

namespace ntreg::app {

/// Транспорт для глобальных опций: YAML store при --store, иначе ntdll
std::variant<std::shared_ptr<Transport>, RegError> open_transport(
    const cli::GlobalOptions& global);

/// Выполнить команду
/// @return exit code (0 успех, 1 ошибка выполнения)
int run_command(const cli::Command& command, const std::shared_ptr<Transport>& transport,
                output::Writer& writer);

/// FILETIME -> "YYYY-MM-DDTHH:MM:SSZ" (0 -> "")
std::string format_filetime(std::uint64_t filetime);

/// {"name", "path", "last_write_time"}
void subkey_to_json(const SubkeyDescriptor& subkey, rapidjson::Value& out,
                    rapidjson::Document::AllocatorType& alloc);

/// {"name", "type", "data"}
void value_to_json(const ValueItem& item, rapidjson::Value& out,
                   rapidjson::Document::AllocatorType& alloc);

}  // namespace ntreg::app

#endif  // NTREG_APP_HPP
