// ==============================================================================
// ntreg/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика (пути, TTY, временные файлы) изолирована здесь.
//
// ==============================================================================

#ifndef NTREG_PLATFORM_HPP
#define NTREG_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace ntreg::platform {

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

bool is_tty_stdout();
bool is_tty_stderr();

/// Создать пустой временный файл
/// @throws std::runtime_error если файл не создан
std::filesystem::path make_temp_file(std::string_view prefix);

/// "Windows", "macOS", "Linux" или "Unknown"
std::string os_name();

}  // namespace ntreg::platform

#endif  // NTREG_PLATFORM_HPP
