// ==============================================================================
// streamgrep/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для stdout/stderr
// - Временные файлы (для тестов и утилит)
// - Количество аппаратных потоков
//
// Платформенная специфика изолирована в platform.cpp.
//
// ==============================================================================

#ifndef STREAMGREP_PLATFORM_HPP
#define STREAMGREP_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace streamgrep::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки (на Windows через UTF-16)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

/// Относительный путь в формате с '/' разделителями (UTF-8)
/// Используется для путей, которые видит пользователь и фильтры
std::string generic_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл и вернуть путь к нему
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(std::string_view prefix);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// Имя ОС ("Linux", "macOS", "Windows", "Unknown")
std::string os_name();

/// Количество аппаратных потоков (минимум 1)
unsigned hardware_threads();

}  // namespace streamgrep::platform

#endif  // STREAMGREP_PLATFORM_HPP
