// ==============================================================================
// zhc/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Локальное время (календарная дата, метка времени для backup)
// - Надёжная запись на диск (fsync) и временные файлы
// - Проверка UTF-8
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована здесь и в
// platform.cpp.
//
// ==============================================================================

#ifndef ZHC_PLATFORM_HPP
#define ZHC_PLATFORM_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace zhc::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать путь из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

/// Домашний каталог пользователя ($HOME / %USERPROFILE%)
std::optional<std::filesystem::path> home_directory();

/// Раскрыть ведущий "~" в пути
/// "~" и "~/x" раскрываются, "~user/x" и прочие пути возвращаются как есть
std::filesystem::path expand_tilde(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Локальное время
// ----------------------------------------------------------------------------

/// Преобразовать UNIX timestamp в локальное календарное время
/// @return std::nullopt если значение не представимо (переполнение time_t,
///         ошибка localtime)
std::optional<std::tm> local_time(std::uint64_t seconds);

/// Текущее локальное время с миллисекундами: "2024-03-26-14h05m09s042ms"
/// Используется в именах backup-файлов
std::string local_timestamp_millis();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Сбросить содержимое файла на диск (fsync / _commit)
/// @return false при ошибке открытия или синхронизации
bool sync_file(const std::filesystem::path& path);

/// Создать уникальный пустой файл в каталоге dir
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(const std::filesystem::path& dir, std::string_view prefix);

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

/// Проверить, что байты образуют корректный UTF-8
/// (без overlong-последовательностей, суррогатов и значений > U+10FFFF)
bool is_valid_utf8(std::string_view bytes);

}  // namespace zhc::platform

#endif  // ZHC_PLATFORM_HPP
