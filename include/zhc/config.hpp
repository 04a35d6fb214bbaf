// ==============================================================================
// zhc/config.hpp - Файл настроек (YAML)
// ==============================================================================
//
// Назначение:
// - Значения по умолчанию для clean/analyze из YAML-файла
// - Поиск файла: --config, $XDG_CONFIG_HOME/zhc/config.yml,
//   ~/.config/zhc/config.yml
//
// Все ключи необязательны, неизвестные ключи игнорируются.
//
// ==============================================================================

#ifndef ZHC_CONFIG_HPP
#define ZHC_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace zhc::config {

struct Config {
    std::optional<std::filesystem::path> history_file;  // history_file
    std::optional<bool> backup;                         // backup
    std::optional<bool> keep_duplicates;                // keep_duplicates
    std::optional<bool> ignore_case;                    // ignore_case
    std::vector<std::string> filters;                   // filters
    std::optional<std::size_t> top_n;                   // top_n
};

struct ConfigError {
    std::string path;
    std::string cause;

    /// "invalid config '<path>': <cause>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из текста YAML (path только для сообщений)
ConfigResult parse_config(const std::string& text, const std::filesystem::path& path);

/// Путь к файлу по умолчанию, если он существует
std::optional<std::filesystem::path> default_config_path();

}  // namespace zhc::config

#endif  // ZHC_CONFIG_HPP
