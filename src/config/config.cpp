// ==============================================================================
// config.cpp - Файл настроек (YAML)
// ==============================================================================

#include "zhc/config.hpp"

#include "zhc/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace zhc::config {

namespace fs = std::filesystem;

namespace {

/// Прочитать значение ключа; ошибка типа превращается в YAML::Exception
template <typename T>
std::optional<T> optional_key(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw YAML::Exception(e.mark, std::string("invalid value for '") + key + "'");
    }
}

}  // anonymous namespace

std::string ConfigError::format() const {
    return "invalid config '" + path + "': " + cause;
}

ConfigResult parse_config(const std::string& text, const fs::path& path) {
    ConfigResult result;
    result.error.path = platform::path_to_utf8(path);

    try {
        YAML::Node root = YAML::Load(text);

        // Пустой файл - пустая конфигурация
        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error.cause = "expected a mapping at the top level";
            return result;
        }

        Config& cfg = result.config;
        if (auto file = optional_key<std::string>(root, "history_file")) {
            cfg.history_file = platform::path_from_utf8(*file);
        }
        cfg.backup = optional_key<bool>(root, "backup");
        cfg.keep_duplicates = optional_key<bool>(root, "keep_duplicates");
        cfg.ignore_case = optional_key<bool>(root, "ignore_case");

        const YAML::Node filters = root["filters"];
        if (filters && !filters.IsNull()) {
            if (filters.IsScalar()) {
                cfg.filters.push_back(filters.as<std::string>());
            } else if (filters.IsSequence()) {
                for (const auto& item : filters) {
                    cfg.filters.push_back(item.as<std::string>());
                }
            } else {
                result.error.cause = "invalid value for 'filters'";
                return result;
            }
        }

        if (auto top = optional_key<long long>(root, "top_n")) {
            if (*top < 0) {
                result.error.cause = "invalid value for 'top_n'";
                return result;
            }
            cfg.top_n = static_cast<std::size_t>(*top);
        }

        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error.cause = e.msg.empty() ? e.what() : e.msg;
    }

    return result;
}

ConfigResult load_config(const fs::path& path) {
    fs::path expanded = platform::expand_tilde(path);

    std::ifstream in(expanded, std::ios::binary);
    if (!in.is_open()) {
        ConfigResult result;
        result.error.path = platform::path_to_utf8(expanded);
        result.error.cause = std::strerror(errno);
        return result;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str(), expanded);
}

std::optional<fs::path> default_config_path() {
    std::vector<fs::path> candidates;

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && *xdg != '\0') {
        candidates.push_back(platform::path_from_utf8(xdg) / "zhc" / "config.yml");
    }
    if (auto home = platform::home_directory()) {
        candidates.push_back(*home / ".config" / "zhc" / "config.yml");
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace zhc::config
