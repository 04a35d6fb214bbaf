// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8
// Платформенная специфика изолирована здесь
//
// ==============================================================================

// До любых заголовков Windows: min/max не должны становиться макросами
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include "zhc/platform.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace zhc::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::optional<std::filesystem::path> home_directory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return path_from_utf8(home);
}

std::filesystem::path expand_tilde(const std::filesystem::path& p) {
    std::string str = path_to_utf8(p);
    if (str.empty() || str[0] != '~') {
        return p;
    }
    // "~user/..." не поддерживается
    if (str.size() > 1 && str[1] != '/' && str[1] != '\\') {
        return p;
    }

    auto home = home_directory();
    if (!home) {
        return p;
    }
    if (str.size() <= 2) {
        return *home;
    }
    return *home / path_from_utf8(std::string_view(str).substr(2));
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Локальное время
// ----------------------------------------------------------------------------

std::optional<std::tm> local_time(std::uint64_t seconds) {
    if (seconds > static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max())) {
        return std::nullopt;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm_result{};
#ifdef _WIN32
    if (localtime_s(&tm_result, &time) != 0) {
        return std::nullopt;
    }
#else
    if (localtime_r(&time, &tm_result) == nullptr) {
        return std::nullopt;
    }
#endif
    return tm_result;
}

std::string local_timestamp_millis() {
    auto now = std::chrono::system_clock::now();
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    std::time_t time = std::chrono::system_clock::to_time_t(now);

    std::tm tm_result{};
#ifdef _WIN32
    localtime_s(&tm_result, &time);
#else
    localtime_r(&time, &tm_result);
#endif

    char buf[64];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d-%Hh%Mm%Ss", &tm_result);
    char ms_buf[16];
    std::snprintf(ms_buf, sizeof(ms_buf), "%03dms", static_cast<int>(millis));

    return std::string(buf, len) + ms_buf;
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

bool sync_file(const std::filesystem::path& path) {
#ifdef _WIN32
    int fd = _wopen(path.c_str(), _O_RDWR | _O_BINARY);
    if (fd < 0) {
        return false;
    }
    bool ok = _commit(fd) == 0;
    _close(fd);
    return ok;
#else
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
#endif
}

std::filesystem::path make_temp_file(const std::filesystem::path& dir, std::string_view prefix) {
#ifdef _WIN32
    auto generate_random_suffix = [](size_t length = 8) -> std::string {
        static const char chars[] = "0123456789abcdef";
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result += chars[dis(gen)];
        }
        return result;
    };

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate =
            dir / path_from_utf8(std::string(prefix) + "_" + generate_random_suffix() + ".tmp");
        HANDLE h = CreateFileW(candidate.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h != INVALID_HANDLE_VALUE) {
            CloseHandle(h);
            return candidate;
        }
    }
    throw std::runtime_error("Failed to create temp file");
#else
    // Unix: mkstemp() в целевом каталоге (rename должен остаться в пределах одной ФС)
    std::string tmpl = path_to_utf8(dir / (std::string(prefix) + "_XXXXXX"));
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    return std::filesystem::path(tmpl_buf.data());
#endif
}

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

bool is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
            cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            cp = c & 0x07;
        } else {
            // 0x80..0xC1 (continuation / overlong) и 0xF5..0xFF
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong, суррогаты, выход за U+10FFFF
        if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

}  // namespace zhc::platform
