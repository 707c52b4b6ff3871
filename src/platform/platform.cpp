// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Пути в UTF-8 переводит std::filesystem (u8path / u8string), вызовы ОС
// остались только для TTY и атомарного создания временного файла.
//
// ==============================================================================

#include "sysguard/platform.hpp"

#include <cstdio>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <process.h>
#else
#include <cstdlib>
#include <unistd.h>
#endif

namespace sysguard::platform {

namespace {

bool stream_is_tty(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return stream_is_tty(stdout);
}

bool is_tty_stderr() {
    return stream_is_tty(stderr);
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix) {
    std::error_code ec;
    const auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("Failed to get temp path: " + ec.message());
    }

#ifdef _WIN32
    // "wx": создать только если файла ещё нет
    static unsigned counter = 0;
    for (int attempt = 0; attempt < 100; ++attempt) {
        auto candidate = dir / path_from_utf8(std::string(prefix) + "_" +
                                              std::to_string(_getpid()) + "_" +
                                              std::to_string(counter++));
        std::FILE* f = _wfopen(candidate.c_str(), L"wx");
        if (f != nullptr) {
            std::fclose(f);
            return candidate;
        }
    }
    throw std::runtime_error("Failed to create temp file");
#else
    std::string tmpl = path_to_utf8(dir / path_from_utf8(prefix)) + "_XXXXXX";
    int fd = mkstemp(tmpl.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file in " + path_to_utf8(dir));
    }
    close(fd);
    return path_from_utf8(tmpl);
#endif
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace sysguard::platform
