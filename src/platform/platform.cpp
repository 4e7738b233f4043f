#include "zmake/platform.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <process.h>
#else
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace zmake {

namespace fs = std::filesystem;

std::optional<OsTarget> detect_host_os() {
#if defined(__APPLE__)
    return OsTarget::MacOS;
#elif defined(_WIN32)
    return OsTarget::Windows;
#elif defined(__linux__)
    return OsTarget::Linux;
#else
    return std::nullopt;
#endif
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return ".";
    return cwd.string();
}

std::string make_transient_path(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 12; ++i) {
        suffix += hex_chars[dis(gen)];
    }

#ifdef _WIN32
    int pid = _getpid();
#else
    int pid = static_cast<int>(getpid());
#endif

    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        dir = fs::current_path(ec);
    }
    return (dir / (prefix + "." + std::to_string(pid) + "." + suffix)).string();
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

#ifdef _WIN32
    char* environ_block = GetEnvironmentStrings();
    if (environ_block) {
        const char* p = environ_block;
        while (*p) {
            std::string entry(p);
            auto eq = entry.find('=');
            if (eq != std::string::npos && eq > 0) {
                env[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
            p += entry.size() + 1;
        }
        FreeEnvironmentStrings(environ_block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
#endif

    return env;
}

} // namespace zmake
