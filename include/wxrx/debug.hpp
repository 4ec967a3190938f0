// Leveled stderr logging for the decode pipeline.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace wxrx { namespace debug {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Accepts DEBUG|INFO|WARN|WARNING|ERROR|OFF in any case.
inline bool parse_level(std::string_view text, Level& out) {
    auto eq = [&](std::string_view ref) {
        if (text.size() != ref.size()) return false;
        for (size_t i = 0; i < ref.size(); ++i) {
            char c = text[i];
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            if (c != ref[i]) return false;
        }
        return true;
    };
    if (eq("DEBUG")) { out = Level::Debug; return true; }
    if (eq("INFO")) { out = Level::Info; return true; }
    if (eq("WARN") || eq("WARNING")) { out = Level::Warn; return true; }
    if (eq("ERROR")) { out = Level::Error; return true; }
    if (eq("OFF")) { out = Level::Off; return true; }
    return false;
}

inline Level level_from_env() {
    Level lvl = Level::Warn;
    if (const char* env = std::getenv("WXRX_LOG")) parse_level(env, lvl);
    return lvl;
}

inline Level& current_level() {
    static Level lvl = level_from_env();
    return lvl;
}

inline void set_level(Level lvl) { current_level() = lvl; }
inline bool enabled(Level lvl) { return static_cast<int>(lvl) >= static_cast<int>(current_level()); }

} } // namespace wxrx::debug

#define WXRX_LOGF(lvl, tag, fmt, ...)                                            \
    do {                                                                         \
        if (::wxrx::debug::enabled(lvl))                                         \
            std::fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__);          \
    } while (0)

#define WXRX_DEBUGF(fmt, ...) WXRX_LOGF(::wxrx::debug::Level::Debug, "DEBUG", fmt, ##__VA_ARGS__)
#define WXRX_INFOF(fmt, ...)  WXRX_LOGF(::wxrx::debug::Level::Info, "INFO", fmt, ##__VA_ARGS__)
#define WXRX_WARNF(fmt, ...)  WXRX_LOGF(::wxrx::debug::Level::Warn, "WARN", fmt, ##__VA_ARGS__)
#define WXRX_ERRORF(fmt, ...) WXRX_LOGF(::wxrx::debug::Level::Error, "ERROR", fmt, ##__VA_ARGS__)
