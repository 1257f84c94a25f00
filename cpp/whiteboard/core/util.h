#ifndef WHITEBOARD_CORE_UTIL_H
#define WHITEBOARD_CORE_UTIL_H

#include <chrono>
#include <cstdint>
#include <string>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

// Wall-clock milliseconds since the Unix epoch (used for id stamps, not for timers).
inline std::uint64_t epochMillis() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

inline std::string toBase36(std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), kDigits[value % 36]);
        value /= 36;
    }
    return out;
}

#endif // WHITEBOARD_CORE_UTIL_H
