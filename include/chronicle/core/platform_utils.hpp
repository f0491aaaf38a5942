#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace chronicle::core {

// Cross-platform getenv.
// - Windows: _dupenv_s, buffer released before returning
// - POSIX: std::getenv (read-only)
// Unset yields std::nullopt; set-but-empty yields an engaged empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// "1", "true", "on" and "yes" (any case) switch a flag on; anything else is off.
inline std::optional<bool> env_flag(const char* name) {
    auto v = safe_getenv(name);
    if (!v) return std::nullopt;
    std::string lowered;
    lowered.reserve(v->size());
    for (char c : *v) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes";
}

// Integer value of an environment variable. The outer optional is empty when the
// variable is unset; the inner one is empty when it is set but not a base-10 integer.
inline std::optional<std::optional<std::int64_t>> env_int(const char* name) {
    auto v = safe_getenv(name);
    if (!v) return std::nullopt;
    std::int64_t out{};
    const char* first = v->data();
    const char* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || v->empty()) return std::optional<std::int64_t>{};
    return std::optional<std::int64_t>{out};
}

} // namespace chronicle::core
