#include "chronicle/diagnostics.hpp"
#include "chronicle/core/platform_utils.hpp"

#include <iostream>

namespace chronicle::diag {

auto to_string(severity s) -> const char* {
    switch (s) {
        case severity::debug: return "DEBUG";
        case severity::info: return "INFO";
        case severity::warning: return "WARNING";
        case severity::severe: return "SEVERE";
    }
    return "SEVERE";
}

void StderrSink::emit(severity level, std::string_view component, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(threshold_)) return;
    std::lock_guard lock(mutex_);
    std::cerr << "[CHRONICLE][" << component << "] " << to_string(level) << ": " << message << std::endl;
}

auto default_sink() -> DiagnosticSink& {
    static StderrSink sink([] {
        auto v = core::safe_getenv("CHRONICLE_DEBUG");
        return (v && !v->empty() && (*v)[0] == '1') ? severity::debug : severity::warning;
    }());
    return sink;
}

} // namespace chronicle::diag
