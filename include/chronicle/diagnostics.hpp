#pragma once

/** \file diagnostics.hpp
 *  \brief Diagnostic sinks handed to the timeline at open time.
 *
 * There is no process-wide logger: every component that reports anything gets a
 * sink reference from its owner. Sinks must be safe to call from concurrent readers.
 */

#include <mutex>
#include <string_view>

namespace chronicle::diag {

enum class severity : int { debug = 0, info = 1, warning = 2, severe = 3 };

auto to_string(severity s) -> const char*;

class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void emit(severity level, std::string_view component, std::string_view message) = 0;
};

/** \brief Writes "[CHRONICLE][component] LEVEL: message" lines to std::cerr. */
class StderrSink final : public DiagnosticSink {
public:
    explicit StderrSink(severity threshold = severity::warning) : threshold_(threshold) {}
    void emit(severity level, std::string_view component, std::string_view message) override;

private:
    severity threshold_;
    std::mutex mutex_;
};

class NullSink final : public DiagnosticSink {
public:
    void emit(severity, std::string_view, std::string_view) override {}
};

/** \brief Process default: stderr, debug level when CHRONICLE_DEBUG=1, warnings otherwise. */
auto default_sink() -> DiagnosticSink&;

} // namespace chronicle::diag
