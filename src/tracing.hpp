// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <chrono>
#include <string>

namespace hookguard {

// Spans are emitted only when HOOKGUARD_OTEL_SPANS is truthy.
bool tracing_enabled();

std::string make_span_id(const std::string& prefix);

std::string current_trace_id();
std::string current_span_id();

/**
 * RAII span. Logs otel_span_start on construction and otel_span_end on
 * destruction, and installs itself as the thread's current span for the
 * duration of its scope.
 */
class ScopedSpan {
  public:
    ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id = {});
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void fail(const std::string& error);

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& span_id() const { return span_id_; }

  private:
    std::string name_;
    std::string trace_id_;
    std::string span_id_;
    std::string parent_span_id_;
    std::string previous_trace_id_;
    std::string previous_span_id_;
    std::string error_;
    bool failed_ = false;
    bool enabled_ = false;
    std::chrono::steady_clock::time_point start_;
};

} // namespace hookguard
