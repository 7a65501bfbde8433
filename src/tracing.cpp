// cppcheck-suppress-file missingIncludeSystem
#include "tracing.hpp"

#include <unistd.h>

#include <atomic>

#include "logging.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

thread_local std::string g_current_trace_id;
thread_local std::string g_current_span_id;

std::atomic<uint64_t> g_span_counter{0};

} // namespace

bool tracing_enabled()
{
    return env_truthy("HOOKGUARD_OTEL_SPANS");
}

std::string make_span_id(const std::string& prefix)
{
    const uint64_t seq = g_span_counter.fetch_add(1, std::memory_order_relaxed);
    return prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(now_unix_ms()) + "-" +
           std::to_string(seq);
}

std::string current_trace_id()
{
    return g_current_trace_id;
}

std::string current_span_id()
{
    return g_current_span_id;
}

ScopedSpan::ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id)
    : name_(std::move(name)), trace_id_(std::move(trace_id)), span_id_(make_span_id("span")),
      parent_span_id_(std::move(parent_span_id)), previous_trace_id_(g_current_trace_id),
      previous_span_id_(g_current_span_id), enabled_(tracing_enabled()), start_(std::chrono::steady_clock::now())
{
    g_current_trace_id = trace_id_;
    g_current_span_id = span_id_;

    if (enabled_) {
        auto entry = SLOG_INFO("otel_span_start")
                         .field("span_name", name_)
                         .field("trace_id", trace_id_)
                         .field("span_id", span_id_);
        if (!parent_span_id_.empty()) {
            entry.field("parent_span_id", parent_span_id_);
        }
        logger().log(entry);
    }
}

ScopedSpan::~ScopedSpan()
{
    if (enabled_) {
        const auto elapsed_us =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
        auto entry = SLOG_INFO("otel_span_end")
                         .field("span_name", name_)
                         .field("trace_id", trace_id_)
                         .field("span_id", span_id_)
                         .field("duration_us", static_cast<int64_t>(elapsed_us))
                         .field("status", failed_ ? "error" : "ok");
        if (!parent_span_id_.empty()) {
            entry.field("parent_span_id", parent_span_id_);
        }
        if (failed_) {
            entry.field("error", error_);
        }
        logger().log(entry);
    }

    g_current_trace_id = previous_trace_id_;
    g_current_span_id = previous_span_id_;
}

void ScopedSpan::fail(const std::string& error)
{
    failed_ = true;
    error_ = error;
}

} // namespace hookguard
