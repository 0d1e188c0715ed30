#pragma once

#include <memory>
#include <string>

namespace ReelSync {
namespace tracing {

// Open the span log. Empty path means <tempdir>/reelsync-trace.log.
void InitTracing(const std::string& outfile = "");

// Flush and close the span log
void ShutdownTracing();

// Lightweight RAII init helper
struct ScopedInit {
    explicit ScopedInit(const std::string& outfile = "") { InitTracing(outfile); }
    ~ScopedInit() { ShutdownTracing(); }
};

// Records START/END lines with the elapsed time; ends on destruction
class Span {
public:
    explicit Span(const char* name);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    void AddAttribute(const std::string& key, const std::string& value);
    void End();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracing
} // namespace ReelSync

#define REELSYNC_TRACE_CONCAT_INNER(a, b) a##b
#define REELSYNC_TRACE_CONCAT(a, b) REELSYNC_TRACE_CONCAT_INNER(a, b)
#define TRACE_SCOPE(name) ::ReelSync::tracing::Span REELSYNC_TRACE_CONCAT(reelsync_span_, __LINE__)(name)
#define TRACE_FUNC() TRACE_SCOPE(__func__)
