#include "tracing/Tracing.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

#if defined(REELSYNC_ENABLE_TRACING)
#include <opentelemetry/trace/provider.h>
#endif

namespace ReelSync {
namespace tracing {

namespace {

// Process-wide span log; every write holds the mutex
struct TraceFile {
    std::mutex mutex;
    std::ofstream stream;
    std::string path;

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lk(mutex);
        if (stream.is_open()) {
            stream << line << '\n';
        }
    }
};

TraceFile& traceFile() {
    static TraceFile file;
    return file;
}

// Nesting depth of open spans on this thread
thread_local int t_depth = 0;

std::string wallClock() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    long ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

std::string defaultTracePath() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        std::cerr << "[ReelSync] No temp directory for traces (" << ec.message() << "), using cwd\n";
        return "reelsync-trace.log";
    }
    return (dir / "reelsync-trace.log").string();
}

} // namespace

struct Span::Impl {
    std::string name;
    std::chrono::steady_clock::time_point start;
    std::map<std::string, std::string> attrs;
    int depth = 0;
    bool ended = false;
#if defined(REELSYNC_ENABLE_TRACING)
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> otelSpan;
#endif
};

void InitTracing(const std::string& outfile) {
    const std::string target = outfile.empty() ? defaultTracePath() : outfile;
    TraceFile& file = traceFile();
    std::lock_guard<std::mutex> lk(file.mutex);
    if (file.stream.is_open()) {
        if (file.path == target) return;
        file.stream.close();
    }

    file.stream.clear();
    file.stream.open(target, std::ios::out | std::ios::app);
    if (file.stream.is_open()) {
        file.path = target;
    } else {
        std::cerr << "[ReelSync] Cannot open trace file " << target << "\n";
        file.path.clear();
    }
}

void ShutdownTracing() {
    TraceFile& file = traceFile();
    std::lock_guard<std::mutex> lk(file.mutex);
    if (file.stream.is_open()) {
        file.stream.flush();
        file.stream.close();
    }
    file.path.clear();
}

Span::Span(const char* name) : impl_(std::make_unique<Impl>()) {
    impl_->name = name ? name : "";
    impl_->start = std::chrono::steady_clock::now();
    impl_->depth = t_depth++;
#if defined(REELSYNC_ENABLE_TRACING)
    impl_->otelSpan = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer("reelsync")->StartSpan(impl_->name);
#endif
    std::ostringstream line;
    line << wallClock() << ' ' << std::string(impl_->depth * 2, ' ') << "START " << impl_->name
         << " thread=" << std::this_thread::get_id();
    traceFile().write(line.str());
}

Span::~Span() {
    End();
}

void Span::AddAttribute(const std::string& key, const std::string& value) {
    if (!impl_ || impl_->ended) return;
    impl_->attrs[key] = value;
#if defined(REELSYNC_ENABLE_TRACING)
    if (impl_->otelSpan) impl_->otelSpan->SetAttribute(key, value);
#endif
}

void Span::End() {
    if (!impl_ || impl_->ended) return;
    impl_->ended = true;
    --t_depth;
    double elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - impl_->start).count();
#if defined(REELSYNC_ENABLE_TRACING)
    if (impl_->otelSpan) impl_->otelSpan->End();
#endif
    std::ostringstream line;
    line << wallClock() << ' ' << std::string(impl_->depth * 2, ' ') << "END " << impl_->name
         << std::fixed << std::setprecision(1) << " took=" << elapsedMs << "ms";
    for (const auto& kv : impl_->attrs) {
        line << ' ' << kv.first << '=' << kv.second;
    }
    traceFile().write(line.str());
}

} // namespace tracing
} // namespace ReelSync
