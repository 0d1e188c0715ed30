#pragma once

#include <stdexcept>
#include <string>

namespace ReelSync {

/**
 * @brief Category of a pipeline failure, reported alongside the failing stage
 */
enum class ErrorKind {
    None,
    Analysis,      // no usable audio signal (recovered by uniform beats)
    NotFound,      // no clips for a keyword (recovered by pool fallback)
    InvalidMedia,  // unreadable or zero-length media
    Timeline,      // timeline violates duration/segment invariants
    Render,        // compositing or muxing failed
    Alignment,     // caption burn-in failed (recovered by caption-file-only output)
    Config,
    Cancelled,
    JobConflict,
    Internal
};

const char* errorKindName(ErrorKind kind);

class ReelError : public std::runtime_error {
public:
    ReelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind getKind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

class AnalysisError : public ReelError {
public:
    explicit AnalysisError(const std::string& message) : ReelError(ErrorKind::Analysis, message) {}
};

class NotFoundError : public ReelError {
public:
    explicit NotFoundError(const std::string& message) : ReelError(ErrorKind::NotFound, message) {}
};

class InvalidMediaError : public ReelError {
public:
    explicit InvalidMediaError(const std::string& message) : ReelError(ErrorKind::InvalidMedia, message) {}
};

class TimelineError : public ReelError {
public:
    explicit TimelineError(const std::string& message) : ReelError(ErrorKind::Timeline, message) {}
};

class RenderError : public ReelError {
public:
    explicit RenderError(const std::string& message) : ReelError(ErrorKind::Render, message) {}
};

class AlignmentError : public ReelError {
public:
    explicit AlignmentError(const std::string& message) : ReelError(ErrorKind::Alignment, message) {}
};

class ConfigError : public ReelError {
public:
    explicit ConfigError(const std::string& message) : ReelError(ErrorKind::Config, message) {}
};

class CancelledError : public ReelError {
public:
    explicit CancelledError(const std::string& message) : ReelError(ErrorKind::Cancelled, message) {}
};

class JobConflictError : public ReelError {
public:
    explicit JobConflictError(const std::string& message) : ReelError(ErrorKind::JobConflict, message) {}
};

} // namespace ReelSync
