#include "Errors.h"

namespace ReelSync {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "None";
        case ErrorKind::Analysis:     return "AnalysisError";
        case ErrorKind::NotFound:     return "NotFoundError";
        case ErrorKind::InvalidMedia: return "InvalidMediaError";
        case ErrorKind::Timeline:     return "TimelineError";
        case ErrorKind::Render:       return "RenderError";
        case ErrorKind::Alignment:    return "AlignmentError";
        case ErrorKind::Config:       return "ConfigError";
        case ErrorKind::Cancelled:    return "CancelledError";
        case ErrorKind::JobConflict:  return "JobConflictError";
        case ErrorKind::Internal:     return "InternalError";
    }
    return "Unknown";
}

} // namespace ReelSync
