#pragma once
#include <stdexcept>
#include <string>

namespace vidguard {

// Enumeration: error conditions surfaced by the session core.
enum class ScanError {
    SessionNotFound = 0,
    VideoNotInitialized,
    ClassifierUnavailable,
    VideoUnreadable,
    EmptyVideo,
    VideoFileMissing,
    FrameReadError,
    ClassificationFailed,
    VideoClosed,
    UnsupportedFormat,
    FileTooLarge,
    ImportFailed
};

inline std::string toString(ScanError e) {
    switch (e) {
        case ScanError::SessionNotFound:       return "SessionNotFound";
        case ScanError::VideoNotInitialized:   return "VideoNotInitialized";
        case ScanError::ClassifierUnavailable: return "ClassifierUnavailable";
        case ScanError::VideoUnreadable:       return "VideoUnreadable";
        case ScanError::EmptyVideo:            return "EmptyVideo";
        case ScanError::VideoFileMissing:      return "VideoFileMissing";
        case ScanError::FrameReadError:        return "FrameReadError";
        case ScanError::ClassificationFailed:  return "ClassificationFailed";
        case ScanError::VideoClosed:           return "VideoClosed";
        case ScanError::UnsupportedFormat:     return "UnsupportedFormat";
        case ScanError::FileTooLarge:          return "FileTooLarge";
        case ScanError::ImportFailed:          return "ImportFailed";
        default:                               return "Unknown";
    }
}

// Per-tick errors: reported to the client, the scan goes on.
inline bool isTransient(ScanError e) {
    return e == ScanError::FrameReadError || e == ScanError::ClassificationFailed;
}

// The session (or its video handle) is gone: the scan stops without further events.
inline bool isSessionGone(ScanError e) {
    return e == ScanError::VideoClosed ||
           e == ScanError::SessionNotFound ||
           e == ScanError::VideoNotInitialized;
}

class ScanException : public std::runtime_error {
public:
    ScanException(ScanError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ScanError code() const { return code_; }

private:
    ScanError code_;
};

} // namespace vidguard
