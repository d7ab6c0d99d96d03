#include "vidguard/session/Events.h"

namespace vidguard {
namespace events {

nlohmann::json connectionEstablished(const std::string& session_id) {
    return {
        {"type", "connection_established"},
        {"sessionId", session_id}
    };
}

nlohmann::json videoInfo(const vision::VideoProperties& props) {
    return {
        {"type", "video_info"},
        {"fps", props.fps},
        {"duration", props.duration},
        {"totalFrames", props.total_frames},
        {"width", props.width},
        {"height", props.height}
    };
}

nlohmann::json classification(const vision::ClassificationResult& result) {
    return {
        {"type", "classification"},
        {"timestamp", result.timestamp},
        {"frame", result.frame_index},
        {"label", result.label},
        {"confidence", result.confidence},
        {"is_nsfw", result.flagged}
    };
}

nlohmann::json error(const std::string& message) {
    return {
        {"type", "error"},
        {"message", message}
    };
}

nlohmann::json ping() {
    return {
        {"type", "ping"}
    };
}

nlohmann::json health(bool classifier_loaded) {
    return {
        {"status", "healthy"},
        {"classifier", classifier_loaded ? "loaded" : "unavailable"}
    };
}

} // namespace events
} // namespace vidguard
