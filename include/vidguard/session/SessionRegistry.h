#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "vidguard/Config.h"
#include "vidguard/session/MessageChannel.h"
#include "vidguard/vision/Classifier.h"
#include "vidguard/vision/Types.h"
#include "vidguard/vision/VideoAccess.h"

namespace vidguard {

class StreamingCoordinator;

/*  SessionRegistry 会话表
*
*   One table of session records: id -> {video path, properties, decode handle, coordinator, connection}.
*   The table mutex is held for lookup/insert/erase only. Decoding runs under the per-session
*   cursor lock, classification runs outside every lock.
*
*   Teardown order in remove(): cancel + join coordinator -> close decode handle -> delete file ->
*   drop connection -> erase entry.
*/
class SessionRegistry {
public:
    // classifier may be null (treated as not loaded). opener defaults to CvVideoAccess.
    SessionRegistry(vision::Classifier* classifier,
                    const ServerConfig& cfg,
                    vision::VideoOpener opener = vision::VideoOpener());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // fresh UUID, no resources yet
    std::string create();

    // register an id issued elsewhere; no-op if present
    void adopt(const std::string& session_id);

    // open the video and snapshot its properties. Idempotent once attached.
    // Throws ScanException: SessionNotFound / VideoUnreadable / EmptyVideo.
    vision::VideoProperties attach(const std::string& session_id, const std::filesystem::path& video_path);

    // single active connection per session; false on a second bind or unknown id
    bool bindConnection(const std::string& session_id, std::shared_ptr<MessageChannel> channel);

    // start the per-session coordinator; false if not attached, being removed, or already started
    bool startStreaming(const std::string& session_id);

    // block until the coordinator has finished (no-op when none was started)
    void waitForScan(const std::string& session_id);

    // null when missing, unbound, or teardown has begun
    std::shared_ptr<MessageChannel> channelFor(const std::string& session_id) const;

    // classify the frame at timestamp; nullopt when the frame index is outside the video.
    // Throws ScanException (SessionNotFound / VideoNotInitialized / ClassifierUnavailable /
    // VideoClosed / FrameReadError / ClassificationFailed).
    std::optional<vision::ClassificationResult> classifyAt(const std::string& session_id, double timestamp);

    // idempotent teardown, unknown id is a no-op
    void remove(const std::string& session_id);
    void removeAll();

    bool contains(const std::string& session_id) const;
    std::size_t size() const;
    std::optional<vision::VideoProperties> propertiesOf(const std::string& session_id) const;

    bool classifierReady() const { return classifier_ && classifier_->isReady(); }

private:
    struct Session;
    std::shared_ptr<Session> find(const std::string& session_id) const;

    vision::Classifier* classifier_;
    vision::VideoOpener opener_;
    std::string benign_label_;
    double scan_interval_s_;
    double tick_delay_s_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace vidguard
