#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/StreamingCoordinator.h"
#include "vidguard/Errors.h"

#include <QDebug>
#include <QUuid>

#include <opencv2/imgproc.hpp>

#include <atomic>
#include <vector>

namespace fs = std::filesystem;

namespace vidguard {

struct SessionRegistry::Session {
    explicit Session(std::string sid) : id(std::move(sid)) {}

    const std::string id;

    // 锁顺序: state_mutex -> cursor_mutex
    std::mutex state_mutex;
    fs::path video_path;
    std::optional<vision::VideoProperties> properties;
    std::shared_ptr<MessageChannel> channel;
    std::shared_ptr<StreamingCoordinator> coordinator;

    std::mutex cursor_mutex;                    // every seek+read pair runs under this
    std::unique_ptr<vision::VideoAccess> video;

    std::atomic<bool> removing{false};
};

SessionRegistry::SessionRegistry(vision::Classifier* classifier,
                                 const ServerConfig& cfg,
                                 vision::VideoOpener opener)
    : classifier_(classifier),
      opener_(std::move(opener)),
      benign_label_(cfg.benign_label),
      scan_interval_s_(cfg.scan_interval_s),
      tick_delay_s_(cfg.tick_delay_s)
{
    if (!opener_) {
        opener_ = []() -> std::unique_ptr<vision::VideoAccess> {
            return std::make_unique<vision::CvVideoAccess>();
        };
    }
}

SessionRegistry::~SessionRegistry() {
    removeAll();
}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::string SessionRegistry::create() {
    std::string id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(id, std::make_shared<Session>(id));
    return id;
}

void SessionRegistry::adopt(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id)) return;
    sessions_.emplace(session_id, std::make_shared<Session>(session_id));
}

vision::VideoProperties SessionRegistry::attach(const std::string& session_id, const fs::path& video_path) {
    auto s = find(session_id);
    if (!s || s->removing) {
        throw ScanException(ScanError::SessionNotFound, "Session not found: " + session_id);
    }

    std::lock_guard<std::mutex> state(s->state_mutex);
    if (s->properties) return *s->properties;  // 已打开, 不再开第二个句柄

    // remove() deletes the file even when the open below fails
    s->video_path = video_path;

    std::unique_ptr<vision::VideoAccess> video = opener_();
    if (!video || !video->open(video_path.string())) {
        if (video) video->close();
        throw ScanException(ScanError::VideoUnreadable, "Could not open video file");
    }

    cv::Mat first;
    if (!video->readFrame(first) || first.empty()) {
        video->close();
        throw ScanException(ScanError::EmptyVideo, "Could not read video frames");
    }

    const vision::VideoProperties props = video->properties();
    if (!video->seekToFrame(0)) {
        qWarning() << "[Registry] Failed to rewind video for" << QString::fromStdString(session_id);
    }

    {
        std::lock_guard<std::mutex> cursor(s->cursor_mutex);
        s->video = std::move(video);
    }
    s->properties = props;

    qInfo() << "[Registry] Video initialized for session" << QString::fromStdString(session_id)
            << "fps=" << props.fps << "frames=" << props.total_frames
            << "size=" << props.width << "x" << props.height
            << "duration=" << props.duration << "s";
    return props;
}

bool SessionRegistry::bindConnection(const std::string& session_id, std::shared_ptr<MessageChannel> channel) {
    auto s = find(session_id);
    if (!s || s->removing) {
        qWarning() << "[Registry] bindConnection: no session" << QString::fromStdString(session_id);
        return false;
    }
    std::lock_guard<std::mutex> state(s->state_mutex);
    if (s->channel) {
        qWarning() << "[Registry] Session" << QString::fromStdString(session_id)
                   << "already has an active connection, rejecting";
        return false;
    }
    s->channel = std::move(channel);
    return true;
}

bool SessionRegistry::startStreaming(const std::string& session_id) {
    auto s = find(session_id);
    if (!s || s->removing) return false;

    std::lock_guard<std::mutex> state(s->state_mutex);
    // remove() may have begun after find(); it reads the coordinator under this lock
    if (s->removing) return false;
    if (!s->properties) {
        qWarning() << "[Registry] startStreaming before attach:" << QString::fromStdString(session_id);
        return false;
    }
    if (s->coordinator) {
        qWarning() << "[Registry] Coordinator already running for" << QString::fromStdString(session_id);
        return false;
    }
    s->coordinator = std::make_shared<StreamingCoordinator>(
        *this, session_id, s->properties->duration, scan_interval_s_, tick_delay_s_);
    s->coordinator->start();
    return true;
}

void SessionRegistry::waitForScan(const std::string& session_id) {
    auto s = find(session_id);
    if (!s) return;
    std::shared_ptr<StreamingCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> state(s->state_mutex);
        coordinator = s->coordinator;
    }
    if (coordinator) coordinator->wait();
}

std::shared_ptr<MessageChannel> SessionRegistry::channelFor(const std::string& session_id) const {
    auto s = find(session_id);
    if (!s || s->removing) return nullptr;
    std::lock_guard<std::mutex> state(s->state_mutex);
    return s->channel;
}

std::optional<vision::ClassificationResult>
SessionRegistry::classifyAt(const std::string& session_id, double timestamp) {
    auto s = find(session_id);
    if (!s || s->removing) {
        throw ScanException(ScanError::SessionNotFound, "Session not found");
    }

    std::optional<vision::VideoProperties> props;
    {
        std::lock_guard<std::mutex> state(s->state_mutex);
        props = s->properties;
    }
    if (!props) {
        throw ScanException(ScanError::VideoNotInitialized, "Video not initialized");
    }
    if (!classifierReady()) {
        throw ScanException(ScanError::ClassifierUnavailable, "Classifier not loaded");
    }

    const int64_t frame_index = props->frameIndexAt(timestamp);
    if (!props->contains(frame_index)) return std::nullopt;

    cv::Mat bgr;
    {
        std::lock_guard<std::mutex> cursor(s->cursor_mutex);
        if (!s->video || !s->video->isOpened()) {
            throw ScanException(ScanError::VideoClosed, "Video capture is closed");
        }
        if (!s->video->seekToFrame(frame_index) || !s->video->readFrame(bgr) || bgr.empty()) {
            throw ScanException(ScanError::FrameReadError,
                                "Could not read frame at timestamp " + std::to_string(timestamp));
        }
    }

    vision::ClassifierOutput out;
    try {
        cv::Mat rgb;
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
        out = classifier_->classify(rgb);
    } catch (const std::exception& e) {
        throw ScanException(ScanError::ClassificationFailed, std::string("Classification failed: ") + e.what());
    }

    vision::ClassificationResult r;
    r.timestamp   = timestamp;
    r.frame_index = frame_index;
    r.label       = out.label;
    r.confidence  = out.score;
    r.flagged     = vision::isFlaggedLabel(out.label, benign_label_);
    return r;
}

void SessionRegistry::remove(const std::string& session_id) {
    auto s = find(session_id);
    if (!s) return;
    if (s->removing.exchange(true)) return;  // 另一个调用者正在拆除

    qInfo() << "[Registry] Cleaning up session" << QString::fromStdString(session_id);

    // 1. cancel the coordinator and wait for it to leave run()
    std::shared_ptr<StreamingCoordinator> coordinator;
    fs::path video_path;
    {
        std::lock_guard<std::mutex> state(s->state_mutex);
        coordinator = s->coordinator;
        video_path = s->video_path;
    }
    if (coordinator) {
        coordinator->cancel();
        coordinator->wait();
    }

    // 2. close the decode handle; waits for any in-flight seek+read
    {
        std::lock_guard<std::mutex> cursor(s->cursor_mutex);
        if (s->video) {
            try {
                s->video->close();
            } catch (const std::exception& e) {
                qWarning() << "[Registry] Error closing video:" << e.what();
            }
            s->video.reset();
        }
    }

    // 3. delete the backing file
    if (!video_path.empty()) {
        std::error_code ec;
        if (fs::remove(video_path, ec)) {
            qInfo() << "[Registry] Removed video file" << QString::fromStdString(video_path.string());
        } else if (ec) {
            qWarning() << "[Registry] Failed to remove" << QString::fromStdString(video_path.string())
                       << ":" << QString::fromStdString(ec.message());
        }
    }

    // 4. drop the connection reference
    {
        std::lock_guard<std::mutex> state(s->state_mutex);
        s->channel.reset();
    }

    // 5. erase
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    }
    qInfo() << "[Registry] Session" << QString::fromStdString(session_id) << "removed";
}

void SessionRegistry::removeAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(sessions_.size());
        for (const auto& kv : sessions_) ids.push_back(kv.first);
    }
    for (const auto& id : ids) remove(id);
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::optional<vision::VideoProperties> SessionRegistry::propertiesOf(const std::string& session_id) const {
    auto s = find(session_id);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> state(s->state_mutex);
    return s->properties;
}

} // namespace vidguard
