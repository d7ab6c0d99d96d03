#include "vidguard/session/SessionProtocol.h"
#include "vidguard/session/Events.h"
#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/VideoStore.h"
#include "vidguard/Errors.h"

#include <QDebug>
#include <QThreadPool>

namespace vidguard {

namespace {

// worker-side delivery; the disconnect handler owns the teardown
void sendOrClose(MessageChannel& channel, const nlohmann::json& event, const std::string& sid) {
    if (channel.send(event)) return;
    qWarning() << "[Protocol] Delivery failed, closing connection for" << QString::fromStdString(sid);
    channel.close("delivery failed");
}

} // namespace

const char* toString(SessionProtocol::State s) {
    switch (s) {
        case SessionProtocol::State::Connecting: return "Connecting";
        case SessionProtocol::State::Attaching:  return "Attaching";
        case SessionProtocol::State::Streaming:  return "Streaming";
        case SessionProtocol::State::Closed:     return "Closed";
        default:                                 return "Unknown";
    }
}

SessionProtocol::SessionProtocol(std::string session_id,
                                 SessionRegistry& registry,
                                 const VideoStore& store,
                                 TaskRunner runner)
    : session_id_(std::move(session_id)),
      registry_(registry),
      store_(store),
      runner_(std::move(runner))
{
    if (!runner_) {
        runner_ = [](std::function<void()> task) {
            QThreadPool::globalInstance()->start(std::move(task));
        };
    }
}

SessionProtocol::State SessionProtocol::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SessionProtocol::onConnected(std::shared_ptr<MessageChannel> channel) {
    const QString sid = QString::fromStdString(session_id_);
    qInfo() << "[Protocol] WebSocket connection for session" << sid;

    if (!registry_.bindConnection(session_id_, channel)) {
        // 重复连接: 拒绝, 不影响已有会话
        channel->send(events::error("Session already has an active connection"));
        channel->close("duplicate connection");
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Closed;
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = channel;
        owns_session_ = true;
    }

    if (!deliver(events::connectionEstablished(session_id_))) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Attaching;
    }
    if (!attachVideo()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Attaching) state_ = State::Streaming;
}

bool SessionProtocol::attachVideo() {
    auto path = store_.locate(session_id_);
    if (!path) {
        qWarning() << "[Protocol] No video found for session" << QString::fromStdString(session_id_);
        fail("Video file not found");
        return false;
    }
    if (!registry_.classifierReady()) {
        fail("Classifier not loaded");
        return false;
    }

    vision::VideoProperties props;
    try {
        props = registry_.attach(session_id_, *path);
    } catch (const ScanException& e) {
        qWarning() << "[Protocol] Attach failed:" << QString::fromStdString(toString(e.code())) << e.what();
        fail(e.what());
        return false;
    }

    if (!deliver(events::videoInfo(props))) return false;

    if (!registry_.startStreaming(session_id_)) {
        qWarning() << "[Protocol] Coordinator not started for" << QString::fromStdString(session_id_);
    }
    return true;
}

void SessionProtocol::onTextMessage(const std::string& text) {
    if (state() == State::Closed) return;

    nlohmann::json msg = nlohmann::json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        qWarning() << "[Protocol] Invalid JSON received:" << QString::fromStdString(text.substr(0, 200));
        return;
    }

    const auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        qWarning() << "[Protocol] Message without type field";
        return;
    }
    const std::string type = type_it->get<std::string>();

    if (type == "process_frame") {
        const auto ts = msg.find("timestamp");
        if (ts == msg.end() || !ts->is_number()) {
            qWarning() << "[Protocol] process_frame without numeric timestamp";
            return;
        }
        handleProcessFrame(ts->get<double>());
    }
    else if (type == "connect") {
        qDebug() << "[Protocol] Client connected to session" << QString::fromStdString(session_id_);
    }
    else if (type == "pong") {
        qDebug() << "[Protocol] pong from" << QString::fromStdString(session_id_);
    }
    else {
        qDebug() << "[Protocol] Received unknown message type:" << QString::fromStdString(type);
    }
}

void SessionProtocol::handleProcessFrame(double timestamp) {
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (!channel) return;

    // 不捕获 this: 任务可能比协议对象活得久
    SessionRegistry& registry = registry_;
    const std::string sid = session_id_;
    runner_([&registry, sid, channel, timestamp] {
        try {
            auto result = registry.classifyAt(sid, timestamp);
            if (result) sendOrClose(*channel, events::classification(*result), sid);
        } catch (const ScanException& e) {
            sendOrClose(*channel, events::error(e.what()), sid);
        } catch (const std::exception& e) {
            sendOrClose(*channel, events::error(std::string("Error processing frame: ") + e.what()), sid);
        }
    });
}

void SessionProtocol::onIdleTimeout() {
    if (state() != State::Streaming) return;
    qDebug() << "[Protocol] Idle, sending ping to" << QString::fromStdString(session_id_);
    deliver(events::ping());
}

void SessionProtocol::onDisconnected() {
    qInfo() << "[Protocol] Client disconnected from session" << QString::fromStdString(session_id_);
    closeSession();
}

bool SessionProtocol::deliver(const nlohmann::json& event) {
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (channel && channel->send(event)) return true;

    qWarning() << "[Protocol] Delivery failed, closing session" << QString::fromStdString(session_id_);
    if (channel) channel->close("delivery failed");
    closeSession();
    return false;
}

void SessionProtocol::fail(const std::string& message) {
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (channel) {
        channel->send(events::error(message));
        channel->close(message);
    }
    closeSession();
}

void SessionProtocol::closeSession() {
    bool owns = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Closed;
        owns = owns_session_;
        owns_session_ = false;
        channel_.reset();
    }
    // remove() is idempotent; teardown runs even if the last event was lost
    if (owns) registry_.remove(session_id_);
}

} // namespace vidguard
