#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "vidguard/session/MessageChannel.h"

namespace vidguard {

class SessionRegistry;
class VideoStore;

/*  SessionProtocol 单连接协议状态机
*
*   Connecting -> Attaching -> Streaming -> Closed
*
*   Transport-agnostic: the gateway feeds it connection events and text frames, outbound traffic
*   goes through the bound MessageChannel. Entering Closed tears the session down, except when the
*   connection was refused as a duplicate (the session belongs to the first connection).
*/
class SessionProtocol {
public:
    enum class State { Connecting, Attaching, Streaming, Closed };

    // runs on-demand process_frame work off the receive path (default: QThreadPool::globalInstance())
    using TaskRunner = std::function<void(std::function<void()>)>;

    SessionProtocol(std::string session_id,
                    SessionRegistry& registry,
                    const VideoStore& store,
                    TaskRunner runner = TaskRunner());

    void onConnected(std::shared_ptr<MessageChannel> channel);
    void onTextMessage(const std::string& text);
    void onIdleTimeout();
    void onDisconnected();

    State state() const;
    const std::string& sessionId() const { return session_id_; }

private:
    bool attachVideo();
    void handleProcessFrame(double timestamp);

    // send on the bound channel; a failed delivery closes the session
    bool deliver(const nlohmann::json& event);
    // error event + server side close + teardown
    void fail(const std::string& message);
    void closeSession();

    const std::string session_id_;
    SessionRegistry& registry_;
    const VideoStore& store_;
    TaskRunner runner_;

    mutable std::mutex mutex_;
    State state_ = State::Connecting;
    std::shared_ptr<MessageChannel> channel_;
    bool owns_session_ = false;
};

const char* toString(SessionProtocol::State s);

} // namespace vidguard
