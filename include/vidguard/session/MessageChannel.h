#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace vidguard {

// 会话的出站消息通道 (one client connection)
// send() may be called from the coordinator thread and from worker threads.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    // fire-and-forget; false means the event could not be delivered.
    // callers then close() the channel so the disconnect path tears the session down
    virtual bool send(const nlohmann::json& event) = 0;

    // terminate the connection from the server side
    virtual void close(const std::string& reason) = 0;
};

} // namespace vidguard
