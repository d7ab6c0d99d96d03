#pragma once
#include <QMutex>
#include <QThread>
#include <QWaitCondition>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace vidguard {

class MessageChannel;
class SessionRegistry;

// ---------------- 扫描线程 ----------------
// Per-session background loop: advances a virtual clock from 0 to the video duration,
// classifies the frame at each tick and pushes the result to the session's channel.
// cancel() is observed at every tick boundary and interrupts the inter-tick wait.
class StreamingCoordinator : public QThread {
    Q_OBJECT
public:
    StreamingCoordinator(SessionRegistry& registry,
                         std::string session_id,
                         double duration_s,
                         double scan_interval_s,
                         double tick_delay_s,
                         QObject* parent = nullptr);
    ~StreamingCoordinator() override;

    void cancel();
    bool isCancelled() const { return isInterruptionRequested(); }

    // ticks completed so far (classification attempted)
    int ticks() const;

protected:
    void run() override;

private:
    // false -> stop the loop
    bool tick(double t);
    // send, closing the channel when the event cannot be delivered
    bool deliver(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& event);
    void pause();

    SessionRegistry& registry_;
    const std::string session_id_;
    const double duration_s_;
    const double interval_s_;
    const double delay_s_;

    mutable QMutex mutex_;
    QWaitCondition wake_;
    int ticks_ = 0;
};

} // namespace vidguard
