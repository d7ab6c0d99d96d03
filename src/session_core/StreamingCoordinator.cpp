#include "vidguard/session/StreamingCoordinator.h"
#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/Events.h"
#include "vidguard/session/MessageChannel.h"
#include "vidguard/Errors.h"

#include <QDebug>
#include <QMutexLocker>

#include <cmath>

namespace vidguard {

StreamingCoordinator::StreamingCoordinator(SessionRegistry& registry,
                                           std::string session_id,
                                           double duration_s,
                                           double scan_interval_s,
                                           double tick_delay_s,
                                           QObject* parent)
    : QThread(parent),
      registry_(registry),
      session_id_(std::move(session_id)),
      duration_s_(duration_s),
      interval_s_(scan_interval_s > 0.0 ? scan_interval_s : 0.5),
      delay_s_(tick_delay_s > 0.0 ? tick_delay_s : 0.0)
{
}

StreamingCoordinator::~StreamingCoordinator() {
    cancel();
    wait();
}

void StreamingCoordinator::cancel() {
    requestInterruption();
    QMutexLocker lock(&mutex_);
    wake_.wakeAll();
}

int StreamingCoordinator::ticks() const {
    QMutexLocker lock(&mutex_);
    return ticks_;
}

void StreamingCoordinator::run() {
    const QString sid = QString::fromStdString(session_id_);
    qInfo() << "[Coordinator] Starting continuous processing for session" << sid;

    double t = 0.0;
    while (t < duration_s_ && !isInterruptionRequested()) {
        if (!tick(t)) break;
        t += interval_s_;
        pause();
    }

    qInfo() << "[Coordinator] Processing stopped for session" << sid << "at t=" << t
            << (isInterruptionRequested() ? "(cancelled)" : "");
}

bool StreamingCoordinator::tick(double t) {
    auto channel = registry_.channelFor(session_id_);
    if (!channel) return false;  // 无连接或正在拆除

    {
        QMutexLocker lock(&mutex_);
        ++ticks_;
    }

    try {
        auto result = registry_.classifyAt(session_id_, t);
        return !result || deliver(channel, events::classification(*result));
    } catch (const ScanException& e) {
        if (isSessionGone(e.code())) {
            qDebug() << "[Coordinator]" << QString::fromStdString(toString(e.code())) << "- stopping";
            return false;
        }
        qWarning() << "[Coordinator] Error at t=" << t << ":" << e.what();
        if (!deliver(channel, events::error(e.what()))) return false;
        // classifier will not come back during this session
        return isTransient(e.code());
    } catch (const std::exception& e) {
        qWarning() << "[Coordinator] Unexpected error at t=" << t << ":" << e.what();
        return deliver(channel, events::error(std::string("Error processing frame: ") + e.what()));
    }
}

bool StreamingCoordinator::deliver(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& event) {
    if (channel->send(event)) return true;
    qWarning() << "[Coordinator] Delivery failed, closing connection for" << QString::fromStdString(session_id_);
    channel->close("delivery failed");
    return false;
}

void StreamingCoordinator::pause() {
    if (delay_s_ <= 0.0) return;
    QMutexLocker lock(&mutex_);
    if (isInterruptionRequested()) return;
    wake_.wait(&mutex_, static_cast<unsigned long>(std::lround(delay_s_ * 1000.0)));
}

} // namespace vidguard
