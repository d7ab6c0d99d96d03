#pragma once
#include <QObject>
#include <QPointer>
#include <QWebSocket>

#include <atomic>
#include <memory>

#include "vidguard/session/MessageChannel.h"

namespace vidguard {

// MessageChannel over one QWebSocket.
// send()/close() may be called from any thread; the socket is only touched on the thread owning this object.
class WsChannel : public QObject, public MessageChannel {
    Q_OBJECT
public:
    explicit WsChannel(QWebSocket* socket);

    // shared_ptr whose deleter calls deleteLater()
    static std::shared_ptr<WsChannel> create(QWebSocket* socket);

    bool send(const nlohmann::json& event) override;
    void close(const std::string& reason) override;

    // socket reported disconnected
    void markClosed() { open_ = false; }
    bool isOpen() const { return open_; }

private:
    QPointer<QWebSocket> socket_;
    std::atomic<bool> open_{true};
};

} // namespace vidguard
