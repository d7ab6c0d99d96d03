#include <ws/ws_channel.hpp>

#include <QDebug>
#include <QMetaObject>
#include <QString>

namespace vidguard {

WsChannel::WsChannel(QWebSocket* socket)
    : QObject(nullptr),
      socket_(socket)
{
}

std::shared_ptr<WsChannel> WsChannel::create(QWebSocket* socket) {
    return std::shared_ptr<WsChannel>(new WsChannel(socket), [](WsChannel* ch) { ch->deleteLater(); });
}

bool WsChannel::send(const nlohmann::json& event) {
    if (!open_) return false;

    const QString text = QString::fromStdString(event.dump());
    QMetaObject::invokeMethod(this, [this, text] {
        if (!socket_ || socket_->state() != QAbstractSocket::ConnectedState) return;
        if (socket_->sendTextMessage(text) == 0) {
            qWarning() << "[WS] sendTextMessage failed, aborting socket";
            open_ = false;
            socket_->abort();
        }
    }, Qt::QueuedConnection);
    return true;
}

void WsChannel::close(const std::string& reason) {
    open_ = false;
    const QString why = QString::fromStdString(reason);
    QMetaObject::invokeMethod(this, [this, why] {
        if (socket_) socket_->close(QWebSocketProtocol::CloseCodeNormal, why);
    }, Qt::QueuedConnection);
}

} // namespace vidguard
