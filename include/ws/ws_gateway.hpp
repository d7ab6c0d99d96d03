#pragma once
#include <QObject>
#include <QHash>
#include <QHostAddress>
#include <QTimer>
#include <QWebSocket>
#include <QWebSocketServer>

#include <memory>

#include "vidguard/Config.h"

namespace vidguard {

class SessionRegistry;
class SessionProtocol;
class VideoStore;
class WsChannel;

// WebSocket 网关: /ws/<session_id> -> SessionProtocol, /health -> status reply
class WsGateway : public QObject {
    Q_OBJECT
public:
    WsGateway(SessionRegistry& registry, const VideoStore& store, const ServerConfig& cfg,
              QObject* parent = nullptr);
    ~WsGateway() override;

    bool start(quint16 port, const QHostAddress& host = QHostAddress::Any);
    void stop();

    int connectionCount() const { return connections_.size(); }

signals:
    void started();

private slots:
    void onNewConnection();

private:
    struct Connection {
        std::unique_ptr<SessionProtocol> protocol;
        std::shared_ptr<WsChannel> channel;
        QTimer* idle = nullptr;   // parented to the socket
    };

    void serveHealth(QWebSocket* socket);
    void serveSession(QWebSocket* socket, const QString& session_id);
    void onSocketText(QWebSocket* socket, const QString& text);
    void onSocketClosed(QWebSocket* socket);

    SessionRegistry& registry_;
    const VideoStore& store_;
    int idle_timeout_ms_;

    QWebSocketServer server_;
    QHash<QWebSocket*, std::shared_ptr<Connection>> connections_;
};

// accepts UUID-like ids only ([A-Za-z0-9_-]), the id becomes a file name
bool isValidSessionId(const QString& id);

} // namespace vidguard
