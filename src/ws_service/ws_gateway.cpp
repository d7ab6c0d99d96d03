#include <ws/ws_gateway.hpp>
#include <ws/ws_channel.hpp>

#include "vidguard/session/Events.h"
#include "vidguard/session/SessionProtocol.h"
#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/VideoStore.h"

#include <QDebug>
#include <QRegularExpression>
#include <QUrl>

namespace vidguard {

bool isValidSessionId(const QString& id) {
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9_-]{1,128}$"));
    return re.match(id).hasMatch();
}

WsGateway::WsGateway(SessionRegistry& registry, const VideoStore& store, const ServerConfig& cfg,
                     QObject* parent)
    : QObject(parent),
      registry_(registry),
      store_(store),
      idle_timeout_ms_(cfg.idle_timeout_s > 0 ? cfg.idle_timeout_s * 1000 : 30000),
      server_(QStringLiteral("vidguard-WS"), QWebSocketServer::NonSecureMode, this)
{
    connect(&server_, &QWebSocketServer::newConnection, this, &WsGateway::onNewConnection);
}

WsGateway::~WsGateway() {
    stop();
}

bool WsGateway::start(quint16 port, const QHostAddress& host) {
    if (!server_.listen(host, port)) {
        qWarning() << "[WS] Gateway start failed on" << host.toString() << ":" << port
                   << server_.errorString();
        return false;
    }
    qInfo() << "[WS] Listening on" << host.toString() << ":" << server_.serverPort();
    emit started();
    return true;
}

void WsGateway::stop() {
    if (server_.isListening()) server_.close();
    // sockets are children of the server; their disconnected handlers drive teardown
    const auto sockets = connections_.keys();
    for (QWebSocket* socket : sockets) {
        onSocketClosed(socket);
    }
}

void WsGateway::onNewConnection() {
    while (QWebSocket* socket = server_.nextPendingConnection()) {
        const QString path = socket->requestUrl().path();

        if (path == QLatin1String("/health")) {
            serveHealth(socket);
            continue;
        }

        static const QString prefix = QStringLiteral("/ws/");
        const QString id = path.startsWith(prefix) ? path.mid(prefix.size()) : QString();
        if (!isValidSessionId(id)) {
            qWarning() << "[WS] Refusing connection to" << path;
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated, QStringLiteral("unknown path"));
            socket->deleteLater();
            continue;
        }
        serveSession(socket, id);
    }
}

void WsGateway::serveHealth(QWebSocket* socket) {
    const auto reply = events::health(registry_.classifierReady());
    connect(socket, &QWebSocket::disconnected, socket, &QObject::deleteLater);
    socket->sendTextMessage(QString::fromStdString(reply.dump()));
    socket->close(QWebSocketProtocol::CloseCodeNormal);
}

void WsGateway::serveSession(QWebSocket* socket, const QString& session_id) {
    const std::string sid = session_id.toStdString();
    registry_.adopt(sid);

    auto conn = std::make_shared<Connection>();
    conn->channel  = WsChannel::create(socket);
    conn->protocol = std::make_unique<SessionProtocol>(sid, registry_, store_);
    conn->idle     = new QTimer(socket);
    conn->idle->setInterval(idle_timeout_ms_);
    connections_.insert(socket, conn);

    connect(conn->idle, &QTimer::timeout, this, [conn] {
        conn->protocol->onIdleTimeout();
    });

    // 处理连接后的消息
    connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
        onSocketText(socket, message);
    });

    // 处理断开连接
    connect(socket, &QWebSocket::disconnected, this, [this, socket] {
        onSocketClosed(socket);
    });

    conn->idle->start();
    conn->protocol->onConnected(conn->channel);
}

void WsGateway::onSocketText(QWebSocket* socket, const QString& text) {
    auto conn = connections_.value(socket);
    if (!conn) return;
    conn->idle->start();  // restart
    conn->protocol->onTextMessage(text.toStdString());
}

void WsGateway::onSocketClosed(QWebSocket* socket) {
    auto conn = connections_.take(socket);
    if (!conn) return;
    conn->idle->stop();
    conn->channel->markClosed();
    conn->protocol->onDisconnected();
    socket->disconnect(this);
    socket->deleteLater();
}

} // namespace vidguard
