#include <QCoreApplication>
#include <QHostAddress>
#include <QThreadPool>
#include <QDebug>

#include <iostream>
#include <string>
#include <vector>

#include <ws/ws_gateway.hpp>
#include "vidguard/Config.h"
#include "vidguard/Errors.h"
#include "vidguard/Runtime.h"
#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/VideoStore.h"

// Usage:
//   vidguard_server [--config assets/config/server.yml] [--import video]... [--cleanup]

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true; return false;
}
static const char* getOpt(int argc, char** argv, const std::string& key, const char* defv=nullptr) {
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) return argv[i+1]; return defv;
}
static std::vector<std::string> getOpts(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) out.emplace_back(argv[++i]);
    return out;
}

int main(int argc, char* argv[]) {
    if (hasFlag(argc, argv, "-h") || hasFlag(argc, argv, "--help")) {
        std::cout << "Usage: vidguard_server [--config file] [--import video]... [--cleanup]\n";
        return 0;
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("vidguard_server"));

    const std::string config_path = getOpt(argc, argv, "--config", "assets/config/server.yml");
    const vidguard::ServerConfig cfg = vidguard::ServerConfig::fromFile(config_path);

    vidguard::VideoStore store(cfg);
    if (!store.prepareDirectories()) return 1;

    if (hasFlag(argc, argv, "--cleanup")) {
        const auto removed = store.cleanupAll();
        for (const auto& name : removed) std::cout << name << "\n";
        std::cout << "Cleaned up " << removed.size() << " files\n";
        return 0;
    }

    // 进程级对象: 分类器与会话表只建一次
    auto classifier = vidguard::loadClassifier(cfg);
    vidguard::SessionRegistry registry(classifier.get(), cfg);

    for (const auto& video : getOpts(argc, argv, "--import")) {
        const std::string sid = registry.create();
        try {
            store.import(sid, video);
            std::cout << sid << "  " << video << "\n";
        } catch (const vidguard::ScanException& e) {
            registry.remove(sid);
            std::cerr << "[Server] Import of " << video << " failed ("
                      << vidguard::toString(e.code()) << "): " << e.what() << "\n";
        }
    }

    vidguard::WsGateway gateway(registry, store, cfg);
    if (!gateway.start(static_cast<quint16>(cfg.port), QHostAddress(QString::fromStdString(cfg.host)))) {
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&] {
        gateway.stop();
        QThreadPool::globalInstance()->waitForDone();
        registry.removeAll();
        qInfo() << "[Server] Shutdown complete";
    });

    return app.exec();
}
