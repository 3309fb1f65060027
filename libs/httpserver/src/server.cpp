#include "httpserver/server.h"
#include "logger/logger.h"

namespace Http {

    Server::Server(QObject* parent)
        : QObject(parent)
    {
    }

    Server::~Server() = default;

    void Server::registerController(std::shared_ptr<Controller> controller) {
        if (controller) {
            controller->setupRoutes(server);
            controllers.push_back(controller);
        }
    }

    bool Server::start(quint16 port, const QHostAddress& address) {
        if (isRunning()) {
            LOG_WARNING("HTTP server already listening");
            return true;
        }

        // QHttpServer takes ownership of a bound QTcpServer; a failed listen keeps it ours
        auto listener = std::make_unique<QTcpServer>();
        if (!listener->listen(address, port)) {
            m_lastError = listener->errorString();
            LOG_ERROR(QString("Failed to listen on %1:%2: %3")
                      .arg(address.toString()).arg(port).arg(m_lastError));
            return false;
        }

        if (!server.bind(listener.get())) {
            m_lastError = "QHttpServer refused the listening socket";
            LOG_ERROR(m_lastError);
            return false;
        }

        tcpServer = std::move(listener);
        LOG_INFO(QString("HTTP server listening on %1:%2")
                 .arg(address.toString()).arg(tcpServer->serverPort()));
        return true;
    }

    void Server::stop() {
        if (tcpServer && tcpServer->isListening()) {
            tcpServer->close();
            LOG_INFO("HTTP server stopped");
        }
    }

    bool Server::isRunning() const {
        return tcpServer && tcpServer->isListening();
    }

    quint16 Server::port() const {
        return isRunning() ? tcpServer->serverPort() : 0;
    }

    QHostAddress Server::address() const {
        return isRunning() ? tcpServer->serverAddress() : QHostAddress::LocalHost;
    }

} // namespace Http
