#pragma once
#include <QObject>
#include <QHttpServer>
#include <QTcpServer>
#include <QHostAddress>
#include <memory>
#include <vector>
#include "controller.h"

namespace Http {

    /**
     * @brief Owns a QHttpServer bound to one listening socket and the controllers routed on it
     */
    class Server : public QObject {
        Q_OBJECT
    public:
        explicit Server(QObject* parent = nullptr);
        ~Server() override;

        void registerController(std::shared_ptr<Controller> controller);

        // Port 0 picks an ephemeral port (tests); the agent binds a fixed loopback port
        bool start(quint16 port, const QHostAddress& address = QHostAddress::LocalHost);
        void stop();
        bool isRunning() const;
        quint16 port() const;
        QHostAddress address() const;
        QString lastError() const { return m_lastError; }

    private:
        QHttpServer server;
        std::unique_ptr<QTcpServer> tcpServer;
        std::vector<std::shared_ptr<Controller>> controllers;
        QString m_lastError;
    };

} // namespace Http
