#ifndef FAKESTORESERVER_H
#define FAKESTORESERVER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>

// Minimal HTTP endpoint standing in for the document store and the storage bucket
class FakeStoreServer : public QObject
{
    Q_OBJECT
public:
    struct Request
    {
        QByteArray method;
        QByteArray target;
        QByteArray authorization;
        QByteArray body;
    };

    explicit FakeStoreServer(QObject* parent = nullptr)
        : QObject(parent)
        , m_silent(false)
    {
        connect(&m_server, &QTcpServer::newConnection, this, &FakeStoreServer::onNewConnection);
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost, 0); }
    quint16 port() const { return m_server.serverPort(); }
    QString baseUrl() const { return QString("http://127.0.0.1:%1").arg(port()); }

    // Accepts requests but never answers
    void setSilent(bool silent) { m_silent = silent; }

    QList<Request> requests() const { return m_requests; }

private slots:
    void onNewConnection()
    {
        while (QTcpSocket* socket = m_server.nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

private:
    void onReadyRead(QTcpSocket* socket)
    {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        Request request;
        int contentLength = 0;
        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        request.method = requestLine.value(0);
        request.target = requestLine.value(1);
        for (int i = 1; i < lines.size(); ++i) {
            const QByteArray line = lines[i].trimmed();
            const int colon = line.indexOf(':');
            const QByteArray name = line.left(colon).trimmed().toLower();
            const QByteArray value = line.mid(colon + 1).trimmed();
            if (name == "content-length") {
                contentLength = value.toInt();
            } else if (name == "authorization") {
                request.authorization = value;
            }
        }

        if (buffer.size() < headerEnd + 4 + contentLength) {
            return;
        }
        request.body = buffer.mid(headerEnd + 4, contentLength);
        m_buffers.remove(socket);
        m_requests.append(request);

        if (m_silent) {
            return;
        }
        socket->write("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                      "Content-Length: 2\r\nConnection: close\r\n\r\n{}");
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    bool m_silent;
    QHash<QTcpSocket*, QByteArray> m_buffers;
    QList<Request> m_requests;
};

#endif // FAKESTORESERVER_H
