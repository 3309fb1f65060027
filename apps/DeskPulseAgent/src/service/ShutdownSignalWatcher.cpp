#include "ShutdownSignalWatcher.h"
#include "logger/logger.h"

#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

int ShutdownSignalWatcher::s_fds[2] = {-1, -1};

ShutdownSignalWatcher::ShutdownSignalWatcher(QObject* parent)
    : QObject(parent)
    , m_notifier(nullptr)
{
}

ShutdownSignalWatcher::~ShutdownSignalWatcher()
{
    if (!isInstalled()) {
        return;
    }
    restoreHandlers();
    delete m_notifier;
    ::close(s_fds[0]);
    ::close(s_fds[1]);
    s_fds[0] = -1;
    s_fds[1] = -1;
}

bool ShutdownSignalWatcher::install(const QList<int>& signalNumbers)
{
    if (isInstalled()) {
        return true;
    }
    if (s_fds[0] != -1) {
        m_lastError = "Another shutdown signal watcher is already installed";
        LOG_ERROR(m_lastError);
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_fds) != 0) {
        m_lastError = QString("socketpair failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        LOG_ERROR(m_lastError);
        s_fds[0] = -1;
        s_fds[1] = -1;
        return false;
    }

    m_notifier = new QSocketNotifier(s_fds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &ShutdownSignalWatcher::onReadable);

    for (int signalNumber : signalNumbers) {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = &ShutdownSignalWatcher::handleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        struct sigaction previous;
        if (::sigaction(signalNumber, &action, &previous) != 0) {
            m_lastError = QString("sigaction(%1) failed: %2")
                              .arg(signalNumber)
                              .arg(QString::fromLocal8Bit(std::strerror(errno)));
            LOG_ERROR(m_lastError);
            restoreHandlers();
            delete m_notifier;
            m_notifier = nullptr;
            ::close(s_fds[0]);
            ::close(s_fds[1]);
            s_fds[0] = -1;
            s_fds[1] = -1;
            return false;
        }
        m_previous.append(qMakePair(signalNumber, previous));
    }

    LOG_DEBUG(QString("Watching %1 shutdown signals").arg(m_previous.size()));
    return true;
}

bool ShutdownSignalWatcher::isInstalled() const
{
    return m_notifier != nullptr;
}

QString ShutdownSignalWatcher::lastError() const
{
    return m_lastError;
}

// Runs in signal context: write(2) only
void ShutdownSignalWatcher::handleSignal(int signalNumber)
{
    const char byte = static_cast<char>(signalNumber);
    const ssize_t written = ::write(s_fds[0], &byte, sizeof(byte));
    (void)written;
}

void ShutdownSignalWatcher::onReadable()
{
    m_notifier->setEnabled(false);
    char byte = 0;
    if (::read(s_fds[1], &byte, sizeof(byte)) == sizeof(byte)) {
        const int signalNumber = static_cast<unsigned char>(byte);
        LOG_INFO(QString("Received signal: %1").arg(signalNumber));
        emit terminationRequested(signalNumber);
    } else {
        LOG_WARNING("Shutdown signal pipe read failed");
    }
    m_notifier->setEnabled(true);
}

void ShutdownSignalWatcher::restoreHandlers()
{
    for (const auto& previous : m_previous) {
        ::sigaction(previous.first, &previous.second, nullptr);
    }
    m_previous.clear();
}
