#ifndef SHUTDOWNSIGNALWATCHER_H
#define SHUTDOWNSIGNALWATCHER_H

#include <QList>
#include <QObject>
#include <QPair>

#include <signal.h>

class QSocketNotifier;

/**
 * @brief Turns SIGINT/SIGTERM into a Qt signal on the event loop
 *
 * The POSIX handler only writes the signal number to a socket pair; logging,
 * quitting and the emergency checkout all run from terminationRequested().
 * One watcher may be installed per process.
 */
class ShutdownSignalWatcher : public QObject
{
    Q_OBJECT
public:
    explicit ShutdownSignalWatcher(QObject* parent = nullptr);
    ~ShutdownSignalWatcher() override;

    bool install(const QList<int>& signalNumbers);
    bool isInstalled() const;
    QString lastError() const;

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onReadable();

private:
    static void handleSignal(int signalNumber);
    void restoreHandlers();

    QSocketNotifier* m_notifier;
    // Handlers in place before install(), put back on destruction
    QList<QPair<int, struct sigaction>> m_previous;
    QString m_lastError;

    static int s_fds[2];
};

#endif // SHUTDOWNSIGNALWATCHER_H
