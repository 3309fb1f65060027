#ifndef AGENTACTIONS_H
#define AGENTACTIONS_H

#include <QString>

/**
 * @brief Operations the local control API can ask of the agent
 *
 * Each call returns false with a human readable error when it is refused.
 */
class AgentActions
{
public:
    struct Status
    {
        bool hasSession = false;
        QString sessionId;
        bool isOnBreak = false;
        int captureCount = 0;
    };

    virtual ~AgentActions() = default;

    virtual Status status() const = 0;

    virtual bool checkIn(const QString& credential, const QString& userId, const QString& name,
                         bool& resumed, QString& error) = 0;
    virtual bool checkOut(const QString& report, const QString& proofLink, QString& error) = 0;
    virtual bool startBreak(QString& error) = 0;
    virtual bool resumeWork(QString& error) = 0;
    virtual bool refreshCredential(const QString& credential, QString& error) = 0;

    // started is false when another capture held the lock
    virtual bool triggerCapture(bool& started, QString& error) = 0;
};

#endif // AGENTACTIONS_H
